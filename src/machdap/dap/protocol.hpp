#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace machdap::dap {

enum class request_kind {
  initialize,
  launch,
  attach,
  set_breakpoints,
  set_instruction_breakpoints,
  configuration_done,
  continue_execution,
  next,
  step_in,
  step_out,
  pause,
  stack_trace,
  scopes,
  variables,
  evaluate,
  threads,
  restart,
  disconnect,
  unknown,
};

request_kind parse_request_kind(std::string_view command);

struct request {
  int64_t seq = 0;
  std::string command;
  request_kind kind = request_kind::unknown;
  nlohmann::json arguments = nlohmann::json::object();
};

// false for anything that is not a well-formed request (client responses, events)
bool parse_request(const nlohmann::json& message, request& out, std::string& error);

nlohmann::json make_capabilities();

// stamps outgoing responses and events with increasing sequence numbers
class message_builder {
public:
  nlohmann::json response(const request& req, nlohmann::json body = nlohmann::json::object());
  nlohmann::json error_response(const request& req, const std::string& message);
  nlohmann::json event(std::string_view name, nlohmann::json body = nlohmann::json::object());

private:
  std::atomic<int64_t> seq_{1};
};

} // namespace machdap::dap
