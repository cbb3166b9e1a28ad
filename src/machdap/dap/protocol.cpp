#include "protocol.hpp"

#include <utility>

namespace machdap::dap {

request_kind parse_request_kind(std::string_view command) {
  static const std::pair<std::string_view, request_kind> k_requests[] = {
      {"initialize", request_kind::initialize},
      {"launch", request_kind::launch},
      {"attach", request_kind::attach},
      {"setBreakpoints", request_kind::set_breakpoints},
      {"setInstructionBreakpoints", request_kind::set_instruction_breakpoints},
      {"configurationDone", request_kind::configuration_done},
      {"continue", request_kind::continue_execution},
      {"next", request_kind::next},
      {"stepIn", request_kind::step_in},
      {"stepOut", request_kind::step_out},
      {"pause", request_kind::pause},
      {"stackTrace", request_kind::stack_trace},
      {"scopes", request_kind::scopes},
      {"variables", request_kind::variables},
      {"evaluate", request_kind::evaluate},
      {"threads", request_kind::threads},
      {"restart", request_kind::restart},
      {"disconnect", request_kind::disconnect},
  };
  for (const auto& entry : k_requests) {
    if (entry.first == command) {
      return entry.second;
    }
  }
  return request_kind::unknown;
}

bool parse_request(const nlohmann::json& message, request& out, std::string& error) {
  auto type = message.find("type");
  if (type == message.end() || !type->is_string() || type->get<std::string>() != "request") {
    error = "not a request";
    return false;
  }
  auto command = message.find("command");
  if (command == message.end() || !command->is_string()) {
    error = "request without command";
    return false;
  }

  out = request{};
  auto seq = message.find("seq");
  if (seq != message.end() && seq->is_number_integer()) {
    out.seq = seq->get<int64_t>();
  }
  out.command = command->get<std::string>();
  out.kind = parse_request_kind(out.command);
  auto arguments = message.find("arguments");
  if (arguments != message.end() && arguments->is_object()) {
    out.arguments = *arguments;
  }
  return true;
}

nlohmann::json make_capabilities() {
  return nlohmann::json{
      {"supportsConfigurationDoneRequest", true},
      {"supportsInstructionBreakpoints", true},
      {"supportsRestartRequest", true},
      {"supportsTerminateDebuggee", true},
      {"supportsEvaluateForHovers", false},
      {"supportsSteppingGranularity", false},
      {"supportsConditionalBreakpoints", false},
      {"supportsFunctionBreakpoints", false},
  };
}

nlohmann::json message_builder::response(const request& req, nlohmann::json body) {
  nlohmann::json message{
      {"seq", seq_.fetch_add(1)},
      {"type", "response"},
      {"request_seq", req.seq},
      {"success", true},
      {"command", req.command},
  };
  if (!body.is_null()) {
    message["body"] = std::move(body);
  }
  return message;
}

nlohmann::json message_builder::error_response(const request& req, const std::string& message_text) {
  return nlohmann::json{
      {"seq", seq_.fetch_add(1)},
      {"type", "response"},
      {"request_seq", req.seq},
      {"success", false},
      {"command", req.command},
      {"message", message_text},
      {"body", {{"error", {{"id", 1}, {"format", message_text}}}}},
  };
}

nlohmann::json message_builder::event(std::string_view name, nlohmann::json body) {
  nlohmann::json message{
      {"seq", seq_.fetch_add(1)},
      {"type", "event"},
      {"event", std::string(name)},
  };
  if (!body.is_null()) {
    message["body"] = std::move(body);
  }
  return message;
}

} // namespace machdap::dap
