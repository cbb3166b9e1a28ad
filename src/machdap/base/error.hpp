#pragma once

#include <optional>
#include <string>

namespace machdap {

// error codes shared by every component
enum class error_code {
  success,

  // client stream
  transport_framing,

  // remote stub
  remote_unavailable,
  remote_protocol_error,
  timeout,

  // symbolication
  symbol_load_error,
  symbol_missing,

  // session
  state_conflict,
  expression_unsupported,
  invalid_argument,

  unknown_error
};

// result type
struct result {
  error_code code = error_code::success;
  std::string error_message;
  std::optional<int> system_error_code;

  bool success() const { return code == error_code::success; }
  operator bool() const { return success(); }
};

// error utilities
std::string error_code_to_string(error_code code);
result make_error_result(error_code code, const std::string& context = "", int system_error = 0);
result make_success_result();
bool is_recoverable_error(error_code code);
bool is_fatal_error(error_code code);

} // namespace machdap
