#include "error.hpp"

namespace machdap {

std::string error_code_to_string(error_code code) {
  switch (code) {
  case error_code::success:
    return "success";
  case error_code::transport_framing:
    return "transport framing error";
  case error_code::remote_unavailable:
    return "remote unavailable";
  case error_code::remote_protocol_error:
    return "remote protocol error";
  case error_code::timeout:
    return "timeout";
  case error_code::symbol_load_error:
    return "symbol load error";
  case error_code::symbol_missing:
    return "symbols missing";
  case error_code::state_conflict:
    return "state conflict";
  case error_code::expression_unsupported:
    return "expression unsupported";
  case error_code::invalid_argument:
    return "invalid argument";
  case error_code::unknown_error:
    return "unknown error";
  default:
    return "unknown error code";
  }
}

result make_error_result(error_code code, const std::string& context, int system_error) {
  result r;
  r.code = code;
  r.error_message = error_code_to_string(code);
  if (!context.empty()) {
    r.error_message += ": " + context;
  }
  if (system_error != 0) {
    r.system_error_code = system_error;
    r.error_message += " (system error: " + std::to_string(system_error) + ")";
  }
  return r;
}

result make_success_result() { return result{error_code::success, "", std::nullopt}; }

bool is_recoverable_error(error_code code) {
  switch (code) {
  case error_code::remote_unavailable:
  case error_code::timeout:
  case error_code::symbol_missing:
    return true;
  default:
    return false;
  }
}

bool is_fatal_error(error_code code) {
  switch (code) {
  case error_code::transport_framing:
  case error_code::symbol_load_error:
    return true;
  default:
    return false;
  }
}

} // namespace machdap
