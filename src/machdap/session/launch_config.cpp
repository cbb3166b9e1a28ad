#include "launch_config.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>

#include <redlog.hpp>

namespace machdap::session {

namespace {

auto log_config = redlog::get_logger("machdap.session.config");

result read_string(const nlohmann::json& value, const char* key, std::string& out) {
  auto it = value.find(key);
  if (it == value.end() || it->is_null()) {
    return make_success_result();
  }
  if (!it->is_string()) {
    return make_error_result(error_code::invalid_argument, std::string(key) + " must be a string");
  }
  out = it->get<std::string>();
  return make_success_result();
}

result read_bool(const nlohmann::json& value, const char* key, bool& out) {
  auto it = value.find(key);
  if (it == value.end() || it->is_null()) {
    return make_success_result();
  }
  if (!it->is_boolean()) {
    return make_error_result(error_code::invalid_argument, std::string(key) + " must be a boolean");
  }
  out = it->get<bool>();
  return make_success_result();
}

// launchers pass ports both as numbers and as strings
result read_unsigned(const nlohmann::json& value, const char* key, uint64_t max, uint64_t& out, bool& present) {
  present = false;
  auto it = value.find(key);
  if (it == value.end() || it->is_null()) {
    return make_success_result();
  }
  uint64_t parsed = 0;
  if (it->is_number_unsigned()) {
    parsed = it->get<uint64_t>();
  } else if (it->is_number_integer()) {
    int64_t signed_value = it->get<int64_t>();
    if (signed_value < 0) {
      return make_error_result(error_code::invalid_argument, std::string(key) + " must not be negative");
    }
    parsed = static_cast<uint64_t>(signed_value);
  } else if (it->is_string()) {
    const std::string text = it->get<std::string>();
    char* end = nullptr;
    parsed = std::strtoull(text.c_str(), &end, 10);
    if (text.empty() || end == text.c_str() || *end != '\0') {
      return make_error_result(error_code::invalid_argument, std::string(key) + " is not a number: " + text);
    }
  } else {
    return make_error_result(error_code::invalid_argument, std::string(key) + " must be a number");
  }
  if (parsed > max) {
    return make_error_result(error_code::invalid_argument, std::string(key) + " out of range");
  }
  out = parsed;
  present = true;
  return make_success_result();
}

} // namespace

result merge_launch_config(const nlohmann::json& value, launch_config& config) {
  if (!value.is_object()) {
    return make_error_result(error_code::invalid_argument, "launch configuration must be a JSON object");
  }

  launch_config merged = config;
  if (auto status = read_string(value, "program", merged.program); !status) {
    return status;
  }
  if (auto status = read_string(value, "cwd", merged.cwd); !status) {
    return status;
  }
  if (auto status = read_string(value, "debugserverHost", merged.debugserver_host); !status) {
    return status;
  }
  if (auto status = read_string(value, "debugInfo", merged.debug_info); !status) {
    return status;
  }
  if (auto status = read_bool(value, "strictSymbols", merged.strict_symbols); !status) {
    return status;
  }
  if (auto status = read_bool(value, "stopOnEntry", merged.stop_on_entry); !status) {
    return status;
  }

  uint64_t number = 0;
  bool present = false;
  if (auto status = read_unsigned(value, "debugserverPort", std::numeric_limits<uint16_t>::max(), number, present);
      !status) {
    return status;
  }
  if (present) {
    merged.debugserver_port = static_cast<uint16_t>(number);
  }
  if (auto status = read_unsigned(value, "replyTimeoutMs", std::numeric_limits<uint32_t>::max(), number, present);
      !status) {
    return status;
  }
  if (present) {
    merged.reply_timeout_ms = static_cast<uint32_t>(number);
  }

  config = std::move(merged);
  return make_success_result();
}

result load_launch_config_file(const std::string& path, launch_config& config) {
  std::ifstream input(path);
  if (!input) {
    return make_error_result(error_code::invalid_argument, "cannot open config file " + path);
  }
  nlohmann::json value = nlohmann::json::parse(input, nullptr, false);
  if (value.is_discarded()) {
    return make_error_result(error_code::invalid_argument, "config file is not valid JSON: " + path);
  }
  log_config.vrb("loaded config file", redlog::field("path", path));
  return merge_launch_config(value, config);
}

result load_launch_config_env(launch_config& config) {
  const char* text = std::getenv("MACHDAP_CONFIG");
  if (!text || *text == '\0') {
    return make_success_result();
  }
  nlohmann::json value = nlohmann::json::parse(text, nullptr, false);
  if (value.is_discarded()) {
    return make_error_result(error_code::invalid_argument, "MACHDAP_CONFIG is not valid JSON");
  }
  log_config.vrb("loaded config from environment");
  return merge_launch_config(value, config);
}

result validate_launch_config(const launch_config& config) {
  if (config.program.empty()) {
    return make_error_result(error_code::invalid_argument, "program is required");
  }
  if (!config.local_only() && config.debugserver_host.empty()) {
    return make_error_result(error_code::invalid_argument, "debugserverHost is empty");
  }
  if (config.reply_timeout_ms == 0) {
    return make_error_result(error_code::invalid_argument, "replyTimeoutMs must be positive");
  }
  return make_success_result();
}

nlohmann::json to_json(const launch_config& config) {
  return nlohmann::json{
      {"program", config.program},
      {"cwd", config.cwd},
      {"debugserverPort", config.debugserver_port},
      {"debugserverHost", config.debugserver_host},
      {"debugInfo", config.debug_info},
      {"strictSymbols", config.strict_symbols},
      {"stopOnEntry", config.stop_on_entry},
      {"replyTimeoutMs", config.reply_timeout_ms},
  };
}

} // namespace machdap::session
