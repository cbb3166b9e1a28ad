#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "machdap/base/error.hpp"

namespace machdap::session {

struct launch_config {
  std::string program;
  std::string cwd;
  // 0: local-only symbolication, no debugserver
  uint16_t debugserver_port = 0;
  std::string debugserver_host = "127.0.0.1";
  // dSYM bundle or DWARF file; adjacent bundles are searched when empty
  std::string debug_info;
  bool strict_symbols = false;
  bool stop_on_entry = false;
  uint32_t reply_timeout_ms = 5000;

  bool local_only() const { return debugserver_port == 0; }
};

// overlays the recognized keys of `value` onto `config`; absent keys keep their current values
result merge_launch_config(const nlohmann::json& value, launch_config& config);

result load_launch_config_file(const std::string& path, launch_config& config);

// MACHDAP_CONFIG holds the JSON object an editor extension passes through the environment
result load_launch_config_env(launch_config& config);

result validate_launch_config(const launch_config& config);

nlohmann::json to_json(const launch_config& config);

} // namespace machdap::session
