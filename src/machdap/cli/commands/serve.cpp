#include "serve.hpp"

#include <iostream>

#include <unistd.h>

#include <redlog.hpp>

#include "machdap/adapter/stdio_adapter.hpp"
#include "machdap/session/launch_config.hpp"

namespace machdap::commands {

int serve(const serve_options& options) {
  auto log = redlog::get_logger("machdap.serve");

  session::session_options session_options;
  if (!options.config_path.empty()) {
    if (auto status = session::load_launch_config_file(options.config_path, session_options.defaults); !status) {
      log.err("failed to load config", redlog::field("path", options.config_path),
              redlog::field("error", status.error_message));
      std::cerr << "error: " << status.error_message << std::endl;
      return 1;
    }
  }
  if (auto status = session::load_launch_config_env(session_options.defaults); !status) {
    log.err("invalid MACHDAP_CONFIG", redlog::field("error", status.error_message));
    std::cerr << "error: " << status.error_message << std::endl;
    return 1;
  }
  if (options.strict_symbols) {
    session_options.defaults.strict_symbols = true;
  }

  log.dbg("defaults", redlog::field("config", session::to_json(session_options.defaults).dump()));

  // stdout belongs to the protocol from here on
  adapter::stdio_adapter adapter(std::move(session_options), STDIN_FILENO, std::cout);
  return adapter.run();
}

} // namespace machdap::commands
