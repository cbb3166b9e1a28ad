#pragma once

#include <string>

namespace machdap::commands {

struct serve_options {
  std::string config_path;
  bool strict_symbols = false;
};

int serve(const serve_options& options);

} // namespace machdap::commands
