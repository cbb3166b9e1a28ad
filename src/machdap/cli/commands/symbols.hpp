#pragma once

#include <string>
#include <vector>

namespace machdap::commands {

struct symbols_options {
  std::string program_path;
  std::string dsym_path;
  std::string slide;
  std::vector<std::string> addresses;
  // file:line
  std::vector<std::string> locations;
  bool strict_symbols = false;
};

int symbols(const symbols_options& options);

} // namespace machdap::commands
