#pragma once

#include <optional>
#include <string>

namespace machdap::symbols {

// maps a `.dSYM` bundle to the DWARF file inside it; a plain file is returned as is
std::optional<std::string> resolve_dsym_bundle(const std::string& path, const std::string& image_name);

// adjacent bundles only: `<program>.dSYM`, then `<bundle>.app.dSYM` when the program lives in an `.app`
std::optional<std::string> locate_dsym(const std::string& program_path);

} // namespace machdap::symbols
