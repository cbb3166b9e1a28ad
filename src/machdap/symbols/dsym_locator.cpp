#include "dsym_locator.hpp"

#include <filesystem>
#include <system_error>
#include <vector>

#include <redlog.hpp>

namespace machdap::symbols {

namespace fs = std::filesystem;

namespace {

auto log_dsym = redlog::get_logger("machdap.symbols.dsym");

bool is_dsym_bundle(const fs::path& path) {
  std::error_code ec;
  return path.extension() == ".dSYM" && fs::is_directory(path, ec);
}

} // namespace

std::optional<std::string> resolve_dsym_bundle(const std::string& path, const std::string& image_name) {
  std::error_code ec;
  fs::path candidate(path);
  if (fs::is_regular_file(candidate, ec)) {
    return candidate.string();
  }
  if (!is_dsym_bundle(candidate)) {
    return std::nullopt;
  }

  fs::path dwarf_dir = candidate / "Contents" / "Resources" / "DWARF";
  fs::path named = dwarf_dir / image_name;
  if (!image_name.empty() && fs::is_regular_file(named, ec)) {
    return named.string();
  }

  // bundles renamed after the build still carry a single DWARF file
  std::vector<fs::path> files;
  for (fs::directory_iterator it(dwarf_dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec)) {
      files.push_back(it->path());
    }
  }
  if (files.size() == 1) {
    log_dsym.vrb(
        "dSYM file name differs from image", redlog::field("bundle", path), redlog::field("file", files.front().string())
    );
    return files.front().string();
  }
  return std::nullopt;
}

std::optional<std::string> locate_dsym(const std::string& program_path) {
  fs::path program(program_path);
  std::string image_name = program.filename().string();

  std::vector<fs::path> candidates;
  candidates.emplace_back(program_path + ".dSYM");
  for (fs::path dir = program.parent_path(); !dir.empty() && dir != dir.root_path(); dir = dir.parent_path()) {
    if (dir.extension() == ".app") {
      fs::path bundle = dir;
      bundle += ".dSYM";
      candidates.push_back(bundle);
      break;
    }
  }

  for (const auto& candidate : candidates) {
    log_dsym.trc("probing dSYM", redlog::field("path", candidate.string()));
    if (auto found = resolve_dsym_bundle(candidate.string(), image_name)) {
      log_dsym.dbg("found dSYM", redlog::field("path", *found));
      return found;
    }
  }
  return std::nullopt;
}

} // namespace machdap::symbols
