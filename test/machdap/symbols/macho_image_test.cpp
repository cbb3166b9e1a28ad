#include <doctest/doctest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "machdap/symbols/dsym_locator.hpp"
#include "machdap/symbols/macho_image.hpp"

namespace fs = std::filesystem;

namespace {

class temp_tree {
public:
  temp_tree() {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    root_ = fs::temp_directory_path() / ("machdap-test-" + std::to_string(stamp));
    fs::create_directories(root_);
  }

  ~temp_tree() {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  const fs::path& root() const { return root_; }

  fs::path write(const fs::path& relative, const std::string& contents) {
    fs::path path = root_ / relative;
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << contents;
    return path;
  }

private:
  fs::path root_;
};

} // namespace

TEST_CASE("Mach-O loader rejects missing files") {
  machdap::symbols::macho_image image;
  auto status = machdap::symbols::load_macho_image("/nonexistent/machdap/App", image);
  CHECK(status.code == machdap::error_code::symbol_load_error);
  CHECK(status.error_message.find("/nonexistent/machdap/App") != std::string::npos);
}

TEST_CASE("Mach-O loader rejects other file formats") {
  temp_tree tree;
  fs::path path = tree.write("notes.txt", "just some text, not an image\n");
  machdap::symbols::macho_image image;
  auto status = machdap::symbols::load_macho_image(path.string(), image);
  CHECK(status.code == machdap::error_code::symbol_load_error);
}

TEST_CASE("dSYM bundles resolve to the DWARF file inside") {
  temp_tree tree;
  fs::path dwarf = tree.write("tool.dSYM/Contents/Resources/DWARF/tool", "dwarf");
  fs::path plain = tree.write("symbols.dwarf", "dwarf");

  auto bundle = machdap::symbols::resolve_dsym_bundle((tree.root() / "tool.dSYM").string(), "tool");
  REQUIRE(bundle.has_value());
  CHECK(fs::equivalent(*bundle, dwarf));

  auto direct = machdap::symbols::resolve_dsym_bundle(plain.string(), "tool");
  REQUIRE(direct.has_value());
  CHECK(*direct == plain.string());

  CHECK_FALSE(machdap::symbols::resolve_dsym_bundle((tree.root() / "absent.dSYM").string(), "tool").has_value());
}

TEST_CASE("renamed dSYM bundles fall back to their single DWARF file") {
  temp_tree tree;
  fs::path dwarf = tree.write("tool.dSYM/Contents/Resources/DWARF/tool-old", "dwarf");
  auto bundle = machdap::symbols::resolve_dsym_bundle((tree.root() / "tool.dSYM").string(), "tool");
  REQUIRE(bundle.has_value());
  CHECK(fs::equivalent(*bundle, dwarf));
}

TEST_CASE("dSYM lookup searches beside the program and its app bundle") {
  temp_tree tree;
  fs::path tool = tree.write("bin/tool", "binary");
  fs::path tool_dwarf = tree.write("bin/tool.dSYM/Contents/Resources/DWARF/tool", "dwarf");
  auto found = machdap::symbols::locate_dsym(tool.string());
  REQUIRE(found.has_value());
  CHECK(fs::equivalent(*found, tool_dwarf));

  fs::path app = tree.write("Build/MyApp.app/MyApp", "binary");
  fs::path app_dwarf = tree.write("Build/MyApp.app.dSYM/Contents/Resources/DWARF/MyApp", "dwarf");
  auto from_app = machdap::symbols::locate_dsym(app.string());
  REQUIRE(from_app.has_value());
  CHECK(fs::equivalent(*from_app, app_dwarf));

  fs::path lonely = tree.write("other/lonely", "binary");
  CHECK_FALSE(machdap::symbols::locate_dsym(lonely.string()).has_value());
}
