#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "dwarf_sections.hpp"

namespace machdap::symbols {

struct function_entry {
  uint64_t low_pc = 0;
  uint64_t high_pc = 0;
  // scope-qualified source name, e.g. `app::view_model::refresh`
  std::string name;
  std::string linkage_name;
};

struct compile_unit_entry {
  uint64_t offset = 0;
  uint16_t version = 0;
  std::string name;
  std::string comp_dir;
  std::optional<uint64_t> stmt_list;
};

struct debug_info {
  std::vector<compile_unit_entry> units;
  std::vector<function_entry> functions;
};

// walks every compile unit in `.debug_info`; type units are skipped
bool parse_debug_info(const dwarf_sections& sections, debug_info& out, std::string& error);

} // namespace machdap::symbols
