#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "dwarf_sections.hpp"

namespace machdap::symbols {

struct line_header {
  uint16_t version = 4;
  bool dwarf64 = false;
  uint8_t address_size = 8;
  uint8_t minimum_instruction_length = 1;
  uint8_t maximum_operations_per_instruction = 1;
  uint8_t default_is_stmt = 1;
  int8_t line_base = -5;
  uint8_t line_range = 14;
  uint8_t opcode_base = 13;
  std::vector<uint8_t> standard_opcode_lengths;
  std::vector<std::string> include_directories;
  std::vector<std::string> file_names;
};

struct line_row {
  uint64_t address = 0;
  uint32_t file = 1;
  uint32_t line = 1;
  uint32_t column = 0;
  bool is_stmt = false;
  bool end_sequence = false;
};

struct line_program {
  line_header header;
  // rows in program order; every sequence ends with an end_sequence row
  std::vector<line_row> rows;

  // full path for a row's file index, empty when out of range
  const std::string& file_name(uint32_t index) const;
};

// decodes the unit at `offset` in `.debug_line`; `next_offset` receives the start of the following unit
bool parse_line_program(
    const dwarf_sections& sections,
    uint64_t offset,
    std::string_view comp_dir,
    line_program& out,
    uint64_t& next_offset,
    std::string& error
);

std::string join_path(std::string_view directory, std::string_view name);

} // namespace machdap::symbols
