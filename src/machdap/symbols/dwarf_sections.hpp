#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "byte_reader.hpp"

namespace machdap::symbols {

// owned copies of the sections the symbolicator reads; the image they came from may be released
struct dwarf_sections {
  std::vector<uint8_t> debug_info;
  std::vector<uint8_t> debug_abbrev;
  std::vector<uint8_t> debug_line;
  std::vector<uint8_t> debug_str;
  std::vector<uint8_t> debug_line_str;
  std::vector<uint8_t> debug_str_offsets;
  std::vector<uint8_t> debug_addr;

  bool has_line_info() const { return !debug_line.empty(); }
  bool has_debug_info() const { return !debug_info.empty() && !debug_abbrev.empty(); }
};

struct unit_context {
  uint16_t version = 4;
  bool dwarf64 = false;
  uint8_t address_size = 8;
  uint64_t unit_offset = 0;
  uint64_t str_offsets_base = 8;
  uint64_t addr_base = 8;
};

struct attribute_value {
  uint64_t form = 0;
  uint64_t value = 0;
  int64_t signed_value = 0;
  std::string_view text;
};

// reads one attribute of `form`; false on an unknown form, after which the DIE stream cannot be trusted
bool read_form(byte_reader& reader, uint64_t form, const unit_context& unit, attribute_value& out,
               int64_t implicit_const = 0);

std::optional<std::string_view> resolve_string(
    const attribute_value& value, const unit_context& unit, const dwarf_sections& sections
);
std::optional<uint64_t> resolve_address(
    const attribute_value& value, const unit_context& unit, const dwarf_sections& sections
);
// section-relative DIE offset
std::optional<uint64_t> resolve_reference(const attribute_value& value, const unit_context& unit);
std::optional<uint64_t> resolve_constant(const attribute_value& value);

bool is_constant_form(uint64_t form);

} // namespace machdap::symbols
