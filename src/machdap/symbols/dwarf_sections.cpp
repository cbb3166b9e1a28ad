#include "dwarf_sections.hpp"

#include "dwarf_constants.hpp"

namespace machdap::symbols {

using namespace dwarf;

bool read_form(byte_reader& reader, uint64_t form, const unit_context& unit, attribute_value& out,
               int64_t implicit_const) {
  out = attribute_value{};
  out.form = form;
  switch (form) {
  case dw_form_addr:
    out.value = reader.unsigned_of_size(unit.address_size);
    break;
  case dw_form_data1:
  case dw_form_ref1:
  case dw_form_flag:
  case dw_form_strx1:
  case dw_form_addrx1:
    out.value = reader.u8();
    break;
  case dw_form_data2:
  case dw_form_ref2:
  case dw_form_strx2:
  case dw_form_addrx2:
    out.value = reader.u16();
    break;
  case dw_form_strx3:
  case dw_form_addrx3:
    out.value = reader.u24();
    break;
  case dw_form_data4:
  case dw_form_ref4:
  case dw_form_ref_sup4:
  case dw_form_strx4:
  case dw_form_addrx4:
    out.value = reader.u32();
    break;
  case dw_form_data8:
  case dw_form_ref8:
  case dw_form_ref_sig8:
  case dw_form_ref_sup8:
    out.value = reader.u64();
    break;
  case dw_form_data16:
    reader.skip(16);
    break;
  case dw_form_sdata:
    out.signed_value = reader.sleb128();
    out.value = static_cast<uint64_t>(out.signed_value);
    break;
  case dw_form_udata:
  case dw_form_ref_udata:
  case dw_form_strx:
  case dw_form_addrx:
  case dw_form_loclistx:
  case dw_form_rnglistx:
  case dw_form_gnu_addr_index:
  case dw_form_gnu_str_index:
    out.value = reader.uleb128();
    break;
  case dw_form_string:
    out.text = reader.cstring();
    break;
  case dw_form_strp:
  case dw_form_line_strp:
  case dw_form_sec_offset:
  case dw_form_strp_sup:
  case dw_form_gnu_ref_alt:
  case dw_form_gnu_strp_alt:
    out.value = reader.section_offset(unit.dwarf64);
    break;
  case dw_form_ref_addr:
    out.value = unit.version <= 2 ? reader.unsigned_of_size(unit.address_size) : reader.section_offset(unit.dwarf64);
    break;
  case dw_form_block1:
    reader.skip(reader.u8());
    break;
  case dw_form_block2:
    reader.skip(reader.u16());
    break;
  case dw_form_block4:
    reader.skip(reader.u32());
    break;
  case dw_form_block:
  case dw_form_exprloc:
    reader.skip(static_cast<size_t>(reader.uleb128()));
    break;
  case dw_form_flag_present:
    out.value = 1;
    break;
  case dw_form_implicit_const:
    out.signed_value = implicit_const;
    out.value = static_cast<uint64_t>(implicit_const);
    break;
  case dw_form_indirect: {
    uint64_t actual = reader.uleb128();
    if (actual == dw_form_indirect) {
      return false;
    }
    return read_form(reader, actual, unit, out, implicit_const);
  }
  default:
    return false;
  }
  return !reader.overrun();
}

std::optional<std::string_view> resolve_string(
    const attribute_value& value, const unit_context& unit, const dwarf_sections& sections
) {
  switch (value.form) {
  case dw_form_string:
    return value.text;
  case dw_form_strp:
    return string_at(sections.debug_str, value.value);
  case dw_form_line_strp:
    return string_at(sections.debug_line_str, value.value);
  case dw_form_strx:
  case dw_form_strx1:
  case dw_form_strx2:
  case dw_form_strx3:
  case dw_form_strx4:
  case dw_form_gnu_str_index: {
    size_t entry_size = unit.dwarf64 ? 8 : 4;
    uint64_t position = unit.str_offsets_base + value.value * entry_size;
    if (position + entry_size > sections.debug_str_offsets.size()) {
      return std::nullopt;
    }
    byte_reader reader(sections.debug_str_offsets, static_cast<size_t>(position));
    return string_at(sections.debug_str, reader.unsigned_of_size(entry_size));
  }
  default:
    return std::nullopt;
  }
}

std::optional<uint64_t> resolve_address(
    const attribute_value& value, const unit_context& unit, const dwarf_sections& sections
) {
  switch (value.form) {
  case dw_form_addr:
    return value.value;
  case dw_form_addrx:
  case dw_form_addrx1:
  case dw_form_addrx2:
  case dw_form_addrx3:
  case dw_form_addrx4:
  case dw_form_gnu_addr_index: {
    uint64_t position = unit.addr_base + value.value * unit.address_size;
    if (position + unit.address_size > sections.debug_addr.size()) {
      return std::nullopt;
    }
    byte_reader reader(sections.debug_addr, static_cast<size_t>(position));
    return reader.unsigned_of_size(unit.address_size);
  }
  default:
    return std::nullopt;
  }
}

std::optional<uint64_t> resolve_reference(const attribute_value& value, const unit_context& unit) {
  switch (value.form) {
  case dw_form_ref1:
  case dw_form_ref2:
  case dw_form_ref4:
  case dw_form_ref8:
  case dw_form_ref_udata:
    return unit.unit_offset + value.value;
  case dw_form_ref_addr:
    return value.value;
  default:
    return std::nullopt;
  }
}

bool is_constant_form(uint64_t form) {
  switch (form) {
  case dw_form_data1:
  case dw_form_data2:
  case dw_form_data4:
  case dw_form_data8:
  case dw_form_udata:
  case dw_form_sdata:
  case dw_form_implicit_const:
    return true;
  default:
    return false;
  }
}

std::optional<uint64_t> resolve_constant(const attribute_value& value) {
  if (!is_constant_form(value.form)) {
    return std::nullopt;
  }
  return value.value;
}

} // namespace machdap::symbols
