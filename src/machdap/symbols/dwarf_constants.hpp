#pragma once

#include <cstdint>

namespace machdap::symbols::dwarf {

// line number program
constexpr uint8_t dw_lns_copy = 0x01;
constexpr uint8_t dw_lns_advance_pc = 0x02;
constexpr uint8_t dw_lns_advance_line = 0x03;
constexpr uint8_t dw_lns_set_file = 0x04;
constexpr uint8_t dw_lns_set_column = 0x05;
constexpr uint8_t dw_lns_negate_stmt = 0x06;
constexpr uint8_t dw_lns_set_basic_block = 0x07;
constexpr uint8_t dw_lns_const_add_pc = 0x08;
constexpr uint8_t dw_lns_fixed_advance_pc = 0x09;
constexpr uint8_t dw_lns_set_prologue_end = 0x0a;
constexpr uint8_t dw_lns_set_epilogue_begin = 0x0b;
constexpr uint8_t dw_lns_set_isa = 0x0c;

constexpr uint8_t dw_lne_end_sequence = 0x01;
constexpr uint8_t dw_lne_set_address = 0x02;
constexpr uint8_t dw_lne_define_file = 0x03;
constexpr uint8_t dw_lne_set_discriminator = 0x04;

constexpr uint64_t dw_lnct_path = 0x1;
constexpr uint64_t dw_lnct_directory_index = 0x2;

// unit types
constexpr uint8_t dw_ut_compile = 0x01;
constexpr uint8_t dw_ut_type = 0x02;
constexpr uint8_t dw_ut_partial = 0x03;
constexpr uint8_t dw_ut_skeleton = 0x04;
constexpr uint8_t dw_ut_split_compile = 0x05;
constexpr uint8_t dw_ut_split_type = 0x06;

// tags
constexpr uint64_t dw_tag_class_type = 0x02;
constexpr uint64_t dw_tag_enumeration_type = 0x04;
constexpr uint64_t dw_tag_lexical_block = 0x0b;
constexpr uint64_t dw_tag_compile_unit = 0x11;
constexpr uint64_t dw_tag_structure_type = 0x13;
constexpr uint64_t dw_tag_union_type = 0x17;
constexpr uint64_t dw_tag_inlined_subroutine = 0x1d;
constexpr uint64_t dw_tag_subprogram = 0x2e;
constexpr uint64_t dw_tag_namespace = 0x39;
constexpr uint64_t dw_tag_partial_unit = 0x3c;

// attributes
constexpr uint64_t dw_at_name = 0x03;
constexpr uint64_t dw_at_stmt_list = 0x10;
constexpr uint64_t dw_at_low_pc = 0x11;
constexpr uint64_t dw_at_high_pc = 0x12;
constexpr uint64_t dw_at_comp_dir = 0x1b;
constexpr uint64_t dw_at_abstract_origin = 0x31;
constexpr uint64_t dw_at_decl_file = 0x3a;
constexpr uint64_t dw_at_decl_line = 0x3b;
constexpr uint64_t dw_at_specification = 0x47;
constexpr uint64_t dw_at_linkage_name = 0x6e;
constexpr uint64_t dw_at_str_offsets_base = 0x72;
constexpr uint64_t dw_at_addr_base = 0x73;
constexpr uint64_t dw_at_mips_linkage_name = 0x2007;

// forms
constexpr uint64_t dw_form_addr = 0x01;
constexpr uint64_t dw_form_block2 = 0x03;
constexpr uint64_t dw_form_block4 = 0x04;
constexpr uint64_t dw_form_data2 = 0x05;
constexpr uint64_t dw_form_data4 = 0x06;
constexpr uint64_t dw_form_data8 = 0x07;
constexpr uint64_t dw_form_string = 0x08;
constexpr uint64_t dw_form_block = 0x09;
constexpr uint64_t dw_form_block1 = 0x0a;
constexpr uint64_t dw_form_data1 = 0x0b;
constexpr uint64_t dw_form_flag = 0x0c;
constexpr uint64_t dw_form_sdata = 0x0d;
constexpr uint64_t dw_form_strp = 0x0e;
constexpr uint64_t dw_form_udata = 0x0f;
constexpr uint64_t dw_form_ref_addr = 0x10;
constexpr uint64_t dw_form_ref1 = 0x11;
constexpr uint64_t dw_form_ref2 = 0x12;
constexpr uint64_t dw_form_ref4 = 0x13;
constexpr uint64_t dw_form_ref8 = 0x14;
constexpr uint64_t dw_form_ref_udata = 0x15;
constexpr uint64_t dw_form_indirect = 0x16;
constexpr uint64_t dw_form_sec_offset = 0x17;
constexpr uint64_t dw_form_exprloc = 0x18;
constexpr uint64_t dw_form_flag_present = 0x19;
constexpr uint64_t dw_form_strx = 0x1a;
constexpr uint64_t dw_form_addrx = 0x1b;
constexpr uint64_t dw_form_ref_sup4 = 0x1c;
constexpr uint64_t dw_form_strp_sup = 0x1d;
constexpr uint64_t dw_form_data16 = 0x1e;
constexpr uint64_t dw_form_line_strp = 0x1f;
constexpr uint64_t dw_form_ref_sig8 = 0x20;
constexpr uint64_t dw_form_implicit_const = 0x21;
constexpr uint64_t dw_form_loclistx = 0x22;
constexpr uint64_t dw_form_rnglistx = 0x23;
constexpr uint64_t dw_form_ref_sup8 = 0x24;
constexpr uint64_t dw_form_strx1 = 0x25;
constexpr uint64_t dw_form_strx2 = 0x26;
constexpr uint64_t dw_form_strx3 = 0x27;
constexpr uint64_t dw_form_strx4 = 0x28;
constexpr uint64_t dw_form_addrx1 = 0x29;
constexpr uint64_t dw_form_addrx2 = 0x2a;
constexpr uint64_t dw_form_addrx3 = 0x2b;
constexpr uint64_t dw_form_addrx4 = 0x2c;
constexpr uint64_t dw_form_gnu_addr_index = 0x1f01;
constexpr uint64_t dw_form_gnu_str_index = 0x1f02;
constexpr uint64_t dw_form_gnu_ref_alt = 0x1f20;
constexpr uint64_t dw_form_gnu_strp_alt = 0x1f21;

} // namespace machdap::symbols::dwarf
