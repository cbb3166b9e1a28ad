#include "line_program.hpp"

#include <utility>

#include "dwarf_constants.hpp"

namespace machdap::symbols {

using namespace dwarf;

namespace {

struct line_state {
  uint64_t address = 0;
  uint32_t file = 1;
  uint32_t line = 1;
  uint32_t column = 0;
  bool is_stmt = false;
  bool basic_block = false;
  bool end_sequence = false;
  bool prologue_end = false;
  bool epilogue_begin = false;
  uint32_t isa = 0;
  uint32_t discriminator = 0;
};

struct entry_format {
  uint64_t content_type = 0;
  uint64_t form = 0;
};

std::vector<entry_format> read_entry_formats(byte_reader& reader) {
  std::vector<entry_format> formats;
  uint8_t count = reader.u8();
  for (uint8_t i = 0; i < count && !reader.overrun(); ++i) {
    entry_format format;
    format.content_type = reader.uleb128();
    format.form = reader.uleb128();
    formats.push_back(format);
  }
  return formats;
}

struct entry {
  std::string path;
  uint64_t directory = 0;
};

bool read_entries(
    byte_reader& reader, const std::vector<entry_format>& formats, const unit_context& unit,
    const dwarf_sections& sections, std::vector<entry>& out, std::string& error
) {
  uint64_t count = reader.uleb128();
  for (uint64_t i = 0; i < count; ++i) {
    entry current;
    for (const auto& format : formats) {
      attribute_value value;
      if (!read_form(reader, format.form, unit, value)) {
        error = "unsupported form in line table entry";
        return false;
      }
      if (format.content_type == dw_lnct_path) {
        if (auto text = resolve_string(value, unit, sections)) {
          current.path = std::string(*text);
        }
      } else if (format.content_type == dw_lnct_directory_index) {
        current.directory = value.value;
      }
    }
    out.push_back(std::move(current));
  }
  return !reader.overrun();
}

bool read_header_v5(
    byte_reader& reader, line_header& header, const dwarf_sections& sections, std::string_view comp_dir,
    std::string& error
) {
  unit_context unit;
  unit.version = header.version;
  unit.dwarf64 = header.dwarf64;
  unit.address_size = header.address_size;

  std::vector<entry_format> dir_formats = read_entry_formats(reader);
  std::vector<entry> dirs;
  if (!read_entries(reader, dir_formats, unit, sections, dirs, error)) {
    return false;
  }
  std::vector<entry_format> file_formats = read_entry_formats(reader);
  std::vector<entry> files;
  if (!read_entries(reader, file_formats, unit, sections, files, error)) {
    return false;
  }

  for (size_t i = 0; i < dirs.size(); ++i) {
    const std::string& dir = dirs[i].path;
    if (i == 0 || dir.empty() || dir.front() == '/') {
      header.include_directories.push_back(i == 0 && dir.empty() ? std::string(comp_dir) : dir);
    } else {
      header.include_directories.push_back(join_path(dirs[0].path.empty() ? comp_dir : dirs[0].path, dir));
    }
  }
  for (const auto& file : files) {
    std::string_view dir = file.directory < header.include_directories.size()
                               ? std::string_view(header.include_directories[file.directory])
                               : std::string_view{};
    header.file_names.push_back(join_path(dir, file.path));
  }
  return true;
}

bool read_header_legacy(byte_reader& reader, line_header& header, std::string_view comp_dir) {
  header.include_directories.push_back(std::string(comp_dir));
  for (;;) {
    std::string_view dir = reader.cstring();
    if (reader.overrun()) {
      return false;
    }
    if (dir.empty()) {
      break;
    }
    header.include_directories.push_back(dir.front() == '/' ? std::string(dir) : join_path(comp_dir, dir));
  }

  header.file_names.push_back({});
  for (;;) {
    std::string_view name = reader.cstring();
    if (reader.overrun()) {
      return false;
    }
    if (name.empty()) {
      break;
    }
    uint64_t dir = reader.uleb128();
    reader.uleb128(); // mtime
    reader.uleb128(); // length
    std::string_view directory =
        dir < header.include_directories.size() ? std::string_view(header.include_directories[dir]) : comp_dir;
    header.file_names.push_back(join_path(directory, name));
  }
  return !reader.overrun();
}

} // namespace

const std::string& line_program::file_name(uint32_t index) const {
  static const std::string empty;
  if (index >= header.file_names.size()) {
    return empty;
  }
  return header.file_names[index];
}

std::string join_path(std::string_view directory, std::string_view name) {
  if (name.empty()) {
    return std::string(directory);
  }
  if (name.front() == '/' || directory.empty()) {
    return std::string(name);
  }
  std::string out(directory);
  if (out.back() != '/') {
    out.push_back('/');
  }
  out.append(name.data(), name.size());
  return out;
}

bool parse_line_program(
    const dwarf_sections& sections,
    uint64_t offset,
    std::string_view comp_dir,
    line_program& out,
    uint64_t& next_offset,
    std::string& error
) {
  out = line_program{};
  line_header& header = out.header;

  byte_reader reader(sections.debug_line, static_cast<size_t>(offset));
  uint64_t unit_length = reader.initial_length(header.dwarf64);
  uint64_t unit_end = reader.offset() + unit_length;
  if (reader.overrun() || unit_end > sections.debug_line.size()) {
    error = "truncated .debug_line unit";
    return false;
  }
  next_offset = unit_end;

  header.version = reader.u16();
  if (header.version < 2 || header.version > 5) {
    error = "unsupported .debug_line version " + std::to_string(header.version);
    return false;
  }
  if (header.version >= 5) {
    header.address_size = reader.u8();
    reader.u8(); // segment selector size
  }
  uint64_t header_length = reader.section_offset(header.dwarf64);
  uint64_t program_start = reader.offset() + header_length;
  if (program_start > unit_end) {
    error = "bad header_length in .debug_line";
    return false;
  }

  header.minimum_instruction_length = reader.u8();
  if (header.version >= 4) {
    header.maximum_operations_per_instruction = reader.u8();
  }
  header.default_is_stmt = reader.u8();
  header.line_base = static_cast<int8_t>(reader.u8());
  header.line_range = reader.u8();
  header.opcode_base = reader.u8();
  if (header.line_range == 0) {
    error = "zero line_range in .debug_line";
    return false;
  }
  header.standard_opcode_lengths.push_back(0);
  for (int i = 1; i < header.opcode_base; ++i) {
    header.standard_opcode_lengths.push_back(reader.u8());
  }

  bool header_ok = header.version >= 5 ? read_header_v5(reader, header, sections, comp_dir, error)
                                       : read_header_legacy(reader, header, comp_dir);
  if (!header_ok) {
    if (error.empty()) {
      error = "truncated .debug_line header";
    }
    return false;
  }

  reader.seek(static_cast<size_t>(program_start));

  line_state state;
  state.is_stmt = header.default_is_stmt != 0;
  state.file = header.version >= 5 ? 0 : 1;
  const line_state initial_state = state;

  auto add_row = [&] {
    line_row row;
    row.address = state.address;
    row.file = state.file;
    row.line = state.line;
    row.column = state.column;
    row.is_stmt = state.is_stmt;
    row.end_sequence = state.end_sequence;
    out.rows.push_back(row);
  };
  auto advance = [&](uint64_t operation_advance) {
    state.address += operation_advance * header.minimum_instruction_length;
  };

  while (reader.offset() < unit_end && !reader.overrun()) {
    uint8_t opcode = reader.u8();
    if (opcode >= header.opcode_base) {
      uint8_t adjusted = static_cast<uint8_t>(opcode - header.opcode_base);
      advance(adjusted / header.line_range);
      state.line = static_cast<uint32_t>(
          static_cast<int64_t>(state.line) + header.line_base + static_cast<int64_t>(adjusted % header.line_range)
      );
      add_row();
      state.basic_block = false;
      state.prologue_end = false;
      state.epilogue_begin = false;
      state.discriminator = 0;
      continue;
    }

    if (opcode == 0) {
      uint64_t size = reader.uleb128();
      size_t extended_end = reader.offset() + static_cast<size_t>(size);
      if (size == 0 || extended_end > unit_end) {
        error = "bytecode overrun in .debug_line";
        return false;
      }
      uint8_t extended_opcode = reader.u8();
      switch (extended_opcode) {
      case dw_lne_end_sequence:
        state.end_sequence = true;
        add_row();
        state = initial_state;
        break;
      case dw_lne_set_address:
        state.address = reader.unsigned_of_size(static_cast<size_t>(size - 1));
        break;
      case dw_lne_set_discriminator:
        state.discriminator = static_cast<uint32_t>(reader.uleb128());
        break;
      default:
        break;
      }
      reader.seek(extended_end);
      continue;
    }

    switch (opcode) {
    case dw_lns_copy:
      add_row();
      state.discriminator = 0;
      state.basic_block = false;
      state.prologue_end = false;
      state.epilogue_begin = false;
      break;
    case dw_lns_advance_pc:
      advance(reader.uleb128());
      break;
    case dw_lns_advance_line:
      state.line = static_cast<uint32_t>(static_cast<int64_t>(state.line) + reader.sleb128());
      break;
    case dw_lns_set_file:
      state.file = static_cast<uint32_t>(reader.uleb128());
      break;
    case dw_lns_set_column:
      state.column = static_cast<uint32_t>(reader.uleb128());
      break;
    case dw_lns_negate_stmt:
      state.is_stmt = !state.is_stmt;
      break;
    case dw_lns_set_basic_block:
      state.basic_block = true;
      break;
    case dw_lns_const_add_pc:
      advance((255 - header.opcode_base) / header.line_range);
      break;
    case dw_lns_fixed_advance_pc:
      state.address += reader.u16();
      break;
    case dw_lns_set_prologue_end:
      state.prologue_end = true;
      break;
    case dw_lns_set_epilogue_begin:
      state.epilogue_begin = true;
      break;
    case dw_lns_set_isa:
      state.isa = static_cast<uint32_t>(reader.uleb128());
      break;
    default:
      // unknown standard opcode: skip its uleb operands
      for (uint8_t i = 0; i < header.standard_opcode_lengths[opcode]; ++i) {
        reader.uleb128();
      }
      break;
    }
  }

  if (reader.overrun()) {
    error = "truncated .debug_line program";
    return false;
  }
  return true;
}

} // namespace machdap::symbols
