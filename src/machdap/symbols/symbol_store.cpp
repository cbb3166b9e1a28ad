#include "symbol_store.hpp"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <limits>
#include <tuple>

#include "machdap/base/string_utils.hpp"
#include "machdap/base/uuid_format.hpp"

#include "debug_info.hpp"
#include "dsym_locator.hpp"
#include "line_program.hpp"

namespace machdap::symbols {

namespace {

// ranges overlapping one address are rare; bound the backwards scan
constexpr int k_max_overlap_scan = 16;

} // namespace

result symbol_store::load(const load_options& options) {
  reset();

  macho_image image;
  if (auto status = load_macho_image(options.program_path, image); !status) {
    log_.err("failed to load image", redlog::field("path", options.program_path),
             redlog::field("error", status.error_message));
    return status;
  }

  module_info info;
  info.path = image.path;
  info.arch = image.arch;
  info.uuid = image.uuid;
  info.text_vmaddr = image.text_vmaddr;
  info.text_size = image.text_size;

  std::string image_name = std::filesystem::path(options.program_path).filename().string();
  std::optional<std::string> debug_path;
  if (options.debug_info_path && !options.debug_info_path->empty()) {
    debug_path = resolve_dsym_bundle(*options.debug_info_path, image_name);
    if (!debug_path) {
      diagnostics_.push_back(
          make_error_result(error_code::symbol_missing, "debug info not found at " + *options.debug_info_path)
      );
    }
  } else {
    debug_path = locate_dsym(options.program_path);
  }

  const dwarf_sections* dwarf = &image.dwarf;
  macho_image debug_image;
  if (debug_path) {
    if (auto status = load_macho_image(*debug_path, debug_image); !status) {
      log_.wrn("ignoring unreadable dSYM", redlog::field("path", *debug_path),
               redlog::field("error", status.error_message));
      diagnostics_.push_back(make_error_result(error_code::symbol_missing, status.error_message));
    } else {
      if (!image.uuid.empty() && !debug_image.uuid.empty() &&
          util::normalize_uuid(image.uuid) != util::normalize_uuid(debug_image.uuid)) {
        log_.wrn("dSYM uuid mismatch", redlog::field("image", image.uuid), redlog::field("dsym", debug_image.uuid));
        diagnostics_.push_back(make_error_result(
            error_code::symbol_missing, "dSYM uuid " + debug_image.uuid + " does not match image uuid " + image.uuid
        ));
      }
      if (debug_image.dwarf.has_line_info()) {
        dwarf = &debug_image.dwarf;
        info.debug_path = *debug_path;
      }
    }
  }
  if (info.debug_path.empty() && image.dwarf.has_line_info()) {
    info.debug_path = image.path;
  }

  return load_sections(std::move(info), *dwarf, std::move(image.symbols), options.strict);
}

result symbol_store::load_sections(
    module_info info, const dwarf_sections& dwarf, std::vector<macho_symbol> symbols, bool strict
) {
  lines_.clear();
  functions_.clear();
  files_.clear();
  file_index_.clear();
  loaded_ = false;

  if (!dwarf.has_line_info()) {
    result missing = make_error_result(error_code::symbol_missing, "no DWARF line table for " + info.path);
    if (strict) {
      log_.err("debug info required in strict mode", redlog::field("path", info.path));
      return missing;
    }
    log_.wrn("no DWARF found, reporting raw addresses", redlog::field("path", info.path));
    diagnostics_.push_back(std::move(missing));
  }

  info_ = std::move(info);
  symbols_ = std::move(symbols);
  std::sort(symbols_.begin(), symbols_.end(), [](const macho_symbol& a, const macho_symbol& b) {
    return a.address < b.address;
  });

  std::vector<std::pair<uint64_t, std::string>> units;
  if (dwarf.has_debug_info()) {
    debug_info parsed;
    std::string error;
    if (parse_debug_info(dwarf, parsed, error)) {
      for (const auto& unit : parsed.units) {
        if (unit.stmt_list) {
          units.emplace_back(*unit.stmt_list, unit.comp_dir);
        }
      }
      for (auto& function : parsed.functions) {
        functions_.push_back(function_range{function.low_pc, function.high_pc, std::move(function.name)});
      }
    } else {
      log_.wrn("unable to parse .debug_info", redlog::field("error", error));
    }
  }
  std::sort(functions_.begin(), functions_.end(), [](const function_range& a, const function_range& b) {
    return std::tie(a.low, a.high) < std::tie(b.low, b.high);
  });

  if (dwarf.has_line_info()) {
    build_line_table(dwarf, units);
  }
  info_.has_debug_info = !lines_.empty();
  loaded_ = true;

  log_.inf(
      "module loaded", redlog::field("path", info_.path), redlog::field("arch", cpu_arch_name(info_.arch)),
      redlog::field("lines", lines_.size()), redlog::field("functions", functions_.size()),
      redlog::field("symbols", symbols_.size())
  );
  return make_success_result();
}

void symbol_store::reset() {
  info_ = module_info{};
  loaded_ = false;
  slide_ = 0;
  diagnostics_.clear();
  lines_.clear();
  functions_.clear();
  symbols_.clear();
  files_.clear();
  file_index_.clear();
}

void symbol_store::set_slide(int64_t slide) {
  if (slide != slide_) {
    log_.dbg("slide changed", redlog::field("slide", "0x%llx", static_cast<unsigned long long>(slide)));
  }
  slide_ = slide;
}

void symbol_store::set_slide_from_load_address(uint64_t text_load_address) {
  set_slide(static_cast<int64_t>(text_load_address - info_.text_vmaddr));
}

uint32_t symbol_store::intern_file(const std::string& path) {
  auto found = file_index_.find(path);
  if (found != file_index_.end()) {
    return found->second;
  }
  uint32_t index = static_cast<uint32_t>(files_.size());
  files_.push_back(path);
  file_index_.emplace(path, index);
  return index;
}

void symbol_store::build_line_table(
    const dwarf_sections& dwarf, const std::vector<std::pair<uint64_t, std::string>>& units
) {
  line_program program;
  uint64_t next_offset = 0;
  std::string error;

  if (!units.empty()) {
    for (const auto& [offset, comp_dir] : units) {
      error.clear();
      if (!parse_line_program(dwarf, offset, comp_dir, program, next_offset, error)) {
        log_.wrn("skipping line program", redlog::field("offset", "0x%llx", offset), redlog::field("error", error));
        continue;
      }
      add_sequence_rows(program);
    }
  } else {
    // no unit directory: walk the section unit by unit
    uint64_t offset = 0;
    while (offset < dwarf.debug_line.size()) {
      error.clear();
      if (!parse_line_program(dwarf, offset, {}, program, next_offset, error)) {
        log_.wrn("stopping line scan", redlog::field("offset", "0x%llx", offset), redlog::field("error", error));
        break;
      }
      add_sequence_rows(program);
      if (next_offset <= offset) {
        break;
      }
      offset = next_offset;
    }
  }

  std::sort(lines_.begin(), lines_.end(), [](const line_entry& a, const line_entry& b) {
    return std::tie(a.low, a.high) < std::tie(b.low, b.high);
  });
}

void symbol_store::add_sequence_rows(const line_program& program) {
  std::unordered_map<uint32_t, uint32_t> local_files;
  auto file_for = [&](uint32_t index) {
    auto found = local_files.find(index);
    if (found != local_files.end()) {
      return found->second;
    }
    uint32_t interned = intern_file(program.file_name(index));
    local_files.emplace(index, interned);
    return interned;
  };

  const auto& rows = program.rows;
  for (size_t i = 0; i + 1 < rows.size(); ++i) {
    const line_row& row = rows[i];
    const line_row& next = rows[i + 1];
    if (row.end_sequence) {
      continue;
    }
    if (row.line == 0 || next.address <= row.address) {
      continue;
    }
    if (program.file_name(row.file).empty()) {
      continue;
    }
    line_entry entry;
    entry.low = row.address;
    entry.high = next.address;
    entry.file = file_for(row.file);
    entry.line = row.line;
    entry.column = row.column;
    entry.is_stmt = row.is_stmt;
    lines_.push_back(entry);
  }
}

const symbol_store::line_entry* symbol_store::find_line(uint64_t address) const {
  auto it = std::upper_bound(lines_.begin(), lines_.end(), address, [](uint64_t value, const line_entry& entry) {
    return value < entry.low;
  });
  for (int scanned = 0; it != lines_.begin() && scanned < k_max_overlap_scan; ++scanned) {
    --it;
    if (address < it->high) {
      return &*it;
    }
  }
  return nullptr;
}

const symbol_store::function_range* symbol_store::find_function(uint64_t address) const {
  auto it = std::upper_bound(
      functions_.begin(), functions_.end(), address,
      [](uint64_t value, const function_range& function) { return value < function.low; }
  );
  const function_range* best = nullptr;
  for (int scanned = 0; it != functions_.begin() && scanned < k_max_overlap_scan; ++scanned) {
    --it;
    if (address >= it->low && address < it->high) {
      if (!best || it->high - it->low < best->high - best->low) {
        best = &*it;
      }
    }
  }
  return best;
}

const macho_symbol* symbol_store::find_symbol(uint64_t address) const {
  if (info_.text_size != 0 && (address < info_.text_vmaddr || address >= info_.text_vmaddr + info_.text_size)) {
    return nullptr;
  }
  auto it = std::upper_bound(symbols_.begin(), symbols_.end(), address, [](uint64_t value, const macho_symbol& sym) {
    return value < sym.address;
  });
  if (it == symbols_.begin()) {
    return nullptr;
  }
  return &*std::prev(it);
}

std::optional<source_location> symbol_store::resolve_address(uint64_t pc) const {
  if (!loaded_) {
    return std::nullopt;
  }
  uint64_t address = pc - static_cast<uint64_t>(slide_);
  const line_entry* entry = find_line(address);
  if (!entry) {
    return std::nullopt;
  }

  source_location location;
  location.file = files_[entry->file];
  location.line = entry->line;
  location.column = entry->column;
  if (const function_range* function = find_function(address)) {
    location.function = function->name;
  } else if (const macho_symbol* symbol = find_symbol(address)) {
    location.function = symbol->name;
  }
  return location;
}

std::optional<std::string> symbol_store::resolve_function(uint64_t pc) const {
  if (!loaded_) {
    return std::nullopt;
  }
  uint64_t address = pc - static_cast<uint64_t>(slide_);
  if (const function_range* function = find_function(address)) {
    return function->name;
  }
  if (const macho_symbol* symbol = find_symbol(address)) {
    return symbol->name;
  }
  return std::nullopt;
}

std::vector<uint32_t> symbol_store::match_files(std::string_view file) const {
  std::vector<uint32_t> exact;
  std::vector<uint32_t> suffix;
  std::vector<uint32_t> base;
  std::string_view wanted_base = util::basename_view(file);
  for (uint32_t i = 0; i < files_.size(); ++i) {
    std::string_view candidate = files_[i];
    if (candidate == file) {
      exact.push_back(i);
    } else if (util::path_has_suffix(candidate, file) || util::path_has_suffix(file, candidate)) {
      suffix.push_back(i);
    } else if (util::basename_view(candidate) == wanted_base) {
      base.push_back(i);
    }
  }
  if (!exact.empty()) {
    return exact;
  }
  if (!suffix.empty()) {
    return suffix;
  }
  return base;
}

std::optional<uint64_t> symbol_store::resolve_location(std::string_view file, uint32_t line) const {
  if (!loaded_ || file.empty()) {
    return std::nullopt;
  }
  std::vector<uint32_t> matched = match_files(file);
  if (matched.empty()) {
    log_.dbg("no line table file matches", redlog::field("file", std::string(file)));
    return std::nullopt;
  }
  auto in_file = [&](const line_entry& entry) {
    return std::find(matched.begin(), matched.end(), entry.file) != matched.end();
  };

  // the function whose line span covers the request keeps the search from leaking into the next function
  struct span {
    uint32_t first = std::numeric_limits<uint32_t>::max();
    uint32_t last = 0;
  };
  std::unordered_map<const function_range*, span> spans;
  for (const auto& entry : lines_) {
    if (!in_file(entry)) {
      continue;
    }
    const function_range* function = find_function(entry.low);
    if (!function) {
      continue;
    }
    span& s = spans[function];
    s.first = std::min(s.first, entry.line);
    s.last = std::max(s.last, entry.line);
  }
  const function_range* covering = nullptr;
  uint32_t covering_width = std::numeric_limits<uint32_t>::max();
  for (const auto& [function, s] : spans) {
    if (s.first <= line && line <= s.last && s.last - s.first < covering_width) {
      covering = function;
      covering_width = s.last - s.first;
    }
  }

  const line_entry* best = nullptr;
  auto better = [](const line_entry& a, const line_entry& b) {
    return std::make_tuple(a.line, !a.is_stmt, a.low) < std::make_tuple(b.line, !b.is_stmt, b.low);
  };
  for (const auto& entry : lines_) {
    if (entry.line < line || !in_file(entry)) {
      continue;
    }
    if (covering && find_function(entry.low) != covering) {
      continue;
    }
    if (!best || better(entry, *best)) {
      best = &entry;
    }
  }
  if (!best) {
    return std::nullopt;
  }
  return best->low + static_cast<uint64_t>(slide_);
}

} // namespace machdap::symbols
