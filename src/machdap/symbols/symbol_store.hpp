#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <redlog.hpp>

#include "machdap/base/error.hpp"

#include "dwarf_sections.hpp"
#include "line_program.hpp"
#include "macho_image.hpp"

namespace machdap::symbols {

struct module_info {
  std::string path;
  std::string debug_path;
  cpu_arch arch = cpu_arch::unknown;
  std::string uuid;
  uint64_t text_vmaddr = 0;
  uint64_t text_size = 0;
  bool has_debug_info = false;
};

struct source_location {
  std::string file;
  uint32_t line = 0;
  uint32_t column = 0;
  std::string function;
};

struct load_options {
  std::string program_path;
  // explicit dSYM bundle or DWARF file; adjacent bundles are searched when empty
  std::optional<std::string> debug_info_path;
  bool strict = false;
};

// address <-> line <-> function index for one module
//
// Addresses handed in and out are runtime addresses; the store subtracts the slide before searching its
// link-address tables.
class symbol_store {
public:
  result load(const load_options& options);

  // builds the tables from sections already in memory; `load` ends here too
  result load_sections(
      module_info info, const dwarf_sections& dwarf, std::vector<macho_symbol> symbols, bool strict = false
  );

  void reset();

  bool loaded() const { return loaded_; }
  const module_info& module() const { return info_; }
  // non-fatal load findings (missing DWARF, dSYM mismatch) for the client console
  const std::vector<result>& diagnostics() const { return diagnostics_; }

  int64_t slide() const { return slide_; }
  void set_slide(int64_t slide);
  void set_slide_from_load_address(uint64_t text_load_address);

  // none when `pc` falls outside every line-table range
  std::optional<source_location> resolve_address(uint64_t pc) const;
  // DWARF function name, else the nearest preceding Mach-O symbol
  std::optional<std::string> resolve_function(uint64_t pc) const;
  std::optional<uint64_t> resolve_location(std::string_view file, uint32_t line) const;

  size_t line_entry_count() const { return lines_.size(); }
  size_t function_count() const { return functions_.size(); }
  const std::vector<std::string>& files() const { return files_; }

private:
  struct line_entry {
    uint64_t low = 0;
    uint64_t high = 0;
    uint32_t file = 0;
    uint32_t line = 0;
    uint32_t column = 0;
    bool is_stmt = false;
  };

  struct function_range {
    uint64_t low = 0;
    uint64_t high = 0;
    std::string name;
  };

  uint32_t intern_file(const std::string& path);
  void build_line_table(const dwarf_sections& dwarf, const std::vector<std::pair<uint64_t, std::string>>& units);
  void add_sequence_rows(const line_program& program);

  const line_entry* find_line(uint64_t address) const;
  const function_range* find_function(uint64_t address) const;
  const macho_symbol* find_symbol(uint64_t address) const;
  std::vector<uint32_t> match_files(std::string_view file) const;

  module_info info_{};
  bool loaded_ = false;
  int64_t slide_ = 0;
  std::vector<result> diagnostics_{};

  std::vector<line_entry> lines_{};
  std::vector<function_range> functions_{};
  std::vector<macho_symbol> symbols_{};
  std::vector<std::string> files_{};
  std::unordered_map<std::string, uint32_t> file_index_{};

  mutable redlog::logger log_{"machdap.symbols.store"};
};

} // namespace machdap::symbols
