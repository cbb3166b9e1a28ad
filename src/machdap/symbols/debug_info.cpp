#include "debug_info.hpp"

#include <map>
#include <unordered_map>
#include <utility>

#include <redlog.hpp>

#include "dwarf_constants.hpp"

namespace machdap::symbols {

using namespace dwarf;

namespace {

auto log_info = redlog::get_logger("machdap.symbols.debug_info");

constexpr int k_max_reference_hops = 8;

struct attribute_spec {
  uint64_t name = 0;
  uint64_t form = 0;
  int64_t implicit_const = 0;
};

struct abbrev {
  uint64_t tag = 0;
  bool has_children = false;
  std::vector<attribute_spec> attributes;
};

using abbrev_table = std::unordered_map<uint64_t, abbrev>;

bool parse_abbrev_table(const dwarf_sections& sections, uint64_t offset, abbrev_table& out) {
  byte_reader reader(sections.debug_abbrev, static_cast<size_t>(offset));
  if (offset >= sections.debug_abbrev.size()) {
    return false;
  }
  for (;;) {
    uint64_t code = reader.uleb128();
    if (code == 0 || reader.overrun()) {
      break;
    }
    abbrev entry;
    entry.tag = reader.uleb128();
    entry.has_children = reader.u8() != 0;
    for (;;) {
      attribute_spec spec;
      spec.name = reader.uleb128();
      spec.form = reader.uleb128();
      if (spec.name == 0 && spec.form == 0) {
        break;
      }
      if (spec.form == dw_form_implicit_const) {
        spec.implicit_const = reader.sleb128();
      }
      if (reader.overrun()) {
        return false;
      }
      entry.attributes.push_back(spec);
    }
    out.emplace(code, std::move(entry));
  }
  return !reader.overrun();
}

struct die_record {
  std::string qualified;
  std::string linkage;
  std::optional<uint64_t> reference;
};

struct pending_function {
  uint64_t low_pc = 0;
  uint64_t high_pc = 0;
  std::string qualified;
  std::string linkage;
  std::optional<uint64_t> reference;
};

bool is_scope_tag(uint64_t tag) {
  return tag == dw_tag_namespace || tag == dw_tag_class_type || tag == dw_tag_structure_type ||
         tag == dw_tag_union_type || tag == dw_tag_enumeration_type;
}

class unit_walker {
public:
  unit_walker(const dwarf_sections& sections, std::unordered_map<uint64_t, die_record>& records)
      : sections_(sections), records_(records) {}

  bool walk(
      byte_reader& reader, uint64_t unit_end, unit_context& unit, const abbrev_table& abbrevs,
      compile_unit_entry& cu, std::vector<pending_function>& functions, std::string& error
  ) {
    std::vector<std::string> scopes;
    bool first = true;
    std::vector<std::pair<uint64_t, attribute_value>> values;

    while (reader.offset() < unit_end) {
      uint64_t die_offset = reader.offset();
      uint64_t code = reader.uleb128();
      if (reader.overrun()) {
        break;
      }
      if (code == 0) {
        if (!scopes.empty()) {
          scopes.pop_back();
        }
        continue;
      }
      auto found = abbrevs.find(code);
      if (found == abbrevs.end()) {
        error = "unknown abbreviation code";
        return false;
      }
      const abbrev& entry = found->second;

      values.clear();
      for (const auto& spec : entry.attributes) {
        attribute_value value;
        if (!read_form(reader, spec.form, unit, value, spec.implicit_const)) {
          error = "unsupported attribute form " + std::to_string(spec.form);
          return false;
        }
        values.emplace_back(spec.name, value);
      }

      if (first) {
        first = false;
        for (const auto& [name, value] : values) {
          if (name == dw_at_str_offsets_base) {
            unit.str_offsets_base = value.value;
          } else if (name == dw_at_addr_base) {
            unit.addr_base = value.value;
          }
        }
      }

      std::string name;
      std::string linkage;
      std::optional<uint64_t> reference;
      std::optional<uint64_t> low_pc;
      std::optional<attribute_value> high_pc;
      for (const auto& [attr, value] : values) {
        switch (attr) {
        case dw_at_name:
          if (auto text = resolve_string(value, unit, sections_)) {
            name = std::string(*text);
          }
          break;
        case dw_at_linkage_name:
        case dw_at_mips_linkage_name:
          if (auto text = resolve_string(value, unit, sections_)) {
            linkage = std::string(*text);
          }
          break;
        case dw_at_specification:
        case dw_at_abstract_origin:
          reference = resolve_reference(value, unit);
          break;
        case dw_at_low_pc:
          low_pc = resolve_address(value, unit, sections_);
          break;
        case dw_at_high_pc:
          high_pc = value;
          break;
        case dw_at_comp_dir:
          if (entry.tag == dw_tag_compile_unit || entry.tag == dw_tag_partial_unit) {
            if (auto text = resolve_string(value, unit, sections_)) {
              cu.comp_dir = std::string(*text);
            }
          }
          break;
        case dw_at_stmt_list:
          if (entry.tag == dw_tag_compile_unit || entry.tag == dw_tag_partial_unit) {
            cu.stmt_list = value.value;
          }
          break;
        default:
          break;
        }
      }

      if (entry.tag == dw_tag_compile_unit || entry.tag == dw_tag_partial_unit) {
        cu.name = name;
      }

      const std::string prefix = scopes.empty() ? std::string{} : scopes.back();
      if (entry.tag == dw_tag_subprogram || is_scope_tag(entry.tag)) {
        die_record record;
        record.qualified = name.empty() ? std::string{} : prefix + name;
        record.linkage = linkage;
        record.reference = reference;
        records_[die_offset] = std::move(record);
      }

      if (entry.tag == dw_tag_subprogram && low_pc && high_pc) {
        pending_function function;
        function.low_pc = *low_pc;
        if (is_constant_form(high_pc->form)) {
          function.high_pc = *low_pc + high_pc->value;
        } else {
          function.high_pc = resolve_address(*high_pc, unit, sections_).value_or(*low_pc);
        }
        function.qualified = name.empty() ? std::string{} : prefix + name;
        function.linkage = linkage;
        function.reference = reference;
        if (function.high_pc > function.low_pc) {
          functions.push_back(std::move(function));
        }
      }

      if (entry.has_children) {
        if (entry.tag == dw_tag_namespace) {
          scopes.push_back(prefix + (name.empty() ? std::string("(anonymous namespace)") : name) + "::");
        } else if (is_scope_tag(entry.tag) && !name.empty()) {
          scopes.push_back(prefix + name + "::");
        } else {
          scopes.push_back(prefix);
        }
      }
    }
    return !reader.overrun();
  }

private:
  const dwarf_sections& sections_;
  std::unordered_map<uint64_t, die_record>& records_;
};

void resolve_function_name(
    pending_function& function, const std::unordered_map<uint64_t, die_record>& records
) {
  std::optional<uint64_t> reference = function.reference;
  for (int hop = 0; hop < k_max_reference_hops && reference; ++hop) {
    auto found = records.find(*reference);
    if (found == records.end()) {
      break;
    }
    // the declaration carries the class scope, prefer its spelling
    if (!found->second.qualified.empty()) {
      function.qualified = found->second.qualified;
    }
    if (function.linkage.empty()) {
      function.linkage = found->second.linkage;
    }
    reference = found->second.reference;
  }
}

} // namespace

bool parse_debug_info(const dwarf_sections& sections, debug_info& out, std::string& error) {
  out = debug_info{};
  if (!sections.has_debug_info()) {
    error = "no .debug_info";
    return false;
  }

  std::map<uint64_t, abbrev_table> abbrev_cache;
  std::unordered_map<uint64_t, die_record> records;
  std::vector<pending_function> functions;
  unit_walker walker(sections, records);

  byte_reader reader(sections.debug_info);
  while (!reader.eof()) {
    uint64_t unit_offset = reader.offset();
    unit_context unit;
    unit.unit_offset = unit_offset;
    uint64_t unit_length = reader.initial_length(unit.dwarf64);
    uint64_t unit_end = reader.offset() + unit_length;
    if (reader.overrun() || unit_length == 0 || unit_end > sections.debug_info.size()) {
      error = "truncated .debug_info unit";
      return false;
    }

    unit.version = reader.u16();
    uint8_t unit_type = dw_ut_compile;
    uint64_t abbrev_offset = 0;
    if (unit.version >= 5) {
      unit_type = reader.u8();
      unit.address_size = reader.u8();
      abbrev_offset = reader.section_offset(unit.dwarf64);
      if (unit_type == dw_ut_skeleton || unit_type == dw_ut_split_compile) {
        reader.skip(8);
      } else if (unit_type == dw_ut_type || unit_type == dw_ut_split_type) {
        reader.seek(static_cast<size_t>(unit_end));
        continue;
      }
    } else if (unit.version >= 2) {
      abbrev_offset = reader.section_offset(unit.dwarf64);
      unit.address_size = reader.u8();
    } else {
      error = "unsupported .debug_info version " + std::to_string(unit.version);
      return false;
    }

    auto cached = abbrev_cache.find(abbrev_offset);
    if (cached == abbrev_cache.end()) {
      abbrev_table table;
      if (!parse_abbrev_table(sections, abbrev_offset, table)) {
        error = "invalid .debug_abbrev table";
        return false;
      }
      cached = abbrev_cache.emplace(abbrev_offset, std::move(table)).first;
    }

    compile_unit_entry cu;
    cu.offset = unit_offset;
    cu.version = unit.version;
    std::string unit_error;
    if (!walker.walk(reader, unit_end, unit, cached->second, cu, functions, unit_error)) {
      // a bad unit only costs its own functions
      log_info.wrn(
          "skipping malformed compile unit", redlog::field("offset", "0x%llx", unit_offset),
          redlog::field("error", unit_error)
      );
    }
    out.units.push_back(std::move(cu));
    reader.seek(static_cast<size_t>(unit_end));
  }

  out.functions.reserve(functions.size());
  for (auto& function : functions) {
    resolve_function_name(function, records);
    function_entry entry;
    entry.low_pc = function.low_pc;
    entry.high_pc = function.high_pc;
    entry.name = !function.qualified.empty() ? function.qualified : function.linkage;
    entry.linkage_name = function.linkage;
    if (!entry.name.empty()) {
      out.functions.push_back(std::move(entry));
    }
  }
  log_info.dbg(
      "parsed debug info", redlog::field("units", out.units.size()), redlog::field("functions", out.functions.size())
  );
  return true;
}

} // namespace machdap::symbols
