#include "macho_image.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <memory>

#include <LIEF/LIEF.hpp>
#include <redlog.hpp>

#include "machdap/base/uuid_format.hpp"

namespace machdap::symbols {

namespace {

auto log_macho = redlog::get_logger("machdap.symbols.macho");

constexpr uint8_t k_n_stab = 0xe0;

cpu_arch arch_from_header(const LIEF::MachO::Binary& binary) {
  switch (binary.header().cpu_type()) {
  case LIEF::MachO::Header::CPU_TYPE::ARM64:
    return cpu_arch::arm64;
  case LIEF::MachO::Header::CPU_TYPE::X86_64:
    return cpu_arch::x86_64;
  default:
    return cpu_arch::unknown;
  }
}

const LIEF::MachO::Binary* select_slice(const LIEF::MachO::FatBinary& fat) {
  const LIEF::MachO::Binary* fallback = nullptr;
  for (const auto& binary : fat) {
    cpu_arch arch = arch_from_header(binary);
    if (arch == cpu_arch::arm64) {
      return &binary;
    }
    if (arch == cpu_arch::x86_64 && !fallback) {
      fallback = &binary;
    }
  }
  return fallback ? fallback : fat.front();
}

void copy_content(const LIEF::MachO::Section& section, std::vector<uint8_t>& out) {
  auto content = section.content();
  out.assign(content.begin(), content.end());
}

void collect_dwarf(const LIEF::MachO::Binary& binary, dwarf_sections& out) {
  for (const LIEF::MachO::Section& section : binary.sections()) {
    if (section.segment_name() != "__DWARF") {
      continue;
    }
    const std::string& name = section.name();
    if (name == "__debug_info") {
      copy_content(section, out.debug_info);
    } else if (name == "__debug_abbrev") {
      copy_content(section, out.debug_abbrev);
    } else if (name == "__debug_line") {
      copy_content(section, out.debug_line);
    } else if (name == "__debug_str") {
      copy_content(section, out.debug_str);
    } else if (name == "__debug_line_str") {
      copy_content(section, out.debug_line_str);
    } else if (name == "__debug_str_offs") {
      copy_content(section, out.debug_str_offsets);
    } else if (name == "__debug_addr") {
      copy_content(section, out.debug_addr);
    }
  }
}

void collect_symbols(const LIEF::MachO::Binary& binary, std::vector<macho_symbol>& out) {
  for (const LIEF::MachO::Symbol& sym : binary.symbols()) {
    if (sym.type() == LIEF::MachO::Symbol::TYPE::UNDEFINED) {
      continue;
    }
    if ((sym.raw_type() & k_n_stab) != 0 || sym.value() == 0 || sym.name().empty()) {
      continue;
    }
    macho_symbol entry;
    entry.address = sym.value();
    std::string demangled = sym.demangled_name();
    if (!demangled.empty()) {
      entry.name = std::move(demangled);
    } else {
      entry.name = sym.name();
      if (entry.name.size() > 1 && entry.name.front() == '_') {
        entry.name.erase(0, 1);
      }
    }
    out.push_back(std::move(entry));
  }
  std::sort(out.begin(), out.end(), [](const macho_symbol& a, const macho_symbol& b) {
    return a.address < b.address;
  });
}

} // namespace

const char* cpu_arch_name(cpu_arch arch) {
  switch (arch) {
  case cpu_arch::arm64:
    return "arm64";
  case cpu_arch::x86_64:
    return "x86_64";
  default:
    return "unknown";
  }
}

result load_macho_image(const std::string& path, macho_image& out) {
  out = macho_image{};
  out.path = path;

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return make_error_result(error_code::symbol_load_error, "not a file: " + path);
  }

  try {
    if (!LIEF::MachO::is_macho(path)) {
      return make_error_result(error_code::symbol_load_error, "not a Mach-O image: " + path);
    }
    std::unique_ptr<LIEF::MachO::FatBinary> fat = LIEF::MachO::Parser::parse(path);
    if (!fat || fat->empty()) {
      return make_error_result(error_code::symbol_load_error, "failed to parse Mach-O image: " + path);
    }

    const LIEF::MachO::Binary* binary = select_slice(*fat);
    if (!binary) {
      return make_error_result(error_code::symbol_load_error, "no usable slice in " + path);
    }

    out.arch = arch_from_header(*binary);
    if (binary->has_uuid()) {
      if (const auto* uuid_cmd = binary->uuid()) {
        const auto& bytes = uuid_cmd->uuid();
        if (!util::is_all_zero_uuid(bytes)) {
          out.uuid = util::format_uuid(bytes);
        }
      }
    }
    for (const LIEF::MachO::SegmentCommand& segment : binary->segments()) {
      if (segment.name() == "__TEXT") {
        out.text_vmaddr = segment.virtual_address();
        out.text_size = segment.virtual_size();
        break;
      }
    }
    collect_dwarf(*binary, out.dwarf);
    collect_symbols(*binary, out.symbols);
  } catch (const std::exception& exc) {
    return make_error_result(error_code::symbol_load_error, std::string("LIEF: ") + exc.what());
  }

  log_macho.dbg(
      "loaded mach-o", redlog::field("path", path), redlog::field("arch", cpu_arch_name(out.arch)),
      redlog::field("uuid", out.uuid), redlog::field("text", "0x%016llx", out.text_vmaddr),
      redlog::field("symbols", out.symbols.size()), redlog::field("debug_line", out.dwarf.debug_line.size())
  );
  return make_success_result();
}

} // namespace machdap::symbols
