#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "machdap/base/error.hpp"

#include "dwarf_sections.hpp"

namespace machdap::symbols {

enum class cpu_arch { unknown, arm64, x86_64 };

const char* cpu_arch_name(cpu_arch arch);

struct macho_symbol {
  uint64_t address = 0;
  std::string name;
};

// one slice of a Mach-O image, reduced to what symbolication needs
struct macho_image {
  std::string path;
  cpu_arch arch = cpu_arch::unknown;
  std::string uuid;
  uint64_t text_vmaddr = 0;
  uint64_t text_size = 0;
  dwarf_sections dwarf;
  // defined, non-debug symbols sorted by address
  std::vector<macho_symbol> symbols;
};

// arm64 slice preferred, then x86_64, then the first slice
result load_macho_image(const std::string& path, macho_image& out);

} // namespace machdap::symbols
