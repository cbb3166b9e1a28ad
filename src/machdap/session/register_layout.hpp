#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "machdap/symbols/macho_image.hpp"

namespace machdap::session {

struct register_desc {
  std::string name;
  // debugserver register number, the operand of `p`
  int regno = -1;
  uint32_t bits = 64;
  std::vector<std::string> aliases;
};

// debugserver's general purpose register numbering for one architecture
struct register_layout {
  std::string architecture;
  std::vector<register_desc> registers;
  int pc_reg_num = -1;
  int sp_reg_num = -1;
  int fp_reg_num = -1;
  // -1 where the return address lives on the stack
  int lr_reg_num = -1;
  // software breakpoint length for `Z0`
  int breakpoint_kind = 1;
  // strips pointer authentication bits from saved return addresses
  uint64_t code_address_mask = ~0ull;

  // accepts names, aliases and an optional leading `$`
  const register_desc* find(std::string_view name) const;
  const register_desc* find(int regno) const;
  uint64_t strip_code_address(uint64_t address) const { return address & code_address_mask; }
};

// unknown architectures get the arm64 layout, the only one iOS devices run
register_layout build_register_layout(symbols::cpu_arch arch);

} // namespace machdap::session
