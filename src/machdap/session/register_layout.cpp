#include "register_layout.hpp"

#include "machdap/base/string_utils.hpp"

namespace machdap::session {

namespace {

// user space on arm64 Darwin stays below 2^39
constexpr uint64_t k_arm64_code_mask = 0x0000007fffffffffull;

register_layout build_arm64_layout() {
  register_layout layout{};
  layout.architecture = "arm64";
  for (int i = 0; i <= 28; ++i) {
    layout.registers.push_back(register_desc{"x" + std::to_string(i), i, 64, {}});
  }
  layout.registers.push_back(register_desc{"fp", 29, 64, {"x29"}});
  layout.registers.push_back(register_desc{"lr", 30, 64, {"x30"}});
  layout.registers.push_back(register_desc{"sp", 31, 64, {"x31"}});
  layout.registers.push_back(register_desc{"pc", 32, 64, {}});
  layout.registers.push_back(register_desc{"cpsr", 33, 32, {}});
  layout.fp_reg_num = 29;
  layout.lr_reg_num = 30;
  layout.sp_reg_num = 31;
  layout.pc_reg_num = 32;
  layout.breakpoint_kind = 4;
  layout.code_address_mask = k_arm64_code_mask;
  return layout;
}

register_layout build_x86_64_layout() {
  register_layout layout{};
  layout.architecture = "x86_64";
  const char* names[] = {"rax", "rbx", "rcx", "rdx", "rdi", "rsi", "rbp", "rsp",
                         "r8",  "r9",  "r10", "r11", "r12", "r13", "r14", "r15"};
  for (int i = 0; i < 16; ++i) {
    layout.registers.push_back(register_desc{names[i], i, 64, {}});
  }
  layout.registers[6].aliases = {"fp"};
  layout.registers[7].aliases = {"sp"};
  layout.registers.push_back(register_desc{"rip", 16, 64, {"pc"}});
  layout.registers.push_back(register_desc{"rflags", 17, 32, {}});
  layout.fp_reg_num = 6;
  layout.sp_reg_num = 7;
  layout.pc_reg_num = 16;
  layout.breakpoint_kind = 1;
  return layout;
}

} // namespace

const register_desc* register_layout::find(std::string_view name) const {
  if (!name.empty() && name.front() == '$') {
    name.remove_prefix(1);
  }
  std::string wanted = util::to_lower(name);
  for (const auto& reg : registers) {
    if (reg.name == wanted) {
      return &reg;
    }
    for (const auto& alias : reg.aliases) {
      if (alias == wanted) {
        return &reg;
      }
    }
  }
  return nullptr;
}

const register_desc* register_layout::find(int regno) const {
  for (const auto& reg : registers) {
    if (reg.regno == regno) {
      return &reg;
    }
  }
  return nullptr;
}

register_layout build_register_layout(symbols::cpu_arch arch) {
  if (arch == symbols::cpu_arch::x86_64) {
    return build_x86_64_layout();
  }
  return build_arm64_layout();
}

} // namespace machdap::session
