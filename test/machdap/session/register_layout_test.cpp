#include <doctest/doctest.h>

#include "machdap/session/register_layout.hpp"

using machdap::session::build_register_layout;
using machdap::symbols::cpu_arch;

TEST_CASE("arm64 register layout follows debugserver numbering") {
  auto layout = build_register_layout(cpu_arch::arm64);
  CHECK(layout.architecture == "arm64");
  CHECK(layout.pc_reg_num == 32);
  CHECK(layout.sp_reg_num == 31);
  CHECK(layout.fp_reg_num == 29);
  CHECK(layout.lr_reg_num == 30);
  CHECK(layout.breakpoint_kind == 4);

  REQUIRE(layout.find("x0") != nullptr);
  CHECK(layout.find("x0")->regno == 0);
  REQUIRE(layout.find("$PC") != nullptr);
  CHECK(layout.find("$PC")->regno == 32);
  REQUIRE(layout.find("x29") != nullptr);
  CHECK(layout.find("x29")->name == "fp");
  CHECK(layout.find("rip") == nullptr);
  REQUIRE(layout.find(30) != nullptr);
  CHECK(layout.find(30)->name == "lr");

  CHECK(layout.strip_code_address(0xa5c1000100003f80ull) == 0x100003f80ull);
}

TEST_CASE("x86_64 register layout keeps the return address on the stack") {
  auto layout = build_register_layout(cpu_arch::x86_64);
  CHECK(layout.architecture == "x86_64");
  CHECK(layout.pc_reg_num == 16);
  CHECK(layout.lr_reg_num == -1);
  CHECK(layout.breakpoint_kind == 1);
  REQUIRE(layout.find("pc") != nullptr);
  CHECK(layout.find("pc")->name == "rip");
  CHECK(layout.find("sp")->name == "rsp");
  CHECK(layout.strip_code_address(0x7fff12345678ull) == 0x7fff12345678ull);
}

TEST_CASE("unknown architectures use the arm64 layout") {
  auto layout = build_register_layout(cpu_arch::unknown);
  CHECK(layout.architecture == "arm64");
}
