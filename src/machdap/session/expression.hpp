#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "machdap/base/error.hpp"

#include "register_layout.hpp"
#include "stack_assembler.hpp"
#include "target_reader.hpp"

namespace machdap::session {

struct evaluation_context {
  uint64_t thread_id = 0;
  const frame_info* frame = nullptr;
  const register_layout* layout = nullptr;
  // null in local-only sessions
  target_reader* reader = nullptr;
};

// register names (`x0`, `$pc`, `rip`, ...) and frame facts (`function`, `file`, `line`);
// anything else is expression_unsupported
result evaluate_expression(std::string_view expression, const evaluation_context& context, std::string& value);

std::string format_address(uint64_t value);

} // namespace machdap::session
