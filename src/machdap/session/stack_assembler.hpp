#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "machdap/base/error.hpp"
#include "machdap/symbols/symbol_store.hpp"

#include "register_layout.hpp"
#include "target_reader.hpp"

namespace machdap::session {

struct frame_info {
  size_t index = 0;
  uint64_t pc = 0;
  uint64_t fp = 0;
  uint64_t sp = 0;
  std::optional<symbols::source_location> location;
  // "unknown" when nothing covers pc
  std::string function;
};

class stack_assembler {
public:
  static constexpr size_t k_max_depth = 64;

  stack_assembler(const register_layout& layout, const symbols::symbol_store* store)
      : layout_(layout), store_(store) {}

  // frame 0 from live registers, callers from the frame-pointer chain; frames are never dropped
  result backtrace(target_reader& reader, uint64_t thread_id, std::vector<frame_info>& out,
                   size_t max_depth = k_max_depth) const;

  // symbolicates one frame; caller frames look up the call instruction, not the return address
  void symbolicate(frame_info& frame) const;

  // return address of the innermost frame, right after a call (lr, or the word at sp)
  result return_address(target_reader& reader, uint64_t thread_id, uint64_t& out) const;

private:
  const register_layout& layout_;
  const symbols::symbol_store* store_ = nullptr;
  mutable redlog::logger log_{"machdap.session.stack"};
};

} // namespace machdap::session
