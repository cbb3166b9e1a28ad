#include "stack_assembler.hpp"

namespace machdap::session {

namespace {

uint64_t load_u64(const std::vector<uint8_t>& bytes, size_t offset) {
  uint64_t value = 0;
  for (size_t i = 0; i < 8; ++i) {
    value |= static_cast<uint64_t>(bytes[offset + i]) << (8 * i);
  }
  return value;
}

} // namespace

void stack_assembler::symbolicate(frame_info& frame) const {
  frame.location.reset();
  frame.function = "unknown";
  if (!store_ || !store_->loaded()) {
    return;
  }
  uint64_t lookup = frame.index == 0 || frame.pc == 0 ? frame.pc : frame.pc - 1;
  frame.location = store_->resolve_address(lookup);
  if (frame.location && !frame.location->function.empty()) {
    frame.function = frame.location->function;
  } else if (auto name = store_->resolve_function(lookup)) {
    frame.function = *name;
  }
}

result stack_assembler::backtrace(
    target_reader& reader, uint64_t thread_id, std::vector<frame_info>& out, size_t max_depth
) const {
  out.clear();

  frame_info top;
  top.index = 0;
  if (auto status = reader.read_register(thread_id, layout_.pc_reg_num, top.pc); !status) {
    return status;
  }
  // fp and sp are best effort; a frame 0 with only a pc is still a frame
  if (!reader.read_register(thread_id, layout_.fp_reg_num, top.fp)) {
    top.fp = 0;
  }
  if (!reader.read_register(thread_id, layout_.sp_reg_num, top.sp)) {
    top.sp = 0;
  }
  symbolicate(top);
  out.push_back(top);

  uint64_t fp = top.fp;
  std::vector<uint8_t> record;
  while (out.size() < max_depth) {
    if (fp == 0 || (fp & 0x7) != 0) {
      break;
    }
    if (!reader.read_memory(fp, 16, record)) {
      log_.trc("frame chain unreadable", redlog::field("fp", "0x%016llx", fp));
      break;
    }
    uint64_t saved_fp = load_u64(record, 0);
    uint64_t return_pc = layout_.strip_code_address(load_u64(record, 8));
    if (return_pc == 0) {
      break;
    }

    frame_info caller;
    caller.index = out.size();
    caller.pc = return_pc;
    caller.fp = saved_fp;
    caller.sp = fp + 16;
    symbolicate(caller);
    out.push_back(caller);

    // callers live at higher addresses; anything else is a corrupt chain
    if (saved_fp <= fp) {
      break;
    }
    fp = saved_fp;
  }

  // leaf functions on arm64 may not have pushed a frame record yet
  if (out.size() == 1 && layout_.lr_reg_num >= 0 && max_depth > 1) {
    uint64_t lr = 0;
    if (reader.read_register(thread_id, layout_.lr_reg_num, lr) && layout_.strip_code_address(lr) != 0) {
      frame_info caller;
      caller.index = 1;
      caller.pc = layout_.strip_code_address(lr);
      caller.fp = top.fp;
      caller.sp = top.sp;
      symbolicate(caller);
      out.push_back(caller);
    }
  }

  log_.dbg("backtrace", redlog::field("thread", thread_id), redlog::field("frames", out.size()));
  return make_success_result();
}

result stack_assembler::return_address(target_reader& reader, uint64_t thread_id, uint64_t& out) const {
  if (layout_.lr_reg_num >= 0) {
    uint64_t lr = 0;
    if (auto status = reader.read_register(thread_id, layout_.lr_reg_num, lr); !status) {
      return status;
    }
    out = layout_.strip_code_address(lr);
    return make_success_result();
  }
  uint64_t sp = 0;
  if (auto status = reader.read_register(thread_id, layout_.sp_reg_num, sp); !status) {
    return status;
  }
  std::vector<uint8_t> word;
  if (auto status = reader.read_memory(sp, 8, word); !status) {
    return status;
  }
  out = load_u64(word, 0);
  return make_success_result();
}

} // namespace machdap::session
