#include "expression.hpp"

#include <cstdio>

#include "machdap/base/string_utils.hpp"

namespace machdap::session {

std::string format_address(uint64_t value) {
  char buffer[24];
  std::snprintf(buffer, sizeof(buffer), "0x%016llx", static_cast<unsigned long long>(value));
  return buffer;
}

result evaluate_expression(std::string_view expression, const evaluation_context& context, std::string& value) {
  std::string_view text = util::trim_view(expression);
  if (text.empty()) {
    return make_error_result(error_code::expression_unsupported, "empty expression");
  }
  const frame_info* frame = context.frame;

  if (frame) {
    if (text == "function") {
      value = frame->function;
      return make_success_result();
    }
    if (text == "file") {
      if (!frame->location) {
        return make_error_result(error_code::expression_unsupported, "no source for frame: file");
      }
      value = frame->location->file;
      return make_success_result();
    }
    if (text == "line") {
      if (!frame->location) {
        return make_error_result(error_code::expression_unsupported, "no source for frame: line");
      }
      value = std::to_string(frame->location->line);
      return make_success_result();
    }
  }

  const register_desc* reg = context.layout ? context.layout->find(text) : nullptr;
  if (!reg) {
    return make_error_result(error_code::expression_unsupported, std::string(text));
  }

  // outer frames only know the registers the unwinder recovered
  if (frame && frame->index > 0) {
    if (reg->regno == context.layout->pc_reg_num) {
      value = format_address(frame->pc);
    } else if (reg->regno == context.layout->fp_reg_num) {
      value = format_address(frame->fp);
    } else if (reg->regno == context.layout->sp_reg_num) {
      value = format_address(frame->sp);
    } else {
      return make_error_result(error_code::expression_unsupported, std::string(text) + " is not recovered in outer frames");
    }
    return make_success_result();
  }

  if (!context.reader) {
    if (frame && reg->regno == context.layout->pc_reg_num) {
      value = format_address(frame->pc);
      return make_success_result();
    }
    return make_error_result(error_code::expression_unsupported, std::string(text) + " needs a debugserver connection");
  }

  uint64_t raw = 0;
  if (auto status = context.reader->read_register(context.thread_id, reg->regno, raw); !status) {
    return status;
  }
  value = format_address(raw);
  return make_success_result();
}

} // namespace machdap::session
