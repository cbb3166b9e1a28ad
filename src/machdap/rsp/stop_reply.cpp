#include "stop_reply.hpp"

#include "machdap/base/string_utils.hpp"

#include "packet_codec.hpp"

namespace machdap::rsp {

namespace {

constexpr uint64_t k_exc_breakpoint = 6;

std::optional<uint8_t> parse_hex_u8(std::string_view text) {
  if (text.size() < 2) {
    return std::nullopt;
  }
  auto value = parse_hex_u64(text.substr(0, 2));
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(*value);
}

stop_cause cause_from_reason(std::string_view reason) {
  if (reason == "breakpoint") {
    return stop_cause::breakpoint;
  }
  if (reason == "trace" || reason == "single-step") {
    return stop_cause::step;
  }
  if (reason == "watchpoint") {
    return stop_cause::watchpoint;
  }
  if (reason == "exception") {
    return stop_cause::exception;
  }
  if (reason == "signal") {
    return stop_cause::signal;
  }
  return stop_cause::unknown;
}

void apply_field(stop_reply& reply, std::string_view key, std::string_view value) {
  if (key == "thread") {
    reply.thread_id = parse_thread_id(value, &reply.process_id);
    return;
  }
  if (key == "reason") {
    reply.reason = std::string(value);
    reply.cause = cause_from_reason(value);
    return;
  }
  if (key == "description") {
    reply.description = hex_decode_text(value);
    return;
  }
  if (key == "metype") {
    reply.mach_exception = parse_hex_u64(value);
    return;
  }
  if (key == "swbreak" || key == "hwbreak") {
    reply.cause = stop_cause::breakpoint;
    return;
  }
  if (key == "watch" || key == "rwatch" || key == "awatch") {
    reply.cause = stop_cause::watchpoint;
    reply.watch_address = parse_hex_u64(value);
    return;
  }
  if (key == "threads") {
    for (std::string_view part : util::split_view(value, ',')) {
      if (auto tid = parse_thread_id(part)) {
        reply.threads.push_back(*tid);
      }
    }
    return;
  }
  // `NN:value` register deltas use a bare hex register number as key
  if (auto regno = parse_hex_u64(key); regno && key.size() <= 4) {
    reply.registers.emplace_back(static_cast<int>(*regno), std::string(value));
  }
}

} // namespace

std::optional<uint64_t> stop_reply::register_value(int regno) const {
  for (const auto& entry : registers) {
    if (entry.first == regno) {
      return decode_le_u64(entry.second);
    }
  }
  return std::nullopt;
}

bool is_stop_reply(std::string_view body) {
  if (body.size() < 3) {
    return false;
  }
  char lead = body.front();
  if (lead != 'S' && lead != 'T' && lead != 'W' && lead != 'X') {
    return false;
  }
  return parse_hex_u8(body.substr(1)).has_value();
}

std::optional<uint64_t> parse_thread_id(std::string_view text, std::optional<uint64_t>* process_id) {
  if (text.empty()) {
    return std::nullopt;
  }
  if (text.front() == 'p') {
    size_t dot = text.find('.');
    if (dot == std::string_view::npos) {
      return std::nullopt;
    }
    if (process_id) {
      *process_id = parse_hex_u64(text.substr(1, dot - 1));
    }
    text = text.substr(dot + 1);
  }
  if (text == "-1" || text == "0") {
    return std::nullopt;
  }
  return parse_hex_u64(text);
}

std::optional<stop_reply> parse_stop_reply(std::string_view body) {
  if (!is_stop_reply(body)) {
    return std::nullopt;
  }

  stop_reply reply;
  reply.code = *parse_hex_u8(body.substr(1));
  std::string_view rest = body.substr(3);

  switch (body.front()) {
  case 'S':
    reply.kind = stop_kind::signal;
    reply.cause = stop_cause::signal;
    return reply;
  case 'W':
    reply.kind = stop_kind::exited;
    break;
  case 'X':
    reply.kind = stop_kind::terminated;
    break;
  default:
    reply.kind = stop_kind::signal;
    break;
  }

  for (std::string_view part : util::split_view(rest, ';')) {
    if (part.empty()) {
      continue;
    }
    size_t colon = part.find(':');
    if (colon == std::string_view::npos) {
      apply_field(reply, part, {});
      continue;
    }
    apply_field(reply, part.substr(0, colon), part.substr(colon + 1));
  }

  if (reply.kind == stop_kind::signal && reply.cause == stop_cause::unknown) {
    if (reply.mach_exception && *reply.mach_exception != k_exc_breakpoint) {
      reply.cause = stop_cause::exception;
    } else {
      reply.cause = stop_cause::signal;
    }
  }
  return reply;
}

const char* stop_cause_name(stop_cause cause) {
  switch (cause) {
  case stop_cause::breakpoint:
    return "breakpoint";
  case stop_cause::step:
    return "step";
  case stop_cause::watchpoint:
    return "watchpoint";
  case stop_cause::signal:
    return "signal";
  case stop_cause::exception:
    return "exception";
  default:
    return "unknown";
  }
}

} // namespace machdap::rsp
