#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace machdap::rsp {

enum class stop_kind { signal, exited, terminated };

enum class stop_cause { unknown, breakpoint, step, watchpoint, signal, exception };

struct stop_reply {
  stop_kind kind = stop_kind::signal;
  // signal number for `S`/`T`/`X`, exit status for `W`
  uint8_t code = 0;
  std::optional<uint64_t> thread_id;
  std::optional<uint64_t> process_id;
  stop_cause cause = stop_cause::unknown;
  std::string reason;
  std::string description;
  std::optional<uint64_t> mach_exception;
  std::optional<uint64_t> watch_address;
  std::vector<uint64_t> threads;
  std::vector<std::pair<int, std::string>> registers;

  std::optional<uint64_t> register_value(int regno) const;
};

bool is_stop_reply(std::string_view body);
std::optional<stop_reply> parse_stop_reply(std::string_view body);

// `p1f.2a`, `2a` or `-1` thread ids
std::optional<uint64_t> parse_thread_id(std::string_view text, std::optional<uint64_t>* process_id = nullptr);

const char* stop_cause_name(stop_cause cause);

} // namespace machdap::rsp
