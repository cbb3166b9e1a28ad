#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace machdap::rsp {

enum class command_kind {
  query_supported,
  start_no_ack_mode,
  query_halt_reason,
  insert_breakpoint,
  remove_breakpoint,
  select_thread,
  read_register,
  read_memory,
  resume,
  step,
  thread_info_first,
  thread_info_next,
  loaded_libraries,
  detach,
  kill,
};

// what the stub answers with
enum class reply_kind {
  none,
  status,
  stop,
};

struct command {
  command_kind kind = command_kind::query_halt_reason;
  std::string payload;
  reply_kind reply = reply_kind::status;
  // caller-chosen correlation value echoed in failure events
  uint64_t tag = 0;
};

command make_query_supported();
command make_start_no_ack_mode();
command make_query_halt_reason();
command make_insert_breakpoint(uint64_t address, int kind, uint64_t tag = 0);
command make_remove_breakpoint(uint64_t address, int kind, uint64_t tag = 0);
command make_select_thread(uint64_t thread_id);
command make_read_register(int regno);
command make_read_memory(uint64_t address, size_t length);
command make_resume();
command make_step(uint64_t thread_id);
command make_thread_info_first();
command make_thread_info_next();
command make_loaded_libraries();
command make_detach();
command make_kill();

const char* command_kind_name(command_kind kind);

} // namespace machdap::rsp
