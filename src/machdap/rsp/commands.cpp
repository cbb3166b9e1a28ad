#include "commands.hpp"

#include <utility>

#include "packet_codec.hpp"

namespace machdap::rsp {

namespace {

command make_command(command_kind kind, std::string payload, reply_kind reply, uint64_t tag = 0) {
  command cmd;
  cmd.kind = kind;
  cmd.payload = std::move(payload);
  cmd.reply = reply;
  cmd.tag = tag;
  return cmd;
}

std::string breakpoint_payload(char op, uint64_t address, int kind) {
  std::string payload;
  payload.push_back(op);
  payload += "0,";
  payload += to_hex(address);
  payload.push_back(',');
  payload += std::to_string(kind);
  return payload;
}

} // namespace

command make_query_supported() {
  return make_command(command_kind::query_supported, "qSupported:multiprocess+;qRelocInsn+", reply_kind::status);
}

command make_start_no_ack_mode() {
  return make_command(command_kind::start_no_ack_mode, "QStartNoAckMode", reply_kind::status);
}

command make_query_halt_reason() { return make_command(command_kind::query_halt_reason, "?", reply_kind::stop); }

command make_insert_breakpoint(uint64_t address, int kind, uint64_t tag) {
  return make_command(command_kind::insert_breakpoint, breakpoint_payload('Z', address, kind), reply_kind::status, tag);
}

command make_remove_breakpoint(uint64_t address, int kind, uint64_t tag) {
  return make_command(command_kind::remove_breakpoint, breakpoint_payload('z', address, kind), reply_kind::status, tag);
}

command make_select_thread(uint64_t thread_id) {
  return make_command(command_kind::select_thread, "Hg" + to_hex(thread_id), reply_kind::status);
}

command make_read_register(int regno) {
  return make_command(command_kind::read_register, "p" + to_hex(static_cast<uint64_t>(regno)), reply_kind::status);
}

command make_read_memory(uint64_t address, size_t length) {
  return make_command(
      command_kind::read_memory, "m" + to_hex(address) + "," + to_hex(static_cast<uint64_t>(length)),
      reply_kind::status
  );
}

command make_resume() { return make_command(command_kind::resume, "vCont;c", reply_kind::stop); }

command make_step(uint64_t thread_id) {
  if (thread_id == 0) {
    return make_command(command_kind::step, "vCont;s", reply_kind::stop);
  }
  return make_command(command_kind::step, "vCont;s:" + to_hex(thread_id), reply_kind::stop);
}

command make_thread_info_first() { return make_command(command_kind::thread_info_first, "qfThreadInfo", reply_kind::status); }

command make_thread_info_next() { return make_command(command_kind::thread_info_next, "qsThreadInfo", reply_kind::status); }

command make_loaded_libraries() {
  return make_command(
      command_kind::loaded_libraries, "jGetLoadedDynamicLibrariesInfos:{\"fetch_all_solibs\":true}", reply_kind::status
  );
}

command make_detach() { return make_command(command_kind::detach, "D", reply_kind::status); }

command make_kill() { return make_command(command_kind::kill, "k", reply_kind::none); }

const char* command_kind_name(command_kind kind) {
  switch (kind) {
  case command_kind::query_supported:
    return "qSupported";
  case command_kind::start_no_ack_mode:
    return "QStartNoAckMode";
  case command_kind::query_halt_reason:
    return "?";
  case command_kind::insert_breakpoint:
    return "Z0";
  case command_kind::remove_breakpoint:
    return "z0";
  case command_kind::select_thread:
    return "Hg";
  case command_kind::read_register:
    return "p";
  case command_kind::read_memory:
    return "m";
  case command_kind::resume:
    return "vCont;c";
  case command_kind::step:
    return "vCont;s";
  case command_kind::thread_info_first:
    return "qfThreadInfo";
  case command_kind::thread_info_next:
    return "qsThreadInfo";
  case command_kind::loaded_libraries:
    return "jGetLoadedDynamicLibrariesInfos";
  case command_kind::detach:
    return "D";
  case command_kind::kill:
    return "k";
  default:
    return "unknown";
  }
}

} // namespace machdap::rsp
