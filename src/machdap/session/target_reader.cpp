#include "target_reader.hpp"

#include <string>

#include "machdap/rsp/commands.hpp"
#include "machdap/rsp/packet_codec.hpp"
#include "machdap/rsp/stop_reply.hpp"

namespace machdap::session {

namespace {

constexpr int k_max_thread_info_pages = 256;

result check_reply(const std::string& reply, const char* what) {
  if (reply.empty()) {
    return make_error_result(error_code::remote_protocol_error, std::string(what) + " unsupported by stub");
  }
  if (reply.size() == 3 && reply[0] == 'E') {
    return make_error_result(error_code::remote_protocol_error, std::string(what) + " failed: " + reply);
  }
  return make_success_result();
}

} // namespace

result remote_target_reader::select_thread(uint64_t thread_id) {
  if (selected_thread_ == thread_id) {
    return make_success_result();
  }
  std::string reply;
  if (auto status = remote_.request(rsp::make_select_thread(thread_id), reply); !status) {
    return status;
  }
  if (reply != "OK") {
    return make_error_result(error_code::remote_protocol_error, "cannot select thread: " + reply);
  }
  selected_thread_ = thread_id;
  return make_success_result();
}

result remote_target_reader::read_register(uint64_t thread_id, int regno, uint64_t& value) {
  auto cached = registers_.find({thread_id, regno});
  if (cached != registers_.end()) {
    value = cached->second;
    return make_success_result();
  }
  if (auto status = select_thread(thread_id); !status) {
    return status;
  }
  std::string reply;
  if (auto status = remote_.request(rsp::make_read_register(regno), reply); !status) {
    return status;
  }
  if (auto status = check_reply(reply, "register read"); !status) {
    return status;
  }
  auto decoded = rsp::decode_le_u64(reply);
  if (!decoded) {
    return make_error_result(error_code::remote_protocol_error, "malformed register reply: " + reply);
  }
  value = *decoded;
  registers_[{thread_id, regno}] = value;
  log_.ped("register", redlog::field("thread", thread_id), redlog::field("regno", regno),
           redlog::field("value", "0x%016llx", value));
  return make_success_result();
}

result remote_target_reader::read_memory(uint64_t address, size_t length, std::vector<uint8_t>& out) {
  std::string reply;
  if (auto status = remote_.request(rsp::make_read_memory(address, length), reply); !status) {
    return status;
  }
  if (auto status = check_reply(reply, "memory read"); !status) {
    return status;
  }
  out.clear();
  if (!rsp::hex_to_bytes(reply, out) || out.size() != length) {
    return make_error_result(error_code::remote_protocol_error, "short memory read at 0x" + rsp::to_hex(address));
  }
  return make_success_result();
}

result remote_target_reader::thread_ids(std::vector<uint64_t>& out) {
  out.clear();
  std::string reply;
  if (auto status = remote_.request(rsp::make_thread_info_first(), reply); !status) {
    return status;
  }
  for (int page = 0; page < k_max_thread_info_pages; ++page) {
    if (reply.empty() || reply.front() != 'm') {
      break;
    }
    std::string_view list(reply);
    list.remove_prefix(1);
    size_t start = 0;
    while (start <= list.size()) {
      size_t comma = list.find(',', start);
      std::string_view item = list.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
      if (auto tid = rsp::parse_thread_id(item)) {
        out.push_back(*tid);
      }
      if (comma == std::string_view::npos) {
        break;
      }
      start = comma + 1;
    }
    if (auto status = remote_.request(rsp::make_thread_info_next(), reply); !status) {
      return status;
    }
  }
  if (reply.size() == 3 && reply[0] == 'E') {
    return make_error_result(error_code::remote_protocol_error, "thread list failed: " + reply);
  }
  return make_success_result();
}

void remote_target_reader::seed(uint64_t thread_id, const std::vector<std::pair<int, std::string>>& registers) {
  for (const auto& [regno, hex] : registers) {
    if (auto value = rsp::decode_le_u64(hex)) {
      registers_[{thread_id, regno}] = *value;
    }
  }
}

void remote_target_reader::invalidate() {
  registers_.clear();
  selected_thread_.reset();
}

} // namespace machdap::session
