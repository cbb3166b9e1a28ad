#include "packet_reader.hpp"

#include <redlog.hpp>

#include "packet_codec.hpp"

namespace machdap::rsp {

namespace {
auto log_reader = redlog::get_logger("machdap.rsp.reader");
} // namespace

void packet_reader::append(std::string_view bytes) { buffer_.append(bytes.data(), bytes.size()); }

void packet_reader::clear() { buffer_.clear(); }

bool packet_reader::next(frame& out) {
  size_t start = buffer_.find_first_of("+-\x03$%");
  if (start == std::string::npos) {
    if (!buffer_.empty()) {
      log_reader.trc("discarding noise", redlog::field("bytes", buffer_.size()));
      buffer_.clear();
    }
    return false;
  }
  if (start > 0) {
    log_reader.trc("discarding noise", redlog::field("bytes", start));
    buffer_.erase(0, start);
  }

  out = frame{};
  char lead = buffer_.front();
  if (lead == k_ack || lead == k_nack || lead == k_interrupt) {
    out.type = lead == k_ack ? frame::kind::ack : (lead == k_nack ? frame::kind::nack : frame::kind::interrupt);
    buffer_.erase(0, 1);
    return true;
  }

  size_t hash = buffer_.find(k_packet_end, 1);
  if (hash == std::string::npos || hash + 2 >= buffer_.size()) {
    return false;
  }

  std::string_view raw(buffer_.data() + 1, hash - 1);
  uint8_t high = hex_to_nibble(buffer_[hash + 1]);
  uint8_t low = hex_to_nibble(buffer_[hash + 2]);

  out.type = lead == k_packet_start ? frame::kind::packet : frame::kind::notification;
  if (high == 0xff || low == 0xff) {
    out.valid = false;
    out.error = "malformed checksum";
  } else if (compute_checksum(raw) != static_cast<uint8_t>((high << 4) | low)) {
    out.valid = false;
    out.error = "checksum mismatch";
  } else if (!decode_body(raw, out.body, out.error)) {
    out.valid = false;
  }

  buffer_.erase(0, hash + 3);
  return true;
}

} // namespace machdap::rsp
