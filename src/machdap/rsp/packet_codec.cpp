#include "packet_codec.hpp"

namespace machdap::rsp {

namespace {

constexpr char k_hex_chars[] = "0123456789abcdef";
constexpr int k_run_length_bias = 29;

bool needs_escape(char ch) {
  return ch == k_packet_start || ch == k_packet_end || ch == k_escape || ch == k_run_length;
}

} // namespace

uint8_t compute_checksum(std::string_view body) noexcept {
  uint8_t sum = 0;
  for (char c : body) {
    sum = static_cast<uint8_t>(sum + static_cast<uint8_t>(c));
  }
  return sum;
}

std::string escape_binary(std::string_view payload) {
  std::string out;
  out.reserve(payload.size());
  for (char ch : payload) {
    if (needs_escape(ch)) {
      out.push_back(k_escape);
      out.push_back(static_cast<char>(ch ^ 0x20));
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

std::string unescape_binary(std::string_view body) {
  std::string out;
  out.reserve(body.size());
  for (size_t i = 0; i < body.size(); ++i) {
    if (body[i] == k_escape && i + 1 < body.size()) {
      out.push_back(static_cast<char>(body[i + 1] ^ 0x20));
      ++i;
    } else {
      out.push_back(body[i]);
    }
  }
  return out;
}

std::string encode_packet(std::string_view payload) {
  std::string body = escape_binary(payload);
  uint8_t checksum = compute_checksum(body);
  std::string packet;
  packet.reserve(body.size() + 4);
  packet.push_back(k_packet_start);
  packet += body;
  packet.push_back(k_packet_end);
  packet.push_back(k_hex_chars[checksum >> 4]);
  packet.push_back(k_hex_chars[checksum & 0xf]);
  return packet;
}

bool expand_run_length(std::string_view body, std::string& out, std::string& error) {
  out.clear();
  out.reserve(body.size());
  for (size_t i = 0; i < body.size(); ++i) {
    char ch = body[i];
    if (ch == k_escape && i + 1 < body.size()) {
      out.push_back(ch);
      out.push_back(body[i + 1]);
      ++i;
      continue;
    }
    if (ch != k_run_length) {
      out.push_back(ch);
      continue;
    }
    if (out.empty() || i + 1 >= body.size()) {
      error = "dangling run-length marker";
      return false;
    }
    int count = static_cast<unsigned char>(body[i + 1]) - k_run_length_bias;
    if (count < 0) {
      error = "invalid run-length count";
      return false;
    }
    out.append(static_cast<size_t>(count), out.back());
    ++i;
  }
  return true;
}

bool decode_body(std::string_view raw, std::string& out, std::string& error) {
  std::string expanded;
  if (!expand_run_length(raw, expanded, error)) {
    return false;
  }
  out = unescape_binary(expanded);
  return true;
}

std::string bytes_to_hex(std::span<const uint8_t> bytes) {
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t value : bytes) {
    out.push_back(k_hex_chars[value >> 4]);
    out.push_back(k_hex_chars[value & 0xf]);
  }
  return out;
}

bool hex_to_bytes(std::string_view hex, std::vector<uint8_t>& out) {
  if (hex.size() % 2 != 0) {
    return false;
  }
  out.clear();
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    uint8_t high = hex_to_nibble(hex[i]);
    uint8_t low = hex_to_nibble(hex[i + 1]);
    if (high == 0xff || low == 0xff) {
      return false;
    }
    out.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return true;
}

std::string hex_encode_text(std::string_view text) {
  return bytes_to_hex(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

std::string hex_decode_text(std::string_view hex) {
  std::vector<uint8_t> bytes;
  if (!hex_to_bytes(hex, bytes)) {
    return std::string(hex);
  }
  return std::string(bytes.begin(), bytes.end());
}

std::string to_hex(uint64_t value) {
  if (value == 0) {
    return "0";
  }
  std::string out;
  while (value != 0) {
    out.insert(out.begin(), k_hex_chars[value & 0xf]);
    value >>= 4;
  }
  return out;
}

std::optional<uint64_t> parse_hex_u64(std::string_view text) {
  if (text.empty() || text.size() > 16) {
    return std::nullopt;
  }
  uint64_t value = 0;
  for (char ch : text) {
    uint8_t nibble = hex_to_nibble(ch);
    if (nibble == 0xff) {
      return std::nullopt;
    }
    value = (value << 4) | nibble;
  }
  return value;
}

std::optional<uint64_t> decode_le_u64(std::string_view hex) {
  std::vector<uint8_t> bytes;
  if (hex.empty() || !hex_to_bytes(hex, bytes) || bytes.size() > 8) {
    return std::nullopt;
  }
  uint64_t value = 0;
  for (size_t i = 0; i < bytes.size(); ++i) {
    value |= static_cast<uint64_t>(bytes[i]) << (8 * i);
  }
  return value;
}

} // namespace machdap::rsp
