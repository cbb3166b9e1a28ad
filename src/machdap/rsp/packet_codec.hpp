#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace machdap::rsp {

constexpr char k_packet_start = '$';
constexpr char k_packet_end = '#';
constexpr char k_notification_start = '%';
constexpr char k_escape = '}';
constexpr char k_run_length = '*';
constexpr char k_ack = '+';
constexpr char k_nack = '-';
constexpr char k_interrupt = '\x03';

constexpr uint8_t hex_to_nibble(char c) noexcept {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return 0xff;
}

uint8_t compute_checksum(std::string_view body) noexcept;

// `$<escaped payload>#xx`
std::string encode_packet(std::string_view payload);

// escapes `$ # } *` as `}` + (byte ^ 0x20)
std::string escape_binary(std::string_view payload);
std::string unescape_binary(std::string_view body);

// `c*N` repeats c (N - 29) more times; fails on a dangling or out of range count
bool expand_run_length(std::string_view body, std::string& out, std::string& error);

// expands run-length encoding, then removes binary escapes
bool decode_body(std::string_view raw, std::string& out, std::string& error);

std::string bytes_to_hex(std::span<const uint8_t> bytes);
bool hex_to_bytes(std::string_view hex, std::vector<uint8_t>& out);
std::string hex_encode_text(std::string_view text);
std::string hex_decode_text(std::string_view hex);

// lower-case hex without leading zeros, as addresses appear in packets
std::string to_hex(uint64_t value);
std::optional<uint64_t> parse_hex_u64(std::string_view text);

// register and memory replies carry target-endian (little-endian) bytes
std::optional<uint64_t> decode_le_u64(std::string_view hex);

} // namespace machdap::rsp
