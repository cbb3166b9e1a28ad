#include <doctest/doctest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "machdap/rsp/packet_codec.hpp"

using namespace machdap::rsp;

TEST_CASE("packet checksum is the byte sum modulo 256") {
  CHECK(compute_checksum("") == 0);
  CHECK(compute_checksum("OK") == 0x9a);
  CHECK(encode_packet("OK") == "$OK#9a");
  CHECK(encode_packet("?") == "$?#3f");
}

TEST_CASE("binary escaping covers the framing characters") {
  std::string raw = std::string("a$b#c}d*e");
  std::string escaped = escape_binary(raw);
  CHECK(escaped == "a}\x04" "b}\x03" "c}]d}\x0a" "e");
  CHECK(unescape_binary(escaped) == raw);
}

TEST_CASE("run-length encoding expands against the previous byte") {
  std::string out;
  std::string error;
  // ' ' is 32, so the run adds three more copies
  REQUIRE(expand_run_length("0* ", out, error));
  CHECK(out == "0000");

  REQUIRE(expand_run_length("ab", out, error));
  CHECK(out == "ab");

  CHECK_FALSE(expand_run_length("*", out, error));
  CHECK(error == "dangling run-length marker");
  CHECK_FALSE(expand_run_length("0*", out, error));
}

TEST_CASE("hex helpers") {
  std::vector<uint8_t> bytes;
  REQUIRE(hex_to_bytes("00ff10", bytes));
  CHECK(bytes == std::vector<uint8_t>{0x00, 0xff, 0x10});
  CHECK(bytes_to_hex(bytes) == "00ff10");
  CHECK_FALSE(hex_to_bytes("abc", bytes));
  CHECK_FALSE(hex_to_bytes("zz", bytes));

  CHECK(hex_encode_text("hi\n") == "68690a");
  CHECK(hex_decode_text("68690a") == "hi\n");

  CHECK(to_hex(0) == "0");
  CHECK(to_hex(0x1000) == "1000");
  CHECK(to_hex(0xdeadbeef) == "deadbeef");

  CHECK(parse_hex_u64("1F") == 0x1fu);
  CHECK_FALSE(parse_hex_u64("").has_value());
  CHECK_FALSE(parse_hex_u64("12345678901234567").has_value());
  CHECK_FALSE(parse_hex_u64("xyz").has_value());
}

TEST_CASE("register values decode little-endian") {
  CHECK(decode_le_u64("0010000001000000") == 0x100001000ull);
  CHECK(decode_le_u64("2a") == 0x2aull);
  CHECK_FALSE(decode_le_u64("").has_value());
  CHECK_FALSE(decode_le_u64("000000000000000000").has_value());
}
