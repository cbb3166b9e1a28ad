#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace machdap::symbols {

// bounds-checked little-endian cursor over a debug section
//
// Reads past the end return zero and latch `overrun()`; callers check once per record instead of per field.
class byte_reader {
public:
  byte_reader() = default;
  explicit byte_reader(std::span<const uint8_t> data, size_t offset = 0) : data_(data), offset_(offset) {}

  size_t offset() const { return offset_; }
  size_t size() const { return data_.size(); }
  size_t remaining() const { return offset_ < data_.size() ? data_.size() - offset_ : 0; }
  bool eof() const { return offset_ >= data_.size(); }
  bool overrun() const { return overrun_; }

  void seek(size_t offset);
  void skip(size_t count);

  uint8_t u8();
  uint16_t u16();
  uint32_t u24();
  uint32_t u32();
  uint64_t u64();
  uint64_t unsigned_of_size(size_t size);
  uint64_t uleb128();
  int64_t sleb128();
  std::string_view cstring();

  // unit length; switches to 64-bit offsets on the 0xffffffff escape
  uint64_t initial_length(bool& dwarf64);
  uint64_t section_offset(bool dwarf64) { return dwarf64 ? u64() : u32(); }

private:
  bool take(size_t count);

  std::span<const uint8_t> data_{};
  size_t offset_ = 0;
  bool overrun_ = false;
};

// NUL-terminated string at `offset` inside a string section, empty when out of range
std::string_view string_at(std::span<const uint8_t> section, uint64_t offset);

} // namespace machdap::symbols
