#include "byte_reader.hpp"

namespace machdap::symbols {

void byte_reader::seek(size_t offset) {
  if (offset > data_.size()) {
    overrun_ = true;
    offset_ = data_.size();
    return;
  }
  offset_ = offset;
}

void byte_reader::skip(size_t count) {
  if (!take(count)) {
    return;
  }
  offset_ += count;
}

bool byte_reader::take(size_t count) {
  if (count > remaining()) {
    overrun_ = true;
    offset_ = data_.size();
    return false;
  }
  return true;
}

uint8_t byte_reader::u8() { return static_cast<uint8_t>(unsigned_of_size(1)); }

uint16_t byte_reader::u16() { return static_cast<uint16_t>(unsigned_of_size(2)); }

uint32_t byte_reader::u24() { return static_cast<uint32_t>(unsigned_of_size(3)); }

uint32_t byte_reader::u32() { return static_cast<uint32_t>(unsigned_of_size(4)); }

uint64_t byte_reader::u64() { return unsigned_of_size(8); }

uint64_t byte_reader::unsigned_of_size(size_t size) {
  if (size > 8 || !take(size)) {
    overrun_ = true;
    return 0;
  }
  uint64_t value = 0;
  for (size_t i = 0; i < size; ++i) {
    value |= static_cast<uint64_t>(data_[offset_ + i]) << (8 * i);
  }
  offset_ += size;
  return value;
}

uint64_t byte_reader::uleb128() {
  uint64_t value = 0;
  unsigned shift = 0;
  for (;;) {
    if (!take(1)) {
      return 0;
    }
    uint8_t byte = data_[offset_++];
    if (shift < 64) {
      value |= static_cast<uint64_t>(byte & 0x7f) << shift;
    }
    shift += 7;
    if ((byte & 0x80) == 0) {
      return value;
    }
  }
}

int64_t byte_reader::sleb128() {
  int64_t value = 0;
  unsigned shift = 0;
  uint8_t byte = 0;
  do {
    if (!take(1)) {
      return 0;
    }
    byte = data_[offset_++];
    if (shift < 64) {
      value |= static_cast<int64_t>(static_cast<uint64_t>(byte & 0x7f) << shift);
    }
    shift += 7;
  } while (byte & 0x80);
  if (shift < 64 && (byte & 0x40)) {
    value |= static_cast<int64_t>(~uint64_t{0} << shift);
  }
  return value;
}

std::string_view byte_reader::cstring() {
  size_t start = offset_;
  while (offset_ < data_.size() && data_[offset_] != 0) {
    ++offset_;
  }
  if (offset_ >= data_.size()) {
    overrun_ = true;
    return {};
  }
  std::string_view text(reinterpret_cast<const char*>(data_.data() + start), offset_ - start);
  ++offset_;
  return text;
}

uint64_t byte_reader::initial_length(bool& dwarf64) {
  uint32_t length = u32();
  if (length == 0xffffffffu) {
    dwarf64 = true;
    return u64();
  }
  dwarf64 = false;
  return length;
}

std::string_view string_at(std::span<const uint8_t> section, uint64_t offset) {
  if (offset >= section.size()) {
    return {};
  }
  byte_reader reader(section, static_cast<size_t>(offset));
  std::string_view text = reader.cstring();
  return reader.overrun() ? std::string_view{} : text;
}

} // namespace machdap::symbols
