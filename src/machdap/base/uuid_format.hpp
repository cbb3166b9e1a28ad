#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace machdap::util {

constexpr size_t k_uuid_byte_count = 16;

bool is_all_zero_uuid(std::span<const uint8_t, k_uuid_byte_count> bytes);

// canonical form: upper-case 8-4-4-4-12, as dyld and dwarfdump print it
std::string format_uuid(std::span<const uint8_t, k_uuid_byte_count> bytes);

// strips dashes and folds case so two spellings of one uuid compare equal
std::string normalize_uuid(std::string_view text);

inline bool is_all_zero_uuid(const std::array<uint8_t, k_uuid_byte_count>& bytes) {
  return is_all_zero_uuid(std::span<const uint8_t, k_uuid_byte_count>(bytes));
}

inline std::string format_uuid(const std::array<uint8_t, k_uuid_byte_count>& bytes) {
  return format_uuid(std::span<const uint8_t, k_uuid_byte_count>(bytes));
}

} // namespace machdap::util
