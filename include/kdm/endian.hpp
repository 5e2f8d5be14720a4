#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

namespace kdm {

// C++20-compatible byteswap (C++23 has std::byteswap)
namespace detail {

inline constexpr uint32_t byteswap(uint32_t value) noexcept {
  return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) |
         ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

} // namespace detail

// Check if the system is little-endian at compile time
inline constexpr bool is_little_endian() noexcept {
  return std::endian::native == std::endian::little;
}

// Convert little-endian to host byte order
inline constexpr uint32_t letoh32(uint32_t value) noexcept {
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

// Convert host byte order to little-endian
inline constexpr uint32_t htole32(uint32_t value) noexcept {
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

// Unaligned little-endian load from a byte buffer
inline uint32_t loadLE32(const uint8_t *src) noexcept {
  uint32_t value;
  std::memcpy(&value, src, 4);
  return letoh32(value);
}

// Unaligned little-endian store into a byte buffer
inline void storeLE32(uint8_t *dst, uint32_t value) noexcept {
  uint32_t le = htole32(value);
  std::memcpy(dst, &le, 4);
}

} // namespace kdm
