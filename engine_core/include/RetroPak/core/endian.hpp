#pragma once

#include "RetroPak/core/types.hpp"

namespace RetroPak {

/**
 * @brief Endianness utilities for the archive formats
 *
 * Every multi-byte field in PAK and STRG payloads is stored big-endian
 * (the byte order of the console the archives were authored for). These
 * helpers convert between that order and the host's native order.
 */

/**
 * @brief Detect host endianness at compile time
 */
constexpr bool isLittleEndian() {
#if defined(__BYTE_ORDER__) && defined(__ORDER_LITTLE_ENDIAN__) && defined(__ORDER_BIG_ENDIAN__)
  return __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__;
#elif defined(_WIN32) || defined(_WIN64)
  // Windows is always little-endian
  return true;
#elif defined(__LITTLE_ENDIAN__) || defined(__i386__) || defined(__x86_64__) || defined(__amd64__) || defined(_M_IX86) || defined(_M_X64) || defined(__aarch64__) || defined(__arm__)
  return true;
#elif defined(__BIG_ENDIAN__) || defined(__ARMEB__) || defined(__THUMBEB__) || defined(__AARCH64EB__) || defined(_MIPSEB) || defined(__MIPSEB) || defined(__MIPSEB__)
  return false;
#else
  return true;
#endif
}

/**
 * @brief Swap byte order of a 16-bit value
 */
inline constexpr u16 byteSwap16(u16 value) {
  return static_cast<u16>(((value & 0xFF00u) >> 8) | ((value & 0x00FFu) << 8));
}

/**
 * @brief Swap byte order of a 32-bit value
 */
inline constexpr u32 byteSwap32(u32 value) {
#if defined(__GNUC__) || defined(__clang__)
  return __builtin_bswap32(value);
#elif defined(_MSC_VER)
  return _byteswap_ulong(value);
#else
  return ((value & 0xFF000000u) >> 24) |
         ((value & 0x00FF0000u) >> 8)  |
         ((value & 0x0000FF00u) << 8)  |
         ((value & 0x000000FFu) << 24);
#endif
}

inline constexpr u16 toBigEndian16(u16 value) {
  if constexpr (isLittleEndian()) {
    return byteSwap16(value);
  } else {
    return value;
  }
}

inline constexpr u16 fromBigEndian16(u16 value) {
  return toBigEndian16(value);
}

/**
 * @brief Convert 32-bit value from native to big-endian
 */
inline constexpr u32 toBigEndian32(u32 value) {
  if constexpr (isLittleEndian()) {
    return byteSwap32(value);
  } else {
    return value;
  }
}

/**
 * @brief Convert 32-bit value from big-endian to native
 */
inline constexpr u32 fromBigEndian32(u32 value) {
  return toBigEndian32(value);
}

} // namespace RetroPak
