#pragma once

/**
 * @file alignment.hpp
 * @brief 32-byte alignment padding shared by the PAK and STRG containers
 */

#include "RetroPak/core/types.hpp"

namespace RetroPak::core {

constexpr usize PAK_ALIGNMENT = 32;
constexpr u8 DEFAULT_FILL_BYTE = 0xFF;

/**
 * @brief Number of filler bytes that round @p length up to PAK_ALIGNMENT
 * @return 0 when @p length is already aligned
 */
[[nodiscard]] constexpr usize paddingFor(usize length) {
  return (PAK_ALIGNMENT - (length % PAK_ALIGNMENT)) % PAK_ALIGNMENT;
}

[[nodiscard]] constexpr usize alignedSize(usize length) {
  return length + paddingFor(length);
}

/**
 * @brief Pad @p buffer in place to the next alignment boundary
 * @return Number of filler bytes appended
 */
inline usize appendPadding(ByteBuffer& buffer, u8 fillByte = DEFAULT_FILL_BYTE) {
  const usize padding = paddingFor(buffer.size());
  buffer.insert(buffer.end(), padding, fillByte);
  return padding;
}

} // namespace RetroPak::core
