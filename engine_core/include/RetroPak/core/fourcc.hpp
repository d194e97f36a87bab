#pragma once

/**
 * @file fourcc.hpp
 * @brief Four-character tags used for asset types and language IDs
 */

#include "RetroPak/core/result.hpp"
#include "RetroPak/core/types.hpp"
#include <array>
#include <functional>
#include <string>
#include <string_view>

namespace RetroPak::core {

class FourCC {
public:
  static constexpr usize SIZE = 4;

  constexpr FourCC() : m_chars{' ', ' ', ' ', ' '} {}

  // Literal form, e.g. FourCC("STRG")
  constexpr FourCC(const char (&text)[SIZE + 1]) // NOLINT(google-explicit-constructor)
      : m_chars{text[0], text[1], text[2], text[3]} {}

  /**
   * @brief Build a tag from runtime text
   * @return InvalidFourCC unless @p text is exactly four bytes
   */
  [[nodiscard]] static Result<FourCC> fromString(std::string_view text);

  [[nodiscard]] static FourCC fromBytes(const u8* bytes);

  [[nodiscard]] std::string toString() const { return std::string(m_chars.data(), SIZE); }

  [[nodiscard]] u32 toU32() const;

  [[nodiscard]] const std::array<char, SIZE>& chars() const { return m_chars; }

  constexpr bool operator==(const FourCC& other) const = default;
  constexpr auto operator<=>(const FourCC& other) const = default;

private:
  std::array<char, SIZE> m_chars;
};

} // namespace RetroPak::core

template <> struct std::hash<RetroPak::core::FourCC> {
  std::size_t operator()(const RetroPak::core::FourCC& tag) const noexcept {
    return std::hash<RetroPak::u32>{}(tag.toU32());
  }
};
