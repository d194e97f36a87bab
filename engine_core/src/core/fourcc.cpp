#include "RetroPak/core/fourcc.hpp"

namespace RetroPak::core {

Result<FourCC> FourCC::fromString(std::string_view text) {
  if (text.size() != SIZE) {
    return Result<FourCC>::error(ErrorCode::InvalidFourCC,
                                 "Tag must be exactly 4 characters: '" + std::string(text) + "'");
  }
  FourCC tag;
  for (usize i = 0; i < SIZE; ++i) {
    tag.m_chars[i] = text[i];
  }
  return Result<FourCC>::ok(tag);
}

FourCC FourCC::fromBytes(const u8* bytes) {
  FourCC tag;
  for (usize i = 0; i < SIZE; ++i) {
    tag.m_chars[i] = static_cast<char>(bytes[i]);
  }
  return tag;
}

u32 FourCC::toU32() const {
  return (static_cast<u32>(static_cast<u8>(m_chars[0])) << 24) |
         (static_cast<u32>(static_cast<u8>(m_chars[1])) << 16) |
         (static_cast<u32>(static_cast<u8>(m_chars[2])) << 8) |
         static_cast<u32>(static_cast<u8>(m_chars[3]));
}

} // namespace RetroPak::core
