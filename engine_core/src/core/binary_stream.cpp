#include "RetroPak/core/binary_stream.hpp"
#include "RetroPak/core/endian.hpp"

#include <cstring>

namespace RetroPak::core {

// ============================================================================
// BinaryReader
// ============================================================================

u8 BinaryReader::readU8() {
  if (!canRead(1)) {
    m_failed = true;
    return 0;
  }
  return m_data[m_pos++];
}

u16 BinaryReader::readU16() {
  if (!canRead(sizeof(u16))) {
    m_failed = true;
    return 0;
  }
  u16 raw;
  std::memcpy(&raw, m_data.data() + m_pos, sizeof(raw));
  m_pos += sizeof(raw);
  return fromBigEndian16(raw);
}

u32 BinaryReader::readU32() {
  if (!canRead(sizeof(u32))) {
    m_failed = true;
    return 0;
  }
  u32 raw;
  std::memcpy(&raw, m_data.data() + m_pos, sizeof(raw));
  m_pos += sizeof(raw);
  return fromBigEndian32(raw);
}

FourCC BinaryReader::readFourCC() {
  if (!canRead(FourCC::SIZE)) {
    m_failed = true;
    return FourCC();
  }
  FourCC tag = FourCC::fromBytes(m_data.data() + m_pos);
  m_pos += FourCC::SIZE;
  return tag;
}

ByteSpan BinaryReader::readBytes(usize count) {
  if (!canRead(count)) {
    m_failed = true;
    return {};
  }
  ByteSpan bytes = m_data.subspan(m_pos, count);
  m_pos += count;
  return bytes;
}

void BinaryReader::skip(usize count) {
  if (!canRead(count)) {
    m_failed = true;
    m_pos = m_data.size();
    return;
  }
  m_pos += count;
}

void BinaryReader::seek(usize position) {
  if (position > m_data.size()) {
    m_failed = true;
    m_pos = m_data.size();
    return;
  }
  m_pos = position;
}

// ============================================================================
// BinaryWriter
// ============================================================================

void BinaryWriter::writeU8(u8 value) {
  m_data.push_back(value);
}

void BinaryWriter::writeU16(u16 value) {
  const u16 raw = toBigEndian16(value);
  u8 bytes[sizeof(raw)];
  std::memcpy(bytes, &raw, sizeof(raw));
  m_data.insert(m_data.end(), bytes, bytes + sizeof(raw));
}

void BinaryWriter::writeU32(u32 value) {
  const u32 raw = toBigEndian32(value);
  u8 bytes[sizeof(raw)];
  std::memcpy(bytes, &raw, sizeof(raw));
  m_data.insert(m_data.end(), bytes, bytes + sizeof(raw));
}

void BinaryWriter::writeFourCC(const FourCC& tag) {
  for (char c : tag.chars()) {
    m_data.push_back(static_cast<u8>(c));
  }
}

void BinaryWriter::writeBytes(ByteSpan bytes) {
  m_data.insert(m_data.end(), bytes.begin(), bytes.end());
}

void BinaryWriter::writeString(const std::string& text) {
  m_data.insert(m_data.end(), text.begin(), text.end());
}

void BinaryWriter::writeFill(u8 value, usize count) {
  m_data.insert(m_data.end(), count, value);
}

} // namespace RetroPak::core
