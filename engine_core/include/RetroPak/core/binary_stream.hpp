#pragma once

/**
 * @file binary_stream.hpp
 * @brief Big-endian cursor reader and append-only writer over byte buffers
 *
 * The reader never reads past its span: callers check canRead() before a
 * fixed-size record and turn a short buffer into a Result error. A read that
 * overruns anyway yields zero and latches failed().
 */

#include "RetroPak/core/fourcc.hpp"
#include "RetroPak/core/types.hpp"
#include <string>

namespace RetroPak::core {

/**
 * @brief A decoded record and the number of bytes it occupied
 */
template <typename T> struct Decoded {
  T value;
  usize consumed = 0;
};

class BinaryReader {
public:
  explicit BinaryReader(ByteSpan data) : m_data(data) {}

  [[nodiscard]] bool canRead(usize count) const {
    return count <= m_data.size() && m_pos <= m_data.size() - count;
  }

  u8 readU8();
  u16 readU16();
  u32 readU32();
  FourCC readFourCC();

  /**
   * @brief Borrow the next @p count bytes and advance past them
   */
  ByteSpan readBytes(usize count);

  void skip(usize count);
  void seek(usize position);

  [[nodiscard]] usize position() const { return m_pos; }
  [[nodiscard]] usize remaining() const { return m_pos < m_data.size() ? m_data.size() - m_pos : 0; }
  [[nodiscard]] usize size() const { return m_data.size(); }
  [[nodiscard]] bool atEnd() const { return m_pos >= m_data.size(); }
  [[nodiscard]] bool failed() const { return m_failed; }

  [[nodiscard]] ByteSpan data() const { return m_data; }

private:
  ByteSpan m_data;
  usize m_pos = 0;
  bool m_failed = false;
};

class BinaryWriter {
public:
  BinaryWriter() = default;
  explicit BinaryWriter(usize reserve) { m_data.reserve(reserve); }

  void writeU8(u8 value);
  void writeU16(u16 value);
  void writeU32(u32 value);
  void writeFourCC(const FourCC& tag);
  void writeBytes(ByteSpan bytes);
  void writeString(const std::string& text);
  void writeFill(u8 value, usize count);

  [[nodiscard]] usize size() const { return m_data.size(); }
  [[nodiscard]] const ByteBuffer& data() const { return m_data; }
  ByteBuffer take() { return std::move(m_data); }

private:
  ByteBuffer m_data;
};

} // namespace RetroPak::core
