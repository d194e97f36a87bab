#pragma once

/**
 * @file test_archives.hpp
 * @brief Hand-assembled PAK/STRG byte fixtures shared by the unit tests
 *
 * Fixtures are written field by field so the codec under test is never used
 * to produce its own expected output.
 */

#include "RetroPak/assets/resource.hpp"
#include "RetroPak/core/alignment.hpp"
#include "RetroPak/core/types.hpp"
#include "RetroPak/pak/pak.hpp"

#include <string>

namespace RetroPak::test {

inline void putU16(ByteBuffer& out, u16 value) {
  out.push_back(static_cast<u8>(value >> 8));
  out.push_back(static_cast<u8>(value & 0xFF));
}

inline void putU32(ByteBuffer& out, u32 value) {
  out.push_back(static_cast<u8>(value >> 24));
  out.push_back(static_cast<u8>((value >> 16) & 0xFF));
  out.push_back(static_cast<u8>((value >> 8) & 0xFF));
  out.push_back(static_cast<u8>(value & 0xFF));
}

inline void putTag(ByteBuffer& out, const char* tag) {
  out.insert(out.end(), tag, tag + 4);
}

inline void putAscii(ByteBuffer& out, const std::string& text, bool terminate) {
  out.insert(out.end(), text.begin(), text.end());
  if (terminate) {
    out.push_back(0);
  }
}

// UTF-16BE plus the two-byte terminator
inline void putUtf16(ByteBuffer& out, const std::u16string& text) {
  for (char16_t unit : text) {
    putU16(out, static_cast<u16>(unit));
  }
  putU16(out, 0);
}

inline void padTo32(ByteBuffer& out, u8 fill = 0xFF) {
  out.insert(out.end(), core::paddingFor(out.size()), fill);
}

/**
 * @brief STRG with ENGL "Hello", FREN "Salut" and the name "title" -> 0
 *
 * 16 header + 24 languages + 22 name table + 2 x 16 string tables = 94 bytes,
 * padded to 96.
 */
inline ByteBuffer minimalStrgBytes() {
  ByteBuffer out;
  putU32(out, 0x87654321); // magic
  putU32(out, 1);          // version
  putU32(out, 2);          // language count
  putU32(out, 1);          // string count

  putTag(out, "ENGL");
  putU32(out, 0);  // strings offset
  putU32(out, 16); // strings size
  putTag(out, "FREN");
  putU32(out, 16);
  putU32(out, 16);

  putU32(out, 1);  // name count
  putU32(out, 14); // name table size: 8 entry bytes + "title\0"
  putU32(out, 8);  // name offset
  putU32(out, 0);  // string index
  putAscii(out, "title", true);

  putU32(out, 4);
  putUtf16(out, u"Hello");
  putU32(out, 4);
  putUtf16(out, u"Salut");

  padTo32(out);
  return out;
}

/**
 * @brief PAK 2.0 holding minimalStrgBytes() as asset 0x1, named "test"
 *
 * Directory is 52 bytes, padded to 64; the STRG payload is 96 bytes.
 */
inline ByteBuffer minimalPakBytes() {
  const ByteBuffer strg = minimalStrgBytes();

  ByteBuffer out;
  putU16(out, 2); // major
  putU16(out, 0); // minor
  putU32(out, 0); // unused
  putU32(out, 1); // named count
  putTag(out, "STRG");
  putU32(out, 0x1);
  putU32(out, 4);
  putAscii(out, "test", false);

  putU32(out, 1); // resource count
  putU32(out, 0); // compressed
  putTag(out, "STRG");
  putU32(out, 0x1);
  putU32(out, static_cast<u32>(strg.size()));
  putU32(out, 64);

  padTo32(out);
  out.insert(out.end(), strg.begin(), strg.end());
  return out;
}

/**
 * @brief Deterministic payload bytes of the given size
 */
inline ByteBuffer blob(usize size, u8 seed) {
  ByteBuffer out(size);
  for (usize i = 0; i < size; ++i) {
    out[i] = static_cast<u8>(seed + i * 7);
  }
  return out;
}

inline assets::ResourcePtr opaque(const char (&tag)[5], usize size, u8 seed) {
  return assets::OpaqueResource::create(core::FourCC(tag), blob(size, seed));
}

/**
 * @brief True when every offset sits at the padded directory size plus the
 *        padded sizes of all earlier payloads, and every size matches its payload
 */
inline bool offsetsAreLaidOut(const pak::Pak& archive) {
  usize expected = core::alignedSize(archive.headerSize());
  for (usize i = 0; i < archive.resourceCount(); ++i) {
    const auto& entry = archive.entries()[i];
    const usize size = archive.resources()[i]->encodedSize();
    if (entry.offset != expected || entry.size != size) {
      return false;
    }
    expected += core::alignedSize(size);
  }
  return true;
}

} // namespace RetroPak::test
