#pragma once

/**
 * @file strg_records.hpp
 * @brief Records nested inside a STRG payload
 *
 * Layout of the pieces (all big-endian):
 * - LanguageEntry: language[4], strings_offset u32, strings_size u32
 * - NameTable:     count u32, size u32, count x NameEntry, count names
 * - NameEntry:     name_offset u32, string_index u32
 * - StringTable:   count x offset u32, count UTF-16BE strings
 *
 * Name offsets are relative to the byte after the NameTable's size field;
 * string offsets are relative to the start of their StringTable.
 */

#include "RetroPak/core/binary_stream.hpp"
#include "RetroPak/core/codec_config.hpp"
#include "RetroPak/core/fourcc.hpp"
#include "RetroPak/core/result.hpp"
#include <string>
#include <utility>
#include <vector>

namespace RetroPak::strg {

struct LanguageEntry {
  static constexpr usize PACKED_SIZE = 12;

  core::FourCC languageId;
  u32 stringsOffset = 0; // Relative to the first byte after the NameTable
  u32 stringsSize = 0;

  [[nodiscard]] static Result<core::Decoded<LanguageEntry>> decode(ByteSpan bytes);

  void encode(core::BinaryWriter& writer) const;
  [[nodiscard]] ByteBuffer encode() const;
  [[nodiscard]] usize encodedSize() const { return PACKED_SIZE; }

  bool operator==(const LanguageEntry& other) const = default;
};

struct NameEntry {
  static constexpr usize PACKED_SIZE = 8;

  u32 offset = 0;
  u32 stringIndex = 0;

  [[nodiscard]] static Result<core::Decoded<NameEntry>> decode(ByteSpan bytes);

  void encode(core::BinaryWriter& writer) const;
  [[nodiscard]] ByteBuffer encode() const;
  [[nodiscard]] usize encodedSize() const { return PACKED_SIZE; }

  bool operator==(const NameEntry& other) const = default;
};

/**
 * @brief Maps human-readable names to string indices
 */
class NameTable {
public:
  static constexpr usize HEADER_SIZE = 8;

  NameTable() = default;

  /**
   * @brief Table whose entries and names are index-aligned
   *
   * Entry offsets are taken as given; use build() to lay names out from
   * scratch.
   * @return StringCountMismatch when the vectors differ in length,
   *         MalformedHeader when a name starts among the entries or overlaps
   *         another name
   */
  [[nodiscard]] static Result<NameTable> create(std::vector<NameEntry> entries,
                                                std::vector<std::string> names);

  /**
   * @brief Lay out (name, string index) pairs contiguously in the given order
   */
  [[nodiscard]] static NameTable build(const std::vector<std::pair<std::string, u32>>& names);

  [[nodiscard]] static Result<core::Decoded<NameTable>> decode(ByteSpan bytes,
                                                              const core::CodecConfig& config = {});

  void encode(core::BinaryWriter& writer) const;
  [[nodiscard]] ByteBuffer encode() const;
  [[nodiscard]] usize encodedSize() const { return HEADER_SIZE + bodySize(); }

  /**
   * @brief Value of the size field
   *
   * Entries plus names as laid out by their offsets, including any gaps and
   * the unused tail a decoded table declared.
   */
  [[nodiscard]] usize bodySize() const;

  [[nodiscard]] usize count() const { return m_entries.size(); }
  [[nodiscard]] const std::vector<NameEntry>& entries() const { return m_entries; }
  [[nodiscard]] const std::vector<std::string>& names() const { return m_names; }

  /**
   * @brief String index a name refers to; UnknownIdentifier when absent
   */
  [[nodiscard]] Result<u32> stringIndexFor(const std::string& name) const;

  bool operator==(const NameTable& other) const = default;

private:
  NameTable(std::vector<NameEntry> entries, std::vector<std::string> names, usize slack = 0);

  [[nodiscard]] std::vector<usize> nameSizes() const;

  std::vector<NameEntry> m_entries;
  std::vector<std::string> m_names;
  usize m_slack = 0; // Declared body bytes past the last name
};

/**
 * @brief One language's strings
 *
 * Strings are kept as UTF-16 code units. Offsets and strings are correlated
 * by index; on encode the strings are written in ascending offset order,
 * which is how the format lays them out. Gaps between strings are written as
 * zero bytes, and indices sharing an offset share one copy of the string.
 */
class StringTable {
public:
  StringTable() = default;

  /**
   * @brief Table from index-aligned offsets and strings
   * @return StringCountMismatch when the vectors differ in length,
   *         MalformedHeader when a string starts inside the offset array,
   *         overlaps another string, or shares an offset with a different one
   */
  [[nodiscard]] static Result<StringTable> create(std::vector<u32> offsets,
                                                  std::vector<std::u16string> strings);

  /**
   * @brief Lay strings out contiguously in index order
   */
  [[nodiscard]] static StringTable build(const std::vector<std::u16string>& strings);

  [[nodiscard]] static Result<StringTable> decode(ByteSpan bytes, u32 stringCount);

  void encode(core::BinaryWriter& writer) const;
  [[nodiscard]] ByteBuffer encode() const;
  [[nodiscard]] usize encodedSize() const;

  [[nodiscard]] usize count() const { return m_offsets.size(); }
  [[nodiscard]] const std::vector<u32>& offsets() const { return m_offsets; }
  [[nodiscard]] const std::vector<std::u16string>& strings() const { return m_strings; }

  [[nodiscard]] Result<std::u16string> stringAt(usize index) const;

  /**
   * @brief Copy with one string replaced
   *
   * Every string laid out after the replaced one moves by the difference in
   * encoded size. When offsets ascend with index (the usual layout) that is
   * exactly the strings after @p index. Indices sharing the replaced offset
   * take the new string too.
   */
  [[nodiscard]] Result<StringTable> withStringReplaced(usize index,
                                                      const std::u16string& newString) const;

  bool operator==(const StringTable& other) const = default;

private:
  StringTable(std::vector<u32> offsets, std::vector<std::u16string> strings);

  [[nodiscard]] std::vector<usize> stringSizes() const;

  std::vector<u32> m_offsets;
  std::vector<std::u16string> m_strings;
};

/**
 * @brief Encoded size of a string including its two-byte terminator
 */
[[nodiscard]] inline usize encodedStringSize(const std::u16string& text) {
  return (text.size() + 1) * sizeof(char16_t);
}

} // namespace RetroPak::strg
