#pragma once

/**
 * @file strg.hpp
 * @brief STRG - localized string table container
 *
 * Layout (big-endian):
 * @code
 *   u32 magic, u32 version, u32 language_count, u32 string_count
 *   language_count x LanguageEntry
 *   NameTable
 *   language_count x StringTable    (at each language's strings_offset)
 *   0xFF padding to a 32-byte boundary
 * @endcode
 *
 * Every language holds the same number of strings. Tables are written in
 * ascending strings_offset order; gaps and the unused tail of a language's
 * strings_size are zero-filled. A Strg is immutable: edits return a new
 * instance with language offsets and sizes updated.
 */

#include "RetroPak/assets/asset_codec.hpp"
#include "RetroPak/strg/strg_records.hpp"
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace RetroPak::strg {

constexpr u32 STRG_MAGIC = 0x87654321;
constexpr usize STRG_HEADER_SIZE = 16;

class Strg final : public assets::Resource {
public:
  static constexpr core::FourCC ASSET_TYPE{"STRG"};

  /**
   * @brief Validate the parts and build the language index
   * @return StringCountMismatch when a table's count differs from @p stringCount,
   *         IndexOutOfRange when languages and tables are not index-aligned,
   *         MalformedHeader when a table outgrows its strings_size or two
   *         language regions overlap
   */
  [[nodiscard]] static Result<Strg> create(u32 magic, u32 version, u32 stringCount,
                                           std::vector<LanguageEntry> languages,
                                           NameTable nameTable,
                                           std::vector<StringTable> stringTables,
                                           u8 fillByte = core::DEFAULT_FILL_BYTE);

  /**
   * @brief Lay out a fresh STRG from per-language tables
   *
   * Language offsets and sizes are computed from the tables in the given order.
   */
  [[nodiscard]] static Result<Strg>
  build(u32 version, NameTable nameTable,
        const std::vector<std::pair<core::FourCC, StringTable>>& languages);

  [[nodiscard]] static Result<Strg> decode(ByteSpan bytes, const core::CodecConfig& config = {});

  // Resource
  [[nodiscard]] core::FourCC assetType() const override { return ASSET_TYPE; }
  [[nodiscard]] assets::CodecKind codecKind() const override {
    return assets::CodecKind::StringTable;
  }
  [[nodiscard]] ByteBuffer encode() const override;
  [[nodiscard]] usize encodedSize() const override;
  [[nodiscard]] bool equals(const Resource& other) const override;

  [[nodiscard]] usize contentSize() const;
  [[nodiscard]] usize paddingSize() const { return core::paddingFor(contentSize()); }

  [[nodiscard]] u32 magic() const { return m_magic; }
  [[nodiscard]] u32 version() const { return m_version; }
  [[nodiscard]] usize languageCount() const { return m_languages.size(); }
  [[nodiscard]] u32 stringCount() const { return m_stringCount; }
  [[nodiscard]] u8 fillByte() const { return m_fillByte; }

  [[nodiscard]] const std::vector<LanguageEntry>& languageEntries() const { return m_languages; }
  [[nodiscard]] const NameTable& nameTable() const { return m_nameTable; }
  [[nodiscard]] const std::vector<StringTable>& stringTables() const { return m_stringTables; }

  [[nodiscard]] bool hasLanguage(const core::FourCC& language) const;
  [[nodiscard]] std::vector<core::FourCC> languages() const;

  [[nodiscard]] Result<LanguageEntry> languageEntry(const core::FourCC& language) const;
  [[nodiscard]] Result<StringTable> stringTable(const core::FourCC& language) const;

  /**
   * @brief String index registered for @p name in the name table
   */
  [[nodiscard]] Result<u32> resolveStringIndex(const std::string& name) const;

  [[nodiscard]] Result<std::u16string> getString(const core::FourCC& language, usize index) const;
  [[nodiscard]] Result<std::u16string> getString(const core::FourCC& language,
                                                 const std::string& name) const;

  /**
   * @brief Copy with one language's table swapped out
   *
   * The language's strings_size becomes the new table's encoded size and
   * every language stored after it moves by the size difference. "After"
   * means a larger strings_offset, whatever the language order.
   * The name table and the other languages' strings are untouched.
   */
  [[nodiscard]] Result<Strg> withStringTableReplaced(const core::FourCC& language,
                                                     StringTable newTable) const;

  [[nodiscard]] Result<Strg> withStringReplaced(const core::FourCC& language, usize index,
                                                const std::u16string& newString) const;

  [[nodiscard]] std::string describe() const;

  bool operator==(const Strg& other) const;

private:
  Strg(u32 magic, u32 version, u32 stringCount, std::vector<LanguageEntry> languages,
       NameTable nameTable, std::vector<StringTable> stringTables, u8 fillByte);

  [[nodiscard]] Result<usize> indexOf(const core::FourCC& language) const;

  u32 m_magic;
  u32 m_version;
  u32 m_stringCount;
  std::vector<LanguageEntry> m_languages;
  NameTable m_nameTable;
  std::vector<StringTable> m_stringTables;
  u8 m_fillByte;

  std::unordered_map<core::FourCC, usize> m_languageIndex;
};

/**
 * @brief Registry codec producing structurally decoded Strg payloads
 */
class StrgCodec final : public assets::IAssetCodec {
public:
  [[nodiscard]] assets::CodecKind kind() const override { return assets::CodecKind::StringTable; }

  [[nodiscard]] Result<assets::ResourcePtr> decode(ByteSpan bytes, core::FourCC assetType,
                                                   const core::CodecConfig& config) const override;
};

/**
 * @brief Narrow UTF-16 text for log output; non-ASCII units become '?'
 */
[[nodiscard]] std::string toAsciiLossy(const std::u16string& text);

} // namespace RetroPak::strg
