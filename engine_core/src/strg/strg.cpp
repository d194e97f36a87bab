/**
 * @file strg.cpp
 * @brief STRG container decode, encode and edits
 */

#include "RetroPak/strg/strg.hpp"
#include "RetroPak/core/logger.hpp"
#include "RetroPak/strg/layout.hpp"

#include <cstdio>
#include <sstream>

namespace RetroPak::strg {

namespace {

std::string hex32(u32 value) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "0x%08X", value);
  return buffer;
}

Result<Strg> fail(ErrorCode code, const std::string& message) {
  RETROPAK_LOG_WARN("STRG decode failed: " + message);
  return Result<Strg>::error(code, message);
}

std::vector<u32> regionOffsets(const std::vector<LanguageEntry>& languages) {
  std::vector<u32> offsets;
  offsets.reserve(languages.size());
  for (const auto& language : languages) {
    offsets.push_back(language.stringsOffset);
  }
  return offsets;
}

std::vector<usize> regionSizes(const std::vector<LanguageEntry>& languages) {
  std::vector<usize> sizes;
  sizes.reserve(languages.size());
  for (const auto& language : languages) {
    sizes.push_back(language.stringsSize);
  }
  return sizes;
}

} // namespace

std::string toAsciiLossy(const std::u16string& text) {
  std::string out;
  out.reserve(text.size());
  for (char16_t unit : text) {
    out.push_back(unit < 0x80 ? static_cast<char>(unit) : '?');
  }
  return out;
}

// ============================================================================
// Construction
// ============================================================================

Strg::Strg(u32 magic, u32 version, u32 stringCount, std::vector<LanguageEntry> languages,
           NameTable nameTable, std::vector<StringTable> stringTables, u8 fillByte)
    : m_magic(magic), m_version(version), m_stringCount(stringCount),
      m_languages(std::move(languages)), m_nameTable(std::move(nameTable)),
      m_stringTables(std::move(stringTables)), m_fillByte(fillByte) {
  m_languageIndex.reserve(m_languages.size());
  for (usize i = 0; i < m_languages.size(); ++i) {
    m_languageIndex.emplace(m_languages[i].languageId, i);
  }
}

Result<Strg> Strg::create(u32 magic, u32 version, u32 stringCount,
                          std::vector<LanguageEntry> languages, NameTable nameTable,
                          std::vector<StringTable> stringTables, u8 fillByte) {
  if (languages.size() != stringTables.size()) {
    return Result<Strg>::error(ErrorCode::IndexOutOfRange,
                               std::to_string(languages.size()) + " languages but " +
                                   std::to_string(stringTables.size()) + " string tables");
  }

  for (usize i = 0; i < stringTables.size(); ++i) {
    if (stringTables[i].count() != stringCount) {
      return Result<Strg>::error(ErrorCode::StringCountMismatch,
                                 "Language " + languages[i].languageId.toString() + " has " +
                                     std::to_string(stringTables[i].count()) +
                                     " strings, expected " + std::to_string(stringCount));
    }
    if (stringTables[i].encodedSize() > languages[i].stringsSize) {
      return Result<Strg>::error(ErrorCode::MalformedHeader,
                                 "String table for " + languages[i].languageId.toString() +
                                     " needs " + std::to_string(stringTables[i].encodedSize()) +
                                     " bytes, strings_size is " +
                                     std::to_string(languages[i].stringsSize));
    }
  }

  auto layout = checkLayout(regionOffsets(languages), regionSizes(languages), 0, false,
                            "String table");
  if (layout.isError()) {
    return Result<Strg>::error(layout.errorInfo());
  }

  return Result<Strg>::ok(Strg(magic, version, stringCount, std::move(languages),
                               std::move(nameTable), std::move(stringTables), fillByte));
}

Result<Strg> Strg::build(u32 version, NameTable nameTable,
                         const std::vector<std::pair<core::FourCC, StringTable>>& languages) {
  const u32 stringCount = languages.empty() ? 0 : static_cast<u32>(languages.front().second.count());

  std::vector<LanguageEntry> entries;
  std::vector<StringTable> tables;
  entries.reserve(languages.size());
  tables.reserve(languages.size());

  u32 offset = 0;
  for (const auto& [language, table] : languages) {
    const u32 size = static_cast<u32>(table.encodedSize());
    entries.push_back(LanguageEntry{language, offset, size});
    tables.push_back(table);
    offset += size;
  }

  return create(STRG_MAGIC, version, stringCount, std::move(entries), std::move(nameTable),
                std::move(tables));
}

// ============================================================================
// Decode / Encode
// ============================================================================

Result<Strg> Strg::decode(ByteSpan bytes, const core::CodecConfig& config) {
  core::BinaryReader reader(bytes);
  if (!reader.canRead(STRG_HEADER_SIZE)) {
    return fail(ErrorCode::MalformedHeader, "Header needs " + std::to_string(STRG_HEADER_SIZE) +
                                                " bytes, " + std::to_string(bytes.size()) +
                                                " available");
  }

  const u32 magic = reader.readU32();
  const u32 version = reader.readU32();
  const u32 languageCount = reader.readU32();
  const u32 stringCount = reader.readU32();

  if (magic != STRG_MAGIC) {
    RETROPAK_LOG_WARN("STRG magic is " + hex32(magic) + ", expected " + hex32(STRG_MAGIC));
  }
  if (languageCount > config.maxLanguageCount) {
    return fail(ErrorCode::MalformedHeader, "Language count " + std::to_string(languageCount) +
                                                " exceeds limit " +
                                                std::to_string(config.maxLanguageCount));
  }
  if (stringCount > config.maxStringCount) {
    return fail(ErrorCode::MalformedHeader, "String count " + std::to_string(stringCount) +
                                                " exceeds limit " +
                                                std::to_string(config.maxStringCount));
  }

  std::vector<LanguageEntry> languages;
  languages.reserve(languageCount);
  for (u32 i = 0; i < languageCount; ++i) {
    auto entry = LanguageEntry::decode(bytes.subspan(reader.position()));
    if (entry.isError()) {
      return fail(entry.errorCode(), entry.error());
    }
    languages.push_back(entry.value().value);
    reader.skip(entry.value().consumed);
  }

  auto nameTable = NameTable::decode(bytes.subspan(reader.position()), config);
  if (nameTable.isError()) {
    return fail(nameTable.errorCode(), nameTable.error());
  }
  reader.skip(nameTable.value().consumed);

  const usize stringTablesStart = reader.position();

  std::vector<StringTable> tables;
  tables.reserve(languageCount);
  for (const auto& language : languages) {
    const u64 begin = static_cast<u64>(stringTablesStart) + language.stringsOffset;
    const u64 end = begin + language.stringsSize;
    if (end > bytes.size()) {
      return fail(ErrorCode::TruncatedPayload,
                  "String table for " + language.languageId.toString() + " spans [" +
                      std::to_string(begin) + ", " + std::to_string(end) + ") of a " +
                      std::to_string(bytes.size()) + "-byte payload");
    }

    auto table = StringTable::decode(
        bytes.subspan(static_cast<usize>(begin), language.stringsSize), stringCount);
    if (table.isError()) {
      return fail(table.errorCode(), language.languageId.toString() + ": " + table.error());
    }
    tables.push_back(std::move(table).value());
  }

  RETROPAK_LOG_DEBUG("Decoded STRG: " + std::to_string(languageCount) + " languages, " +
                     std::to_string(stringCount) + " strings, " +
                     std::to_string(nameTable.value().value.count()) + " names");

  return create(magic, version, stringCount, std::move(languages),
                std::move(nameTable).value().value, std::move(tables), config.strgFillByte);
}

usize Strg::contentSize() const {
  usize tablesEnd = 0;
  (void)placeByOffset(regionOffsets(m_languages), regionSizes(m_languages), 0, tablesEnd);
  return STRG_HEADER_SIZE + m_languages.size() * LanguageEntry::PACKED_SIZE +
         m_nameTable.encodedSize() + tablesEnd;
}

usize Strg::encodedSize() const {
  return core::alignedSize(contentSize());
}

ByteBuffer Strg::encode() const {
  core::BinaryWriter writer(encodedSize());
  writer.writeU32(m_magic);
  writer.writeU32(m_version);
  writer.writeU32(static_cast<u32>(m_languages.size()));
  writer.writeU32(m_stringCount);

  for (const auto& language : m_languages) {
    language.encode(writer);
  }
  m_nameTable.encode(writer);

  // Tables land where their language entries point, not in language order
  usize tablesEnd = 0;
  for (const auto& placement :
       placeByOffset(regionOffsets(m_languages), regionSizes(m_languages), 0, tablesEnd)) {
    const StringTable& table = m_stringTables[placement.index];
    writer.writeFill(0, placement.gap);
    table.encode(writer);
    writer.writeFill(0, m_languages[placement.index].stringsSize - table.encodedSize());
  }

  ByteBuffer bytes = writer.take();
  core::appendPadding(bytes, m_fillByte);
  return bytes;
}

// ============================================================================
// Lookup
// ============================================================================

Result<usize> Strg::indexOf(const core::FourCC& language) const {
  auto it = m_languageIndex.find(language);
  if (it == m_languageIndex.end()) {
    return Result<usize>::error(ErrorCode::UnknownIdentifier,
                                "No language " + language.toString() + " in STRG");
  }
  return Result<usize>::ok(it->second);
}

bool Strg::hasLanguage(const core::FourCC& language) const {
  return m_languageIndex.find(language) != m_languageIndex.end();
}

std::vector<core::FourCC> Strg::languages() const {
  std::vector<core::FourCC> result;
  result.reserve(m_languages.size());
  for (const auto& language : m_languages) {
    result.push_back(language.languageId);
  }
  return result;
}

Result<LanguageEntry> Strg::languageEntry(const core::FourCC& language) const {
  auto index = indexOf(language);
  if (index.isError()) {
    return Result<LanguageEntry>::error(index.errorInfo());
  }
  return Result<LanguageEntry>::ok(m_languages[index.value()]);
}

Result<StringTable> Strg::stringTable(const core::FourCC& language) const {
  auto index = indexOf(language);
  if (index.isError()) {
    return Result<StringTable>::error(index.errorInfo());
  }
  return Result<StringTable>::ok(m_stringTables[index.value()]);
}

Result<u32> Strg::resolveStringIndex(const std::string& name) const {
  return m_nameTable.stringIndexFor(name);
}

Result<std::u16string> Strg::getString(const core::FourCC& language, usize index) const {
  auto tableIndex = indexOf(language);
  if (tableIndex.isError()) {
    return Result<std::u16string>::error(tableIndex.errorInfo());
  }
  return m_stringTables[tableIndex.value()].stringAt(index);
}

Result<std::u16string> Strg::getString(const core::FourCC& language,
                                       const std::string& name) const {
  auto stringIndex = resolveStringIndex(name);
  if (stringIndex.isError()) {
    return Result<std::u16string>::error(stringIndex.errorInfo());
  }
  return getString(language, stringIndex.value());
}

// ============================================================================
// Edits
// ============================================================================

Result<Strg> Strg::withStringTableReplaced(const core::FourCC& language,
                                           StringTable newTable) const {
  auto index = indexOf(language);
  if (index.isError()) {
    return Result<Strg>::error(index.errorInfo());
  }
  if (newTable.count() != m_stringCount) {
    return Result<Strg>::error(ErrorCode::StringCountMismatch,
                               "Replacement table for " + language.toString() + " has " +
                                   std::to_string(newTable.count()) + " strings, STRG holds " +
                                   std::to_string(m_stringCount));
  }

  const usize tableIndex = index.value();
  const LanguageEntry& old = m_languages[tableIndex];
  const u32 newSize = static_cast<u32>(newTable.encodedSize());
  const i64 delta = static_cast<i64>(newSize) - static_cast<i64>(old.stringsSize);

  const u64 oldEnd = static_cast<u64>(old.stringsOffset) + old.stringsSize;

  std::vector<LanguageEntry> languages;
  languages.reserve(m_languages.size());
  for (usize i = 0; i < m_languages.size(); ++i) {
    LanguageEntry entry = m_languages[i];
    if (i == tableIndex) {
      entry.stringsSize = newSize;
    } else if (entry.stringsOffset >= oldEnd && entry.stringsOffset > old.stringsOffset) {
      entry.stringsOffset = static_cast<u32>(entry.stringsOffset + delta);
    }
    languages.push_back(entry);
  }

  std::vector<StringTable> tables = m_stringTables;
  tables[tableIndex] = std::move(newTable);

  return create(m_magic, m_version, m_stringCount, std::move(languages), m_nameTable,
                std::move(tables), m_fillByte);
}

Result<Strg> Strg::withStringReplaced(const core::FourCC& language, usize index,
                                      const std::u16string& newString) const {
  auto table = stringTable(language);
  if (table.isError()) {
    return Result<Strg>::error(table.errorInfo());
  }

  auto replaced = table.value().withStringReplaced(index, newString);
  if (replaced.isError()) {
    return Result<Strg>::error(replaced.errorInfo());
  }
  return withStringTableReplaced(language, std::move(replaced).value());
}

// ============================================================================
// Misc
// ============================================================================

bool Strg::equals(const Resource& other) const {
  const auto* strg = dynamic_cast<const Strg*>(&other);
  return strg != nullptr && *this == *strg;
}

bool Strg::operator==(const Strg& other) const {
  return m_magic == other.m_magic && m_version == other.m_version &&
         m_stringCount == other.m_stringCount && m_languages == other.m_languages &&
         m_nameTable == other.m_nameTable && m_stringTables == other.m_stringTables;
}

std::string Strg::describe() const {
  std::ostringstream out;
  out << "STRG magic=" << hex32(m_magic) << " version=" << m_version
      << " languages=" << m_languages.size() << " strings=" << m_stringCount
      << " names=" << m_nameTable.count() << " size=" << encodedSize() << '\n';
  for (const auto& language : m_languages) {
    out << "  " << language.languageId.toString() << " offset=" << language.stringsOffset
        << " size=" << language.stringsSize << '\n';
  }
  return out.str();
}

Result<assets::ResourcePtr> StrgCodec::decode(ByteSpan bytes, core::FourCC /*assetType*/,
                                              const core::CodecConfig& config) const {
  auto strg = Strg::decode(bytes, config);
  if (strg.isError()) {
    return Result<assets::ResourcePtr>::error(strg.errorInfo());
  }
  return Result<assets::ResourcePtr>::ok(std::make_shared<Strg>(std::move(strg).value()));
}

} // namespace RetroPak::strg
