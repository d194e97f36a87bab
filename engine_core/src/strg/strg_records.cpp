/**
 * @file strg_records.cpp
 * @brief STRG language entries, name table and string tables
 */

#include "RetroPak/strg/strg_records.hpp"
#include "RetroPak/core/logger.hpp"
#include "RetroPak/strg/layout.hpp"

#include <algorithm>

namespace RetroPak::strg {

namespace {

std::vector<u32> nameOffsets(const std::vector<NameEntry>& entries) {
  std::vector<u32> offsets;
  offsets.reserve(entries.size());
  for (const auto& entry : entries) {
    offsets.push_back(entry.offset);
  }
  return offsets;
}

Result<void> checkNames(const std::vector<NameEntry>& entries,
                        const std::vector<std::string>& names) {
  if (entries.size() != names.size()) {
    return Result<void>::error(ErrorCode::StringCountMismatch,
                               std::to_string(entries.size()) + " name entries but " +
                                   std::to_string(names.size()) + " names");
  }

  std::vector<usize> sizes;
  sizes.reserve(names.size());
  for (const auto& name : names) {
    sizes.push_back(name.size() + 1);
  }

  const std::vector<u32> offsets = nameOffsets(entries);
  auto layout = checkLayout(offsets, sizes, entries.size() * NameEntry::PACKED_SIZE, true, "Name");
  if (layout.isError()) {
    return layout;
  }

  for (usize i = 0; i < names.size(); ++i) {
    for (usize j = i + 1; j < names.size(); ++j) {
      if (offsets[i] == offsets[j] && names[i] != names[j]) {
        return Result<void>::error(ErrorCode::MalformedHeader,
                                   "Names " + std::to_string(i) + " and " + std::to_string(j) +
                                       " share offset " + std::to_string(offsets[i]) +
                                       " but differ");
      }
    }
  }
  return Result<void>::ok();
}

} // namespace

// ============================================================================
// LanguageEntry
// ============================================================================

Result<core::Decoded<LanguageEntry>> LanguageEntry::decode(ByteSpan bytes) {
  using Decoded = core::Decoded<LanguageEntry>;

  core::BinaryReader reader(bytes);
  if (!reader.canRead(PACKED_SIZE)) {
    return Result<Decoded>::error(ErrorCode::MalformedHeader,
                                  "Language entry needs " + std::to_string(PACKED_SIZE) +
                                      " bytes, " + std::to_string(bytes.size()) + " available");
  }

  LanguageEntry entry;
  entry.languageId = reader.readFourCC();
  entry.stringsOffset = reader.readU32();
  entry.stringsSize = reader.readU32();
  return Result<Decoded>::ok(Decoded{entry, PACKED_SIZE});
}

void LanguageEntry::encode(core::BinaryWriter& writer) const {
  writer.writeFourCC(languageId);
  writer.writeU32(stringsOffset);
  writer.writeU32(stringsSize);
}

ByteBuffer LanguageEntry::encode() const {
  core::BinaryWriter writer(PACKED_SIZE);
  encode(writer);
  return writer.take();
}

// ============================================================================
// NameEntry
// ============================================================================

Result<core::Decoded<NameEntry>> NameEntry::decode(ByteSpan bytes) {
  using Decoded = core::Decoded<NameEntry>;

  core::BinaryReader reader(bytes);
  if (!reader.canRead(PACKED_SIZE)) {
    return Result<Decoded>::error(ErrorCode::MalformedHeader,
                                  "Name entry needs " + std::to_string(PACKED_SIZE) + " bytes, " +
                                      std::to_string(bytes.size()) + " available");
  }

  NameEntry entry;
  entry.offset = reader.readU32();
  entry.stringIndex = reader.readU32();
  return Result<Decoded>::ok(Decoded{entry, PACKED_SIZE});
}

void NameEntry::encode(core::BinaryWriter& writer) const {
  writer.writeU32(offset);
  writer.writeU32(stringIndex);
}

ByteBuffer NameEntry::encode() const {
  core::BinaryWriter writer(PACKED_SIZE);
  encode(writer);
  return writer.take();
}

// ============================================================================
// NameTable
// ============================================================================

NameTable::NameTable(std::vector<NameEntry> entries, std::vector<std::string> names, usize slack)
    : m_entries(std::move(entries)), m_names(std::move(names)), m_slack(slack) {}

Result<NameTable> NameTable::create(std::vector<NameEntry> entries,
                                    std::vector<std::string> names) {
  auto valid = checkNames(entries, names);
  if (valid.isError()) {
    return Result<NameTable>::error(valid.errorInfo());
  }
  return Result<NameTable>::ok(NameTable(std::move(entries), std::move(names)));
}

NameTable NameTable::build(const std::vector<std::pair<std::string, u32>>& names) {
  std::vector<NameEntry> entries;
  std::vector<std::string> nameStrings;
  entries.reserve(names.size());
  nameStrings.reserve(names.size());

  u32 offset = static_cast<u32>(names.size() * NameEntry::PACKED_SIZE);
  for (const auto& [name, stringIndex] : names) {
    entries.push_back(NameEntry{offset, stringIndex});
    nameStrings.push_back(name);
    offset += static_cast<u32>(name.size() + 1);
  }
  return NameTable(std::move(entries), std::move(nameStrings));
}

Result<core::Decoded<NameTable>> NameTable::decode(ByteSpan bytes,
                                                   const core::CodecConfig& config) {
  using Decoded = core::Decoded<NameTable>;

  core::BinaryReader reader(bytes);
  if (!reader.canRead(HEADER_SIZE)) {
    return Result<Decoded>::error(ErrorCode::MalformedHeader,
                                  "Name table header needs 8 bytes, " +
                                      std::to_string(bytes.size()) + " available");
  }

  const u32 count = reader.readU32();
  const u32 size = reader.readU32();

  if (count > config.maxNameCount) {
    return Result<Decoded>::error(ErrorCode::MalformedHeader,
                                  "Name count " + std::to_string(count) + " exceeds limit " +
                                      std::to_string(config.maxNameCount));
  }
  if (!reader.canRead(size)) {
    return Result<Decoded>::error(ErrorCode::TruncatedPayload,
                                  "Name table declares " + std::to_string(size) + " bytes, " +
                                      std::to_string(reader.remaining()) + " available");
  }

  const ByteSpan body = reader.readBytes(size);
  if (static_cast<u64>(count) * NameEntry::PACKED_SIZE > body.size()) {
    return Result<Decoded>::error(ErrorCode::MalformedHeader,
                                  std::to_string(count) + " name entries do not fit in " +
                                      std::to_string(size) + " bytes");
  }

  std::vector<NameEntry> entries;
  entries.reserve(count);
  for (u32 i = 0; i < count; ++i) {
    auto entry = NameEntry::decode(body.subspan(i * NameEntry::PACKED_SIZE));
    if (entry.isError()) {
      return Result<Decoded>::error(entry.errorInfo());
    }
    entries.push_back(entry.value().value);
  }

  std::vector<std::string> names;
  names.reserve(count);
  for (const auto& entry : entries) {
    if (entry.offset >= body.size()) {
      return Result<Decoded>::error(ErrorCode::TruncatedPayload,
                                    "Name offset " + std::to_string(entry.offset) +
                                        " lies outside the name table");
    }

    const auto begin = body.begin() + entry.offset;
    const auto terminator = std::find(begin, body.end(), u8{0});
    if (terminator == body.end()) {
      return Result<Decoded>::error(ErrorCode::MissingTerminator,
                                    "Name at offset " + std::to_string(entry.offset) +
                                        " is not null-terminated");
    }
    names.emplace_back(begin, terminator);
  }

  auto valid = checkNames(entries, names);
  if (valid.isError()) {
    return Result<Decoded>::error(valid.errorInfo());
  }

  NameTable table(std::move(entries), std::move(names));
  const usize used = table.bodySize();
  table.m_slack = size > used ? size - used : 0;
  return Result<Decoded>::ok(Decoded{std::move(table), HEADER_SIZE + size});
}

std::vector<usize> NameTable::nameSizes() const {
  std::vector<usize> sizes;
  sizes.reserve(m_names.size());
  for (const auto& name : m_names) {
    sizes.push_back(name.size() + 1);
  }
  return sizes;
}

usize NameTable::bodySize() const {
  if (m_entries.empty()) {
    return m_slack;
  }
  usize end = 0;
  (void)placeByOffset(nameOffsets(m_entries), nameSizes(),
                      m_entries.size() * NameEntry::PACKED_SIZE, end);
  return end + m_slack;
}

void NameTable::encode(core::BinaryWriter& writer) const {
  writer.writeU32(static_cast<u32>(m_entries.size()));
  writer.writeU32(static_cast<u32>(bodySize()));
  for (const auto& entry : m_entries) {
    entry.encode(writer);
  }

  // Names follow offset order, like strings in a StringTable
  usize end = 0;
  for (const auto& placement : placeByOffset(nameOffsets(m_entries), nameSizes(),
                                             m_entries.size() * NameEntry::PACKED_SIZE, end)) {
    writer.writeFill(0, placement.gap);
    writer.writeString(m_names[placement.index]);
    writer.writeU8(0);
  }
  writer.writeFill(0, m_slack);
}

ByteBuffer NameTable::encode() const {
  core::BinaryWriter writer(encodedSize());
  encode(writer);
  return writer.take();
}

Result<u32> NameTable::stringIndexFor(const std::string& name) const {
  auto it = std::find(m_names.begin(), m_names.end(), name);
  if (it == m_names.end()) {
    return Result<u32>::error(ErrorCode::UnknownIdentifier, "No string named '" + name + "'");
  }
  return Result<u32>::ok(m_entries[static_cast<usize>(it - m_names.begin())].stringIndex);
}

// ============================================================================
// StringTable
// ============================================================================

StringTable::StringTable(std::vector<u32> offsets, std::vector<std::u16string> strings)
    : m_offsets(std::move(offsets)), m_strings(std::move(strings)) {}

Result<StringTable> StringTable::create(std::vector<u32> offsets,
                                        std::vector<std::u16string> strings) {
  if (offsets.size() != strings.size()) {
    return Result<StringTable>::error(ErrorCode::StringCountMismatch,
                                      std::to_string(offsets.size()) + " string offsets but " +
                                          std::to_string(strings.size()) + " strings");
  }

  StringTable table(std::move(offsets), std::move(strings));
  auto layout = checkLayout(table.m_offsets, table.stringSizes(),
                            table.m_offsets.size() * sizeof(u32), true, "String");
  if (layout.isError()) {
    return Result<StringTable>::error(layout.errorInfo());
  }

  for (usize i = 0; i < table.m_strings.size(); ++i) {
    for (usize j = i + 1; j < table.m_strings.size(); ++j) {
      if (table.m_offsets[i] == table.m_offsets[j] && table.m_strings[i] != table.m_strings[j]) {
        return Result<StringTable>::error(ErrorCode::MalformedHeader,
                                          "Strings " + std::to_string(i) + " and " +
                                              std::to_string(j) + " share offset " +
                                              std::to_string(table.m_offsets[i]) + " but differ");
      }
    }
  }
  return Result<StringTable>::ok(std::move(table));
}

StringTable StringTable::build(const std::vector<std::u16string>& strings) {
  std::vector<u32> offsets;
  offsets.reserve(strings.size());

  u32 offset = static_cast<u32>(strings.size() * sizeof(u32));
  for (const auto& text : strings) {
    offsets.push_back(offset);
    offset += static_cast<u32>(encodedStringSize(text));
  }
  return StringTable(std::move(offsets), strings);
}

Result<StringTable> StringTable::decode(ByteSpan bytes, u32 stringCount) {
  core::BinaryReader reader(bytes);
  if (static_cast<u64>(stringCount) * sizeof(u32) > bytes.size()) {
    return Result<StringTable>::error(ErrorCode::TruncatedPayload,
                                      std::to_string(stringCount) +
                                          " string offsets do not fit in " +
                                          std::to_string(bytes.size()) + " bytes");
  }

  std::vector<u32> offsets;
  offsets.reserve(stringCount);
  for (u32 i = 0; i < stringCount; ++i) {
    offsets.push_back(reader.readU32());
  }

  std::vector<std::u16string> strings;
  strings.reserve(stringCount);
  for (u32 offset : offsets) {
    if (offset >= bytes.size()) {
      return Result<StringTable>::error(ErrorCode::TruncatedPayload,
                                        "String offset " + std::to_string(offset) +
                                            " lies outside a " + std::to_string(bytes.size()) +
                                            "-byte string table");
    }

    // Scan whole code units for the 0x0000 sentinel
    std::u16string text;
    bool terminated = false;
    for (usize pos = offset; pos + 1 < bytes.size(); pos += 2) {
      const char16_t unit = static_cast<char16_t>((bytes[pos] << 8) | bytes[pos + 1]);
      if (unit == 0) {
        terminated = true;
        break;
      }
      text.push_back(unit);
    }

    if (!terminated) {
      return Result<StringTable>::error(ErrorCode::MissingTerminator,
                                        "String at offset " + std::to_string(offset) +
                                            " has no double-null terminator");
    }
    strings.push_back(std::move(text));
  }

  return create(std::move(offsets), std::move(strings));
}

std::vector<usize> StringTable::stringSizes() const {
  std::vector<usize> sizes;
  sizes.reserve(m_strings.size());
  for (const auto& text : m_strings) {
    sizes.push_back(encodedStringSize(text));
  }
  return sizes;
}

void StringTable::encode(core::BinaryWriter& writer) const {
  for (u32 offset : m_offsets) {
    writer.writeU32(offset);
  }

  usize end = 0;
  for (const auto& placement :
       placeByOffset(m_offsets, stringSizes(), m_offsets.size() * sizeof(u32), end)) {
    writer.writeFill(0, placement.gap);
    for (char16_t unit : m_strings[placement.index]) {
      writer.writeU16(static_cast<u16>(unit));
    }
    writer.writeU16(0);
  }
}

ByteBuffer StringTable::encode() const {
  core::BinaryWriter writer(encodedSize());
  encode(writer);
  return writer.take();
}

usize StringTable::encodedSize() const {
  usize end = 0;
  (void)placeByOffset(m_offsets, stringSizes(), m_offsets.size() * sizeof(u32), end);
  return end;
}

Result<std::u16string> StringTable::stringAt(usize index) const {
  if (index >= m_strings.size()) {
    return Result<std::u16string>::error(ErrorCode::IndexOutOfRange,
                                         "String index " + std::to_string(index) +
                                             " out of range (" +
                                             std::to_string(m_strings.size()) + " strings)");
  }
  return Result<std::u16string>::ok(m_strings[index]);
}

Result<StringTable> StringTable::withStringReplaced(usize index,
                                                    const std::u16string& newString) const {
  if (index >= m_strings.size()) {
    return Result<StringTable>::error(ErrorCode::IndexOutOfRange,
                                      "String index " + std::to_string(index) +
                                          " out of range (" + std::to_string(m_strings.size()) +
                                          " strings)");
  }

  const i64 delta = static_cast<i64>(encodedStringSize(newString)) -
                    static_cast<i64>(encodedStringSize(m_strings[index]));
  const u32 replacedOffset = m_offsets[index];

  std::vector<u32> offsets;
  offsets.reserve(m_offsets.size());
  for (u32 offset : m_offsets) {
    offsets.push_back(offset > replacedOffset ? static_cast<u32>(offset + delta) : offset);
  }

  std::vector<std::u16string> strings = m_strings;
  for (usize i = 0; i < strings.size(); ++i) {
    if (m_offsets[i] == replacedOffset) {
      strings[i] = newString;
    }
  }

  if (delta != 0) {
    RETROPAK_LOG_TRACE("Replaced string " + std::to_string(index) + ", later offsets moved by " +
                       std::to_string(delta));
  }
  return Result<StringTable>::ok(StringTable(std::move(offsets), std::move(strings)));
}

} // namespace RetroPak::strg
