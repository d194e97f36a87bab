/**
 * @file pak_records.cpp
 * @brief PAK directory records
 */

#include "RetroPak/pak/pak_records.hpp"

namespace RetroPak::pak {

// ============================================================================
// NamedResourceEntry
// ============================================================================

Result<core::Decoded<NamedResourceEntry>> NamedResourceEntry::decode(ByteSpan bytes) {
  using Decoded = core::Decoded<NamedResourceEntry>;

  core::BinaryReader reader(bytes);
  if (!reader.canRead(FIXED_SIZE)) {
    return Result<Decoded>::error(ErrorCode::MalformedHeader,
                                  "Named resource entry needs " + std::to_string(FIXED_SIZE) +
                                      " bytes, " + std::to_string(bytes.size()) + " available");
  }

  NamedResourceEntry entry;
  entry.assetType = reader.readFourCC();
  entry.assetId = reader.readU32();
  const u32 nameLength = reader.readU32();

  if (!reader.canRead(nameLength)) {
    return Result<Decoded>::error(ErrorCode::TruncatedPayload,
                                  "Resource name declares " + std::to_string(nameLength) +
                                      " bytes, " + std::to_string(reader.remaining()) +
                                      " available");
  }

  const ByteSpan name = reader.readBytes(nameLength);
  entry.name.assign(name.begin(), name.end());
  return Result<Decoded>::ok(Decoded{std::move(entry), FIXED_SIZE + nameLength});
}

void NamedResourceEntry::encode(core::BinaryWriter& writer) const {
  writer.writeFourCC(assetType);
  writer.writeU32(assetId);
  writer.writeU32(nameLength());
  writer.writeString(name);
}

ByteBuffer NamedResourceEntry::encode() const {
  core::BinaryWriter writer(encodedSize());
  encode(writer);
  return writer.take();
}

// ============================================================================
// ResourceEntry
// ============================================================================

Result<core::Decoded<ResourceEntry>> ResourceEntry::decode(ByteSpan bytes) {
  using Decoded = core::Decoded<ResourceEntry>;

  core::BinaryReader reader(bytes);
  if (!reader.canRead(PACKED_SIZE)) {
    return Result<Decoded>::error(ErrorCode::MalformedHeader,
                                  "Resource entry needs " + std::to_string(PACKED_SIZE) +
                                      " bytes, " + std::to_string(bytes.size()) + " available");
  }

  ResourceEntry entry;
  entry.compressionFlag = reader.readU32();
  entry.assetType = reader.readFourCC();
  entry.assetId = reader.readU32();
  entry.size = reader.readU32();
  entry.offset = reader.readU32();
  return Result<Decoded>::ok(Decoded{entry, PACKED_SIZE});
}

void ResourceEntry::encode(core::BinaryWriter& writer) const {
  writer.writeU32(compressionFlag);
  writer.writeFourCC(assetType);
  writer.writeU32(assetId);
  writer.writeU32(size);
  writer.writeU32(offset);
}

ByteBuffer ResourceEntry::encode() const {
  core::BinaryWriter writer(PACKED_SIZE);
  encode(writer);
  return writer.take();
}

} // namespace RetroPak::pak
