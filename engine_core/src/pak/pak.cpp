/**
 * @file pak.cpp
 * @brief PAK archive decode, encode and structural edits
 */

#include "RetroPak/pak/pak.hpp"
#include "RetroPak/core/logger.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>

namespace RetroPak::pak {

namespace {

std::string hexId(u32 assetId) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "0x%08X", assetId);
  return buffer;
}

Result<Pak> fail(ErrorCode code, const std::string& message) {
  RETROPAK_LOG_WARN("PAK decode failed: " + message);
  return Result<Pak>::error(code, message);
}

/**
 * @brief Move the offsets of entries in [begin, end) by @p delta
 */
std::vector<ResourceEntry> shiftOffsets(std::vector<ResourceEntry> entries, usize begin, usize end,
                                        i64 delta) {
  if (delta == 0) {
    return entries;
  }
  for (usize i = begin; i < end && i < entries.size(); ++i) {
    entries[i].offset = static_cast<u32>(static_cast<i64>(entries[i].offset) + delta);
  }
  return entries;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Pak::Pak(u16 majorVersion, u16 minorVersion, u32 unused,
         std::vector<NamedResourceEntry> namedResources, std::vector<ResourceEntry> entries,
         std::vector<assets::ResourcePtr> resources)
    : m_majorVersion(majorVersion), m_minorVersion(minorVersion), m_unused(unused),
      m_namedResources(std::move(namedResources)), m_entries(std::move(entries)),
      m_resources(std::move(resources)) {
  m_indexById.reserve(m_entries.size());
  for (usize i = 0; i < m_entries.size(); ++i) {
    m_indexById.emplace(m_entries[i].assetId, i);
  }
}

Pak Pak::empty(u16 majorVersion, u16 minorVersion) {
  return Pak(majorVersion, minorVersion, 0, {}, {}, {});
}

Result<Pak> Pak::create(u16 majorVersion, u16 minorVersion, u32 unused,
                        std::vector<NamedResourceEntry> namedResources,
                        std::vector<ResourceEntry> entries,
                        std::vector<assets::ResourcePtr> resources) {
  if (entries.size() != resources.size()) {
    return Result<Pak>::error(ErrorCode::IndexOutOfRange,
                              std::to_string(entries.size()) + " resource entries but " +
                                  std::to_string(resources.size()) + " payloads");
  }

  std::unordered_map<u32, usize> seen;
  seen.reserve(entries.size());
  for (usize i = 0; i < entries.size(); ++i) {
    if (!resources[i]) {
      return Result<Pak>::error("Resource " + std::to_string(i) + " has no payload");
    }
    if (!seen.emplace(entries[i].assetId, i).second) {
      return Result<Pak>::error(ErrorCode::DuplicateIdentifier,
                                "Asset " + hexId(entries[i].assetId) + " appears at index " +
                                    std::to_string(seen[entries[i].assetId]) + " and " +
                                    std::to_string(i));
    }
  }

  return Result<Pak>::ok(Pak(majorVersion, minorVersion, unused, std::move(namedResources),
                             std::move(entries), std::move(resources)));
}

// ============================================================================
// Decode
// ============================================================================

Result<Pak> Pak::decode(ByteSpan bytes, const assets::AssetCodecRegistry& registry,
                        const core::CodecConfig& config) {
  core::BinaryReader reader(bytes);
  if (!reader.canRead(PAK_HEADER_SIZE)) {
    return fail(ErrorCode::MalformedHeader, "Header needs " + std::to_string(PAK_HEADER_SIZE) +
                                                " bytes, " + std::to_string(bytes.size()) +
                                                " available");
  }

  const u16 majorVersion = reader.readU16();
  const u16 minorVersion = reader.readU16();
  const u32 unused = reader.readU32();
  const u32 namedCount = reader.readU32();

  if (namedCount > config.maxNamedResourceCount) {
    return fail(ErrorCode::MalformedHeader, "Named resource count " + std::to_string(namedCount) +
                                                " exceeds limit " +
                                                std::to_string(config.maxNamedResourceCount));
  }

  // Named entries vary in length; each one's end is the next one's start
  std::vector<NamedResourceEntry> namedResources;
  namedResources.reserve(namedCount);
  for (u32 i = 0; i < namedCount; ++i) {
    auto named = NamedResourceEntry::decode(bytes.subspan(reader.position()));
    if (named.isError()) {
      return fail(named.errorCode(), "Named resource " + std::to_string(i) + ": " + named.error());
    }
    reader.skip(named.value().consumed);
    namedResources.push_back(std::move(named).value().value);
  }

  if (!reader.canRead(sizeof(u32))) {
    return fail(ErrorCode::MalformedHeader, "Missing resource count");
  }
  const u32 resourceCount = reader.readU32();

  if (resourceCount > config.maxResourceCount) {
    return fail(ErrorCode::MalformedHeader, "Resource count " + std::to_string(resourceCount) +
                                                " exceeds limit " +
                                                std::to_string(config.maxResourceCount));
  }
  if (static_cast<u64>(resourceCount) * ResourceEntry::PACKED_SIZE > reader.remaining()) {
    return fail(ErrorCode::MalformedHeader, std::to_string(resourceCount) +
                                                " resource entries do not fit in the remaining " +
                                                std::to_string(reader.remaining()) + " bytes");
  }

  std::vector<ResourceEntry> entries;
  entries.reserve(resourceCount);
  for (u32 i = 0; i < resourceCount; ++i) {
    auto entry = ResourceEntry::decode(bytes.subspan(reader.position()));
    if (entry.isError()) {
      return fail(entry.errorCode(), "Resource entry " + std::to_string(i) + ": " + entry.error());
    }
    reader.skip(entry.value().consumed);
    entries.push_back(entry.value().value);
  }

  std::vector<assets::ResourcePtr> resources;
  resources.reserve(resourceCount);
  for (const auto& entry : entries) {
    const u64 end = static_cast<u64>(entry.offset) + entry.size;
    if (end > bytes.size()) {
      return fail(ErrorCode::TruncatedPayload,
                  entry.assetType.toString() + " " + hexId(entry.assetId) + " spans [" +
                      std::to_string(entry.offset) + ", " + std::to_string(end) + ") of a " +
                      std::to_string(bytes.size()) + "-byte archive");
    }

    const ByteSpan payload = bytes.subspan(entry.offset, entry.size);

    // Compressed payloads cannot be decoded structurally; keep them verbatim
    if (entry.compressed()) {
      RETROPAK_LOG_DEBUG(entry.assetType.toString() + " " + hexId(entry.assetId) +
                         " is compressed, keeping payload opaque");
      resources.push_back(assets::OpaqueResource::create(
          entry.assetType, ByteBuffer(payload.begin(), payload.end()),
          registry.resolve(entry.assetType, entry.assetId)));
      continue;
    }

    auto resource = registry.decode(payload, entry.assetType, entry.assetId, config);
    if (resource.isError()) {
      return fail(resource.errorCode(), entry.assetType.toString() + " " + hexId(entry.assetId) +
                                            ": " + resource.error());
    }
    resources.push_back(std::move(resource).value());
  }

  RETROPAK_LOG_DEBUG("Decoded PAK " + std::to_string(majorVersion) + "." +
                     std::to_string(minorVersion) + ": " + std::to_string(namedCount) +
                     " named, " + std::to_string(resourceCount) + " resources");

  auto pak = create(majorVersion, minorVersion, unused, std::move(namedResources),
                    std::move(entries), std::move(resources));
  if (pak.isError()) {
    return fail(pak.errorCode(), pak.error());
  }
  return pak;
}

// ============================================================================
// Encode
// ============================================================================

usize Pak::headerSizeFor(const std::vector<NamedResourceEntry>& namedResources,
                         usize resourceCount) {
  usize size = PAK_HEADER_SIZE;
  for (const auto& named : namedResources) {
    size += named.encodedSize();
  }
  size += sizeof(u32);
  size += resourceCount * ResourceEntry::PACKED_SIZE;
  return size;
}

usize Pak::headerSize() const {
  return headerSizeFor(m_namedResources, m_entries.size());
}

usize Pak::encodedSize() const {
  usize size = core::alignedSize(headerSize());
  for (const auto& resource : m_resources) {
    size += core::alignedSize(resource->encodedSize());
  }
  return size;
}

ByteBuffer Pak::encode(const core::CodecConfig& config) const {
  core::BinaryWriter writer(encodedSize());
  writer.writeU16(m_majorVersion);
  writer.writeU16(m_minorVersion);
  writer.writeU32(m_unused);
  writer.writeU32(static_cast<u32>(m_namedResources.size()));
  for (const auto& named : m_namedResources) {
    named.encode(writer);
  }

  writer.writeU32(static_cast<u32>(m_entries.size()));

  std::vector<ByteBuffer> payloads;
  payloads.reserve(m_resources.size());
  usize offset = core::alignedSize(headerSize());
  for (usize i = 0; i < m_entries.size(); ++i) {
    payloads.push_back(m_resources[i]->encode());

    ResourceEntry entry = m_entries[i];
    entry.size = static_cast<u32>(payloads.back().size());
    entry.offset = static_cast<u32>(offset);
    entry.encode(writer);

    offset += core::alignedSize(payloads.back().size());
  }

  writer.writeFill(config.headerFillByte, headerPaddingSize());

  for (const auto& payload : payloads) {
    writer.writeBytes(payload);
    writer.writeFill(config.resourceFillByte, core::paddingFor(payload.size()));
  }

  return writer.take();
}

// ============================================================================
// Lookup
// ============================================================================

bool Pak::contains(u32 assetId) const {
  return m_indexById.find(assetId) != m_indexById.end();
}

Result<usize> Pak::indexOf(u32 assetId) const {
  auto it = m_indexById.find(assetId);
  if (it == m_indexById.end()) {
    return Result<usize>::error(ErrorCode::UnknownIdentifier,
                                "No asset " + hexId(assetId) + " in PAK");
  }
  return Result<usize>::ok(it->second);
}

Result<ResourceEntry> Pak::entryAt(usize index) const {
  if (index >= m_entries.size()) {
    return Result<ResourceEntry>::error(ErrorCode::IndexOutOfRange,
                                        "Resource index " + std::to_string(index) +
                                            " out of range (" +
                                            std::to_string(m_entries.size()) + " resources)");
  }
  return Result<ResourceEntry>::ok(m_entries[index]);
}

Result<assets::ResourcePtr> Pak::resourceAt(usize index) const {
  if (index >= m_resources.size()) {
    return Result<assets::ResourcePtr>::error(ErrorCode::IndexOutOfRange,
                                              "Resource index " + std::to_string(index) +
                                                  " out of range (" +
                                                  std::to_string(m_resources.size()) +
                                                  " resources)");
  }
  return Result<assets::ResourcePtr>::ok(m_resources[index]);
}

Result<assets::ResourcePtr> Pak::lookup(u32 assetId) const {
  auto index = indexOf(assetId);
  if (index.isError()) {
    return Result<assets::ResourcePtr>::error(index.errorInfo());
  }
  return Result<assets::ResourcePtr>::ok(m_resources[index.value()]);
}

Result<NamedResourceEntry> Pak::findNamedResource(const std::string& name) const {
  auto it = std::find_if(m_namedResources.begin(), m_namedResources.end(),
                         [&name](const NamedResourceEntry& named) { return named.name == name; });
  if (it == m_namedResources.end()) {
    return Result<NamedResourceEntry>::error(ErrorCode::UnknownIdentifier,
                                             "No resource named '" + name + "'");
  }
  return Result<NamedResourceEntry>::ok(*it);
}

// ============================================================================
// Edits
// ============================================================================

Result<Pak> Pak::withResourceInserted(usize index, u32 assetId,
                                      assets::ResourcePtr resource) const {
  const usize count = m_entries.size();
  if (index > count) {
    return Result<Pak>::error(ErrorCode::IndexOutOfRange,
                              "Insert index " + std::to_string(index) + " out of range (" +
                                  std::to_string(count) + " resources)");
  }
  if (!resource) {
    return Result<Pak>::error("Cannot insert a null resource");
  }
  if (contains(assetId)) {
    return Result<Pak>::error(ErrorCode::DuplicateIdentifier,
                              "Asset " + hexId(assetId) + " already present");
  }

  // One more directory entry may push the payload region to the next boundary
  const usize oldDataStart = core::alignedSize(headerSize());
  const usize newDataStart = core::alignedSize(headerSizeFor(m_namedResources, count + 1));
  const i64 headerDelta = static_cast<i64>(newDataStart) - static_cast<i64>(oldDataStart);

  u32 position = 0;
  if (index < count) {
    position = m_entries[index].offset;
  } else if (count > 0) {
    const ResourceEntry& last = m_entries.back();
    position = static_cast<u32>(last.offset + core::alignedSize(last.size));
  } else {
    position = static_cast<u32>(oldDataStart);
  }

  const usize size = resource->encodedSize();
  ResourceEntry inserted;
  inserted.compressionFlag = 0;
  inserted.assetType = resource->assetType();
  inserted.assetId = assetId;
  inserted.size = static_cast<u32>(size);
  inserted.offset = static_cast<u32>(static_cast<i64>(position) + headerDelta);

  std::vector<ResourceEntry> entries = shiftOffsets(m_entries, 0, count, headerDelta);
  entries.insert(entries.begin() + static_cast<std::ptrdiff_t>(index), inserted);
  entries = shiftOffsets(std::move(entries), index + 1, count + 1,
                         static_cast<i64>(core::alignedSize(size)));

  std::vector<assets::ResourcePtr> resources = m_resources;
  resources.insert(resources.begin() + static_cast<std::ptrdiff_t>(index), std::move(resource));

  RETROPAK_LOG_DEBUG("Inserted " + inserted.assetType.toString() + " " + hexId(assetId) +
                     " at index " + std::to_string(index));

  return Result<Pak>::ok(Pak(m_majorVersion, m_minorVersion, m_unused, m_namedResources,
                             std::move(entries), std::move(resources)));
}

Result<Pak> Pak::withResourceAppended(u32 assetId, assets::ResourcePtr resource) const {
  return withResourceInserted(m_entries.size(), assetId, std::move(resource));
}

Result<Pak> Pak::withResourceRemoved(usize index) const {
  const usize count = m_entries.size();
  if (index >= count) {
    return Result<Pak>::error(ErrorCode::IndexOutOfRange,
                              "Remove index " + std::to_string(index) + " out of range (" +
                                  std::to_string(count) + " resources)");
  }

  const usize oldDataStart = core::alignedSize(headerSize());
  const usize newDataStart = core::alignedSize(headerSizeFor(m_namedResources, count - 1));
  const i64 headerDelta = static_cast<i64>(newDataStart) - static_cast<i64>(oldDataStart);
  const i64 removedExtent = static_cast<i64>(core::alignedSize(m_entries[index].size));

  std::vector<ResourceEntry> entries = m_entries;
  entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(index));
  entries = shiftOffsets(std::move(entries), 0, count - 1, headerDelta);
  entries = shiftOffsets(std::move(entries), index, count - 1, -removedExtent);

  std::vector<assets::ResourcePtr> resources = m_resources;
  resources.erase(resources.begin() + static_cast<std::ptrdiff_t>(index));

  RETROPAK_LOG_DEBUG("Removed " + m_entries[index].assetType.toString() + " " +
                     hexId(m_entries[index].assetId) + " from index " + std::to_string(index));

  return Result<Pak>::ok(Pak(m_majorVersion, m_minorVersion, m_unused, m_namedResources,
                             std::move(entries), std::move(resources)));
}

Result<Pak> Pak::withResourceRemovedById(u32 assetId) const {
  auto index = indexOf(assetId);
  if (index.isError()) {
    return Result<Pak>::error(index.errorInfo());
  }
  return withResourceRemoved(index.value());
}

Result<Pak> Pak::withResourceReplaced(usize index, assets::ResourcePtr resource) const {
  if (index >= m_entries.size()) {
    return Result<Pak>::error(ErrorCode::IndexOutOfRange,
                              "Replace index " + std::to_string(index) + " out of range (" +
                                  std::to_string(m_entries.size()) + " resources)");
  }

  const u32 assetId = m_entries[index].assetId;
  auto removed = withResourceRemoved(index);
  if (removed.isError()) {
    return removed;
  }
  return removed.value().withResourceInserted(index, assetId, std::move(resource));
}

Result<Pak> Pak::withResourceReplacedById(u32 assetId, assets::ResourcePtr resource) const {
  auto index = indexOf(assetId);
  if (index.isError()) {
    return Result<Pak>::error(index.errorInfo());
  }
  return withResourceReplaced(index.value(), std::move(resource));
}

// ============================================================================
// Misc
// ============================================================================

bool Pak::operator==(const Pak& other) const {
  if (m_majorVersion != other.m_majorVersion || m_minorVersion != other.m_minorVersion ||
      m_unused != other.m_unused || m_namedResources != other.m_namedResources ||
      m_entries != other.m_entries || m_resources.size() != other.m_resources.size()) {
    return false;
  }

  for (usize i = 0; i < m_resources.size(); ++i) {
    if (m_resources[i] != other.m_resources[i] && !m_resources[i]->equals(*other.m_resources[i])) {
      return false;
    }
  }
  return true;
}

std::string Pak::describe() const {
  std::ostringstream out;
  out << "PAK " << m_majorVersion << "." << m_minorVersion << " named=" << m_namedResources.size()
      << " resources=" << m_entries.size() << " size=" << encodedSize() << '\n';
  for (const auto& named : m_namedResources) {
    out << "  name " << named.assetType.toString() << " " << hexId(named.assetId) << " \""
        << named.name << "\"\n";
  }
  for (usize i = 0; i < m_entries.size(); ++i) {
    const ResourceEntry& entry = m_entries[i];
    out << "  [" << i << "] " << entry.assetType.toString() << " " << hexId(entry.assetId)
        << " offset=" << entry.offset << " size=" << entry.size
        << (entry.compressed() ? " compressed" : "") << " ("
        << assets::codecKindToString(m_resources[i]->codecKind()) << ")\n";
  }
  return out.str();
}

} // namespace RetroPak::pak
