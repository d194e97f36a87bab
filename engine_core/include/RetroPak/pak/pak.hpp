#pragma once

/**
 * @file pak.hpp
 * @brief PAK - the engine's resource archive
 *
 * Layout (big-endian):
 * @code
 *   u16 major, u16 minor, u32 unused, u32 named_count
 *   named_count x NamedResourceEntry
 *   u32 resource_count
 *   resource_count x ResourceEntry
 *   padding to 32 bytes
 *   resource_count x (payload, padded to 32 bytes)
 * @endcode
 *
 * A Pak is an immutable snapshot. Entries and payloads are index-parallel;
 * every edit returns a new Pak whose directory offsets are already laid out
 * for the edited content. Payloads are shared between snapshots.
 *
 * Edits rebuild the entry list and the asset ID index, so each costs O(n)
 * in the number of resources.
 */

#include "RetroPak/assets/codec_registry.hpp"
#include "RetroPak/pak/pak_records.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace RetroPak::pak {

constexpr usize PAK_HEADER_SIZE = 12;

class Pak {
public:
  /**
   * @brief Archive with no resources
   */
  [[nodiscard]] static Pak empty(u16 majorVersion = 3, u16 minorVersion = 5);

  /**
   * @brief Assemble a Pak from its parts, taking the entries as given
   * @return IndexOutOfRange when entries and resources differ in length,
   *         DuplicateIdentifier when an asset ID repeats
   */
  [[nodiscard]] static Result<Pak> create(u16 majorVersion, u16 minorVersion, u32 unused,
                                          std::vector<NamedResourceEntry> namedResources,
                                          std::vector<ResourceEntry> entries,
                                          std::vector<assets::ResourcePtr> resources);

  [[nodiscard]] static Result<Pak>
  decode(ByteSpan bytes,
         const assets::AssetCodecRegistry& registry = assets::AssetCodecRegistry::defaultRegistry(),
         const core::CodecConfig& config = {});

  /**
   * @brief Serialize; offsets and sizes are recomputed from the payloads
   */
  [[nodiscard]] ByteBuffer encode(const core::CodecConfig& config = {}) const;
  [[nodiscard]] usize encodedSize() const;

  /**
   * @brief Unpadded size of the header and both directories
   */
  [[nodiscard]] usize headerSize() const;
  [[nodiscard]] usize headerPaddingSize() const { return core::paddingFor(headerSize()); }

  [[nodiscard]] u16 majorVersion() const { return m_majorVersion; }
  [[nodiscard]] u16 minorVersion() const { return m_minorVersion; }
  [[nodiscard]] u32 unused() const { return m_unused; }

  [[nodiscard]] usize namedResourceCount() const { return m_namedResources.size(); }
  [[nodiscard]] usize resourceCount() const { return m_entries.size(); }

  [[nodiscard]] const std::vector<NamedResourceEntry>& namedResources() const {
    return m_namedResources;
  }
  [[nodiscard]] const std::vector<ResourceEntry>& entries() const { return m_entries; }
  [[nodiscard]] const std::vector<assets::ResourcePtr>& resources() const { return m_resources; }

  [[nodiscard]] bool contains(u32 assetId) const;
  [[nodiscard]] Result<usize> indexOf(u32 assetId) const;

  [[nodiscard]] Result<ResourceEntry> entryAt(usize index) const;
  [[nodiscard]] Result<assets::ResourcePtr> resourceAt(usize index) const;

  /**
   * @brief Payload stored under @p assetId; UnknownIdentifier when absent
   */
  [[nodiscard]] Result<assets::ResourcePtr> lookup(u32 assetId) const;

  /**
   * @brief Typed lookup; AssetTypeMismatch when the payload is not a T
   */
  template <typename T>
  [[nodiscard]] Result<std::shared_ptr<const T>> lookupAs(u32 assetId) const {
    auto resource = lookup(assetId);
    if (resource.isError()) {
      return Result<std::shared_ptr<const T>>::error(resource.errorInfo());
    }
    auto typed = std::dynamic_pointer_cast<const T>(resource.value());
    if (!typed) {
      return Result<std::shared_ptr<const T>>::error(
          ErrorCode::AssetTypeMismatch,
          "Asset " + std::to_string(assetId) + " holds a " +
              resource.value()->assetType().toString() + " payload of another kind");
    }
    return Result<std::shared_ptr<const T>>::ok(std::move(typed));
  }

  /**
   * @brief First alias with the given name
   */
  [[nodiscard]] Result<NamedResourceEntry> findNamedResource(const std::string& name) const;

  /**
   * @brief Insert @p resource at @p index under @p assetId
   *
   * The new entry takes the position of the entry currently at @p index
   * (or follows the last entry when appending) and is never compressed.
   * Everything after it moves by the new payload's padded size.
   */
  [[nodiscard]] Result<Pak> withResourceInserted(usize index, u32 assetId,
                                                 assets::ResourcePtr resource) const;

  [[nodiscard]] Result<Pak> withResourceAppended(u32 assetId, assets::ResourcePtr resource) const;

  [[nodiscard]] Result<Pak> withResourceRemoved(usize index) const;

  /**
   * @brief Resolve @p assetId to its index, then remove that index
   */
  [[nodiscard]] Result<Pak> withResourceRemovedById(u32 assetId) const;

  /**
   * @brief Remove then re-insert at the same index under the same asset ID
   */
  [[nodiscard]] Result<Pak> withResourceReplaced(usize index, assets::ResourcePtr resource) const;

  [[nodiscard]] Result<Pak> withResourceReplacedById(u32 assetId,
                                                     assets::ResourcePtr resource) const;

  [[nodiscard]] std::string describe() const;

  bool operator==(const Pak& other) const;

private:
  Pak(u16 majorVersion, u16 minorVersion, u32 unused,
      std::vector<NamedResourceEntry> namedResources, std::vector<ResourceEntry> entries,
      std::vector<assets::ResourcePtr> resources);

  [[nodiscard]] static usize headerSizeFor(const std::vector<NamedResourceEntry>& namedResources,
                                           usize resourceCount);

  u16 m_majorVersion = 3;
  u16 m_minorVersion = 5;
  u32 m_unused = 0;
  std::vector<NamedResourceEntry> m_namedResources;
  std::vector<ResourceEntry> m_entries;
  std::vector<assets::ResourcePtr> m_resources;

  std::unordered_map<u32, usize> m_indexById;
};

} // namespace RetroPak::pak
