#pragma once

/**
 * @file codec_registry.hpp
 * @brief Type-tag and asset-ID dispatch to payload codecs
 *
 * Dispatch order:
 * 1. An asset whose ID equals SCAN_TREE_ASSET_ID is a scan tree, whatever its tag.
 * 2. Otherwise the tag is looked up in the static tag table.
 * 3. Otherwise the payload is opaque.
 *
 * A resolved kind without a registered codec also decodes opaquely; unknown
 * payloads never fail a PAK decode.
 */

#include "RetroPak/assets/asset_codec.hpp"
#include <memory>
#include <unordered_map>

namespace RetroPak::assets {

// The logbook scan tree is a DUMB payload recognised only by this ID
constexpr u32 SCAN_TREE_ASSET_ID = 0x95B61279;

/**
 * @brief Static tag table lookup; no asset-ID rule applied
 */
[[nodiscard]] CodecKind codecKindForTag(const core::FourCC& assetType);

/**
 * @brief Two-tier dispatch rule described above
 */
[[nodiscard]] CodecKind resolveCodecKind(const core::FourCC& assetType, u32 assetId);

class AssetCodecRegistry {
public:
  AssetCodecRegistry();

  /**
   * @brief Process-wide registry with the built-in codecs
   *
   * Read-only once constructed; callers needing extra codecs build their
   * own registry.
   */
  [[nodiscard]] static const AssetCodecRegistry& defaultRegistry();

  /**
   * @brief Install @p codec for @p kind, replacing any previous one
   */
  void registerCodec(CodecKind kind, std::shared_ptr<const IAssetCodec> codec);

  [[nodiscard]] bool hasCodec(CodecKind kind) const;

  [[nodiscard]] CodecKind resolve(const core::FourCC& assetType, u32 assetId) const {
    return resolveCodecKind(assetType, assetId);
  }

  /**
   * @brief Codec registered for @p kind, or the opaque fallback
   */
  [[nodiscard]] const IAssetCodec& codecFor(CodecKind kind) const;

  [[nodiscard]] Result<ResourcePtr> decode(ByteSpan bytes, const core::FourCC& assetType,
                                           u32 assetId,
                                           const core::CodecConfig& config = {}) const;

private:
  std::unordered_map<CodecKind, std::shared_ptr<const IAssetCodec>> m_codecs;
  OpaqueCodec m_fallback;
};

} // namespace RetroPak::assets
