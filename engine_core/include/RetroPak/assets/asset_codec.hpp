#pragma once

/**
 * @file asset_codec.hpp
 * @brief Contract between the PAK container and per-type payload decoders
 */

#include "RetroPak/assets/resource.hpp"
#include "RetroPak/core/codec_config.hpp"
#include "RetroPak/core/result.hpp"

namespace RetroPak::assets {

/**
 * @brief Decoder for one payload family
 *
 * Encoding is the decoded Resource's own responsibility, so a codec only
 * has to turn a payload slice into a Resource. Implementations must be
 * stateless: the same codec instance is shared by every decode.
 */
class IAssetCodec {
public:
  virtual ~IAssetCodec() = default;

  [[nodiscard]] virtual CodecKind kind() const = 0;

  [[nodiscard]] virtual Result<ResourcePtr> decode(ByteSpan bytes, core::FourCC assetType,
                                                   const core::CodecConfig& config) const = 0;
};

/**
 * @brief Pass-through codec; wraps the payload bytes untouched
 */
class OpaqueCodec final : public IAssetCodec {
public:
  OpaqueCodec() = default;
  explicit OpaqueCodec(CodecKind resolvedKind) : m_resolvedKind(resolvedKind) {}

  [[nodiscard]] CodecKind kind() const override { return m_resolvedKind; }

  [[nodiscard]] Result<ResourcePtr> decode(ByteSpan bytes, core::FourCC assetType,
                                           const core::CodecConfig& config) const override;

private:
  CodecKind m_resolvedKind = CodecKind::Opaque;
};

} // namespace RetroPak::assets
