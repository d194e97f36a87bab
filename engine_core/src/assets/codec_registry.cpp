/**
 * @file codec_registry.cpp
 * @brief Asset codec dispatch
 */

#include "RetroPak/assets/codec_registry.hpp"
#include "RetroPak/core/logger.hpp"
#include "RetroPak/strg/strg.hpp"

#include <cstdio>

namespace RetroPak::assets {

namespace {

std::string hexId(u32 assetId) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "0x%08X", assetId);
  return buffer;
}

} // namespace

Result<ResourcePtr> OpaqueCodec::decode(ByteSpan bytes, core::FourCC assetType,
                                        const core::CodecConfig& /*config*/) const {
  return Result<ResourcePtr>::ok(
      OpaqueResource::create(assetType, ByteBuffer(bytes.begin(), bytes.end()), m_resolvedKind));
}

CodecKind codecKindForTag(const core::FourCC& assetType) {
  static const std::unordered_map<core::FourCC, CodecKind> tagTable = {
      {core::FourCC("STRG"), CodecKind::StringTable},
      {core::FourCC("DGRP"), CodecKind::DependencyGroup},
      {core::FourCC("DUMB"), CodecKind::DumbData},
      {core::FourCC("HINT"), CodecKind::Hint},
      {core::FourCC("SCAN"), CodecKind::Scan},
  };

  auto it = tagTable.find(assetType);
  return it != tagTable.end() ? it->second : CodecKind::Opaque;
}

CodecKind resolveCodecKind(const core::FourCC& assetType, u32 assetId) {
  if (assetId == SCAN_TREE_ASSET_ID) {
    return CodecKind::ScanTree;
  }
  return codecKindForTag(assetType);
}

AssetCodecRegistry::AssetCodecRegistry() = default;

const AssetCodecRegistry& AssetCodecRegistry::defaultRegistry() {
  static const AssetCodecRegistry registry = [] {
    AssetCodecRegistry builtIn;
    builtIn.registerCodec(CodecKind::StringTable, std::make_shared<strg::StrgCodec>());
    return builtIn;
  }();
  return registry;
}

void AssetCodecRegistry::registerCodec(CodecKind kind, std::shared_ptr<const IAssetCodec> codec) {
  if (!codec) {
    m_codecs.erase(kind);
    return;
  }
  m_codecs[kind] = std::move(codec);
}

bool AssetCodecRegistry::hasCodec(CodecKind kind) const {
  return m_codecs.find(kind) != m_codecs.end();
}

const IAssetCodec& AssetCodecRegistry::codecFor(CodecKind kind) const {
  auto it = m_codecs.find(kind);
  if (it == m_codecs.end()) {
    return m_fallback;
  }
  return *it->second;
}

Result<ResourcePtr> AssetCodecRegistry::decode(ByteSpan bytes, const core::FourCC& assetType,
                                               u32 assetId,
                                               const core::CodecConfig& config) const {
  const CodecKind kind = resolve(assetType, assetId);

  auto it = m_codecs.find(kind);
  if (it == m_codecs.end()) {
    if (kind != CodecKind::Opaque) {
      RETROPAK_LOG_DEBUG("No decoder for " + assetType.toString() + " " + hexId(assetId) + " (" +
                         codecKindToString(kind) + "), keeping payload opaque");
    }
    return OpaqueCodec(kind).decode(bytes, assetType, config);
  }

  return it->second->decode(bytes, assetType, config);
}

} // namespace RetroPak::assets
