#include "RetroPak/assets/resource.hpp"

namespace RetroPak::assets {

OpaqueResource::OpaqueResource(core::FourCC assetType, ByteBuffer data, CodecKind resolvedKind)
    : m_assetType(assetType), m_data(std::move(data)), m_resolvedKind(resolvedKind) {}

ResourcePtr OpaqueResource::create(core::FourCC assetType, ByteBuffer data,
                                   CodecKind resolvedKind) {
  return std::make_shared<OpaqueResource>(assetType, std::move(data), resolvedKind);
}

bool OpaqueResource::equals(const Resource& other) const {
  const auto* opaque = dynamic_cast<const OpaqueResource*>(&other);
  if (!opaque) {
    return false;
  }
  return m_assetType == opaque->m_assetType && m_data == opaque->m_data;
}

} // namespace RetroPak::assets
