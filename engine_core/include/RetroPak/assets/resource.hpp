#pragma once

/**
 * @file resource.hpp
 * @brief Decoded PAK payloads
 *
 * Every payload stored in a PAK is a Resource: it knows its type tag, the
 * codec kind that produced it, and how to encode itself back to bytes.
 * Resources are immutable and shared between container snapshots through
 * ResourcePtr, so an edit that leaves a payload untouched never copies it.
 */

#include "RetroPak/core/fourcc.hpp"
#include "RetroPak/core/types.hpp"
#include <memory>

namespace RetroPak::assets {

/**
 * @brief Codec families a payload can be dispatched to
 */
enum class CodecKind : u8 {
  Opaque,          // Raw pass-through
  StringTable,     // STRG
  ScanTree,        // Logbook tree, selected by its reserved asset ID
  DependencyGroup, // DGRP
  DumbData,        // DUMB
  Hint,            // HINT
  Scan             // SCAN
};

[[nodiscard]] inline const char* codecKindToString(CodecKind kind) {
  switch (kind) {
  case CodecKind::Opaque:
    return "opaque";
  case CodecKind::StringTable:
    return "string_table";
  case CodecKind::ScanTree:
    return "scan_tree";
  case CodecKind::DependencyGroup:
    return "dependency_group";
  case CodecKind::DumbData:
    return "dumb_data";
  case CodecKind::Hint:
    return "hint";
  case CodecKind::Scan:
    return "scan";
  }
  return "unknown";
}

class Resource {
public:
  virtual ~Resource() = default;

  [[nodiscard]] virtual core::FourCC assetType() const = 0;
  [[nodiscard]] virtual CodecKind codecKind() const = 0;

  [[nodiscard]] virtual ByteBuffer encode() const = 0;

  /**
   * @brief Unpadded encoded size; always equals encode().size()
   */
  [[nodiscard]] virtual usize encodedSize() const = 0;

  /**
   * @brief Value equality across resource types
   */
  [[nodiscard]] virtual bool equals(const Resource& other) const = 0;
};

using ResourcePtr = std::shared_ptr<const Resource>;

/**
 * @brief Payload kept as the exact bytes it was decoded from
 *
 * Used for every type tag without a structural codec. The bytes are never
 * inspected, so encode() reproduces the input exactly.
 */
class OpaqueResource final : public Resource {
public:
  OpaqueResource(core::FourCC assetType, ByteBuffer data,
                 CodecKind resolvedKind = CodecKind::Opaque);

  [[nodiscard]] static ResourcePtr create(core::FourCC assetType, ByteBuffer data,
                                          CodecKind resolvedKind = CodecKind::Opaque);

  [[nodiscard]] core::FourCC assetType() const override { return m_assetType; }

  /**
   * @brief Kind the registry resolved for this payload
   *
   * A payload whose resolved kind has no registered decoder is still stored
   * opaquely; the resolved kind is kept so callers can tell it apart from a
   * genuinely unknown tag.
   */
  [[nodiscard]] CodecKind codecKind() const override { return m_resolvedKind; }

  [[nodiscard]] ByteBuffer encode() const override { return m_data; }
  [[nodiscard]] usize encodedSize() const override { return m_data.size(); }
  [[nodiscard]] bool equals(const Resource& other) const override;

  [[nodiscard]] const ByteBuffer& data() const { return m_data; }

private:
  core::FourCC m_assetType;
  ByteBuffer m_data;
  CodecKind m_resolvedKind;
};

} // namespace RetroPak::assets
