#pragma once

/**
 * @file pak_records.hpp
 * @brief PAK directory records
 *
 * NamedResourceEntry: type[4], asset_id u32, name_length u32, name[name_length]
 * ResourceEntry:      compressed u32, type[4], asset_id u32, size u32, offset u32
 */

#include "RetroPak/core/binary_stream.hpp"
#include "RetroPak/core/fourcc.hpp"
#include "RetroPak/core/result.hpp"
#include <string>

namespace RetroPak::pak {

/**
 * @brief Human-readable alias for an asset
 */
struct NamedResourceEntry {
  static constexpr usize FIXED_SIZE = 12;

  core::FourCC assetType;
  u32 assetId = 0;
  std::string name;

  [[nodiscard]] u32 nameLength() const { return static_cast<u32>(name.size()); }

  [[nodiscard]] static Result<core::Decoded<NamedResourceEntry>> decode(ByteSpan bytes);

  void encode(core::BinaryWriter& writer) const;
  [[nodiscard]] ByteBuffer encode() const;
  [[nodiscard]] usize encodedSize() const { return FIXED_SIZE + name.size(); }

  bool operator==(const NamedResourceEntry& other) const = default;
};

/**
 * @brief Directory entry locating one resource payload
 *
 * @c size is the unpadded payload size; @c offset is absolute from the
 * start of the archive.
 */
struct ResourceEntry {
  static constexpr usize PACKED_SIZE = 20;

  u32 compressionFlag = 0; // Kept verbatim; any non-zero value means compressed
  core::FourCC assetType;
  u32 assetId = 0;
  u32 size = 0;
  u32 offset = 0;

  [[nodiscard]] bool compressed() const { return compressionFlag != 0; }

  [[nodiscard]] static Result<core::Decoded<ResourceEntry>> decode(ByteSpan bytes);

  void encode(core::BinaryWriter& writer) const;
  [[nodiscard]] ByteBuffer encode() const;
  [[nodiscard]] usize encodedSize() const { return PACKED_SIZE; }

  bool operator==(const ResourceEntry& other) const = default;
};

} // namespace RetroPak::pak
