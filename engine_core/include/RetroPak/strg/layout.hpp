#pragma once

/**
 * @file layout.hpp
 * @brief Offset-ordered placement of variable-length items inside a region
 *
 * Names, strings and per-language string tables are all addressed through an
 * offset table and written back in ascending offset order, not index order.
 * These helpers validate such a layout and compute where each item lands.
 */

#include "RetroPak/core/result.hpp"
#include "RetroPak/core/types.hpp"
#include <string>
#include <vector>

namespace RetroPak::strg {

struct Placement {
  usize index = 0; // Item index in its owning sequence
  usize gap = 0;   // Zero bytes written before the item
};

/**
 * @brief Indices sorted by ascending offset; ties keep index order
 */
[[nodiscard]] std::vector<usize> orderByOffset(const std::vector<u32>& offsets);

/**
 * @brief Reject items that start before @p regionStart or inside another item
 *
 * Items of size zero never overlap anything. When @p allowShared is set, items
 * at the same offset with the same size share their bytes.
 * @return MalformedHeader naming @p what on violation
 */
[[nodiscard]] Result<void> checkLayout(const std::vector<u32>& offsets,
                                       const std::vector<usize>& sizes, usize regionStart,
                                       bool allowShared, const std::string& what);

/**
 * @brief Items to write, in offset order, with the gap preceding each
 *
 * An item whose offset equals an already placed item's shares its bytes and
 * is left out. An empty item is placed only when it lies past everything
 * before it, so the region reaches its offset. @p regionEnd receives the end
 * of the last item.
 */
[[nodiscard]] std::vector<Placement> placeByOffset(const std::vector<u32>& offsets,
                                                   const std::vector<usize>& sizes,
                                                   usize regionStart, usize& regionEnd);

} // namespace RetroPak::strg
