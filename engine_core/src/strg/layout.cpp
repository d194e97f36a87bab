/**
 * @file layout.cpp
 * @brief Offset-ordered placement shared by the STRG tables
 */

#include "RetroPak/strg/layout.hpp"

#include <algorithm>
#include <numeric>

namespace RetroPak::strg {

std::vector<usize> orderByOffset(const std::vector<u32>& offsets) {
  std::vector<usize> order(offsets.size());
  std::iota(order.begin(), order.end(), usize{0});
  std::stable_sort(order.begin(), order.end(),
                   [&offsets](usize a, usize b) { return offsets[a] < offsets[b]; });
  return order;
}

Result<void> checkLayout(const std::vector<u32>& offsets, const std::vector<usize>& sizes,
                         usize regionStart, bool allowShared, const std::string& what) {
  bool placed = false;
  usize lastIndex = 0;
  usize end = regionStart;

  for (usize index : orderByOffset(offsets)) {
    if (sizes[index] == 0) {
      continue;
    }

    const usize offset = offsets[index];
    if (offset < regionStart) {
      return Result<void>::error(ErrorCode::MalformedHeader,
                                 what + " " + std::to_string(index) + " at offset " +
                                     std::to_string(offset) + " starts inside the offset table");
    }

    if (placed && offset == offsets[lastIndex] && allowShared) {
      if (sizes[index] != sizes[lastIndex]) {
        return Result<void>::error(ErrorCode::MalformedHeader,
                                   what + "s " + std::to_string(lastIndex) + " and " +
                                       std::to_string(index) + " share offset " +
                                       std::to_string(offset) + " with different sizes");
      }
      continue;
    }

    if (offset < end) {
      return Result<void>::error(ErrorCode::MalformedHeader,
                                 what + " " + std::to_string(index) + " at offset " +
                                     std::to_string(offset) + " overlaps " + what + " " +
                                     std::to_string(lastIndex));
    }

    placed = true;
    lastIndex = index;
    end = offset + sizes[index];
  }
  return Result<void>::ok();
}

std::vector<Placement> placeByOffset(const std::vector<u32>& offsets,
                                     const std::vector<usize>& sizes, usize regionStart,
                                     usize& regionEnd) {
  std::vector<Placement> placements;
  placements.reserve(offsets.size());

  bool placed = false;
  usize lastOffset = 0;
  usize end = regionStart;

  for (usize index : orderByOffset(offsets)) {
    const usize offset = offsets[index];
    if (sizes[index] == 0) {
      // Nothing to write, but the region must still reach the offset
      if (offset > end) {
        placements.push_back(Placement{index, offset - end});
        end = offset;
      }
      continue;
    }
    if (placed && offset == lastOffset) {
      continue;
    }

    const usize gap = offset > end ? offset - end : 0;
    placements.push_back(Placement{index, gap});
    end += gap + sizes[index];

    placed = true;
    lastOffset = offset;
  }

  regionEnd = end;
  return placements;
}

} // namespace RetroPak::strg
