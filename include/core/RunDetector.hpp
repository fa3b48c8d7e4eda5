#pragma once
#include <cstddef>
#include <vector>
#include "core/Partition.hpp"

namespace blocksort::core {

// ============================================================================
// RUN DETECTION (block boundaries already in merge order)
// ============================================================================
// After every block is sorted, boundary i (between blocks i and i+1) is
// ordered when the last element of block i is not greater than the first
// element of block i+1. One scan, k-1 markers, no mutation.
template <class RandomIt>
auto mark_runs(RandomIt first, const std::vector<Block>& blocks) -> std::vector<bool> {
  std::vector<bool> ordered;
  if (blocks.size() < 2) return ordered;
  ordered.reserve(blocks.size() - 1);
  for (size_t i = 0; i + 1 < blocks.size(); ++i) {
    const auto& tail = *(first + (blocks[i].end() - 1));
    const auto& head = *(first + blocks[i + 1].start);
    ordered.push_back(!(head < tail));
  }
  return ordered;
}

[[nodiscard]] auto count_ordered(const std::vector<bool>& markers) noexcept -> size_t;

// Fuses every maximal chain of ordered boundaries into one span, giving the
// merge sources. All boundaries ordered -> a single source covering [0, n).
[[nodiscard]] auto coalesce_runs(const std::vector<Block>& blocks,
                                 const std::vector<bool>& markers) -> std::vector<Block>;

} // namespace blocksort::core
