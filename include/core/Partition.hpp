#pragma once
#include <cstddef>
#include <vector>
#include "core/BlockSortConfig.hpp"

namespace blocksort::core {

// Non-owning view over [start, start + length) of the sequence.
struct Block {
  size_t start;
  size_t length;

  [[nodiscard]] size_t end() const noexcept { return start + length; }
  bool operator==(const Block&) const = default;
};

// Elements of config.element_size bytes that fit one cache line (at least 1).
[[nodiscard]] auto elements_per_line(const BlockSortConfig& config) noexcept -> size_t;

// Block length for a sequence of n elements:
//   max(min_block, elements_per_line, floor(sqrt(n) / 2)), rounded up to a
//   multiple of elements_per_line. Zero for n == 0.
[[nodiscard]] auto compute_block_length(size_t n, const BlockSortConfig& config) noexcept -> size_t;

// Blocks of block_length covering [0, n) in order; the last one holds the
// remainder. Empty for n == 0. block_length == 0 with n > 0 yields one block.
[[nodiscard]] auto partition(size_t n, size_t block_length) -> std::vector<Block>;

} // namespace blocksort::core
