#include "core/Partition.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace blocksort::core {

auto elements_per_line(const BlockSortConfig& config) noexcept -> size_t {
  const size_t elem = std::max<size_t>(1, config.element_size);
  return std::max<size_t>(1, config.cache_line_bytes / elem);
}

auto compute_block_length(size_t n, const BlockSortConfig& config) noexcept -> size_t {
  if (n == 0) return 0;
  const size_t per_line = elements_per_line(config);
  // floating estimate, then nudged to the exact integer root
  auto root = static_cast<size_t>(std::sqrt(static_cast<long double>(n)));
  while (root > 0 && root > n / root) --root;
  while (root + 1 <= n / (root + 1)) ++root;
  const size_t target = root / 2;

  size_t b = std::max({std::max<size_t>(1, config.min_block), per_line, target});
  if (b % per_line != 0) {
    const size_t up = per_line - (b % per_line);
    // near SIZE_MAX round down; the block still covers any n that fits
    b = (b > SIZE_MAX - up) ? b - (b % per_line) : b + up;
  }
  return b;
}

auto partition(size_t n, size_t block_length) -> std::vector<Block> {
  std::vector<Block> blocks;
  if (n == 0) return blocks;
  if (block_length == 0 || block_length >= n) {
    blocks.push_back({0, n});
    return blocks;
  }
  blocks.reserve((n + block_length - 1) / block_length);
  for (size_t start = 0; start < n; start += block_length) {
    blocks.push_back({start, std::min(block_length, n - start)});
  }
  return blocks;
}

} // namespace blocksort::core
