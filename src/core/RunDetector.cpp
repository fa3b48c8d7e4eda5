#include "core/RunDetector.hpp"
#include <algorithm>

namespace blocksort::core {

auto count_ordered(const std::vector<bool>& markers) noexcept -> size_t {
  return static_cast<size_t>(std::count(markers.begin(), markers.end(), true));
}

auto coalesce_runs(const std::vector<Block>& blocks,
                   const std::vector<bool>& markers) -> std::vector<Block> {
  std::vector<Block> sources;
  if (blocks.empty()) return sources;
  sources.reserve(blocks.size());
  Block current = blocks.front();
  for (size_t i = 1; i < blocks.size(); ++i) {
    // missing marker counts as "not ordered"
    if (i - 1 < markers.size() && markers[i - 1]) {
      current.length += blocks[i].length;
    } else {
      sources.push_back(current);
      current = blocks[i];
    }
  }
  sources.push_back(current);
  return sources;
}

} // namespace blocksort::core
