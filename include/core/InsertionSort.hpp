#pragma once
#include <cstddef>
#include <iterator>
#include <utility>

namespace blocksort::core {

// Linear insertion sort over [first, last) using operator<.
// Each comparison moves an element by at most one slot, so a range that is
// already ordered costs n-1 comparisons and no moves.
// Returns the number of single-slot shifts performed.
template <class RandomIt>
auto insertion_sort(RandomIt first, RandomIt last) -> size_t {
  size_t shifts = 0;
  if (last - first < 2) return shifts;
  for (auto it = first + 1; it != last; ++it) {
    if (!(*it < *(it - 1))) continue;
    auto value = std::move(*it);
    auto hole = it;
    do {
      *hole = std::move(*(hole - 1));
      --hole;
      ++shifts;
    } while (hole != first && value < *(hole - 1));
    *hole = std::move(value);
  }
  return shifts;
}

} // namespace blocksort::core
