#pragma once
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <vector>
#include "core/Partition.hpp"

namespace blocksort::core {

namespace detail {

// ============================================================================
// GALLOP RIGHT (rightmost insertion point via exponential search)
// ============================================================================
// Position in [base, base+len) where key inserts after any equal elements.
// Returns k such that base[k-1] <= key < base[k].
// Starts at 'hint', gallops outward exponentially, then binary searches.
template <class RandomIt, class T>
auto gallop_right(const T& key, RandomIt base, size_t len, size_t hint) -> size_t {
  if (len == 0) return 0;
  size_t last_ofs = 0;
  size_t ofs = 1;

  if (key < *(base + hint)) {
    // key < base[hint], search left
    size_t max_ofs = hint + 1;
    while (ofs < max_ofs && key < *(base + hint - ofs)) {
      last_ofs = ofs;
      ofs = (ofs << 1) + 1;
      if (ofs <= last_ofs) ofs = max_ofs;
    }
    if (ofs > max_ofs) ofs = max_ofs;

    size_t tmp = last_ofs;
    last_ofs = (ofs > hint) ? 0 : hint - ofs;
    ofs = hint - tmp;
  } else {
    // key >= base[hint], search right
    size_t max_ofs = len - hint;
    while (ofs < max_ofs && !(key < *(base + hint + ofs))) {
      last_ofs = ofs;
      ofs = (ofs << 1) + 1;
      if (ofs <= last_ofs) ofs = max_ofs; // overflow
    }
    if (ofs > max_ofs) ofs = max_ofs;

    last_ofs += hint;
    ofs += hint;
  }

  while (last_ofs < ofs) {
    size_t mid = last_ofs + ((ofs - last_ofs) >> 1);
    if (key < *(base + mid)) {
      ofs = mid;
    } else {
      last_ofs = mid + 1;
    }
  }

  return ofs;
}

} // namespace detail

struct MergeResult {
  size_t rotations{0};
  size_t moves{0};
  size_t aux_bytes{0};  // heap, cursors and ends
};

// ============================================================================
// HEAP MERGE (k-way, in place, O(k) extra space)
// ============================================================================
// Merges sorted, contiguous sources that tile [0, n) in index order.
//
// The unconsumed parts of all sources always tile [write, n) in source
// order. When source j wins, the chunk of its elements not greater than the
// next heap minimum is rotated down to 'write'; every live source before j
// slides right by the chunk length and j's cursor advances past it. Nothing
// moves while the winner is the front source.
//
// Extra space: one heap entry per source, a cursor and an end per source.
// Comparisons O(n log k); element moves O(n^2) worst case (interleaved
// sources), zero when the sources are already in order.
//
// Equal heads leave the heap lowest source id first, and the chunk taken
// from the winner includes elements equal to the next minimum. Deterministic,
// not stable.
template <class RandomIt>
auto heap_merge(RandomIt first, const std::vector<Block>& sources) -> MergeResult {
  using value_type = typename std::iterator_traits<RandomIt>::value_type;

  MergeResult result;
  const size_t k = sources.size();
  if (k < 2) return result;

  struct HeapEntry {
    value_type head;
    size_t source;
  };
  // std heap algorithms keep the "largest" on top; invert for a min-heap
  auto later = [](const HeapEntry& a, const HeapEntry& b) {
    if (b.head < a.head) return true;
    if (a.head < b.head) return false;
    return a.source > b.source;
  };

  std::vector<size_t> cursor(k);
  std::vector<size_t> end(k);
  std::vector<HeapEntry> heap;
  heap.reserve(k);
  for (size_t i = 0; i < k; ++i) {
    cursor[i] = sources[i].start;
    end[i] = sources[i].end();
    if (cursor[i] < end[i]) heap.push_back(HeapEntry{*(first + cursor[i]), i});
  }
  std::make_heap(heap.begin(), heap.end(), later);
  result.aux_bytes = k * (sizeof(HeapEntry) + 2 * sizeof(size_t));

  size_t write = sources.front().start;
  size_t front = 0;  // lowest source id that may still hold elements

  while (!heap.empty()) {
    std::pop_heap(heap.begin(), heap.end(), later);
    const size_t j = heap.back().source;
    heap.pop_back();

    const size_t chunk_begin = cursor[j];
    size_t take = end[j] - chunk_begin;
    if (!heap.empty()) {
      take = detail::gallop_right(heap.front().head, first + chunk_begin, take, 0);
      // at least the head; only an inconsistent operator< reaches zero
      take = std::max<size_t>(1, take);
    }
    const size_t chunk_end = chunk_begin + take;

    if (chunk_begin != write) {
      std::rotate(first + write, first + chunk_begin, first + chunk_end);
      ++result.rotations;
      result.moves += chunk_end - write;
      for (size_t i = front; i < j; ++i) {
        cursor[i] += take;
        end[i] += take;
      }
    }
    cursor[j] = chunk_end;
    write += take;

    if (cursor[j] < end[j]) {
      heap.push_back(HeapEntry{*(first + cursor[j]), j});
      std::push_heap(heap.begin(), heap.end(), later);
    }
    while (front < k && cursor[front] == end[front]) ++front;
  }

  return result;
}

} // namespace blocksort::core
