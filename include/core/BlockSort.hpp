#pragma once
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iterator>
#include <vector>
#include "core/BlockSortConfig.hpp"
#include "core/HeapMerge.hpp"
#include "core/InsertionSort.hpp"
#include "core/Partition.hpp"
#include "core/RunDetector.hpp"

namespace blocksort::core {

// In-place, cache-blocked sort over [first, last) using operator<.
//
//   Unpartitioned -> Partitioned    blocks of compute_block_length(n, config)
//   Partitioned   -> BlocksSorted   insertion sort inside each block
//   BlocksSorted  -> RunsMarked     ordered block boundaries marked
//   RunsMarked    -> Merged         runs coalesced, k-way heap merge
//   Merged        -> Done           full insertion pass over [first, last)
//
// The last pass always runs: it is a linear scan when the merge left the
// sequence sorted and repairs any residual disorder otherwise.
//
// Extra memory is O(k), k = number of blocks. Equal elements may be
// reordered.
template <class RandomIt>
class BlockSortPipeline {
public:
  // 'timed' fills the per-stage *_us fields of stats().
  BlockSortPipeline(RandomIt first, RandomIt last, const BlockSortConfig& config = {},
                    bool timed = true)
      : first_(first), last_(last), config_(config), timed_(timed) {
    stats_.n = static_cast<size_t>(std::distance(first, last));
  }

  // Runs the next stage. Returns false once the pipeline is Done.
  bool step() {
    using clock = std::chrono::steady_clock;
    clock::time_point t0;
    if (timed_) t0 = clock::now();
    auto elapsed_us = [&]() -> double {
      if (!timed_) return 0.0;
      return std::chrono::duration<double, std::micro>(clock::now() - t0).count();
    };
    switch (stage_) {
      case SortStage::Unpartitioned:
        partition_stage();
        stats_.partition_us = elapsed_us();
        stage_ = SortStage::Partitioned;
        break;
      case SortStage::Partitioned:
        block_sort_stage();
        stats_.block_sort_us = elapsed_us();
        stage_ = SortStage::BlocksSorted;
        break;
      case SortStage::BlocksSorted:
        run_detect_stage();
        stats_.run_detect_us = elapsed_us();
        stage_ = SortStage::RunsMarked;
        break;
      case SortStage::RunsMarked:
        merge_stage();
        stats_.merge_us = elapsed_us();
        stage_ = SortStage::Merged;
        break;
      case SortStage::Merged:
        stats_.corrective_repairs = insertion_sort(first_, last_);
        stats_.corrective_us = elapsed_us();
        stage_ = SortStage::Done;
        break;
      case SortStage::Done:
        return false;
    }
    stats_.stage = stage_;
    return true;
  }

  void run() {
    while (step()) {}
  }

  [[nodiscard]] SortStage stage() const noexcept { return stage_; }
  [[nodiscard]] const std::vector<Block>& blocks() const noexcept { return blocks_; }
  [[nodiscard]] const std::vector<bool>& run_markers() const noexcept { return markers_; }
  [[nodiscard]] const std::vector<Block>& sources() const noexcept { return sources_; }
  [[nodiscard]] const SortStats& stats() const noexcept { return stats_; }

private:
  void partition_stage() {
    stats_.block_length = compute_block_length(stats_.n, config_);
    blocks_ = partition(stats_.n, stats_.block_length);
    stats_.block_count = blocks_.size();
    update_aux(0);
  }

  void block_sort_stage() {
    for (const auto& b : blocks_) {
      stats_.block_shifts += insertion_sort(first_ + b.start, first_ + b.end());
    }
  }

  void run_detect_stage() {
    markers_ = mark_runs(first_, blocks_);
    stats_.ordered_boundaries = count_ordered(markers_);
    update_aux(0);
  }

  void merge_stage() {
    sources_ = coalesce_runs(blocks_, markers_);
    stats_.merge_sources = sources_.size();
    update_aux(0);
    // one source: every boundary ordered, nothing to merge
    if (sources_.size() < 2) return;
    auto r = heap_merge(first_, sources_);
    stats_.merge_rotations = r.rotations;
    stats_.merge_moves = r.moves;
    update_aux(r.aux_bytes);
  }

  // Block tables and markers stay alive until the pipeline ends, so the peak
  // is their sum plus whatever the current stage holds on top.
  void update_aux(size_t stage_bytes) {
    const size_t held = (blocks_.size() + sources_.size()) * sizeof(Block) + (markers_.size() + 7) / 8;
    stats_.aux_bytes = std::max(stats_.aux_bytes, held + stage_bytes);
  }

  RandomIt first_;
  RandomIt last_;
  BlockSortConfig config_;
  bool timed_;
  SortStage stage_{SortStage::Unpartitioned};
  std::vector<Block> blocks_;
  std::vector<bool> markers_;
  std::vector<Block> sources_;
  SortStats stats_{};
};

template <class RandomIt>
void block_sort(RandomIt first, RandomIt last, const BlockSortConfig& config = {},
                SortStats* stats = nullptr) {
  // empty and single-element input is already sorted
  if (std::distance(first, last) < 2) {
    if (stats) {
      *stats = SortStats{};
      stats->n = static_cast<size_t>(std::distance(first, last));
      stats->stage = SortStage::Done;
    }
    return;
  }
  BlockSortPipeline<RandomIt> pipeline(first, last, config, stats != nullptr);
  pipeline.run();
  if (stats) *stats = pipeline.stats();
}

template <class Container>
void block_sort(Container& c, const BlockSortConfig& config = {}, SortStats* stats = nullptr) {
  block_sort(std::begin(c), std::end(c), config, stats);
}

} // namespace blocksort::core
