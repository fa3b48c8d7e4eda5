#pragma once
#include <cstddef>
#include <cstdint>

namespace blocksort::core {

// Tuning passed explicitly into every sort call. Nothing here is global, so
// concurrent sorts with different tuning never see each other's values.
struct BlockSortConfig {
  size_t cache_line_bytes{64};
  size_t element_size{8};
  size_t min_block{16};   // floor for the block length

  template <class T>
  static constexpr auto for_element() noexcept -> BlockSortConfig {
    BlockSortConfig c{};
    c.element_size = sizeof(T);
    return c;
  }
};

// Pipeline states. Transitions are one-way, one per stage.
enum class SortStage : uint8_t {
  Unpartitioned,
  Partitioned,
  BlocksSorted,
  RunsMarked,
  Merged,
  Done
};

[[nodiscard]] auto stage_name(SortStage s) noexcept -> const char*;

struct SortStats {
  size_t n{0};
  size_t block_length{0};
  size_t block_count{0};
  size_t ordered_boundaries{0};
  size_t merge_sources{0};      // sources left after run coalescing
  size_t block_shifts{0};       // insertion shifts inside blocks
  size_t merge_rotations{0};
  size_t merge_moves{0};        // elements touched by rotations
  size_t corrective_repairs{0}; // shifts done by the final pass
  size_t aux_bytes{0};          // peak bookkeeping memory, excluding the input
  SortStage stage{SortStage::Unpartitioned};

  // wall time per stage (microseconds); zero when the run was not timed
  double partition_us{0.0};
  double block_sort_us{0.0};
  double run_detect_us{0.0};
  double merge_us{0.0};
  double corrective_us{0.0};
};

} // namespace blocksort::core
