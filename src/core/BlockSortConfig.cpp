#include "core/BlockSortConfig.hpp"

namespace blocksort::core {

auto stage_name(SortStage s) noexcept -> const char* {
  switch (s) {
    case SortStage::Unpartitioned: return "unpartitioned";
    case SortStage::Partitioned:   return "partitioned";
    case SortStage::BlocksSorted:  return "blocks-sorted";
    case SortStage::RunsMarked:    return "runs-marked";
    case SortStage::Merged:        return "merged";
    case SortStage::Done:          return "done";
  }
  return "unknown";
}

} // namespace blocksort::core
