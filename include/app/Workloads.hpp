#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace blocksort::app {

// Input shapes used by the benchmark and the stress tests.
enum class Workload : uint8_t {
  Random,         // uniform in [0, n]
  NearlySorted,   // sorted, then n/10 random swaps
  ReverseSorted,  // n, n-1, ..., 1
  Duplicates      // uniform in [0, 100]
};

inline constexpr Workload kAllWorkloads[] = {
  Workload::Random, Workload::NearlySorted, Workload::ReverseSorted, Workload::Duplicates
};

[[nodiscard]] auto workload_name(Workload w) noexcept -> const char*;
[[nodiscard]] auto parse_workload(std::string_view name) -> std::optional<Workload>;

// Deterministic for a given (w, n, seed).
[[nodiscard]] auto make_workload(Workload w, size_t n, uint64_t seed) -> std::vector<int64_t>;

} // namespace blocksort::app
