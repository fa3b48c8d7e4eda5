#include "app/Workloads.hpp"
#include <algorithm>
#include <random>

namespace blocksort::app {

auto workload_name(Workload w) noexcept -> const char* {
  switch (w) {
    case Workload::Random:        return "random";
    case Workload::NearlySorted:  return "nearly_sorted";
    case Workload::ReverseSorted: return "reverse_sorted";
    case Workload::Duplicates:    return "duplicates";
  }
  return "unknown";
}

auto parse_workload(std::string_view name) -> std::optional<Workload> {
  for (auto w : kAllWorkloads) {
    if (name == workload_name(w)) return w;
  }
  return std::nullopt;
}

auto make_workload(Workload w, size_t n, uint64_t seed) -> std::vector<int64_t> {
  std::vector<int64_t> out;
  out.reserve(n);
  std::mt19937_64 rng(seed);

  switch (w) {
    case Workload::Random: {
      std::uniform_int_distribution<int64_t> dist(0, static_cast<int64_t>(n));
      for (size_t i = 0; i < n; ++i) out.push_back(dist(rng));
      break;
    }
    case Workload::NearlySorted: {
      std::uniform_int_distribution<int64_t> dist(0, static_cast<int64_t>(n));
      for (size_t i = 0; i < n; ++i) out.push_back(dist(rng));
      std::sort(out.begin(), out.end());
      if (n > 1) {
        std::uniform_int_distribution<size_t> pick(0, n - 1);
        for (size_t s = 0; s < n / 10; ++s) {
          size_t a = pick(rng);
          size_t b = pick(rng);
          std::swap(out[a], out[b]);
        }
      }
      break;
    }
    case Workload::ReverseSorted:
      for (size_t i = n; i > 0; --i) out.push_back(static_cast<int64_t>(i));
      break;
    case Workload::Duplicates: {
      std::uniform_int_distribution<int64_t> dist(0, 100);
      for (size_t i = 0; i < n; ++i) out.push_back(dist(rng));
      break;
    }
  }
  return out;
}

} // namespace blocksort::app
