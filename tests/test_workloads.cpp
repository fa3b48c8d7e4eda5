#include "minitest.hpp"
#include "app/Workloads.hpp"
#include <algorithm>
#include <string>

using namespace blocksort::app;

TEST(workload_names_round_trip) {
  for (auto w : kAllWorkloads) {
    auto parsed = parse_workload(workload_name(w));
    ASSERT_TRUE(parsed.has_value());
    ASSERT_TRUE(*parsed == w);
  }
  ASSERT_FALSE(parse_workload("sorted").has_value());
  ASSERT_EQ(std::string(workload_name(Workload::NearlySorted)), "nearly_sorted");
}

TEST(workload_deterministic_for_seed) {
  for (auto w : kAllWorkloads) {
    ASSERT_EQ(make_workload(w, 1000, 7), make_workload(w, 1000, 7));
    ASSERT_EQ(make_workload(w, 1000, 7).size(), 1000u);
  }
  ASSERT_NE(make_workload(Workload::Random, 1000, 7), make_workload(Workload::Random, 1000, 8));
}

TEST(workload_random_range) {
  auto v = make_workload(Workload::Random, 500, 1);
  ASSERT_TRUE(std::all_of(v.begin(), v.end(), [](int64_t x) { return x >= 0 && x <= 500; }));
}

TEST(workload_reverse_shape) {
  auto v = make_workload(Workload::ReverseSorted, 100, 0);
  ASSERT_EQ(v.front(), 100);
  ASSERT_EQ(v.back(), 1);
  ASSERT_TRUE(std::is_sorted(v.rbegin(), v.rend()));
}

TEST(workload_duplicates_range) {
  auto v = make_workload(Workload::Duplicates, 5000, 3);
  ASSERT_TRUE(std::all_of(v.begin(), v.end(), [](int64_t x) { return x >= 0 && x <= 100; }));
  std::sort(v.begin(), v.end());
  auto distinct = std::unique(v.begin(), v.end()) - v.begin();
  ASSERT_TRUE(distinct <= 101);
}

// n/10 swaps can break at most four adjacent pairs each
TEST(workload_nearly_sorted_has_few_descents) {
  const size_t n = 10000;
  auto v = make_workload(Workload::NearlySorted, n, 4);
  size_t descents = 0;
  for (size_t i = 1; i < v.size(); ++i) if (v[i] < v[i - 1]) ++descents;
  ASSERT_TRUE(descents > 0);
  ASSERT_TRUE(descents <= 4 * (n / 10));
}

TEST(workload_empty) {
  for (auto w : kAllWorkloads) ASSERT_TRUE(make_workload(w, 0, 1).empty());
}
