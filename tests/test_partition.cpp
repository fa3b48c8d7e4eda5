#include "minitest.hpp"
#include "core/Partition.hpp"
#include <cstdint>

using namespace blocksort::core;

TEST(block_length_zero_for_empty) {
  ASSERT_EQ(compute_block_length(0, BlockSortConfig{}), 0u);
}

// sqrt(10)/2 is tiny, so the floor of 16 wins
TEST(block_length_small_input_uses_floor) {
  ASSERT_EQ(compute_block_length(10, BlockSortConfig{}), 16u);
  ASSERT_EQ(compute_block_length(1, BlockSortConfig{}), 16u);
}

// floor(sqrt(n)/2) rounded up to a multiple of 64/8 = 8 elements
TEST(block_length_tracks_half_sqrt) {
  BlockSortConfig c{};
  ASSERT_EQ(compute_block_length(10000, c), 56u);      // 50 -> 56
  ASSERT_EQ(compute_block_length(1000000, c), 504u);   // 500 -> 504
  ASSERT_EQ(compute_block_length(1024, c), 16u);       // 16 stays 16
}

TEST(block_length_exact_integer_root) {
  BlockSortConfig c{};
  c.cache_line_bytes = 8;
  c.element_size = 8;
  c.min_block = 1;
  ASSERT_EQ(compute_block_length(99, c), 4u);    // sqrt 9.94 -> 9 -> 4
  ASSERT_EQ(compute_block_length(100, c), 5u);   // sqrt 10 -> 5
  ASSERT_EQ(compute_block_length(120, c), 5u);
  ASSERT_EQ(compute_block_length(121, c), 5u);   // sqrt 11 -> 5
  ASSERT_EQ(compute_block_length(144, c), 6u);
}

TEST(block_length_rounds_to_cache_line_multiple) {
  BlockSortConfig c = BlockSortConfig::for_element<int32_t>();
  ASSERT_EQ(c.element_size, 4u);
  ASSERT_EQ(elements_per_line(c), 16u);
  ASSERT_EQ(compute_block_length(10000, c), 64u);  // 50 -> 64
  ASSERT_EQ(compute_block_length(1000000, c) % 16, 0u);
}

TEST(block_length_degenerate_config_values) {
  BlockSortConfig c{};
  c.cache_line_bytes = 0;
  ASSERT_EQ(elements_per_line(c), 1u);
  ASSERT_EQ(compute_block_length(10000, c), 50u);

  BlockSortConfig z{};
  z.element_size = 0;  // treated as one byte
  ASSERT_EQ(elements_per_line(z), 64u);
  ASSERT_EQ(compute_block_length(10, z), 64u);

  BlockSortConfig m{};
  m.cache_line_bytes = 1;
  m.min_block = 0;
  ASSERT_EQ(compute_block_length(4, m), 1u);
}

TEST(block_length_huge_element_is_one_per_line) {
  BlockSortConfig c{};
  c.element_size = 256;
  ASSERT_EQ(elements_per_line(c), 1u);
  ASSERT_EQ(compute_block_length(1000000, c), 500u);
}

// rounding up from the top of the range must not wrap to zero
TEST(block_length_huge_min_block_saturates) {
  BlockSortConfig c{};
  c.min_block = SIZE_MAX;
  const size_t b = compute_block_length(1000, c);
  ASSERT_EQ(b, SIZE_MAX - 7);
  ASSERT_EQ(b % elements_per_line(c), 0u);
  ASSERT_EQ(partition(1000, b).size(), 1u);
}

TEST(partition_empty) {
  ASSERT_TRUE(partition(0, 16).empty());
}

TEST(partition_single_block_when_n_fits) {
  auto blocks = partition(10, 16);
  ASSERT_EQ(blocks.size(), 1u);
  ASSERT_EQ(blocks[0], (Block{0, 10}));

  auto exact = partition(16, 16);
  ASSERT_EQ(exact.size(), 1u);
  ASSERT_EQ(exact[0].length, 16u);

  auto zero_len = partition(5, 0);
  ASSERT_EQ(zero_len.size(), 1u);
  ASSERT_EQ(zero_len[0].length, 5u);
}

TEST(partition_covers_range_without_gaps) {
  const size_t n = 100;
  auto blocks = partition(n, 16);
  ASSERT_EQ(blocks.size(), 7u);
  size_t expect_start = 0;
  for (size_t i = 0; i < blocks.size(); ++i) {
    ASSERT_EQ(blocks[i].start, expect_start);
    if (i + 1 < blocks.size()) ASSERT_EQ(blocks[i].length, 16u);
    expect_start = blocks[i].end();
  }
  ASSERT_EQ(expect_start, n);
  ASSERT_EQ(blocks.back().length, 4u);
}

TEST(partition_exact_multiple_has_full_last_block) {
  auto blocks = partition(64, 16);
  ASSERT_EQ(blocks.size(), 4u);
  ASSERT_EQ(blocks.back(), (Block{48, 16}));
}

TEST(stage_names) {
  ASSERT_EQ(std::string(stage_name(SortStage::Unpartitioned)), "unpartitioned");
  ASSERT_EQ(std::string(stage_name(SortStage::RunsMarked)), "runs-marked");
  ASSERT_EQ(std::string(stage_name(SortStage::Done)), "done");
}
