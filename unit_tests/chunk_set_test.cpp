/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "chunk/chunk_set.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <string>

using namespace dgen;

TEST(ChunkSetTest, ParsesSingleIdsAndRanges) {
  ChunkSet chunks = parse_chunk_list("0:3,10,7", ',');
  EXPECT_EQ(chunks, (ChunkSet{0, 1, 2, 3, 7, 10}));
}

TEST(ChunkSetTest, RangeBoundsMayBeReversed) {
  EXPECT_EQ(parse_chunk_list("5:2", ','), (ChunkSet{2, 3, 4, 5}));
}

TEST(ChunkSetTest, SkipsBlankElementsAndWhitespace) {
  EXPECT_EQ(parse_chunk_list("\n 4 \n\n  1:2\n", '\n'), (ChunkSet{1, 2, 4}));
  EXPECT_TRUE(parse_chunk_list("", ',').empty());
  EXPECT_TRUE(parse_chunk_list(" , ,", ',').empty());
}

TEST(ChunkSetTest, RejectsMalformedElements) {
  EXPECT_THROW(parse_chunk_list("abc", ','), std::invalid_argument);
  EXPECT_THROW(parse_chunk_list("1:2:3", ','), std::invalid_argument);
  EXPECT_THROW(parse_chunk_list("4x", ','), std::invalid_argument);
  EXPECT_THROW(parse_chunk_list("-3", ','), std::invalid_argument);
  EXPECT_THROW(parse_chunk_list("1:", ','), std::invalid_argument);
}

TEST(ChunkSetTest, RangeEndingAtLargestIdDoesNotOverflow) {
  const ChunkId max_id = std::numeric_limits<ChunkId>::max();
  std::string raw = std::to_string(max_id - 2) + ":" + std::to_string(max_id);
  EXPECT_EQ(parse_chunk_list(raw, ','), (ChunkSet{max_id - 2, max_id - 1, max_id}));
  EXPECT_EQ(parse_chunk_list(std::to_string(max_id), ','), (ChunkSet{max_id}));
}

TEST(ChunkSetTest, RejectsOversizedRanges) {
  EXPECT_THROW(parse_chunk_list("0:" + std::to_string(std::numeric_limits<ChunkId>::max()), ','),
               std::invalid_argument);
  EXPECT_THROW(parse_chunk_list("0:" + std::to_string(MAX_RANGE_SPAN), ','),
               std::invalid_argument);
}

TEST(ChunkSetTest, FormatHasNoTrailingSeparator) {
  EXPECT_EQ(format_chunk_list({3, 1, 2}, '\n'), "1\n2\n3");
  EXPECT_EQ(format_chunk_list({}, '\n'), "");
  EXPECT_EQ(format_chunk_list({8}, ','), "8");
}

TEST(ChunkSetTest, SummaryTruncatesLongSets) {
  EXPECT_EQ(summarize_chunks({1, 2, 3}), "{1,2,3} (3)");
  EXPECT_EQ(summarize_chunks({}), "{} (0)");
  EXPECT_EQ(summarize_chunks({1, 2, 3, 4}, 2), "{1,2,...} (4)");
}

TEST(ChunkSetTest, SetOperations) {
  ChunkSet a{1, 2, 3, 4};
  ChunkSet b{3, 4, 5};
  EXPECT_EQ(set_difference(a, b), (ChunkSet{1, 2}));
  EXPECT_EQ(set_intersection(a, b), (ChunkSet{3, 4}));
  EXPECT_EQ(to_chunk_set({4, 4, 1}), (ChunkSet{1, 4}));
}
