#include <gtest/gtest.h>
#include "dag/chunker.hpp"
#include "dag/dag_error.hpp"
#include "test_utils.hpp"

using namespace dagsync;
using namespace dagsync::dag;

class ChunkerTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::init_logging();
  }

  static std::vector<Bytes> collect(io::ByteStream& input, std::size_t chunk_size) {
    Chunker chunker(input, chunk_size);
    std::vector<Bytes> segments;
    Bytes segment;
    while (chunker.next(segment)) {
      segments.push_back(segment);
    }
    return segments;
  }
};

TEST_F(ChunkerTest, EmptyInputYieldsOneEmptySegment) {
  test::PieceStream input({}, 16);
  auto segments = collect(input, 8);

  ASSERT_EQ(segments.size(), 1u);
  EXPECT_TRUE(segments[0].empty());
}

TEST_F(ChunkerTest, ExactMultipleHasNoTrailingEmptySegment) {
  test::PieceStream input(test::random_bytes(32), 5);
  auto segments = collect(input, 8);

  ASSERT_EQ(segments.size(), 4u);
  for (const auto& segment : segments) {
    EXPECT_EQ(segment.size(), 8u);
  }
}

TEST_F(ChunkerTest, LastSegmentMayBeShorter) {
  Bytes data = test::random_bytes(21);
  test::PieceStream input(data, 4);
  auto segments = collect(input, 8);

  ASSERT_EQ(segments.size(), 3u);
  EXPECT_EQ(segments[0].size(), 8u);
  EXPECT_EQ(segments[1].size(), 8u);
  EXPECT_EQ(segments[2].size(), 5u);

  Bytes joined;
  for (const auto& segment : segments) {
    joined.insert(joined.end(), segment.begin(), segment.end());
  }
  EXPECT_EQ(joined, data);
}

TEST_F(ChunkerTest, BoundariesIgnoreInputPieceSizes) {
  Bytes data = test::random_bytes(1000, 7);

  for (std::size_t piece : {1u, 3u, 64u, 999u, 4096u}) {
    test::PieceStream input(data, piece);
    auto segments = collect(input, 100);
    ASSERT_EQ(segments.size(), 10u) << "piece size " << piece;
    for (std::size_t i = 0; i < segments.size(); ++i) {
      EXPECT_EQ(segments[i], Bytes(data.begin() + i * 100, data.begin() + (i + 1) * 100));
    }
  }
}

TEST_F(ChunkerTest, NotRestartable) {
  test::PieceStream input(test::random_bytes(10), 10);
  Chunker chunker(input, 4);

  Bytes segment;
  std::size_t count = 0;
  while (chunker.next(segment)) {
    ++count;
  }
  std::size_t reads = input.reads();

  EXPECT_EQ(count, 3u);
  EXPECT_FALSE(chunker.next(segment));
  EXPECT_FALSE(chunker.next(segment));
  EXPECT_EQ(input.reads(), reads);
  EXPECT_EQ(chunker.bytes_consumed(), 10u);
  EXPECT_EQ(chunker.segments_emitted(), 3u);
}

TEST_F(ChunkerTest, ZeroChunkSizeIsConfigError) {
  test::PieceStream input(test::random_bytes(10), 10);
  EXPECT_THROW(Chunker chunker(input, 0), ConfigError);
}
