#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "transfer/progress_channel.hpp"
#include "test_utils.hpp"

using namespace dagsync;
using namespace dagsync::transfer;

class ProgressChannelTest : public ::testing::Test {
protected:
  ProgressChannel channel{Direction::Uploading};

  void SetUp() override {
    test::init_logging();
  }
};

TEST_F(ProgressChannelTest, EmptyInitially) {
  ProgressEvent event;
  EXPECT_TRUE(channel.empty());
  EXPECT_FALSE(channel.consume(event));
  EXPECT_FALSE(channel.finished());
  EXPECT_FALSE(channel.cancelled());
}

TEST_F(ProgressChannelTest, UnreadProgressIsCoalesced) {
  channel.set_total(100);
  channel.advance(10);
  channel.advance(20);
  channel.advance(30);
  EXPECT_EQ(channel.size(), 1u);

  ProgressEvent event;
  ASSERT_TRUE(channel.consume(event));
  EXPECT_EQ(event.kind, EventKind::Progress);
  EXPECT_EQ(event.direction, Direction::Uploading);
  EXPECT_EQ(event.processed_bytes, 60u);
  EXPECT_EQ(event.total_bytes, 100u);
  EXPECT_DOUBLE_EQ(event.percent(), 60.0);
}

TEST_F(ProgressChannelTest, TerminalEventIsKeptAfterProgress) {
  channel.advance(5);
  dag::Cid cid = test::fake_cid(dag::Codec::Metadata);
  channel.succeed(cid);
  channel.advance(5);
  channel.fail("too late");

  ProgressEvent event;
  ASSERT_TRUE(channel.consume(event));
  EXPECT_EQ(event.kind, EventKind::Progress);
  ASSERT_TRUE(channel.consume(event));
  EXPECT_EQ(event.kind, EventKind::Success);
  ASSERT_TRUE(event.cid.has_value());
  EXPECT_EQ(*event.cid, cid);
  EXPECT_EQ(event.processed_bytes, 5u);
  EXPECT_FALSE(channel.consume(event));
  EXPECT_TRUE(channel.finished());
}

TEST_F(ProgressChannelTest, OnlyFirstTerminalEventCounts) {
  channel.fail("first");
  channel.fail("second");
  channel.succeed();

  ProgressEvent event = channel.wait_finished();
  EXPECT_EQ(event.kind, EventKind::Failure);
  EXPECT_EQ(event.error, "first");
  EXPECT_EQ(channel.size(), 1u);
}

TEST_F(ProgressChannelTest, PercentEdgeCases) {
  ProgressEvent event;
  EXPECT_DOUBLE_EQ(event.percent(), 0.0);
  event.kind = EventKind::Success;
  EXPECT_DOUBLE_EQ(event.percent(), 100.0);

  event.kind = EventKind::Progress;
  event.total_bytes = 10;
  event.processed_bytes = 30;
  EXPECT_DOUBLE_EQ(event.percent(), 100.0);
}

TEST_F(ProgressChannelTest, WaitConsumeTimesOut) {
  ProgressEvent event;
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(channel.wait_consume(event, std::chrono::milliseconds(50)));
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(40));
}

TEST_F(ProgressChannelTest, ProducerAndConsumerThreads) {
  const int steps = 1000;
  channel.set_total(steps);

  std::thread producer([this] {
    for (int i = 0; i < steps; ++i) {
      channel.advance(1);
    }
    channel.succeed();
  });

  ProgressEvent event;
  std::uint64_t last = 0;
  bool done = false;
  while (!done) {
    if (!channel.wait_consume(event, std::chrono::milliseconds(1000))) {
      continue;
    }
    EXPECT_GE(event.processed_bytes, last);
    last = event.processed_bytes;
    done = event.terminal();
  }
  producer.join();

  EXPECT_EQ(event.kind, EventKind::Success);
  EXPECT_EQ(last, static_cast<std::uint64_t>(steps));
  EXPECT_TRUE(channel.empty());
}

TEST_F(ProgressChannelTest, CancelIsSticky) {
  channel.cancel();
  channel.cancel();
  EXPECT_TRUE(channel.cancelled());
  EXPECT_FALSE(channel.finished());
}
