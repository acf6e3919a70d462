/**
 * @file test_frame_collector.cpp
 * @brief Unit tests for the best-frame collection window
 */

#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "collect/FrameCollector.hpp"
#include "test_helpers.hpp"

using namespace testutil;

namespace {

FaceCandidate candidate(float q, uint64_t seq)
{
    return FaceCandidate{ makeFace(), makeFrame(seq), q };
}

} // namespace

class FrameCollectorTest : public ::testing::Test {
protected:
    FakeClock clock;
    FrameCollector collector{ CollectorParams{}, clock.fn() };
};

TEST_F(FrameCollectorTest, HighWaterMarkWinsImmediately) {
    auto r = collector.process(candidate(0.95f, 1));

    ASSERT_TRUE(r.winner.has_value());
    EXPECT_EQ(r.winner->image.seq, 1u);
    EXPECT_DOUBLE_EQ(r.progress, 1.0);
    EXPECT_FALSE(collector.isCollecting());
}

TEST_F(FrameCollectorTest, ExactlyHighWaterMarkCounts) {
    auto r = collector.process(candidate(0.9f, 1));
    EXPECT_TRUE(r.winner.has_value());
}

TEST_F(FrameCollectorTest, AccumulatesUntilWindowExpires) {
    clock.set(0);
    auto r1 = collector.process(candidate(0.5f, 1));
    EXPECT_FALSE(r1.winner.has_value());
    EXPECT_DOUBLE_EQ(r1.progress, 0.0);
    EXPECT_TRUE(collector.isCollecting());

    clock.set(400);
    auto r2 = collector.process(candidate(0.8f, 2));
    EXPECT_FALSE(r2.winner.has_value());
    EXPECT_NEAR(r2.progress, 0.5, 1e-9);

    clock.set(799);
    auto r3 = collector.process(candidate(0.1f, 3));
    EXPECT_FALSE(r3.winner.has_value());
    EXPECT_LT(r3.progress, 1.0);

    clock.set(800);
    auto r4 = collector.process(candidate(0.2f, 4));
    ASSERT_TRUE(r4.winner.has_value());
    EXPECT_EQ(r4.winner->image.seq, 2u);
    EXPECT_FLOAT_EQ(r4.winner->quality, 0.8f);
    EXPECT_DOUBLE_EQ(r4.progress, 1.0);
    EXPECT_FALSE(collector.isCollecting());
}

TEST_F(FrameCollectorTest, HighWaterMarkAfterAccumulationEmitsIt) {
    collector.process(candidate(0.5f, 1));
    clock.advance(100);
    collector.process(candidate(0.8f, 2));
    clock.advance(100);

    auto r = collector.process(candidate(0.92f, 3));
    ASSERT_TRUE(r.winner.has_value());
    EXPECT_EQ(r.winner->image.seq, 3u);
}

TEST_F(FrameCollectorTest, EqualQualityKeepsFirstCandidate) {
    collector.process(candidate(0.6f, 1));
    clock.advance(100);
    collector.process(candidate(0.6f, 2));

    clock.set(1000);
    auto r = collector.process(candidate(0.1f, 3));
    ASSERT_TRUE(r.winner.has_value());
    EXPECT_EQ(r.winner->image.seq, 1u);
}

TEST_F(FrameCollectorTest, ResetIsIdempotentAndClearsWindow) {
    collector.process(candidate(0.5f, 1));
    ASSERT_TRUE(collector.isCollecting());

    collector.reset();
    EXPECT_FALSE(collector.isCollecting());
    EXPECT_DOUBLE_EQ(collector.progress(), 0.0);

    collector.reset();
    EXPECT_FALSE(collector.isCollecting());

    // 리셋 후 첫 후보는 새 창을 연다
    clock.advance(5000);
    auto r = collector.process(candidate(0.3f, 2));
    EXPECT_FALSE(r.winner.has_value());
    EXPECT_DOUBLE_EQ(r.progress, 0.0);
}

TEST_F(FrameCollectorTest, ProgressTracksElapsedTime) {
    EXPECT_DOUBLE_EQ(collector.progress(), 0.0);

    collector.process(candidate(0.5f, 1));
    clock.advance(200);
    EXPECT_NEAR(collector.progress(), 0.25, 1e-9);

    clock.advance(10000);
    EXPECT_LT(collector.progress(), 1.0);
}

TEST_F(FrameCollectorTest, CustomWindowAndHighWaterMark) {
    CollectorParams p;
    p.windowMs = 200;
    p.highWaterMark = 0.7f;
    FrameCollector c(p, clock.fn());

    EXPECT_TRUE(c.process(candidate(0.75f, 1)).winner.has_value());

    c.process(candidate(0.4f, 2));
    clock.advance(200);
    auto r = c.process(candidate(0.3f, 3));
    ASSERT_TRUE(r.winner.has_value());
    EXPECT_EQ(r.winner->image.seq, 2u);
}

TEST_F(FrameCollectorTest, ConcurrentProcessAndResetStayConsistent) {
    constexpr int kIterations = 2000;
    std::atomic<bool> done{false};
    std::atomic<int> winners{0};
    std::atomic<int> badWinners{0};
    std::atomic<int> badProgress{0};

    std::thread producer([&] {
        for (int i = 1; i <= kIterations; ++i) {
            clock.advance(7);
            const float q = static_cast<float>(i % 10) / 10.0f;		// 0.0 .. 0.9
            auto r = collector.process(candidate(q, static_cast<uint64_t>(i)));
            if (r.winner) {
                winners.fetch_add(1);
                if (r.winner->image.empty() || r.winner->image.seq == 0) badWinners.fetch_add(1);
            }
            if (r.progress < 0.0 || r.progress > 1.0) badProgress.fetch_add(1);
        }
        done.store(true);
    });

    std::thread resetter([&] {
        while (!done.load()) {
            collector.reset();
            const double p = collector.progress();
            if (p < 0.0 || p >= 1.0) badProgress.fetch_add(1);
            collector.isCollecting();
        }
    });

    producer.join();
    resetter.join();

    EXPECT_GT(winners.load(), 0);
    EXPECT_EQ(badWinners.load(), 0);
    EXPECT_EQ(badProgress.load(), 0);

    // 정지 상태에서는 두 값이 일치해야 한다
    if (collector.isCollecting()) {
        EXPECT_GE(collector.progress(), 0.0);
    } else {
        EXPECT_DOUBLE_EQ(collector.progress(), 0.0);
    }
    collector.reset();
    EXPECT_FALSE(collector.isCollecting());
    EXPECT_DOUBLE_EQ(collector.progress(), 0.0);
}
