#include <gtest/gtest.h>

#include "app/video/StreamStats.hpp"

using Vision::StreamStats;


TEST(StreamStats, AveragesOverSession) {
    const auto t0 = StreamStats::Clock::now();
    StreamStats stats(t0);

    for (int i = 0; i < 20; i++) {
        stats.recordFrame(1024 * 1024, t0 + std::chrono::milliseconds(100 * i));
    }

    const auto s = stats.snapshot(t0 + std::chrono::seconds(2));
    EXPECT_EQ(20u, s.frames);
    EXPECT_EQ(20u * 1024 * 1024, s.bytes);
    EXPECT_DOUBLE_EQ(2.0, s.elapsedSec);
    EXPECT_DOUBLE_EQ(10.0, s.averageFps);
    EXPECT_DOUBLE_EQ(10.0, s.bandwidthMBs);
}


TEST(StreamStats, InstantRateUpdatesEverySecond) {
    const auto t0 = StreamStats::Clock::now();
    StreamStats stats(t0);

    // Nothing is reported until a full window has elapsed
    for (int i = 1; i <= 5; i++) {
        stats.recordFrame(10, t0 + std::chrono::milliseconds(150 * i));
    }
    EXPECT_DOUBLE_EQ(0.0, stats.snapshot(t0 + std::chrono::milliseconds(800)).instantFps);

    stats.recordFrame(10, t0 + std::chrono::milliseconds(1000));
    EXPECT_DOUBLE_EQ(6.0, stats.snapshot(t0 + std::chrono::milliseconds(1000)).instantFps);
}


TEST(StreamStats, ResetClearsCounters) {
    const auto t0 = StreamStats::Clock::now();
    StreamStats stats(t0);
    stats.recordFrame(100, t0 + std::chrono::seconds(1));

    stats.reset(t0 + std::chrono::seconds(5));
    const auto s = stats.snapshot(t0 + std::chrono::seconds(5));
    EXPECT_EQ(0u, s.frames);
    EXPECT_EQ(0u, s.bytes);
    EXPECT_DOUBLE_EQ(0.0, s.averageFps);
    EXPECT_DOUBLE_EQ(0.0, s.instantFps);
}
