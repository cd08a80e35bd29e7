#include <gtest/gtest.h>

#include "app/video/FrameReassembler.hpp"

using Vision::FrameOrderGuard;


TEST(FrameOrderGuard, SerialComparison) {
    EXPECT_TRUE(FrameOrderGuard::isNewer(2, 1));
    EXPECT_FALSE(FrameOrderGuard::isNewer(1, 2));
    EXPECT_FALSE(FrameOrderGuard::isNewer(7, 7));

    // Across the wrap
    EXPECT_TRUE(FrameOrderGuard::isNewer(0, 65535));
    EXPECT_TRUE(FrameOrderGuard::isNewer(3, 65530));
    EXPECT_FALSE(FrameOrderGuard::isNewer(65530, 3));

    // Half the space apart counts as older
    EXPECT_TRUE(FrameOrderGuard::isNewer(0x7FFF, 0));
    EXPECT_FALSE(FrameOrderGuard::isNewer(0x8000, 0));
}


TEST(FrameOrderGuard, DropsLateFrames) {
    const auto t0 = FrameOrderGuard::Clock::now();
    FrameOrderGuard guard;

    EXPECT_TRUE(guard.accept(10, t0));
    EXPECT_TRUE(guard.accept(12, t0));
    EXPECT_FALSE(guard.accept(11, t0));
    EXPECT_FALSE(guard.accept(12, t0));
    EXPECT_TRUE(guard.accept(13, t0));

    EXPECT_EQ(2u, guard.rejected());
    ASSERT_TRUE(guard.lastAccepted().has_value());
    EXPECT_EQ(13, *guard.lastAccepted());
}


TEST(FrameOrderGuard, ContinuesAcrossWrap) {
    const auto t0 = FrameOrderGuard::Clock::now();
    FrameOrderGuard guard;

    EXPECT_TRUE(guard.accept(65534, t0));
    EXPECT_TRUE(guard.accept(65535, t0));
    EXPECT_TRUE(guard.accept(0, t0));
    EXPECT_TRUE(guard.accept(1, t0));
    EXPECT_FALSE(guard.accept(65535, t0));
}


TEST(FrameOrderGuard, ResyncsAfterSilence) {
    const auto t0 = FrameOrderGuard::Clock::now();
    FrameOrderGuard guard(std::chrono::milliseconds(2000));

    EXPECT_TRUE(guard.accept(5000, t0));
    EXPECT_FALSE(guard.accept(1, t0 + std::chrono::milliseconds(1000)));

    // A restarted server counts from 1 again
    EXPECT_TRUE(guard.accept(1, t0 + std::chrono::milliseconds(2500)));
    EXPECT_TRUE(guard.accept(2, t0 + std::chrono::milliseconds(2510)));
}


TEST(FrameOrderGuard, ResetForgetsLastFrame) {
    FrameOrderGuard guard;
    EXPECT_TRUE(guard.accept(100));
    guard.reset();
    EXPECT_FALSE(guard.lastAccepted().has_value());
    EXPECT_TRUE(guard.accept(3));
}
