#include <gtest/gtest.h>

#include <string>

#include "Modules/RcMessageLib.hpp"

using Msg::CircularBuffer;


TEST(CircularBuffer, FifoOrder) {
    CircularBuffer<int> buf(3);
    EXPECT_TRUE(buf.isEmpty());

    buf.push(1);
    buf.push(2);
    EXPECT_EQ(2u, buf.size());
    EXPECT_EQ(2, buf.getHead());
    EXPECT_EQ(1, buf[0]);

    EXPECT_EQ(1, buf.pop());
    EXPECT_EQ(2, buf.pop());
    EXPECT_TRUE(buf.isEmpty());
    EXPECT_THROW(buf.pop(), std::out_of_range);
}


TEST(CircularBuffer, OverwritesOldestWhenFull) {
    CircularBuffer<int> buf(2);
    buf.push(1);
    buf.push(2);
    EXPECT_TRUE(buf.isFull());

    buf.push(3);
    EXPECT_EQ(2u, buf.size());
    EXPECT_EQ(2, buf[0]);
    EXPECT_EQ(3, buf[1]);
    EXPECT_EQ(3, buf.getHead());
    EXPECT_THROW(buf[2], std::out_of_range);
}


TEST(CircularBuffer, FlushEmpties) {
    CircularBuffer<int> buf(4);
    buf.push(7);
    buf.push(8);
    buf.flush();
    EXPECT_TRUE(buf.isEmpty());
    EXPECT_EQ(4u, buf.capacity());
    EXPECT_THROW(buf.getHead(), std::out_of_range);

    buf.push(9);
    EXPECT_EQ(9, buf.getHead());
}


TEST(CircularBuffer, ZeroCapacityThrows) {
    EXPECT_THROW(CircularBuffer<int>(0), std::invalid_argument);
}


TEST(CircularBuffer, PushReportsOverwrite) {
    CircularBuffer<int> buf(2);
    EXPECT_FALSE(buf.push(1));
    EXPECT_FALSE(buf.push(2));
    EXPECT_TRUE(buf.push(3));
}


TEST(CircularBuffer, TakeNewestDiscardsOlder) {
    CircularBuffer<std::string> buf(3);
    size_t skipped = 99;
    EXPECT_FALSE(buf.takeNewest(skipped).has_value());
    EXPECT_EQ(0u, skipped);

    buf.push("a");
    buf.push("b");
    buf.push("c");
    auto newest = buf.takeNewest(skipped);
    ASSERT_TRUE(newest.has_value());
    EXPECT_EQ("c", *newest);
    EXPECT_EQ(2u, skipped);
    EXPECT_TRUE(buf.isEmpty());
}
