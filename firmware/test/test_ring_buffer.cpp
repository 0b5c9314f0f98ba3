// test_ring_buffer.cpp

#include <gtest/gtest.h>

#include "ring_buffer.h"

TEST(RingBuffer, PushRejectsWhenFull) {
    RingBuffer<int, 3> buffer;
    EXPECT_TRUE(buffer.push(1));
    EXPECT_TRUE(buffer.push(2));
    EXPECT_TRUE(buffer.push(3));
    EXPECT_FALSE(buffer.push(4));
    EXPECT_EQ(3u, buffer.size());
    EXPECT_EQ(0u, buffer.overruns());

    int value = 0;
    ASSERT_TRUE(buffer.pop(value));
    EXPECT_EQ(1, value);
}

TEST(RingBuffer, PushOverwriteKeepsNewestInOrder) {
    RingBuffer<int, 2> buffer;
    for (int i = 1; i <= 5; i++) {
        buffer.pushOverwrite(i);
    }
    EXPECT_EQ(2u, buffer.size());
    EXPECT_EQ(3u, buffer.overruns());

    int value = 0;
    ASSERT_TRUE(buffer.pop(value));
    EXPECT_EQ(4, value);
    ASSERT_TRUE(buffer.pop(value));
    EXPECT_EQ(5, value);
    EXPECT_FALSE(buffer.pop(value));
}

TEST(RingBuffer, PeekDoesNotConsume) {
    RingBuffer<int, 4> buffer;
    int value = 0;
    EXPECT_FALSE(buffer.peek(value));

    buffer.push(7);
    buffer.push(8);
    ASSERT_TRUE(buffer.peek(value));
    EXPECT_EQ(7, value);
    EXPECT_EQ(2u, buffer.size());
}

TEST(RingBuffer, WrapsAroundAndClears) {
    RingBuffer<int, 3> buffer;
    int value = 0;
    for (int round = 0; round < 10; round++) {
        ASSERT_TRUE(buffer.push(round));
        ASSERT_TRUE(buffer.push(round + 100));
        ASSERT_TRUE(buffer.pop(value));
        EXPECT_EQ(round, value);
        ASSERT_TRUE(buffer.pop(value));
        EXPECT_EQ(round + 100, value);
    }
    EXPECT_TRUE(buffer.empty());

    buffer.push(1);
    buffer.push(2);
    buffer.clear();
    EXPECT_TRUE(buffer.empty());
    EXPECT_FALSE(buffer.pop(value));
}
