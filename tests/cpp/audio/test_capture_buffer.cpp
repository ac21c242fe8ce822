/**
 * @file test_capture_buffer.cpp
 * @brief Unit tests for the lock-free SPSC capture buffer
 */

#include "audio/capture_buffer.h"

#include <atomic>
#include <gtest/gtest.h>
#include <numeric>
#include <stdexcept>
#include <thread>
#include <vector>

using voxcap::audio::CaptureBuffer;

TEST(CaptureBuffer, InitRejectsZeroCapacity) {
    CaptureBuffer buffer;
    EXPECT_THROW(buffer.init(0), std::invalid_argument);
}

TEST(CaptureBuffer, AppendThenDrainPreservesOrder) {
    CaptureBuffer buffer;
    buffer.init(16);
    std::vector<float> a = {1, 2, 3};
    std::vector<float> b = {4, 5};

    EXPECT_EQ(buffer.append(a.data(), a.size()), 3u);
    EXPECT_EQ(buffer.append(b.data(), b.size()), 2u);
    EXPECT_EQ(buffer.size(), 5u);

    auto out = buffer.drainAll();
    EXPECT_EQ(out, (std::vector<float>{1, 2, 3, 4, 5}));
    EXPECT_TRUE(buffer.empty());
}

TEST(CaptureBuffer, OverflowIsDroppedAndLatchesFull) {
    CaptureBuffer buffer;
    buffer.init(4);
    std::vector<float> data = {1, 2, 3, 4, 5, 6};

    EXPECT_EQ(buffer.append(data.data(), data.size()), 4u);
    EXPECT_TRUE(buffer.full());
    EXPECT_EQ(buffer.droppedSamples(), 2u);
    EXPECT_EQ(buffer.append(data.data(), 1), 0u);
    EXPECT_EQ(buffer.droppedSamples(), 3u);

    auto out = buffer.drainAll();
    EXPECT_EQ(out, (std::vector<float>{1, 2, 3, 4}));
    // full() stays latched until clear()
    EXPECT_TRUE(buffer.full());

    buffer.clear();
    EXPECT_FALSE(buffer.full());
    EXPECT_EQ(buffer.droppedSamples(), 0u);
}

TEST(CaptureBuffer, WrapsAroundAfterPartialDrain) {
    CaptureBuffer buffer;
    buffer.init(5);
    std::vector<float> first = {1, 2, 3, 4};
    buffer.append(first.data(), first.size());
    std::vector<float> out;
    buffer.drain(out);

    std::vector<float> second = {5, 6, 7};
    EXPECT_EQ(buffer.append(second.data(), second.size()), 3u);
    out.clear();
    buffer.drain(out);
    EXPECT_EQ(out, second);
}

TEST(CaptureBuffer, ConcurrentProducerConsumerKeepsEverySample) {
    CaptureBuffer buffer;
    buffer.init(1 << 12);
    constexpr size_t kTotal = 200000;
    constexpr size_t kBlock = 160;

    std::atomic<bool> done{false};
    std::thread producer([&]() {
        std::vector<float> block(kBlock);
        size_t next = 0;
        while (next < kTotal) {
            size_t count = std::min(kBlock, kTotal - next);
            for (size_t i = 0; i < count; ++i) {
                block[i] = static_cast<float>(next + i);
            }
            size_t accepted = buffer.append(block.data(), count);
            next += accepted;
            if (accepted < count) {
                std::this_thread::yield();
            }
        }
        done = true;
    });

    std::vector<float> received;
    received.reserve(kTotal);
    while (!done.load() || !buffer.empty()) {
        buffer.drain(received);
    }
    producer.join();

    ASSERT_EQ(received.size(), kTotal);
    for (size_t i = 0; i < kTotal; ++i) {
        ASSERT_EQ(received[i], static_cast<float>(i));
    }
}
