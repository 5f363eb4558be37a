/**
 * @file progress_test.cpp
 * @brief Unit tests for progress sinks
 */

#include "stork/ProgressSink.h"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <utility>
#include <vector>

using namespace Stork;
using namespace std::chrono_literals;

namespace {

class RecordingSink : public ProgressSink {
public:
    void onProgress(uint64_t bytesMoved, uint64_t bytesTotal) override {
        events.emplace_back(bytesMoved, bytesTotal);
    }

    std::vector<std::pair<uint64_t, uint64_t>> events;
};

}  // namespace

TEST(ProgressTest, CallbackSinkForwardsEvents)
{
    uint64_t lastMoved = 0;
    uint64_t lastTotal = 0;
    CallbackProgressSink sink([&](uint64_t moved, uint64_t total) {
        lastMoved = moved;
        lastTotal = total;
    });
    sink.onProgress(10, 20);
    EXPECT_EQ(lastMoved, 10u);
    EXPECT_EQ(lastTotal, 20u);
}

TEST(ProgressTest, EmptyCallbackIsIgnored)
{
    CallbackProgressSink sink(nullptr);
    sink.onProgress(1, 2);
}

TEST(ProgressTest, ThrottleCoalescesBurstButKeepsFirstAndFinal)
{
    RecordingSink downstream;
    ThrottledProgress throttle(downstream, 10000ms);

    for (uint64_t moved = 1; moved <= 100; ++moved) {
        throttle.onProgress(moved, 100);
    }

    ASSERT_EQ(downstream.events.size(), 2u);
    EXPECT_EQ(downstream.events.front().first, 1u);
    EXPECT_EQ(downstream.events.back().first, 100u);
}

TEST(ProgressTest, ThrottleForwardsAfterInterval)
{
    RecordingSink downstream;
    ThrottledProgress throttle(downstream, 20ms);

    throttle.onProgress(1, 10);
    throttle.onProgress(2, 10);
    std::this_thread::sleep_for(40ms);
    throttle.onProgress(3, 10);

    ASSERT_EQ(downstream.events.size(), 2u);
    EXPECT_EQ(downstream.events[1].first, 3u);
}

TEST(ProgressTest, ZeroByteTransferSeesCompletion)
{
    RecordingSink downstream;
    ThrottledProgress throttle(downstream);
    throttle.onProgress(0, 0);

    ASSERT_EQ(downstream.events.size(), 1u);
    EXPECT_EQ(downstream.events[0].first, 0u);
    EXPECT_EQ(downstream.events[0].second, 0u);
}
