/**
 * @file cancel_token_test.cpp
 * @brief Unit tests for CancelToken and InterruptRegistration
 */

#include "stork/CancelToken.h"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace Stork;

TEST(CancelTokenTest, StartsUncancelled)
{
    CancelToken token;
    EXPECT_FALSE(token.isCancelled());
}

TEST(CancelTokenTest, CancelRunsEveryHookOnce)
{
    CancelToken token;
    int a = 0;
    int b = 0;
    token.registerInterrupt([&]() { ++a; });
    token.registerInterrupt([&]() { ++b; });

    token.cancel();
    token.cancel();

    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(a, 1);
    EXPECT_EQ(b, 1);
}

TEST(CancelTokenTest, HookRegisteredAfterCancelRunsImmediately)
{
    CancelToken token;
    token.cancel();

    int calls = 0;
    token.registerInterrupt([&]() { ++calls; });
    EXPECT_EQ(calls, 1);
}

TEST(CancelTokenTest, UnregisteredHookDoesNotRun)
{
    CancelToken token;
    int calls = 0;
    {
        InterruptRegistration registration(token, [&]() { ++calls; });
    }
    token.cancel();
    EXPECT_EQ(calls, 0);
}

TEST(CancelTokenTest, ConcurrentCancelRunsHookOnce)
{
    CancelToken token;
    std::atomic<int> calls{ 0 };
    token.registerInterrupt([&]() { calls.fetch_add(1); });

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() { token.cancel(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(calls.load(), 1);
}
