#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include "Cancellation.hpp"

using namespace std::chrono_literals;

// ============================================================================
// TOKENS
// ============================================================================

/** @brief A default token is never cancelled and sleeps the full delay */
TEST(CancellationTest, DefaultTokenNeverCancelled) {
    CancellationToken t;
    EXPECT_FALSE(t.is_cancelled());
    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_TRUE(t.sleep_for(20));
    EXPECT_GE(std::chrono::steady_clock::now() - t0, 15ms);
}

TEST(CancellationTest, CancelPropagatesToTokens) {
    CancellationSource src;
    CancellationToken a = src.token();
    CancellationToken b = src.token();
    EXPECT_FALSE(a.is_cancelled());
    src.cancel();
    EXPECT_TRUE(src.is_cancelled());
    EXPECT_TRUE(a.is_cancelled());
    EXPECT_TRUE(b.is_cancelled());
    EXPECT_FALSE(a.sleep_for(1000));
    EXPECT_FALSE(a.sleep_for(0));
}

/** @brief cancel() wakes a sleeping token well before its delay */
TEST(CancellationTest, CancelWakesSleeper) {
    CancellationSource src;
    CancellationToken t = src.token();
    std::atomic<bool> result{true};
    std::atomic<bool> done{false};

    const auto t0 = std::chrono::steady_clock::now();
    std::thread sleeper([&]() {
        result.store(t.sleep_for(10000));
        done.store(true);
    });
    std::this_thread::sleep_for(50ms);
    src.cancel();
    sleeper.join();

    EXPECT_TRUE(done.load());
    EXPECT_FALSE(result.load());
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 5s);
}

/** @brief Replacing a source leaves tokens of the old one cancelled and the new one live */
TEST(CancellationTest, ReplacedSourceIsIndependent) {
    CancellationSource src;
    CancellationToken old_token = src.token();
    src.cancel();
    src = CancellationSource();
    CancellationToken new_token = src.token();

    EXPECT_TRUE(old_token.is_cancelled());
    EXPECT_FALSE(new_token.is_cancelled());
    EXPECT_TRUE(new_token.sleep_for(1));
}
