#include <gtest/gtest.h>
#include "rate_limiter.hpp"
#include "metrics.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace auvctl;

// Manually advanced clock shared with the limiter under test.
class RateLimiterTest : public ::testing::Test {
protected:
    RateLimiter::Clock::time_point now_ = RateLimiter::Clock::time_point{} + std::chrono::hours(1);

    RateLimiter::NowFn clock() {
        return [this] { return now_; };
    }

    void advance(std::chrono::milliseconds d) { now_ += d; }

    static RateLimiter::Policy small_policy(size_t capacity) {
        RateLimiter::Policy p;
        p.capacity = capacity;
        p.window = std::chrono::seconds(60);
        p.block = std::chrono::seconds(300);
        return p;
    }
};

TEST_F(RateLimiterTest, FirstRequestAlwaysAllowed) {
    RateLimiter limiter(small_policy(1), clock());
    auto res = limiter.admit("10.0.0.1");
    EXPECT_TRUE(res.allowed);
    EXPECT_EQ(res.current, 1);
    EXPECT_EQ(res.limit, 1);
    EXPECT_EQ(res.reset_after_sec, 0);
}

TEST_F(RateLimiterTest, BlocksOnRequestAboveCapacity) {
    RateLimiter limiter(RateLimiter::Policy{}, clock());

    for (int i = 0; i < 300; ++i) {
        ASSERT_TRUE(limiter.admit("10.0.0.1").allowed) << "request " << i + 1;
        advance(std::chrono::milliseconds(10));
    }

    auto res = limiter.admit("10.0.0.1");
    EXPECT_FALSE(res.allowed);
    EXPECT_EQ(res.reset_after_sec, 300);
    EXPECT_TRUE(limiter.is_blocked("10.0.0.1"));
}

TEST_F(RateLimiterTest, BlockedClientStaysBlockedUntilExpiry) {
    RateLimiter limiter(small_policy(2), clock());
    limiter.admit("a");
    limiter.admit("a");
    ASSERT_FALSE(limiter.admit("a").allowed);

    advance(std::chrono::seconds(100));
    auto res = limiter.admit("a");
    EXPECT_FALSE(res.allowed);
    EXPECT_EQ(res.reset_after_sec, 200);

    advance(std::chrono::seconds(200));
    EXPECT_TRUE(limiter.admit("a").allowed);
}

TEST_F(RateLimiterTest, ExpiredBlockStartsFromEmptyHistory) {
    RateLimiter limiter(small_policy(3), clock());
    for (int i = 0; i < 4; ++i) limiter.admit("a");
    ASSERT_TRUE(limiter.is_blocked("a"));

    advance(std::chrono::seconds(301));
    // Full capacity is available again: nothing carried over from before the block.
    for (int i = 0; i < 3; ++i) {
        auto res = limiter.admit("a");
        EXPECT_TRUE(res.allowed);
        EXPECT_EQ(res.current, i + 1);
    }
    EXPECT_FALSE(limiter.admit("a").allowed);
}

TEST_F(RateLimiterTest, WindowSlides) {
    RateLimiter limiter(small_policy(2), clock());
    EXPECT_TRUE(limiter.admit("a").allowed);
    advance(std::chrono::seconds(30));
    EXPECT_TRUE(limiter.admit("a").allowed);

    // First timestamp leaves the window.
    advance(std::chrono::seconds(31));
    auto res = limiter.admit("a");
    EXPECT_TRUE(res.allowed);
    EXPECT_EQ(res.current, 2);
}

TEST_F(RateLimiterTest, ClientsAreIndependent) {
    RateLimiter limiter(small_policy(1), clock());
    EXPECT_TRUE(limiter.admit("a").allowed);
    EXPECT_FALSE(limiter.admit("a").allowed);
    EXPECT_TRUE(limiter.admit("b").allowed);
    EXPECT_FALSE(limiter.is_blocked("b"));
}

TEST_F(RateLimiterTest, PruneIdleDropsStaleRecords) {
    RateLimiter limiter(small_policy(10), clock());
    limiter.admit("old");
    advance(std::chrono::seconds(200));
    limiter.admit("recent");
    EXPECT_EQ(limiter.tracked_clients(), 2u);

    advance(std::chrono::seconds(200)); // "old" idle 400s > 360s
    EXPECT_EQ(limiter.prune_idle(), 1u);
    EXPECT_EQ(limiter.tracked_clients(), 1u);
    EXPECT_EQ(MetricsRegistry::instance().get_gauge("rate_limiter_tracked_clients"), 1.0);
}

TEST_F(RateLimiterTest, PruneKeepsActiveBlocks) {
    RateLimiter limiter(small_policy(1), clock());
    limiter.admit("a");
    limiter.admit("a");
    advance(std::chrono::seconds(299));
    EXPECT_EQ(limiter.prune_idle(), 0u);
    EXPECT_TRUE(limiter.is_blocked("a"));
}

TEST_F(RateLimiterTest, TableIsBoundedByEviction) {
    auto policy = small_policy(5);
    policy.max_tracked_clients = 3;
    RateLimiter limiter(policy, clock());

    // "blocked" holds an active block and must survive eviction.
    for (int i = 0; i < 6; ++i) limiter.admit("blocked");
    advance(std::chrono::seconds(1));
    limiter.admit("c1");
    advance(std::chrono::seconds(1));
    limiter.admit("c2");
    advance(std::chrono::seconds(1));
    limiter.admit("c3");

    EXPECT_EQ(limiter.tracked_clients(), 3u);
    EXPECT_TRUE(limiter.is_blocked("blocked"));
}

TEST_F(RateLimiterTest, ConcurrentAdmissionCountsEveryRequest) {
    RateLimiter::Policy policy;
    policy.capacity = 1000;
    RateLimiter limiter(policy);

    const int num_threads = 8;
    const int per_thread = 200;
    std::atomic<int> allowed{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < per_thread; ++i) {
                if (limiter.admit("shared").allowed) {
                    allowed++;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    // 1600 requests against a capacity of 1000: exactly 1000 pass, the 1001st
    // starts the block and everything after it is refused.
    EXPECT_EQ(allowed.load(), 1000);
    EXPECT_TRUE(limiter.is_blocked("shared"));
}
