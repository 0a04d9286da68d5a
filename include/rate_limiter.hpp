#pragma once

#include <string>
#include <unordered_map>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace auvctl {

struct RateLimitResult {
    bool allowed;
    long long current;          // requests counted in the current window
    long long limit;
    long long reset_after_sec;  // seconds until the client may retry (0 when allowed)
};

// In-process sliding-window limiter with temporary blocking.
// One record per client address, guarded by a single table lock that is
// held only for the read-modify-write of a call.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    struct Policy {
        size_t capacity = 300;
        std::chrono::seconds window{60};
        std::chrono::seconds block{300};
        size_t max_tracked_clients = 100000;
    };

    explicit RateLimiter(Policy policy, NowFn now = [] { return Clock::now(); });
    ~RateLimiter() = default;

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * Counts one request for the client and decides whether it may proceed.
     * Requests arriving during a block period are refused without being counted.
     * @param client_id Client network address.
     * @return Admission result with retry metadata.
     */
    RateLimitResult admit(const std::string& client_id);

    // Drops records idle for longer than block + window. Returns the number removed.
    size_t prune_idle();

    size_t tracked_clients() const;
    bool is_blocked(const std::string& client_id) const;

    const Policy& policy() const { return policy_; }

private:
    struct ClientRecord {
        std::deque<Clock::time_point> timestamps;
        std::optional<Clock::time_point> blocked_until;
        Clock::time_point last_seen;
    };

    size_t prune_idle_locked(Clock::time_point now);
    void make_room_locked(Clock::time_point now);

    static long long seconds_until(Clock::time_point from, Clock::time_point to);

    Policy policy_;
    NowFn now_;
    std::unordered_map<std::string, ClientRecord> clients_;
    mutable std::mutex mutex_;
};

}
