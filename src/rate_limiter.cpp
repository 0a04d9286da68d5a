#include "rate_limiter.hpp"
#include "metrics.hpp"

namespace auvctl {

RateLimiter::RateLimiter(Policy policy, NowFn now)
    : policy_(policy)
    , now_(std::move(now))
{}

// Sliding-window admission. A block period, once started, refuses everything
// until it expires; expiry wipes the history so no old requests carry over.
RateLimitResult RateLimiter::admit(const std::string& client_id) {
    const auto now = now_();
    const long long limit = static_cast<long long>(policy_.capacity);

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = clients_.find(client_id);
    if (it == clients_.end()) {
        make_room_locked(now);
        it = clients_.emplace(client_id, ClientRecord{}).first;
    }
    ClientRecord& record = it->second;
    record.last_seen = now;

    if (record.blocked_until) {
        if (now < *record.blocked_until) {
            return {false, 0, limit, seconds_until(now, *record.blocked_until)};
        }
        record.blocked_until.reset();
        record.timestamps.clear();
    }

    while (!record.timestamps.empty() && now - record.timestamps.front() >= policy_.window) {
        record.timestamps.pop_front();
    }

    record.timestamps.push_back(now);
    const long long count = static_cast<long long>(record.timestamps.size());

    if (record.timestamps.size() > policy_.capacity) {
        record.blocked_until = now + policy_.block;
        record.timestamps.clear();
        return {false, count, limit, seconds_until(now, *record.blocked_until)};
    }

    return {true, count, limit, 0};
}

size_t RateLimiter::prune_idle() {
    const auto now = now_();
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = prune_idle_locked(now);
    MetricsRegistry::instance().set_gauge("rate_limiter_tracked_clients", static_cast<double>(clients_.size()));
    return removed;
}

size_t RateLimiter::tracked_clients() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

bool RateLimiter::is_blocked(const std::string& client_id) const {
    const auto now = now_();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(client_id);
    if (it == clients_.end() || !it->second.blocked_until) {
        return false;
    }
    return now < *it->second.blocked_until;
}

// A record idle for block + window can hold neither an active block nor a
// timestamp still inside the window, so dropping it changes no decision.
size_t RateLimiter::prune_idle_locked(Clock::time_point now) {
    const auto idle_after = policy_.block + policy_.window;
    size_t removed = 0;
    for (auto it = clients_.begin(); it != clients_.end(); ) {
        if (now - it->second.last_seen > idle_after) {
            it = clients_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

// Keeps the table under max_tracked_clients before a new record is inserted.
// Idle records go first; otherwise the least recently seen record is evicted,
// preferring one without an active block.
void RateLimiter::make_room_locked(Clock::time_point now) {
    if (clients_.size() < policy_.max_tracked_clients) {
        return;
    }
    prune_idle_locked(now);
    if (clients_.size() < policy_.max_tracked_clients) {
        return;
    }

    auto victim = clients_.end();
    auto blocked_victim = clients_.end();
    for (auto it = clients_.begin(); it != clients_.end(); ++it) {
        bool blocked = it->second.blocked_until && now < *it->second.blocked_until;
        auto& slot = blocked ? blocked_victim : victim;
        if (slot == clients_.end() || it->second.last_seen < slot->second.last_seen) {
            slot = it;
        }
    }
    if (victim == clients_.end()) {
        victim = blocked_victim;
    }
    if (victim != clients_.end()) {
        clients_.erase(victim);
        MetricsRegistry::instance().increment_counter("rate_limiter_evictions_total");
    }
}

long long RateLimiter::seconds_until(Clock::time_point from, Clock::time_point to) {
    auto remaining = std::chrono::ceil<std::chrono::seconds>(to - from).count();
    return remaining > 0 ? remaining : 1;
}

}
