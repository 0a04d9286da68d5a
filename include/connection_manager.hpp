#pragma once

#include <string>
#include <unordered_map>
#include <shared_mutex>
#include <cstddef>

namespace auvctl {

// Counts open HTTP connections per client address and overall so one peer
// cannot starve the listener. Addresses are held only in blinded form.
class ConnectionManager {
public:
    explicit ConnectionManager(const std::string& salt);
    ~ConnectionManager() = default;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * Reserves a connection slot for ip.
     * @return false (and reserves nothing) when either the per-IP or the
     *         global cap is already reached.
     */
    bool try_acquire(const std::string& ip, size_t max_per_ip, size_t max_global);

    // Releases a slot taken by try_acquire.
    void release(const std::string& ip);

    size_t connection_count() const;
    size_t connection_count_for_ip(const std::string& ip_address) const;
    size_t tracked_addresses() const;

    std::string blind_id(const std::string& id) const;

private:
    std::unordered_map<std::string, size_t> ip_counts_;
    size_t total_ = 0;

    mutable std::shared_mutex connections_mutex_;
    std::string salt_;
};

}
