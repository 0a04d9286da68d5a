#include <openssl/sha.h>
#include <iomanip>
#include <sstream>
#include <mutex>
#include "connection_manager.hpp"
#include "metrics.hpp"

namespace auvctl {

ConnectionManager::ConnectionManager(const std::string& salt) : salt_(salt) {
}

bool ConnectionManager::try_acquire(const std::string& ip, size_t max_per_ip, size_t max_global) {
    const std::string b_ip = blind_id(ip);
    std::unique_lock lock(connections_mutex_);

    if (total_ >= max_global) {
        return false;
    }
    size_t& count = ip_counts_[b_ip];
    if (count >= max_per_ip) {
        if (count == 0) {
            ip_counts_.erase(b_ip);
        }
        return false;
    }

    ++count;
    ++total_;
    MetricsRegistry::instance().set_gauge("active_connections", static_cast<double>(total_));
    return true;
}

void ConnectionManager::release(const std::string& ip) {
    const std::string b_ip = blind_id(ip);
    std::unique_lock lock(connections_mutex_);

    auto it = ip_counts_.find(b_ip);
    if (it == ip_counts_.end()) {
        return;
    }
    if (--it->second == 0) {
        ip_counts_.erase(it);
    }
    if (total_ > 0) {
        --total_;
    }
    MetricsRegistry::instance().set_gauge("active_connections", static_cast<double>(total_));
}

size_t ConnectionManager::connection_count() const {
    std::shared_lock lock(connections_mutex_);
    return total_;
}

size_t ConnectionManager::connection_count_for_ip(const std::string& ip_address) const {
    std::string b_ip = blind_id(ip_address);
    std::shared_lock lock(connections_mutex_);
    auto it = ip_counts_.find(b_ip);
    if (it != ip_counts_.end()) {
        return it->second;
    }
    return 0;
}

size_t ConnectionManager::tracked_addresses() const {
    std::shared_lock lock(connections_mutex_);
    return ip_counts_.size();
}

// Salted SHA256 of an identifier, hex encoded.
std::string ConnectionManager::blind_id(const std::string& id) const {
    std::string data = id + salt_;
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return ss.str();
}

}
