#pragma once

#include <unordered_map>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace vault_ledger {

/**
 * Fixed-window request budget per key (caller identity or peer address).
 * A limit of 0 disables throttling. Expired windows are swept every
 * PRUNE_EVERY calls, and at most `max_keys` windows are tracked at once;
 * a new key arriving while the table is full of live windows is refused.
 */
class RequestThrottle {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr size_t PRUNE_EVERY = 1024;
    static constexpr size_t DEFAULT_MAX_KEYS = 100000;

    explicit RequestThrottle(size_t limit_per_window = 120,
                             std::chrono::seconds window = std::chrono::seconds(60),
                             size_t max_keys = DEFAULT_MAX_KEYS)
        : limit_(limit_per_window), window_(window), max_keys_(max_keys) {}

    bool allow(const std::string& key) {
        return allow_at(key, Clock::now());
    }

    // Deterministic entry point; allow() forwards here with the steady clock.
    bool allow_at(const std::string& key, Clock::time_point now) {
        if (limit_ == 0) return true;
        std::lock_guard<std::mutex> lock(mu_);
        if (++calls_ % PRUNE_EVERY == 0) prune_locked(now);
        auto it = windows_.find(key);
        if (it == windows_.end()) {
            if (windows_.size() >= max_keys_) {
                prune_locked(now);
                if (windows_.size() >= max_keys_) return false;
            }
            it = windows_.emplace(key, Window{}).first;
        }
        auto& w = it->second;
        if (w.used == 0 || now - w.opened >= window_) {
            w.opened = now;
            w.used = 0;
        }
        if (w.used >= limit_) return false;
        ++w.used;
        return true;
    }

    size_t remaining(const std::string& key, Clock::time_point now) const {
        if (limit_ == 0) return SIZE_MAX;
        std::lock_guard<std::mutex> lock(mu_);
        auto it = windows_.find(key);
        if (it == windows_.end() || now - it->second.opened >= window_) return limit_;
        return it->second.used >= limit_ ? 0 : limit_ - it->second.used;
    }

    // Drops keys whose window has expired.
    size_t prune(Clock::time_point now) {
        std::lock_guard<std::mutex> lock(mu_);
        return prune_locked(now);
    }

    size_t tracked_keys() const {
        std::lock_guard<std::mutex> lock(mu_);
        return windows_.size();
    }

private:
    size_t prune_locked(Clock::time_point now) {
        size_t removed = 0;
        for (auto it = windows_.begin(); it != windows_.end();) {
            if (now - it->second.opened >= window_) {
                it = windows_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    struct Window {
        Clock::time_point opened{};
        size_t used{0};
    };
    size_t limit_;
    std::chrono::seconds window_;
    size_t max_keys_;
    uint64_t calls_{0};
    std::unordered_map<std::string, Window> windows_;
    mutable std::mutex mu_;
};

} // namespace vault_ledger
