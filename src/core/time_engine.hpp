#pragma once

#include <chrono>
#include <atomic>
#include <cstdint>

namespace vault_ledger {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * Time source for the ledger.
 * Follows the wall clock until pinned; a pinned clock only moves through
 * set_time()/advance(). Thread-safe for concurrent readers.
 */
class LedgerClock {
public:
    LedgerClock() = default;

    LedgerClock(const LedgerClock&) = delete;
    LedgerClock& operator=(const LedgerClock&) = delete;

    Timestamp current_time() const {
        if (!pinned_.load(std::memory_order_acquire)) {
            return std::chrono::system_clock::now();
        }
        return current_time_.load(std::memory_order_acquire);
    }

    int64_t now_sec() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            current_time().time_since_epoch()).count();
    }

    void set_time(Timestamp ts) {
        current_time_.store(ts, std::memory_order_release);
        pinned_.store(true, std::memory_order_release);
    }

    void set_time_sec(int64_t unix_sec) {
        set_time(Timestamp{} + std::chrono::seconds(unix_sec));
    }

    // Moves a pinned clock forward; pins at wall-clock time first if needed.
    void advance(std::chrono::seconds delta) {
        Timestamp cur = current_time();
        set_time(cur + delta);
    }

    void follow_wall_clock() {
        pinned_.store(false, std::memory_order_release);
    }

    bool is_pinned() const { return pinned_.load(std::memory_order_acquire); }

private:
    std::atomic<Timestamp> current_time_{Timestamp{}};
    std::atomic<bool> pinned_{false};
};

} // namespace vault_ledger
