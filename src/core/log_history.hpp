#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <string>
#include <string_view>

#include "core/log_level.hpp"

namespace core {

struct LogEntry {
    std::string message;
    Level level{Level::Info};
    std::chrono::system_clock::time_point timestamp{};
};

// Bounded FIFO of recently accepted records used for duplicate detection.
// Not thread-safe: the owner serialises every call (DedupLogWriter holds one mutex across
// rotation + admit so that evict, check and insert happen as one unit).
class DedupHistory {
public:
    using time_point = std::chrono::system_clock::time_point;

    DedupHistory(std::size_t max_entries, std::chrono::milliseconds stale_window) noexcept;

    // Evicts stale/overflowing entries, then records (message, level) unless an identical pair
    // is still present. Returns true when the record was accepted.
    bool admit(std::string_view message, Level level, time_point now);

    // Drops entries older than now - stale_window and trims the front to max_entries.
    void evict(time_point now) noexcept;

    [[nodiscard]] bool contains(std::string_view message, Level level) const noexcept;

    void clear() noexcept { entries_.clear(); }

    // Suppression is off when either the count or the window is zero.
    [[nodiscard]] bool suppression_enabled() const noexcept {
        return max_entries_ > 0 && stale_window_ > std::chrono::milliseconds::zero();
    }

    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }
    std::size_t max_entries() const noexcept { return max_entries_; }
    std::chrono::milliseconds stale_window() const noexcept { return stale_window_; }
    const std::deque<LogEntry>& entries() const noexcept { return entries_; }

private:
    bool is_stale(const LogEntry& entry, time_point now) const noexcept;

    std::size_t max_entries_;
    std::chrono::milliseconds stale_window_;
    std::deque<LogEntry> entries_;
};

} // namespace core
