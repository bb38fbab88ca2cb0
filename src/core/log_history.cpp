#include "core/log_history.hpp"

#include <algorithm>

namespace core {

DedupHistory::DedupHistory(std::size_t max_entries, std::chrono::milliseconds stale_window) noexcept
    : max_entries_(max_entries), stale_window_(stale_window) {}

bool DedupHistory::is_stale(const LogEntry& entry, time_point now) const noexcept {
    return now - entry.timestamp > stale_window_;
}

void DedupHistory::evict(time_point now) noexcept {
    while (!entries_.empty() && (is_stale(entries_.front(), now) || entries_.size() > max_entries_)) {
        entries_.pop_front();
    }
}

bool DedupHistory::contains(std::string_view message, Level level) const noexcept {
    return std::any_of(entries_.begin(), entries_.end(), [&](const LogEntry& e) {
        return e.level == level && e.message == message;
    });
}

bool DedupHistory::admit(std::string_view message, Level level, time_point now) {
    if (!suppression_enabled()) {
        // Nothing may match: an entry stamped in the same clock tick would otherwise
        // survive a zero window.
        entries_.clear();
        return true;
    }

    evict(now);
    if (contains(message, level)) {
        return false;
    }

    entries_.push_back(LogEntry{std::string(message), level, now});
    if (entries_.size() > max_entries_) {
        entries_.pop_front();
    }
    return true;
}

} // namespace core
