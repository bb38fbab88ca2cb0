#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "core/log_history.hpp"
#include "core/log_level.hpp"
#include "persist/dedup_log_config.hpp"
#include "persist/file_sink.hpp"
#include "persist/log_naming.hpp"
#include "util/clock.hpp"

namespace persist {

struct WriteError {
    int error_code{0};              // errno (GetLastError on Windows); 0 for non-I/O failures
    std::string detail;
    std::filesystem::path path;     // target of the failed append, empty when unknown
};

// Invoked for every failed append with the original message. May run concurrently from
// several writer threads; no writer lock is held while it runs.
using WriteFailureHandler = std::function<void(const std::string& message, const WriteError& error)>;

// Appends "[<time>] [<Level>] <message>" lines to a flat text file, dropping a record when the
// same (message, level) pair was accepted within the stale window. Every write entry point is
// noexcept: failures go to the registered WriteFailureHandlers only.
//
// Background writes run in submission order on one worker thread owned by the writer. A deferred
// write that finds the target locked goes back to a timed wait list, so it never holds up the
// writes queued behind it.
//
// dispose() does not wait for background writes already running; deferred writes still waiting
// for a lock give up at their next poll. The destructor lets pending background writes finish,
// then disposes and joins the worker.
class DedupLogWriter {
public:
    explicit DedupLogWriter(DedupLogConfig cfg,
                            std::unique_ptr<IFileSink> sink = nullptr,
                            std::unique_ptr<util::WallClock> clock = nullptr);
    ~DedupLogWriter();

    DedupLogWriter(const DedupLogWriter&) = delete;
    DedupLogWriter& operator=(const DedupLogWriter&) = delete;

    // Blocks until the append completed or failed.
    void write(std::string_view message, core::Level level = core::Level::Info) noexcept;

    // Runs write() on a background task. The future may be waited on or dropped; it is only
    // invalid when the task could not even be allocated.
    std::shared_future<void> write_async(std::string message, core::Level level = core::Level::Info) noexcept;

    // Background task that waits for an exclusive lock on the target to clear, probing up to
    // `retries` times, then writes regardless. Completion is not observable.
    void write_deferred(std::string message, core::Level level, std::uint32_t retries) noexcept;
    void write_deferred(std::string message, core::Level level = core::Level::Info) noexcept;

    void on_write_failure(WriteFailureHandler handler);

    // Directory of the log file. Dated naming computes it from today's date.
    [[nodiscard]] std::filesystem::path log_path() const;
    // Full path of the log file. Dated naming computes it from today's date.
    [[nodiscard]] std::filesystem::path log_name() const;
    // Path the next append goes to, fallback naming included.
    [[nodiscard]] std::filesystem::path active_log_file() const;

    void clear_history() noexcept;
    [[nodiscard]] std::size_t history_size() const noexcept;

    // Idempotent. Clears history; writes arriving afterwards are dropped.
    void dispose() noexcept;
    [[nodiscard]] bool disposed() const noexcept { return disposed_.load(std::memory_order_acquire); }

    // Waits for every background write submitted so far. Must not be called from a
    // WriteFailureHandler: handlers run on the worker thread for background writes.
    void flush() noexcept;

    const DedupLogConfig& config() const noexcept { return cfg_; }

private:
    void write_impl(std::string_view message, core::Level level) noexcept;
    bool admit(std::string_view message, core::Level level, util::WallClock::time_point now,
               std::filesystem::path& target);
    void rotate_if_needed(util::WallClock::time_point now);
    bool target_locked() noexcept;
    void echo_console(std::string_view message, core::Level level) noexcept;
    std::string format_line(std::string_view message, core::Level level, util::WallClock::time_point now) const;
    void notify_failure(const std::string& message, const WriteError& error) noexcept;

    // One unit of background work. step() returns false to be run again after
    // deferred_poll_interval.
    struct BackgroundJob {
        std::function<bool()> step;
        std::promise<void> done;
        std::chrono::steady_clock::time_point due{};
    };

    std::shared_future<void> submit(std::function<bool()> step) noexcept;
    void run_inline(BackgroundJob& job) noexcept;
    void worker_loop() noexcept;

    DedupLogConfig cfg_;
    std::unique_ptr<IFileSink> sink_;
    std::unique_ptr<util::WallClock> clock_;
    LogNaming naming_;

    // Guards history_, target_path_ and rotation_date_.
    mutable std::mutex mutex_;
    core::DedupHistory history_;
    std::filesystem::path target_path_;
    util::CalendarDate rotation_date_{};

    std::mutex handlers_mutex_;
    std::vector<WriteFailureHandler> handlers_;

    // Guards ready_, waiting_, the counters and stopping_.
    std::mutex tasks_mutex_;
    std::condition_variable tasks_cv_;
    std::condition_variable idle_cv_;
    std::deque<BackgroundJob> ready_;
    std::vector<BackgroundJob> waiting_;
    std::uint64_t submitted_{0};
    std::uint64_t completed_{0};
    bool stopping_{false};

    std::mutex console_mutex_;
    std::atomic<bool> disposed_{false};

    std::thread worker_;
};

} // namespace persist
