#include "persist/dedup_log_writer.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>
#include <utility>

#include "util/log.hpp"
#include "util/time_format.hpp"

namespace persist {

namespace {

std::shared_future<void> ready_future() {
    std::promise<void> done;
    done.set_value();
    return done.get_future().share();
}

} // namespace

DedupLogWriter::DedupLogWriter(DedupLogConfig cfg,
                               std::unique_ptr<IFileSink> sink,
                               std::unique_ptr<util::WallClock> clock)
    : cfg_(std::move(cfg)),
      sink_(std::move(sink)),
      clock_(std::move(clock)),
      history_(cfg_.max_history, cfg_.stale_window) {
    if (!sink_) {
        sink_ = make_default_file_sink();
    }
    if (!clock_) {
        clock_ = std::make_unique<util::WallClock>();
    }
    if (cfg_.time_format.empty()) {
        cfg_.time_format = util::kDefaultTimeFormat;
    }

    if (cfg_.uses_dated_naming()) {
        naming_ = resolve_naming(LogNaming{cfg_.base_dir, cfg_.program_name});
        rotation_date_ = util::local_date(clock_->now());
        target_path_ = prepare_dated_log_file(naming_, rotation_date_);
    } else {
        target_path_ = cfg_.log_file_path;
    }
    DLOG_DIAG_DEBUG("DedupLogWriter: target=%s max_history=%zu stale_window_ms=%lld",
                    target_path_.string().c_str(), cfg_.max_history,
                    static_cast<long long>(cfg_.stale_window.count()));

    try {
        worker_ = std::thread([this] { worker_loop(); });
    } catch (const std::system_error& ex) {
        DLOG_DIAG_WARN("DedupLogWriter: no background thread (%s), background writes run inline", ex.what());
    }
}

DedupLogWriter::~DedupLogWriter() {
    flush();
    dispose();
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        stopping_ = true;
    }
    tasks_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void DedupLogWriter::write(std::string_view message, core::Level level) noexcept {
    write_impl(message, level);
}

std::shared_future<void> DedupLogWriter::write_async(std::string message, core::Level level) noexcept {
    try {
        if (level == core::Level::None) {
            echo_console(message, level);
            return ready_future();
        }
        if (disposed()) {
            return ready_future();
        }
        return submit([this, message = std::move(message), level] {
            write_impl(message, level);
            return true;
        });
    } catch (const std::exception& ex) {
        DLOG_DIAG_ERROR("DedupLogWriter: async write not submitted: %s", ex.what());
        return {};
    }
}

void DedupLogWriter::write_deferred(std::string message, core::Level level) noexcept {
    write_deferred(std::move(message), level, cfg_.deferred_retries);
}

void DedupLogWriter::write_deferred(std::string message, core::Level level, std::uint32_t retries) noexcept {
    if (level == core::Level::None) {
        echo_console(message, level);
        return;
    }
    if (disposed()) {
        return;
    }
    // Probes once, then up to `retries` more times one poll interval apart.
    try {
        submit([this, message = std::move(message), level, retries, attempt = std::uint32_t{0}]() mutable {
            if (!disposed() && target_locked()) {
                if (attempt < retries) {
                    ++attempt;
                    return false;
                }
                DLOG_DIAG_DEBUG("DedupLogWriter: target still locked after %u retries, writing anyway",
                                static_cast<unsigned>(retries));
            }
            write_impl(message, level);
            return true;
        });
    } catch (const std::exception& ex) {
        DLOG_DIAG_ERROR("DedupLogWriter: deferred write not submitted: %s", ex.what());
    }
}

void DedupLogWriter::on_write_failure(WriteFailureHandler handler) {
    if (!handler) {
        return;
    }
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_.push_back(std::move(handler));
}

std::filesystem::path DedupLogWriter::log_path() const {
    if (cfg_.uses_dated_naming()) {
        return dated_log_directory(naming_.base_dir, util::local_date(clock_->now()));
    }
    if (cfg_.log_file_path.has_parent_path()) {
        return cfg_.log_file_path.parent_path();
    }
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(".") : cwd;
}

std::filesystem::path DedupLogWriter::log_name() const {
    if (cfg_.uses_dated_naming()) {
        return dated_log_file(naming_, util::local_date(clock_->now()));
    }
    return cfg_.log_file_path;
}

std::filesystem::path DedupLogWriter::active_log_file() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return target_path_;
}

void DedupLogWriter::clear_history() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

std::size_t DedupLogWriter::history_size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

void DedupLogWriter::dispose() noexcept {
    if (disposed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.clear();
    }
    // Wakes the worker so deferred writes waiting for a lock stop polling.
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
    }
    tasks_cv_.notify_all();
}

void DedupLogWriter::flush() noexcept {
    std::unique_lock<std::mutex> lock(tasks_mutex_);
    const std::uint64_t target = submitted_;
    idle_cv_.wait(lock, [this, target] { return completed_ >= target; });
}

void DedupLogWriter::write_impl(std::string_view message, core::Level level) noexcept {
    if (level == core::Level::None) {
        echo_console(message, level);
        return;
    }
    if (disposed()) {
        return;
    }

    std::filesystem::path target;
    try {
        const auto now = clock_->now();
        if (!admit(message, level, now, target)) {
            return;
        }
        // Disposal may have happened while we held no lock.
        if (disposed()) {
            return;
        }
        const std::string line = format_line(message, level, now);
        const IoResult res = sink_->append(target, line);
        if (!res.ok) {
            notify_failure(std::string(message),
                           WriteError{res.error_code, std::system_category().message(res.error_code), target});
        }
    } catch (const std::exception& ex) {
        try {
            notify_failure(std::string(message), WriteError{0, ex.what(), target});
        } catch (const std::exception& inner) {
            DLOG_DIAG_ERROR("DedupLogWriter: failure report lost: %s", inner.what());
        }
    }
}

bool DedupLogWriter::admit(std::string_view message, core::Level level, util::WallClock::time_point now,
                           std::filesystem::path& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    rotate_if_needed(now);
    if (!history_.admit(message, level, now)) {
        return false;
    }
    target = target_path_;
    return true;
}

void DedupLogWriter::rotate_if_needed(util::WallClock::time_point now) {
    if (!cfg_.uses_dated_naming()) {
        return;
    }
    const util::CalendarDate today = util::local_date(now);
    if (today == rotation_date_) {
        return;
    }
    rotation_date_ = today;
    target_path_ = prepare_dated_log_file(naming_, today);
    DLOG_DIAG_INFO("DedupLogWriter: rotated to %s", target_path_.string().c_str());
}

bool DedupLogWriter::target_locked() noexcept {
    try {
        return sink_->probe_lock(active_log_file()) == LockState::Locked;
    } catch (const std::exception& ex) {
        DLOG_DIAG_WARN("DedupLogWriter: lock probe failed: %s", ex.what());
        return false;
    }
}

void DedupLogWriter::echo_console(std::string_view message, core::Level level) noexcept {
    if (!cfg_.console) {
        return;
    }
    try {
        const std::string line = format_line(message, level, clock_->now());
        std::lock_guard<std::mutex> lock(console_mutex_);
        std::fwrite(line.data(), 1, line.size(), cfg_.console);
        std::fflush(cfg_.console);
    } catch (const std::exception& ex) {
        DLOG_DIAG_WARN("DedupLogWriter: console echo failed: %s", ex.what());
    }
}

std::string DedupLogWriter::format_line(std::string_view message, core::Level level,
                                        util::WallClock::time_point now) const {
    std::string line;
    line.reserve(message.size() + cfg_.time_format.size() + 24);
    line += '[';
    line += util::format_local_time(now, cfg_.time_format);
    line += "] [";
    line += core::to_string(level);
    line += "] ";
    line += message;
    line += '\n';
    return line;
}

void DedupLogWriter::notify_failure(const std::string& message, const WriteError& error) noexcept {
    DLOG_DIAG_DEBUG("DedupLogWriter: write of \"%s\" to %s failed: %s (%d)", message.c_str(),
                    error.path.string().c_str(), error.detail.c_str(), error.error_code);
    try {
        std::vector<WriteFailureHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handlers = handlers_;
        }
        for (const auto& handler : handlers) {
            try {
                handler(message, error);
            } catch (const std::exception& ex) {
                DLOG_DIAG_WARN("DedupLogWriter: write failure handler threw: %s", ex.what());
            }
        }
    } catch (const std::exception& ex) {
        DLOG_DIAG_ERROR("DedupLogWriter: cannot dispatch write failure: %s", ex.what());
    }
}

std::shared_future<void> DedupLogWriter::submit(std::function<bool()> step) noexcept {
    try {
        BackgroundJob job{std::move(step), {}, {}};
        auto fut = job.done.get_future().share();
        {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            if (worker_.joinable() && !stopping_) {
                ready_.push_back(std::move(job));
                ++submitted_;
                tasks_cv_.notify_one();
                return fut;
            }
        }
        run_inline(job);
        return fut;
    } catch (const std::exception& ex) {
        DLOG_DIAG_ERROR("DedupLogWriter: background write not submitted: %s", ex.what());
        return {};
    }
}

void DedupLogWriter::run_inline(BackgroundJob& job) noexcept {
    while (!job.step()) {
        std::this_thread::sleep_for(cfg_.deferred_poll_interval);
    }
    job.done.set_value();
}

void DedupLogWriter::worker_loop() noexcept {
    std::unique_lock<std::mutex> lock(tasks_mutex_);
    for (;;) {
        if (!ready_.empty()) {
            BackgroundJob job = std::move(ready_.front());
            ready_.pop_front();
            lock.unlock();
            const bool finished = job.step();
            lock.lock();
            if (finished) {
                job.done.set_value();
                ++completed_;
                idle_cv_.notify_all();
            } else {
                job.due = std::chrono::steady_clock::now() + cfg_.deferred_poll_interval;
                waiting_.push_back(std::move(job));
            }
            continue;
        }
        if (!waiting_.empty()) {
            auto next = std::min_element(waiting_.begin(), waiting_.end(),
                                         [](const BackgroundJob& a, const BackgroundJob& b) { return a.due < b.due; });
            if (disposed() || next->due <= std::chrono::steady_clock::now()) {
                ready_.push_back(std::move(*next));
                waiting_.erase(next);
                continue;
            }
            tasks_cv_.wait_until(lock, next->due);
            continue;
        }
        if (stopping_) {
            return;
        }
        tasks_cv_.wait(lock);
    }
}

} // namespace persist
