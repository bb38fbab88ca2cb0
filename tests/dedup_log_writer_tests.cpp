#include <gtest/gtest.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "harness/log_test_support.hpp"
#include "persist/dedup_log_writer.hpp"

namespace {

using core::Level;
using persist::DedupLogConfig;
using persist::DedupLogWriter;
using persist::WriteError;
using test_support::ExclusiveFileLock;
using test_support::ManualClock;
using namespace std::chrono_literals;

struct FailureLog {
    std::mutex mtx;
    std::vector<std::pair<std::string, WriteError>> failures;

    void attach(DedupLogWriter& writer) {
        writer.on_write_failure([this](const std::string& msg, const WriteError& err) {
            std::lock_guard<std::mutex> lock(mtx);
            failures.emplace_back(msg, err);
        });
    }

    std::size_t count() {
        std::lock_guard<std::mutex> lock(mtx);
        return failures.size();
    }
};

DedupLogConfig file_config(const std::filesystem::path& file) {
    DedupLogConfig cfg{};
    cfg.log_file_path = file;
    cfg.console = nullptr;
    return cfg;
}

std::unique_ptr<ManualClock> clock_at(std::chrono::system_clock::time_point tp) {
    return std::make_unique<ManualClock>(tp);
}

// Sink that fails every append with a fixed errno and records what it was asked to write.
class FailingSink : public persist::IFileSink {
public:
    explicit FailingSink(int err) : err_(err) {}

    persist::IoResult append(const std::filesystem::path&, std::string_view data) noexcept override {
        ++append_calls;
        last_data.assign(data);
        return {false, err_};
    }
    persist::LockState probe_lock(const std::filesystem::path&) noexcept override {
        return persist::LockState::Unlocked;
    }

    int append_calls{0};
    std::string last_data;

private:
    int err_;
};

// Sink whose lock state is switched by the test; appends are kept in memory.
class ScriptedLockSink : public persist::IFileSink {
public:
    persist::IoResult append(const std::filesystem::path&, std::string_view data) noexcept override {
        std::lock_guard<std::mutex> lock(mtx_);
        lines_.emplace_back(data);
        return {true, 0};
    }
    persist::LockState probe_lock(const std::filesystem::path&) noexcept override {
        return locked.load() ? persist::LockState::Locked : persist::LockState::Unlocked;
    }

    std::vector<std::string> lines() {
        std::lock_guard<std::mutex> lock(mtx_);
        return lines_;
    }

    std::atomic<bool> locked{false};

private:
    std::mutex mtx_;
    std::vector<std::string> lines_;
};

std::vector<std::string> read_console(std::FILE* console) {
    std::vector<std::string> out;
    std::rewind(console);
    char buf[256];
    while (std::fgets(buf, sizeof(buf), console)) {
        out.emplace_back(buf);
    }
    return out;
}

TEST(DedupLogWriterTests, WritesFormattedLine) {
    const auto dir = test_support::make_temp_dir("writer_format");
    auto cfg = file_config(dir / "app.log");
    cfg.time_format = "yyyy-MM-dd HH:mm:ss";
    DedupLogWriter writer(cfg, nullptr, clock_at(test_support::local_time_point(2024, 5, 6, 7, 8, 9)));

    writer.write("service started", Level::Warning);
    writer.write("");

    const auto lines = test_support::read_lines(dir / "app.log");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "[2024-05-06 07:08:09] [Warning] service started");
    EXPECT_EQ(lines[1], "[2024-05-06 07:08:09] [Info] ");
}

TEST(DedupLogWriterTests, DefaultTimestampPattern) {
    const auto dir = test_support::make_temp_dir("writer_default_pattern");
    DedupLogWriter writer(file_config(dir / "app.log"), nullptr,
                          clock_at(test_support::local_time_point(2024, 11, 2, 21, 15, 0) + 250ms));
    writer.write("evening", Level::Important);

    const auto lines = test_support::read_lines(dir / "app.log");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "[2024-11-02 09:15:00.250 PM] [Important] evening");
}

TEST(DedupLogWriterTests, SuppressesDuplicatesWithinWindow) {
    const auto dir = test_support::make_temp_dir("writer_dupes");
    auto clock = clock_at(test_support::local_time_point(2024, 1, 10));
    auto* clk = clock.get();
    DedupLogWriter writer(file_config(dir / "app.log"), nullptr, std::move(clock));

    for (int i = 0; i < 5; ++i) {
        writer.write("retrying connection", Level::Warning);
        clk->advance(1s);
    }
    writer.write("retrying connection", Level::Error);

    const auto lines = test_support::read_lines(dir / "app.log");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("[Warning] retrying connection"), std::string::npos);
    EXPECT_NE(lines[1].find("[Error] retrying connection"), std::string::npos);
}

TEST(DedupLogWriterTests, DuplicateAcceptedAgainAfterWindow) {
    const auto dir = test_support::make_temp_dir("writer_window");
    auto cfg = file_config(dir / "app.log");
    cfg.stale_window = 1s;
    auto clock = clock_at(test_support::local_time_point(2024, 1, 10));
    auto* clk = clock.get();
    DedupLogWriter writer(cfg, nullptr, std::move(clock));

    writer.write("heartbeat missed");
    clk->advance(500ms);
    writer.write("heartbeat missed");
    clk->advance(1s);
    writer.write("heartbeat missed");

    EXPECT_EQ(test_support::read_lines(dir / "app.log").size(), 2u);
}

TEST(DedupLogWriterTests, DuplicateAcceptedAgainAfterRealTimeWindow) {
    const auto dir = test_support::make_temp_dir("writer_window_real");
    auto cfg = file_config(dir / "app.log");
    cfg.stale_window = 1s;
    DedupLogWriter writer(cfg);

    writer.write("slow consumer");
    writer.write("slow consumer");
    std::this_thread::sleep_for(1100ms);
    writer.write("slow consumer");

    EXPECT_EQ(test_support::read_lines(dir / "app.log").size(), 2u);
}

TEST(DedupLogWriterTests, ZeroHistoryDisablesSuppression) {
    const auto dir = test_support::make_temp_dir("writer_zero_history");
    auto cfg = file_config(dir / "app.log");
    cfg.max_history = 0;
    DedupLogWriter writer(cfg);

    for (int i = 0; i < 7; ++i) {
        writer.write("same", Level::Debug);
    }
    EXPECT_EQ(test_support::read_lines(dir / "app.log").size(), 7u);
}

TEST(DedupLogWriterTests, ZeroWindowDisablesSuppression) {
    const auto dir = test_support::make_temp_dir("writer_zero_window");
    auto cfg = file_config(dir / "app.log");
    cfg.stale_window = 0ms;
    DedupLogWriter writer(cfg, nullptr, clock_at(test_support::local_time_point(2024, 1, 10)));

    for (int i = 0; i < 7; ++i) {
        writer.write("same", Level::Debug);
    }
    EXPECT_EQ(test_support::read_lines(dir / "app.log").size(), 7u);
}

TEST(DedupLogWriterTests, ClearHistoryAllowsRepeat) {
    const auto dir = test_support::make_temp_dir("writer_clear");
    DedupLogWriter writer(file_config(dir / "app.log"));

    writer.write("cache miss");
    writer.write("cache miss");
    EXPECT_EQ(writer.history_size(), 1u);
    writer.clear_history();
    EXPECT_EQ(writer.history_size(), 0u);
    writer.write("cache miss");

    EXPECT_EQ(test_support::read_lines(dir / "app.log").size(), 2u);
}

TEST(DedupLogWriterTests, NoneLevelOnlyEchoesToConsole) {
    const auto dir = test_support::make_temp_dir("writer_none");
    std::FILE* console = std::tmpfile();
    ASSERT_NE(console, nullptr);
    auto cfg = file_config(dir / "app.log");
    cfg.console = console;
    cfg.time_format = "HH:mm";
    DedupLogWriter writer(cfg, nullptr, clock_at(test_support::local_time_point(2024, 1, 10, 13, 45)));

    writer.write("console only", Level::None);
    writer.write("console only", Level::None);
    writer.write_async("console only", Level::None).wait();
    writer.write_deferred("console only", Level::None, 0);
    writer.flush();

    EXPECT_FALSE(std::filesystem::exists(dir / "app.log"));
    EXPECT_EQ(writer.history_size(), 0u);

    std::rewind(console);
    char buf[256];
    int lines = 0;
    while (std::fgets(buf, sizeof(buf), console)) {
        EXPECT_STREQ(buf, "[13:45] [None] console only\n");
        ++lines;
    }
    EXPECT_EQ(lines, 4);
    std::fclose(console);
}

TEST(DedupLogWriterTests, ConcurrentDistinctWritesAllLand) {
    const auto dir = test_support::make_temp_dir("writer_concurrent");
    auto cfg = file_config(dir / "app.log");
    cfg.max_history = 1000;
    DedupLogWriter writer(cfg);
    FailureLog failures;
    failures.attach(writer);

    constexpr int producers = 8;
    constexpr int per_thread = 50;
    std::vector<std::thread> threads;
    threads.reserve(producers);
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&writer, p] {
            for (int i = 0; i < per_thread; ++i) {
                const std::string msg = "p" + std::to_string(p) + "-" + std::to_string(i);
                if (i % 2 == 0) {
                    writer.write(msg);
                } else {
                    writer.write_async(msg);
                }
            }
        });
    }
    for (auto& t : threads) t.join();
    writer.flush();

    const auto lines = test_support::read_lines(dir / "app.log");
    EXPECT_EQ(lines.size(), static_cast<std::size_t>(producers * per_thread));
    std::set<std::string> unique(lines.begin(), lines.end());
    EXPECT_EQ(unique.size(), lines.size());
    for (const auto& line : lines) {
        EXPECT_NE(line.find("] [Info] p"), std::string::npos) << line;
    }
    EXPECT_EQ(failures.count(), 0u);
}

TEST(DedupLogWriterTests, ConcurrentDuplicatesWrittenOnce) {
    const auto dir = test_support::make_temp_dir("writer_concurrent_dupes");
    DedupLogWriter writer(file_config(dir / "app.log"));

    std::vector<std::thread> threads;
    for (int p = 0; p < 8; ++p) {
        threads.emplace_back([&writer] {
            for (int i = 0; i < 20; ++i) {
                writer.write_async("shared failure", Level::Error);
            }
        });
    }
    for (auto& t : threads) t.join();
    writer.flush();

    EXPECT_EQ(test_support::read_lines(dir / "app.log").size(), 1u);
}

TEST(DedupLogWriterTests, WriteAsyncFutureSettles) {
    const auto dir = test_support::make_temp_dir("writer_async");
    DedupLogWriter writer(file_config(dir / "app.log"));

    auto fut = writer.write_async("async line", Level::Success);
    ASSERT_TRUE(fut.valid());
    EXPECT_EQ(fut.wait_for(5s), std::future_status::ready);

    const auto lines = test_support::read_lines(dir / "app.log");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("[Success] async line"), std::string::npos);
}

TEST(DedupLogWriterTests, DeferredWaitsForLockRelease) {
    const auto dir = test_support::make_temp_dir("writer_deferred_release");
    const auto path = dir / "app.log";
    DedupLogWriter writer(file_config(path));
    FailureLog failures;
    failures.attach(writer);

    ExclusiveFileLock lock(path);
    ASSERT_TRUE(lock.locked());

    writer.write_deferred("queued behind lock", Level::Info, 300);
    std::thread releaser([&lock] {
        std::this_thread::sleep_for(100ms);
        lock.release();
    });
    releaser.join();
    writer.flush();

    const auto lines = test_support::read_lines(path);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("queued behind lock"), std::string::npos);
    EXPECT_EQ(failures.count(), 0u);
}

TEST(DedupLogWriterTests, DeferredAbandonedWhenBudgetExpires) {
    const auto dir = test_support::make_temp_dir("writer_deferred_expire");
    const auto path = dir / "app.log";
    DedupLogWriter writer(file_config(path));
    FailureLog failures;
    failures.attach(writer);

    ExclusiveFileLock lock(path);
    ASSERT_TRUE(lock.locked());

    writer.write_deferred("never lands", Level::Warning, 3);
    writer.flush();

    ASSERT_EQ(failures.count(), 1u);
    EXPECT_EQ(failures.failures[0].first, "never lands");
    EXPECT_EQ(failures.failures[0].second.error_code, EWOULDBLOCK);
    EXPECT_EQ(failures.failures[0].second.path, path);

    lock.release();
    EXPECT_TRUE(test_support::read_lines(path).empty());
}

TEST(DedupLogWriterTests, DeferredUsesConfiguredRetries) {
    const auto dir = test_support::make_temp_dir("writer_deferred_default");
    const auto path = dir / "app.log";
    auto cfg = file_config(path);
    cfg.deferred_retries = 2;
    cfg.deferred_poll_interval = 5ms;
    DedupLogWriter writer(cfg);
    FailureLog failures;
    failures.attach(writer);

    ExclusiveFileLock lock(path);
    ASSERT_TRUE(lock.locked());
    const auto start = std::chrono::steady_clock::now();
    writer.write_deferred("short budget");
    writer.flush();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(failures.count(), 1u);
    EXPECT_GE(elapsed, 10ms);
    EXPECT_LT(elapsed, 2s);
}

TEST(DedupLogWriterTests, DatedNamesDifferAcrossDays) {
    const auto dir = test_support::make_temp_dir("writer_dated_names");
    DedupLogConfig cfg{};
    cfg.base_dir = dir;
    cfg.program_name = "svc";
    cfg.console = nullptr;
    auto clock = clock_at(test_support::local_time_point(2026, 1, 15));
    auto* clk = clock.get();
    DedupLogWriter writer(cfg, nullptr, std::move(clock));

    const auto first = writer.log_name();
    EXPECT_EQ(first, dir / "Logs" / "2026" / "01-January" / "svc_15.log");
    EXPECT_EQ(writer.log_path(), first.parent_path());

    clk->set(test_support::local_time_point(2026, 2, 3));
    const auto second = writer.log_name();
    EXPECT_EQ(second, dir / "Logs" / "2026" / "02-February" / "svc_03.log");
    EXPECT_NE(first, second);
    // Accessors follow the date before any write triggered rotation.
    EXPECT_EQ(writer.active_log_file(), first);
}

TEST(DedupLogWriterTests, RotatesOnDateChange) {
    const auto dir = test_support::make_temp_dir("writer_rotation");
    DedupLogConfig cfg{};
    cfg.base_dir = dir;
    cfg.program_name = "svc";
    cfg.console = nullptr;
    auto clock = clock_at(test_support::local_time_point(2026, 3, 31, 23, 59, 0));
    auto* clk = clock.get();
    DedupLogWriter writer(cfg, nullptr, std::move(clock));

    const auto day1 = dir / "Logs" / "2026" / "03-March" / "svc_31.log";
    const auto day2 = dir / "Logs" / "2026" / "04-April" / "svc_01.log";
    EXPECT_EQ(writer.active_log_file(), day1);

    writer.write("before midnight");
    clk->advance(2min);
    writer.write("after midnight");

    EXPECT_EQ(writer.active_log_file(), day2);
    ASSERT_EQ(test_support::read_lines(day1).size(), 1u);
    ASSERT_EQ(test_support::read_lines(day2).size(), 1u);
    EXPECT_NE(test_support::read_lines(day2)[0].find("after midnight"), std::string::npos);
}

TEST(DedupLogWriterTests, ManualPathAccessors) {
    const auto dir = test_support::make_temp_dir("writer_manual_accessors");
    DedupLogWriter writer(file_config(dir / "sub" / "app.log"));
    EXPECT_EQ(writer.log_name(), dir / "sub" / "app.log");
    EXPECT_EQ(writer.log_path(), dir / "sub");

    DedupLogWriter bare(file_config("bare.log"));
    EXPECT_EQ(bare.log_name(), std::filesystem::path("bare.log"));
    EXPECT_EQ(bare.log_path(), std::filesystem::current_path());
}

TEST(DedupLogWriterTests, DisposeStopsWritesAndIsIdempotent) {
    const auto dir = test_support::make_temp_dir("writer_dispose");
    std::FILE* console = std::tmpfile();
    ASSERT_NE(console, nullptr);
    auto cfg = file_config(dir / "app.log");
    cfg.console = console;
    cfg.time_format = "HH:mm";
    DedupLogWriter writer(cfg, nullptr, clock_at(test_support::local_time_point(2024, 1, 10, 8, 30)));

    writer.write("before dispose");
    EXPECT_EQ(writer.history_size(), 1u);
    writer.dispose();
    writer.dispose();
    EXPECT_TRUE(writer.disposed());
    EXPECT_EQ(writer.history_size(), 0u);

    writer.write("after dispose");
    writer.write_async("after dispose async").wait();
    writer.write_deferred("after dispose deferred", Level::Info, 0);
    writer.flush();

    const auto lines = test_support::read_lines(dir / "app.log");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("before dispose"), std::string::npos);

    // Console echo keeps working from every entry point.
    writer.write("sync", Level::None);
    writer.write_async("async", Level::None).wait();
    writer.write_deferred("deferred", Level::None);
    writer.flush();

    const auto echoed = read_console(console);
    ASSERT_EQ(echoed.size(), 3u);
    EXPECT_EQ(echoed[0], "[08:30] [None] sync\n");
    EXPECT_EQ(echoed[1], "[08:30] [None] async\n");
    EXPECT_EQ(echoed[2], "[08:30] [None] deferred\n");
    std::fclose(console);
}

TEST(DedupLogWriterTests, DisposeEndsDeferredLockWait) {
    const auto dir = test_support::make_temp_dir("writer_dispose_deferred");
    const auto path = dir / "app.log";
    auto writer = std::make_unique<DedupLogWriter>(file_config(path));
    FailureLog failures;
    failures.attach(*writer);

    ExclusiveFileLock lock(path);
    ASSERT_TRUE(lock.locked());

    // 300 retries at the default 10 ms poll interval would wait about three seconds.
    writer->write_deferred("abandoned", Level::Info, 300);
    std::this_thread::sleep_for(20ms);

    const auto start = std::chrono::steady_clock::now();
    writer->dispose();
    writer.reset();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 500ms);
    EXPECT_EQ(failures.count(), 0u);
    lock.release();
    EXPECT_TRUE(test_support::read_lines(path).empty());
}

TEST(DedupLogWriterTests, DeferredLockWaitDoesNotDelayAsyncWrites) {
    auto sink = std::make_unique<ScriptedLockSink>();
    auto* raw = sink.get();
    raw->locked = true;
    auto cfg = file_config("unused.log");
    cfg.deferred_poll_interval = 5ms;
    DedupLogWriter writer(cfg, std::move(sink));

    writer.write_deferred("after unlock", Level::Info, 1000);
    auto fut = writer.write_async("not held up", Level::Info);
    ASSERT_TRUE(fut.valid());
    EXPECT_EQ(fut.wait_for(2s), std::future_status::ready);

    auto lines = raw->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("not held up"), std::string::npos);

    raw->locked = false;
    writer.flush();
    lines = raw->lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[1].find("after unlock"), std::string::npos);
}

TEST(DedupLogWriterTests, AsyncWritesLandInSubmissionOrder) {
    auto sink = std::make_unique<ScriptedLockSink>();
    auto* raw = sink.get();
    auto cfg = file_config("unused.log");
    cfg.max_history = 1000;
    DedupLogWriter writer(cfg, std::move(sink));

    constexpr int count = 200;
    for (int i = 0; i < count; ++i) {
        writer.write_async("job-" + std::to_string(i));
    }
    writer.flush();

    const auto lines = raw->lines();
    ASSERT_EQ(lines.size(), static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        EXPECT_NE(lines[i].find("] job-" + std::to_string(i) + "\n"), std::string::npos) << lines[i];
    }
}

TEST(DedupLogWriterTests, ReportsAppendFailure) {
    const auto dir = test_support::make_temp_dir("writer_append_failure");
    const auto path = dir / "missing" / "app.log";
    DedupLogWriter writer(file_config(path));
    FailureLog failures;
    failures.attach(writer);

    EXPECT_NO_THROW(writer.write("lost line", Level::Error));

    ASSERT_EQ(failures.count(), 1u);
    EXPECT_EQ(failures.failures[0].first, "lost line");
    EXPECT_EQ(failures.failures[0].second.error_code, ENOENT);
    EXPECT_EQ(failures.failures[0].second.path, path);
    EXPECT_FALSE(failures.failures[0].second.detail.empty());
}

TEST(DedupLogWriterTests, HandlersAllRunEvenIfOneThrows) {
    auto sink = std::make_unique<FailingSink>(ENOSPC);
    auto* raw = sink.get();
    DedupLogWriter writer(file_config("unused.log"), std::move(sink));

    int calls = 0;
    writer.on_write_failure([](const std::string&, const WriteError&) { throw std::runtime_error("handler bug"); });
    writer.on_write_failure([&calls](const std::string& msg, const WriteError& err) {
        EXPECT_EQ(msg, "disk is full");
        EXPECT_EQ(err.error_code, ENOSPC);
        ++calls;
    });

    EXPECT_NO_THROW(writer.write("disk is full", Level::Error));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(raw->append_calls, 1);
    EXPECT_NE(raw->last_data.find("[Error] disk is full\n"), std::string::npos);

    // A failed append still counts as seen for duplicate purposes.
    writer.write("disk is full", Level::Error);
    EXPECT_EQ(raw->append_calls, 1);
}

TEST(DedupLogWriterTests, FailuresWithoutHandlerAreDropped) {
    auto sink = std::make_unique<FailingSink>(EACCES);
    auto* raw = sink.get();
    DedupLogWriter writer(file_config("unused.log"), std::move(sink));
    EXPECT_NO_THROW(writer.write("nobody listens"));
    EXPECT_EQ(raw->append_calls, 1);
}

} // namespace
