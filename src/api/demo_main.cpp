#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "persist/dedup_log_writer.hpp"
#include "util/log.hpp"

namespace {

struct DemoOptions {
    persist::DedupLogConfig writer{};
    int count{50};
    std::chrono::milliseconds interval{250};
    std::uint32_t retries{50};
    bool quiet{false};
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --path <file>           Log file (default: dated file under --base-dir)\n"
              << "  --base-dir <dir>        Root of the dated Logs/ tree (default: executable dir)\n"
              << "  --time-format <pattern> Timestamp pattern (default yyyy-MM-dd hh:mm:ss.fff tt)\n"
              << "  --max-history <N>       Records remembered for duplicate checks (default 10)\n"
              << "  --stale-ms <ms>         Duplicate suppression window (default 10000)\n"
              << "  --count <N>             Duplicate messages per phase (default 50)\n"
              << "  --interval-ms <ms>      Delay between messages (default 250)\n"
              << "  --retries <N>           Lock probes per deferred write (default 50)\n"
              << "  --quiet                 No progress output\n"
              << "  --verbose               Internal diagnostics at debug level\n";
}

bool parse_cli(int argc, char** argv, DemoOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--path" && i + 1 < argc) {
            opts.writer.log_file_path = argv[++i];
        } else if (arg == "--base-dir" && i + 1 < argc) {
            opts.writer.base_dir = argv[++i];
        } else if (arg == "--time-format" && i + 1 < argc) {
            opts.writer.time_format = argv[++i];
        } else if (arg == "--max-history" && i + 1 < argc) {
            opts.writer.max_history = static_cast<std::size_t>(std::strtoull(argv[++i], nullptr, 10));
        } else if (arg == "--stale-ms" && i + 1 < argc) {
            opts.writer.stale_window = std::chrono::milliseconds{std::strtoll(argv[++i], nullptr, 10)};
        } else if (arg == "--count" && i + 1 < argc) {
            opts.count = std::atoi(argv[++i]);
        } else if (arg == "--interval-ms" && i + 1 < argc) {
            opts.interval = std::chrono::milliseconds{std::strtoll(argv[++i], nullptr, 10)};
        } else if (arg == "--retries" && i + 1 < argc) {
            opts.retries = static_cast<std::uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "--verbose") {
            util::set_diag_threshold(util::DiagLevel::Debug);
        } else {
            print_usage(argv[0]);
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    util::DiagLevel env_level{};
    if (util::parse_diag_level(std::getenv("DLOG_DIAG_LEVEL"), env_level)) {
        util::set_diag_threshold(env_level);
    }

    DemoOptions opts;
    // Short window so the demo shows a duplicate being accepted again.
    opts.writer.max_history = 10;
    opts.writer.stale_window = std::chrono::seconds(10);
    if (!parse_cli(argc, argv, opts)) {
        return 1;
    }

    persist::DedupLogWriter writer(opts.writer);
    writer.on_write_failure([](const std::string& msg, const persist::WriteError& err) {
        std::cerr << "write failed for '" << msg << "': " << err.detail << " (" << err.error_code << ")\n";
    });

    writer.write("Starting duplicate write test...");
    for (int i = 1; i <= opts.count; ++i) {
        std::this_thread::sleep_for(opts.interval);
        if (!opts.quiet) {
            std::cout << "async duplicate #" << i << "\n";
        }
        writer.write_async("This is a test message for duplicate checking.").wait();
    }

    writer.write_deferred("Starting deferred write test...", core::Level::Info, opts.retries);
    for (int i = 1; i <= opts.count; ++i) {
        std::this_thread::sleep_for(opts.interval);
        if (!opts.quiet) {
            std::cout << "deferred duplicate #" << i << "\n";
        }
        writer.write_deferred("This is a test message for deferred writing.", core::Level::Info, opts.retries);
    }
    writer.flush();

    writer.write("Logging tests completed.", core::Level::Success);
    writer.write("Console only, never written to the file.", core::Level::None);

    std::cout << "Log file: " << writer.active_log_file().string() << "\n";
    writer.dispose();
    return 0;
}
