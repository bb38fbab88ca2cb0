#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>

#include "util/time_format.hpp"

namespace persist {

// Construction parameters of DedupLogWriter. Fixed for the writer's lifetime.
struct DedupLogConfig {
    // Target file. Empty selects dated naming under base_dir with daily rotation.
    std::filesystem::path log_file_path{};

    // Display pattern for the line timestamp (see util::format_time).
    std::string time_format{util::kDefaultTimeFormat};

    // Duplicate suppression: at most max_history recent records, each valid for stale_window.
    // Either one at zero disables suppression.
    std::size_t max_history{50};
    std::chrono::milliseconds stale_window{std::chrono::minutes(30)};

    // Dated naming only. Empty base_dir means the executable's directory; empty
    // program_name means the executable's name.
    std::filesystem::path base_dir{};
    std::string program_name{};

    // Deferred writes: probe interval and default number of probes while the file is locked.
    std::chrono::milliseconds deferred_poll_interval{10};
    std::uint32_t deferred_retries{50};

    // Echo target for Level::None records. nullptr silences them.
    std::FILE* console{stdout};

    bool uses_dated_naming() const noexcept { return log_file_path.empty(); }
};

[[nodiscard]] inline DedupLogConfig default_dedup_log_config() { return DedupLogConfig{}; }

} // namespace persist
