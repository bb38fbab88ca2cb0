#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "util/time_format.hpp"

namespace persist {

// Inputs of the dated layout <base_dir>/Logs/<yyyy>/<MM>-<MonthName>/<program>_<dd>.log
struct LogNaming {
    std::filesystem::path base_dir;
    std::string program_name;
};

// <base_dir>/Logs/<yyyy>/<MM>-<MonthName>
[[nodiscard]] std::filesystem::path dated_log_directory(const std::filesystem::path& base_dir,
                                                        const util::CalendarDate& date);

// <dated_log_directory>/<program>_<dd>.log
[[nodiscard]] std::filesystem::path dated_log_file(const LogNaming& naming, const util::CalendarDate& date);

// Stem of the running executable (/proc/self/exe). Empty when unavailable.
[[nodiscard]] std::string executable_name() noexcept;

// Alternate identity source: the kernel's command name (/proc/self/comm). Empty when unavailable.
[[nodiscard]] std::string process_command_name() noexcept;

// Directory holding the running executable, or the current directory when unknown.
[[nodiscard]] std::filesystem::path executable_directory() noexcept;

// Fills empty fields of `naming` from the running process.
[[nodiscard]] LogNaming resolve_naming(LogNaming naming) noexcept;

// Creates the dated directory and returns the dated file. On failure falls back to
// <cwd>/<program>.log, then to the alternate identity, then to Application.log.
// Never throws and always yields a path.
[[nodiscard]] std::filesystem::path prepare_dated_log_file(const LogNaming& naming,
                                                           const util::CalendarDate& date) noexcept;

} // namespace persist
