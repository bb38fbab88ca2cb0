#include "persist/log_naming.hpp"

#include <fstream>
#include <system_error>

#include "util/log.hpp"

namespace persist {

namespace {

constexpr const char* kLastResortName = "Application";

std::string two_digits(int v) {
    std::string s = std::to_string(v);
    if (s.size() < 2) {
        s.insert(s.begin(), '0');
    }
    return s;
}

std::filesystem::path current_dir_or_relative() noexcept {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        return {};
    }
    return cwd;
}

std::filesystem::path fallback_log_file(const LogNaming& naming) noexcept {
    const auto cwd = current_dir_or_relative();
    try {
        if (!naming.program_name.empty()) {
            return cwd / (naming.program_name + ".log");
        }
    } catch (const std::exception& ex) {
        DLOG_DIAG_WARN("fallback log name from program name failed: %s", ex.what());
    }
    try {
        const std::string alt = process_command_name();
        if (!alt.empty()) {
            return cwd / (alt + ".log");
        }
    } catch (const std::exception& ex) {
        DLOG_DIAG_WARN("fallback log name from command name failed: %s", ex.what());
    }
    try {
        return cwd / (std::string(kLastResortName) + ".log");
    } catch (const std::exception& ex) {
        DLOG_DIAG_ERROR("cannot build any log file name: %s", ex.what());
    }
    return {};
}

} // namespace

std::filesystem::path dated_log_directory(const std::filesystem::path& base_dir, const util::CalendarDate& date) {
    const std::string month_dir = two_digits(date.month) + "-" + std::string(util::month_name(date.month));
    return base_dir / "Logs" / std::to_string(date.year) / month_dir;
}

std::filesystem::path dated_log_file(const LogNaming& naming, const util::CalendarDate& date) {
    return dated_log_directory(naming.base_dir, date) / (naming.program_name + "_" + two_digits(date.day) + ".log");
}

std::string executable_name() noexcept {
    try {
        std::error_code ec;
        const auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
        if (ec) {
            return {};
        }
        return exe.stem().string();
    } catch (const std::exception&) {
        return {};
    }
}

std::string process_command_name() noexcept {
    try {
        std::ifstream in("/proc/self/comm");
        std::string name;
        if (!std::getline(in, name)) {
            return {};
        }
        while (!name.empty() && (name.back() == '\n' || name.back() == '\r' || name.back() == ' ')) {
            name.pop_back();
        }
        return name;
    } catch (const std::exception&) {
        return {};
    }
}

std::filesystem::path executable_directory() noexcept {
    try {
        std::error_code ec;
        const auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
        if (!ec && exe.has_parent_path()) {
            return exe.parent_path();
        }
    } catch (const std::exception& ex) {
        DLOG_DIAG_DEBUG("executable directory lookup failed: %s", ex.what());
    }
    return current_dir_or_relative();
}

LogNaming resolve_naming(LogNaming naming) noexcept {
    if (naming.base_dir.empty()) {
        naming.base_dir = executable_directory();
    }
    try {
        if (naming.program_name.empty()) {
            naming.program_name = executable_name();
        }
        if (naming.program_name.empty()) {
            naming.program_name = process_command_name();
        }
        if (naming.program_name.empty()) {
            naming.program_name = kLastResortName;
        }
    } catch (const std::exception& ex) {
        DLOG_DIAG_WARN("program name lookup failed: %s", ex.what());
    }
    return naming;
}

std::filesystem::path prepare_dated_log_file(const LogNaming& naming, const util::CalendarDate& date) noexcept {
    try {
        const auto dir = dated_log_directory(naming.base_dir, date);
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (!ec) {
            return dated_log_file(naming, date);
        }
        DLOG_DIAG_WARN("cannot create log directory %s: %s", dir.string().c_str(), ec.message().c_str());
    } catch (const std::exception& ex) {
        DLOG_DIAG_WARN("dated log name failed: %s", ex.what());
    }
    return fallback_log_file(naming);
}

} // namespace persist
