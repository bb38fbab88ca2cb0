#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string_view>

namespace persist {

struct IoResult {
    bool ok{false};
    int error_code{0};
};

enum class LockState : std::uint8_t { Unlocked, Locked };

// Stateless file access used by DedupLogWriter. No handle outlives a call.
class IFileSink {
public:
    virtual ~IFileSink() = default;

    // Opens `path` for append with shared access, writes all of `data`, closes.
    // Creates the file but never its parent directories.
    virtual IoResult append(const std::filesystem::path& path, std::string_view data) noexcept = 0;

    // Best-effort check whether another holder keeps `path` exclusively locked.
    // Only contention reports Locked; any other failure (missing file included) is Unlocked.
    virtual LockState probe_lock(const std::filesystem::path& path) noexcept = 0;
};

#ifndef _WIN32
// Shared access is modelled with flock(): appends and the probe take LOCK_SH|LOCK_NB.
// A LOCK_EX holder therefore makes appends fail with EWOULDBLOCK and the probe report
// Locked, while concurrent appenders never block each other.
class PosixFileSink : public IFileSink {
public:
    IoResult append(const std::filesystem::path& path, std::string_view data) noexcept override;
    LockState probe_lock(const std::filesystem::path& path) noexcept override;
};
#else
class WindowsFileSink : public IFileSink {
public:
    IoResult append(const std::filesystem::path& path, std::string_view data) noexcept override;
    LockState probe_lock(const std::filesystem::path& path) noexcept override;
};
#endif

// Platform default sink.
std::unique_ptr<IFileSink> make_default_file_sink();

} // namespace persist
