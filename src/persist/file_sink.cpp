#include "persist/file_sink.hpp"

#include <cerrno>
#include <cstddef>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/file.h>
#include <sys/types.h>
#include <unistd.h>
#else
#include <Windows.h>
#endif

namespace persist {

#ifndef _WIN32

namespace {

class FdGuard {
public:
    explicit FdGuard(int fd) noexcept : fd_(fd) {}
    ~FdGuard() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const noexcept { return fd_; }

private:
    int fd_;
};

} // namespace

IoResult PosixFileSink::append(const std::filesystem::path& path, std::string_view data) noexcept {
    FdGuard fd(::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644));
    if (fd.get() < 0) {
        return {false, errno};
    }
    if (::flock(fd.get(), LOCK_SH | LOCK_NB) != 0) {
        return {false, errno};
    }

    const char* cur = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        const ssize_t ret = ::write(fd.get(), cur, remaining);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            return {false, errno};
        }
        if (ret == 0) {
            return {false, EIO};
        }
        cur += ret;
        remaining -= static_cast<std::size_t>(ret);
    }
    // Lock released by close().
    return {true, 0};
}

LockState PosixFileSink::probe_lock(const std::filesystem::path& path) noexcept {
    FdGuard fd(::open(path.c_str(), O_RDWR | O_CLOEXEC));
    if (fd.get() < 0) {
        return LockState::Unlocked;
    }
    // A shared request fails only against an exclusive holder, so concurrent appenders
    // are neither reported as a lock nor disturbed by the probe.
    if (::flock(fd.get(), LOCK_SH | LOCK_NB) != 0) {
        return errno == EWOULDBLOCK ? LockState::Locked : LockState::Unlocked;
    }
    return LockState::Unlocked; // lock dropped with the descriptor
}

std::unique_ptr<IFileSink> make_default_file_sink() { return std::make_unique<PosixFileSink>(); }

#else

IoResult WindowsFileSink::append(const std::filesystem::path& path, std::string_view data) noexcept {
    HANDLE handle = ::CreateFileW(path.c_str(),
                                  FILE_APPEND_DATA,
                                  FILE_SHARE_READ | FILE_SHARE_WRITE,
                                  nullptr,
                                  OPEN_ALWAYS,
                                  FILE_ATTRIBUTE_NORMAL,
                                  nullptr);
    if (handle == INVALID_HANDLE_VALUE) {
        return {false, static_cast<int>(::GetLastError())};
    }
    const char* cur = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        DWORD written = 0;
        if (!::WriteFile(handle, cur, static_cast<DWORD>(remaining), &written, nullptr)) {
            const int err = static_cast<int>(::GetLastError());
            ::CloseHandle(handle);
            return {false, err};
        }
        if (written == 0) {
            ::CloseHandle(handle);
            return {false, EIO};
        }
        cur += written;
        remaining -= written;
    }
    ::CloseHandle(handle);
    return {true, 0};
}

LockState WindowsFileSink::probe_lock(const std::filesystem::path& path) noexcept {
    HANDLE handle = ::CreateFileW(path.c_str(),
                                  GENERIC_READ | GENERIC_WRITE,
                                  0,
                                  nullptr,
                                  OPEN_EXISTING,
                                  FILE_ATTRIBUTE_NORMAL,
                                  nullptr);
    if (handle == INVALID_HANDLE_VALUE) {
        const DWORD err = ::GetLastError();
        return (err == ERROR_SHARING_VIOLATION || err == ERROR_LOCK_VIOLATION) ? LockState::Locked
                                                                               : LockState::Unlocked;
    }
    ::CloseHandle(handle);
    return LockState::Unlocked;
}

std::unique_ptr<IFileSink> make_default_file_sink() { return std::make_unique<WindowsFileSink>(); }

#endif

} // namespace persist
