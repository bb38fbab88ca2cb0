#pragma once

#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdarg>
#include <mutex>

namespace util {

// Internal diagnostics only. Records written by DedupLogWriter never go through here.
enum class DiagLevel { Trace, Debug, Info, Warn, Error, Off };

inline const char* level_name(DiagLevel lvl) noexcept {
    switch (lvl) {
    case DiagLevel::Trace: return "TRACE";
    case DiagLevel::Debug: return "DEBUG";
    case DiagLevel::Info: return "INFO";
    case DiagLevel::Warn: return "WARN";
    case DiagLevel::Error: return "ERROR";
    case DiagLevel::Off: return "OFF";
    }
    return "UNKNOWN";
}

namespace detail {
inline bool iequals(const char* a, const char* b) noexcept {
    for (; *a && *b; ++a, ++b) {
        if (std::tolower(static_cast<unsigned char>(*a)) != std::tolower(static_cast<unsigned char>(*b))) {
            return false;
        }
    }
    return *a == *b;
}
} // namespace detail

// Accepts "trace", "debug", "info", "warn", "error", "off" (any case). Returns false otherwise.
inline bool parse_diag_level(const char* text, DiagLevel& out) noexcept {
    if (!text) return false;
    static constexpr DiagLevel all[] = {DiagLevel::Trace, DiagLevel::Debug, DiagLevel::Info,
                                        DiagLevel::Warn,  DiagLevel::Error, DiagLevel::Off};
    for (DiagLevel lvl : all) {
        if (detail::iequals(text, level_name(lvl))) {
            out = lvl;
            return true;
        }
    }
    return false;
}

namespace detail {
inline std::mutex& diag_mutex() {
    static std::mutex mtx;
    return mtx;
}

inline std::atomic<DiagLevel>& diag_threshold() {
    static std::atomic<DiagLevel> threshold{DiagLevel::Warn};
    return threshold;
}

inline void diag_impl(DiagLevel lvl, const char* fmt, va_list args) {
    std::lock_guard<std::mutex> lock(diag_mutex());
    std::fprintf(stderr, "dlog %s: ", level_name(lvl));
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
}
} // namespace detail

inline void set_diag_threshold(DiagLevel lvl) noexcept {
    detail::diag_threshold().store(lvl, std::memory_order_relaxed);
}

inline DiagLevel diag_threshold() noexcept {
    return detail::diag_threshold().load(std::memory_order_relaxed);
}

inline bool diag_enabled(DiagLevel lvl) noexcept {
    return lvl != DiagLevel::Off && lvl >= diag_threshold();
}

inline void diag(DiagLevel lvl, const char* fmt, ...) {
    if (!diag_enabled(lvl)) return;
    va_list args;
    va_start(args, fmt);
    detail::diag_impl(lvl, fmt, args);
    va_end(args);
}

} // namespace util

#define DLOG_DIAG_TRACE(FMT, ...) ::util::diag(::util::DiagLevel::Trace, (FMT) __VA_OPT__(, __VA_ARGS__))
#define DLOG_DIAG_DEBUG(FMT, ...) ::util::diag(::util::DiagLevel::Debug, (FMT) __VA_OPT__(, __VA_ARGS__))
#define DLOG_DIAG_INFO(FMT, ...)  ::util::diag(::util::DiagLevel::Info,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define DLOG_DIAG_WARN(FMT, ...)  ::util::diag(::util::DiagLevel::Warn,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define DLOG_DIAG_ERROR(FMT, ...) ::util::diag(::util::DiagLevel::Error, (FMT) __VA_OPT__(, __VA_ARGS__))
