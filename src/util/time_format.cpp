#include "util/time_format.hpp"

#include <array>
#include <cstddef>

namespace util {

namespace {

constexpr std::array<std::string_view, 12> kMonthNames = {
    "January", "February", "March",     "April",   "May",      "June",
    "July",    "August",   "September", "October", "November", "December"};

constexpr std::array<std::string_view, 7> kDayNames = {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"};

void append_padded(std::string& out, int value, std::size_t width) {
    const std::string digits = std::to_string(value < 0 ? -value : value);
    if (value < 0) {
        out.push_back('-');
    }
    if (digits.size() < width) {
        out.append(width - digits.size(), '0');
    }
    out += digits;
}

// Length of the run of `c` starting at `pos`.
std::size_t run_length(std::string_view pattern, std::size_t pos) noexcept {
    std::size_t n = 1;
    while (pos + n < pattern.size() && pattern[pos + n] == pattern[pos]) {
        ++n;
    }
    return n;
}

std::string_view weekday_name(int wday) noexcept {
    if (wday < 0 || wday > 6) return {};
    return kDayNames[static_cast<std::size_t>(wday)];
}

} // namespace

std::tm to_local_tm(std::chrono::system_clock::time_point tp) noexcept {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return tm;
}

CalendarDate local_date(std::chrono::system_clock::time_point tp) noexcept {
    const std::tm tm = to_local_tm(tp);
    return CalendarDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

std::string_view month_name(int month) noexcept {
    if (month < 1 || month > 12) return {};
    return kMonthNames[static_cast<std::size_t>(month - 1)];
}

std::string format_time(const std::tm& tm, int millis, std::string_view pattern) {
    std::string out;
    out.reserve(pattern.size() + 8);

    const int year = tm.tm_year + 1900;
    const int month = tm.tm_mon + 1;
    const int hour12 = tm.tm_hour % 12 == 0 ? 12 : tm.tm_hour % 12;
    const bool pm = tm.tm_hour >= 12;

    std::size_t i = 0;
    while (i < pattern.size()) {
        const char c = pattern[i];
        const std::size_t n = run_length(pattern, i);
        switch (c) {
        case 'y':
            if (n <= 2) {
                append_padded(out, year % 100, n);
            } else {
                append_padded(out, year, n);
            }
            i += n;
            break;
        case 'M':
            if (n <= 2) {
                append_padded(out, month, n);
            } else if (n == 3) {
                out += month_name(month).substr(0, 3);
            } else {
                out += month_name(month);
            }
            i += n;
            break;
        case 'd':
            if (n <= 2) {
                append_padded(out, tm.tm_mday, n);
            } else if (n == 3) {
                out += weekday_name(tm.tm_wday).substr(0, 3);
            } else {
                out += weekday_name(tm.tm_wday);
            }
            i += n;
            break;
        case 'H':
            append_padded(out, tm.tm_hour, n >= 2 ? 2 : 1);
            i += n;
            break;
        case 'h':
            append_padded(out, hour12, n >= 2 ? 2 : 1);
            i += n;
            break;
        case 'm':
            append_padded(out, tm.tm_min, n >= 2 ? 2 : 1);
            i += n;
            break;
        case 's':
            append_padded(out, tm.tm_sec, n >= 2 ? 2 : 1);
            i += n;
            break;
        case 'f': {
            std::string frac;
            append_padded(frac, millis, 3);
            if (n <= 3) {
                out += frac.substr(0, n);
            } else {
                out += frac;
                out.append(n - 3, '0');
            }
            i += n;
            break;
        }
        case 't':
            if (n == 1) {
                out.push_back(pm ? 'P' : 'A');
            } else {
                out += pm ? "PM" : "AM";
            }
            i += n;
            break;
        case '\'':
        case '"': {
            const std::size_t close = pattern.find(c, i + 1);
            if (close == std::string_view::npos) {
                out += pattern.substr(i + 1);
                i = pattern.size();
            } else {
                out += pattern.substr(i + 1, close - i - 1);
                i = close + 1;
            }
            break;
        }
        case '\\':
            if (i + 1 < pattern.size()) {
                out.push_back(pattern[i + 1]);
            }
            i += 2;
            break;
        default:
            out.push_back(c);
            ++i;
            break;
        }
    }
    return out;
}

std::string format_local_time(std::chrono::system_clock::time_point tp, std::string_view pattern) {
    const auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
    int millis = static_cast<int>(since_epoch.count() % 1000);
    if (millis < 0) {
        millis += 1000;
    }
    return format_time(to_local_tm(tp), millis, pattern);
}

} // namespace util
