#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include <string_view>

namespace util {

struct CalendarDate {
    int year{0};
    int month{0}; // 1-12
    int day{0};   // 1-31

    bool operator==(const CalendarDate&) const = default;
};

inline constexpr std::string_view kDefaultTimeFormat = "yyyy-MM-dd hh:mm:ss.fff tt";

// Broken-down local time of an instant.
[[nodiscard]] std::tm to_local_tm(std::chrono::system_clock::time_point tp) noexcept;

[[nodiscard]] CalendarDate local_date(std::chrono::system_clock::time_point tp) noexcept;

// English month name for 1-12, empty for anything else.
[[nodiscard]] std::string_view month_name(int month) noexcept;

// Renders a .NET-style custom date/time pattern:
//   yyyy yy  MMMM MMM MM M  dd d  HH H hh h  mm m  ss s  fff ff f  tt t
// Text in '...' or "..." and characters after '\' are copied literally, as is anything
// that is not a recognised specifier.
// Not supported: '\' inside a quoted literal is copied as-is and does not escape the
// closing quote, and the '%' single-specifier prefix is emitted as a literal '%'.
[[nodiscard]] std::string format_time(const std::tm& tm, int millis, std::string_view pattern);

// format_time() on the local time of `tp`.
[[nodiscard]] std::string format_local_time(std::chrono::system_clock::time_point tp, std::string_view pattern);

} // namespace util
