#pragma once

#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace core {

// Severity attached to every record. Values are single bits so callers may build masks.
// None is the sentinel that bypasses history and file: the record is echoed to console only.
enum class Level : std::uint8_t {
    None      = 0,
    Debug     = 1u << 0,
    Verbose   = 1u << 1,
    Info      = 1u << 2,
    Warning   = 1u << 3,
    Error     = 1u << 4,
    Success   = 1u << 5,
    Important = 1u << 6,
};

inline constexpr std::array<Level, 8> kAllLevels = {
    Level::None, Level::Debug, Level::Verbose, Level::Info,
    Level::Warning, Level::Error, Level::Success, Level::Important};

[[nodiscard]] constexpr std::string_view to_string(Level lvl) noexcept {
    switch (lvl) {
    case Level::None: return "None";
    case Level::Debug: return "Debug";
    case Level::Verbose: return "Verbose";
    case Level::Info: return "Info";
    case Level::Warning: return "Warning";
    case Level::Error: return "Error";
    case Level::Success: return "Success";
    case Level::Important: return "Important";
    }
    return "Unknown";
}

// Case-insensitive inverse of to_string().
[[nodiscard]] inline std::optional<Level> parse_level(std::string_view text) noexcept {
    for (Level lvl : kAllLevels) {
        const std::string_view name = to_string(lvl);
        if (name.size() != text.size()) continue;
        bool match = true;
        for (std::size_t i = 0; i < name.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(name[i])) !=
                std::tolower(static_cast<unsigned char>(text[i]))) {
                match = false;
                break;
            }
        }
        if (match) return lvl;
    }
    return std::nullopt;
}

} // namespace core
