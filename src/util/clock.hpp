#pragma once

#include <chrono>

namespace util {

// Thin clock abstraction to enable deterministic testing of staleness and date rotation.
class WallClock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~WallClock() = default;
    virtual time_point now() const noexcept { return std::chrono::system_clock::now(); }
};

} // namespace util
