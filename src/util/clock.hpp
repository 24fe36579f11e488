#pragma once

#include <chrono>
#include <cstdint>

namespace util {

// Wall clock used for received_at and movement timestamps. Virtual so tests can
// substitute a deterministic source.
class SystemClock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~SystemClock() = default;
    virtual time_point now() const noexcept { return std::chrono::system_clock::now(); }

    std::uint64_t now_ns() const noexcept {
        return static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(now().time_since_epoch()).count());
    }
};

} // namespace util
