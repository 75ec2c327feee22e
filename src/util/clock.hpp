#pragma once

#include <chrono>
#include <cstdint>

namespace util {

// Injectable monotonic clock; push deadlines are evaluated against it so tests
// can expire a context without sleeping.
class SteadyClock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~SteadyClock() = default;
    virtual time_point now() const noexcept { return std::chrono::steady_clock::now(); }
};

inline const SteadyClock& default_steady_clock() noexcept {
    static const SteadyClock clock;
    return clock;
}

[[nodiscard]] inline std::uint64_t monotonic_ns() noexcept {
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch()
        ).count()
    );
}

} // namespace util
