#ifndef PAPER_UTIL_TYPES_HPP
#define PAPER_UTIL_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>

namespace paper::util {

using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;

// nullopt = wait forever
using Deadline = std::optional<TimePoint>;

inline Deadline deadline_after(Duration timeout) {
    if (timeout.count() <= 0) {
        return std::nullopt;
    }
    return std::chrono::steady_clock::now() + timeout;
}

// milliseconds left before the deadline, clamped at 0. -1 (poll's "forever") when unset
inline int remaining_ms(const Deadline& deadline) {
    if (!deadline) {
        return -1;
    }
    auto left =
        std::chrono::duration_cast<Duration>(*deadline - std::chrono::steady_clock::now()).count();
    if (left <= 0) {
        return 0;
    }
    if (left > std::numeric_limits<int>::max()) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(left);
}

}  // namespace paper::util

#endif
