/**
 * @file Clock.hpp
 * @brief Injectable monotonic time source used by the TTL caches
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace util {

using TimePoint = std::chrono::steady_clock::time_point;
using Clock = std::function<TimePoint()>;

[[nodiscard]] inline auto steady_clock() -> Clock {
    return [] { return std::chrono::steady_clock::now(); };
}

/// Wall-clock milliseconds since the Unix epoch
[[nodiscard]] inline auto epoch_millis() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace util
