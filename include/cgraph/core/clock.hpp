#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
namespace cgraph::e2ee {
using TimePoint = std::chrono::system_clock::time_point;
/// Injected time source. Components that expire or schedule take one so tests can drive time.
using Clock = std::function<TimePoint()>;

inline Clock SystemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

[[nodiscard]] inline int64_t ToUnixMillis(const TimePoint time_point) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()).count();
}

[[nodiscard]] inline TimePoint FromUnixMillis(const int64_t millis) noexcept {
    return TimePoint(std::chrono::milliseconds(millis));
}
}
