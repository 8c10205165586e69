#pragma once
#include "cgraph/core/clock.hpp"
#include <atomic>
#include <chrono>
#include <memory>

namespace cgraph::e2ee::test_helpers {

/// Clock that only moves when the test says so. Copies share the same time.
class ManualClock {
public:
    explicit ManualClock(const int64_t start_millis = 1'700'000'000'000)
        : millis_(std::make_shared<std::atomic<int64_t>>(start_millis)) {}

    [[nodiscard]] TimePoint Now() const {
        return FromUnixMillis(millis_->load());
    }

    void Advance(const std::chrono::milliseconds delta) {
        millis_->fetch_add(delta.count());
    }

    [[nodiscard]] Clock AsClock() const {
        return [millis = millis_] { return FromUnixMillis(millis->load()); };
    }

private:
    std::shared_ptr<std::atomic<int64_t>> millis_;
};

}
