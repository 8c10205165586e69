#include <catch2/catch_test_macros.hpp>
#include "cgraph/lifecycle/replenishment_scheduler.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
using namespace cgraph::e2ee::lifecycle;

namespace {
    template<typename Predicate>
    bool WaitFor(Predicate predicate, const std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return predicate();
    }
}

TEST_CASE("ReplenishmentScheduler - Runs immediately on start", "[scheduler]") {
    std::atomic<int> runs{0};
    ReplenishmentScheduler scheduler([&runs] { ++runs; }, std::chrono::hours(1));
    REQUIRE_FALSE(scheduler.IsRunning());

    scheduler.Start();
    REQUIRE(scheduler.IsRunning());
    REQUIRE(WaitFor([&] { return runs.load() == 1; }));
    REQUIRE(WaitFor([&] { return scheduler.TickCount() == 1; }));

    SECTION("Trigger runs the task again without waiting for the interval") {
        scheduler.TriggerNow();
        REQUIRE(WaitFor([&] { return runs.load() == 2; }));
    }

    SECTION("Stop joins and stays stopped") {
        scheduler.Stop();
        REQUIRE_FALSE(scheduler.IsRunning());
        const int before = runs.load();
        scheduler.TriggerNow();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        REQUIRE(runs.load() == before);
    }
}

TEST_CASE("ReplenishmentScheduler - Periodic ticks", "[scheduler]") {
    std::atomic<int> runs{0};
    ReplenishmentScheduler scheduler([&runs] { ++runs; }, std::chrono::milliseconds(5));
    scheduler.Start();
    REQUIRE(WaitFor([&] { return runs.load() >= 4; }));
    scheduler.Stop();
}

TEST_CASE("ReplenishmentScheduler - Start is idempotent and restartable", "[scheduler]") {
    std::atomic<int> runs{0};
    ReplenishmentScheduler scheduler([&runs] { ++runs; }, std::chrono::hours(1));
    scheduler.Start();
    scheduler.Start();
    REQUIRE(WaitFor([&] { return runs.load() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE(runs.load() == 1);

    scheduler.Stop();
    scheduler.Start();
    REQUIRE(WaitFor([&] { return runs.load() == 2; }));
}

TEST_CASE("ReplenishmentScheduler - Stop waits for a running task", "[scheduler]") {
    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};
    ReplenishmentScheduler scheduler([&] {
        entered = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        finished = true;
    }, std::chrono::hours(1));
    scheduler.Start();
    REQUIRE(WaitFor([&] { return entered.load(); }));
    scheduler.Stop();
    REQUIRE(finished.load());
}

TEST_CASE("ReplenishmentScheduler - Rejects invalid arguments", "[scheduler]") {
    REQUIRE_THROWS_AS(ReplenishmentScheduler(nullptr, std::chrono::seconds(1)), std::invalid_argument);
    REQUIRE_THROWS_AS(ReplenishmentScheduler([] {}, std::chrono::milliseconds(0)), std::invalid_argument);
}
