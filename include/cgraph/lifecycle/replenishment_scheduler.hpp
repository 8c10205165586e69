#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
namespace cgraph::e2ee::lifecycle {

/**
 * @brief Background timer for one-time prekey top-ups
 *
 * Runs `task` once right after Start(), then every `interval`, and whenever
 * TriggerNow() is called (app returned to foreground). Stop() cancels the
 * timer and joins the worker; it must run before the key store is cleared
 * and must not be called from inside `task`.
 */
class ReplenishmentScheduler {
public:
    using Task = std::function<void()>;

    ReplenishmentScheduler(Task task, std::chrono::milliseconds interval);
    ~ReplenishmentScheduler();

    ReplenishmentScheduler(const ReplenishmentScheduler&) = delete;
    ReplenishmentScheduler& operator=(const ReplenishmentScheduler&) = delete;

    void Start();
    void TriggerNow();
    void Stop();

    [[nodiscard]] bool IsRunning() const noexcept {
        return running_.load(std::memory_order_acquire);
    }
    [[nodiscard]] uint64_t TickCount() const noexcept {
        return ticks_.load(std::memory_order_acquire);
    }

private:
    void Run();

    Task task_;
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_requested_ = false;
    bool triggered_ = false;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::thread worker_;
};
}
