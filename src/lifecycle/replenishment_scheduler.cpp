#include "cgraph/lifecycle/replenishment_scheduler.hpp"
#include "cgraph/debug/logger.hpp"

#include <stdexcept>

namespace cgraph::e2ee::lifecycle {

namespace {
    constexpr std::string_view kComponent = "REPLENISH";
}

ReplenishmentScheduler::ReplenishmentScheduler(Task task, const std::chrono::milliseconds interval)
    : task_(std::move(task))
    , interval_(interval) {
    if (!task_ || interval_.count() <= 0) {
        throw std::invalid_argument("ReplenishmentScheduler needs a task and a positive interval");
    }
}

ReplenishmentScheduler::~ReplenishmentScheduler() {
    Stop();
}

void ReplenishmentScheduler::Start() {
    std::lock_guard lock(mutex_);
    if (worker_.joinable()) {
        return;
    }
    stop_requested_ = false;
    triggered_ = true;
    running_.store(true, std::memory_order_release);
    worker_ = std::thread([this] { Run(); });
}

void ReplenishmentScheduler::TriggerNow() {
    {
        std::lock_guard lock(mutex_);
        triggered_ = true;
    }
    wake_.notify_one();
}

void ReplenishmentScheduler::Stop() {
    std::thread worker;
    {
        std::lock_guard lock(mutex_);
        stop_requested_ = true;
        worker = std::move(worker_);
    }
    wake_.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
}

void ReplenishmentScheduler::Run() {
    CGRAPH_LOG_DEBUG(kComponent, "Scheduler started, interval {}ms", interval_.count());
    std::unique_lock lock(mutex_);
    while (!stop_requested_) {
        wake_.wait_for(lock, interval_, [this] { return stop_requested_ || triggered_; });
        if (stop_requested_) {
            break;
        }
        triggered_ = false;
        lock.unlock();
        task_();
        ticks_.fetch_add(1, std::memory_order_acq_rel);
        lock.lock();
    }
    running_.store(false, std::memory_order_release);
    CGRAPH_LOG_DEBUG(kComponent, "Scheduler stopped");
}

}
