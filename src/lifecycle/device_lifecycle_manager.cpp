#include "cgraph/lifecycle/device_lifecycle_manager.hpp"
#include "cgraph/core/format.hpp"
#include "cgraph/debug/logger.hpp"

namespace cgraph::e2ee::lifecycle {

namespace {
    constexpr std::string_view kComponent = "LIFECYCLE";

    E2eeFailure AsRevocation(E2eeFailure failure) {
        if (failure.type == E2eeFailureType::Directory) {
            failure.type = E2eeFailureType::Revocation;
        }
        return failure;
    }
}

DeviceLifecycleManager::DeviceLifecycleManager(protocol::E2eeManager& manager)
    : manager_(manager) {}

DeviceLifecycleManager::~DeviceLifecycleManager() {
    manager_.Shutdown();
    StopReplenishment();
}

Result<std::vector<proto::directory::DeviceInfo>, E2eeFailure> DeviceLifecycleManager::ListDevices() {
    return manager_.DirectoryClient().ListDevices().MapErr(AsRevocation);
}

Result<Unit, E2eeFailure> DeviceLifecycleManager::RevokeDevice(std::string_view device_id) {
    auto local_device = manager_.GetDeviceId();
    const bool is_active = local_device.IsOk() && local_device.Unwrap() == device_id;

    auto revoked = manager_.DirectoryClient().RevokeDevice(device_id);
    if (revoked.IsErr()) {
        return Result<Unit, E2eeFailure>::Err(AsRevocation(std::move(revoked).UnwrapErr()));
    }
    if (!is_active) {
        CGRAPH_LOG_INFO(kComponent, "Revoked device {}", device_id);
        return Result<Unit, E2eeFailure>::Ok(unit);
    }

    CGRAPH_LOG_WARN(kComponent, "Active device {} revoked, wiping local key material", device_id);
    StopReplenishment();
    return manager_.WipeLocalState();
}

Result<uint32_t, E2eeFailure> DeviceLifecycleManager::GetPrekeyCount() {
    return manager_.GetRemainingPrekeyCount();
}

Result<uint32_t, E2eeFailure> DeviceLifecycleManager::UploadMorePrekeys() {
    return UploadMorePrekeys(manager_.Config().PreKeyUploadDefault());
}

Result<uint32_t, E2eeFailure> DeviceLifecycleManager::UploadMorePrekeys(const uint32_t count) {
    return manager_.UploadOneTimePreKeys(count);
}

Result<uint32_t, E2eeFailure> DeviceLifecycleManager::CheckAndReplenish() {
    std::unique_lock flight(replenish_mutex_, std::try_to_lock);
    if (!flight.owns_lock()) {
        CGRAPH_LOG_DEBUG(kComponent, "Replenishment already in progress");
        return Result<uint32_t, E2eeFailure>::Ok(0);
    }
    if (!manager_.IsInitialized()) {
        return Result<uint32_t, E2eeFailure>::Ok(0);
    }

    auto remaining = manager_.GetRemainingPrekeyCount();
    if (remaining.IsErr()) {
        return remaining;
    }
    const auto& config = manager_.Config();
    const uint32_t count = remaining.Unwrap();
    if (count >= config.LowWaterMark()) {
        CGRAPH_LOG_DEBUG(kComponent, "{} one-time prekeys remaining, no top-up needed", count);
        return Result<uint32_t, E2eeFailure>::Ok(0);
    }

    const uint32_t needed = config.HighWaterMark() - count;
    CGRAPH_LOG_INFO(kComponent, "{} one-time prekeys remaining (low water {}), uploading {}",
        count, config.LowWaterMark(), needed);
    return manager_.UploadOneTimePreKeys(needed);
}

void DeviceLifecycleManager::StartReplenishment() {
    std::lock_guard lock(scheduler_mutex_);
    if (scheduler_) {
        return;
    }
    scheduler_ = std::make_unique<ReplenishmentScheduler>(
        [this] {
            auto result = CheckAndReplenish();
            if (result.IsErr()) {
                CGRAPH_LOG_WARN(kComponent, "Scheduled replenishment failed: {}", result.UnwrapErr().message);
            }
        },
        manager_.Config().ReplenishInterval());
    scheduler_->Start();
}

void DeviceLifecycleManager::TriggerReplenishment() {
    std::lock_guard lock(scheduler_mutex_);
    if (scheduler_) {
        scheduler_->TriggerNow();
    }
}

bool DeviceLifecycleManager::IsReplenishing() const {
    std::lock_guard lock(scheduler_mutex_);
    return scheduler_ != nullptr && scheduler_->IsRunning();
}

uint64_t DeviceLifecycleManager::ReplenishmentTickCount() const {
    std::lock_guard lock(scheduler_mutex_);
    return scheduler_ ? scheduler_->TickCount() : 0;
}

void DeviceLifecycleManager::StopReplenishment() {
    std::unique_ptr<ReplenishmentScheduler> scheduler;
    {
        std::lock_guard lock(scheduler_mutex_);
        scheduler = std::move(scheduler_);
    }
    if (scheduler) {
        scheduler->Stop();
    }
}

}
