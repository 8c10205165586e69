#pragma once
#include "cgraph/core/result.hpp"
#include "cgraph/core/failures.hpp"
#include "cgraph/lifecycle/replenishment_scheduler.hpp"
#include "cgraph/protocol/e2ee_manager.hpp"
#include "directory/key_directory.pb.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>
namespace cgraph::e2ee::lifecycle {

/**
 * @brief Device listing, revocation and one-time prekey upkeep
 *
 * Works on behalf of one E2eeManager, which must outlive it. Directory
 * failures of list and revoke are reported as Revocation.
 *
 * Destroying it is part of logout. The destructor shuts down the manager's
 * directory client before joining the background thread, so a top-up stuck
 * in retry backoff ends with Cancelled instead of holding up teardown.
 *
 * CheckAndReplenish() is single-flight: a call that overlaps a running
 * top-up returns immediately, so one low-water breach leads to exactly one
 * upload that brings the directory back to the high-water mark.
 */
class DeviceLifecycleManager {
public:
    explicit DeviceLifecycleManager(protocol::E2eeManager& manager);
    ~DeviceLifecycleManager();

    DeviceLifecycleManager(const DeviceLifecycleManager&) = delete;
    DeviceLifecycleManager& operator=(const DeviceLifecycleManager&) = delete;

    [[nodiscard]] Result<std::vector<proto::directory::DeviceInfo>, E2eeFailure> ListDevices();

    /// Revoking the active device also stops replenishment and wipes local key material.
    [[nodiscard]] Result<Unit, E2eeFailure> RevokeDevice(std::string_view device_id);

    [[nodiscard]] Result<uint32_t, E2eeFailure> GetPrekeyCount();

    [[nodiscard]] Result<uint32_t, E2eeFailure> UploadMorePrekeys();
    [[nodiscard]] Result<uint32_t, E2eeFailure> UploadMorePrekeys(uint32_t count);

    /// Returns how many prekeys were published; 0 when above the low-water mark or already running.
    [[nodiscard]] Result<uint32_t, E2eeFailure> CheckAndReplenish();

    void StartReplenishment();
    /// App came back to the foreground.
    void TriggerReplenishment();
    void StopReplenishment();

    [[nodiscard]] bool IsReplenishing() const;
    /// Completed background checks since StartReplenishment(); 0 when stopped.
    [[nodiscard]] uint64_t ReplenishmentTickCount() const;

private:
    protocol::E2eeManager& manager_;
    std::mutex replenish_mutex_;
    mutable std::mutex scheduler_mutex_;
    std::unique_ptr<ReplenishmentScheduler> scheduler_;
};
}
