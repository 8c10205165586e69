#pragma once
#include "cgraph/core/clock.hpp"
#include "cgraph/directory/i_key_directory.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
namespace cgraph::e2ee::directory {

/**
 * @brief In-process key directory
 *
 * Holds the server side of the directory for any number of users and hands
 * out per-user connections through ConnectAs(). Used by tests, the example
 * program and local development builds.
 *
 * Server rules it enforces:
 *  - a fetch issues the oldest unused one-time prekey of the user's most
 *    recently registered device and marks it used in the same step;
 *  - re-registering a device with a different identity key replaces it and
 *    logs a warning;
 *  - uploads skip key ids the device already published.
 *
 * FailNextCalls()/SetAvailable() inject transport faults.
 */
class LoopbackKeyDirectory : public std::enable_shared_from_this<LoopbackKeyDirectory> {
public:
    [[nodiscard]] static std::shared_ptr<LoopbackKeyDirectory> Create(Clock clock = SystemClock());

    LoopbackKeyDirectory(const LoopbackKeyDirectory&) = delete;
    LoopbackKeyDirectory& operator=(const LoopbackKeyDirectory&) = delete;

    /// Connection authenticated as `user_id`.
    [[nodiscard]] std::shared_ptr<IKeyDirectory> ConnectAs(std::string user_id);

    void FailNextCalls(uint32_t count) noexcept;
    void SetAvailable(bool available) noexcept;

    [[nodiscard]] uint64_t FetchCount() const noexcept {
        return fetch_count_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] size_t UnusedPrekeyCount(std::string_view user_id, std::string_view device_id) const;
    [[nodiscard]] bool IsRegistered(std::string_view user_id, std::string_view device_id) const;

private:
    class Connection;

    struct PublishedPrekey {
        std::string key_id;
        std::string public_key;
        uint64_t sequence = 0;
        bool used = false;
    };

    struct DeviceRecord {
        std::string identity_key;
        std::string identity_key_id;
        std::string identity_signing_key;
        std::string signed_prekey;
        std::string signed_prekey_signature;
        std::string signed_prekey_id;
        std::vector<PublishedPrekey> prekeys;
        TimePoint registered_at;
        uint64_t registration_sequence = 0;
    };

    using DeviceMap = std::map<std::string, DeviceRecord, std::less<>>;

    explicit LoopbackKeyDirectory(Clock clock);

    [[nodiscard]] bool ConsumeInjectedFault();
    uint32_t AppendPrekeysLocked(
        DeviceRecord& device,
        const google::protobuf::RepeatedPtrField<pb::OneTimePreKeyUpload>& prekeys);

    Result<Unit, E2eeFailure> Register(std::string_view user_id, const pb::RegistrationRequest& request);
    Result<uint32_t, E2eeFailure> Upload(std::string_view user_id, const pb::PrekeyUploadRequest& request);
    Result<uint32_t, E2eeFailure> RemainingCount(std::string_view user_id, std::string_view device_id);
    Result<pb::ServerPrekeyBundle, E2eeFailure> Fetch(std::string_view user_id);
    Result<std::vector<pb::DeviceInfo>, E2eeFailure> List(std::string_view user_id);
    Result<Unit, E2eeFailure> Revoke(std::string_view user_id, std::string_view device_id);

    Clock clock_;
    mutable std::mutex lock_;
    std::map<std::string, DeviceMap, std::less<>> users_;
    uint64_t next_sequence_ = 0;
    std::atomic<uint32_t> fail_next_{0};
    std::atomic<bool> available_{true};
    std::atomic<uint64_t> fetch_count_{0};
};
}
