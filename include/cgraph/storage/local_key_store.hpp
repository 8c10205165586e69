#pragma once
#include "cgraph/core/result.hpp"
#include "cgraph/core/failures.hpp"
#include "cgraph/core/clock.hpp"
#include "cgraph/core/constants.hpp"
#include "cgraph/models/key_bundle.hpp"
#include "cgraph/storage/i_secure_storage.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>
namespace cgraph::e2ee::storage {
using models::IdentityKeyPair;
using models::SignedPreKey;
using models::OneTimePreKey;
using models::KeyBundle;

/// Key material restored from device storage.
struct LocalIdentity {
    IdentityKeyPair identity;
    SignedPreKey signed_pre_key;
    TimePoint created_at;
};

/**
 * @brief Device-local persistence of the key bundle
 *
 * The identity pair, signing pair, signed prekey and device id are written
 * as one record under one storage key, so a reader sees all of them or none.
 * Private halves of published one-time prekeys live in a separate vault
 * record and are deleted once consumed. Every append also drops vault
 * entries older than the retention window, which covers prekeys the
 * directory handed out for a message that never arrived.
 *
 * Save() refuses to overwrite an existing record. The check and the write
 * happen under one lock, which makes Save() the per-device critical section
 * that keeps concurrent setups from clobbering each other.
 */
class LocalKeyStore {
public:
    explicit LocalKeyStore(
        std::shared_ptr<ISecureStorage> storage,
        Clock clock = SystemClock(),
        std::chrono::milliseconds one_time_prekey_retention = ProtocolConstants::DEFAULT_ONE_TIME_PREKEY_RETENTION);

    LocalKeyStore(const LocalKeyStore&) = delete;
    LocalKeyStore& operator=(const LocalKeyStore&) = delete;

    /// Persist the whole bundle: vault first, then the identity record that marks the device initialized.
    [[nodiscard]] Result<Unit, E2eeFailure> Save(const KeyBundle& bundle);

    /// nullopt when the device has never been set up (or was cleared).
    [[nodiscard]] Result<std::optional<LocalIdentity>, E2eeFailure> Load();

    [[nodiscard]] Result<bool, E2eeFailure> HasKeyMaterial();

    /// Removes identity record, one-time prekey vault and session cache.
    [[nodiscard]] Result<Unit, E2eeFailure> Clear();

    /// Appends to the vault after pruning entries past the retention window.
    [[nodiscard]] Result<Unit, E2eeFailure> AddOneTimePreKeys(const std::vector<OneTimePreKey>& keys);

    [[nodiscard]] Result<std::optional<OneTimePreKey>, E2eeFailure> FindOneTimePreKey(std::string_view key_id);

    /// Returns false when the key was already gone.
    [[nodiscard]] Result<bool, E2eeFailure> RemoveOneTimePreKey(std::string_view key_id);

    [[nodiscard]] Result<size_t, E2eeFailure> OneTimePreKeyCount();

    [[nodiscard]] const std::shared_ptr<ISecureStorage>& Storage() const noexcept {
        return storage_;
    }

private:
    [[nodiscard]] Result<Unit, E2eeFailure> AppendToVaultLocked(const std::vector<OneTimePreKey>& keys);

    std::shared_ptr<ISecureStorage> storage_;
    Clock clock_;
    std::chrono::milliseconds retention_;
    std::unique_ptr<std::mutex> lock_;
};
}
