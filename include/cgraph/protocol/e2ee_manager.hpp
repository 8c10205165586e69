#pragma once
#include "cgraph/core/result.hpp"
#include "cgraph/core/failures.hpp"
#include "cgraph/core/clock.hpp"
#include "cgraph/configuration/e2ee_config.hpp"
#include "cgraph/directory/i_key_directory.hpp"
#include "cgraph/directory/key_directory_client.hpp"
#include "cgraph/directory/prekey_bundle_cache.hpp"
#include "cgraph/storage/i_secure_storage.hpp"
#include "cgraph/storage/local_key_store.hpp"
#include "cgraph/storage/session_store.hpp"
#include "common/encrypted_message.pb.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cgraph::e2ee::protocol {
    using storage::LocalIdentity;
    using models::SessionRecord;

    /**
     * @brief Per-login E2EE endpoint for one user on one device
     *
     * Owns the local key store, the session cache, the directory client and
     * the bundle cache; nothing here is process-global, so tearing the
     * manager down on logout drops all of it.
     *
     * Every message is sealed under a fresh X3DH secret (no ratchet). All
     * operations are synchronous and thread-safe. Operations that need key
     * material fail with NotInitialized before touching the network when
     * the device has not been set up.
     */
    class E2eeManager {
    public:
        [[nodiscard]] static Result<std::unique_ptr<E2eeManager>, E2eeFailure> Create(
            std::string local_user_id,
            std::shared_ptr<storage::ISecureStorage> storage,
            std::shared_ptr<directory::IKeyDirectory> directory,
            configuration::E2eeConfig config = configuration::E2eeConfig::Default(),
            Clock clock = SystemClock());

        ~E2eeManager();

        E2eeManager(const E2eeManager&) = delete;
        E2eeManager& operator=(const E2eeManager&) = delete;

        /// Restores key material from the store. Returns whether the device was already set up.
        [[nodiscard]] Result<bool, E2eeFailure> Initialize();

        /**
         * Generates a key bundle, persists it and publishes its public half.
         * All or nothing: if publishing fails the local record is removed again.
         * Refuses to run when key material already exists.
         */
        [[nodiscard]] Result<Unit, E2eeFailure> Setup(
            std::string_view platform_tag = ProtocolConstants::DEFAULT_DEVICE_TAG);

        /// Revokes this device at the directory (best effort) and wipes all local state.
        [[nodiscard]] Result<Unit, E2eeFailure> Reset();

        [[nodiscard]] bool IsInitialized() const;
        [[nodiscard]] const std::string& GetLocalUserId() const noexcept { return local_user_id_; }
        [[nodiscard]] Result<std::string, E2eeFailure> GetDeviceId() const;
        [[nodiscard]] Result<std::string, E2eeFailure> GetFingerprint() const;
        [[nodiscard]] Result<std::string, E2eeFailure> GetIdentityKeyBase64() const;

        [[nodiscard]] Result<proto::common::EncryptedMessage, E2eeFailure> EncryptMessage(
            std::string_view recipient_id,
            std::span<const uint8_t> plaintext);
        [[nodiscard]] Result<proto::common::EncryptedMessage, E2eeFailure> EncryptMessage(
            std::string_view recipient_id,
            std::string_view plaintext);

        [[nodiscard]] Result<std::vector<uint8_t>, E2eeFailure> DecryptMessage(
            std::string_view sender_id,
            std::string_view sender_identity_key_b64,
            const proto::common::EncryptedMessage& message);

        [[nodiscard]] Result<std::string, E2eeFailure> GetSafetyNumber(std::string_view user_id);

        [[nodiscard]] Result<std::optional<SessionRecord>, E2eeFailure> GetSession(std::string_view recipient_id);

        /// Unused one-time prekeys the directory still holds for this device.
        [[nodiscard]] Result<uint32_t, E2eeFailure> GetRemainingPrekeyCount();

        /// Generates `count` one-time prekeys, vaults the private halves and publishes them.
        [[nodiscard]] Result<uint32_t, E2eeFailure> UploadOneTimePreKeys(uint32_t count);

        /// Drops identity, vault, sessions and cached bundles without calling the directory.
        [[nodiscard]] Result<Unit, E2eeFailure> WipeLocalState();

        /// Logout: wakes directory calls waiting out a backoff. Every directory call after this fails with Cancelled.
        void Shutdown();

        [[nodiscard]] directory::KeyDirectoryClient& DirectoryClient() noexcept { return *client_; }
        [[nodiscard]] const configuration::E2eeConfig& Config() const noexcept { return config_; }

    private:
        E2eeManager(
            std::string local_user_id,
            std::shared_ptr<storage::ISecureStorage> storage,
            std::shared_ptr<directory::IKeyDirectory> directory,
            configuration::E2eeConfig config,
            Clock clock);

        [[nodiscard]] std::shared_ptr<const LocalIdentity> Snapshot() const;
        [[nodiscard]] Result<std::shared_ptr<const LocalIdentity>, E2eeFailure> RequireIdentity() const;
        void Publish(std::shared_ptr<const LocalIdentity> identity);
        [[nodiscard]] Result<Unit, E2eeFailure> WipeLocalStateLocked();
        /// Skipped when `sender` is no longer the published identity.
        void RecordSend(
            const std::shared_ptr<const LocalIdentity>& sender,
            std::string_view recipient_id,
            const std::vector<uint8_t>& recipient_identity_key);

        std::string local_user_id_;
        configuration::E2eeConfig config_;
        Clock clock_;
        storage::LocalKeyStore key_store_;
        storage::SessionStore session_store_;
        std::unique_ptr<directory::KeyDirectoryClient> client_;
        directory::PrekeyBundleCache bundle_cache_;

        /// Serializes setup, teardown and prekey publication.
        std::mutex lifecycle_mutex_;
        /// Held from one-time prekey lookup until its removal so a key opens at most one message.
        std::mutex one_time_mutex_;
        /// Session records are read, bumped and written back as one step.
        std::mutex session_mutex_;
        mutable std::mutex identity_mutex_;
        std::shared_ptr<const LocalIdentity> identity_;
    };
}
