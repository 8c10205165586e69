#include "cgraph/protocol/e2ee_manager.hpp"
#include "cgraph/protocol/x3dh_agreement.hpp"
#include "cgraph/protocol/message_cipher.hpp"
#include "cgraph/protocol/safety_number.hpp"
#include "cgraph/directory/bundle_formatter.hpp"
#include "cgraph/identity/key_bundle_generator.hpp"
#include "cgraph/crypto/sodium_interop.hpp"
#include "cgraph/core/constants.hpp"
#include "cgraph/core/format.hpp"
#include "cgraph/debug/logger.hpp"

namespace cgraph::e2ee::protocol {
    using crypto::SodiumInterop;
    using directory::BundleFormatter;
    using identity::KeyBundleGenerator;

    namespace {
        constexpr std::string_view kComponent = "E2EE";

        std::span<const uint8_t> AsBytes(const std::string& value) {
            return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
        }

        std::string ToProtoBytes(std::span<const uint8_t> data) {
            return {data.begin(), data.end()};
        }
    }

    Result<std::unique_ptr<E2eeManager>, E2eeFailure> E2eeManager::Create(
        std::string local_user_id,
        std::shared_ptr<storage::ISecureStorage> storage,
        std::shared_ptr<directory::IKeyDirectory> directory,
        configuration::E2eeConfig config,
        Clock clock) {
        using CreateResult = Result<std::unique_ptr<E2eeManager>, E2eeFailure>;
        if (local_user_id.empty()) {
            return CreateResult::Err(E2eeFailure::InvalidInput("Local user id must not be empty"));
        }
        if (!storage || !directory || !clock) {
            return CreateResult::Err(E2eeFailure::InvalidInput("E2EE manager needs storage, a directory and a clock"));
        }
        CGRAPH_TRY(config.Validate());
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return CreateResult::Err(E2eeFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        return CreateResult::Ok(std::unique_ptr<E2eeManager>(new E2eeManager(
            std::move(local_user_id), std::move(storage), std::move(directory), config, std::move(clock))));
    }

    E2eeManager::E2eeManager(
        std::string local_user_id,
        std::shared_ptr<storage::ISecureStorage> storage,
        std::shared_ptr<directory::IKeyDirectory> directory,
        configuration::E2eeConfig config,
        Clock clock)
        : local_user_id_(std::move(local_user_id))
        , config_(config)
        , clock_(std::move(clock))
        , key_store_(storage, clock_, config_.OneTimePreKeyRetention())
        , session_store_(storage)
        , client_(std::make_unique<directory::KeyDirectoryClient>(std::move(directory), config_))
        , bundle_cache_(
              [client = client_.get()](std::string_view user_id) { return client->FetchPrekeyBundle(user_id); },
              config_.BundleCacheTtl(),
              clock_) {
    }

    E2eeManager::~E2eeManager() {
        Shutdown();
    }

    void E2eeManager::Shutdown() {
        if (!client_->IsShutdown()) {
            CGRAPH_LOG_DEBUG(kComponent, "Shutting down directory client for {}", local_user_id_);
        }
        client_->Shutdown();
    }

    std::shared_ptr<const LocalIdentity> E2eeManager::Snapshot() const {
        std::lock_guard lock(identity_mutex_);
        return identity_;
    }

    void E2eeManager::Publish(std::shared_ptr<const LocalIdentity> identity) {
        std::lock_guard lock(identity_mutex_);
        identity_ = std::move(identity);
    }

    Result<std::shared_ptr<const LocalIdentity>, E2eeFailure> E2eeManager::RequireIdentity() const {
        auto identity = Snapshot();
        if (!identity) {
            return Result<std::shared_ptr<const LocalIdentity>, E2eeFailure>::Err(
                E2eeFailure::NotInitialized(std::string(ErrorMessages::E2EE_NOT_INITIALIZED)));
        }
        return Result<std::shared_ptr<const LocalIdentity>, E2eeFailure>::Ok(std::move(identity));
    }

    bool E2eeManager::IsInitialized() const {
        return Snapshot() != nullptr;
    }

    Result<bool, E2eeFailure> E2eeManager::Initialize() {
        std::lock_guard lock(lifecycle_mutex_);
        auto loaded = key_store_.Load();
        if (loaded.IsErr()) {
            CGRAPH_LOG_ERROR(kComponent, "Failed to restore key material: {}", loaded.UnwrapErr().message);
            return Result<bool, E2eeFailure>::Err(std::move(loaded).UnwrapErr());
        }
        auto identity = std::move(loaded).Unwrap();
        if (!identity.has_value()) {
            Publish(nullptr);
            return Result<bool, E2eeFailure>::Ok(false);
        }
        CGRAPH_LOG_INFO(kComponent, "Restored device {}", identity->identity.GetDeviceId());
        Publish(std::make_shared<const LocalIdentity>(std::move(*identity)));
        return Result<bool, E2eeFailure>::Ok(true);
    }

    Result<Unit, E2eeFailure> E2eeManager::Setup(std::string_view platform_tag) {
        std::lock_guard lock(lifecycle_mutex_);
        if (Snapshot()) {
            return Result<Unit, E2eeFailure>::Err(
                E2eeFailure::Setup(std::string(ErrorMessages::ALREADY_INITIALIZED)));
        }
        auto existing = key_store_.HasKeyMaterial();
        if (existing.IsErr()) {
            return Result<Unit, E2eeFailure>::Err(E2eeFailure::Setup(existing.UnwrapErr().message));
        }
        if (existing.Unwrap()) {
            return Result<Unit, E2eeFailure>::Err(
                E2eeFailure::Setup(std::string(ErrorMessages::ALREADY_INITIALIZED)));
        }

        auto bundle_result = KeyBundleGenerator::GenerateKeyBundle(
            KeyBundleGenerator::GenerateDeviceId(platform_tag),
            config_.OneTimePreKeyBatch(),
            config_.PreKeyGenerationWorkers());
        if (bundle_result.IsErr()) {
            return Result<Unit, E2eeFailure>::Err(E2eeFailure::Setup(
                compat::format("Key generation failed: {}", bundle_result.UnwrapErr().message)));
        }
        models::KeyBundle bundle = std::move(bundle_result).Unwrap();

        if (auto saved = key_store_.Save(bundle); saved.IsErr()) {
            const auto& failure = saved.UnwrapErr();
            return Result<Unit, E2eeFailure>::Err(failure.type == E2eeFailureType::Setup
                ? failure
                : E2eeFailure::Setup(compat::format("Persisting key material failed: {}", failure.message)));
        }

        auto registered = client_->RegisterBundle(BundleFormatter::FormatForRegistration(bundle));
        if (registered.IsErr()) {
            CGRAPH_LOG_WARN(kComponent, "Publishing key bundle failed, rolling back: {}", registered.UnwrapErr().message);
            if (auto rollback = key_store_.Clear(); rollback.IsErr()) {
                CGRAPH_LOG_ERROR(kComponent, "Rollback after failed publish failed: {}", rollback.UnwrapErr().message);
            }
            return Result<Unit, E2eeFailure>::Err(E2eeFailure::Setup(
                compat::format("Publishing key bundle failed: {}", registered.UnwrapErr().message)));
        }

        const std::string device_id = bundle.GetDeviceId();
        models::IdentityKeyPair identity = std::move(bundle).TakeIdentity();
        models::SignedPreKey signed_pre_key = std::move(bundle).TakeSignedPreKey();
        Publish(std::make_shared<const LocalIdentity>(LocalIdentity{
            std::move(identity), std::move(signed_pre_key), clock_()}));
        CGRAPH_LOG_INFO(kComponent, "Device {} set up for {}", device_id, local_user_id_);
        return Result<Unit, E2eeFailure>::Ok(unit);
    }

    Result<Unit, E2eeFailure> E2eeManager::Reset() {
        std::lock_guard lock(lifecycle_mutex_);
        if (const auto identity = Snapshot()) {
            auto revoked = client_->RevokeDevice(identity->identity.GetDeviceId());
            if (revoked.IsErr()) {
                CGRAPH_LOG_WARN(kComponent, "Could not revoke device {} during reset: {}",
                    identity->identity.GetDeviceId(), revoked.UnwrapErr().message);
            }
        }
        return WipeLocalStateLocked();
    }

    Result<Unit, E2eeFailure> E2eeManager::WipeLocalState() {
        std::lock_guard lock(lifecycle_mutex_);
        return WipeLocalStateLocked();
    }

    Result<Unit, E2eeFailure> E2eeManager::WipeLocalStateLocked() {
        // In-flight decrypts and sends write the vault and session records; they must not land after the clear.
        std::scoped_lock writers(one_time_mutex_, session_mutex_);
        Publish(nullptr);
        bundle_cache_.Clear();
        return key_store_.Clear();
    }

    Result<std::string, E2eeFailure> E2eeManager::GetDeviceId() const {
        return RequireIdentity().Map([](const std::shared_ptr<const LocalIdentity>& identity) {
            return identity->identity.GetDeviceId();
        });
    }

    Result<std::string, E2eeFailure> E2eeManager::GetFingerprint() const {
        return RequireIdentity().Map([](const std::shared_ptr<const LocalIdentity>& identity) {
            return KeyBundleGenerator::Fingerprint(identity->identity.GetPublicKey());
        });
    }

    Result<std::string, E2eeFailure> E2eeManager::GetIdentityKeyBase64() const {
        return RequireIdentity().Map([](const std::shared_ptr<const LocalIdentity>& identity) {
            return SodiumInterop::ToBase64(identity->identity.GetPublicKey());
        });
    }

    Result<proto::common::EncryptedMessage, E2eeFailure> E2eeManager::EncryptMessage(
        std::string_view recipient_id,
        std::string_view plaintext) {
        return EncryptMessage(recipient_id, std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size()));
    }

    Result<proto::common::EncryptedMessage, E2eeFailure> E2eeManager::EncryptMessage(
        std::string_view recipient_id,
        std::span<const uint8_t> plaintext) {
        using EncryptResult = Result<proto::common::EncryptedMessage, E2eeFailure>;
        auto identity_result = RequireIdentity();
        if (identity_result.IsErr()) {
            return EncryptResult::Err(std::move(identity_result).UnwrapErr());
        }
        const auto identity = std::move(identity_result).Unwrap();
        if (recipient_id.empty()) {
            return EncryptResult::Err(E2eeFailure::InvalidInput("Recipient id must not be empty"));
        }

        auto bundle_result = bundle_cache_.AcquireForAgreement(recipient_id);
        if (bundle_result.IsErr()) {
            return EncryptResult::Err(std::move(bundle_result).UnwrapErr());
        }
        const auto& bundle = bundle_result.Unwrap();

        auto agreement_result = X3dhAgreement::Initiate(identity->identity, bundle, config_.HkdfInfo());
        if (agreement_result.IsErr()) {
            return EncryptResult::Err(std::move(agreement_result).UnwrapErr());
        }
        auto agreement = std::move(agreement_result).Unwrap();

        auto sealed_result = MessageCipher::Encrypt(plaintext, agreement.shared_secret);
        if (sealed_result.IsErr()) {
            return EncryptResult::Err(std::move(sealed_result).UnwrapErr());
        }
        auto sealed = std::move(sealed_result).Unwrap();

        proto::common::EncryptedMessage message;
        message.set_ciphertext(ToProtoBytes(sealed.ciphertext));
        message.set_nonce(ToProtoBytes(sealed.nonce));
        message.set_ephemeral_public_key(ToProtoBytes(agreement.ephemeral_public_key));
        message.set_recipient_identity_key_id(bundle.identity_key_id);
        if (agreement.one_time_pre_key_id.has_value()) {
            message.set_one_time_prekey_id(*agreement.one_time_pre_key_id);
        }

        RecordSend(identity, recipient_id, bundle.identity_key);
        return EncryptResult::Ok(std::move(message));
    }

    void E2eeManager::RecordSend(
        const std::shared_ptr<const LocalIdentity>& sender,
        std::string_view recipient_id,
        const std::vector<uint8_t>& recipient_identity_key) {
        std::lock_guard lock(session_mutex_);
        if (Snapshot() != sender) {
            CGRAPH_LOG_DEBUG(kComponent, "Device was reset while sealing for {}, session not recorded", recipient_id);
            return;
        }
        auto loaded = session_store_.Load(recipient_id);
        if (loaded.IsErr()) {
            CGRAPH_LOG_WARN(kComponent, "Session cache unreadable for {}: {}", recipient_id, loaded.UnwrapErr().message);
            return;
        }
        const TimePoint now = clock_();
        auto existing = std::move(loaded).Unwrap();
        SessionRecord record = existing.value_or(SessionRecord{std::string(recipient_id), {}, 0, now, now});
        if (existing.has_value() && record.recipient_identity_key != recipient_identity_key) {
            CGRAPH_LOG_WARN(kComponent, "Identity key changed for {}", recipient_id);
        }
        record.recipient_identity_key = recipient_identity_key;
        record.message_count += 1;
        record.updated_at = now;
        if (auto saved = session_store_.Save(record); saved.IsErr()) {
            CGRAPH_LOG_WARN(kComponent, "Session cache update failed for {}: {}", recipient_id, saved.UnwrapErr().message);
        }
    }

    Result<std::vector<uint8_t>, E2eeFailure> E2eeManager::DecryptMessage(
        std::string_view sender_id,
        std::string_view sender_identity_key_b64,
        const proto::common::EncryptedMessage& message) {
        using DecryptResult = Result<std::vector<uint8_t>, E2eeFailure>;
        auto identity_result = RequireIdentity();
        if (identity_result.IsErr()) {
            return DecryptResult::Err(std::move(identity_result).UnwrapErr());
        }
        const auto identity = std::move(identity_result).Unwrap();

        if (message.recipient_identity_key_id() != identity->identity.GetKeyId()) {
            return DecryptResult::Err(E2eeFailure::Decryption(compat::format(
                "Message from {} was sealed for identity key {}, this device holds {}",
                sender_id, message.recipient_identity_key_id(), identity->identity.GetKeyId())));
        }

        auto sender_key = SodiumInterop::FromBase64(sender_identity_key_b64);
        if (sender_key.IsErr()) {
            return DecryptResult::Err(E2eeFailure::KeyAgreement(
                compat::format("Sender identity key is not valid base64: {}", sender_key.UnwrapErr().message)));
        }

        std::unique_lock one_time_lock(one_time_mutex_, std::defer_lock);
        std::optional<models::OneTimePreKey> one_time_pre_key;
        if (message.has_one_time_prekey_id()) {
            one_time_lock.lock();
            auto found = key_store_.FindOneTimePreKey(message.one_time_prekey_id());
            if (found.IsErr()) {
                return DecryptResult::Err(std::move(found).UnwrapErr());
            }
            one_time_pre_key = std::move(found).Unwrap();
            if (!one_time_pre_key.has_value()) {
                CGRAPH_LOG_WARN(kComponent, "Message from {} references unavailable one-time prekey {}",
                    sender_id, message.one_time_prekey_id());
                return DecryptResult::Err(E2eeFailure::KeyAgreement(compat::format(
                    "One-time prekey {} is not available", message.one_time_prekey_id())));
            }
        }

        auto secret = X3dhAgreement::Respond(
            identity->identity,
            identity->signed_pre_key,
            sender_key.Unwrap(),
            AsBytes(message.ephemeral_public_key()),
            one_time_pre_key.has_value() ? &*one_time_pre_key : nullptr,
            config_.HkdfInfo());
        if (secret.IsErr()) {
            return DecryptResult::Err(std::move(secret).UnwrapErr());
        }

        auto plaintext = MessageCipher::Decrypt(
            AsBytes(message.ciphertext()), AsBytes(message.nonce()), secret.Unwrap());
        if (plaintext.IsErr()) {
            CGRAPH_LOG_DEBUG(kComponent, "Message from {} failed authentication", sender_id);
            return plaintext;
        }

        if (one_time_pre_key.has_value()) {
            auto removed = key_store_.RemoveOneTimePreKey(one_time_pre_key->GetKeyId());
            if (removed.IsErr()) {
                CGRAPH_LOG_ERROR(kComponent, "Failed to retire one-time prekey {}: {}",
                    one_time_pre_key->GetKeyId(), removed.UnwrapErr().message);
            }
        }
        return plaintext;
    }

    Result<std::string, E2eeFailure> E2eeManager::GetSafetyNumber(std::string_view user_id) {
        auto identity_result = RequireIdentity();
        if (identity_result.IsErr()) {
            return Result<std::string, E2eeFailure>::Err(std::move(identity_result).UnwrapErr());
        }
        const auto identity = std::move(identity_result).Unwrap();

        auto bundle = bundle_cache_.LookupIdentity(user_id);
        if (bundle.IsErr()) {
            return Result<std::string, E2eeFailure>::Err(std::move(bundle).UnwrapErr());
        }
        return SafetyNumber::Compute(
            local_user_id_, identity->identity.GetPublicKey(),
            user_id, bundle.Unwrap().identity_key);
    }

    Result<std::optional<SessionRecord>, E2eeFailure> E2eeManager::GetSession(std::string_view recipient_id) {
        if (!IsInitialized()) {
            return Result<std::optional<SessionRecord>, E2eeFailure>::Err(
                E2eeFailure::NotInitialized(std::string(ErrorMessages::E2EE_NOT_INITIALIZED)));
        }
        return session_store_.Load(recipient_id);
    }

    Result<uint32_t, E2eeFailure> E2eeManager::GetRemainingPrekeyCount() {
        auto identity_result = RequireIdentity();
        if (identity_result.IsErr()) {
            return Result<uint32_t, E2eeFailure>::Err(std::move(identity_result).UnwrapErr());
        }
        return client_->GetRemainingPrekeyCount(identity_result.Unwrap()->identity.GetDeviceId());
    }

    Result<uint32_t, E2eeFailure> E2eeManager::UploadOneTimePreKeys(const uint32_t count) {
        std::lock_guard lock(lifecycle_mutex_);
        auto identity_result = RequireIdentity();
        if (identity_result.IsErr()) {
            return Result<uint32_t, E2eeFailure>::Err(std::move(identity_result).UnwrapErr());
        }
        const auto identity = std::move(identity_result).Unwrap();
        if (count == 0) {
            return Result<uint32_t, E2eeFailure>::Ok(0);
        }
        if (count > ProtocolConstants::MAX_PREKEYS_PER_CALL) {
            return Result<uint32_t, E2eeFailure>::Err(E2eeFailure::InvalidInput(compat::format(
                "Cannot upload {} prekeys at once (limit {})", count, ProtocolConstants::MAX_PREKEYS_PER_CALL)));
        }

        auto generated = KeyBundleGenerator::GenerateOneTimePreKeys(count, config_.PreKeyGenerationWorkers());
        if (generated.IsErr()) {
            return Result<uint32_t, E2eeFailure>::Err(std::move(generated).UnwrapErr());
        }
        const auto prekeys = std::move(generated).Unwrap();

        CGRAPH_TRY(key_store_.AddOneTimePreKeys(prekeys));
        auto uploaded = client_->UploadPrekeys(
            BundleFormatter::FormatPrekeyUpload(identity->identity.GetDeviceId(), prekeys));
        if (uploaded.IsErr()) {
            for (const auto& prekey : prekeys) {
                if (auto removed = key_store_.RemoveOneTimePreKey(prekey.GetKeyId()); removed.IsErr()) {
                    CGRAPH_LOG_ERROR(kComponent, "Failed to drop unpublished prekey {}: {}",
                        prekey.GetKeyId(), removed.UnwrapErr().message);
                }
            }
            return uploaded;
        }
        CGRAPH_LOG_INFO(kComponent, "Published {} of {} new one-time prekeys", uploaded.Unwrap(), count);
        return uploaded;
    }
}
