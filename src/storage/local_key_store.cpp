#include "cgraph/storage/local_key_store.hpp"
#include "cgraph/crypto/sodium_interop.hpp"
#include "cgraph/core/constants.hpp"
#include "cgraph/core/format.hpp"
#include "cgraph/debug/logger.hpp"

#include "storage/local_state.pb.h"

#include <string>

namespace cgraph::e2ee::storage {
using crypto::SodiumInterop;
using models::X25519KeyPair;
using models::Ed25519KeyPair;
namespace pb = cgraph::proto::storage;

namespace {
    constexpr std::string_view kComponent = "KEYSTORE";

    void WipeString(std::string& value) {
        if (!value.empty()) {
            sodium_memzero(value.data(), value.size());
        }
    }

    void WipeKeyPair(pb::StoredKeyPair& pair) {
        WipeString(*pair.mutable_private_key());
    }

    void WipeVault(pb::StoredOneTimePreKeys& vault) {
        for (auto& key : *vault.mutable_keys()) {
            WipeKeyPair(key);
        }
    }

    /// Drops vault entries at or past the retention window and returns how many went.
    size_t PruneExpired(pb::StoredOneTimePreKeys& vault, const int64_t now_ms, const std::chrono::milliseconds retention) {
        const int64_t cutoff_ms = now_ms - retention.count();
        auto* stored_keys = vault.mutable_keys();
        size_t pruned = 0;
        for (int i = stored_keys->size() - 1; i >= 0; --i) {
            auto& stored = *stored_keys->Mutable(i);
            if (stored.created_at_ms() == 0) {
                // Entries written before timestamps existed start aging now.
                stored.set_created_at_ms(now_ms);
                continue;
            }
            if (stored.created_at_ms() > cutoff_ms) {
                continue;
            }
            WipeKeyPair(stored);
            stored_keys->DeleteSubrange(i, 1);
            ++pruned;
        }
        return pruned;
    }

    void WipeRecord(pb::StoredKeyRecord& record) {
        WipeKeyPair(*record.mutable_identity());
        WipeKeyPair(*record.mutable_identity_signing());
        WipeKeyPair(*record.mutable_signed_prekey());
    }

    std::span<const uint8_t> AsBytes(const std::string& value) {
        return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
    }

    std::string ToProtoBytes(std::span<const uint8_t> data) {
        return {reinterpret_cast<const char*>(data.data()), data.size()};
    }

    template<typename KeyPair>
    Result<Unit, E2eeFailure> FillStoredPair(
        pb::StoredKeyPair& out,
        const KeyPair& pair,
        std::string_view key_id) {
        auto secret_result = pair.GetSecretKeyCopy();
        if (secret_result.IsErr()) {
            return Result<Unit, E2eeFailure>::Err(std::move(secret_result).UnwrapErr());
        }
        auto secret = std::move(secret_result).Unwrap();
        out.set_public_key(ToProtoBytes(pair.GetPublicKey()));
        out.set_private_key(ToProtoBytes(secret));
        out.set_key_id(std::string(key_id));
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(secret));
        return Result<Unit, E2eeFailure>::Ok(unit);
    }

    template<typename Message>
    Result<Unit, E2eeFailure> WriteMessage(ISecureStorage& storage, std::string_view key, const Message& message) {
        std::string serialized;
        if (!message.SerializeToString(&serialized)) {
            return Result<Unit, E2eeFailure>::Err(
                E2eeFailure::Encode(compat::format("Failed to serialize {}", key)));
        }
        auto result = storage.Set(key, AsBytes(serialized));
        WipeString(serialized);
        return result;
    }

    template<typename Message>
    Result<std::optional<Message>, E2eeFailure> ReadMessage(ISecureStorage& storage, std::string_view key) {
        auto get_result = storage.Get(key);
        if (get_result.IsErr()) {
            return Result<std::optional<Message>, E2eeFailure>::Err(std::move(get_result).UnwrapErr());
        }
        auto bytes = std::move(get_result).Unwrap();
        if (!bytes.has_value()) {
            return Result<std::optional<Message>, E2eeFailure>::Ok(std::nullopt);
        }
        Message message;
        const bool parsed = message.ParseFromArray(bytes->data(), static_cast<int>(bytes->size()));
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(*bytes));
        if (!parsed) {
            return Result<std::optional<Message>, E2eeFailure>::Err(
                E2eeFailure::Decode(compat::format("Stored record {} is malformed", key)));
        }
        return Result<std::optional<Message>, E2eeFailure>::Ok(std::move(message));
    }

    Result<X25519KeyPair, E2eeFailure> RestoreX25519(const pb::StoredKeyPair& stored, std::string_view what) {
        auto pair_result = X25519KeyPair::FromPrivateKey(AsBytes(stored.private_key()));
        if (pair_result.IsErr()) {
            return Result<X25519KeyPair, E2eeFailure>::Err(E2eeFailure::Decode(
                compat::format("Stored {} key is invalid: {}", what, pair_result.UnwrapErr().message)));
        }
        if (!SodiumInterop::ConstantTimeEquals(pair_result.Unwrap().GetPublicKey(), AsBytes(stored.public_key()))) {
            return Result<X25519KeyPair, E2eeFailure>::Err(E2eeFailure::Decode(
                compat::format("Stored {} public key does not match its private key", what)));
        }
        return pair_result;
    }
}

LocalKeyStore::LocalKeyStore(
    std::shared_ptr<ISecureStorage> storage,
    Clock clock,
    const std::chrono::milliseconds one_time_prekey_retention)
    : storage_(std::move(storage))
    , clock_(std::move(clock))
    , retention_(one_time_prekey_retention)
    , lock_(std::make_unique<std::mutex>()) {
}

Result<Unit, E2eeFailure> LocalKeyStore::Save(const KeyBundle& bundle) {
    std::lock_guard guard(*lock_);

    auto existing = storage_->Get(StorageKeys::KEY_RECORD);
    if (existing.IsErr()) {
        return Result<Unit, E2eeFailure>::Err(std::move(existing).UnwrapErr());
    }
    if (existing.Unwrap().has_value()) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(*existing.Unwrap()));
        return Result<Unit, E2eeFailure>::Err(
            E2eeFailure::Setup(std::string(ErrorMessages::ALREADY_INITIALIZED)));
    }

    pb::StoredOneTimePreKeys vault;
    const int64_t now_ms = ToUnixMillis(clock_());
    for (const auto& opk : bundle.GetOneTimePreKeys()) {
        auto& stored = *vault.add_keys();
        auto fill = FillStoredPair(stored, opk.GetKeyPair(), opk.GetKeyId());
        if (fill.IsErr()) {
            WipeVault(vault);
            return fill;
        }
        stored.set_created_at_ms(now_ms);
    }
    auto vault_result = WriteMessage(*storage_, StorageKeys::ONE_TIME_PREKEYS, vault);
    WipeVault(vault);
    if (vault_result.IsErr()) {
        return vault_result;
    }

    const auto& identity = bundle.GetIdentity();
    const auto& spk = bundle.GetSignedPreKey();
    pb::StoredKeyRecord record;
    record.set_version(StorageKeys::RECORD_VERSION);
    record.set_device_id(identity.GetDeviceId());
    record.set_signed_prekey_signature(ToProtoBytes(spk.GetSignature()));
    record.set_created_at_ms(ToUnixMillis(clock_()));
    auto fill_result = FillStoredPair(*record.mutable_identity(), identity.GetDhKeyPair(), identity.GetKeyId());
    if (fill_result.IsOk()) {
        fill_result = FillStoredPair(*record.mutable_identity_signing(), identity.GetSigningKeyPair(), identity.GetKeyId());
    }
    if (fill_result.IsOk()) {
        fill_result = FillStoredPair(*record.mutable_signed_prekey(), spk.GetKeyPair(), spk.GetKeyId());
    }
    if (fill_result.IsOk()) {
        fill_result = WriteMessage(*storage_, StorageKeys::KEY_RECORD, record);
    }
    WipeRecord(record);
    if (fill_result.IsErr()) {
        auto rollback = storage_->Delete(StorageKeys::ONE_TIME_PREKEYS);
        if (rollback.IsErr()) {
            CGRAPH_LOG_ERROR(kComponent, "Failed to roll back one-time prekey vault: {}", rollback.UnwrapErr().message);
        }
        return fill_result;
    }

    CGRAPH_LOG_INFO(kComponent, "Saved key material for device {} ({} one-time prekeys)",
        identity.GetDeviceId(), bundle.GetOneTimePreKeys().size());
    return Result<Unit, E2eeFailure>::Ok(unit);
}

Result<std::optional<LocalIdentity>, E2eeFailure> LocalKeyStore::Load() {
    using LoadResult = Result<std::optional<LocalIdentity>, E2eeFailure>;
    std::lock_guard guard(*lock_);

    auto read_result = ReadMessage<pb::StoredKeyRecord>(*storage_, StorageKeys::KEY_RECORD);
    if (read_result.IsErr()) {
        return LoadResult::Err(std::move(read_result).UnwrapErr());
    }
    auto record_opt = std::move(read_result).Unwrap();
    if (!record_opt.has_value()) {
        return LoadResult::Ok(std::nullopt);
    }
    pb::StoredKeyRecord& record = *record_opt;

    auto restore = [&]() -> LoadResult {
        if (record.version() != StorageKeys::RECORD_VERSION) {
            return LoadResult::Err(E2eeFailure::Decode(
                compat::format("Unsupported key record version {}", record.version())));
        }
        if (record.device_id().empty() || record.identity().key_id().empty() ||
            record.signed_prekey().key_id().empty()) {
            return LoadResult::Err(E2eeFailure::Decode("Stored key record is missing identifiers"));
        }
        auto dh_result = RestoreX25519(record.identity(), "identity");
        if (dh_result.IsErr()) {
            return LoadResult::Err(std::move(dh_result).UnwrapErr());
        }
        auto signing_result = Ed25519KeyPair::FromSecretKey(AsBytes(record.identity_signing().private_key()));
        if (signing_result.IsErr()) {
            return LoadResult::Err(E2eeFailure::Decode(
                "Stored identity signing key is invalid: " + signing_result.UnwrapErr().message));
        }
        auto spk_result = RestoreX25519(record.signed_prekey(), "signed prekey");
        if (spk_result.IsErr()) {
            return LoadResult::Err(std::move(spk_result).UnwrapErr());
        }
        const std::string& signature = record.signed_prekey_signature();
        if (!Ed25519KeyPair::Verify(signing_result.Unwrap().GetPublicKey(),
                                    spk_result.Unwrap().GetPublicKey(), AsBytes(signature))) {
            return LoadResult::Err(E2eeFailure::Decode(std::string(ErrorMessages::SIGNED_PRE_KEY_INVALID)));
        }
        IdentityKeyPair identity(
            std::move(dh_result).Unwrap(),
            std::move(signing_result).Unwrap(),
            record.identity().key_id(),
            record.device_id());
        SignedPreKey spk(
            std::move(spk_result).Unwrap(),
            record.signed_prekey().key_id(),
            std::vector<uint8_t>(signature.begin(), signature.end()));
        return LoadResult::Ok(LocalIdentity{
            std::move(identity),
            std::move(spk),
            FromUnixMillis(record.created_at_ms())});
    };
    auto result = restore();
    WipeRecord(record);
    return result;
}

Result<bool, E2eeFailure> LocalKeyStore::HasKeyMaterial() {
    std::lock_guard guard(*lock_);
    auto get_result = storage_->Get(StorageKeys::KEY_RECORD);
    if (get_result.IsErr()) {
        return Result<bool, E2eeFailure>::Err(std::move(get_result).UnwrapErr());
    }
    auto& bytes = get_result.Unwrap();
    if (bytes.has_value()) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(*bytes));
    }
    return Result<bool, E2eeFailure>::Ok(bytes.has_value());
}

Result<Unit, E2eeFailure> LocalKeyStore::Clear() {
    std::lock_guard guard(*lock_);
    std::optional<E2eeFailure> first_failure;
    for (const auto key : {StorageKeys::KEY_RECORD, StorageKeys::ONE_TIME_PREKEYS, StorageKeys::SESSIONS}) {
        auto result = storage_->Delete(key);
        if (result.IsErr() && !first_failure) {
            first_failure = std::move(result).UnwrapErr();
        }
    }
    if (first_failure) {
        return Result<Unit, E2eeFailure>::Err(std::move(*first_failure));
    }
    CGRAPH_LOG_INFO(kComponent, "Cleared local key material");
    return Result<Unit, E2eeFailure>::Ok(unit);
}

Result<Unit, E2eeFailure> LocalKeyStore::AddOneTimePreKeys(const std::vector<OneTimePreKey>& keys) {
    std::lock_guard guard(*lock_);
    return AppendToVaultLocked(keys);
}

Result<Unit, E2eeFailure> LocalKeyStore::AppendToVaultLocked(const std::vector<OneTimePreKey>& keys) {
    auto read_result = ReadMessage<pb::StoredOneTimePreKeys>(*storage_, StorageKeys::ONE_TIME_PREKEYS);
    if (read_result.IsErr()) {
        return Result<Unit, E2eeFailure>::Err(std::move(read_result).UnwrapErr());
    }
    pb::StoredOneTimePreKeys vault = std::move(read_result).Unwrap().value_or(pb::StoredOneTimePreKeys{});
    const int64_t now_ms = ToUnixMillis(clock_());
    const size_t pruned = PruneExpired(vault, now_ms, retention_);
    for (const auto& opk : keys) {
        auto& stored = *vault.add_keys();
        auto fill = FillStoredPair(stored, opk.GetKeyPair(), opk.GetKeyId());
        if (fill.IsErr()) {
            WipeVault(vault);
            return fill;
        }
        stored.set_created_at_ms(now_ms);
    }
    auto write_result = WriteMessage(*storage_, StorageKeys::ONE_TIME_PREKEYS, vault);
    WipeVault(vault);
    if (write_result.IsOk() && pruned > 0) {
        CGRAPH_LOG_INFO(kComponent, "Pruned {} unused one-time prekeys older than {} ms",
            pruned, retention_.count());
    }
    return write_result;
}

Result<std::optional<OneTimePreKey>, E2eeFailure> LocalKeyStore::FindOneTimePreKey(std::string_view key_id) {
    using FindResult = Result<std::optional<OneTimePreKey>, E2eeFailure>;
    std::lock_guard guard(*lock_);
    auto read_result = ReadMessage<pb::StoredOneTimePreKeys>(*storage_, StorageKeys::ONE_TIME_PREKEYS);
    if (read_result.IsErr()) {
        return FindResult::Err(std::move(read_result).UnwrapErr());
    }
    auto vault_opt = std::move(read_result).Unwrap();
    if (!vault_opt.has_value()) {
        return FindResult::Ok(std::nullopt);
    }
    FindResult result = FindResult::Ok(std::nullopt);
    for (const auto& stored : vault_opt->keys()) {
        if (stored.key_id() != key_id) {
            continue;
        }
        auto pair_result = RestoreX25519(stored, "one-time prekey");
        if (pair_result.IsErr()) {
            result = FindResult::Err(std::move(pair_result).UnwrapErr());
        } else {
            result = FindResult::Ok(OneTimePreKey(std::move(pair_result).Unwrap(), stored.key_id()));
        }
        break;
    }
    WipeVault(*vault_opt);
    return result;
}

Result<bool, E2eeFailure> LocalKeyStore::RemoveOneTimePreKey(std::string_view key_id) {
    std::lock_guard guard(*lock_);
    auto read_result = ReadMessage<pb::StoredOneTimePreKeys>(*storage_, StorageKeys::ONE_TIME_PREKEYS);
    if (read_result.IsErr()) {
        return Result<bool, E2eeFailure>::Err(std::move(read_result).UnwrapErr());
    }
    auto vault_opt = std::move(read_result).Unwrap();
    if (!vault_opt.has_value()) {
        return Result<bool, E2eeFailure>::Ok(false);
    }
    auto* keys = vault_opt->mutable_keys();
    bool removed = false;
    for (int i = 0; i < keys->size(); ++i) {
        if (keys->Get(i).key_id() == key_id) {
            WipeKeyPair(*keys->Mutable(i));
            keys->DeleteSubrange(i, 1);
            removed = true;
            break;
        }
    }
    if (!removed) {
        WipeVault(*vault_opt);
        return Result<bool, E2eeFailure>::Ok(false);
    }
    auto write_result = WriteMessage(*storage_, StorageKeys::ONE_TIME_PREKEYS, *vault_opt);
    WipeVault(*vault_opt);
    if (write_result.IsErr()) {
        return Result<bool, E2eeFailure>::Err(std::move(write_result).UnwrapErr());
    }
    return Result<bool, E2eeFailure>::Ok(true);
}

Result<size_t, E2eeFailure> LocalKeyStore::OneTimePreKeyCount() {
    std::lock_guard guard(*lock_);
    auto read_result = ReadMessage<pb::StoredOneTimePreKeys>(*storage_, StorageKeys::ONE_TIME_PREKEYS);
    if (read_result.IsErr()) {
        return Result<size_t, E2eeFailure>::Err(std::move(read_result).UnwrapErr());
    }
    auto vault_opt = std::move(read_result).Unwrap();
    if (!vault_opt.has_value()) {
        return Result<size_t, E2eeFailure>::Ok(0);
    }
    const auto count = static_cast<size_t>(vault_opt->keys_size());
    WipeVault(*vault_opt);
    return Result<size_t, E2eeFailure>::Ok(count);
}

}
