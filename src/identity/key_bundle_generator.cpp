#include "cgraph/identity/key_bundle_generator.hpp"
#include "cgraph/crypto/sodium_interop.hpp"
#include "cgraph/core/format.hpp"
#include "cgraph/core/clock.hpp"
#include "cgraph/debug/logger.hpp"

#include <algorithm>
#include <future>
#include <optional>
#include <unordered_set>

namespace cgraph::e2ee::identity {
using crypto::SodiumInterop;
using models::X25519KeyPair;
using models::Ed25519KeyPair;

namespace {
    constexpr std::string_view kComponent = "KEYGEN";
}

Result<IdentityKeyPair, E2eeFailure> KeyBundleGenerator::GenerateIdentityKeyPair(std::string device_id) {
    if (device_id.empty()) {
        return Result<IdentityKeyPair, E2eeFailure>::Err(
            E2eeFailure::InvalidInput("Device id cannot be empty"));
    }
    auto dh_result = X25519KeyPair::Generate("identity");
    if (dh_result.IsErr()) {
        return Result<IdentityKeyPair, E2eeFailure>::Err(std::move(dh_result).UnwrapErr());
    }
    auto signing_result = Ed25519KeyPair::Generate();
    if (signing_result.IsErr()) {
        return Result<IdentityKeyPair, E2eeFailure>::Err(std::move(signing_result).UnwrapErr());
    }
    IdentityKeyPair identity(
        std::move(dh_result).Unwrap(),
        std::move(signing_result).Unwrap(),
        GenerateKeyId(),
        std::move(device_id));
    CGRAPH_LOG_KEY(kComponent, "identity_public", identity.GetPublicKey());
    CGRAPH_LOG_KEY(kComponent, "identity_signing_public", identity.GetSigningPublicKey());
    return Result<IdentityKeyPair, E2eeFailure>::Ok(std::move(identity));
}

Result<SignedPreKey, E2eeFailure> KeyBundleGenerator::GenerateSignedPreKey(const IdentityKeyPair& identity) {
    auto key_result = X25519KeyPair::Generate("signed prekey");
    if (key_result.IsErr()) {
        return Result<SignedPreKey, E2eeFailure>::Err(std::move(key_result).UnwrapErr());
    }
    auto key_pair = std::move(key_result).Unwrap();
    auto signature_result = identity.GetSigningKeyPair().Sign(key_pair.GetPublicKeySpan());
    if (signature_result.IsErr()) {
        return Result<SignedPreKey, E2eeFailure>::Err(std::move(signature_result).UnwrapErr());
    }
    CGRAPH_LOG_KEY(kComponent, "signed_prekey_public", key_pair.GetPublicKey());
    return Result<SignedPreKey, E2eeFailure>::Ok(
        SignedPreKey(std::move(key_pair), GenerateKeyId(), std::move(signature_result).Unwrap()));
}

Result<std::vector<OneTimePreKey>, E2eeFailure> KeyBundleGenerator::GenerateOneTimePreKeyRange(
    const uint32_t count) {
    std::vector<OneTimePreKey> keys;
    keys.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        auto key_result = X25519KeyPair::Generate("one-time prekey");
        if (key_result.IsErr()) {
            return Result<std::vector<OneTimePreKey>, E2eeFailure>::Err(std::move(key_result).UnwrapErr());
        }
        keys.emplace_back(std::move(key_result).Unwrap(), GenerateKeyId());
    }
    return Result<std::vector<OneTimePreKey>, E2eeFailure>::Ok(std::move(keys));
}

Result<std::vector<OneTimePreKey>, E2eeFailure> KeyBundleGenerator::GenerateOneTimePreKeys(
    const uint32_t count,
    const uint32_t workers) {
    if (count > ProtocolConstants::MAX_PREKEYS_PER_CALL) {
        return Result<std::vector<OneTimePreKey>, E2eeFailure>::Err(
            E2eeFailure::InvalidInput(compat::format(
                "Cannot generate more than {} one-time prekeys at once, requested {}",
                ProtocolConstants::MAX_PREKEYS_PER_CALL, count)));
    }

    std::vector<OneTimePreKey> keys;
    keys.reserve(count);
    const uint32_t worker_count = std::clamp<uint32_t>(workers, 1, std::max<uint32_t>(count, 1));
    if (worker_count == 1) {
        auto range_result = GenerateOneTimePreKeyRange(count);
        if (range_result.IsErr()) {
            return range_result;
        }
        keys = std::move(range_result).Unwrap();
    } else {
        std::vector<std::future<Result<std::vector<OneTimePreKey>, E2eeFailure>>> futures;
        futures.reserve(worker_count);
        const uint32_t share = count / worker_count;
        const uint32_t remainder = count % worker_count;
        for (uint32_t w = 0; w < worker_count; ++w) {
            const uint32_t slice = share + (w < remainder ? 1 : 0);
            futures.push_back(std::async(std::launch::async, &GenerateOneTimePreKeyRange, slice));
        }
        std::optional<E2eeFailure> first_failure;
        for (auto& future : futures) {
            auto slice_result = future.get();
            if (slice_result.IsErr()) {
                if (!first_failure) {
                    first_failure = std::move(slice_result).UnwrapErr();
                }
                continue;
            }
            for (auto& key : std::move(slice_result).Unwrap()) {
                keys.push_back(std::move(key));
            }
        }
        if (first_failure) {
            return Result<std::vector<OneTimePreKey>, E2eeFailure>::Err(std::move(*first_failure));
        }
    }

    // Random 64-bit ids collide with negligible probability; a collision still must not ship.
    std::unordered_set<std::string> seen;
    for (auto& key : keys) {
        if (!seen.insert(key.GetKeyId()).second) {
            return Result<std::vector<OneTimePreKey>, E2eeFailure>::Err(
                E2eeFailure::KeyGeneration("Duplicate one-time prekey id generated"));
        }
    }
    CGRAPH_LOG_DEBUG(kComponent, "Generated {} one-time prekeys on {} worker(s)", keys.size(), worker_count);
    return Result<std::vector<OneTimePreKey>, E2eeFailure>::Ok(std::move(keys));
}

Result<KeyBundle, E2eeFailure> KeyBundleGenerator::GenerateKeyBundle(
    std::string device_id,
    const uint32_t one_time_pre_key_count,
    const uint32_t workers) {
    auto identity_result = GenerateIdentityKeyPair(std::move(device_id));
    if (identity_result.IsErr()) {
        return Result<KeyBundle, E2eeFailure>::Err(std::move(identity_result).UnwrapErr());
    }
    auto identity = std::move(identity_result).Unwrap();

    auto spk_result = GenerateSignedPreKey(identity);
    if (spk_result.IsErr()) {
        return Result<KeyBundle, E2eeFailure>::Err(std::move(spk_result).UnwrapErr());
    }

    auto opk_result = GenerateOneTimePreKeys(one_time_pre_key_count, workers);
    if (opk_result.IsErr()) {
        return Result<KeyBundle, E2eeFailure>::Err(std::move(opk_result).UnwrapErr());
    }

    return Result<KeyBundle, E2eeFailure>::Ok(KeyBundle(
        std::move(identity),
        std::move(spk_result).Unwrap(),
        std::move(opk_result).Unwrap()));
}

std::string KeyBundleGenerator::GenerateDeviceId(std::string_view platform_tag) {
    const auto random = SodiumInterop::GetRandomBytes(ProtocolConstants::DEVICE_ID_RANDOM_BYTES);
    return compat::format("{}_{}_{}",
        platform_tag,
        SodiumInterop::ToHex(random),
        ToUnixMillis(std::chrono::system_clock::now()));
}

std::string KeyBundleGenerator::GenerateKeyId() {
    const auto random = SodiumInterop::GetRandomBytes(ProtocolConstants::KEY_ID_RANDOM_BYTES);
    return SodiumInterop::ToHex(random);
}

std::string KeyBundleGenerator::Fingerprint(std::span<const uint8_t> public_key) {
    return SodiumInterop::ToHex(SodiumInterop::Sha256(public_key));
}

}
