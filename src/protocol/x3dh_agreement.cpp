#include "cgraph/protocol/x3dh_agreement.hpp"
#include "cgraph/crypto/hkdf.hpp"
#include "cgraph/crypto/sodium_interop.hpp"
#include "cgraph/core/constants.hpp"
#include "cgraph/core/format.hpp"
#include "cgraph/debug/logger.hpp"

#include <array>

namespace cgraph::e2ee::protocol {
using crypto::Hkdf;
using crypto::SodiumInterop;
using crypto::SecureMemoryHandle;
using models::X25519KeyPair;

namespace {
    constexpr std::string_view kComponent = "X3DH";

    /// Wipes every collected DH output when it goes out of scope.
    class DhTranscript {
    public:
        DhTranscript() {
            ikm_.reserve(ProtocolConstants::MAX_DH_COUNT * Constants::X_25519_SHARED_SECRET_SIZE);
        }
        ~DhTranscript() {
            (void)SodiumInterop::SecureWipe(std::span<uint8_t>(ikm_));
        }
        DhTranscript(const DhTranscript&) = delete;
        DhTranscript& operator=(const DhTranscript&) = delete;

        Result<Unit, E2eeFailure> Append(
            std::string_view label,
            const X25519KeyPair& local,
            std::span<const uint8_t> remote_public) {
            auto dh = local.DiffieHellman(remote_public);
            if (dh.IsErr()) {
                return Result<Unit, E2eeFailure>::Err(E2eeFailure::KeyAgreement(
                    compat::format("{} failed: {}", label, dh.UnwrapErr().message)));
            }
            auto& shared = dh.Unwrap();
            CGRAPH_LOG_KEY(kComponent, label, std::span<const uint8_t>(shared));
            ikm_.insert(ikm_.end(), shared.begin(), shared.end());
            (void)SodiumInterop::SecureWipe(std::span<uint8_t>(shared));
            return Result<Unit, E2eeFailure>::Ok(unit);
        }

        Result<SecureMemoryHandle, E2eeFailure> Derive(std::string_view info) const {
            if (info.empty()) {
                return Result<SecureMemoryHandle, E2eeFailure>::Err(
                    E2eeFailure::KeyAgreement("HKDF info must not be empty"));
            }
            const std::array<uint8_t, ProtocolConstants::HKDF_SALT_SIZE> salt{};
            std::array<uint8_t, ProtocolConstants::DERIVED_KEY_SIZE> okm{};
            auto derived = Hkdf::DeriveKey(
                ikm_, okm, salt,
                std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(info.data()), info.size()));
            if (derived.IsErr()) {
                (void)SodiumInterop::SecureWipe(std::span<uint8_t>(okm));
                return Result<SecureMemoryHandle, E2eeFailure>::Err(E2eeFailure::KeyAgreement(
                    compat::format("HKDF failed: {}", derived.UnwrapErr().message)));
            }
            auto handle = SecureMemoryHandle::FromBytes(okm);
            (void)SodiumInterop::SecureWipe(std::span<uint8_t>(okm));
            if (handle.IsErr()) {
                return Result<SecureMemoryHandle, E2eeFailure>::Err(E2eeFailure::KeyAgreement(
                    compat::format("Failed to store derived secret: {}", handle.UnwrapErr().message)));
            }
            return Result<SecureMemoryHandle, E2eeFailure>::Ok(std::move(handle).Unwrap());
        }

    private:
        std::vector<uint8_t> ikm_;
    };
}

Result<InitiatorAgreement, E2eeFailure> X3dhAgreement::Initiate(
    const models::IdentityKeyPair& local_identity,
    const models::RemotePrekeyBundle& remote_bundle,
    std::string_view info) {
    auto ephemeral_result = X25519KeyPair::Generate("ephemeral");
    if (ephemeral_result.IsErr()) {
        return Result<InitiatorAgreement, E2eeFailure>::Err(E2eeFailure::KeyAgreement(
            compat::format("Ephemeral key generation failed: {}", ephemeral_result.UnwrapErr().message)));
    }
    const X25519KeyPair ephemeral = std::move(ephemeral_result).Unwrap();

    DhTranscript transcript;
    CGRAPH_TRY(transcript.Append("DH1", local_identity.GetDhKeyPair(), remote_bundle.signed_pre_key));
    CGRAPH_TRY(transcript.Append("DH2", ephemeral, remote_bundle.identity_key));
    CGRAPH_TRY(transcript.Append("DH3", ephemeral, remote_bundle.signed_pre_key));

    std::optional<std::string> one_time_pre_key_id;
    if (remote_bundle.one_time_pre_key.has_value()) {
        CGRAPH_TRY(transcript.Append("DH4", ephemeral, remote_bundle.one_time_pre_key->public_key));
        one_time_pre_key_id = remote_bundle.one_time_pre_key->key_id;
    } else {
        CGRAPH_LOG_DEBUG(kComponent, "No one-time prekey for {}, agreeing without DH4", remote_bundle.user_id);
    }

    auto secret = transcript.Derive(info);
    if (secret.IsErr()) {
        return Result<InitiatorAgreement, E2eeFailure>::Err(std::move(secret).UnwrapErr());
    }
    return Result<InitiatorAgreement, E2eeFailure>::Ok(InitiatorAgreement{
        std::move(secret).Unwrap(),
        ephemeral.GetPublicKey(),
        std::move(one_time_pre_key_id)});
}

Result<SecureMemoryHandle, E2eeFailure> X3dhAgreement::Respond(
    const models::IdentityKeyPair& local_identity,
    const models::SignedPreKey& local_signed_pre_key,
    std::span<const uint8_t> sender_identity_key,
    std::span<const uint8_t> ephemeral_public_key,
    const models::OneTimePreKey* local_one_time_pre_key,
    std::string_view info) {
    DhTranscript transcript;
    CGRAPH_TRY(transcript.Append("DH1", local_signed_pre_key.GetKeyPair(), sender_identity_key));
    CGRAPH_TRY(transcript.Append("DH2", local_identity.GetDhKeyPair(), ephemeral_public_key));
    CGRAPH_TRY(transcript.Append("DH3", local_signed_pre_key.GetKeyPair(), ephemeral_public_key));
    if (local_one_time_pre_key != nullptr) {
        CGRAPH_TRY(transcript.Append("DH4", local_one_time_pre_key->GetKeyPair(), ephemeral_public_key));
    }
    return transcript.Derive(info);
}

}
