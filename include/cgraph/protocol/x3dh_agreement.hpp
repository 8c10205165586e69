#pragma once
#include "cgraph/core/result.hpp"
#include "cgraph/core/failures.hpp"
#include "cgraph/crypto/sodium_secure_memory_handle.hpp"
#include "cgraph/models/identity_key_pair.hpp"
#include "cgraph/models/signed_pre_key.hpp"
#include "cgraph/models/one_time_pre_key.hpp"
#include "cgraph/models/remote_prekey_bundle.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace cgraph::e2ee::protocol {

/// Output of the sending side of one key agreement.
struct InitiatorAgreement {
    crypto::SecureMemoryHandle shared_secret;
    std::vector<uint8_t> ephemeral_public_key;
    std::optional<std::string> one_time_pre_key_id;
};

/**
 * @brief X3DH key agreement, one run per message
 *
 * Initiator (A) against recipient bundle (B):
 *   DH1 = DH(IK_A, SPK_B)
 *   DH2 = DH(EK_A, IK_B)
 *   DH3 = DH(EK_A, SPK_B)
 *   DH4 = DH(EK_A, OPK_B)      only when the bundle carries a one-time prekey
 *   SK  = HKDF-SHA256(salt = 32 zero bytes, ikm = DH1 || DH2 || DH3 [|| DH4], info)
 *
 * The responder computes the same four values from its private halves. The
 * concatenation order is fixed on both sides. Every failure is reported as
 * KeyAgreement and intermediate DH outputs are wiped before returning.
 */
class X3dhAgreement {
public:
    [[nodiscard]] static Result<InitiatorAgreement, E2eeFailure> Initiate(
        const models::IdentityKeyPair& local_identity,
        const models::RemotePrekeyBundle& remote_bundle,
        std::string_view info);

    [[nodiscard]] static Result<crypto::SecureMemoryHandle, E2eeFailure> Respond(
        const models::IdentityKeyPair& local_identity,
        const models::SignedPreKey& local_signed_pre_key,
        std::span<const uint8_t> sender_identity_key,
        std::span<const uint8_t> ephemeral_public_key,
        const models::OneTimePreKey* local_one_time_pre_key,
        std::string_view info);

private:
    X3dhAgreement() = delete;
};
}
