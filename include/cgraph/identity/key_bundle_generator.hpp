#pragma once
#include "cgraph/core/result.hpp"
#include "cgraph/core/failures.hpp"
#include "cgraph/core/constants.hpp"
#include "cgraph/models/identity_key_pair.hpp"
#include "cgraph/models/signed_pre_key.hpp"
#include "cgraph/models/one_time_pre_key.hpp"
#include "cgraph/models/key_bundle.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace cgraph::e2ee::identity {
using models::IdentityKeyPair;
using models::SignedPreKey;
using models::OneTimePreKey;
using models::KeyBundle;

/**
 * @brief Produces every kind of device key material
 *
 * Stateless. Private halves are returned in secure memory and never leave
 * the caller unless it persists them through LocalKeyStore.
 */
class KeyBundleGenerator {
public:
    /**
     * @brief Fresh X25519 identity key, Ed25519 signing key and random key id
     */
    [[nodiscard]] static Result<IdentityKeyPair, E2eeFailure> GenerateIdentityKeyPair(
        std::string device_id);

    /**
     * @brief Fresh X25519 prekey signed with the identity signing key
     *
     * The signature covers exactly the 32-byte public key and verifies under
     * the identity's published Ed25519 key.
     */
    [[nodiscard]] static Result<SignedPreKey, E2eeFailure> GenerateSignedPreKey(
        const IdentityKeyPair& identity);

    /**
     * @brief `count` one-time prekeys with ids unique within the batch
     *
     * @param workers Number of threads sharing the batch; 1 generates inline
     */
    [[nodiscard]] static Result<std::vector<OneTimePreKey>, E2eeFailure> GenerateOneTimePreKeys(
        uint32_t count,
        uint32_t workers = 1);

    [[nodiscard]] static Result<KeyBundle, E2eeFailure> GenerateKeyBundle(
        std::string device_id,
        uint32_t one_time_pre_key_count = ProtocolConstants::DEFAULT_ONE_TIME_PREKEY_BATCH,
        uint32_t workers = 1);

    /// `<tag>_<8 hex>_<unix millis>`, the device naming used by the directory.
    [[nodiscard]] static std::string GenerateDeviceId(
        std::string_view platform_tag = ProtocolConstants::DEFAULT_DEVICE_TAG);

    /// Lowercase hex of 8 random bytes.
    [[nodiscard]] static std::string GenerateKeyId();

    /// Lowercase hex SHA-256 of a public key, shown to users for manual comparison.
    [[nodiscard]] static std::string Fingerprint(std::span<const uint8_t> public_key);

private:
    [[nodiscard]] static Result<std::vector<OneTimePreKey>, E2eeFailure> GenerateOneTimePreKeyRange(
        uint32_t count);

    KeyBundleGenerator() = delete;
};
}
