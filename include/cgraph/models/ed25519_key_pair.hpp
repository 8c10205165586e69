#pragma once
#include "cgraph/core/result.hpp"
#include "cgraph/core/failures.hpp"
#include "cgraph/crypto/sodium_secure_memory_handle.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace cgraph::e2ee::models {

/**
 * Signing half of a device identity. Kept separate from the X25519 DH key so
 * that the signed prekey carries a real signature instead of a MAC.
 */
class Ed25519KeyPair {
public:
    [[nodiscard]] static Result<Ed25519KeyPair, E2eeFailure> Generate();
    [[nodiscard]] static Result<Ed25519KeyPair, E2eeFailure> FromSecretKey(
        std::span<const uint8_t> secret_key);
    Ed25519KeyPair(
        crypto::SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key);
    Ed25519KeyPair(Ed25519KeyPair&&) noexcept = default;
    Ed25519KeyPair& operator=(Ed25519KeyPair&&) noexcept = default;
    Ed25519KeyPair(const Ed25519KeyPair&) = delete;
    Ed25519KeyPair& operator=(const Ed25519KeyPair&) = delete;
    [[nodiscard]] const crypto::SecureMemoryHandle& GetSecretKeyHandle() const noexcept {
        return secret_key_handle_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] Result<std::vector<uint8_t>, E2eeFailure> GetSecretKeyCopy() const;
    [[nodiscard]] Result<std::vector<uint8_t>, E2eeFailure> Sign(std::span<const uint8_t> message) const;
    [[nodiscard]] static bool Verify(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature);
private:
    crypto::SecureMemoryHandle secret_key_handle_;
    std::vector<uint8_t> public_key_;
};
}
