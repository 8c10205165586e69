#pragma once
#include "cgraph/core/result.hpp"
#include "cgraph/core/failures.hpp"
#include "cgraph/crypto/sodium_secure_memory_handle.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
namespace cgraph::e2ee::models {
class X25519KeyPair {
public:
    [[nodiscard]] static Result<X25519KeyPair, E2eeFailure> Generate(std::string_view key_purpose);
    /// Rebuilds a pair from a stored private scalar; the public key is re-derived.
    [[nodiscard]] static Result<X25519KeyPair, E2eeFailure> FromPrivateKey(
        std::span<const uint8_t> private_key);
    X25519KeyPair(
        crypto::SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key);
    X25519KeyPair(X25519KeyPair&&) noexcept = default;
    X25519KeyPair& operator=(X25519KeyPair&&) noexcept = default;
    X25519KeyPair(const X25519KeyPair&) = delete;
    X25519KeyPair& operator=(const X25519KeyPair&) = delete;
    [[nodiscard]] const crypto::SecureMemoryHandle& GetSecretKeyHandle() const noexcept {
        return secret_key_handle_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] std::span<const uint8_t> GetPublicKeySpan() const noexcept {
        return std::span<const uint8_t>(public_key_);
    }
    [[nodiscard]] Result<std::vector<uint8_t>, E2eeFailure> GetSecretKeyCopy() const;
    /// X25519(secret, remote_public). Rejects invalid remote keys and all-zero outputs.
    [[nodiscard]] Result<std::vector<uint8_t>, E2eeFailure> DiffieHellman(
        std::span<const uint8_t> remote_public) const;
private:
    crypto::SecureMemoryHandle secret_key_handle_;
    std::vector<uint8_t> public_key_;
};
}
