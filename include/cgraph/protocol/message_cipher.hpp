#pragma once
#include "cgraph/core/result.hpp"
#include "cgraph/core/failures.hpp"
#include "cgraph/crypto/sodium_secure_memory_handle.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace cgraph::e2ee::protocol {

struct SealedPayload {
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> nonce;
};

/**
 * AES-256-GCM under a per-message X3DH secret.
 *
 * Each key seals exactly one message, so a random 12-byte nonce per call
 * is sufficient. Decrypt returns plaintext only after the tag verified.
 */
class MessageCipher {
public:
    [[nodiscard]] static Result<SealedPayload, E2eeFailure> Encrypt(
        std::span<const uint8_t> plaintext,
        const crypto::SecureMemoryHandle& key);

    [[nodiscard]] static Result<std::vector<uint8_t>, E2eeFailure> Decrypt(
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> nonce,
        const crypto::SecureMemoryHandle& key);

private:
    MessageCipher() = delete;
};
}
