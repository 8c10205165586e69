#pragma once
#include "cgraph/core/result.hpp"
#include "cgraph/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace cgraph::e2ee::crypto {

/**
 * AES-256-GCM over OpenSSL EVP.
 *
 * Stateless primitive: the caller owns nonce uniqueness per key. Output of
 * Encrypt is ciphertext followed by the 16-byte tag. A tag mismatch on
 * Decrypt is reported as E2eeFailureType::Decryption and no plaintext is
 * returned.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, E2eeFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, E2eeFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
