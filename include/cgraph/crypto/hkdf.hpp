#pragma once

#include "cgraph/core/result.hpp"
#include "cgraph/core/failures.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace cgraph::e2ee::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) over OpenSSL EVP_KDF
 *
 * Used once per X3DH run to turn the concatenated DH outputs into the
 * 32-byte message key.
 */
class Hkdf {
public:
    /**
     * @brief Extract-then-expand into `output`
     *
     * @param ikm Input key material, must not be empty
     * @param output Buffer filled with derived bytes
     * @param salt Salt (empty means HashLen zero bytes per RFC 5869)
     * @param info Context string
     */
    static Result<Unit, E2eeFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, E2eeFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

}
