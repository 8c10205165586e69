#include "cgraph/crypto/hkdf.hpp"
#include "cgraph/core/format.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <memory>

namespace cgraph::e2ee::crypto {

namespace {
    struct EvpKdfDeleter {
        void operator()(EVP_KDF* kdf) const { EVP_KDF_free(kdf); }
    };
    struct EvpKdfCtxDeleter {
        void operator()(EVP_KDF_CTX* ctx) const { EVP_KDF_CTX_free(ctx); }
    };
}

Result<Unit, E2eeFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, E2eeFailure>::Err(
            E2eeFailure::InvalidInput(compat::format(
                "HKDF output size must be in [1, {}], got {}", MAX_OUTPUT_LEN, output.size())));
    }

    if (ikm.empty()) {
        return Result<Unit, E2eeFailure>::Err(
            E2eeFailure::InvalidInput("HKDF input key material cannot be empty"));
    }

    std::unique_ptr<EVP_KDF, EvpKdfDeleter> kdf(EVP_KDF_fetch(nullptr, "HKDF", nullptr));
    if (!kdf) {
        return Result<Unit, E2eeFailure>::Err(
            E2eeFailure::KeyAgreement("Failed to fetch HKDF algorithm"));
    }

    std::unique_ptr<EVP_KDF_CTX, EvpKdfCtxDeleter> kctx(EVP_KDF_CTX_new(kdf.get()));
    if (!kctx) {
        return Result<Unit, E2eeFailure>::Err(
            E2eeFailure::KeyAgreement("Failed to create HKDF context"));
    }

    OSSL_PARAM params[5];
    int param_idx = 0;
    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        "digest", const_cast<char*>("SHA256"), 0);
    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        "key", const_cast<uint8_t*>(ikm.data()), ikm.size());
    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            "salt", const_cast<uint8_t*>(salt.data()), salt.size());
    }
    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            "info", const_cast<uint8_t*>(info.data()), info.size());
    }
    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != 1) {
        return Result<Unit, E2eeFailure>::Err(
            E2eeFailure::KeyAgreement("HKDF key derivation failed"));
    }

    return Result<Unit, E2eeFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, E2eeFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(ikm, output, salt, info);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, E2eeFailure>::Err(std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, E2eeFailure>::Ok(std::move(output));
}

}
