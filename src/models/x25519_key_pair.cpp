#include "cgraph/models/x25519_key_pair.hpp"
#include "cgraph/crypto/sodium_interop.hpp"
#include "cgraph/crypto/dh_validator.hpp"
#include "cgraph/core/constants.hpp"

namespace cgraph::e2ee::models {
using crypto::SodiumInterop;
using crypto::SecureMemoryHandle;

X25519KeyPair::X25519KeyPair(
    SecureMemoryHandle secret_key_handle,
    std::vector<uint8_t> public_key)
    : secret_key_handle_(std::move(secret_key_handle))
    , public_key_(std::move(public_key)) {
}

Result<X25519KeyPair, E2eeFailure> X25519KeyPair::Generate(std::string_view key_purpose) {
    auto key_result = SodiumInterop::GenerateX25519KeyPair(key_purpose);
    if (key_result.IsErr()) {
        return Result<X25519KeyPair, E2eeFailure>::Err(std::move(key_result).UnwrapErr());
    }
    auto [secret_handle, public_key] = std::move(key_result).Unwrap();
    return Result<X25519KeyPair, E2eeFailure>::Ok(
        X25519KeyPair(std::move(secret_handle), std::move(public_key)));
}

Result<X25519KeyPair, E2eeFailure> X25519KeyPair::FromPrivateKey(std::span<const uint8_t> private_key) {
    auto public_result = SodiumInterop::DeriveX25519PublicKey(private_key);
    if (public_result.IsErr()) {
        return Result<X25519KeyPair, E2eeFailure>::Err(std::move(public_result).UnwrapErr());
    }
    auto handle_result = SecureMemoryHandle::FromBytes(private_key);
    if (handle_result.IsErr()) {
        return Result<X25519KeyPair, E2eeFailure>::Err(
            E2eeFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    return Result<X25519KeyPair, E2eeFailure>::Ok(
        X25519KeyPair(std::move(handle_result).Unwrap(), std::move(public_result).Unwrap()));
}

Result<std::vector<uint8_t>, E2eeFailure> X25519KeyPair::GetSecretKeyCopy() const {
    auto read_result = secret_key_handle_.ReadBytes(Constants::X_25519_PRIVATE_KEY_SIZE);
    if (read_result.IsErr()) {
        return Result<std::vector<uint8_t>, E2eeFailure>::Err(
            E2eeFailure::FromSodiumFailure(read_result.UnwrapErr()));
    }
    return Result<std::vector<uint8_t>, E2eeFailure>::Ok(std::move(read_result).Unwrap());
}

Result<std::vector<uint8_t>, E2eeFailure> X25519KeyPair::DiffieHellman(
    std::span<const uint8_t> remote_public) const {
    auto validation = crypto::DhValidator::ValidateX25519PublicKey(remote_public);
    if (validation.IsErr()) {
        return Result<std::vector<uint8_t>, E2eeFailure>::Err(std::move(validation).UnwrapErr());
    }
    std::vector<uint8_t> shared(Constants::X_25519_SHARED_SECRET_SIZE);
    auto dh_result = secret_key_handle_.WithReadAccess([&](std::span<const uint8_t> secret) {
        return crypto_scalarmult(shared.data(), secret.data(), remote_public.data());
    });
    if (dh_result.IsErr()) {
        return Result<std::vector<uint8_t>, E2eeFailure>::Err(
            E2eeFailure::FromSodiumFailure(dh_result.UnwrapErr()));
    }
    if (dh_result.Unwrap() != SodiumConstants::SUCCESS) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(shared));
        return Result<std::vector<uint8_t>, E2eeFailure>::Err(
            E2eeFailure::KeyAgreement("X25519 produced an all-zero shared secret"));
    }
    return Result<std::vector<uint8_t>, E2eeFailure>::Ok(std::move(shared));
}

}
