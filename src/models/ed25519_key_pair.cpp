#include "cgraph/models/ed25519_key_pair.hpp"
#include "cgraph/crypto/sodium_interop.hpp"
#include "cgraph/core/constants.hpp"

namespace cgraph::e2ee::models {
using crypto::SodiumInterop;
using crypto::SecureMemoryHandle;

Ed25519KeyPair::Ed25519KeyPair(
    SecureMemoryHandle secret_key_handle,
    std::vector<uint8_t> public_key)
    : secret_key_handle_(std::move(secret_key_handle))
    , public_key_(std::move(public_key)) {
}

Result<Ed25519KeyPair, E2eeFailure> Ed25519KeyPair::Generate() {
    auto key_result = SodiumInterop::GenerateEd25519KeyPair();
    if (key_result.IsErr()) {
        return Result<Ed25519KeyPair, E2eeFailure>::Err(std::move(key_result).UnwrapErr());
    }
    auto [secret_handle, public_key] = std::move(key_result).Unwrap();
    return Result<Ed25519KeyPair, E2eeFailure>::Ok(
        Ed25519KeyPair(std::move(secret_handle), std::move(public_key)));
}

Result<Ed25519KeyPair, E2eeFailure> Ed25519KeyPair::FromSecretKey(std::span<const uint8_t> secret_key) {
    if (secret_key.size() != Constants::ED_25519_SECRET_KEY_SIZE) {
        return Result<Ed25519KeyPair, E2eeFailure>::Err(
            E2eeFailure::InvalidInput("Ed25519 secret key has incorrect size"));
    }
    std::vector<uint8_t> public_key(Constants::ED_25519_PUBLIC_KEY_SIZE);
    if (crypto_sign_ed25519_sk_to_pk(public_key.data(), secret_key.data()) != SodiumConstants::SUCCESS) {
        return Result<Ed25519KeyPair, E2eeFailure>::Err(
            E2eeFailure::KeyGeneration("Failed to derive Ed25519 public key"));
    }
    auto handle_result = SecureMemoryHandle::FromBytes(secret_key);
    if (handle_result.IsErr()) {
        return Result<Ed25519KeyPair, E2eeFailure>::Err(
            E2eeFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    return Result<Ed25519KeyPair, E2eeFailure>::Ok(
        Ed25519KeyPair(std::move(handle_result).Unwrap(), std::move(public_key)));
}

Result<std::vector<uint8_t>, E2eeFailure> Ed25519KeyPair::GetSecretKeyCopy() const {
    auto read_result = secret_key_handle_.ReadBytes(Constants::ED_25519_SECRET_KEY_SIZE);
    if (read_result.IsErr()) {
        return Result<std::vector<uint8_t>, E2eeFailure>::Err(
            E2eeFailure::FromSodiumFailure(read_result.UnwrapErr()));
    }
    return Result<std::vector<uint8_t>, E2eeFailure>::Ok(std::move(read_result).Unwrap());
}

Result<std::vector<uint8_t>, E2eeFailure> Ed25519KeyPair::Sign(std::span<const uint8_t> message) const {
    std::vector<uint8_t> signature(Constants::ED_25519_SIGNATURE_SIZE);
    unsigned long long sig_len = 0;
    auto sign_result = secret_key_handle_.WithReadAccess([&](std::span<const uint8_t> secret) {
        return crypto_sign_detached(
            signature.data(), &sig_len,
            message.data(), message.size(),
            secret.data());
    });
    if (sign_result.IsErr()) {
        return Result<std::vector<uint8_t>, E2eeFailure>::Err(
            E2eeFailure::FromSodiumFailure(sign_result.UnwrapErr()));
    }
    if (sign_result.Unwrap() != SodiumConstants::SUCCESS || sig_len != Constants::ED_25519_SIGNATURE_SIZE) {
        return Result<std::vector<uint8_t>, E2eeFailure>::Err(
            E2eeFailure::KeyGeneration("Failed to sign message"));
    }
    return Result<std::vector<uint8_t>, E2eeFailure>::Ok(std::move(signature));
}

bool Ed25519KeyPair::Verify(
    std::span<const uint8_t> public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) {
    if (public_key.size() != Constants::ED_25519_PUBLIC_KEY_SIZE ||
        signature.size() != Constants::ED_25519_SIGNATURE_SIZE) {
        return false;
    }
    return crypto_sign_verify_detached(
        signature.data(), message.data(), message.size(), public_key.data()) == SodiumConstants::SUCCESS;
}

}
