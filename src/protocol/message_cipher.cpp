#include "cgraph/protocol/message_cipher.hpp"
#include "cgraph/crypto/aes_gcm.hpp"
#include "cgraph/crypto/sodium_interop.hpp"
#include "cgraph/core/constants.hpp"
#include "cgraph/core/format.hpp"

namespace cgraph::e2ee::protocol {
using crypto::AesGcm;
using crypto::SodiumInterop;

Result<SealedPayload, E2eeFailure> MessageCipher::Encrypt(
    std::span<const uint8_t> plaintext,
    const crypto::SecureMemoryHandle& key) {
    if (plaintext.size() > ProtocolConstants::MAX_PLAINTEXT_SIZE) {
        return Result<SealedPayload, E2eeFailure>::Err(E2eeFailure::InvalidInput(compat::format(
            "Plaintext of {} bytes exceeds the {} byte limit",
            plaintext.size(), ProtocolConstants::MAX_PLAINTEXT_SIZE)));
    }
    if (key.Size() != Constants::AES_KEY_SIZE) {
        return Result<SealedPayload, E2eeFailure>::Err(
            E2eeFailure::InvalidInput("Message key must be 32 bytes"));
    }

    auto nonce = SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);
    auto sealed = key.WithReadAccess([&](std::span<const uint8_t> key_bytes) {
        return AesGcm::Encrypt(key_bytes, nonce, plaintext);
    });
    if (sealed.IsErr()) {
        return Result<SealedPayload, E2eeFailure>::Err(E2eeFailure::FromSodiumFailure(sealed.UnwrapErr()));
    }
    auto ciphertext = std::move(sealed).Unwrap();
    if (ciphertext.IsErr()) {
        return Result<SealedPayload, E2eeFailure>::Err(std::move(ciphertext).UnwrapErr());
    }
    return Result<SealedPayload, E2eeFailure>::Ok(
        SealedPayload{std::move(ciphertext).Unwrap(), std::move(nonce)});
}

Result<std::vector<uint8_t>, E2eeFailure> MessageCipher::Decrypt(
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> nonce,
    const crypto::SecureMemoryHandle& key) {
    if (nonce.size() != Constants::AES_GCM_NONCE_SIZE) {
        return Result<std::vector<uint8_t>, E2eeFailure>::Err(E2eeFailure::Decryption(
            compat::format("Nonce must be {} bytes, got {}", Constants::AES_GCM_NONCE_SIZE, nonce.size())));
    }
    if (ciphertext_with_tag.size() < Constants::AES_GCM_TAG_SIZE) {
        return Result<std::vector<uint8_t>, E2eeFailure>::Err(
            E2eeFailure::Decryption("Ciphertext is shorter than the authentication tag"));
    }
    if (key.Size() != Constants::AES_KEY_SIZE) {
        return Result<std::vector<uint8_t>, E2eeFailure>::Err(
            E2eeFailure::InvalidInput("Message key must be 32 bytes"));
    }

    auto opened = key.WithReadAccess([&](std::span<const uint8_t> key_bytes) {
        return AesGcm::Decrypt(key_bytes, nonce, ciphertext_with_tag);
    });
    if (opened.IsErr()) {
        return Result<std::vector<uint8_t>, E2eeFailure>::Err(E2eeFailure::FromSodiumFailure(opened.UnwrapErr()));
    }
    return std::move(opened).Unwrap();
}

}
