#include "cgraph/crypto/sodium_interop.hpp"
#include "cgraph/crypto/sodium_secure_memory_handle.hpp"
#include "cgraph/core/format.hpp"

#include <string>

namespace cgraph::e2ee::crypto {

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                compat::format("Buffer size {} exceeds maximum {}", buffer.size(), MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<const uint8_t> buffer) {
    return SecureWipe(std::span<uint8_t>(
        const_cast<uint8_t*>(buffer.data()),
        buffer.size()));
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, E2eeFailure>
SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    using PairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, E2eeFailure>;

    auto sk_handle_result = SecureMemoryHandle::Allocate(Constants::X_25519_PRIVATE_KEY_SIZE);
    if (sk_handle_result.IsErr()) {
        return PairResult::Err(E2eeFailure::FromSodiumFailure(sk_handle_result.UnwrapErr()));
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();

    std::vector<uint8_t> sk_bytes = GetRandomBytes(Constants::X_25519_PRIVATE_KEY_SIZE);
    std::vector<uint8_t> pk_bytes(Constants::X_25519_PUBLIC_KEY_SIZE);
    const int derive_rc = crypto_scalarmult_base(pk_bytes.data(), sk_bytes.data());
    auto write_result = sk_handle.Write(std::span<const uint8_t>(sk_bytes));
    (void)SecureWipe(std::span<uint8_t>(sk_bytes));

    if (derive_rc != SodiumConstants::SUCCESS) {
        return PairResult::Err(E2eeFailure::KeyGeneration(
            compat::format("Failed to derive {} public key", key_purpose)));
    }
    if (write_result.IsErr()) {
        return PairResult::Err(E2eeFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }

    return PairResult::Ok(std::make_pair(std::move(sk_handle), std::move(pk_bytes)));
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, E2eeFailure>
SodiumInterop::GenerateEd25519KeyPair() {
    using PairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, E2eeFailure>;

    auto sk_handle_result = SecureMemoryHandle::Allocate(Constants::ED_25519_SECRET_KEY_SIZE);
    if (sk_handle_result.IsErr()) {
        return PairResult::Err(E2eeFailure::FromSodiumFailure(sk_handle_result.UnwrapErr()));
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();

    std::vector<uint8_t> pk(Constants::ED_25519_PUBLIC_KEY_SIZE);
    std::vector<uint8_t> sk(Constants::ED_25519_SECRET_KEY_SIZE);
    if (crypto_sign_keypair(pk.data(), sk.data()) != SodiumConstants::SUCCESS) {
        (void)SecureWipe(std::span<uint8_t>(sk));
        return PairResult::Err(E2eeFailure::KeyGeneration("Failed to generate Ed25519 key pair"));
    }
    auto write_result = sk_handle.Write(std::span<const uint8_t>(sk));
    (void)SecureWipe(std::span<uint8_t>(sk));
    if (write_result.IsErr()) {
        return PairResult::Err(E2eeFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }

    return PairResult::Ok(std::make_pair(std::move(sk_handle), std::move(pk)));
}

Result<std::vector<uint8_t>, E2eeFailure> SodiumInterop::DeriveX25519PublicKey(
    std::span<const uint8_t> private_key) {
    if (private_key.size() != Constants::X_25519_PRIVATE_KEY_SIZE) {
        return Result<std::vector<uint8_t>, E2eeFailure>::Err(
            E2eeFailure::InvalidInput(compat::format(
                "X25519 private key must be {} bytes, got {}",
                Constants::X_25519_PRIVATE_KEY_SIZE, private_key.size())));
    }
    std::vector<uint8_t> public_key(Constants::X_25519_PUBLIC_KEY_SIZE);
    if (crypto_scalarmult_base(public_key.data(), private_key.data()) != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, E2eeFailure>::Err(
            E2eeFailure::KeyGeneration("Failed to derive X25519 public key"));
    }
    return Result<std::vector<uint8_t>, E2eeFailure>::Ok(std::move(public_key));
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

std::vector<uint8_t> SodiumInterop::Sha256(std::span<const uint8_t> data) {
    std::vector<uint8_t> digest(crypto_hash_sha256_BYTES);
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

std::string SodiumInterop::ToHex(std::span<const uint8_t> data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.resize(data.size() * 2);
    return hex;
}

std::string SodiumInterop::ToBase64(std::span<const uint8_t> data) {
    constexpr int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string encoded(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), variant);
    encoded.resize(encoded.size() - 1);
    return encoded;
}

Result<std::vector<uint8_t>, E2eeFailure> SodiumInterop::FromBase64(std::string_view encoded) {
    std::vector<uint8_t> decoded(encoded.size() / 4 * 3 + 3);
    size_t decoded_len = 0;
    const char* end = nullptr;
    const int rc = sodium_base642bin(
        decoded.data(), decoded.size(),
        encoded.data(), encoded.size(),
        " \t\r\n", &decoded_len, &end,
        sodium_base64_VARIANT_ORIGINAL);
    if (rc != SodiumConstants::SUCCESS || end != encoded.data() + encoded.size()) {
        return Result<std::vector<uint8_t>, E2eeFailure>::Err(
            E2eeFailure::Decode("Invalid base64 input"));
    }
    decoded.resize(decoded_len);
    return Result<std::vector<uint8_t>, E2eeFailure>::Ok(std::move(decoded));
}

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

}
