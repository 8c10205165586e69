#pragma once

#include "cgraph/core/result.hpp"
#include "cgraph/core/failures.hpp"
#include "cgraph/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cgraph::e2ee::crypto {

class SecureMemoryHandle;

/**
 * @brief Interop layer for libsodium
 *
 * Every private key in the subsystem is created here and handed out in a
 * SecureMemoryHandle. Encoding helpers (base64, hex) and SHA-256 live here
 * too so that callers never touch raw libsodium APIs.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium
     *
     * Must be called before any other operation. Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are wiped through a volatile pointer, large ones with
     * sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    static Result<Unit, SodiumFailure> SecureWipe(std::span<const uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without inspecting content.
     */
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    /**
     * @brief Generate an X25519 key pair
     *
     * @param key_purpose Description used in error messages
     * @return (secret key handle, public key bytes)
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, E2eeFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief Generate an Ed25519 signing key pair
     *
     * @return (64-byte secret key handle, 32-byte public key)
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, E2eeFailure>
    GenerateEd25519KeyPair();

    /**
     * @brief Derive the X25519 public key for a private scalar
     */
    static Result<std::vector<uint8_t>, E2eeFailure> DeriveX25519PublicKey(
        std::span<const uint8_t> private_key);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    [[nodiscard]] static std::vector<uint8_t> Sha256(std::span<const uint8_t> data);

    [[nodiscard]] static std::string ToHex(std::span<const uint8_t> data);

    [[nodiscard]] static std::string ToBase64(std::span<const uint8_t> data);

    /**
     * @brief Decode standard (padded) base64
     *
     * Whitespace is ignored; any other invalid character is an error.
     */
    static Result<std::vector<uint8_t>, E2eeFailure> FromBase64(std::string_view encoded);

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

}
