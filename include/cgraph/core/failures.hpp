#pragma once
#include <string>
#include <string_view>
namespace cgraph::e2ee {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    InvalidOperation
};
enum class E2eeFailureType {
    Generic,
    KeyGeneration,
    Setup,
    NotInitialized,
    Storage,
    Directory,
    KeyAgreement,
    Decryption,
    Revocation,
    InvalidInput,
    Decode,
    Encode,
    Cancelled,
    InvalidState
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/**
 * Error value carried by every fallible E2EE operation.
 *
 * Setup, NotInitialized, Directory, KeyAgreement, Decryption and Revocation
 * are the kinds surfaced to the messaging layer. The remaining kinds describe
 * lower-level faults (storage, encoding, bad arguments) and are reported as-is.
 */
class E2eeFailure {
public:
    E2eeFailureType type;
    std::string message;
    E2eeFailure(const E2eeFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static E2eeFailure Generic(std::string msg) {
        return {E2eeFailureType::Generic, std::move(msg)};
    }
    static E2eeFailure KeyGeneration(std::string msg) {
        return {E2eeFailureType::KeyGeneration, std::move(msg)};
    }
    static E2eeFailure Setup(std::string msg) {
        return {E2eeFailureType::Setup, std::move(msg)};
    }
    static E2eeFailure NotInitialized(std::string msg) {
        return {E2eeFailureType::NotInitialized, std::move(msg)};
    }
    static E2eeFailure Storage(std::string msg) {
        return {E2eeFailureType::Storage, std::move(msg)};
    }
    static E2eeFailure Directory(std::string msg) {
        return {E2eeFailureType::Directory, std::move(msg)};
    }
    static E2eeFailure KeyAgreement(std::string msg) {
        return {E2eeFailureType::KeyAgreement, std::move(msg)};
    }
    static E2eeFailure Decryption(std::string msg) {
        return {E2eeFailureType::Decryption, std::move(msg)};
    }
    static E2eeFailure Revocation(std::string msg) {
        return {E2eeFailureType::Revocation, std::move(msg)};
    }
    static E2eeFailure InvalidInput(std::string msg) {
        return {E2eeFailureType::InvalidInput, std::move(msg)};
    }
    static E2eeFailure Decode(std::string msg) {
        return {E2eeFailureType::Decode, std::move(msg)};
    }
    static E2eeFailure Encode(std::string msg) {
        return {E2eeFailureType::Encode, std::move(msg)};
    }
    static E2eeFailure Cancelled(std::string msg) {
        return {E2eeFailureType::Cancelled, std::move(msg)};
    }
    static E2eeFailure InvalidState(std::string msg) {
        return {E2eeFailureType::InvalidState, std::move(msg)};
    }
    static E2eeFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
    /// Transient directory faults may be retried; everything else is final.
    [[nodiscard]] bool IsRetryable() const noexcept {
        return type == E2eeFailureType::Directory || type == E2eeFailureType::Revocation;
    }
};

[[nodiscard]] constexpr std::string_view ToString(const E2eeFailureType type) noexcept {
    switch (type) {
        case E2eeFailureType::Generic: return "Generic";
        case E2eeFailureType::KeyGeneration: return "KeyGeneration";
        case E2eeFailureType::Setup: return "Setup";
        case E2eeFailureType::NotInitialized: return "NotInitialized";
        case E2eeFailureType::Storage: return "Storage";
        case E2eeFailureType::Directory: return "Directory";
        case E2eeFailureType::KeyAgreement: return "KeyAgreement";
        case E2eeFailureType::Decryption: return "Decryption";
        case E2eeFailureType::Revocation: return "Revocation";
        case E2eeFailureType::InvalidInput: return "InvalidInput";
        case E2eeFailureType::Decode: return "Decode";
        case E2eeFailureType::Encode: return "Encode";
        case E2eeFailureType::Cancelled: return "Cancelled";
        case E2eeFailureType::InvalidState: return "InvalidState";
    }
    return "Unknown";
}
}
