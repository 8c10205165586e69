#include "cgraph/crypto/dh_validator.hpp"
#include "cgraph/crypto/sodium_interop.hpp"
#include "cgraph/core/format.hpp"

namespace cgraph::e2ee::crypto {

Result<Unit, E2eeFailure> DhValidator::ValidateX25519PublicKey(
    std::span<const uint8_t> public_key) {

    if (public_key.size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
        return Result<Unit, E2eeFailure>::Err(
            E2eeFailure::KeyAgreement(compat::format(
                "Invalid X25519 public key size: expected {}, got {}",
                Constants::X_25519_PUBLIC_KEY_SIZE, public_key.size())));
    }

    if (HasSmallOrder(public_key)) {
        return Result<Unit, E2eeFailure>::Err(
            E2eeFailure::KeyAgreement("X25519 public key is a small-order point"));
    }

    if (!IsCanonicalFieldElement(public_key)) {
        return Result<Unit, E2eeFailure>::Err(
            E2eeFailure::KeyAgreement("X25519 public key is not a canonical Curve25519 field element"));
    }

    return Result<Unit, E2eeFailure>::Ok(unit);
}

bool DhValidator::HasSmallOrder(std::span<const uint8_t> public_key) {
    bool found = false;
    for (const auto& point : SMALL_ORDER_POINTS) {
        found |= SodiumInterop::ConstantTimeEquals(public_key, point);
    }
    return found;
}

bool DhValidator::IsCanonicalFieldElement(std::span<const uint8_t> public_key) {
    // Compare from the most significant byte; the top bit is ignored by X25519.
    for (size_t i = Constants::CURVE_25519_FIELD_ELEMENT_SIZE; i-- > 0;) {
        uint8_t key_byte = public_key[i];
        if (i == Constants::CURVE_25519_FIELD_ELEMENT_SIZE - 1) {
            key_byte &= 0x7F;
        }
        if (key_byte < CURVE_25519_PRIME[i]) {
            return true;
        }
        if (key_byte > CURVE_25519_PRIME[i]) {
            return false;
        }
    }
    return false;
}

}
