#pragma once
#include "cgraph/core/result.hpp"
#include "cgraph/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
namespace cgraph::e2ee::protocol {

/**
 * Human-comparable code for two (user id, identity key) pairs.
 *
 * The pairs are ordered by user id (bytewise, then by key when the ids are
 * equal), hashed with SHA-256 as idLow || keyLow || idHigh || keyHigh, and
 * the digest's first 24 bytes are rendered as twelve 5-digit groups. Both
 * parties get the same string.
 */
class SafetyNumber {
public:
    [[nodiscard]] static Result<std::string, E2eeFailure> Compute(
        std::string_view user_a,
        std::span<const uint8_t> identity_key_a,
        std::string_view user_b,
        std::span<const uint8_t> identity_key_b);

private:
    SafetyNumber() = delete;
};
}
