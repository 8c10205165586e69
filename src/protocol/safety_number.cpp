#include "cgraph/protocol/safety_number.hpp"
#include "cgraph/crypto/sodium_interop.hpp"
#include "cgraph/core/constants.hpp"
#include "cgraph/core/format.hpp"

#include <algorithm>
#include <vector>

namespace cgraph::e2ee::protocol {
using crypto::SodiumInterop;

namespace {
    struct Party {
        std::string_view user_id;
        std::span<const uint8_t> identity_key;
    };

    bool Precedes(const Party& a, const Party& b) {
        if (a.user_id != b.user_id) {
            return a.user_id < b.user_id;
        }
        return std::lexicographical_compare(
            a.identity_key.begin(), a.identity_key.end(),
            b.identity_key.begin(), b.identity_key.end());
    }

    void Append(std::vector<uint8_t>& out, const Party& party) {
        out.insert(out.end(), party.user_id.begin(), party.user_id.end());
        out.insert(out.end(), party.identity_key.begin(), party.identity_key.end());
    }
}

Result<std::string, E2eeFailure> SafetyNumber::Compute(
    std::string_view user_a,
    std::span<const uint8_t> identity_key_a,
    std::string_view user_b,
    std::span<const uint8_t> identity_key_b) {
    if (identity_key_a.empty() || identity_key_b.empty()) {
        return Result<std::string, E2eeFailure>::Err(
            E2eeFailure::InvalidInput("Safety number needs both identity keys"));
    }

    Party low{user_a, identity_key_a};
    Party high{user_b, identity_key_b};
    if (Precedes(high, low)) {
        std::swap(low, high);
    }

    std::vector<uint8_t> material;
    material.reserve(low.user_id.size() + low.identity_key.size() + high.user_id.size() + high.identity_key.size());
    Append(material, low);
    Append(material, high);
    const auto digest = SodiumInterop::Sha256(material);

    std::string code;
    code.reserve(SafetyNumberConstants::CHUNK_COUNT * (SafetyNumberConstants::DIGITS_PER_CHUNK + 1));
    for (size_t chunk = 0; chunk < SafetyNumberConstants::CHUNK_COUNT; ++chunk) {
        const size_t offset = chunk * SafetyNumberConstants::CHUNK_BYTES;
        const uint32_t value = (static_cast<uint32_t>(digest[offset]) << 8) | digest[offset + 1];
        if (chunk != 0) {
            code.push_back(' ');
        }
        code += compat::format("{:05}", value);
    }
    return Result<std::string, E2eeFailure>::Ok(std::move(code));
}

}
