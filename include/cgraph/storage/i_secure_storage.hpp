#pragma once
#include "cgraph/core/result.hpp"
#include "cgraph/core/failures.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>
namespace cgraph::e2ee::storage {
/// Device-local secret storage (keychain, keystore, encrypted file). Each Set replaces the value atomically.
class ISecureStorage {
public:
    virtual ~ISecureStorage() = default;
    [[nodiscard]] virtual Result<std::optional<std::vector<uint8_t>>, E2eeFailure> Get(
        std::string_view key) = 0;
    [[nodiscard]] virtual Result<Unit, E2eeFailure> Set(
        std::string_view key,
        std::span<const uint8_t> value) = 0;
    /// Deleting a missing key succeeds.
    [[nodiscard]] virtual Result<Unit, E2eeFailure> Delete(std::string_view key) = 0;
};
}
