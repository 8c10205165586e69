#include "cgraph/storage/in_memory_secure_storage.hpp"
#include "cgraph/crypto/sodium_interop.hpp"

namespace cgraph::e2ee::storage {
using crypto::SodiumInterop;

InMemorySecureStorage::~InMemorySecureStorage() {
    for (auto& [key, value] : entries_) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(value));
    }
}

Result<std::optional<std::vector<uint8_t>>, E2eeFailure> InMemorySecureStorage::Get(std::string_view key) {
    std::lock_guard guard(*lock_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return Result<std::optional<std::vector<uint8_t>>, E2eeFailure>::Ok(std::nullopt);
    }
    return Result<std::optional<std::vector<uint8_t>>, E2eeFailure>::Ok(it->second);
}

Result<Unit, E2eeFailure> InMemorySecureStorage::Set(std::string_view key, std::span<const uint8_t> value) {
    std::lock_guard guard(*lock_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(it->second));
        it->second.assign(value.begin(), value.end());
    } else {
        entries_.emplace(std::string(key), std::vector<uint8_t>(value.begin(), value.end()));
    }
    return Result<Unit, E2eeFailure>::Ok(unit);
}

Result<Unit, E2eeFailure> InMemorySecureStorage::Delete(std::string_view key) {
    std::lock_guard guard(*lock_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(it->second));
        entries_.erase(it);
    }
    return Result<Unit, E2eeFailure>::Ok(unit);
}

size_t InMemorySecureStorage::Size() const {
    std::lock_guard guard(*lock_);
    return entries_.size();
}

}
