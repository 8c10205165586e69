#pragma once
#include "cgraph/storage/i_secure_storage.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
namespace cgraph::e2ee::storage {
/// Process-lifetime storage. Values are wiped when replaced or deleted.
class InMemorySecureStorage final : public ISecureStorage {
public:
    InMemorySecureStorage() : lock_(std::make_unique<std::mutex>()) {}
    ~InMemorySecureStorage() override;
    [[nodiscard]] Result<std::optional<std::vector<uint8_t>>, E2eeFailure> Get(std::string_view key) override;
    [[nodiscard]] Result<Unit, E2eeFailure> Set(std::string_view key, std::span<const uint8_t> value) override;
    [[nodiscard]] Result<Unit, E2eeFailure> Delete(std::string_view key) override;
    [[nodiscard]] size_t Size() const;
private:
    std::map<std::string, std::vector<uint8_t>, std::less<>> entries_;
    mutable std::unique_ptr<std::mutex> lock_;
};
}
