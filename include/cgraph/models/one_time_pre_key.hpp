#pragma once
#include "cgraph/models/x25519_key_pair.hpp"
#include <string>
namespace cgraph::e2ee::models {
class OneTimePreKey {
public:
    OneTimePreKey(X25519KeyPair key_pair, std::string key_id)
        : key_pair_(std::move(key_pair))
        , key_id_(std::move(key_id)) {}
    OneTimePreKey(OneTimePreKey&&) noexcept = default;
    OneTimePreKey& operator=(OneTimePreKey&&) noexcept = default;
    OneTimePreKey(const OneTimePreKey&) = delete;
    OneTimePreKey& operator=(const OneTimePreKey&) = delete;
    ~OneTimePreKey() = default;
    [[nodiscard]] const X25519KeyPair& GetKeyPair() const noexcept {
        return key_pair_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return key_pair_.GetPublicKey();
    }
    [[nodiscard]] const std::string& GetKeyId() const noexcept {
        return key_id_;
    }
private:
    X25519KeyPair key_pair_;
    std::string key_id_;
};
}
