#pragma once
#include "cgraph/models/x25519_key_pair.hpp"
#include <string>
namespace cgraph::e2ee::models {
class SignedPreKey {
public:
    SignedPreKey(X25519KeyPair key_pair, std::string key_id, std::vector<uint8_t> signature)
        : key_pair_(std::move(key_pair))
        , key_id_(std::move(key_id))
        , signature_(std::move(signature)) {}
    SignedPreKey(SignedPreKey&&) noexcept = default;
    SignedPreKey& operator=(SignedPreKey&&) noexcept = default;
    SignedPreKey(const SignedPreKey&) = delete;
    SignedPreKey& operator=(const SignedPreKey&) = delete;
    [[nodiscard]] const X25519KeyPair& GetKeyPair() const noexcept {
        return key_pair_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return key_pair_.GetPublicKey();
    }
    [[nodiscard]] const std::string& GetKeyId() const noexcept {
        return key_id_;
    }
    /// Ed25519 signature by the identity signing key over the raw public key.
    [[nodiscard]] const std::vector<uint8_t>& GetSignature() const noexcept {
        return signature_;
    }
private:
    X25519KeyPair key_pair_;
    std::string key_id_;
    std::vector<uint8_t> signature_;
};
}
