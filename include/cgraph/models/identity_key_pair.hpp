#pragma once
#include "cgraph/models/x25519_key_pair.hpp"
#include "cgraph/models/ed25519_key_pair.hpp"
#include <string>
namespace cgraph::e2ee::models {
/// Long-term device identity: X25519 key for DH1/DH2, Ed25519 key for prekey signatures.
class IdentityKeyPair {
public:
    IdentityKeyPair(
        X25519KeyPair dh_key_pair,
        Ed25519KeyPair signing_key_pair,
        std::string key_id,
        std::string device_id)
        : dh_key_pair_(std::move(dh_key_pair))
        , signing_key_pair_(std::move(signing_key_pair))
        , key_id_(std::move(key_id))
        , device_id_(std::move(device_id)) {}
    IdentityKeyPair(IdentityKeyPair&&) noexcept = default;
    IdentityKeyPair& operator=(IdentityKeyPair&&) noexcept = default;
    IdentityKeyPair(const IdentityKeyPair&) = delete;
    IdentityKeyPair& operator=(const IdentityKeyPair&) = delete;
    [[nodiscard]] const X25519KeyPair& GetDhKeyPair() const noexcept {
        return dh_key_pair_;
    }
    [[nodiscard]] const Ed25519KeyPair& GetSigningKeyPair() const noexcept {
        return signing_key_pair_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return dh_key_pair_.GetPublicKey();
    }
    [[nodiscard]] const std::vector<uint8_t>& GetSigningPublicKey() const noexcept {
        return signing_key_pair_.GetPublicKey();
    }
    [[nodiscard]] const std::string& GetKeyId() const noexcept {
        return key_id_;
    }
    [[nodiscard]] const std::string& GetDeviceId() const noexcept {
        return device_id_;
    }
private:
    X25519KeyPair dh_key_pair_;
    Ed25519KeyPair signing_key_pair_;
    std::string key_id_;
    std::string device_id_;
};
}
