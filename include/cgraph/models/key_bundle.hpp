#pragma once
#include "cgraph/models/identity_key_pair.hpp"
#include "cgraph/models/signed_pre_key.hpp"
#include "cgraph/models/one_time_pre_key.hpp"
#include <string>
#include <vector>
namespace cgraph::e2ee::models {
/// Full key material produced for a device at setup time.
class KeyBundle {
public:
    KeyBundle(
        IdentityKeyPair identity,
        SignedPreKey signed_pre_key,
        std::vector<OneTimePreKey> one_time_pre_keys)
        : identity_(std::move(identity))
        , signed_pre_key_(std::move(signed_pre_key))
        , one_time_pre_keys_(std::move(one_time_pre_keys)) {}
    KeyBundle(KeyBundle&&) noexcept = default;
    KeyBundle& operator=(KeyBundle&&) noexcept = default;
    KeyBundle(const KeyBundle&) = delete;
    KeyBundle& operator=(const KeyBundle&) = delete;
    [[nodiscard]] const std::string& GetDeviceId() const noexcept {
        return identity_.GetDeviceId();
    }
    [[nodiscard]] const IdentityKeyPair& GetIdentity() const noexcept {
        return identity_;
    }
    [[nodiscard]] const SignedPreKey& GetSignedPreKey() const noexcept {
        return signed_pre_key_;
    }
    [[nodiscard]] const std::vector<OneTimePreKey>& GetOneTimePreKeys() const noexcept {
        return one_time_pre_keys_;
    }
    [[nodiscard]] IdentityKeyPair TakeIdentity() && {
        return std::move(identity_);
    }
    [[nodiscard]] SignedPreKey TakeSignedPreKey() && {
        return std::move(signed_pre_key_);
    }
    [[nodiscard]] std::vector<OneTimePreKey> TakeOneTimePreKeys() && {
        return std::move(one_time_pre_keys_);
    }
private:
    IdentityKeyPair identity_;
    SignedPreKey signed_pre_key_;
    std::vector<OneTimePreKey> one_time_pre_keys_;
};
}
