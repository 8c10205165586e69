#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
namespace cgraph::e2ee::models {
struct RemoteOneTimePreKey {
    std::string key_id;
    std::vector<uint8_t> public_key;
};
/// A recipient's published bundle after BundleValidator accepted it.
struct RemotePrekeyBundle {
    std::string user_id;
    std::string device_id;
    std::vector<uint8_t> identity_key;
    std::string identity_key_id;
    std::vector<uint8_t> identity_signing_key;
    std::vector<uint8_t> signed_pre_key;
    std::string signed_pre_key_id;
    std::vector<uint8_t> signed_pre_key_signature;
    std::optional<RemoteOneTimePreKey> one_time_pre_key;
};
}
