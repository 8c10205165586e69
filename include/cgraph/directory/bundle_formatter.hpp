#pragma once
#include "cgraph/models/key_bundle.hpp"
#include "directory/key_directory.pb.h"
#include <string_view>
#include <vector>
namespace cgraph::e2ee::directory {
/// Projects local key material onto the public wire payloads. Never reads a private key.
class BundleFormatter {
public:
    [[nodiscard]] static proto::directory::RegistrationRequest FormatForRegistration(
        const models::KeyBundle& bundle);
    [[nodiscard]] static proto::directory::PrekeyUploadRequest FormatPrekeyUpload(
        std::string_view device_id,
        const std::vector<models::OneTimePreKey>& prekeys);
private:
    BundleFormatter() = delete;
};
}
