#pragma once
#include "cgraph/core/result.hpp"
#include "cgraph/core/failures.hpp"
#include "cgraph/models/remote_prekey_bundle.hpp"
#include "directory/key_directory.pb.h"
#include <cstdint>
#include <span>
namespace cgraph::e2ee::directory {

/**
 * Deserialization boundary for directory answers.
 *
 * Anything that reaches the agreement engine has passed here: key sizes,
 * point validity, identifiers, and the Ed25519 signature on the signed
 * prekey under the published identity signing key. Every rejection is a
 * KeyAgreement failure so the caller aborts the send.
 */
class BundleValidator {
public:
    [[nodiscard]] static Result<models::RemotePrekeyBundle, E2eeFailure> Validate(
        const proto::directory::ServerPrekeyBundle& bundle);
    [[nodiscard]] static Result<models::RemotePrekeyBundle, E2eeFailure> Parse(
        std::span<const uint8_t> serialized);
private:
    BundleValidator() = delete;
};
}
