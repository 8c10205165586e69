#pragma once
#include "cgraph/core/result.hpp"
#include "cgraph/core/failures.hpp"
#include "directory/key_directory.pb.h"
#include <cstdint>
#include <string_view>
#include <vector>
namespace cgraph::e2ee::directory {
namespace pb = cgraph::proto::directory;

/**
 * Authenticated connection to the key directory, bound to one user.
 *
 * Implementations report transport and server faults as
 * E2eeFailureType::Directory (revocation faults as Revocation); callers
 * decide whether to retry. Requests that can never succeed, such as
 * revoking a device the user does not own, are InvalidInput. A fetched bundle's one-time prekey has been
 * marked used by the directory and is never issued again.
 */
class IKeyDirectory {
public:
    virtual ~IKeyDirectory() = default;
    [[nodiscard]] virtual Result<Unit, E2eeFailure> RegisterBundle(
        const pb::RegistrationRequest& request) = 0;
    /// Returns how many of the uploaded keys were new.
    [[nodiscard]] virtual Result<uint32_t, E2eeFailure> UploadPrekeys(
        const pb::PrekeyUploadRequest& request) = 0;
    [[nodiscard]] virtual Result<uint32_t, E2eeFailure> GetRemainingPrekeyCount(
        std::string_view device_id) = 0;
    [[nodiscard]] virtual Result<pb::ServerPrekeyBundle, E2eeFailure> FetchPrekeyBundle(
        std::string_view user_id) = 0;
    /// Devices registered by the authenticated user.
    [[nodiscard]] virtual Result<std::vector<pb::DeviceInfo>, E2eeFailure> ListDevices() = 0;
    [[nodiscard]] virtual Result<Unit, E2eeFailure> RevokeDevice(std::string_view device_id) = 0;
};
}
