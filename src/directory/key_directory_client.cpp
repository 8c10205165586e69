#include "cgraph/directory/key_directory_client.hpp"
#include "cgraph/directory/bundle_validator.hpp"
#include "cgraph/core/constants.hpp"
#include "cgraph/debug/logger.hpp"

#include <stdexcept>

namespace cgraph::e2ee::directory {

namespace {
    constexpr std::string_view kComponent = "DIRECTORY";
}

KeyDirectoryClient::KeyDirectoryClient(
    std::shared_ptr<IKeyDirectory> directory,
    configuration::E2eeConfig config)
    : directory_(std::move(directory))
    , config_(config) {
    if (!directory_) {
        throw std::invalid_argument("KeyDirectoryClient requires a directory connection");
    }
}

template<typename T>
Result<T, E2eeFailure> KeyDirectoryClient::WithRetry(
    std::string_view operation,
    const std::function<Result<T, E2eeFailure>()>& call) {
    const uint32_t max_attempts = config_.DirectoryMaxAttempts() == 0 ? 1 : config_.DirectoryMaxAttempts();
    auto delay = config_.DirectoryBaseBackoff();

    for (uint32_t attempt = 1;; ++attempt) {
        if (IsShutdown()) {
            return Result<T, E2eeFailure>::Err(
                E2eeFailure::Cancelled(std::string(ErrorMessages::DIRECTORY_SHUT_DOWN)));
        }
        auto result = call();
        if (result.IsOk() || !result.UnwrapErr().IsRetryable() || attempt >= max_attempts) {
            if (result.IsErr()) {
                CGRAPH_LOG_DEBUG(kComponent, "{} failed after {} attempt(s): {}",
                    operation, attempt, result.UnwrapErr().message);
            }
            return result;
        }
        CGRAPH_LOG_INFO(kComponent, "{} attempt {}/{} failed, retrying in {}ms: {}",
            operation, attempt, max_attempts, delay.count(), result.UnwrapErr().message);
        if (!WaitBackoff(delay)) {
            return Result<T, E2eeFailure>::Err(
                E2eeFailure::Cancelled(std::string(ErrorMessages::DIRECTORY_SHUT_DOWN)));
        }
        delay *= 2;
    }
}

bool KeyDirectoryClient::WaitBackoff(const std::chrono::milliseconds delay) {
    std::unique_lock lock(wait_mutex_);
    return !wait_cv_.wait_for(lock, delay, [this] { return IsShutdown(); });
}

void KeyDirectoryClient::Shutdown() {
    {
        std::lock_guard lock(wait_mutex_);
        shutdown_.store(true, std::memory_order_release);
    }
    wait_cv_.notify_all();
}

Result<Unit, E2eeFailure> KeyDirectoryClient::RegisterBundle(const pb::RegistrationRequest& request) {
    return WithRetry<Unit>("register", [&] { return directory_->RegisterBundle(request); });
}

Result<uint32_t, E2eeFailure> KeyDirectoryClient::UploadPrekeys(const pb::PrekeyUploadRequest& request) {
    if (request.prekeys_size() == 0) {
        return Result<uint32_t, E2eeFailure>::Ok(0);
    }
    if (static_cast<size_t>(request.prekeys_size()) > ProtocolConstants::MAX_PREKEYS_PER_CALL) {
        return Result<uint32_t, E2eeFailure>::Err(E2eeFailure::InvalidInput(compat::format(
            "Prekey upload of {} exceeds the per-call limit of {}",
            request.prekeys_size(), ProtocolConstants::MAX_PREKEYS_PER_CALL)));
    }
    return WithRetry<uint32_t>("upload-prekeys", [&] { return directory_->UploadPrekeys(request); });
}

Result<uint32_t, E2eeFailure> KeyDirectoryClient::GetRemainingPrekeyCount(std::string_view device_id) {
    return WithRetry<uint32_t>("prekey-count", [&] { return directory_->GetRemainingPrekeyCount(device_id); });
}

Result<models::RemotePrekeyBundle, E2eeFailure> KeyDirectoryClient::FetchPrekeyBundle(std::string_view user_id) {
    if (user_id.empty()) {
        return Result<models::RemotePrekeyBundle, E2eeFailure>::Err(
            E2eeFailure::InvalidInput("Recipient id must not be empty"));
    }
    auto fetched = WithRetry<pb::ServerPrekeyBundle>(
        "fetch-bundle", [&] { return directory_->FetchPrekeyBundle(user_id); });
    if (fetched.IsErr()) {
        return Result<models::RemotePrekeyBundle, E2eeFailure>::Err(std::move(fetched).UnwrapErr());
    }
    const auto& bundle = fetched.Unwrap();
    if (bundle.user_id() != user_id) {
        return Result<models::RemotePrekeyBundle, E2eeFailure>::Err(E2eeFailure::KeyAgreement(
            compat::format("Directory answered for '{}' instead of '{}'", bundle.user_id(), user_id)));
    }
    auto validated = BundleValidator::Validate(bundle);
    if (validated.IsErr()) {
        CGRAPH_LOG_WARN(kComponent, "Rejected bundle for {}: {}", user_id, validated.UnwrapErr().message);
    }
    return validated;
}

Result<std::vector<pb::DeviceInfo>, E2eeFailure> KeyDirectoryClient::ListDevices() {
    return WithRetry<std::vector<pb::DeviceInfo>>("list-devices", [&] { return directory_->ListDevices(); });
}

Result<Unit, E2eeFailure> KeyDirectoryClient::RevokeDevice(std::string_view device_id) {
    if (device_id.empty()) {
        return Result<Unit, E2eeFailure>::Err(E2eeFailure::InvalidInput("Device id must not be empty"));
    }
    return WithRetry<Unit>("revoke-device", [&] { return directory_->RevokeDevice(device_id); });
}

}
