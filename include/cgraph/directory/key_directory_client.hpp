#pragma once
#include "cgraph/core/result.hpp"
#include "cgraph/core/failures.hpp"
#include "cgraph/configuration/e2ee_config.hpp"
#include "cgraph/directory/i_key_directory.hpp"
#include "cgraph/models/remote_prekey_bundle.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>
namespace cgraph::e2ee::directory {

/**
 * @brief Retrying front end over an IKeyDirectory connection
 *
 * Retryable failures (Directory, Revocation) are retried up to the configured
 * attempt count with exponential backoff. Shutdown() wakes any backoff wait
 * and makes in-flight and later calls fail with Cancelled.
 *
 * Fetched bundles are passed through BundleValidator before they are
 * returned, so callers only ever see verified remote key material.
 */
class KeyDirectoryClient {
public:
    KeyDirectoryClient(std::shared_ptr<IKeyDirectory> directory, configuration::E2eeConfig config);

    KeyDirectoryClient(const KeyDirectoryClient&) = delete;
    KeyDirectoryClient& operator=(const KeyDirectoryClient&) = delete;

    [[nodiscard]] Result<Unit, E2eeFailure> RegisterBundle(const pb::RegistrationRequest& request);
    [[nodiscard]] Result<uint32_t, E2eeFailure> UploadPrekeys(const pb::PrekeyUploadRequest& request);
    [[nodiscard]] Result<uint32_t, E2eeFailure> GetRemainingPrekeyCount(std::string_view device_id);
    [[nodiscard]] Result<models::RemotePrekeyBundle, E2eeFailure> FetchPrekeyBundle(std::string_view user_id);
    [[nodiscard]] Result<std::vector<pb::DeviceInfo>, E2eeFailure> ListDevices();
    [[nodiscard]] Result<Unit, E2eeFailure> RevokeDevice(std::string_view device_id);

    void Shutdown();
    [[nodiscard]] bool IsShutdown() const noexcept {
        return shutdown_.load(std::memory_order_acquire);
    }

private:
    template<typename T>
    [[nodiscard]] Result<T, E2eeFailure> WithRetry(
        std::string_view operation,
        const std::function<Result<T, E2eeFailure>()>& call);

    /// Returns false if shutdown interrupted the wait.
    [[nodiscard]] bool WaitBackoff(std::chrono::milliseconds delay);

    std::shared_ptr<IKeyDirectory> directory_;
    configuration::E2eeConfig config_;
    std::atomic<bool> shutdown_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};
}
