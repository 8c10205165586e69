#pragma once

#include "cgraph/core/constants.hpp"
#include "cgraph/core/result.hpp"
#include "cgraph/core/failures.hpp"

#include <chrono>
#include <cstdint>
#include <string_view>

namespace cgraph::e2ee::configuration {

/// Tunables for one logged-in E2EE session.
///
/// All values have working defaults; `Validate()` is run by every component
/// that accepts a config, so an inconsistent config fails at construction
/// instead of mid-operation.
///
/// @example
/// ```cpp
/// auto config = E2eeConfig::Default()
///     .WithBundleCacheTtl(std::chrono::minutes(1))
///     .WithWaterMarks(10, 50);
/// ```
class E2eeConfig {
public:
    [[nodiscard]] static constexpr E2eeConfig Default() noexcept {
        return E2eeConfig();
    }

    [[nodiscard]] constexpr uint32_t OneTimePreKeyBatch() const noexcept { return one_time_prekey_batch_; }
    [[nodiscard]] constexpr uint32_t PreKeyUploadDefault() const noexcept { return prekey_upload_default_; }
    [[nodiscard]] constexpr uint32_t LowWaterMark() const noexcept { return low_water_mark_; }
    [[nodiscard]] constexpr uint32_t HighWaterMark() const noexcept { return high_water_mark_; }
    [[nodiscard]] constexpr std::chrono::milliseconds ReplenishInterval() const noexcept { return replenish_interval_; }
    [[nodiscard]] constexpr std::chrono::milliseconds BundleCacheTtl() const noexcept { return bundle_cache_ttl_; }
    [[nodiscard]] constexpr uint32_t DirectoryMaxAttempts() const noexcept { return directory_max_attempts_; }
    [[nodiscard]] constexpr std::chrono::milliseconds DirectoryBaseBackoff() const noexcept { return directory_base_backoff_; }
    [[nodiscard]] constexpr uint32_t PreKeyGenerationWorkers() const noexcept { return prekey_generation_workers_; }
    /// How long an unconsumed one-time prekey private half stays in the local vault.
    [[nodiscard]] constexpr std::chrono::milliseconds OneTimePreKeyRetention() const noexcept { return one_time_prekey_retention_; }
    /// HKDF info string. Must reference storage that outlives the config.
    [[nodiscard]] constexpr std::string_view HkdfInfo() const noexcept { return hkdf_info_; }

    [[nodiscard]] constexpr E2eeConfig WithOneTimePreKeyBatch(const uint32_t count) const noexcept {
        E2eeConfig copy = *this;
        copy.one_time_prekey_batch_ = count;
        return copy;
    }
    [[nodiscard]] constexpr E2eeConfig WithPreKeyUploadDefault(const uint32_t count) const noexcept {
        E2eeConfig copy = *this;
        copy.prekey_upload_default_ = count;
        return copy;
    }
    [[nodiscard]] constexpr E2eeConfig WithWaterMarks(const uint32_t low, const uint32_t high) const noexcept {
        E2eeConfig copy = *this;
        copy.low_water_mark_ = low;
        copy.high_water_mark_ = high;
        return copy;
    }
    [[nodiscard]] constexpr E2eeConfig WithReplenishInterval(const std::chrono::milliseconds interval) const noexcept {
        E2eeConfig copy = *this;
        copy.replenish_interval_ = interval;
        return copy;
    }
    [[nodiscard]] constexpr E2eeConfig WithBundleCacheTtl(const std::chrono::milliseconds ttl) const noexcept {
        E2eeConfig copy = *this;
        copy.bundle_cache_ttl_ = ttl;
        return copy;
    }
    [[nodiscard]] constexpr E2eeConfig WithDirectoryRetry(
        const uint32_t max_attempts,
        const std::chrono::milliseconds base_backoff) const noexcept {
        E2eeConfig copy = *this;
        copy.directory_max_attempts_ = max_attempts;
        copy.directory_base_backoff_ = base_backoff;
        return copy;
    }
    [[nodiscard]] constexpr E2eeConfig WithPreKeyGenerationWorkers(const uint32_t workers) const noexcept {
        E2eeConfig copy = *this;
        copy.prekey_generation_workers_ = workers;
        return copy;
    }
    [[nodiscard]] constexpr E2eeConfig WithOneTimePreKeyRetention(const std::chrono::milliseconds retention) const noexcept {
        E2eeConfig copy = *this;
        copy.one_time_prekey_retention_ = retention;
        return copy;
    }
    [[nodiscard]] constexpr E2eeConfig WithHkdfInfo(const std::string_view info) const noexcept {
        E2eeConfig copy = *this;
        copy.hkdf_info_ = info;
        return copy;
    }

    [[nodiscard]] Result<Unit, E2eeFailure> Validate() const;

private:
    constexpr E2eeConfig() noexcept = default;

    uint32_t one_time_prekey_batch_ = ProtocolConstants::DEFAULT_ONE_TIME_PREKEY_BATCH;
    uint32_t prekey_upload_default_ = ProtocolConstants::DEFAULT_PREKEY_UPLOAD;
    uint32_t low_water_mark_ = ProtocolConstants::DEFAULT_LOW_WATER_MARK;
    uint32_t high_water_mark_ = ProtocolConstants::DEFAULT_HIGH_WATER_MARK;
    std::chrono::milliseconds replenish_interval_ = ProtocolConstants::DEFAULT_REPLENISH_INTERVAL;
    std::chrono::milliseconds bundle_cache_ttl_ = ProtocolConstants::DEFAULT_BUNDLE_CACHE_TTL;
    uint32_t directory_max_attempts_ = ProtocolConstants::DEFAULT_DIRECTORY_MAX_ATTEMPTS;
    std::chrono::milliseconds directory_base_backoff_ = ProtocolConstants::DEFAULT_DIRECTORY_BASE_BACKOFF;
    uint32_t prekey_generation_workers_ = 1;
    std::chrono::milliseconds one_time_prekey_retention_ = ProtocolConstants::DEFAULT_ONE_TIME_PREKEY_RETENTION;
    std::string_view hkdf_info_ = ProtocolConstants::HKDF_INFO;
};

}
