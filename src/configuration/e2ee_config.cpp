#include "cgraph/configuration/e2ee_config.hpp"
#include "cgraph/core/format.hpp"

namespace cgraph::e2ee::configuration {

Result<Unit, E2eeFailure> E2eeConfig::Validate() const {
    if (one_time_prekey_batch_ == 0 || one_time_prekey_batch_ > ProtocolConstants::MAX_PREKEYS_PER_CALL) {
        return Result<Unit, E2eeFailure>::Err(E2eeFailure::InvalidInput(compat::format(
            "one_time_prekey_batch must be in [1, {}], got {}",
            ProtocolConstants::MAX_PREKEYS_PER_CALL, one_time_prekey_batch_)));
    }
    if (prekey_upload_default_ == 0 || prekey_upload_default_ > ProtocolConstants::MAX_PREKEYS_PER_CALL) {
        return Result<Unit, E2eeFailure>::Err(E2eeFailure::InvalidInput(compat::format(
            "prekey_upload_default must be in [1, {}], got {}",
            ProtocolConstants::MAX_PREKEYS_PER_CALL, prekey_upload_default_)));
    }
    if (low_water_mark_ >= high_water_mark_ || high_water_mark_ > ProtocolConstants::MAX_PREKEYS_PER_CALL) {
        return Result<Unit, E2eeFailure>::Err(E2eeFailure::InvalidInput(compat::format(
            "water marks must satisfy low < high <= {}, got low={} high={}",
            ProtocolConstants::MAX_PREKEYS_PER_CALL, low_water_mark_, high_water_mark_)));
    }
    if (replenish_interval_.count() <= 0 || bundle_cache_ttl_.count() <= 0) {
        return Result<Unit, E2eeFailure>::Err(E2eeFailure::InvalidInput(
            "replenish interval and bundle cache TTL must be positive"));
    }
    if (directory_max_attempts_ == 0 || directory_base_backoff_.count() < 0) {
        return Result<Unit, E2eeFailure>::Err(E2eeFailure::InvalidInput(
            "directory retry policy needs at least one attempt and a non-negative backoff"));
    }
    if (prekey_generation_workers_ == 0) {
        return Result<Unit, E2eeFailure>::Err(E2eeFailure::InvalidInput(
            "prekey_generation_workers must be at least 1"));
    }
    if (one_time_prekey_retention_ <= bundle_cache_ttl_) {
        return Result<Unit, E2eeFailure>::Err(E2eeFailure::InvalidInput(
            "one-time prekey retention must outlast the bundle cache TTL"));
    }
    if (hkdf_info_.empty()) {
        return Result<Unit, E2eeFailure>::Err(E2eeFailure::InvalidInput("HKDF info cannot be empty"));
    }
    return Result<Unit, E2eeFailure>::Ok(unit);
}

}
