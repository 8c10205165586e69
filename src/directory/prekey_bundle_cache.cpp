#include "cgraph/directory/prekey_bundle_cache.hpp"
#include "cgraph/debug/logger.hpp"

#include <stdexcept>

namespace cgraph::e2ee::directory {
using models::RemotePrekeyBundle;

namespace {
    constexpr std::string_view kComponent = "BUNDLE_CACHE";
    using BundleResult = Result<RemotePrekeyBundle, E2eeFailure>;
}

PrekeyBundleCache::PrekeyBundleCache(Fetcher fetcher, const std::chrono::milliseconds ttl, Clock clock)
    : fetcher_(std::move(fetcher))
    , ttl_(ttl)
    , clock_(std::move(clock)) {
    if (!fetcher_ || !clock_) {
        throw std::invalid_argument("PrekeyBundleCache requires a fetcher and a clock");
    }
}

std::shared_ptr<std::mutex> PrekeyBundleCache::RecipientLock(std::string_view recipient_id) {
    std::lock_guard lock(map_lock_);
    auto it = recipient_locks_.find(recipient_id);
    if (it == recipient_locks_.end()) {
        it = recipient_locks_.emplace(std::string(recipient_id), std::make_shared<std::mutex>()).first;
    }
    return it->second;
}

std::optional<PrekeyBundleCache::Entry> PrekeyBundleCache::FreshEntry(
    std::string_view recipient_id,
    const TimePoint now) const {
    std::lock_guard lock(map_lock_);
    const auto it = entries_.find(recipient_id);
    if (it == entries_.end() || now - it->second.fetched_at >= ttl_) {
        return std::nullopt;
    }
    return it->second;
}

void PrekeyBundleCache::Store(std::string_view recipient_id, Entry entry) {
    std::lock_guard lock(map_lock_);
    entries_.insert_or_assign(std::string(recipient_id), std::move(entry));
}

BundleResult PrekeyBundleCache::AcquireForAgreement(std::string_view recipient_id) {
    const auto recipient_lock = RecipientLock(recipient_id);
    std::lock_guard guard(*recipient_lock);

    auto cached = FreshEntry(recipient_id, clock_());
    if (cached.has_value() && !(cached->bundle.one_time_pre_key.has_value() && cached->one_time_issued)) {
        if (cached->bundle.one_time_pre_key.has_value()) {
            cached->one_time_issued = true;
            Store(recipient_id, *cached);
        }
        return BundleResult::Ok(cached->bundle);
    }

    auto fetched = fetcher_(recipient_id);
    if (fetched.IsOk()) {
        RemotePrekeyBundle bundle = std::move(fetched).Unwrap();
        Store(recipient_id, Entry{bundle, clock_(), bundle.one_time_pre_key.has_value()});
        return BundleResult::Ok(std::move(bundle));
    }

    const auto& failure = fetched.UnwrapErr();
    if (cached.has_value() && failure.type == E2eeFailureType::Directory) {
        CGRAPH_LOG_WARN(kComponent, "Directory unreachable for {}, using cached bundle without one-time prekey: {}",
            recipient_id, failure.message);
        RemotePrekeyBundle fallback = cached->bundle;
        fallback.one_time_pre_key.reset();
        return BundleResult::Ok(std::move(fallback));
    }
    return fetched;
}

BundleResult PrekeyBundleCache::LookupIdentity(std::string_view recipient_id) {
    const auto recipient_lock = RecipientLock(recipient_id);
    std::lock_guard guard(*recipient_lock);

    if (auto cached = FreshEntry(recipient_id, clock_())) {
        return BundleResult::Ok(std::move(cached->bundle));
    }
    auto fetched = fetcher_(recipient_id);
    if (fetched.IsOk()) {
        Store(recipient_id, Entry{fetched.Unwrap(), clock_(), false});
    }
    return fetched;
}

void PrekeyBundleCache::Invalidate(std::string_view recipient_id) {
    std::lock_guard lock(map_lock_);
    if (const auto it = entries_.find(recipient_id); it != entries_.end()) {
        entries_.erase(it);
    }
}

void PrekeyBundleCache::Clear() {
    std::lock_guard lock(map_lock_);
    entries_.clear();
}

size_t PrekeyBundleCache::Size() const {
    std::lock_guard lock(map_lock_);
    return entries_.size();
}

}
