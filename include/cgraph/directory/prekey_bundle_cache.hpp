#pragma once
#include "cgraph/core/result.hpp"
#include "cgraph/core/failures.hpp"
#include "cgraph/core/clock.hpp"
#include "cgraph/models/remote_prekey_bundle.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
namespace cgraph::e2ee::directory {

/**
 * @brief Short-lived cache of recipients' validated prekey bundles
 *
 * An entry is fresh while `now - fetched_at < ttl` on the injected clock.
 *
 * A bundle's one-time prekey is handed to at most one key agreement. Once
 * the cached copy's prekey was used, AcquireForAgreement() goes back to the
 * directory; if the directory is unreachable it falls back to the fresh
 * cached copy with the one-time prekey removed. An expired entry is never
 * used as a fallback.
 *
 * Calls for the same recipient are serialized; different recipients proceed
 * in parallel.
 */
class PrekeyBundleCache {
public:
    using Fetcher = std::function<Result<models::RemotePrekeyBundle, E2eeFailure>(std::string_view)>;

    PrekeyBundleCache(Fetcher fetcher, std::chrono::milliseconds ttl, Clock clock = SystemClock());

    PrekeyBundleCache(const PrekeyBundleCache&) = delete;
    PrekeyBundleCache& operator=(const PrekeyBundleCache&) = delete;

    /// Bundle for an outgoing key agreement. Never returns an already-issued one-time prekey.
    [[nodiscard]] Result<models::RemotePrekeyBundle, E2eeFailure> AcquireForAgreement(std::string_view recipient_id);

    /// Bundle for identity display (safety numbers); does not consume the one-time prekey.
    [[nodiscard]] Result<models::RemotePrekeyBundle, E2eeFailure> LookupIdentity(std::string_view recipient_id);

    void Invalidate(std::string_view recipient_id);
    void Clear();
    [[nodiscard]] size_t Size() const;

private:
    struct Entry {
        models::RemotePrekeyBundle bundle;
        TimePoint fetched_at;
        bool one_time_issued = false;
    };

    [[nodiscard]] std::shared_ptr<std::mutex> RecipientLock(std::string_view recipient_id);
    [[nodiscard]] std::optional<Entry> FreshEntry(std::string_view recipient_id, TimePoint now) const;
    void Store(std::string_view recipient_id, Entry entry);

    Fetcher fetcher_;
    std::chrono::milliseconds ttl_;
    Clock clock_;
    mutable std::mutex map_lock_;
    std::map<std::string, Entry, std::less<>> entries_;
    std::map<std::string, std::shared_ptr<std::mutex>, std::less<>> recipient_locks_;
};
}
