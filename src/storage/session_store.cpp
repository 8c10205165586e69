#include "cgraph/storage/session_store.hpp"
#include "cgraph/core/constants.hpp"
#include "cgraph/core/format.hpp"

#include "storage/local_state.pb.h"

#include <string>

namespace cgraph::e2ee::storage {
namespace pb = cgraph::proto::storage;

namespace {
    Result<pb::StoredSessions, E2eeFailure> ReadSessions(ISecureStorage& storage) {
        auto get_result = storage.Get(StorageKeys::SESSIONS);
        if (get_result.IsErr()) {
            return Result<pb::StoredSessions, E2eeFailure>::Err(std::move(get_result).UnwrapErr());
        }
        pb::StoredSessions sessions;
        const auto& bytes = get_result.Unwrap();
        if (bytes.has_value() && !sessions.ParseFromArray(bytes->data(), static_cast<int>(bytes->size()))) {
            return Result<pb::StoredSessions, E2eeFailure>::Err(
                E2eeFailure::Decode("Stored session cache is malformed"));
        }
        return Result<pb::StoredSessions, E2eeFailure>::Ok(std::move(sessions));
    }

    Result<Unit, E2eeFailure> WriteSessions(ISecureStorage& storage, const pb::StoredSessions& sessions) {
        std::string serialized;
        if (!sessions.SerializeToString(&serialized)) {
            return Result<Unit, E2eeFailure>::Err(E2eeFailure::Encode("Failed to serialize session cache"));
        }
        return storage.Set(StorageKeys::SESSIONS,
            std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(serialized.data()), serialized.size()));
    }
}

SessionStore::SessionStore(std::shared_ptr<ISecureStorage> storage)
    : storage_(std::move(storage))
    , lock_(std::make_unique<std::mutex>()) {
}

Result<std::optional<SessionRecord>, E2eeFailure> SessionStore::Load(std::string_view recipient_id) {
    using LoadResult = Result<std::optional<SessionRecord>, E2eeFailure>;
    std::lock_guard guard(*lock_);
    auto sessions_result = ReadSessions(*storage_);
    if (sessions_result.IsErr()) {
        return LoadResult::Err(std::move(sessions_result).UnwrapErr());
    }
    const auto& sessions = sessions_result.Unwrap().sessions();
    const auto it = sessions.find(std::string(recipient_id));
    if (it == sessions.end()) {
        return LoadResult::Ok(std::nullopt);
    }
    const auto& stored = it->second;
    return LoadResult::Ok(SessionRecord{
        stored.recipient_id(),
        std::vector<uint8_t>(stored.recipient_identity_key().begin(), stored.recipient_identity_key().end()),
        stored.message_count(),
        FromUnixMillis(stored.created_at_ms()),
        FromUnixMillis(stored.updated_at_ms())});
}

Result<Unit, E2eeFailure> SessionStore::Save(const SessionRecord& record) {
    if (record.recipient_id.empty()) {
        return Result<Unit, E2eeFailure>::Err(E2eeFailure::InvalidInput("Session recipient id cannot be empty"));
    }
    std::lock_guard guard(*lock_);
    auto sessions_result = ReadSessions(*storage_);
    if (sessions_result.IsErr()) {
        return Result<Unit, E2eeFailure>::Err(std::move(sessions_result).UnwrapErr());
    }
    auto sessions = std::move(sessions_result).Unwrap();
    pb::StoredSession& stored = (*sessions.mutable_sessions())[record.recipient_id];
    stored.set_recipient_id(record.recipient_id);
    stored.set_recipient_identity_key(std::string(
        record.recipient_identity_key.begin(), record.recipient_identity_key.end()));
    stored.set_message_count(record.message_count);
    stored.set_created_at_ms(ToUnixMillis(record.created_at));
    stored.set_updated_at_ms(ToUnixMillis(record.updated_at));
    return WriteSessions(*storage_, sessions);
}

Result<Unit, E2eeFailure> SessionStore::Remove(std::string_view recipient_id) {
    std::lock_guard guard(*lock_);
    auto sessions_result = ReadSessions(*storage_);
    if (sessions_result.IsErr()) {
        return Result<Unit, E2eeFailure>::Err(std::move(sessions_result).UnwrapErr());
    }
    auto sessions = std::move(sessions_result).Unwrap();
    if (sessions.mutable_sessions()->erase(std::string(recipient_id)) == 0) {
        return Result<Unit, E2eeFailure>::Ok(unit);
    }
    return WriteSessions(*storage_, sessions);
}

}
