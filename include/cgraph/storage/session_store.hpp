#pragma once
#include "cgraph/core/result.hpp"
#include "cgraph/core/failures.hpp"
#include "cgraph/models/session_record.hpp"
#include "cgraph/storage/i_secure_storage.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
namespace cgraph::e2ee::storage {
using models::SessionRecord;
class SessionStore {
public:
    explicit SessionStore(std::shared_ptr<ISecureStorage> storage);
    [[nodiscard]] Result<std::optional<SessionRecord>, E2eeFailure> Load(std::string_view recipient_id);
    [[nodiscard]] Result<Unit, E2eeFailure> Save(const SessionRecord& record);
    [[nodiscard]] Result<Unit, E2eeFailure> Remove(std::string_view recipient_id);
private:
    std::shared_ptr<ISecureStorage> storage_;
    std::unique_ptr<std::mutex> lock_;
};
}
