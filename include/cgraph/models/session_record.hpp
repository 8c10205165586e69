#pragma once
#include "cgraph/core/clock.hpp"
#include <cstdint>
#include <string>
#include <vector>
namespace cgraph::e2ee::models {
/// What this device remembers about a conversation partner between messages.
struct SessionRecord {
    std::string recipient_id;
    std::vector<uint8_t> recipient_identity_key;
    uint64_t message_count = 0;
    TimePoint created_at{};
    TimePoint updated_at{};
};
}
