#include <catch2/catch_test_macros.hpp>
#include "cgraph/storage/session_store.hpp"
#include "cgraph/storage/in_memory_secure_storage.hpp"
#include "helpers/manual_clock.hpp"
using namespace cgraph::e2ee;
using namespace cgraph::e2ee::storage;

TEST_CASE("SessionStore - Save, load and remove", "[session]") {
    auto storage = std::make_shared<InMemorySecureStorage>();
    SessionStore store(storage);
    test_helpers::ManualClock clock;

    REQUIRE_FALSE(store.Load("bob").Unwrap().has_value());

    SessionRecord record;
    record.recipient_id = "bob";
    record.recipient_identity_key = std::vector<uint8_t>(32, 0x0b);
    record.message_count = 3;
    record.created_at = clock.Now();
    clock.Advance(std::chrono::seconds(5));
    record.updated_at = clock.Now();
    REQUIRE(store.Save(record).IsOk());

    auto loaded = store.Load("bob");
    REQUIRE(loaded.IsOk());
    REQUIRE(loaded.Unwrap().has_value());
    const auto& stored = *loaded.Unwrap();
    REQUIRE(stored.recipient_id == "bob");
    REQUIRE(stored.recipient_identity_key == record.recipient_identity_key);
    REQUIRE(stored.message_count == 3);
    REQUIRE(stored.created_at == record.created_at);
    REQUIRE(stored.updated_at == record.updated_at);

    SECTION("Sessions are independent per recipient") {
        SessionRecord carol = record;
        carol.recipient_id = "carol";
        carol.message_count = 1;
        REQUIRE(store.Save(carol).IsOk());
        REQUIRE(store.Load("bob").Unwrap()->message_count == 3);
        REQUIRE(store.Load("carol").Unwrap()->message_count == 1);
    }

    SECTION("Remove forgets the recipient") {
        REQUIRE(store.Remove("bob").IsOk());
        REQUIRE_FALSE(store.Load("bob").Unwrap().has_value());
        REQUIRE(store.Remove("bob").IsOk());
    }
}

TEST_CASE("SessionStore - Rejects empty recipient", "[session]") {
    SessionStore store(std::make_shared<InMemorySecureStorage>());
    auto result = store.Save(SessionRecord{});
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == E2eeFailureType::InvalidInput);
}
