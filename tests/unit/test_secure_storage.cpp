#include <catch2/catch_test_macros.hpp>
#include "cgraph/storage/in_memory_secure_storage.hpp"
#include "cgraph/storage/file_secure_storage.hpp"
#include "cgraph/crypto/sodium_interop.hpp"
#include <filesystem>
using namespace cgraph::e2ee;
using namespace cgraph::e2ee::storage;

namespace {
    std::vector<uint8_t> Bytes(std::string_view text) {
        return {text.begin(), text.end()};
    }

    void ExerciseContract(ISecureStorage& storage) {
        auto missing = storage.Get("absent.key");
        REQUIRE(missing.IsOk());
        REQUIRE_FALSE(missing.Unwrap().has_value());

        REQUIRE(storage.Set("cgraph.test", Bytes("first")).IsOk());
        auto stored = storage.Get("cgraph.test");
        REQUIRE(stored.IsOk());
        REQUIRE(stored.Unwrap() == Bytes("first"));

        REQUIRE(storage.Set("cgraph.test", Bytes("second")).IsOk());
        REQUIRE(storage.Get("cgraph.test").Unwrap() == Bytes("second"));

        REQUIRE(storage.Delete("cgraph.test").IsOk());
        REQUIRE_FALSE(storage.Get("cgraph.test").Unwrap().has_value());
        REQUIRE(storage.Delete("cgraph.test").IsOk());
    }
}

TEST_CASE("InMemorySecureStorage - Contract", "[storage]") {
    InMemorySecureStorage storage;
    ExerciseContract(storage);
    REQUIRE(storage.Size() == 0);
}

TEST_CASE("FileSecureStorage - Contract", "[storage]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto directory = std::filesystem::temp_directory_path() /
        ("cgraph_storage_" + crypto::SodiumInterop::ToHex(crypto::SodiumInterop::GetRandomBytes(6)));
    {
        auto opened = FileSecureStorage::Open(directory);
        REQUIRE(opened.IsOk());
        auto storage = std::move(opened).Unwrap();
        ExerciseContract(*storage);

        SECTION("Values survive reopening") {
            REQUIRE(storage->Set("persisted", Bytes("kept")).IsOk());
            auto reopened = FileSecureStorage::Open(directory);
            REQUIRE(reopened.IsOk());
            REQUIRE(reopened.Unwrap()->Get("persisted").Unwrap() == Bytes("kept"));
        }

        SECTION("Keys that escape the directory are rejected") {
            for (const auto* key : {"../escape", "a/b", ".hidden", ""}) {
                auto result = storage->Set(key, Bytes("x"));
                REQUIRE(result.IsErr());
                REQUIRE(result.UnwrapErr().type == E2eeFailureType::InvalidInput);
            }
        }
    }
    std::error_code ec;
    std::filesystem::remove_all(directory, ec);
}
