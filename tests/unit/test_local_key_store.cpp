#include <catch2/catch_test_macros.hpp>
#include "cgraph/storage/local_key_store.hpp"
#include "cgraph/storage/in_memory_secure_storage.hpp"
#include "cgraph/identity/key_bundle_generator.hpp"
#include "cgraph/crypto/sodium_interop.hpp"
#include "helpers/failing_storage.hpp"
#include "helpers/manual_clock.hpp"
#include <chrono>
using namespace cgraph::e2ee;
using namespace cgraph::e2ee::storage;
using identity::KeyBundleGenerator;

namespace {
    KeyBundle MakeBundle(const uint32_t one_time_count = 5) {
        REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
        auto result = KeyBundleGenerator::GenerateKeyBundle("test_device", one_time_count);
        REQUIRE(result.IsOk());
        return std::move(result).Unwrap();
    }
}

TEST_CASE("LocalKeyStore - Save and load", "[keystore]") {
    auto storage = std::make_shared<InMemorySecureStorage>();
    test_helpers::ManualClock clock;
    LocalKeyStore store(storage, clock.AsClock());
    const auto bundle = MakeBundle();

    REQUIRE_FALSE(store.HasKeyMaterial().Unwrap());
    REQUIRE_FALSE(store.Load().Unwrap().has_value());

    REQUIRE(store.Save(bundle).IsOk());
    REQUIRE(store.HasKeyMaterial().Unwrap());

    auto loaded = store.Load();
    REQUIRE(loaded.IsOk());
    REQUIRE(loaded.Unwrap().has_value());
    const auto& local = *loaded.Unwrap();
    REQUIRE(local.identity.GetDeviceId() == "test_device");
    REQUIRE(local.identity.GetKeyId() == bundle.GetIdentity().GetKeyId());
    REQUIRE(local.identity.GetPublicKey() == bundle.GetIdentity().GetPublicKey());
    REQUIRE(local.identity.GetSigningPublicKey() == bundle.GetIdentity().GetSigningPublicKey());
    REQUIRE(local.signed_pre_key.GetKeyId() == bundle.GetSignedPreKey().GetKeyId());
    REQUIRE(local.signed_pre_key.GetPublicKey() == bundle.GetSignedPreKey().GetPublicKey());
    REQUIRE(local.created_at == clock.Now());

    auto original_secret = bundle.GetIdentity().GetDhKeyPair().GetSecretKeyCopy();
    auto loaded_secret = local.identity.GetDhKeyPair().GetSecretKeyCopy();
    REQUIRE(original_secret.IsOk());
    REQUIRE(loaded_secret.IsOk());
    REQUIRE(original_secret.Unwrap() == loaded_secret.Unwrap());
}

TEST_CASE("LocalKeyStore - Refuses to overwrite key material", "[keystore]") {
    LocalKeyStore store(std::make_shared<InMemorySecureStorage>());
    const auto first = MakeBundle();
    const auto second = MakeBundle();
    REQUIRE(store.Save(first).IsOk());

    auto overwrite = store.Save(second);
    REQUIRE(overwrite.IsErr());
    REQUIRE(overwrite.UnwrapErr().type == E2eeFailureType::Setup);
    REQUIRE(store.Load().Unwrap()->identity.GetPublicKey() == first.GetIdentity().GetPublicKey());
}

TEST_CASE("LocalKeyStore - Clear removes everything", "[keystore]") {
    auto storage = std::make_shared<InMemorySecureStorage>();
    LocalKeyStore store(storage);
    REQUIRE(store.Save(MakeBundle()).IsOk());
    REQUIRE(storage->Size() > 0);

    REQUIRE(store.Clear().IsOk());
    REQUIRE(storage->Size() == 0);
    REQUIRE_FALSE(store.HasKeyMaterial().Unwrap());
    REQUIRE(store.OneTimePreKeyCount().Unwrap() == 0);
    REQUIRE(store.Save(MakeBundle()).IsOk());
}

TEST_CASE("LocalKeyStore - One-time prekey vault", "[keystore]") {
    LocalKeyStore store(std::make_shared<InMemorySecureStorage>());
    const auto bundle = MakeBundle(3);
    REQUIRE(store.Save(bundle).IsOk());
    REQUIRE(store.OneTimePreKeyCount().Unwrap() == 3);

    const auto& target = bundle.GetOneTimePreKeys()[1];

    SECTION("Find restores the key pair") {
        auto found = store.FindOneTimePreKey(target.GetKeyId());
        REQUIRE(found.IsOk());
        REQUIRE(found.Unwrap().has_value());
        REQUIRE(found.Unwrap()->GetPublicKey() == target.GetPublicKey());
        REQUIRE_FALSE(store.FindOneTimePreKey("unknown").Unwrap().has_value());
    }

    SECTION("Remove deletes exactly one key") {
        REQUIRE(store.RemoveOneTimePreKey(target.GetKeyId()).Unwrap());
        REQUIRE(store.OneTimePreKeyCount().Unwrap() == 2);
        REQUIRE_FALSE(store.FindOneTimePreKey(target.GetKeyId()).Unwrap().has_value());
        REQUIRE_FALSE(store.RemoveOneTimePreKey(target.GetKeyId()).Unwrap());
    }

    SECTION("Add appends new keys") {
        auto extra = KeyBundleGenerator::GenerateOneTimePreKeys(4);
        REQUIRE(extra.IsOk());
        REQUIRE(store.AddOneTimePreKeys(extra.Unwrap()).IsOk());
        REQUIRE(store.OneTimePreKeyCount().Unwrap() == 7);
        REQUIRE(store.FindOneTimePreKey(extra.Unwrap()[3].GetKeyId()).Unwrap().has_value());
    }
}

TEST_CASE("LocalKeyStore - Unconsumed one-time prekeys expire", "[keystore]") {
    test_helpers::ManualClock clock;
    const auto retention = std::chrono::hours(24);
    LocalKeyStore store(std::make_shared<InMemorySecureStorage>(), clock.AsClock(), retention);
    const auto bundle = MakeBundle(3);
    REQUIRE(store.Save(bundle).IsOk());

    auto fresh = KeyBundleGenerator::GenerateOneTimePreKeys(2);
    REQUIRE(fresh.IsOk());

    SECTION("Keys inside the window survive an append") {
        clock.Advance(retention - std::chrono::minutes(1));
        REQUIRE(store.AddOneTimePreKeys(fresh.Unwrap()).IsOk());
        REQUIRE(store.OneTimePreKeyCount().Unwrap() == 5);
        REQUIRE(store.FindOneTimePreKey(bundle.GetOneTimePreKeys()[0].GetKeyId()).Unwrap().has_value());
    }

    SECTION("Keys past the window are dropped on the next append") {
        clock.Advance(retention);
        REQUIRE(store.AddOneTimePreKeys(fresh.Unwrap()).IsOk());
        REQUIRE(store.OneTimePreKeyCount().Unwrap() == 2);
        for (const auto& orphan : bundle.GetOneTimePreKeys()) {
            REQUIRE_FALSE(store.FindOneTimePreKey(orphan.GetKeyId()).Unwrap().has_value());
        }
        for (const auto& kept : fresh.Unwrap()) {
            REQUIRE(store.FindOneTimePreKey(kept.GetKeyId()).Unwrap().has_value());
        }
    }

    SECTION("Each batch ages from its own upload") {
        clock.Advance(std::chrono::hours(12));
        REQUIRE(store.AddOneTimePreKeys(fresh.Unwrap()).IsOk());
        clock.Advance(std::chrono::hours(12));
        auto later = KeyBundleGenerator::GenerateOneTimePreKeys(1);
        REQUIRE(later.IsOk());
        REQUIRE(store.AddOneTimePreKeys(later.Unwrap()).IsOk());
        REQUIRE(store.OneTimePreKeyCount().Unwrap() == 3);
        REQUIRE(store.FindOneTimePreKey(fresh.Unwrap()[1].GetKeyId()).Unwrap().has_value());
        REQUIRE_FALSE(store.FindOneTimePreKey(bundle.GetOneTimePreKeys()[2].GetKeyId()).Unwrap().has_value());
    }
}

TEST_CASE("LocalKeyStore - Storage failures", "[keystore]") {
    auto storage = std::make_shared<test_helpers::FailingStorage>();
    LocalKeyStore store(storage);

    SECTION("Failed record write leaves nothing behind") {
        storage->FailWritesTo(std::string(StorageKeys::KEY_RECORD));
        auto result = store.Save(MakeBundle());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == E2eeFailureType::Storage);
        REQUIRE(storage->Size() == 0);
        REQUIRE_FALSE(store.HasKeyMaterial().Unwrap());
    }

    SECTION("Corrupted record is a decode error") {
        const std::vector<uint8_t> garbage = {0xff, 0xff, 0xff, 0x01};
        REQUIRE(storage->Set(StorageKeys::KEY_RECORD, garbage).IsOk());
        auto loaded = store.Load();
        REQUIRE(loaded.IsErr());
        REQUIRE(loaded.UnwrapErr().type == E2eeFailureType::Decode);
    }
}
