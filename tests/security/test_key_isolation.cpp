#include <catch2/catch_test_macros.hpp>
#include "cgraph/storage/local_key_store.hpp"
#include "helpers/e2ee_fixture.hpp"
#include <algorithm>
#include <string>
#include <vector>

using namespace cgraph::e2ee;
using namespace cgraph::e2ee::test_helpers;

namespace {
    bool Contains(const std::string& haystack, const std::vector<uint8_t>& needle) {
        const std::string pattern(needle.begin(), needle.end());
        return haystack.find(pattern) != std::string::npos;
    }
}

TEST_CASE("Security - Private keys never reach the directory", "[security][isolation]") {
    auto server = LoopbackKeyDirectory::Create();
    auto bob = MakeSetUpParticipant(server, "bob");

    storage::LocalKeyStore store(bob.storage);
    auto loaded = store.Load();
    REQUIRE(loaded.IsOk());
    REQUIRE(loaded.Unwrap().has_value());
    const auto& local = *loaded.Unwrap();

    auto fetched = server->ConnectAs("eve")->FetchPrekeyBundle("bob");
    REQUIRE(fetched.IsOk());
    const auto& bundle = fetched.Unwrap();
    REQUIRE(bundle.has_one_time_prekey_id());
    const std::string wire = bundle.SerializeAsString();

    auto one_time = store.FindOneTimePreKey(bundle.one_time_prekey_id());
    REQUIRE(one_time.IsOk());
    REQUIRE(one_time.Unwrap().has_value());

    std::vector<std::vector<uint8_t>> secrets;
    secrets.push_back(local.identity.GetDhKeyPair().GetSecretKeyCopy().Unwrap());
    auto signing_secret = local.identity.GetSigningKeyPair().GetSecretKeyCopy().Unwrap();
    secrets.emplace_back(signing_secret.begin(), signing_secret.begin() + 32);
    secrets.push_back(local.signed_pre_key.GetKeyPair().GetSecretKeyCopy().Unwrap());
    secrets.push_back(one_time.Unwrap()->GetKeyPair().GetSecretKeyCopy().Unwrap());

    for (const auto& secret : secrets) {
        REQUIRE(secret.size() == 32);
        REQUIRE_FALSE(Contains(wire, secret));
    }

    REQUIRE(Contains(wire, local.identity.GetPublicKey()));
    REQUIRE(Contains(wire, local.signed_pre_key.GetPublicKey()));
}

TEST_CASE("Security - Messages open only on the intended device", "[security][isolation]") {
    auto server = LoopbackKeyDirectory::Create();
    auto alice = MakeSetUpParticipant(server, "alice");
    auto bob = MakeSetUpParticipant(server, "bob");
    auto carol = MakeSetUpParticipant(server, "carol");
    const std::string alice_key = alice.manager->GetIdentityKeyBase64().Unwrap();

    auto sealed = alice.manager->EncryptMessage("carol", "for carol only");
    REQUIRE(sealed.IsOk());
    auto message = sealed.Unwrap();

    SECTION("Bob refuses a message addressed to Carol's key") {
        auto opened = bob.manager->DecryptMessage("alice", alice_key, message);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == E2eeFailureType::Decryption);
    }

    SECTION("Relabelling the message for Bob does not help") {
        auto bob_bundle = server->ConnectAs("eve")->FetchPrekeyBundle("bob");
        REQUIRE(bob_bundle.IsOk());
        message.set_recipient_identity_key_id(bob_bundle.Unwrap().identity_key_id());

        auto with_carols_prekey = bob.manager->DecryptMessage("alice", alice_key, message);
        REQUIRE(with_carols_prekey.IsErr());
        REQUIRE(with_carols_prekey.UnwrapErr().type == E2eeFailureType::KeyAgreement);

        message.clear_one_time_prekey_id();
        auto without_prekey = bob.manager->DecryptMessage("alice", alice_key, message);
        REQUIRE(without_prekey.IsErr());
        REQUIRE(without_prekey.UnwrapErr().type == E2eeFailureType::Decryption);
    }

    auto opened = carol.manager->DecryptMessage("alice", alice_key, sealed.Unwrap());
    REQUIRE(opened.IsOk());
    REQUIRE(ToString(opened.Unwrap()) == "for carol only");
}

TEST_CASE("Security - Reset leaves nothing to recover", "[security][isolation]") {
    auto server = LoopbackKeyDirectory::Create();
    auto alice = MakeSetUpParticipant(server, "alice");
    auto bob = MakeSetUpParticipant(server, "bob");
    const std::string alice_key = alice.manager->GetIdentityKeyBase64().Unwrap();

    auto sealed = alice.manager->EncryptMessage("bob", "before reset");
    REQUIRE(sealed.IsOk());
    REQUIRE(bob.manager->Reset().IsOk());

    storage::LocalKeyStore store(bob.storage);
    REQUIRE_FALSE(store.HasKeyMaterial().Unwrap());
    REQUIRE(store.OneTimePreKeyCount().Unwrap() == 0);

    auto restored = MakeParticipant(server, "bob", FastConfig(), SystemClock(), bob.storage);
    REQUIRE_FALSE(restored.manager->Initialize().Unwrap());
    auto opened = restored.manager->DecryptMessage("alice", alice_key, sealed.Unwrap());
    REQUIRE(opened.IsErr());
    REQUIRE(opened.UnwrapErr().type == E2eeFailureType::NotInitialized);
}
