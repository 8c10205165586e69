#include <catch2/catch_test_macros.hpp>
#include "cgraph/identity/key_bundle_generator.hpp"
#include "cgraph/crypto/sodium_interop.hpp"
#include <set>
using namespace cgraph::e2ee;
using namespace cgraph::e2ee::identity;
using crypto::SodiumInterop;

TEST_CASE("KeyBundleGenerator - Full bundle", "[keygen]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto result = KeyBundleGenerator::GenerateKeyBundle("desktop_device", 20);
    REQUIRE(result.IsOk());
    const auto& bundle = result.Unwrap();

    SECTION("Identity and prekey sizes") {
        REQUIRE(bundle.GetDeviceId() == "desktop_device");
        REQUIRE(bundle.GetIdentity().GetPublicKey().size() == Constants::X_25519_PUBLIC_KEY_SIZE);
        REQUIRE(bundle.GetIdentity().GetSigningPublicKey().size() == Constants::ED_25519_PUBLIC_KEY_SIZE);
        REQUIRE(bundle.GetSignedPreKey().GetPublicKey().size() == Constants::X_25519_PUBLIC_KEY_SIZE);
        REQUIRE(bundle.GetSignedPreKey().GetSignature().size() == Constants::ED_25519_SIGNATURE_SIZE);
        REQUIRE(bundle.GetOneTimePreKeys().size() == 20);
    }

    SECTION("Signed prekey verifies under the identity signing key") {
        REQUIRE(models::Ed25519KeyPair::Verify(
            bundle.GetIdentity().GetSigningPublicKey(),
            bundle.GetSignedPreKey().GetPublicKey(),
            bundle.GetSignedPreKey().GetSignature()));
    }

    SECTION("Key ids are unique 16-char hex") {
        std::set<std::string> ids;
        ids.insert(bundle.GetIdentity().GetKeyId());
        ids.insert(bundle.GetSignedPreKey().GetKeyId());
        for (const auto& opk : bundle.GetOneTimePreKeys()) {
            REQUIRE(opk.GetKeyId().size() == 2 * ProtocolConstants::KEY_ID_RANDOM_BYTES);
            ids.insert(opk.GetKeyId());
        }
        REQUIRE(ids.size() == 22);
    }
}

TEST_CASE("KeyBundleGenerator - Parallel one-time prekeys", "[keygen]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto result = KeyBundleGenerator::GenerateOneTimePreKeys(37, 4);
    REQUIRE(result.IsOk());
    const auto& keys = result.Unwrap();
    REQUIRE(keys.size() == 37);
    std::set<std::vector<uint8_t>> publics;
    for (const auto& key : keys) {
        publics.insert(key.GetPublicKey());
    }
    REQUIRE(publics.size() == 37);
}

TEST_CASE("KeyBundleGenerator - Input validation", "[keygen]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Empty device id") {
        auto result = KeyBundleGenerator::GenerateIdentityKeyPair("");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == E2eeFailureType::InvalidInput);
    }
    SECTION("Batch above the per-call limit") {
        auto result = KeyBundleGenerator::GenerateOneTimePreKeys(ProtocolConstants::MAX_PREKEYS_PER_CALL + 1);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == E2eeFailureType::InvalidInput);
    }
    SECTION("Zero prekeys is allowed") {
        auto result = KeyBundleGenerator::GenerateOneTimePreKeys(0, 3);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().empty());
    }
}

TEST_CASE("KeyBundleGenerator - Device ids and fingerprints", "[keygen]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto first = KeyBundleGenerator::GenerateDeviceId("ios");
    const auto second = KeyBundleGenerator::GenerateDeviceId("ios");
    REQUIRE(first.rfind("ios_", 0) == 0);
    REQUIRE(first != second);

    const std::vector<uint8_t> key(32, 0x01);
    const auto fingerprint = KeyBundleGenerator::Fingerprint(key);
    REQUIRE(fingerprint.size() == 64);
    REQUIRE(fingerprint == KeyBundleGenerator::Fingerprint(key));
}
