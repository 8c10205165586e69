#include <catch2/catch_test_macros.hpp>
#include "cgraph/crypto/hkdf.hpp"
#include "cgraph/crypto/sodium_interop.hpp"
#include <string>
#include <string_view>
using namespace cgraph::e2ee;
using namespace cgraph::e2ee::crypto;

namespace {
    std::vector<uint8_t> FromHex(std::string_view hex) {
        std::vector<uint8_t> out;
        for (size_t i = 0; i + 1 < hex.size(); i += 2) {
            out.push_back(static_cast<uint8_t>(std::stoi(std::string(hex.substr(i, 2)), nullptr, 16)));
        }
        return out;
    }
}

TEST_CASE("HKDF - RFC 5869 test case 1", "[hkdf][crypto]") {
    const std::vector<uint8_t> ikm(22, 0x0b);
    const auto salt = FromHex("000102030405060708090a0b0c");
    const auto info = FromHex("f0f1f2f3f4f5f6f7f8f9");
    auto result = Hkdf::DeriveKeyBytes(ikm, 42, salt, info);
    REQUIRE(result.IsOk());
    REQUIRE(SodiumInterop::ToHex(result.Unwrap()) ==
            "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf34007208d5b887185865");
}

TEST_CASE("HKDF - Zero salt matches empty salt", "[hkdf][crypto]") {
    const std::vector<uint8_t> ikm(96, 0x42);
    const std::vector<uint8_t> zero_salt(Hkdf::HASH_LEN, 0x00);
    const std::string_view info = "CGraph E2EE v1";
    const std::span<const uint8_t> info_bytes(reinterpret_cast<const uint8_t*>(info.data()), info.size());

    auto with_zero_salt = Hkdf::DeriveKeyBytes(ikm, 32, zero_salt, info_bytes);
    auto with_empty_salt = Hkdf::DeriveKeyBytes(ikm, 32, {}, info_bytes);
    REQUIRE(with_zero_salt.IsOk());
    REQUIRE(with_empty_salt.IsOk());
    REQUIRE(with_zero_salt.Unwrap() == with_empty_salt.Unwrap());
}

TEST_CASE("HKDF - Different info gives different keys", "[hkdf][crypto]") {
    const std::vector<uint8_t> ikm(64, 0x07);
    const std::vector<uint8_t> info_a = {'a'};
    const std::vector<uint8_t> info_b = {'b'};
    auto a = Hkdf::DeriveKeyBytes(ikm, 32, {}, info_a);
    auto b = Hkdf::DeriveKeyBytes(ikm, 32, {}, info_b);
    REQUIRE(a.IsOk());
    REQUIRE(b.IsOk());
    REQUIRE(a.Unwrap() != b.Unwrap());
}

TEST_CASE("HKDF - Input validation", "[hkdf][crypto]") {
    SECTION("Empty IKM") {
        auto result = Hkdf::DeriveKeyBytes({}, 32);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == E2eeFailureType::InvalidInput);
    }
    SECTION("Zero output length") {
        const std::vector<uint8_t> ikm(32, 0x01);
        REQUIRE(Hkdf::DeriveKeyBytes(ikm, 0).IsErr());
    }
    SECTION("Output longer than 255 blocks") {
        const std::vector<uint8_t> ikm(32, 0x01);
        REQUIRE(Hkdf::DeriveKeyBytes(ikm, Hkdf::MAX_OUTPUT_LEN + 1).IsErr());
    }
}
