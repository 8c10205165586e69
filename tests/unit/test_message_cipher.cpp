#include <catch2/catch_test_macros.hpp>
#include "cgraph/protocol/message_cipher.hpp"
#include "cgraph/crypto/sodium_interop.hpp"
#include "cgraph/core/constants.hpp"
using namespace cgraph::e2ee;
using namespace cgraph::e2ee::protocol;
using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;

namespace {
    SecureMemoryHandle RandomKey() {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        auto bytes = SodiumInterop::GetRandomBytes(Constants::AES_KEY_SIZE);
        return SecureMemoryHandle::FromBytes(bytes).Unwrap();
    }
}

TEST_CASE("MessageCipher - Seal and open", "[cipher]") {
    const auto key = RandomKey();
    const std::vector<uint8_t> plaintext = {'h', 'e', 'l', 'l', 'o'};
    auto sealed = MessageCipher::Encrypt(plaintext, key);
    REQUIRE(sealed.IsOk());
    const auto& payload = sealed.Unwrap();
    REQUIRE(payload.nonce.size() == Constants::AES_GCM_NONCE_SIZE);
    REQUIRE(payload.ciphertext.size() == plaintext.size() + Constants::AES_GCM_TAG_SIZE);

    auto opened = MessageCipher::Decrypt(payload.ciphertext, payload.nonce, key);
    REQUIRE(opened.IsOk());
    REQUIRE(opened.Unwrap() == plaintext);
}

TEST_CASE("MessageCipher - Fresh nonce per message", "[cipher]") {
    const auto key = RandomKey();
    const std::vector<uint8_t> plaintext(64, 0x33);
    auto first = MessageCipher::Encrypt(plaintext, key).Unwrap();
    auto second = MessageCipher::Encrypt(plaintext, key).Unwrap();
    REQUIRE(first.nonce != second.nonce);
    REQUIRE(first.ciphertext != second.ciphertext);
}

TEST_CASE("MessageCipher - Tampering is detected", "[cipher][security]") {
    const auto key = RandomKey();
    const std::vector<uint8_t> plaintext = {'s', 'e', 'c', 'r', 'e', 't'};
    auto payload = MessageCipher::Encrypt(plaintext, key).Unwrap();

    auto expect_decryption_failure = [&](const std::vector<uint8_t>& ciphertext, const std::vector<uint8_t>& nonce) {
        auto result = MessageCipher::Decrypt(ciphertext, nonce, key);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == E2eeFailureType::Decryption);
    };

    SECTION("Ciphertext bit flip") {
        auto tampered = payload.ciphertext;
        tampered[2] ^= 0x04;
        expect_decryption_failure(tampered, payload.nonce);
    }
    SECTION("Tag bit flip") {
        auto tampered = payload.ciphertext;
        tampered.back() ^= 0x80;
        expect_decryption_failure(tampered, payload.nonce);
    }
    SECTION("Nonce bit flip") {
        auto tampered = payload.nonce;
        tampered[0] ^= 0x01;
        expect_decryption_failure(payload.ciphertext, tampered);
    }
    SECTION("Wrong nonce length") {
        expect_decryption_failure(payload.ciphertext, std::vector<uint8_t>(8, 0x00));
    }
    SECTION("Truncated below the tag") {
        expect_decryption_failure(std::vector<uint8_t>(payload.ciphertext.begin(), payload.ciphertext.begin() + 4),
                                  payload.nonce);
    }
    SECTION("Wrong key") {
        const auto other = RandomKey();
        auto result = MessageCipher::Decrypt(payload.ciphertext, payload.nonce, other);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == E2eeFailureType::Decryption);
    }
}

TEST_CASE("MessageCipher - Input limits", "[cipher]") {
    const auto key = RandomKey();

    SECTION("Empty plaintext is allowed") {
        auto payload = MessageCipher::Encrypt({}, key);
        REQUIRE(payload.IsOk());
        REQUIRE(MessageCipher::Decrypt(payload.Unwrap().ciphertext, payload.Unwrap().nonce, key).Unwrap().empty());
    }
    SECTION("Oversized plaintext is rejected") {
        const std::vector<uint8_t> huge(ProtocolConstants::MAX_PLAINTEXT_SIZE + 1, 0x00);
        auto result = MessageCipher::Encrypt(huge, key);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == E2eeFailureType::InvalidInput);
    }
    SECTION("Key of the wrong size") {
        auto short_key = SecureMemoryHandle::Allocate(16).Unwrap();
        const std::vector<uint8_t> plaintext = {'x'};
        REQUIRE(MessageCipher::Encrypt(plaintext, short_key).UnwrapErr().type == E2eeFailureType::InvalidInput);
    }
}
