#include "cgraph/directory/bundle_validator.hpp"
#include "cgraph/crypto/dh_validator.hpp"
#include "cgraph/models/ed25519_key_pair.hpp"
#include "cgraph/core/constants.hpp"
#include "cgraph/core/format.hpp"

namespace cgraph::e2ee::directory {
using models::RemotePrekeyBundle;
using models::RemoteOneTimePreKey;
namespace pb = cgraph::proto::directory;

namespace {
    using ValidateResult = Result<RemotePrekeyBundle, E2eeFailure>;

    std::vector<uint8_t> ToBytes(const std::string& value) {
        return {value.begin(), value.end()};
    }

    std::optional<E2eeFailure> CheckX25519(const std::string& key, std::string_view field) {
        auto validation = crypto::DhValidator::ValidateX25519PublicKey(
            std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(key.data()), key.size()));
        if (validation.IsErr()) {
            return E2eeFailure::KeyAgreement(
                compat::format("Recipient {} rejected: {}", field, validation.UnwrapErr().message));
        }
        return std::nullopt;
    }
}

ValidateResult BundleValidator::Validate(const pb::ServerPrekeyBundle& bundle) {
    if (bundle.identity_key_id().empty() || bundle.signed_prekey_id().empty()) {
        return ValidateResult::Err(E2eeFailure::KeyAgreement("Recipient bundle is missing key identifiers"));
    }
    if (auto failure = CheckX25519(bundle.identity_key(), "identity key")) {
        return ValidateResult::Err(std::move(*failure));
    }
    if (auto failure = CheckX25519(bundle.signed_prekey(), "signed prekey")) {
        return ValidateResult::Err(std::move(*failure));
    }
    if (bundle.identity_signing_key().size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        return ValidateResult::Err(E2eeFailure::KeyAgreement(compat::format(
            "Recipient identity signing key must be {} bytes, got {}",
            Constants::ED_25519_PUBLIC_KEY_SIZE, bundle.identity_signing_key().size())));
    }

    const auto signing_key = ToBytes(bundle.identity_signing_key());
    const auto signed_prekey = ToBytes(bundle.signed_prekey());
    const auto signature = ToBytes(bundle.signed_prekey_signature());
    if (!models::Ed25519KeyPair::Verify(signing_key, signed_prekey, signature)) {
        return ValidateResult::Err(E2eeFailure::KeyAgreement(std::string(ErrorMessages::SIGNED_PRE_KEY_INVALID)));
    }

    if (bundle.has_one_time_prekey() != bundle.has_one_time_prekey_id()) {
        return ValidateResult::Err(E2eeFailure::KeyAgreement(
            "Recipient one-time prekey and its id must be present together"));
    }

    RemotePrekeyBundle result;
    result.user_id = bundle.user_id();
    result.device_id = bundle.device_id();
    result.identity_key = ToBytes(bundle.identity_key());
    result.identity_key_id = bundle.identity_key_id();
    result.identity_signing_key = signing_key;
    result.signed_pre_key = signed_prekey;
    result.signed_pre_key_id = bundle.signed_prekey_id();
    result.signed_pre_key_signature = signature;

    if (bundle.has_one_time_prekey()) {
        if (bundle.one_time_prekey_id().empty()) {
            return ValidateResult::Err(E2eeFailure::KeyAgreement("Recipient one-time prekey id is empty"));
        }
        if (auto failure = CheckX25519(bundle.one_time_prekey(), "one-time prekey")) {
            return ValidateResult::Err(std::move(*failure));
        }
        result.one_time_pre_key = RemoteOneTimePreKey{
            bundle.one_time_prekey_id(),
            ToBytes(bundle.one_time_prekey())};
    }
    return ValidateResult::Ok(std::move(result));
}

ValidateResult BundleValidator::Parse(std::span<const uint8_t> serialized) {
    pb::ServerPrekeyBundle bundle;
    if (!bundle.ParseFromArray(serialized.data(), static_cast<int>(serialized.size()))) {
        return ValidateResult::Err(E2eeFailure::KeyAgreement("Recipient bundle is not a valid payload"));
    }
    return Validate(bundle);
}

}
