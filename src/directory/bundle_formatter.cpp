#include "cgraph/directory/bundle_formatter.hpp"

#include <string>

namespace cgraph::e2ee::directory {
namespace pb = cgraph::proto::directory;

namespace {
    std::string ToProtoBytes(const std::vector<uint8_t>& data) {
        return {data.begin(), data.end()};
    }

    void FillOneTimePreKey(pb::OneTimePreKeyUpload& out, const models::OneTimePreKey& prekey) {
        out.set_public_key(ToProtoBytes(prekey.GetPublicKey()));
        out.set_key_id(prekey.GetKeyId());
    }
}

pb::RegistrationRequest BundleFormatter::FormatForRegistration(const models::KeyBundle& bundle) {
    const auto& identity = bundle.GetIdentity();
    const auto& spk = bundle.GetSignedPreKey();

    pb::RegistrationRequest request;
    request.set_identity_key(ToProtoBytes(identity.GetPublicKey()));
    request.set_identity_signing_key(ToProtoBytes(identity.GetSigningPublicKey()));
    request.set_key_id(identity.GetKeyId());
    request.set_device_id(identity.GetDeviceId());

    auto* signed_prekey = request.mutable_signed_prekey();
    signed_prekey->set_public_key(ToProtoBytes(spk.GetPublicKey()));
    signed_prekey->set_signature(ToProtoBytes(spk.GetSignature()));
    signed_prekey->set_key_id(spk.GetKeyId());

    for (const auto& opk : bundle.GetOneTimePreKeys()) {
        FillOneTimePreKey(*request.add_one_time_prekeys(), opk);
    }
    return request;
}

pb::PrekeyUploadRequest BundleFormatter::FormatPrekeyUpload(
    std::string_view device_id,
    const std::vector<models::OneTimePreKey>& prekeys) {
    pb::PrekeyUploadRequest request;
    request.set_device_id(std::string(device_id));
    for (const auto& opk : prekeys) {
        FillOneTimePreKey(*request.add_prekeys(), opk);
    }
    return request;
}

}
