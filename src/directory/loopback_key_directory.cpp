#include "cgraph/directory/loopback_key_directory.hpp"
#include "cgraph/crypto/sodium_interop.hpp"
#include "cgraph/debug/logger.hpp"

#include <algorithm>

namespace cgraph::e2ee::directory {

namespace {
    constexpr std::string_view kComponent = "LOOPBACK";

    std::span<const uint8_t> AsBytes(const std::string& value) {
        return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
    }
}

class LoopbackKeyDirectory::Connection final : public IKeyDirectory {
public:
    Connection(std::shared_ptr<LoopbackKeyDirectory> server, std::string user_id)
        : server_(std::move(server))
        , user_id_(std::move(user_id)) {}

    Result<Unit, E2eeFailure> RegisterBundle(const pb::RegistrationRequest& request) override {
        return server_->Register(user_id_, request);
    }
    Result<uint32_t, E2eeFailure> UploadPrekeys(const pb::PrekeyUploadRequest& request) override {
        return server_->Upload(user_id_, request);
    }
    Result<uint32_t, E2eeFailure> GetRemainingPrekeyCount(std::string_view device_id) override {
        return server_->RemainingCount(user_id_, device_id);
    }
    Result<pb::ServerPrekeyBundle, E2eeFailure> FetchPrekeyBundle(std::string_view user_id) override {
        return server_->Fetch(user_id);
    }
    Result<std::vector<pb::DeviceInfo>, E2eeFailure> ListDevices() override {
        return server_->List(user_id_);
    }
    Result<Unit, E2eeFailure> RevokeDevice(std::string_view device_id) override {
        return server_->Revoke(user_id_, device_id);
    }

private:
    std::shared_ptr<LoopbackKeyDirectory> server_;
    std::string user_id_;
};

LoopbackKeyDirectory::LoopbackKeyDirectory(Clock clock)
    : clock_(std::move(clock)) {}

std::shared_ptr<LoopbackKeyDirectory> LoopbackKeyDirectory::Create(Clock clock) {
    return std::shared_ptr<LoopbackKeyDirectory>(new LoopbackKeyDirectory(std::move(clock)));
}

std::shared_ptr<IKeyDirectory> LoopbackKeyDirectory::ConnectAs(std::string user_id) {
    return std::make_shared<Connection>(shared_from_this(), std::move(user_id));
}

void LoopbackKeyDirectory::FailNextCalls(const uint32_t count) noexcept {
    fail_next_.store(count, std::memory_order_relaxed);
}

void LoopbackKeyDirectory::SetAvailable(const bool available) noexcept {
    available_.store(available, std::memory_order_relaxed);
}

bool LoopbackKeyDirectory::ConsumeInjectedFault() {
    if (!available_.load(std::memory_order_relaxed)) {
        return true;
    }
    uint32_t remaining = fail_next_.load(std::memory_order_relaxed);
    while (remaining > 0) {
        if (fail_next_.compare_exchange_weak(remaining, remaining - 1, std::memory_order_relaxed)) {
            return true;
        }
    }
    return false;
}

uint32_t LoopbackKeyDirectory::AppendPrekeysLocked(
    DeviceRecord& device,
    const google::protobuf::RepeatedPtrField<pb::OneTimePreKeyUpload>& prekeys) {
    uint32_t accepted = 0;
    for (const auto& upload : prekeys) {
        const bool duplicate = std::any_of(device.prekeys.begin(), device.prekeys.end(),
            [&](const PublishedPrekey& existing) { return existing.key_id == upload.key_id(); });
        if (duplicate) {
            continue;
        }
        device.prekeys.push_back(PublishedPrekey{upload.key_id(), upload.public_key(), next_sequence_++, false});
        ++accepted;
    }
    return accepted;
}

Result<Unit, E2eeFailure> LoopbackKeyDirectory::Register(
    std::string_view user_id,
    const pb::RegistrationRequest& request) {
    if (ConsumeInjectedFault()) {
        return Result<Unit, E2eeFailure>::Err(E2eeFailure::Directory("Loopback directory unavailable"));
    }
    if (request.device_id().empty() || request.identity_key().empty() || !request.has_signed_prekey()) {
        return Result<Unit, E2eeFailure>::Err(E2eeFailure::Directory("Registration is missing required fields"));
    }

    std::lock_guard lock(lock_);
    auto& devices = users_[std::string(user_id)];
    auto& device = devices[request.device_id()];
    if (!device.identity_key.empty() && device.identity_key != request.identity_key()) {
        CGRAPH_LOG_WARN(kComponent, "Identity key changed for {} device {}", user_id, request.device_id());
        device.prekeys.clear();
    }
    device.identity_key = request.identity_key();
    device.identity_key_id = request.key_id();
    device.identity_signing_key = request.identity_signing_key();
    device.signed_prekey = request.signed_prekey().public_key();
    device.signed_prekey_signature = request.signed_prekey().signature();
    device.signed_prekey_id = request.signed_prekey().key_id();
    device.registered_at = clock_();
    device.registration_sequence = next_sequence_++;
    const uint32_t accepted = AppendPrekeysLocked(device, request.one_time_prekeys());
    CGRAPH_LOG_DEBUG(kComponent, "Registered {} device {} with {} prekeys", user_id, request.device_id(), accepted);
    return Result<Unit, E2eeFailure>::Ok(unit);
}

Result<uint32_t, E2eeFailure> LoopbackKeyDirectory::Upload(
    std::string_view user_id,
    const pb::PrekeyUploadRequest& request) {
    if (ConsumeInjectedFault()) {
        return Result<uint32_t, E2eeFailure>::Err(E2eeFailure::Directory("Loopback directory unavailable"));
    }
    std::lock_guard lock(lock_);
    const auto user = users_.find(user_id);
    if (user == users_.end()) {
        return Result<uint32_t, E2eeFailure>::Err(E2eeFailure::Directory("Device is not registered"));
    }
    const auto device = user->second.find(request.device_id());
    if (device == user->second.end()) {
        return Result<uint32_t, E2eeFailure>::Err(E2eeFailure::Directory("Device is not registered"));
    }
    return Result<uint32_t, E2eeFailure>::Ok(AppendPrekeysLocked(device->second, request.prekeys()));
}

Result<uint32_t, E2eeFailure> LoopbackKeyDirectory::RemainingCount(
    std::string_view user_id,
    std::string_view device_id) {
    if (ConsumeInjectedFault()) {
        return Result<uint32_t, E2eeFailure>::Err(E2eeFailure::Directory("Loopback directory unavailable"));
    }
    return Result<uint32_t, E2eeFailure>::Ok(static_cast<uint32_t>(UnusedPrekeyCount(user_id, device_id)));
}

Result<pb::ServerPrekeyBundle, E2eeFailure> LoopbackKeyDirectory::Fetch(std::string_view user_id) {
    fetch_count_.fetch_add(1, std::memory_order_relaxed);
    if (ConsumeInjectedFault()) {
        return Result<pb::ServerPrekeyBundle, E2eeFailure>::Err(
            E2eeFailure::Directory("Loopback directory unavailable"));
    }

    std::lock_guard lock(lock_);
    const auto user = users_.find(user_id);
    if (user == users_.end() || user->second.empty()) {
        return Result<pb::ServerPrekeyBundle, E2eeFailure>::Err(
            E2eeFailure::Directory(compat::format("No key bundle published for '{}'", user_id)));
    }

    auto latest = std::max_element(user->second.begin(), user->second.end(),
        [](const auto& a, const auto& b) {
            return a.second.registration_sequence < b.second.registration_sequence;
        });
    auto& device = latest->second;

    pb::ServerPrekeyBundle bundle;
    bundle.set_user_id(std::string(user_id));
    bundle.set_device_id(latest->first);
    bundle.set_identity_key(device.identity_key);
    bundle.set_identity_key_id(device.identity_key_id);
    bundle.set_identity_signing_key(device.identity_signing_key);
    bundle.set_signed_prekey(device.signed_prekey);
    bundle.set_signed_prekey_signature(device.signed_prekey_signature);
    bundle.set_signed_prekey_id(device.signed_prekey_id);

    PublishedPrekey* oldest = nullptr;
    for (auto& prekey : device.prekeys) {
        if (!prekey.used && (oldest == nullptr || prekey.sequence < oldest->sequence)) {
            oldest = &prekey;
        }
    }
    if (oldest != nullptr) {
        oldest->used = true;
        bundle.set_one_time_prekey(oldest->public_key);
        bundle.set_one_time_prekey_id(oldest->key_id);
    } else {
        CGRAPH_LOG_INFO(kComponent, "One-time prekeys exhausted for {} device {}", user_id, latest->first);
    }
    return Result<pb::ServerPrekeyBundle, E2eeFailure>::Ok(std::move(bundle));
}

Result<std::vector<pb::DeviceInfo>, E2eeFailure> LoopbackKeyDirectory::List(std::string_view user_id) {
    if (ConsumeInjectedFault()) {
        return Result<std::vector<pb::DeviceInfo>, E2eeFailure>::Err(
            E2eeFailure::Directory("Loopback directory unavailable"));
    }
    std::vector<pb::DeviceInfo> devices;
    std::lock_guard lock(lock_);
    const auto user = users_.find(user_id);
    if (user != users_.end()) {
        for (const auto& [device_id, record] : user->second) {
            pb::DeviceInfo info;
            info.set_device_id(device_id);
            info.set_identity_key_fingerprint(
                crypto::SodiumInterop::ToHex(crypto::SodiumInterop::Sha256(AsBytes(record.identity_key))));
            info.set_registered_at_ms(ToUnixMillis(record.registered_at));
            devices.push_back(std::move(info));
        }
    }
    return Result<std::vector<pb::DeviceInfo>, E2eeFailure>::Ok(std::move(devices));
}

Result<Unit, E2eeFailure> LoopbackKeyDirectory::Revoke(std::string_view user_id, std::string_view device_id) {
    if (ConsumeInjectedFault()) {
        return Result<Unit, E2eeFailure>::Err(E2eeFailure::Revocation("Loopback directory unavailable"));
    }
    std::lock_guard lock(lock_);
    const auto user = users_.find(user_id);
    if (user == users_.end()) {
        return Result<Unit, E2eeFailure>::Err(E2eeFailure::InvalidInput(
            compat::format("Device '{}' not found", device_id)));
    }
    const auto device = user->second.find(device_id);
    if (device == user->second.end()) {
        return Result<Unit, E2eeFailure>::Err(E2eeFailure::InvalidInput(
            compat::format("Device '{}' not found", device_id)));
    }
    user->second.erase(device);
    CGRAPH_LOG_INFO(kComponent, "Revoked {} device {}", user_id, device_id);
    return Result<Unit, E2eeFailure>::Ok(unit);
}

size_t LoopbackKeyDirectory::UnusedPrekeyCount(std::string_view user_id, std::string_view device_id) const {
    std::lock_guard lock(lock_);
    const auto user = users_.find(user_id);
    if (user == users_.end()) {
        return 0;
    }
    const auto device = user->second.find(device_id);
    if (device == user->second.end()) {
        return 0;
    }
    return static_cast<size_t>(std::count_if(device->second.prekeys.begin(), device->second.prekeys.end(),
        [](const PublishedPrekey& prekey) { return !prekey.used; }));
}

bool LoopbackKeyDirectory::IsRegistered(std::string_view user_id, std::string_view device_id) const {
    std::lock_guard lock(lock_);
    const auto user = users_.find(user_id);
    return user != users_.end() && user->second.find(device_id) != user->second.end();
}

}
