#include <catch2/catch_test_macros.hpp>
#include "cgraph/directory/key_directory_client.hpp"
#include "cgraph/directory/loopback_key_directory.hpp"
#include "cgraph/directory/bundle_formatter.hpp"
#include "cgraph/identity/key_bundle_generator.hpp"
#include "cgraph/crypto/sodium_interop.hpp"
#include <atomic>
#include <stdexcept>
#include <deque>
#include <thread>
using namespace cgraph::e2ee;
using namespace cgraph::e2ee::directory;
using configuration::E2eeConfig;
using identity::KeyBundleGenerator;

namespace {
    /// Directory whose revoke answers come from a script; other calls succeed trivially.
    class ScriptedDirectory final : public IKeyDirectory {
    public:
        std::deque<E2eeFailureType> failures;
        std::atomic<int> calls{0};

        Result<Unit, E2eeFailure> RegisterBundle(const pb::RegistrationRequest&) override {
            return Next<Unit>(unit);
        }
        Result<uint32_t, E2eeFailure> UploadPrekeys(const pb::PrekeyUploadRequest& request) override {
            return Next<uint32_t>(static_cast<uint32_t>(request.prekeys_size()));
        }
        Result<uint32_t, E2eeFailure> GetRemainingPrekeyCount(std::string_view) override {
            return Next<uint32_t>(7);
        }
        Result<pb::ServerPrekeyBundle, E2eeFailure> FetchPrekeyBundle(std::string_view user_id) override {
            pb::ServerPrekeyBundle bundle;
            bundle.set_user_id(std::string(user_id) + "-impostor");
            return Next<pb::ServerPrekeyBundle>(std::move(bundle));
        }
        Result<std::vector<pb::DeviceInfo>, E2eeFailure> ListDevices() override {
            return Next<std::vector<pb::DeviceInfo>>({});
        }
        Result<Unit, E2eeFailure> RevokeDevice(std::string_view) override {
            return Next<Unit>(unit);
        }

    private:
        template<typename T>
        Result<T, E2eeFailure> Next(T value) {
            ++calls;
            if (failures.empty()) {
                return Result<T, E2eeFailure>::Ok(std::move(value));
            }
            const auto type = failures.front();
            failures.pop_front();
            return Result<T, E2eeFailure>::Err(E2eeFailure{type, "scripted failure"});
        }
    };

    E2eeConfig RetryConfig(const uint32_t attempts, const std::chrono::milliseconds backoff) {
        return E2eeConfig::Default().WithDirectoryRetry(attempts, backoff);
    }
}

TEST_CASE("KeyDirectoryClient - Requires a directory", "[directory][client]") {
    REQUIRE_THROWS_AS(KeyDirectoryClient(nullptr, E2eeConfig::Default()), std::invalid_argument);
}

TEST_CASE("KeyDirectoryClient - Retries transient failures", "[directory][client]") {
    auto directory = std::make_shared<ScriptedDirectory>();
    KeyDirectoryClient client(directory, RetryConfig(3, std::chrono::milliseconds(1)));

    SECTION("Succeeds on the last attempt") {
        directory->failures = {E2eeFailureType::Directory, E2eeFailureType::Directory};
        auto result = client.GetRemainingPrekeyCount("device");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == 7);
        REQUIRE(directory->calls.load() == 3);
    }

    SECTION("Gives up after the configured attempts") {
        directory->failures = {E2eeFailureType::Directory, E2eeFailureType::Directory,
                               E2eeFailureType::Directory, E2eeFailureType::Directory};
        auto result = client.GetRemainingPrekeyCount("device");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == E2eeFailureType::Directory);
        REQUIRE(directory->calls.load() == 3);
    }

    SECTION("Revocation failures are retried too") {
        directory->failures = {E2eeFailureType::Revocation};
        REQUIRE(client.RevokeDevice("device").IsOk());
        REQUIRE(directory->calls.load() == 2);
    }

    SECTION("Non-retryable failures return at once") {
        directory->failures = {E2eeFailureType::InvalidInput};
        auto result = client.ListDevices();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == E2eeFailureType::InvalidInput);
        REQUIRE(directory->calls.load() == 1);
    }
}

TEST_CASE("KeyDirectoryClient - Argument checks happen before the network", "[directory][client]") {
    auto directory = std::make_shared<ScriptedDirectory>();
    KeyDirectoryClient client(directory, E2eeConfig::Default());

    REQUIRE(client.FetchPrekeyBundle("").UnwrapErr().type == E2eeFailureType::InvalidInput);
    REQUIRE(client.RevokeDevice("").UnwrapErr().type == E2eeFailureType::InvalidInput);

    pb::PrekeyUploadRequest empty;
    empty.set_device_id("device");
    REQUIRE(client.UploadPrekeys(empty).Unwrap() == 0);

    pb::PrekeyUploadRequest oversized;
    for (uint32_t i = 0; i <= ProtocolConstants::MAX_PREKEYS_PER_CALL; ++i) {
        oversized.add_prekeys()->set_key_id(std::to_string(i));
    }
    REQUIRE(client.UploadPrekeys(oversized).UnwrapErr().type == E2eeFailureType::InvalidInput);
    REQUIRE(directory->calls.load() == 0);
}

TEST_CASE("KeyDirectoryClient - Rejects a bundle for the wrong user", "[directory][client][security]") {
    auto directory = std::make_shared<ScriptedDirectory>();
    KeyDirectoryClient client(directory, E2eeConfig::Default());
    auto result = client.FetchPrekeyBundle("bob");
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == E2eeFailureType::KeyAgreement);
}

TEST_CASE("KeyDirectoryClient - Fetches and validates through the loopback", "[directory][client]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto server = LoopbackKeyDirectory::Create();
    auto bundle = KeyBundleGenerator::GenerateKeyBundle("bob_phone", 2).Unwrap();
    REQUIRE(server->ConnectAs("bob")->RegisterBundle(BundleFormatter::FormatForRegistration(bundle)).IsOk());

    KeyDirectoryClient client(server->ConnectAs("alice"), E2eeConfig::Default());
    auto fetched = client.FetchPrekeyBundle("bob");
    REQUIRE(fetched.IsOk());
    REQUIRE(fetched.Unwrap().device_id == "bob_phone");
    REQUIRE(fetched.Unwrap().one_time_pre_key.has_value());
}

TEST_CASE("KeyDirectoryClient - Unknown device is not retried", "[directory][client]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto server = LoopbackKeyDirectory::Create();
    auto bundle = KeyBundleGenerator::GenerateKeyBundle("bob_phone", 1).Unwrap();
    REQUIRE(server->ConnectAs("bob")->RegisterBundle(BundleFormatter::FormatForRegistration(bundle)).IsOk());
    KeyDirectoryClient client(server->ConnectAs("bob"), RetryConfig(3, std::chrono::seconds(5)));

    const auto started = std::chrono::steady_clock::now();
    auto result = client.RevokeDevice("bob_tablet");
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == E2eeFailureType::InvalidInput);
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
    REQUIRE(server->IsRegistered("bob", "bob_phone"));
}

TEST_CASE("KeyDirectoryClient - Shutdown cancels pending retries", "[directory][client][lifecycle]") {
    auto directory = std::make_shared<ScriptedDirectory>();
    directory->failures = {E2eeFailureType::Directory, E2eeFailureType::Directory, E2eeFailureType::Directory};
    KeyDirectoryClient client(directory, RetryConfig(3, std::chrono::seconds(30)));

    std::thread stopper([&client] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        client.Shutdown();
    });
    const auto started = std::chrono::steady_clock::now();
    auto result = client.GetRemainingPrekeyCount("device");
    stopper.join();

    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == E2eeFailureType::Cancelled);
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(10));
    REQUIRE(client.IsShutdown());

    auto after = client.ListDevices();
    REQUIRE(after.UnwrapErr().type == E2eeFailureType::Cancelled);
}
