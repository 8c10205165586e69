#include <catch2/catch_test_macros.hpp>
#include "cgraph/lifecycle/device_lifecycle_manager.hpp"
#include "cgraph/core/constants.hpp"
#include "helpers/e2ee_fixture.hpp"
#include <atomic>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace cgraph::e2ee;
using namespace cgraph::e2ee::test_helpers;
using lifecycle::DeviceLifecycleManager;

TEST_CASE("Concurrency - Parallel replenishment", "[concurrency][lifecycle]") {
    const auto config = FastConfig();
    auto server = LoopbackKeyDirectory::Create();
    auto alice = MakeSetUpParticipant(server, "alice");
    auto bob = MakeSetUpParticipant(server, "bob");
    const std::string bob_device = bob.manager->GetDeviceId().Unwrap();
    DeviceLifecycleManager lifecycle(*bob.manager);

    for (uint32_t i = 0; i < config.OneTimePreKeyBatch() - 1; ++i) {
        REQUIRE(alice.manager->EncryptMessage("bob", "drain").IsOk());
    }
    REQUIRE(server->UnusedPrekeyCount("bob", bob_device) == 1);

    constexpr int THREAD_COUNT = 8;
    std::atomic<uint32_t> uploaded{0};
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&] {
            auto result = lifecycle.CheckAndReplenish();
            if (result.IsErr()) {
                failures.fetch_add(1);
                return;
            }
            uploaded.fetch_add(result.Unwrap());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failures.load() == 0);
    REQUIRE(uploaded.load() == config.HighWaterMark() - 1);
    REQUIRE(server->UnusedPrekeyCount("bob", bob_device) == config.HighWaterMark());
}

TEST_CASE("Concurrency - Parallel setup", "[concurrency][setup]") {
    auto server = LoopbackKeyDirectory::Create();
    auto alice = MakeParticipant(server, "alice");

    constexpr int THREAD_COUNT = 6;
    std::atomic<int> succeeded{0};
    std::atomic<int> refused{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&] {
            auto result = alice.manager->Setup();
            if (result.IsOk()) {
                succeeded.fetch_add(1);
            } else if (result.UnwrapErr().type == E2eeFailureType::Setup) {
                refused.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(succeeded.load() == 1);
    REQUIRE(refused.load() == THREAD_COUNT - 1);
    REQUIRE(alice.manager->IsInitialized());

    auto devices = server->ConnectAs("alice")->ListDevices();
    REQUIRE(devices.IsOk());
    REQUIRE(devices.Unwrap().size() == 1);
}

TEST_CASE("Concurrency - Parallel sends and receives", "[concurrency][e2ee]") {
    const auto config = FastConfig().WithOneTimePreKeyBatch(40);
    auto server = LoopbackKeyDirectory::Create();
    auto alice = MakeSetUpParticipant(server, "alice", config);
    auto bob = MakeSetUpParticipant(server, "bob", config);
    const std::string alice_key = alice.manager->GetIdentityKeyBase64().Unwrap();

    constexpr int THREAD_COUNT = 4;
    constexpr int MESSAGES_PER_THREAD = 8;

    std::mutex collected_lock;
    std::vector<proto::common::EncryptedMessage> messages;
    std::atomic<int> send_failures{0};
    {
        std::vector<std::thread> threads;
        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&, t] {
                for (int i = 0; i < MESSAGES_PER_THREAD; ++i) {
                    auto sealed = alice.manager->EncryptMessage(
                        "bob", "thread " + std::to_string(t) + " message " + std::to_string(i));
                    if (sealed.IsErr()) {
                        send_failures.fetch_add(1);
                        continue;
                    }
                    std::lock_guard lock(collected_lock);
                    messages.push_back(std::move(sealed).Unwrap());
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }
    REQUIRE(send_failures.load() == 0);
    REQUIRE(messages.size() == THREAD_COUNT * MESSAGES_PER_THREAD);

    std::set<std::string> prekey_ids;
    for (const auto& message : messages) {
        REQUIRE(message.has_one_time_prekey_id());
        prekey_ids.insert(message.one_time_prekey_id());
    }
    REQUIRE(prekey_ids.size() == messages.size());

    auto session = alice.manager->GetSession("bob");
    REQUIRE(session.IsOk());
    REQUIRE(session.Unwrap().has_value());
    REQUIRE(session.Unwrap()->message_count == messages.size());

    SECTION("Each message opens exactly once under parallel delivery") {
        std::atomic<int> opened{0};
        std::atomic<int> rejected{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&] {
                for (const auto& message : messages) {
                    auto result = bob.manager->DecryptMessage("alice", alice_key, message);
                    if (result.IsOk()) {
                        opened.fetch_add(1);
                    } else if (result.UnwrapErr().type == E2eeFailureType::KeyAgreement) {
                        rejected.fetch_add(1);
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(opened.load() == static_cast<int>(messages.size()));
        REQUIRE(rejected.load() == static_cast<int>(messages.size()) * (THREAD_COUNT - 1));
    }
}

TEST_CASE("Concurrency - Reset while traffic is in flight", "[concurrency][reset]") {
    const auto config = FastConfig().WithOneTimePreKeyBatch(40);
    auto server = LoopbackKeyDirectory::Create();
    auto alice = MakeSetUpParticipant(server, "alice", config);
    auto bob = MakeSetUpParticipant(server, "bob", config);

    constexpr int THREAD_COUNT = 4;
    constexpr int ROUNDS = 5;

    SECTION("No session record survives a reset racing sends") {
        for (int round = 0; round < ROUNDS; ++round) {
            if (round > 0) {
                REQUIRE(alice.manager->Setup().IsOk());
            }
            std::atomic<bool> stop{false};
            std::atomic<int> sent{0};
            std::vector<std::thread> senders;
            for (int t = 0; t < THREAD_COUNT; ++t) {
                senders.emplace_back([&] {
                    while (!stop.load()) {
                        if (alice.manager->EncryptMessage("bob", "in flight").IsOk()) {
                            sent.fetch_add(1);
                        }
                    }
                });
            }
            while (sent.load() < 2 * THREAD_COUNT) {
                std::this_thread::yield();
            }
            const auto reset = alice.manager->Reset();
            stop.store(true);
            for (auto& thread : senders) {
                thread.join();
            }

            REQUIRE(reset.IsOk());
            REQUIRE_FALSE(alice.manager->IsInitialized());
            REQUIRE_FALSE(alice.storage->Get(StorageKeys::SESSIONS).Unwrap().has_value());
            REQUIRE_FALSE(alice.storage->Get(StorageKeys::KEY_RECORD).Unwrap().has_value());
            REQUIRE_FALSE(alice.manager->GetSession("bob").Unwrap().has_value());
        }
    }

    SECTION("No vault survives a reset racing receives") {
        const std::string alice_key = alice.manager->GetIdentityKeyBase64().Unwrap();
        for (int round = 0; round < ROUNDS; ++round) {
            if (round > 0) {
                REQUIRE(bob.manager->Setup().IsOk());
            }
            std::vector<proto::common::EncryptedMessage> inbox;
            for (int i = 0; i < 4 * THREAD_COUNT; ++i) {
                auto sealed = alice.manager->EncryptMessage("bob", "queued");
                REQUIRE(sealed.IsOk());
                REQUIRE(sealed.Unwrap().has_one_time_prekey_id());
                inbox.push_back(std::move(sealed).Unwrap());
            }

            std::atomic<int> opened{0};
            std::vector<std::thread> receivers;
            for (int t = 0; t < THREAD_COUNT; ++t) {
                receivers.emplace_back([&, t] {
                    for (size_t i = t; i < inbox.size(); i += THREAD_COUNT) {
                        if (bob.manager->DecryptMessage("alice", alice_key, inbox[i]).IsOk()) {
                            opened.fetch_add(1);
                        }
                    }
                });
            }
            while (opened.load() < THREAD_COUNT) {
                std::this_thread::yield();
            }
            const auto reset = bob.manager->Reset();
            for (auto& thread : receivers) {
                thread.join();
            }

            REQUIRE(reset.IsOk());
            REQUIRE_FALSE(bob.storage->Get(StorageKeys::ONE_TIME_PREKEYS).Unwrap().has_value());
            REQUIRE_FALSE(bob.storage->Get(StorageKeys::KEY_RECORD).Unwrap().has_value());
        }
    }
}
