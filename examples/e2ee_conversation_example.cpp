/**
 * @file e2ee_conversation_example.cpp
 * @brief Two users set up devices against an in-process directory and exchange messages
 */

#include "cgraph/protocol/e2ee_manager.hpp"
#include "cgraph/lifecycle/device_lifecycle_manager.hpp"
#include "cgraph/directory/loopback_key_directory.hpp"
#include "cgraph/storage/in_memory_secure_storage.hpp"
#include "cgraph/core/result.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace cgraph::e2ee;
using directory::LoopbackKeyDirectory;
using lifecycle::DeviceLifecycleManager;
using protocol::E2eeManager;

namespace {
    std::unique_ptr<E2eeManager> SetUpUser(
        const std::shared_ptr<LoopbackKeyDirectory>& server,
        const std::string& user_id) {
        auto created = E2eeManager::Create(
            user_id,
            std::make_shared<storage::InMemorySecureStorage>(),
            server->ConnectAs(user_id));
        if (created.IsErr()) {
            std::cerr << "Failed to create manager for " << user_id << ": "
                      << created.UnwrapErr().message << std::endl;
            return nullptr;
        }
        auto manager = std::move(created).Unwrap();
        if (auto setup = manager->Setup("example"); setup.IsErr()) {
            std::cerr << "Setup failed for " << user_id << ": " << setup.UnwrapErr().message << std::endl;
            return nullptr;
        }
        std::cout << "   ✓ " << user_id << " is on device " << manager->GetDeviceId().Unwrap() << std::endl;
        return manager;
    }
}

int main() {
    std::cout << "=== CGraph E2EE - Conversation Example ===" << std::endl;
    std::cout << std::endl;

    auto server = LoopbackKeyDirectory::Create();

    std::cout << "1. Setting up devices..." << std::endl;
    auto alice = SetUpUser(server, "alice");
    auto bob = SetUpUser(server, "bob");
    if (!alice || !bob) {
        return 1;
    }
    std::cout << std::endl;

    std::cout << "2. Alice encrypts a message for Bob..." << std::endl;
    auto sealed = alice->EncryptMessage("bob", "Meet at the usual place at noon.");
    if (sealed.IsErr()) {
        std::cerr << "Encryption failed: " << sealed.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto& message = sealed.Unwrap();
    std::cout << "   ✓ " << message.ciphertext().size() << " bytes of ciphertext, one-time prekey "
              << (message.has_one_time_prekey_id() ? message.one_time_prekey_id() : "none") << std::endl;
    std::cout << std::endl;

    std::cout << "3. Bob decrypts it..." << std::endl;
    auto opened = bob->DecryptMessage("alice", alice->GetIdentityKeyBase64().Unwrap(), message);
    if (opened.IsErr()) {
        std::cerr << "Decryption failed: " << opened.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto& plaintext = opened.Unwrap();
    std::cout << "   ✓ \"" << std::string(plaintext.begin(), plaintext.end()) << "\"" << std::endl;
    std::cout << std::endl;

    std::cout << "4. Comparing safety numbers..." << std::endl;
    auto alice_view = alice->GetSafetyNumber("bob");
    auto bob_view = bob->GetSafetyNumber("alice");
    if (alice_view.IsErr() || bob_view.IsErr()) {
        std::cerr << "Could not compute safety numbers" << std::endl;
        return 1;
    }
    std::cout << "   Alice sees: " << alice_view.Unwrap() << std::endl;
    std::cout << "   Bob sees:   " << bob_view.Unwrap() << std::endl;
    std::cout << "   " << (alice_view.Unwrap() == bob_view.Unwrap() ? "✓ match" : "✗ MISMATCH") << std::endl;
    std::cout << std::endl;

    std::cout << "5. Bob checks his one-time prekeys..." << std::endl;
    DeviceLifecycleManager bob_devices(*bob);
    auto remaining = bob_devices.GetPrekeyCount();
    auto uploaded = bob_devices.CheckAndReplenish();
    if (remaining.IsErr() || uploaded.IsErr()) {
        std::cerr << "Prekey maintenance failed" << std::endl;
        return 1;
    }
    std::cout << "   ✓ " << remaining.Unwrap() << " remaining, " << uploaded.Unwrap() << " uploaded" << std::endl;
    std::cout << std::endl;

    std::cout << "6. Alice resets her device..." << std::endl;
    if (auto reset = alice->Reset(); reset.IsErr()) {
        std::cerr << "Reset failed: " << reset.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ initialized: " << std::boolalpha << alice->IsInitialized() << std::endl;

    return 0;
}
