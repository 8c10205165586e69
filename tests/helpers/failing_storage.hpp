#pragma once
#include "cgraph/storage/in_memory_secure_storage.hpp"
#include <atomic>
#include <mutex>
#include <set>
#include <string>

namespace cgraph::e2ee::test_helpers {
using storage::ISecureStorage;
using storage::InMemorySecureStorage;

/// In-memory storage whose writes can be made to fail, per key or after N successes.
class FailingStorage final : public ISecureStorage {
public:
    void FailWritesTo(std::string key) {
        std::lock_guard lock(mutex_);
        failing_keys_.insert(std::move(key));
    }

    void FailWritesAfter(const int successful_writes) {
        writes_left_.store(successful_writes);
    }

    void Heal() {
        std::lock_guard lock(mutex_);
        failing_keys_.clear();
        writes_left_.store(-1);
    }

    [[nodiscard]] size_t Size() const {
        return inner_.Size();
    }

    Result<std::optional<std::vector<uint8_t>>, E2eeFailure> Get(std::string_view key) override {
        return inner_.Get(key);
    }

    Result<Unit, E2eeFailure> Set(std::string_view key, std::span<const uint8_t> value) override {
        if (ShouldFail(key)) {
            return Result<Unit, E2eeFailure>::Err(E2eeFailure::Storage("Injected storage write failure"));
        }
        return inner_.Set(key, value);
    }

    Result<Unit, E2eeFailure> Delete(std::string_view key) override {
        return inner_.Delete(key);
    }

private:
    bool ShouldFail(std::string_view key) {
        {
            std::lock_guard lock(mutex_);
            if (failing_keys_.count(std::string(key)) != 0) {
                return true;
            }
        }
        int left = writes_left_.load();
        while (left >= 0) {
            if (left == 0) {
                return true;
            }
            if (writes_left_.compare_exchange_weak(left, left - 1)) {
                return false;
            }
        }
        return false;
    }

    InMemorySecureStorage inner_;
    std::mutex mutex_;
    std::set<std::string> failing_keys_;
    std::atomic<int> writes_left_{-1};
};

}
