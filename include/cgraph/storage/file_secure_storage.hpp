#pragma once
#include "cgraph/storage/i_secure_storage.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
namespace cgraph::e2ee::storage {

/**
 * One owner-only file per key under a private directory.
 *
 * Writes go to a temporary sibling and are renamed into place, so a crash
 * leaves either the old value or the new one. Keys are restricted to
 * [A-Za-z0-9._-] so they map directly onto file names.
 */
class FileSecureStorage final : public ISecureStorage {
public:
    [[nodiscard]] static Result<std::unique_ptr<FileSecureStorage>, E2eeFailure> Open(
        std::filesystem::path directory);
    [[nodiscard]] Result<std::optional<std::vector<uint8_t>>, E2eeFailure> Get(std::string_view key) override;
    [[nodiscard]] Result<Unit, E2eeFailure> Set(std::string_view key, std::span<const uint8_t> value) override;
    [[nodiscard]] Result<Unit, E2eeFailure> Delete(std::string_view key) override;
    [[nodiscard]] const std::filesystem::path& Directory() const noexcept {
        return directory_;
    }
private:
    explicit FileSecureStorage(std::filesystem::path directory);
    [[nodiscard]] Result<std::filesystem::path, E2eeFailure> PathFor(std::string_view key) const;
    std::filesystem::path directory_;
    std::unique_ptr<std::mutex> lock_;
};
}
