#include "cgraph/storage/file_secure_storage.hpp"
#include "cgraph/crypto/sodium_interop.hpp"
#include "cgraph/core/format.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace cgraph::e2ee::storage {
namespace fs = std::filesystem;

namespace {
    constexpr fs::perms kOwnerOnly = fs::perms::owner_read | fs::perms::owner_write;
    constexpr std::string_view kTempSuffix = ".tmp";

    bool IsValidKeyChar(const char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '.' || c == '_' || c == '-';
    }
}

FileSecureStorage::FileSecureStorage(fs::path directory)
    : directory_(std::move(directory))
    , lock_(std::make_unique<std::mutex>()) {
}

Result<std::unique_ptr<FileSecureStorage>, E2eeFailure> FileSecureStorage::Open(fs::path directory) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        return Result<std::unique_ptr<FileSecureStorage>, E2eeFailure>::Err(E2eeFailure::Storage(
            compat::format("Cannot create storage directory {}: {}", directory.string(), ec.message())));
    }
    fs::permissions(directory, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        return Result<std::unique_ptr<FileSecureStorage>, E2eeFailure>::Err(E2eeFailure::Storage(
            compat::format("Cannot restrict permissions on {}: {}", directory.string(), ec.message())));
    }
    return Result<std::unique_ptr<FileSecureStorage>, E2eeFailure>::Ok(
        std::unique_ptr<FileSecureStorage>(new FileSecureStorage(std::move(directory))));
}

Result<fs::path, E2eeFailure> FileSecureStorage::PathFor(std::string_view key) const {
    if (key.empty() || key.front() == '.' || !std::all_of(key.begin(), key.end(), IsValidKeyChar)) {
        return Result<fs::path, E2eeFailure>::Err(
            E2eeFailure::InvalidInput(compat::format("Invalid storage key '{}'", key)));
    }
    return Result<fs::path, E2eeFailure>::Ok(directory_ / std::string(key));
}

Result<std::optional<std::vector<uint8_t>>, E2eeFailure> FileSecureStorage::Get(std::string_view key) {
    using GetResult = Result<std::optional<std::vector<uint8_t>>, E2eeFailure>;
    auto path_result = PathFor(key);
    if (path_result.IsErr()) {
        return GetResult::Err(std::move(path_result).UnwrapErr());
    }
    const fs::path path = std::move(path_result).Unwrap();

    std::lock_guard guard(*lock_);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            return GetResult::Err(E2eeFailure::Storage(
                compat::format("Cannot stat {}: {}", path.string(), ec.message())));
        }
        return GetResult::Ok(std::nullopt);
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return GetResult::Err(E2eeFailure::Storage(compat::format("Cannot open {}", path.string())));
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        (void)crypto::SodiumInterop::SecureWipe(std::span<uint8_t>(data));
        return GetResult::Err(E2eeFailure::Storage(compat::format("Read failed for {}", path.string())));
    }
    return GetResult::Ok(std::move(data));
}

Result<Unit, E2eeFailure> FileSecureStorage::Set(std::string_view key, std::span<const uint8_t> value) {
    auto path_result = PathFor(key);
    if (path_result.IsErr()) {
        return Result<Unit, E2eeFailure>::Err(std::move(path_result).UnwrapErr());
    }
    const fs::path path = std::move(path_result).Unwrap();
    fs::path temp_path = path;
    temp_path += kTempSuffix;

    std::lock_guard guard(*lock_);
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<Unit, E2eeFailure>::Err(
                E2eeFailure::Storage(compat::format("Cannot create {}", temp_path.string())));
        }
        std::error_code perm_ec;
        fs::permissions(temp_path, kOwnerOnly, fs::perm_options::replace, perm_ec);
        if (perm_ec) {
            out.close();
            fs::remove(temp_path, perm_ec);
            return Result<Unit, E2eeFailure>::Err(E2eeFailure::Storage(
                compat::format("Cannot restrict permissions on {}", temp_path.string())));
        }
        out.write(reinterpret_cast<const char*>(value.data()), static_cast<std::streamsize>(value.size()));
        out.flush();
        if (!out) {
            out.close();
            std::error_code cleanup_ec;
            fs::remove(temp_path, cleanup_ec);
            return Result<Unit, E2eeFailure>::Err(
                E2eeFailure::Storage(compat::format("Write failed for {}", temp_path.string())));
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(temp_path, cleanup_ec);
        return Result<Unit, E2eeFailure>::Err(E2eeFailure::Storage(
            compat::format("Cannot move {} into place: {}", path.string(), ec.message())));
    }
    return Result<Unit, E2eeFailure>::Ok(unit);
}

Result<Unit, E2eeFailure> FileSecureStorage::Delete(std::string_view key) {
    auto path_result = PathFor(key);
    if (path_result.IsErr()) {
        return Result<Unit, E2eeFailure>::Err(std::move(path_result).UnwrapErr());
    }
    std::lock_guard guard(*lock_);
    std::error_code ec;
    fs::remove(path_result.Unwrap(), ec);
    if (ec) {
        return Result<Unit, E2eeFailure>::Err(E2eeFailure::Storage(
            compat::format("Cannot delete {}: {}", path_result.Unwrap().string(), ec.message())));
    }
    return Result<Unit, E2eeFailure>::Ok(unit);
}

}
