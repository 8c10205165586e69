#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace cgraph::e2ee {
struct Constants {
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t ED_25519_SECRET_KEY_SIZE = 64;
    static constexpr size_t ED_25519_SIGNATURE_SIZE = 64;
    static constexpr size_t X_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t X_25519_PRIVATE_KEY_SIZE = 32;
    static constexpr size_t X_25519_SHARED_SECRET_SIZE = 32;
    static constexpr size_t CURVE_25519_FIELD_ELEMENT_SIZE = 32;
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t SHA_256_SIZE = 32;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
};
struct ProtocolConstants {
    static constexpr std::string_view HKDF_INFO = "CGraph E2EE v1";
    static constexpr size_t HKDF_SALT_SIZE = 32;
    static constexpr size_t DERIVED_KEY_SIZE = 32;
    static constexpr size_t MAX_DH_COUNT = 4;
    static constexpr size_t KEY_ID_RANDOM_BYTES = 8;
    static constexpr size_t DEVICE_ID_RANDOM_BYTES = 4;
    static constexpr std::string_view DEFAULT_DEVICE_TAG = "native";
    static constexpr uint32_t DEFAULT_ONE_TIME_PREKEY_BATCH = 100;
    static constexpr uint32_t DEFAULT_PREKEY_UPLOAD = 50;
    static constexpr uint32_t DEFAULT_LOW_WATER_MARK = 20;
    static constexpr uint32_t DEFAULT_HIGH_WATER_MARK = 100;
    static constexpr uint32_t MAX_PREKEYS_PER_CALL = 1000;
    static constexpr std::chrono::minutes DEFAULT_BUNDLE_CACHE_TTL{5};
    static constexpr std::chrono::minutes DEFAULT_REPLENISH_INTERVAL{5};
    static constexpr uint32_t DEFAULT_DIRECTORY_MAX_ATTEMPTS = 3;
    static constexpr std::chrono::milliseconds DEFAULT_DIRECTORY_BASE_BACKOFF{200};
    static constexpr std::chrono::hours DEFAULT_ONE_TIME_PREKEY_RETENTION{24 * 30};
    static constexpr size_t MAX_PLAINTEXT_SIZE = 10 * 1024 * 1024;
};
struct SafetyNumberConstants {
    static constexpr size_t CHUNK_COUNT = 12;
    static constexpr size_t CHUNK_BYTES = 2;
    static constexpr size_t DIGITS_PER_CHUNK = 5;
};
struct StorageKeys {
    static constexpr std::string_view KEY_RECORD = "cgraph.e2ee.key_record";
    static constexpr std::string_view ONE_TIME_PREKEYS = "cgraph.e2ee.one_time_prekeys";
    static constexpr std::string_view SESSIONS = "cgraph.e2ee.sessions";
    static constexpr uint32_t RECORD_VERSION = 1;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view E2EE_NOT_INITIALIZED = "E2EE is not initialized for this device";
    static constexpr std::string_view ALREADY_INITIALIZED = "Key material already exists for this device";
    static constexpr std::string_view SIGNED_PRE_KEY_INVALID = "Signed prekey signature verification failed";
    static constexpr std::string_view AES_GCM_DECRYPTION_FAILED = "Authentication tag verification failed";
    static constexpr std::string_view DIRECTORY_SHUT_DOWN = "Key directory client has been shut down";
};
}
