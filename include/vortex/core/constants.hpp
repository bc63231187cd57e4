#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace vortex::protocol {

struct Constants {
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr size_t UUID_BYTES = 16;
};

struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_HMAC = "HMAC";
    static constexpr std::string_view ALGORITHM_SHA512 = "SHA512";
    static constexpr std::string_view PARAM_DIGEST = "digest";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};

struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view SESSION_NOT_READY = "Session has not completed its handshake";
    static constexpr std::string_view NO_IDENTITY = "No identity has been generated or imported";
    static constexpr std::string_view AEAD_AUTHENTICATION_FAILED = "AEAD authentication failed";
    static constexpr std::string_view BACKUP_AUTHENTICATION_FAILED = "Wrong password or corrupted backup";
};

}
