#pragma once

/**
 * @file protocol_logger.hpp
 * @brief Compile-time gated diagnostics for protocol events.
 *
 * Enable via CMake: -DVORTEX_DEBUG_LOG=ON
 *
 * Only public keys (truncated), counters, ids and event names are ever
 * passed to these helpers. Private keys, root/chain/message/header keys
 * and plaintext must never be logged, in any build.
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>

namespace vortex::debug {

enum class Side {
    Sender,
    Receiver,
    Identity,
    Unknown
};

#ifdef VORTEX_DEBUG_LOG

inline std::string ToHexPrefix(std::span<const uint8_t> data, size_t max_bytes = 8) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    const size_t count = data.size() < max_bytes ? data.size() : max_bytes;
    result.reserve(count * 2 + 3);
    for (size_t i = 0; i < count; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    if (data.size() > max_bytes) {
        result += "...";
    }
    return result;
}

inline const char* SideToString(Side side) {
    switch (side) {
        case Side::Sender: return "SENDER";
        case Side::Receiver: return "RECEIVER";
        case Side::Identity: return "IDENTITY";
        default: return "UNKNOWN";
    }
}

#define VORTEX_LOG_PUBLIC_KEY(side, operation, key_name, data) \
    do { \
        fprintf(stdout, "[VORTEX-DEBUG] %s %s %s: %s\n", \
            ::vortex::debug::SideToString(side), \
            operation, \
            key_name, \
            ::vortex::debug::ToHexPrefix(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define VORTEX_LOG_VALUE(side, operation, name, value) \
    do { \
        fprintf(stdout, "[VORTEX-DEBUG] %s %s %s: %s\n", \
            ::vortex::debug::SideToString(side), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define VORTEX_LOG_MSG(side, operation, message) \
    do { \
        fprintf(stdout, "[VORTEX-DEBUG] %s %s %s\n", \
            ::vortex::debug::SideToString(side), \
            operation, \
            message); \
        fflush(stdout); \
    } while(0)

inline void LogSessionInitialized(
    Side side,
    const std::string& session_id,
    std::span<const uint8_t> local_ratchet_public,
    bool used_one_time_pre_key) {
    VORTEX_LOG_MSG(side, "INIT", session_id.c_str());
    VORTEX_LOG_PUBLIC_KEY(side, "INIT", "ratchet_public", local_ratchet_public);
    VORTEX_LOG_MSG(side, "INIT", used_one_time_pre_key ? "one_time_pre_key: YES" : "one_time_pre_key: NO");
}

inline void LogDhRatchetStep(
    Side side,
    std::span<const uint8_t> peer_ratchet_public,
    std::span<const uint8_t> new_local_ratchet_public,
    uint32_t previous_chain_length) {
    VORTEX_LOG_PUBLIC_KEY(side, "RATCHET", "peer_ratchet_public", peer_ratchet_public);
    VORTEX_LOG_PUBLIC_KEY(side, "RATCHET", "new_ratchet_public", new_local_ratchet_public);
    VORTEX_LOG_VALUE(side, "RATCHET", "pn", previous_chain_length);
}

inline void LogSkippedKeysCached(Side side, size_t newly_cached, size_t total_cached) {
    VORTEX_LOG_VALUE(side, "SKIP", "newly_cached", newly_cached);
    VORTEX_LOG_VALUE(side, "SKIP", "total_cached", total_cached);
}

inline void LogSkippedKeysRemoved(Side side, const char* reason, size_t removed) {
    VORTEX_LOG_VALUE(side, "SKIP", reason, removed);
}

inline void LogDecryptRejected(Side side, const char* reason) {
    VORTEX_LOG_MSG(side, "DECRYPT", reason);
}

inline void LogPreKeysReplenished(uint32_t first_id, uint32_t count) {
    VORTEX_LOG_VALUE(Side::Identity, "PREKEYS", "replenish_first_id", first_id);
    VORTEX_LOG_VALUE(Side::Identity, "PREKEYS", "replenish_count", count);
}

inline void LogSignedPreKeyRotated(uint32_t new_key_id, std::span<const uint8_t> public_key) {
    VORTEX_LOG_VALUE(Side::Identity, "ROTATE", "signed_pre_key_id", new_key_id);
    VORTEX_LOG_PUBLIC_KEY(Side::Identity, "ROTATE", "signed_pre_key_public", public_key);
}

#else

#define VORTEX_LOG_PUBLIC_KEY(side, operation, key_name, data) ((void)0)
#define VORTEX_LOG_VALUE(side, operation, name, value) ((void)0)
#define VORTEX_LOG_MSG(side, operation, message) ((void)0)

inline void LogSessionInitialized(Side, const std::string&, std::span<const uint8_t>, bool) {}
inline void LogDhRatchetStep(Side, std::span<const uint8_t>, std::span<const uint8_t>, uint32_t) {}
inline void LogSkippedKeysCached(Side, size_t, size_t) {}
inline void LogSkippedKeysRemoved(Side, const char*, size_t) {}
inline void LogDecryptRejected(Side, const char*) {}
inline void LogPreKeysReplenished(uint32_t, uint32_t) {}
inline void LogSignedPreKeyRotated(uint32_t, std::span<const uint8_t>) {}

#endif

}
