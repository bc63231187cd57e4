#pragma once
#include "vortex/core/result.hpp"
#include "vortex/core/failures.hpp"
#include "vortex/models/key_materials/x25519_key_pair.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vortex::protocol {

enum class SessionRole {
    Sender,
    Receiver
};

/// Key of the skipped-message cache: the sender ratchet key the message
/// was sent under and its index in that chain.
struct SkippedKeyId {
    std::vector<uint8_t> dh;
    uint32_t n = 0;

    [[nodiscard]] bool operator<(const SkippedKeyId& other) const noexcept {
        if (dh != other.dh) {
            return dh < other.dh;
        }
        return n < other.n;
    }

    /// "<base64url(dh)>:<n>", the form used in exported state.
    [[nodiscard]] std::string ToString() const;

    [[nodiscard]] static Result<SkippedKeyId, ProtocolFailure> Parse(std::string_view text);
};

struct SkippedMessageKey {
    std::vector<uint8_t> message_key;
    int64_t timestamp_ms = 0;
    /// Cache insertion order within this session. Not exported; breaks
    /// timestamp ties when the cache is trimmed to its cap.
    uint64_t sequence = 0;
};

using SkippedKeyMap = std::map<SkippedKeyId, SkippedMessageKey>;

/// Wipes every cached message key and empties the map.
void WipeSkippedKeys(SkippedKeyMap& skipped) noexcept;

/**
 * @brief The mutable part of a session: DH ratchet pair, root and chain keys,
 * header keys and counters.
 *
 * Secrets are wiped when the state is destroyed or overwritten. Clone() is
 * used to stage a decrypt so that a failed attempt leaves the original
 * untouched.
 */
struct RatchetState {
    std::optional<models::X25519KeyPair> dhs;
    std::optional<std::vector<uint8_t>> dhr;
    std::vector<uint8_t> root_key;
    std::optional<std::vector<uint8_t>> cks;
    std::optional<std::vector<uint8_t>> ckr;
    std::optional<std::vector<uint8_t>> hks;
    std::optional<std::vector<uint8_t>> hkr;
    uint32_t ns = 0;
    uint32_t nr = 0;
    uint32_t pn = 0;

    RatchetState() = default;
    RatchetState(RatchetState&& other) noexcept = default;
    RatchetState& operator=(RatchetState&& other) noexcept;
    RatchetState(const RatchetState&) = delete;
    RatchetState& operator=(const RatchetState&) = delete;
    ~RatchetState();

    [[nodiscard]] Result<RatchetState, ProtocolFailure> Clone() const;

    void Wipe() noexcept;
};

/// Everything a DoubleRatchetSession owns once initialized, and exactly what
/// its export document carries.
struct SessionState {
    std::string session_id;
    SessionRole role = SessionRole::Sender;
    RatchetState ratchet;
    SkippedKeyMap skipped;
    std::vector<uint8_t> local_identity_key;
    std::vector<uint8_t> remote_identity_key;
    int64_t created_at_ms = 0;
    int64_t last_activity_ms = 0;
    uint64_t next_skipped_sequence = 0;

    SessionState() = default;
    SessionState(SessionState&&) noexcept = default;
    SessionState& operator=(SessionState&& other) noexcept;
    SessionState(const SessionState&) = delete;
    SessionState& operator=(const SessionState&) = delete;
    ~SessionState();
};

/// Overwrites @p target with @p value, wiping the previous contents first.
void ReplaceSecret(std::vector<uint8_t>& target, std::vector<uint8_t>&& value) noexcept;
void ReplaceSecret(std::optional<std::vector<uint8_t>>& target, std::vector<uint8_t>&& value) noexcept;

}
