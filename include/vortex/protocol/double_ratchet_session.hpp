#pragma once
#include "vortex/core/failures.hpp"
#include "vortex/core/result.hpp"
#include "vortex/configuration/ratchet_config.hpp"
#include "vortex/models/bundles/pre_key_bundle.hpp"
#include "vortex/models/key_materials/x25519_key_pair.hpp"
#include "vortex/models/messages/encrypted_message.hpp"
#include "vortex/protocol/session_state.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vortex::protocol {

/// What a successful Decrypt did to the ratchet, beyond producing plaintext.
enum class RatchetEvent {
    None,               ///< Message advanced the current receiving chain
    DhRatchetStep,      ///< Peer switched ratchet key; a new sending chain now exists
    SkippedKeyConsumed  ///< Out-of-order message served from the skipped-key cache
};

/// Double Ratchet session with X3DH bootstrap and encrypted headers.
///
/// One object per peer relationship. The session is inert until either
/// InitializeSender() or InitializeReceiver() succeeds (or ImportState()
/// restores an exported one), after which IsReady() stays true for the
/// lifetime of the object.
///
/// Decrypt is all-or-nothing: the skip-and-cache and DH-ratchet work is done
/// on a staged copy of the ratchet state and only committed once both the
/// header and the body authenticate. A rejected message never changes the
/// session.
///
/// Thread Safety: All public methods are thread-safe; internal state is protected by mutex.
class DoubleRatchetSession {
public:
    struct SenderHandshake {
        std::vector<uint8_t> ephemeral_public_key;
        bool used_one_time_pre_key = false;
    };

    struct DecryptResult {
        std::vector<uint8_t> plaintext;
        RatchetEvent event = RatchetEvent::None;
        /// Keys this call added to the skipped cache that are still in it.
        size_t newly_skipped_keys = 0;
        /// Older cached keys dropped by this call to stay within the cap.
        size_t evicted_skipped_keys = 0;
    };

    /// @param session_id Optional stable id; a random UUIDv4 is used otherwise.
    explicit DoubleRatchetSession(
        configuration::RatchetConfig config = configuration::RatchetConfig::Default(),
        std::optional<std::string> session_id = std::nullopt);

    /// Runs X3DH against @p remote_bundle and starts the sending chain.
    ///
    /// The returned ephemeral public key must reach the peer (see HandshakeInit).
    /// When used_one_time_pre_key is true the peer's manager must mark that
    /// key used; this session never tracks pre-key consumption.
    [[nodiscard]] Result<SenderHandshake, ProtocolFailure> InitializeSender(
        const models::X25519KeyPair& local_identity,
        const models::PreKeyBundle& remote_bundle);

    /// Mirrors the initiator's X3DH. The local signed pre-key becomes the
    /// first ratchet key pair; the receiving chain starts with the first
    /// incoming message.
    [[nodiscard]] Result<Unit, ProtocolFailure> InitializeReceiver(
        const models::X25519KeyPair& local_identity,
        const models::X25519KeyPair& local_signed_pre_key,
        const models::X25519KeyPair* local_one_time_pre_key,
        std::span<const uint8_t> remote_identity_key,
        std::span<const uint8_t> remote_ephemeral_key);

    [[nodiscard]] Result<models::EncryptedMessage, ProtocolFailure> Encrypt(
        std::span<const uint8_t> plaintext);

    [[nodiscard]] Result<DecryptResult, ProtocolFailure> Decrypt(
        const models::EncryptedMessage& message);

    /// Drops cached skipped keys older than the configured maximum age.
    /// @return Number of keys removed
    size_t CleanupSkippedKeys();

    size_t CleanupSkippedKeys(std::chrono::milliseconds max_age);

    /// Same as CleanupSkippedKeys() with an explicit clock reading.
    size_t CleanupSkippedKeysAt(
        std::chrono::system_clock::time_point now,
        std::chrono::milliseconds max_age);

    [[nodiscard]] Result<std::string, ProtocolFailure> ExportState() const;

    /// Replaces any current state with the exported document.
    [[nodiscard]] Result<Unit, ProtocolFailure> ImportState(std::string_view json);

    [[nodiscard]] std::string SessionId() const;
    [[nodiscard]] bool IsReady() const;
    [[nodiscard]] std::optional<SessionRole> Role() const;
    [[nodiscard]] uint32_t SendingMessageNumber() const;
    [[nodiscard]] uint32_t ReceivingMessageNumber() const;
    [[nodiscard]] uint32_t PreviousSendingChainLength() const;
    [[nodiscard]] size_t SkippedKeyCount() const;
    [[nodiscard]] std::vector<uint8_t> LocalRatchetPublicKey() const;
    [[nodiscard]] int64_t CreatedAt() const;
    [[nodiscard]] int64_t LastActivity() const;
    [[nodiscard]] const configuration::RatchetConfig& Config() const noexcept {
        return config_;
    }

    DoubleRatchetSession(const DoubleRatchetSession&) = delete;
    DoubleRatchetSession& operator=(const DoubleRatchetSession&) = delete;
    DoubleRatchetSession(DoubleRatchetSession&&) noexcept = delete;
    DoubleRatchetSession& operator=(DoubleRatchetSession&&) noexcept = delete;
    ~DoubleRatchetSession() = default;

private:
    [[nodiscard]] Result<Unit, ProtocolFailure> SkipMessageKeys(
        RatchetState& staged,
        uint32_t until,
        SkippedKeyMap& newly_skipped,
        int64_t now_ms,
        uint64_t& next_sequence) const;

    [[nodiscard]] Result<Unit, ProtocolFailure> DhRatchetStep(
        RatchetState& staged,
        std::span<const uint8_t> remote_ratchet_key) const;

    [[nodiscard]] Result<DecryptResult, ProtocolFailure> DecryptWithSkippedKey(
        SkippedKeyMap::iterator entry,
        const models::EncryptedMessage& message,
        int64_t now_ms);

    /// Drops the oldest cached keys until the cap holds. Entries whose
    /// sequence is at least @p protected_from are dropped last.
    size_t EnforceSkippedKeyCap(uint64_t protected_from);

    configuration::RatchetConfig config_;
    std::string session_id_;
    std::optional<SessionState> state_;
    mutable std::mutex lock_;
};

}
