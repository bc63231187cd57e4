#pragma once
#include "vortex/core/result.hpp"
#include "vortex/core/failures.hpp"
#include "vortex/configuration/identity_config.hpp"
#include "vortex/identity/identity_store.hpp"
#include "vortex/models/bundles/pre_key_bundle.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace vortex::protocol::identity {
using protocol::Result;
using protocol::Unit;
using protocol::ProtocolFailure;
using models::PreKeyBundle;
using configuration::IdentityConfig;

/// Public view of a freshly generated or imported identity.
struct IdentitySummary {
    std::vector<uint8_t> identity_public_key;
    std::vector<uint8_t> signing_public_key;
    uint32_t registration_id = 0;
    uint32_t signed_pre_key_id = 0;
    size_t one_time_pre_key_count = 0;
    std::string fingerprint;
    int64_t created_at = 0;
};

/**
 * @brief Owner of the local party's long-term key material
 *
 * Generates the identity (X25519 identity pair, Ed25519 signing pair,
 * registration id, signed pre-key, one-time pre-key pool), issues pre-key
 * bundles, tracks one-time pre-key consumption and produces encrypted
 * backups.
 *
 * Bundle issuance and pool mutation share one lock, so a one-time pre-key
 * marked used is never handed out again, even under concurrent callers.
 *
 * Only one signed pre-key is kept. RotateSignedPreKey() discards the
 * previous one immediately; a handshake started against an older bundle
 * can no longer be answered.
 */
class IdentityManager {
public:
    explicit IdentityManager(IdentityConfig config = IdentityConfig::Default());

    /// Replaces any existing identity. Fails with InitializationFailed when
    /// libsodium has not been initialized.
    [[nodiscard]] Result<IdentitySummary, ProtocolFailure> GenerateIdentity();

    /// Fresh X25519 pair signed with the current signing key. Does not
    /// install it; see RotateSignedPreKey().
    [[nodiscard]] Result<models::SignedPreKey, ProtocolFailure> GenerateSignedPreKey(uint32_t key_id) const;

    [[nodiscard]] static Result<std::vector<models::OneTimePreKey>, ProtocolFailure> GenerateOneTimePreKeys(
        uint32_t count,
        uint32_t start_id);

    /// Current public material with the first unused one-time pre-key, or
    /// nullopt without an identity.
    [[nodiscard]] std::optional<PreKeyBundle> GetPreKeyBundle() const;

    /**
     * @brief Marks the one-time pre-key with this public key as consumed
     *
     * Replenishes the pool with a batch of new keys when the unused count
     * drops below the configured low-water mark.
     *
     * @return Ok(true) if the key belongs to this identity, Ok(false) otherwise
     */
    [[nodiscard]] Result<bool, ProtocolFailure> MarkOneTimePreKeyUsed(std::span<const uint8_t> public_key);

    /// Private pair for an unused one-time pre-key, for the responder side of X3DH.
    [[nodiscard]] Result<std::optional<X25519KeyPair>, ProtocolFailure> GetOneTimePreKeyPair(
        std::span<const uint8_t> public_key) const;

    /// Installs signed pre-key currentId + 1. @return the new key id
    [[nodiscard]] Result<uint32_t, ProtocolFailure> RotateSignedPreKey();

    /// Ed25519 check of the bundle's signed pre-key signature. Never throws;
    /// malformed input yields false.
    [[nodiscard]] static bool VerifyPreKeyBundle(
        const PreKeyBundle& bundle,
        std::span<const uint8_t> signing_public_key) noexcept;

    /// Six groups of five digits, identical on both sides of a conversation.
    [[nodiscard]] Result<std::string, ProtocolFailure> ComputeSafetyNumber(
        std::span<const uint8_t> their_identity_key) const;

    [[nodiscard]] static Result<std::string, ProtocolFailure> ComputeFingerprint(
        std::span<const uint8_t> identity_public_key);

    /// Empty without an identity.
    [[nodiscard]] std::string GetFingerprint() const;

    /// Password-encrypted JSON backup of the full identity, signing pair included.
    [[nodiscard]] Result<std::string, ProtocolFailure> ExportIdentity(std::string_view password) const;

    /// Restores a backup produced with the same password-hash configuration.
    [[nodiscard]] Result<IdentitySummary, ProtocolFailure> ImportIdentity(
        std::string_view backup,
        std::string_view password);

    [[nodiscard]] Result<X25519KeyPair, ProtocolFailure> GetIdentityKeyPair() const;
    [[nodiscard]] Result<X25519KeyPair, ProtocolFailure> GetSignedPreKeyPair() const;
    [[nodiscard]] std::optional<std::vector<uint8_t>> GetIdentityPublicKey() const;
    [[nodiscard]] std::optional<std::vector<uint8_t>> GetSigningPublicKey() const;
    [[nodiscard]] bool IsInitialized() const;
    [[nodiscard]] std::optional<uint32_t> RegistrationId() const;
    [[nodiscard]] std::optional<uint32_t> SignedPreKeyId() const;
    [[nodiscard]] size_t UnusedOneTimePreKeyCount() const;
    [[nodiscard]] const IdentityConfig& Config() const noexcept { return config_; }

    IdentityManager(IdentityManager&&) noexcept = default;
    IdentityManager& operator=(IdentityManager&&) noexcept = default;
    IdentityManager(const IdentityManager&) = delete;
    IdentityManager& operator=(const IdentityManager&) = delete;
    ~IdentityManager() = default;

private:
    [[nodiscard]] static IdentitySummary Summarize(const IdentityStore& store);
    [[nodiscard]] Result<models::SignedPreKey, ProtocolFailure> GenerateSignedPreKeyLocked(uint32_t key_id) const;
    [[nodiscard]] Result<Unit, ProtocolFailure> ReplenishOneTimePreKeysLocked();

    IdentityConfig config_;
    std::optional<IdentityStore> store_;
    mutable std::unique_ptr<std::shared_mutex> lock_;
};
}
