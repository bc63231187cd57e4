#pragma once
#include "vortex/models/key_materials/ed25519_key_pair.hpp"
#include "vortex/models/key_materials/x25519_key_pair.hpp"
#include "vortex/models/keys/one_time_pre_key.hpp"
#include "vortex/models/keys/signed_pre_key.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>
namespace vortex::protocol::identity {
using models::Ed25519KeyPair;
using models::X25519KeyPair;
using models::SignedPreKey;
using models::OneTimePreKey;
/// Long-term key material of the local party. Owned by IdentityManager;
/// exactly one signed pre-key is active at a time.
class IdentityStore {
public:
    IdentityStore(
        X25519KeyPair identity_key_pair,
        Ed25519KeyPair signing_key_pair,
        uint32_t registration_id,
        SignedPreKey signed_pre_key,
        std::vector<OneTimePreKey> one_time_pre_keys,
        int64_t created_at_ms,
        std::string fingerprint);
    [[nodiscard]] const X25519KeyPair& GetIdentityKeyPair() const noexcept { return identity_key_pair_; }
    [[nodiscard]] const Ed25519KeyPair& GetSigningKeyPair() const noexcept { return signing_key_pair_; }
    [[nodiscard]] uint32_t GetRegistrationId() const noexcept { return registration_id_; }
    [[nodiscard]] const SignedPreKey& GetSignedPreKey() const noexcept { return signed_pre_key_; }
    [[nodiscard]] const std::vector<OneTimePreKey>& GetOneTimePreKeys() const noexcept { return one_time_pre_keys_; }
    [[nodiscard]] int64_t GetCreatedAt() const noexcept { return created_at_ms_; }
    [[nodiscard]] const std::string& GetFingerprint() const noexcept { return fingerprint_; }
    [[nodiscard]] size_t UnusedOneTimePreKeyCount() const noexcept;
    /// Largest one-time pre-key id ever issued, 0 when the pool is empty.
    [[nodiscard]] uint32_t MaxOneTimePreKeyId() const noexcept;
    /// Lowest-positioned unused key, nullptr when all are used.
    [[nodiscard]] const OneTimePreKey* FirstUnusedOneTimePreKey() const noexcept;
    /// Constant-time scan by public key, used or not.
    [[nodiscard]] OneTimePreKey* FindOneTimePreKey(std::span<const uint8_t> public_key);
    [[nodiscard]] const OneTimePreKey* FindOneTimePreKey(std::span<const uint8_t> public_key) const;
    void ReplaceSignedPreKey(SignedPreKey signed_pre_key);
    void AppendOneTimePreKeys(std::vector<OneTimePreKey> keys);
    IdentityStore(IdentityStore&&) noexcept = default;
    IdentityStore& operator=(IdentityStore&&) noexcept = default;
    IdentityStore(const IdentityStore&) = delete;
    IdentityStore& operator=(const IdentityStore&) = delete;
    ~IdentityStore() = default;
private:
    X25519KeyPair identity_key_pair_;
    Ed25519KeyPair signing_key_pair_;
    uint32_t registration_id_;
    SignedPreKey signed_pre_key_;
    std::vector<OneTimePreKey> one_time_pre_keys_;
    int64_t created_at_ms_;
    std::string fingerprint_;
};
}
