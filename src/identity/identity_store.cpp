#include "vortex/identity/identity_store.hpp"
#include "vortex/crypto/sodium_interop.hpp"
#include <algorithm>

namespace vortex::protocol::identity {
    using crypto::SodiumInterop;

    IdentityStore::IdentityStore(
        X25519KeyPair identity_key_pair,
        Ed25519KeyPair signing_key_pair,
        uint32_t registration_id,
        SignedPreKey signed_pre_key,
        std::vector<OneTimePreKey> one_time_pre_keys,
        int64_t created_at_ms,
        std::string fingerprint)
        : identity_key_pair_(std::move(identity_key_pair))
          , signing_key_pair_(std::move(signing_key_pair))
          , registration_id_(registration_id)
          , signed_pre_key_(std::move(signed_pre_key))
          , one_time_pre_keys_(std::move(one_time_pre_keys))
          , created_at_ms_(created_at_ms)
          , fingerprint_(std::move(fingerprint)) {
    }

    size_t IdentityStore::UnusedOneTimePreKeyCount() const noexcept {
        return static_cast<size_t>(std::count_if(
            one_time_pre_keys_.begin(), one_time_pre_keys_.end(),
            [](const OneTimePreKey& key) { return !key.IsUsed(); }));
    }

    uint32_t IdentityStore::MaxOneTimePreKeyId() const noexcept {
        uint32_t max_id = 0;
        for (const auto& key : one_time_pre_keys_) {
            max_id = std::max(max_id, key.GetKeyId());
        }
        return max_id;
    }

    const OneTimePreKey* IdentityStore::FirstUnusedOneTimePreKey() const noexcept {
        for (const auto& key : one_time_pre_keys_) {
            if (!key.IsUsed()) {
                return &key;
            }
        }
        return nullptr;
    }

    OneTimePreKey* IdentityStore::FindOneTimePreKey(std::span<const uint8_t> public_key) {
        OneTimePreKey* match = nullptr;
        for (auto& key : one_time_pre_keys_) {
            auto equal = SodiumInterop::ConstantTimeEquals(key.GetPublicKeySpan(), public_key);
            if (equal.IsOk() && equal.Unwrap() && match == nullptr) {
                match = &key;
            }
        }
        return match;
    }

    const OneTimePreKey* IdentityStore::FindOneTimePreKey(std::span<const uint8_t> public_key) const {
        return const_cast<IdentityStore*>(this)->FindOneTimePreKey(public_key);
    }

    void IdentityStore::ReplaceSignedPreKey(SignedPreKey signed_pre_key) {
        signed_pre_key_ = std::move(signed_pre_key);
    }

    void IdentityStore::AppendOneTimePreKeys(std::vector<OneTimePreKey> keys) {
        one_time_pre_keys_.reserve(one_time_pre_keys_.size() + keys.size());
        for (auto& key : keys) {
            one_time_pre_keys_.push_back(std::move(key));
        }
    }
}
