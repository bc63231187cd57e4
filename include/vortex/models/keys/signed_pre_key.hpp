#pragma once
#include "vortex/core/result.hpp"
#include "vortex/core/failures.hpp"
#include "vortex/models/key_materials/x25519_key_pair.hpp"
#include "vortex/models/key_materials/ed25519_key_pair.hpp"
#include <cstdint>
#include <vector>

namespace vortex::protocol::models {

class SignedPreKey {
public:
    /// Fresh X25519 pair, signed over its raw public key bytes.
    [[nodiscard]] static Result<SignedPreKey, ProtocolFailure> Generate(
        uint32_t key_id,
        const Ed25519KeyPair& signing_key);

    SignedPreKey(
        uint32_t key_id,
        X25519KeyPair key_pair,
        std::vector<uint8_t> signature,
        int64_t timestamp_ms);
    SignedPreKey(SignedPreKey&&) noexcept = default;
    SignedPreKey& operator=(SignedPreKey&&) noexcept = default;
    SignedPreKey(const SignedPreKey&) = delete;
    SignedPreKey& operator=(const SignedPreKey&) = delete;
    ~SignedPreKey() = default;

    [[nodiscard]] uint32_t GetKeyId() const noexcept {
        return key_id_;
    }
    [[nodiscard]] const X25519KeyPair& GetKeyPair() const noexcept {
        return key_pair_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetSignature() const noexcept {
        return signature_;
    }
    [[nodiscard]] int64_t GetTimestamp() const noexcept {
        return timestamp_ms_;
    }

private:
    uint32_t key_id_;
    X25519KeyPair key_pair_;
    std::vector<uint8_t> signature_;
    int64_t timestamp_ms_;
};

}
