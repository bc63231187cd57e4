#pragma once
#include "vortex/core/result.hpp"
#include "vortex/core/failures.hpp"
#include "vortex/crypto/sodium_secure_memory_handle.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace vortex::protocol::models {

/// Ed25519 signing pair. Used only to sign pre-keys, never for DH.
class Ed25519KeyPair {
public:
    [[nodiscard]] static Result<Ed25519KeyPair, ProtocolFailure> Generate();

    [[nodiscard]] static Result<Ed25519KeyPair, ProtocolFailure> FromParts(
        std::span<const uint8_t> secret_key,
        std::span<const uint8_t> public_key);

    Ed25519KeyPair(
        crypto::SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key);
    Ed25519KeyPair(Ed25519KeyPair&&) noexcept = default;
    Ed25519KeyPair& operator=(Ed25519KeyPair&&) noexcept = default;
    Ed25519KeyPair(const Ed25519KeyPair&) = delete;
    Ed25519KeyPair& operator=(const Ed25519KeyPair&) = delete;
    ~Ed25519KeyPair() = default;

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Sign(
        std::span<const uint8_t> message) const;

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> ReadSecretKeyCopy() const;

    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }

private:
    crypto::SecureMemoryHandle secret_key_handle_;
    std::vector<uint8_t> public_key_;
};

}
