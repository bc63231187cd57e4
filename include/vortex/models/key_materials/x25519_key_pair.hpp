#pragma once
#include "vortex/core/result.hpp"
#include "vortex/core/failures.hpp"
#include "vortex/crypto/sodium_secure_memory_handle.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace vortex::protocol::models {

/// X25519 key pair whose private scalar never leaves secure memory except
/// through ReadPrivateKeyCopy(), which exists for serialized export only.
class X25519KeyPair {
public:
    [[nodiscard]] static Result<X25519KeyPair, ProtocolFailure> Generate(std::string_view key_purpose);

    /// Rebuilds a pair from a stored private scalar and checks it against
    /// the stored public key.
    [[nodiscard]] static Result<X25519KeyPair, ProtocolFailure> FromParts(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> public_key);

    X25519KeyPair(
        crypto::SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key);
    X25519KeyPair(X25519KeyPair&&) noexcept = default;
    X25519KeyPair& operator=(X25519KeyPair&&) noexcept = default;
    X25519KeyPair(const X25519KeyPair&) = delete;
    X25519KeyPair& operator=(const X25519KeyPair&) = delete;
    ~X25519KeyPair() = default;

    [[nodiscard]] Result<X25519KeyPair, ProtocolFailure> Clone() const;

    /// DH(this.private, peer_public_key). The caller wipes the result.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Agree(
        std::span<const uint8_t> peer_public_key) const;

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> ReadPrivateKeyCopy() const;

    [[nodiscard]] const crypto::SecureMemoryHandle& GetSecretKeyHandle() const noexcept {
        return secret_key_handle_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] std::vector<uint8_t> GetPublicKeyCopy() const {
        return public_key_;
    }

private:
    crypto::SecureMemoryHandle secret_key_handle_;
    std::vector<uint8_t> public_key_;
};

}
