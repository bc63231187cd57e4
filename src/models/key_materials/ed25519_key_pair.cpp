#include "vortex/models/key_materials/ed25519_key_pair.hpp"
#include "vortex/crypto/sodium_interop.hpp"
#include "vortex/protocol/constants.hpp"
#include <sodium.h>
#include <array>

namespace vortex::protocol::models {
    using crypto::SecureMemoryHandle;
    using crypto::SodiumInterop;

    Ed25519KeyPair::Ed25519KeyPair(
        SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key)
        : secret_key_handle_(std::move(secret_key_handle))
          , public_key_(std::move(public_key)) {
    }

    Result<Ed25519KeyPair, ProtocolFailure> Ed25519KeyPair::Generate() {
        auto key_result = SodiumInterop::GenerateEd25519KeyPair();
        if (key_result.IsErr()) {
            return Result<Ed25519KeyPair, ProtocolFailure>::Err(std::move(key_result).UnwrapErr());
        }
        auto [handle, public_key] = std::move(key_result).Unwrap();
        return Result<Ed25519KeyPair, ProtocolFailure>::Ok(
            Ed25519KeyPair(std::move(handle), std::move(public_key)));
    }

    Result<Ed25519KeyPair, ProtocolFailure> Ed25519KeyPair::FromParts(
        std::span<const uint8_t> secret_key,
        std::span<const uint8_t> public_key) {
        if (secret_key.size() != kEd25519SecretKeyBytes || public_key.size() != kEd25519PublicKeyBytes) {
            return Result<Ed25519KeyPair, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Ed25519 key pair has invalid key sizes"));
        }
        std::array<uint8_t, kEd25519PublicKeyBytes> embedded{};
        crypto_sign_ed25519_sk_to_pk(embedded.data(), secret_key.data());
        auto equal_result = SodiumInterop::ConstantTimeEquals(embedded, public_key);
        if (equal_result.IsErr() || !equal_result.Unwrap()) {
            return Result<Ed25519KeyPair, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Ed25519 secret key does not match its public key"));
        }
        auto handle_result = SecureMemoryHandle::FromBytes(secret_key);
        if (handle_result.IsErr()) {
            return Result<Ed25519KeyPair, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        return Result<Ed25519KeyPair, ProtocolFailure>::Ok(Ed25519KeyPair(
            std::move(handle_result).Unwrap(),
            std::vector<uint8_t>(public_key.begin(), public_key.end())));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> Ed25519KeyPair::Sign(
        std::span<const uint8_t> message) const {
        auto sign_result = secret_key_handle_.WithReadAccess(
            [message](std::span<const uint8_t> secret_key) {
                return SodiumInterop::SignDetached(secret_key, message);
            });
        if (sign_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(sign_result.UnwrapErr()));
        }
        return std::move(sign_result).Unwrap();
    }

    Result<std::vector<uint8_t>, ProtocolFailure> Ed25519KeyPair::ReadSecretKeyCopy() const {
        auto read_result = secret_key_handle_.ReadBytes(kEd25519SecretKeyBytes);
        if (read_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(read_result.UnwrapErr()));
        }
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(read_result).Unwrap());
    }
}
