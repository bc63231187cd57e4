#include "vortex/models/key_materials/x25519_key_pair.hpp"
#include "vortex/crypto/sodium_interop.hpp"
#include "vortex/protocol/constants.hpp"

namespace vortex::protocol::models {
    using crypto::SecureMemoryHandle;
    using crypto::SodiumInterop;

    X25519KeyPair::X25519KeyPair(
        SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key)
        : secret_key_handle_(std::move(secret_key_handle))
          , public_key_(std::move(public_key)) {
    }

    Result<X25519KeyPair, ProtocolFailure> X25519KeyPair::Generate(std::string_view key_purpose) {
        auto key_result = SodiumInterop::GenerateX25519KeyPair(key_purpose);
        if (key_result.IsErr()) {
            return Result<X25519KeyPair, ProtocolFailure>::Err(std::move(key_result).UnwrapErr());
        }
        auto [handle, public_key] = std::move(key_result).Unwrap();
        return Result<X25519KeyPair, ProtocolFailure>::Ok(
            X25519KeyPair(std::move(handle), std::move(public_key)));
    }

    Result<X25519KeyPair, ProtocolFailure> X25519KeyPair::FromParts(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> public_key) {
        if (private_key.size() != kX25519PrivateKeyBytes || public_key.size() != kX25519PublicKeyBytes) {
            return Result<X25519KeyPair, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("X25519 key pair has invalid key sizes"));
        }
        auto derived_result = SodiumInterop::DeriveX25519PublicKey(private_key);
        if (derived_result.IsErr()) {
            return Result<X25519KeyPair, ProtocolFailure>::Err(std::move(derived_result).UnwrapErr());
        }
        const auto derived = std::move(derived_result).Unwrap();
        auto equal_result = SodiumInterop::ConstantTimeEquals(derived, public_key);
        if (equal_result.IsErr() || !equal_result.Unwrap()) {
            return Result<X25519KeyPair, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("X25519 private key does not match its public key"));
        }
        auto handle_result = SecureMemoryHandle::FromBytes(private_key);
        if (handle_result.IsErr()) {
            return Result<X25519KeyPair, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        return Result<X25519KeyPair, ProtocolFailure>::Ok(X25519KeyPair(
            std::move(handle_result).Unwrap(),
            std::vector<uint8_t>(public_key.begin(), public_key.end())));
    }

    Result<X25519KeyPair, ProtocolFailure> X25519KeyPair::Clone() const {
        auto handle_result = secret_key_handle_.Clone();
        if (handle_result.IsErr()) {
            return Result<X25519KeyPair, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        return Result<X25519KeyPair, ProtocolFailure>::Ok(
            X25519KeyPair(std::move(handle_result).Unwrap(), public_key_));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> X25519KeyPair::Agree(
        std::span<const uint8_t> peer_public_key) const {
        auto dh_result = secret_key_handle_.WithReadAccess(
            [peer_public_key](std::span<const uint8_t> private_key) {
                return SodiumInterop::ComputeSharedSecret(private_key, peer_public_key);
            });
        if (dh_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(dh_result.UnwrapErr()));
        }
        return std::move(dh_result).Unwrap();
    }

    Result<std::vector<uint8_t>, ProtocolFailure> X25519KeyPair::ReadPrivateKeyCopy() const {
        auto read_result = secret_key_handle_.ReadBytes(kX25519PrivateKeyBytes);
        if (read_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(read_result.UnwrapErr()));
        }
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(read_result).Unwrap());
    }
}
