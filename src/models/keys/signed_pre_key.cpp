#include "vortex/models/keys/signed_pre_key.hpp"
#include <chrono>

namespace vortex::protocol::models {
    SignedPreKey::SignedPreKey(
        const uint32_t key_id,
        X25519KeyPair key_pair,
        std::vector<uint8_t> signature,
        const int64_t timestamp_ms)
        : key_id_(key_id)
          , key_pair_(std::move(key_pair))
          , signature_(std::move(signature))
          , timestamp_ms_(timestamp_ms) {
    }

    Result<SignedPreKey, ProtocolFailure> SignedPreKey::Generate(
        const uint32_t key_id,
        const Ed25519KeyPair& signing_key) {
        auto pair_result = X25519KeyPair::Generate("SignedPreKey");
        if (pair_result.IsErr()) {
            return Result<SignedPreKey, ProtocolFailure>::Err(std::move(pair_result).UnwrapErr());
        }
        auto key_pair = std::move(pair_result).Unwrap();

        auto signature_result = signing_key.Sign(key_pair.GetPublicKey());
        if (signature_result.IsErr()) {
            return Result<SignedPreKey, ProtocolFailure>::Err(std::move(signature_result).UnwrapErr());
        }

        const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        return Result<SignedPreKey, ProtocolFailure>::Ok(SignedPreKey(
            key_id, std::move(key_pair), std::move(signature_result).Unwrap(), now));
    }
}
