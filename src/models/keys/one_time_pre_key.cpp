#include "vortex/models/keys/one_time_pre_key.hpp"

namespace vortex::protocol::models {
    OneTimePreKey::OneTimePreKey(const uint32_t key_id, X25519KeyPair key_pair, const bool used)
        : key_id_(key_id)
          , key_pair_(std::move(key_pair))
          , used_(used) {
    }

    Result<OneTimePreKey, ProtocolFailure> OneTimePreKey::Generate(const uint32_t key_id) {
        auto pair_result = X25519KeyPair::Generate("OneTimePreKey");
        if (pair_result.IsErr()) {
            return Result<OneTimePreKey, ProtocolFailure>::Err(std::move(pair_result).UnwrapErr());
        }
        return Result<OneTimePreKey, ProtocolFailure>::Ok(
            OneTimePreKey(key_id, std::move(pair_result).Unwrap()));
    }
}
