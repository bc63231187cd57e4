#pragma once
#include <cstdint>
#include <optional>
#include <vector>

namespace vortex::protocol::models {

/// Public snapshot of a party's handshake material. Immutable once issued.
///
/// signing_key, signed_pre_key_id and one_time_pre_key_id are optional
/// extras; a peer that only knows the five core fields can still run X3DH.
struct PreKeyBundle {
    std::vector<uint8_t> identity_key;
    std::vector<uint8_t> signed_pre_key;
    std::vector<uint8_t> signed_pre_key_signature;
    std::optional<std::vector<uint8_t>> one_time_pre_key;
    uint32_t registration_id = 0;
    std::optional<std::vector<uint8_t>> signing_key;
    std::optional<uint32_t> signed_pre_key_id;
    std::optional<uint32_t> one_time_pre_key_id;
};

}
