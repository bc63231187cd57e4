#pragma once
#include <cstdint>
#include <optional>
#include <vector>

namespace vortex::protocol::models {

/// First-contact message the initiator sends alongside (or before) its
/// first EncryptedMessage so the responder can run its half of X3DH.
struct HandshakeInit {
    std::vector<uint8_t> identity_key;
    std::vector<uint8_t> ephemeral_key;
    std::optional<std::vector<uint8_t>> one_time_pre_key;
    std::optional<uint32_t> signed_pre_key_id;
    uint32_t registration_id = 0;
};

}
