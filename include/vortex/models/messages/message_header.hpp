#pragma once
#include <cstdint>
#include <vector>

namespace vortex::protocol::models {

/// Routing header: sender's current ratchet public key, length of the
/// sender's previous sending chain, and this message's index in the
/// current chain.
struct MessageHeader {
    std::vector<uint8_t> dh;
    uint32_t pn = 0;
    uint32_t n = 0;
};

}
