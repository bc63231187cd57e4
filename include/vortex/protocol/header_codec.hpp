#pragma once
#include "vortex/core/result.hpp"
#include "vortex/core/failures.hpp"
#include "vortex/models/messages/message_header.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace vortex::protocol {

/// Fixed 40-byte layout used as the header plaintext: dh || pn (BE32) || n (BE32).
class HeaderCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Encode(
        const models::MessageHeader& header);

    [[nodiscard]] static Result<models::MessageHeader, ProtocolFailure> Decode(
        std::span<const uint8_t> bytes);

private:
    HeaderCodec() = delete;
};

}
