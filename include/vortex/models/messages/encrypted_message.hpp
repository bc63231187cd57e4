#pragma once
#include "vortex/models/messages/message_header.hpp"
#include <cstdint>
#include <vector>

namespace vortex::protocol::models {

struct EncryptedMessage {
    MessageHeader header;
    std::vector<uint8_t> header_cipher;
    std::vector<uint8_t> header_nonce;
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> nonce;
};

}
