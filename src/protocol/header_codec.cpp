#include "vortex/protocol/header_codec.hpp"
#include "vortex/protocol/constants.hpp"

namespace vortex::protocol {
    namespace {
        void AppendUint32BE(std::vector<uint8_t>& out, uint32_t value) {
            out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
            out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
            out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
            out.push_back(static_cast<uint8_t>(value & 0xFF));
        }

        uint32_t ReadUint32BE(std::span<const uint8_t> bytes) {
            return (static_cast<uint32_t>(bytes[0]) << 24) |
                   (static_cast<uint32_t>(bytes[1]) << 16) |
                   (static_cast<uint32_t>(bytes[2]) << 8) |
                   static_cast<uint32_t>(bytes[3]);
        }
    }

    Result<std::vector<uint8_t>, ProtocolFailure> HeaderCodec::Encode(
        const models::MessageHeader& header) {
        if (header.dh.size() != kX25519PublicKeyBytes) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Encode("Header ratchet key must be " +
                                        std::to_string(kX25519PublicKeyBytes) + " bytes"));
        }
        std::vector<uint8_t> out;
        out.reserve(kMessageHeaderBytes);
        out.insert(out.end(), header.dh.begin(), header.dh.end());
        AppendUint32BE(out, header.pn);
        AppendUint32BE(out, header.n);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(out));
    }

    Result<models::MessageHeader, ProtocolFailure> HeaderCodec::Decode(
        std::span<const uint8_t> bytes) {
        if (bytes.size() != kMessageHeaderBytes) {
            return Result<models::MessageHeader, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Header must be " + std::to_string(kMessageHeaderBytes) +
                                        " bytes, got " + std::to_string(bytes.size())));
        }
        models::MessageHeader header;
        header.dh.assign(bytes.begin(), bytes.begin() + kX25519PublicKeyBytes);
        header.pn = ReadUint32BE(bytes.subspan(kX25519PublicKeyBytes, 4));
        header.n = ReadUint32BE(bytes.subspan(kX25519PublicKeyBytes + 4, 4));
        return Result<models::MessageHeader, ProtocolFailure>::Ok(std::move(header));
    }
}
