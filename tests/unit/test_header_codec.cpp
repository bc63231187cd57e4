#include <catch2/catch_test_macros.hpp>
#include "vortex/protocol/header_codec.hpp"
#include "vortex/protocol/constants.hpp"
#include <vector>

using namespace vortex::protocol;

TEST_CASE("HeaderCodec - Layout", "[header][protocol]") {
    models::MessageHeader header;
    header.dh = std::vector<uint8_t>(32, 0xAB);
    header.pn = 0x01020304;
    header.n = 0xA0B0C0D0;

    SECTION("40 bytes, counters big-endian after the key") {
        auto encoded = HeaderCodec::Encode(header);
        REQUIRE(encoded.IsOk());
        const auto& bytes = encoded.Unwrap();
        REQUIRE(bytes.size() == kMessageHeaderBytes);
        REQUIRE(std::vector<uint8_t>(bytes.begin(), bytes.begin() + 32) == header.dh);
        REQUIRE(bytes[32] == 0x01);
        REQUIRE(bytes[35] == 0x04);
        REQUIRE(bytes[36] == 0xA0);
        REQUIRE(bytes[39] == 0xD0);
    }
    SECTION("Decode restores every field") {
        auto bytes = HeaderCodec::Encode(header).Unwrap();
        auto decoded = HeaderCodec::Decode(bytes);
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().dh == header.dh);
        REQUIRE(decoded.Unwrap().pn == header.pn);
        REQUIRE(decoded.Unwrap().n == header.n);
    }
}

TEST_CASE("HeaderCodec - Malformed input", "[header][protocol]") {
    SECTION("Encode rejects a short ratchet key") {
        models::MessageHeader header;
        header.dh = std::vector<uint8_t>(31, 0x01);
        auto result = HeaderCodec::Encode(header);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Encode);
    }
    SECTION("Decode requires exactly 40 bytes") {
        std::vector<uint8_t> short_bytes(39, 0);
        std::vector<uint8_t> long_bytes(41, 0);
        REQUIRE(HeaderCodec::Decode(short_bytes).IsErr());
        REQUIRE(HeaderCodec::Decode(long_bytes).IsErr());
        REQUIRE(HeaderCodec::Decode(short_bytes).UnwrapErr().type == ProtocolFailureType::Decode);
    }
}
