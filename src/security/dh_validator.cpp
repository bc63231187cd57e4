#include "vortex/security/dh_validator.hpp"
#include "vortex/protocol/constants.hpp"
#include <array>

namespace vortex::protocol::security {

namespace {
    constexpr size_t kLastByte = kX25519PublicKeyBytes - 1;
    constexpr uint8_t kSignBitMask = 0x7F;

    // Little-endian encodings of the Curve25519 points of order 1, 2, 4 and 8
    // plus the encodings p - 1, p and p + 1. The top bit is
    // compared masked off.
    constexpr std::array<std::array<uint8_t, kX25519PublicKeyBytes>, 7> kSmallOrderPoints = {{
        {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
         0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00},
        {0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
         0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00},
        {0xe0, 0xeb, 0x7a, 0x7c, 0x3b, 0x41, 0xb8, 0xae, 0x16, 0x56, 0xe3, 0xfa, 0xf1, 0x9f, 0xc4, 0x6a,
         0xda, 0x09, 0x8d, 0xeb, 0x9c, 0x32, 0xb1, 0xfd, 0x86, 0x62, 0x05, 0x16, 0x5f, 0x49, 0xb8, 0x00},
        {0x5f, 0x9c, 0x95, 0xbc, 0xa3, 0x50, 0x8c, 0x24, 0xb1, 0xd0, 0xb1, 0x55, 0x9c, 0x83, 0xef, 0x5b,
         0x04, 0x44, 0x5c, 0xc4, 0x58, 0x1c, 0x8e, 0x86, 0xd8, 0x22, 0x4e, 0xdd, 0xd0, 0x9f, 0x11, 0x57},
        {0xec, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f},
        {0xed, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f},
        {0xee, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f},
    }};

    // 2^255 - 19, little-endian
    constexpr uint8_t kPrimeLowByte = 0xed;
}

Result<Unit, ProtocolFailure> DhValidator::ValidateX25519PublicKey(
    std::span<const uint8_t> public_key) {
    if (public_key.size() != kX25519PublicKeyBytes) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                "Invalid X25519 public key size: expected " +
                std::to_string(kX25519PublicKeyBytes) + ", got " +
                std::to_string(public_key.size())));
    }
    if (HasSmallOrder(public_key)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("X25519 public key is a small-order point"));
    }
    if (!IsCanonicalFieldElement(public_key)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("X25519 public key is not a canonical field element"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

bool DhValidator::HasSmallOrder(std::span<const uint8_t> public_key) {
    if (public_key.size() != kX25519PublicKeyBytes) {
        return false;
    }
    // Accumulate over every candidate so timing does not depend on which matched.
    uint8_t any_match = 0;
    for (const auto& point : kSmallOrderPoints) {
        uint8_t diff = 0;
        for (size_t i = 0; i < kLastByte; ++i) {
            diff |= static_cast<uint8_t>(public_key[i] ^ point[i]);
        }
        diff |= static_cast<uint8_t>((public_key[kLastByte] & kSignBitMask) ^ point[kLastByte]);
        any_match |= static_cast<uint8_t>(diff == 0);
    }
    return any_match != 0;
}

bool DhValidator::IsCanonicalFieldElement(std::span<const uint8_t> public_key) {
    if (public_key.size() != kX25519PublicKeyBytes) {
        return false;
    }
    // Only values in [p, 2^255) are non-canonical: 0x7f, then 30 bytes of 0xff,
    // then a low byte of at least 0xed.
    if ((public_key[kLastByte] & kSignBitMask) != kSignBitMask) {
        return true;
    }
    for (size_t i = kLastByte - 1; i >= 1; --i) {
        if (public_key[i] != 0xff) {
            return true;
        }
    }
    return public_key[0] < kPrimeLowByte;
}

}
