#pragma once
#include "vortex/core/result.hpp"
#include "vortex/core/failures.hpp"
#include <array>
#include <cstdint>
#include <span>

namespace vortex::protocol::security {

/// Rejects peer X25519 public keys that are the wrong size, that encode a
/// point of small order, or that are not a canonical field element.
class DhValidator {
public:
    [[nodiscard]] static Result<Unit, ProtocolFailure> ValidateX25519PublicKey(
        std::span<const uint8_t> public_key);

    [[nodiscard]] static bool HasSmallOrder(std::span<const uint8_t> public_key);

    [[nodiscard]] static bool IsCanonicalFieldElement(std::span<const uint8_t> public_key);

private:
    DhValidator() = delete;
};

}
