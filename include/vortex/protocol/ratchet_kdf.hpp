#pragma once
#include "vortex/core/result.hpp"
#include "vortex/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace vortex::protocol {

/// Output of one root-chain step. Each field feeds exactly one consumer.
struct RootKeyStep {
    std::vector<uint8_t> root_key;
    std::vector<uint8_t> chain_key;
    std::vector<uint8_t> header_key;

    void Wipe() noexcept;
};

/// Output of one symmetric-chain step.
struct ChainKeyStep {
    std::vector<uint8_t> message_key;
    std::vector<uint8_t> next_chain_key;

    void Wipe() noexcept;
};

/**
 * Stateless key schedule of the ratchet.
 *
 * KDF-RK: HKDF(ikm = dh_output, salt = root_key, info = "VORTEX_RATCHET", 96)
 *         split 32/32/32 into root, chain and header keys.
 * KDF-CK: message_key = MAC(chain_key, 0x01), next = MAC(chain_key, 0x02).
 * X3DH:   HKDF(ikm = DH1||DH2||DH3[||DH4], salt = 32 zero bytes,
 *         info = "VORTEX_RATCHET", 32).
 */
class RatchetKdf {
public:
    [[nodiscard]] static Result<RootKeyStep, ProtocolFailure> DeriveRootKeys(
        std::span<const uint8_t> root_key,
        std::span<const uint8_t> dh_output);

    [[nodiscard]] static Result<ChainKeyStep, ProtocolFailure> DeriveChainKeys(
        std::span<const uint8_t> chain_key);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> DeriveX3dhSecret(
        std::span<const uint8_t> dh_concatenation);

private:
    RatchetKdf() = delete;
};

}
