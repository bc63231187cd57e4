#pragma once
#include "vortex/core/result.hpp"
#include "vortex/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>

namespace vortex::protocol::crypto {

/**
 * ChaCha20-Poly1305 (IETF variant) authenticated encryption.
 *
 * Key: 32 bytes. Nonce: 12 bytes. Tag: 16 bytes, appended to the ciphertext.
 *
 * The nonce space is 96 bits, so random nonces are only safe when a key is
 * used for a small number of encryptions. The ratchet derives a fresh key
 * for every message and every header, and each of those keys encrypts
 * exactly once. The identity backup key is derived with a fresh salt per
 * export. Do not use this class with a long-lived key and random nonces.
 */
class Aead {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    /**
     * Fails with AuthenticationFailure on any tag mismatch. No plaintext is
     * returned in that case.
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});

    [[nodiscard]] static std::vector<uint8_t> GenerateNonce();

private:
    Aead() = delete;
};

}
