#pragma once

#include "vortex/core/result.hpp"
#include "vortex/core/failures.hpp"

#include <span>
#include <vector>
#include <cstdint>

namespace vortex::protocol::crypto {

/**
 * @brief HMAC and RFC 5869 HKDF over HMAC-SHA-512/256
 *
 * The MAC is HMAC-SHA-512 truncated to its first 32 bytes, which is the
 * construction libsodium exposes as crypto_auth_hmacsha512256. Both HKDF
 * phases are built from that MAC:
 *
 *   PRK  = MAC(key = salt, data = ikm)
 *   T(i) = MAC(key = PRK,  data = T(i-1) || info || i)   for i = 1..n
 *
 * The MAC itself is computed with OpenSSL's EVP_MAC interface.
 */
class Hkdf {
public:
    /**
     * @brief HMAC-SHA-512 truncated to HASH_LEN bytes
     *
     * @param key MAC key (must not be empty)
     * @param data Message to authenticate
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Mac(
        std::span<const uint8_t> key,
        std::span<const uint8_t> data);

    /**
     * @brief Extract then expand
     *
     * @param ikm Input key material
     * @param output_size Desired output size in bytes, at most MAX_OUTPUT_LEN
     * @param salt Extract salt; an empty salt is replaced by HASH_LEN zero bytes
     * @param info Context label
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Extract(
        std::span<const uint8_t> ikm,
        std::span<const uint8_t> salt = {});

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Expand(
        std::span<const uint8_t> prk,
        size_t output_size,
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

}
