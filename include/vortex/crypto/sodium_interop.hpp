#pragma once

#include "vortex/core/result.hpp"
#include "vortex/core/failures.hpp"
#include "vortex/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vortex::protocol::crypto {

class SecureMemoryHandle;

/**
 * @brief Interop layer for libsodium primitives
 *
 * Every curve operation, signature, hash, password hash and encoding the
 * protocol needs goes through this class. Secret outputs are either placed
 * in a SecureMemoryHandle or returned as plain buffers that the caller is
 * expected to wipe with SecureWipe once consumed.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Must be called before any other operation. Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Zero a buffer in a way the optimizer cannot elide
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Overload for temporaries that are only viewed as const
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<const uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without touching contents.
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Curve25519 / Ed25519
    // ========================================================================

    /**
     * @brief Generate an X25519 key pair
     *
     * @param key_purpose Used only to label error messages
     * @return Ok((secret_key_handle, public_key)) or Err
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief Generate an Ed25519 signing key pair
     *
     * @return Ok((secret_key_handle, public_key)) or Err. The secret key is
     *         the 64-byte libsodium seed-plus-public form.
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
    GenerateEd25519KeyPair();

    /**
     * @brief Recompute the X25519 public key for a private scalar
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveX25519PublicKey(
        std::span<const uint8_t> private_key);

    /**
     * @brief X25519 scalar multiplication
     *
     * Fails when the result is the all-zero point, which is what a
     * small-order peer key produces.
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> ComputeSharedSecret(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> peer_public_key);

    static Result<std::vector<uint8_t>, ProtocolFailure> SignDetached(
        std::span<const uint8_t> secret_key,
        std::span<const uint8_t> message);

    /**
     * @brief Ed25519 detached verification
     *
     * Malformed sizes yield false.
     */
    static bool VerifyDetached(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) noexcept;

    // ========================================================================
    // Hashing / Password hashing
    // ========================================================================

    /**
     * @brief Unkeyed BLAKE2b
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> GenericHash(
        std::span<const uint8_t> data,
        size_t output_size);

    /**
     * @brief Argon2id key derivation from a password
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveKeyFromPassword(
        std::string_view password,
        std::span<const uint8_t> salt,
        size_t output_size,
        unsigned long long ops_limit,
        size_t mem_limit);

    // ========================================================================
    // Encoding
    // ========================================================================

    /**
     * @brief URL-safe base64 without padding
     */
    static std::string ToBase64Url(std::span<const uint8_t> data);

    static Result<std::vector<uint8_t>, ProtocolFailure> FromBase64Url(std::string_view encoded);

    static std::string ToHex(std::span<const uint8_t> data);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /**
     * @brief Uniform random value in [0, upper_bound)
     */
    static uint32_t GenerateRandomUniform(uint32_t upper_bound);

    /**
     * @brief RFC 4122 version 4 UUID in canonical lowercase form
     */
    static std::string GenerateUuid();

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief sodium_malloc: guard-paged, locked, zeroed on free
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

}
