#include "vortex/crypto/sodium_interop.hpp"
#include "vortex/crypto/sodium_secure_memory_handle.hpp"

#include <cstring>

namespace vortex::protocol::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= SodiumConstants::SUCCESS, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }
    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                "Buffer size " + std::to_string(buffer.size()) +
                " exceeds maximum " + std::to_string(MAX_BUFFER_SIZE)));
    }
    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<const uint8_t> buffer) {
    return SecureWipe(std::span<uint8_t>(
        const_cast<uint8_t*>(buffer.data()),
        buffer.size()));
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {
    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }
    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::ComparisonFailed(
                std::string(ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED) +
                ": " + std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    return Result<bool, SodiumFailure>::Ok(
        sodium_memcmp(a.data(), b.data(), a.size()) == 0);
}

// ============================================================================
// Curve25519 / Ed25519
// ============================================================================

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>;

    auto alloc_result = SecureMemoryHandle::Allocate(crypto_scalarmult_SCALARBYTES);
    if (alloc_result.IsErr()) {
        return KeyPairResult::Err(ProtocolFailure::FromSodiumFailure(alloc_result.UnwrapErr()));
    }
    auto sk_handle = std::move(alloc_result).Unwrap();

    auto fill_result = sk_handle.WithWriteAccess([](std::span<uint8_t> sk) {
        randombytes_buf(sk.data(), sk.size());
        return unit;
    });
    if (fill_result.IsErr()) {
        return KeyPairResult::Err(ProtocolFailure::FromSodiumFailure(fill_result.UnwrapErr()));
    }

    std::vector<uint8_t> pk_bytes(crypto_scalarmult_BYTES);
    auto derive_result = sk_handle.WithReadAccess([&pk_bytes](std::span<const uint8_t> sk) {
        return crypto_scalarmult_base(pk_bytes.data(), sk.data());
    });
    if (derive_result.IsErr()) {
        return KeyPairResult::Err(ProtocolFailure::FromSodiumFailure(derive_result.UnwrapErr()));
    }
    if (derive_result.Unwrap() != SodiumConstants::SUCCESS) {
        return KeyPairResult::Err(ProtocolFailure::KeyGeneration(
            "Failed to derive " + std::string(key_purpose) + " public key"));
    }

    return KeyPairResult::Ok(std::make_pair(std::move(sk_handle), std::move(pk_bytes)));
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
SodiumInterop::GenerateEd25519KeyPair() {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>;

    auto alloc_result = SecureMemoryHandle::Allocate(crypto_sign_SECRETKEYBYTES);
    if (alloc_result.IsErr()) {
        return KeyPairResult::Err(ProtocolFailure::FromSodiumFailure(alloc_result.UnwrapErr()));
    }
    auto sk_handle = std::move(alloc_result).Unwrap();

    std::vector<uint8_t> pk_bytes(crypto_sign_PUBLICKEYBYTES);
    auto keypair_result = sk_handle.WithWriteAccess([&pk_bytes](std::span<uint8_t> sk) {
        return crypto_sign_keypair(pk_bytes.data(), sk.data());
    });
    if (keypair_result.IsErr()) {
        return KeyPairResult::Err(ProtocolFailure::FromSodiumFailure(keypair_result.UnwrapErr()));
    }
    if (keypair_result.Unwrap() != SodiumConstants::SUCCESS) {
        return KeyPairResult::Err(ProtocolFailure::KeyGeneration(
            "Failed to generate Ed25519 key pair"));
    }

    return KeyPairResult::Ok(std::make_pair(std::move(sk_handle), std::move(pk_bytes)));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::DeriveX25519PublicKey(
    std::span<const uint8_t> private_key) {
    if (private_key.size() != crypto_scalarmult_SCALARBYTES) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                "X25519 private key must be " + std::to_string(crypto_scalarmult_SCALARBYTES) +
                " bytes, got " + std::to_string(private_key.size())));
    }
    std::vector<uint8_t> public_key(crypto_scalarmult_BYTES);
    if (crypto_scalarmult_base(public_key.data(), private_key.data()) != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("Failed to derive X25519 public key"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(public_key));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::ComputeSharedSecret(
    std::span<const uint8_t> private_key,
    std::span<const uint8_t> peer_public_key) {
    if (private_key.size() != crypto_scalarmult_SCALARBYTES ||
        peer_public_key.size() != crypto_scalarmult_BYTES) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                "X25519 operands must be " + std::to_string(crypto_scalarmult_BYTES) + " bytes"));
    }
    std::vector<uint8_t> shared(crypto_scalarmult_BYTES);
    if (crypto_scalarmult(shared.data(), private_key.data(), peer_public_key.data()) !=
        SodiumConstants::SUCCESS) {
        auto _wipe = SecureWipe(std::span(shared));
        (void) _wipe;
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("X25519 produced a degenerate shared secret"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(shared));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::SignDetached(
    std::span<const uint8_t> secret_key,
    std::span<const uint8_t> message) {
    if (secret_key.size() != crypto_sign_SECRETKEYBYTES) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                "Ed25519 secret key must be " + std::to_string(crypto_sign_SECRETKEYBYTES) + " bytes"));
    }
    std::vector<uint8_t> signature(crypto_sign_BYTES);
    unsigned long long signature_len = 0;
    if (crypto_sign_detached(signature.data(), &signature_len, message.data(), message.size(),
                             secret_key.data()) != SodiumConstants::SUCCESS ||
        signature_len != crypto_sign_BYTES) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic("Ed25519 signing failed"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(signature));
}

bool SodiumInterop::VerifyDetached(
    std::span<const uint8_t> public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) noexcept {
    if (!IsInitialized() ||
        public_key.size() != crypto_sign_PUBLICKEYBYTES ||
        signature.size() != crypto_sign_BYTES) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(), message.data(), message.size(),
                                       public_key.data()) == SodiumConstants::SUCCESS;
}

// ============================================================================
// Hashing / Password hashing
// ============================================================================

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::GenericHash(
    std::span<const uint8_t> data,
    size_t output_size) {
    if (output_size < crypto_generichash_BYTES_MIN || output_size > crypto_generichash_BYTES_MAX) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                "BLAKE2b output size out of range: " + std::to_string(output_size)));
    }
    std::vector<uint8_t> digest(output_size);
    if (crypto_generichash(digest.data(), digest.size(), data.data(), data.size(),
                           nullptr, 0) != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic("BLAKE2b hashing failed"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(digest));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::DeriveKeyFromPassword(
    std::string_view password,
    std::span<const uint8_t> salt,
    size_t output_size,
    unsigned long long ops_limit,
    size_t mem_limit) {
    if (salt.size() != crypto_pwhash_SALTBYTES) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                "Password salt must be " + std::to_string(crypto_pwhash_SALTBYTES) + " bytes"));
    }
    std::vector<uint8_t> key(output_size);
    if (crypto_pwhash(key.data(), key.size(), password.data(), password.size(), salt.data(),
                      ops_limit, mem_limit, crypto_pwhash_ALG_ARGON2ID13) != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("Argon2id key derivation failed (out of memory?)"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(key));
}

// ============================================================================
// Encoding
// ============================================================================

std::string SodiumInterop::ToBase64Url(std::span<const uint8_t> data) {
    constexpr int variant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
    std::string encoded(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), variant);
    encoded.resize(std::strlen(encoded.c_str()));
    return encoded;
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::FromBase64Url(std::string_view encoded) {
    std::vector<uint8_t> decoded(encoded.size() * 3 / 4 + 1);
    size_t decoded_len = 0;
    if (sodium_base642bin(decoded.data(), decoded.size(), encoded.data(), encoded.size(),
                          nullptr, &decoded_len, nullptr,
                          sodium_base64_VARIANT_URLSAFE_NO_PADDING) != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Decode("Invalid base64url field"));
    }
    decoded.resize(decoded_len);
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(decoded));
}

std::string SodiumInterop::ToHex(std::span<const uint8_t> data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.pop_back();
    return hex;
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

uint32_t SodiumInterop::GenerateRandomUniform(uint32_t upper_bound) {
    return randombytes_uniform(upper_bound);
}

std::string SodiumInterop::GenerateUuid() {
    auto bytes = GetRandomBytes(Constants::UUID_BYTES);
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
    const std::string hex = ToHex(bytes);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

}
