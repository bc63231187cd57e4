#include "vortex/crypto/aead.hpp"
#include "vortex/crypto/sodium_interop.hpp"
#include "vortex/core/constants.hpp"
#include "vortex/protocol/constants.hpp"
#include <sodium.h>

namespace vortex::protocol::crypto {

namespace {
    Result<Unit, ProtocolFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != kAeadKeyBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    "AEAD key must be " + std::to_string(kAeadKeyBytes) +
                    " bytes, got " + std::to_string(key.size())));
        }
        if (nonce.size() != kAeadNonceBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    "AEAD nonce must be " + std::to_string(kAeadNonceBytes) +
                    " bytes, got " + std::to_string(nonce.size())));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}

static_assert(kAeadKeyBytes == crypto_aead_chacha20poly1305_ietf_KEYBYTES);
static_assert(kAeadNonceBytes == crypto_aead_chacha20poly1305_ietf_NPUBBYTES);
static_assert(kAeadTagBytes == crypto_aead_chacha20poly1305_ietf_ABYTES);

Result<std::vector<uint8_t>, ProtocolFailure>
Aead::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce); check.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(check).UnwrapErr());
    }

    std::vector<uint8_t> ciphertext(plaintext.size() + kAeadTagBytes);
    unsigned long long ciphertext_len = 0;
    if (crypto_aead_chacha20poly1305_ietf_encrypt(
            ciphertext.data(), &ciphertext_len,
            plaintext.data(), plaintext.size(),
            associated_data.empty() ? nullptr : associated_data.data(), associated_data.size(),
            nullptr, nonce.data(), key.data()) != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Encode("ChaCha20-Poly1305 encryption failed"));
    }
    ciphertext.resize(static_cast<size_t>(ciphertext_len));
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(ciphertext));
}

Result<std::vector<uint8_t>, ProtocolFailure>
Aead::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce); check.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(check).UnwrapErr());
    }
    if (ciphertext_with_tag.size() < kAeadTagBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::AuthenticationFailure("Ciphertext shorter than the authentication tag"));
    }

    std::vector<uint8_t> plaintext(ciphertext_with_tag.size() - kAeadTagBytes);
    unsigned long long plaintext_len = 0;
    if (crypto_aead_chacha20poly1305_ietf_decrypt(
            plaintext.data(), &plaintext_len,
            nullptr,
            ciphertext_with_tag.data(), ciphertext_with_tag.size(),
            associated_data.empty() ? nullptr : associated_data.data(), associated_data.size(),
            nonce.data(), key.data()) != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::AuthenticationFailure(
                std::string(ErrorMessages::AEAD_AUTHENTICATION_FAILED)));
    }
    plaintext.resize(static_cast<size_t>(plaintext_len));
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(plaintext));
}

std::vector<uint8_t> Aead::GenerateNonce() {
    return SodiumInterop::GetRandomBytes(kAeadNonceBytes);
}

}
