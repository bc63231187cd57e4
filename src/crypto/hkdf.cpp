#include "vortex/crypto/hkdf.hpp"
#include "vortex/crypto/sodium_interop.hpp"
#include "vortex/core/constants.hpp"

#include <algorithm>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <array>
#include <cstddef>
#include <memory>

namespace vortex::protocol::crypto {
using OpenSSL = OpenSSLConstants;

namespace {
    struct EVP_MAC_Deleter {
        void operator()(EVP_MAC* mac) const {
            if (mac) {
                EVP_MAC_free(mac);
            }
        }
    };
    struct EVP_MAC_CTX_Deleter {
        void operator()(EVP_MAC_CTX* ctx) const {
            if (ctx) {
                EVP_MAC_CTX_free(ctx);
            }
        }
    };
    using EVP_MAC_ptr = std::unique_ptr<EVP_MAC, EVP_MAC_Deleter>;
    using EVP_MAC_CTX_ptr = std::unique_ptr<EVP_MAC_CTX, EVP_MAC_CTX_Deleter>;

    constexpr size_t kSha512Bytes = 64;

    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::Mac(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data) {
    if (key.empty()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("HMAC key cannot be empty"));
    }

    EVP_MAC_ptr mac(EVP_MAC_fetch(nullptr, OpenSSL::ALGORITHM_HMAC.data(), nullptr));
    if (!mac) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("Failed to fetch HMAC: " + GetOpenSSLError()));
    }
    EVP_MAC_CTX_ptr ctx(EVP_MAC_CTX_new(mac.get()));
    if (!ctx) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("Failed to create HMAC context: " + GetOpenSSLError()));
    }

    OSSL_PARAM params[2];
    params[0] = OSSL_PARAM_construct_utf8_string(
        OpenSSL::PARAM_DIGEST.data(), const_cast<char*>(OpenSSL::ALGORITHM_SHA512.data()), 0);
    params[1] = OSSL_PARAM_construct_end();

    if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params) != OpenSSL::SUCCESS ||
        EVP_MAC_update(ctx.get(), data.data(), data.size()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("HMAC computation failed: " + GetOpenSSLError()));
    }

    std::array<uint8_t, kSha512Bytes> full{};
    size_t full_len = 0;
    if (EVP_MAC_final(ctx.get(), full.data(), &full_len, full.size()) != OpenSSL::SUCCESS ||
        full_len != kSha512Bytes) {
        auto _wipe = SodiumInterop::SecureWipe(std::span(full));
        (void) _wipe;
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("HMAC finalization failed: " + GetOpenSSLError()));
    }

    std::vector<uint8_t> truncated(full.begin(), full.begin() + HASH_LEN);
    auto _wipe = SodiumInterop::SecureWipe(std::span(full));
    (void) _wipe;
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(truncated));
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::Extract(
    std::span<const uint8_t> ikm,
    std::span<const uint8_t> salt) {
    if (ikm.empty()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("HKDF input key material cannot be empty"));
    }
    if (salt.empty()) {
        const std::array<uint8_t, HASH_LEN> zero_salt{};
        return Mac(zero_salt, ikm);
    }
    return Mac(salt, ikm);
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::Expand(
    std::span<const uint8_t> prk,
    size_t output_size,
    std::span<const uint8_t> info) {
    if (prk.size() != HASH_LEN) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                "PRK must be exactly " + std::to_string(HASH_LEN) + " bytes"));
    }
    if (output_size == 0 || output_size > MAX_OUTPUT_LEN) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                "HKDF output size out of range: " + std::to_string(output_size)));
    }

    std::vector<uint8_t> output;
    output.reserve(output_size);
    std::vector<uint8_t> previous;
    std::vector<uint8_t> block_input;

    for (size_t counter = 1; output.size() < output_size; ++counter) {
        block_input.clear();
        block_input.insert(block_input.end(), previous.begin(), previous.end());
        block_input.insert(block_input.end(), info.begin(), info.end());
        block_input.push_back(static_cast<uint8_t>(counter));

        auto block_result = Mac(prk, block_input);
        auto _wipe_prev = SodiumInterop::SecureWipe(std::span(previous));
        (void) _wipe_prev;
        if (block_result.IsErr()) {
            auto _wipe_out = SodiumInterop::SecureWipe(std::span(output));
            (void) _wipe_out;
            return block_result;
        }
        previous = std::move(block_result).Unwrap();

        const size_t take = std::min(previous.size(), output_size - output.size());
        output.insert(output.end(), previous.begin(), previous.begin() + static_cast<std::ptrdiff_t>(take));
    }

    auto _wipe_prev = SodiumInterop::SecureWipe(std::span(previous));
    (void) _wipe_prev;
    auto _wipe_input = SodiumInterop::SecureWipe(std::span(block_input));
    (void) _wipe_input;
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {
    auto prk_result = Extract(ikm, salt);
    if (prk_result.IsErr()) {
        return prk_result;
    }
    auto prk = std::move(prk_result).Unwrap();
    auto okm_result = Expand(prk, output_size, info);
    auto _wipe = SodiumInterop::SecureWipe(std::span(prk));
    (void) _wipe;
    return okm_result;
}

}
