#include "vortex/protocol/ratchet_kdf.hpp"
#include "vortex/protocol/constants.hpp"
#include "vortex/crypto/hkdf.hpp"
#include "vortex/crypto/sodium_interop.hpp"
#include <array>

namespace vortex::protocol {
    using crypto::Hkdf;
    using crypto::SodiumInterop;

    namespace {
        void WipeBytes(std::vector<uint8_t>& bytes) noexcept {
            if (!bytes.empty()) {
                auto _wipe = SodiumInterop::SecureWipe(std::span(bytes));
                (void) _wipe;
            }
            bytes.clear();
        }

        std::span<const uint8_t> RatchetInfo() {
            return {reinterpret_cast<const uint8_t*>(kRatchetInfo.data()), kRatchetInfo.size()};
        }
    }

    void RootKeyStep::Wipe() noexcept {
        WipeBytes(root_key);
        WipeBytes(chain_key);
        WipeBytes(header_key);
    }

    void ChainKeyStep::Wipe() noexcept {
        WipeBytes(message_key);
        WipeBytes(next_chain_key);
    }

    Result<RootKeyStep, ProtocolFailure> RatchetKdf::DeriveRootKeys(
        std::span<const uint8_t> root_key,
        std::span<const uint8_t> dh_output) {
        if (root_key.size() != kRootKeyBytes) {
            return Result<RootKeyStep, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Root key must be " + std::to_string(kRootKeyBytes) + " bytes"));
        }
        if (dh_output.size() != kX25519SharedSecretBytes) {
            return Result<RootKeyStep, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("DH output must be " +
                                              std::to_string(kX25519SharedSecretBytes) + " bytes"));
        }

        auto okm_result = Hkdf::DeriveKeyBytes(dh_output, kRootKdfOutputBytes, root_key, RatchetInfo());
        if (okm_result.IsErr()) {
            return Result<RootKeyStep, ProtocolFailure>::Err(std::move(okm_result).UnwrapErr());
        }
        auto okm = std::move(okm_result).Unwrap();

        RootKeyStep step;
        const auto chain_begin = okm.begin() + static_cast<std::ptrdiff_t>(kRootKeyBytes);
        const auto header_begin = chain_begin + static_cast<std::ptrdiff_t>(kChainKeyBytes);
        step.root_key.assign(okm.begin(), chain_begin);
        step.chain_key.assign(chain_begin, header_begin);
        step.header_key.assign(header_begin, okm.end());
        WipeBytes(okm);
        return Result<RootKeyStep, ProtocolFailure>::Ok(std::move(step));
    }

    Result<ChainKeyStep, ProtocolFailure> RatchetKdf::DeriveChainKeys(
        std::span<const uint8_t> chain_key) {
        if (chain_key.size() != kChainKeyBytes) {
            return Result<ChainKeyStep, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Chain key must be " + std::to_string(kChainKeyBytes) + " bytes"));
        }

        constexpr std::array<uint8_t, 1> message_seed{kMessageKeySeed};
        constexpr std::array<uint8_t, 1> chain_seed{kChainKeySeed};

        auto message_key_result = Hkdf::Mac(chain_key, message_seed);
        if (message_key_result.IsErr()) {
            return Result<ChainKeyStep, ProtocolFailure>::Err(std::move(message_key_result).UnwrapErr());
        }
        auto next_chain_result = Hkdf::Mac(chain_key, chain_seed);
        if (next_chain_result.IsErr()) {
            auto message_key = std::move(message_key_result).Unwrap();
            WipeBytes(message_key);
            return Result<ChainKeyStep, ProtocolFailure>::Err(std::move(next_chain_result).UnwrapErr());
        }

        ChainKeyStep step;
        step.message_key = std::move(message_key_result).Unwrap();
        step.next_chain_key = std::move(next_chain_result).Unwrap();
        return Result<ChainKeyStep, ProtocolFailure>::Ok(std::move(step));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> RatchetKdf::DeriveX3dhSecret(
        std::span<const uint8_t> dh_concatenation) {
        if (dh_concatenation.empty() || dh_concatenation.size() % kX25519SharedSecretBytes != 0) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("X3DH input must be a whole number of DH outputs"));
        }
        const std::array<uint8_t, Hkdf::HASH_LEN> zero_salt{};
        return Hkdf::DeriveKeyBytes(dh_concatenation, kRootKeyBytes, zero_salt, RatchetInfo());
    }
}
