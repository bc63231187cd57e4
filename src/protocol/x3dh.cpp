#include "vortex/protocol/x3dh.hpp"
#include "vortex/protocol/ratchet_kdf.hpp"
#include "vortex/protocol/constants.hpp"
#include "vortex/crypto/sodium_interop.hpp"
#include "vortex/security/dh_validator.hpp"

namespace vortex::protocol {
    using crypto::SodiumInterop;
    using models::X25519KeyPair;
    using security::DhValidator;

    namespace {
        void WipeBytes(std::vector<uint8_t>& bytes) {
            if (!bytes.empty()) {
                auto _wipe = SodiumInterop::SecureWipe(std::span(bytes));
                (void) _wipe;
            }
            bytes.clear();
        }

        Result<Unit, ProtocolFailure> AppendAgreement(
            std::vector<uint8_t>& dh_concat,
            const X25519KeyPair& local,
            std::span<const uint8_t> remote_public,
            const char* label) {
            auto dh_result = local.Agree(remote_public);
            if (dh_result.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::DeriveKey(std::string(label) + " failed: " + dh_result.UnwrapErr().message));
            }
            auto dh = std::move(dh_result).Unwrap();
            dh_concat.insert(dh_concat.end(), dh.begin(), dh.end());
            WipeBytes(dh);
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<Unit, ProtocolFailure> ValidatePeerKey(
            std::span<const uint8_t> public_key,
            const char* name) {
            auto result = DhValidator::ValidateX25519PublicKey(public_key);
            if (result.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput(std::string(name) + ": " + result.UnwrapErr().message));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<std::vector<uint8_t>, ProtocolFailure> FinishAgreement(std::vector<uint8_t>& dh_concat) {
            auto secret_result = RatchetKdf::DeriveX3dhSecret(dh_concat);
            WipeBytes(dh_concat);
            return secret_result;
        }
    }

    Result<X3dhInitiatorOutput, ProtocolFailure> X3dh::AgreeAsInitiator(
        const X25519KeyPair& local_identity,
        const models::PreKeyBundle& remote_bundle) {
        if (auto check = ValidatePeerKey(remote_bundle.identity_key, "Remote identity key"); check.IsErr()) {
            return Result<X3dhInitiatorOutput, ProtocolFailure>::Err(std::move(check).UnwrapErr());
        }
        if (auto check = ValidatePeerKey(remote_bundle.signed_pre_key, "Remote signed pre-key"); check.IsErr()) {
            return Result<X3dhInitiatorOutput, ProtocolFailure>::Err(std::move(check).UnwrapErr());
        }
        if (remote_bundle.one_time_pre_key.has_value()) {
            if (auto check = ValidatePeerKey(*remote_bundle.one_time_pre_key, "Remote one-time pre-key");
                check.IsErr()) {
                return Result<X3dhInitiatorOutput, ProtocolFailure>::Err(std::move(check).UnwrapErr());
            }
        }

        auto ephemeral_result = X25519KeyPair::Generate("X3DH ephemeral");
        if (ephemeral_result.IsErr()) {
            return Result<X3dhInitiatorOutput, ProtocolFailure>::Err(std::move(ephemeral_result).UnwrapErr());
        }
        auto ephemeral = std::move(ephemeral_result).Unwrap();

        std::vector<uint8_t> dh_concat;
        dh_concat.reserve(4 * kX25519SharedSecretBytes);
        auto dh = AppendAgreement(dh_concat, local_identity, remote_bundle.signed_pre_key, "DH1");
        if (dh.IsOk()) {
            dh = AppendAgreement(dh_concat, ephemeral, remote_bundle.identity_key, "DH2");
        }
        if (dh.IsOk()) {
            dh = AppendAgreement(dh_concat, ephemeral, remote_bundle.signed_pre_key, "DH3");
        }
        if (dh.IsOk() && remote_bundle.one_time_pre_key.has_value()) {
            dh = AppendAgreement(dh_concat, ephemeral, *remote_bundle.one_time_pre_key, "DH4");
        }
        if (dh.IsErr()) {
            WipeBytes(dh_concat);
            return Result<X3dhInitiatorOutput, ProtocolFailure>::Err(std::move(dh).UnwrapErr());
        }

        auto secret_result = FinishAgreement(dh_concat);
        if (secret_result.IsErr()) {
            return Result<X3dhInitiatorOutput, ProtocolFailure>::Err(std::move(secret_result).UnwrapErr());
        }
        return Result<X3dhInitiatorOutput, ProtocolFailure>::Ok(X3dhInitiatorOutput{
            std::move(secret_result).Unwrap(),
            std::move(ephemeral),
            remote_bundle.one_time_pre_key.has_value()
        });
    }

    Result<std::vector<uint8_t>, ProtocolFailure> X3dh::AgreeAsResponder(
        const X25519KeyPair& local_identity,
        const X25519KeyPair& local_signed_pre_key,
        const X25519KeyPair* local_one_time_pre_key,
        std::span<const uint8_t> remote_identity_key,
        std::span<const uint8_t> remote_ephemeral_key) {
        if (auto check = ValidatePeerKey(remote_identity_key, "Remote identity key"); check.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(check).UnwrapErr());
        }
        if (auto check = ValidatePeerKey(remote_ephemeral_key, "Remote ephemeral key"); check.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(check).UnwrapErr());
        }

        std::vector<uint8_t> dh_concat;
        dh_concat.reserve(4 * kX25519SharedSecretBytes);
        auto dh = AppendAgreement(dh_concat, local_signed_pre_key, remote_identity_key, "DH1");
        if (dh.IsOk()) {
            dh = AppendAgreement(dh_concat, local_identity, remote_ephemeral_key, "DH2");
        }
        if (dh.IsOk()) {
            dh = AppendAgreement(dh_concat, local_signed_pre_key, remote_ephemeral_key, "DH3");
        }
        if (dh.IsOk() && local_one_time_pre_key != nullptr) {
            dh = AppendAgreement(dh_concat, *local_one_time_pre_key, remote_ephemeral_key, "DH4");
        }
        if (dh.IsErr()) {
            WipeBytes(dh_concat);
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(dh).UnwrapErr());
        }
        return FinishAgreement(dh_concat);
    }
}
