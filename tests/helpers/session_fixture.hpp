#pragma once

#include <catch2/catch_test_macros.hpp>
#include "vortex/crypto/sodium_interop.hpp"
#include "vortex/identity/identity_manager.hpp"
#include "vortex/protocol/double_ratchet_session.hpp"
#include "vortex/configuration/identity_config.hpp"
#include "vortex/configuration/ratchet_config.hpp"
#include <sodium.h>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vortex::protocol::test_helpers {
    using configuration::IdentityConfig;
    using configuration::RatchetConfig;
    using identity::IdentityManager;

    /// Small pool and the cheapest password hash so test identities are fast to build.
    inline IdentityConfig TestIdentityConfig() {
        return IdentityConfig(10, 3, 5, 16380,
                              crypto_pwhash_OPSLIMIT_INTERACTIVE,
                              crypto_pwhash_MEMLIMIT_INTERACTIVE);
    }

    inline std::vector<uint8_t> Bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    inline std::string Text(const std::vector<uint8_t>& bytes) {
        return std::string(bytes.begin(), bytes.end());
    }

    inline std::unique_ptr<IdentityManager> CreateIdentity(
        IdentityConfig config = TestIdentityConfig()) {
        REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
        auto manager = std::make_unique<IdentityManager>(config);
        REQUIRE(manager->GenerateIdentity().IsOk());
        return manager;
    }

    /// Runs the full bundle -> X3DH -> handshake flow between two identities.
    /// The responder's one-time pre-key is consumed when the bundle carries one.
    inline std::pair<std::unique_ptr<DoubleRatchetSession>, std::unique_ptr<DoubleRatchetSession>>
    EstablishSessions(
        IdentityManager& initiator_identity,
        IdentityManager& responder_identity,
        const RatchetConfig& config = RatchetConfig::Default(),
        bool use_one_time_pre_key = true) {
        auto bundle = responder_identity.GetPreKeyBundle();
        REQUIRE(bundle.has_value());
        if (!use_one_time_pre_key) {
            bundle->one_time_pre_key.reset();
            bundle->one_time_pre_key_id.reset();
        }

        auto initiator = std::make_unique<DoubleRatchetSession>(config);
        auto initiator_key = initiator_identity.GetIdentityKeyPair();
        REQUIRE(initiator_key.IsOk());
        auto handshake = initiator->InitializeSender(initiator_key.Unwrap(), *bundle);
        REQUIRE(handshake.IsOk());
        REQUIRE(handshake.Unwrap().used_one_time_pre_key == bundle->one_time_pre_key.has_value());

        std::optional<models::X25519KeyPair> one_time;
        if (bundle->one_time_pre_key.has_value()) {
            auto lookup = responder_identity.GetOneTimePreKeyPair(*bundle->one_time_pre_key);
            REQUIRE(lookup.IsOk());
            REQUIRE(lookup.Unwrap().has_value());
            one_time = std::move(*std::move(lookup).Unwrap());
        }

        auto responder = std::make_unique<DoubleRatchetSession>(config);
        auto responder_key = responder_identity.GetIdentityKeyPair();
        auto responder_signed = responder_identity.GetSignedPreKeyPair();
        REQUIRE(responder_key.IsOk());
        REQUIRE(responder_signed.IsOk());
        REQUIRE(responder->InitializeReceiver(
            responder_key.Unwrap(),
            responder_signed.Unwrap(),
            one_time.has_value() ? &*one_time : nullptr,
            initiator_key.Unwrap().GetPublicKey(),
            handshake.Unwrap().ephemeral_public_key).IsOk());

        if (bundle->one_time_pre_key.has_value()) {
            auto marked = responder_identity.MarkOneTimePreKeyUsed(*bundle->one_time_pre_key);
            REQUIRE(marked.IsOk());
            REQUIRE(marked.Unwrap());
        }
        return {std::move(initiator), std::move(responder)};
    }

    /// Two identities with an established session; alice initiated.
    struct SessionPair {
        std::unique_ptr<IdentityManager> alice_identity;
        std::unique_ptr<IdentityManager> bob_identity;
        std::unique_ptr<DoubleRatchetSession> alice;
        std::unique_ptr<DoubleRatchetSession> bob;
    };

    inline SessionPair CreateSessionPair(
        const RatchetConfig& config = RatchetConfig::Default(),
        bool use_one_time_pre_key = true) {
        SessionPair pair;
        pair.alice_identity = CreateIdentity();
        pair.bob_identity = CreateIdentity();
        auto sessions = EstablishSessions(*pair.alice_identity, *pair.bob_identity, config, use_one_time_pre_key);
        pair.alice = std::move(sessions.first);
        pair.bob = std::move(sessions.second);
        return pair;
    }

    inline models::EncryptedMessage EncryptText(DoubleRatchetSession& sender, const std::string& text) {
        auto encrypted = sender.Encrypt(Bytes(text));
        REQUIRE(encrypted.IsOk());
        return std::move(encrypted).Unwrap();
    }

    inline DoubleRatchetSession::DecryptResult Deliver(
        DoubleRatchetSession& receiver,
        const models::EncryptedMessage& message) {
        auto decrypted = receiver.Decrypt(message);
        REQUIRE(decrypted.IsOk());
        return std::move(decrypted).Unwrap();
    }

    /// Encrypts on one side and decrypts on the other, checking the plaintext survives.
    inline DoubleRatchetSession::DecryptResult Relay(
        DoubleRatchetSession& sender,
        DoubleRatchetSession& receiver,
        const std::string& text) {
        auto result = Deliver(receiver, EncryptText(sender, text));
        REQUIRE(Text(result.plaintext) == text);
        return result;
    }
}
