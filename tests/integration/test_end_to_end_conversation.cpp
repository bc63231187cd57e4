#include <catch2/catch_test_macros.hpp>
#include "vortex/serialization/wire_codec.hpp"
#include "vortex/crypto/sodium_interop.hpp"
#include "helpers/session_fixture.hpp"
#include <algorithm>
#include <map>
#include <random>
#include <string>
#include <variant>
#include <vector>

using namespace vortex::protocol;
using namespace vortex::protocol::serialization;
using namespace vortex::protocol::test_helpers;

namespace {
    /// Everything crosses the transport as envelope JSON.
    std::string Send(DoubleRatchetSession& sender, const std::string& text) {
        auto json = WireCodec::EncodeEnvelope(WireMessage(EncryptText(sender, text)));
        REQUIRE(json.IsOk());
        return std::move(json).Unwrap();
    }

    std::string Receive(DoubleRatchetSession& receiver, const std::string& json) {
        auto envelope = WireCodec::DecodeEnvelope(json);
        REQUIRE(envelope.IsOk());
        REQUIRE(WireCodec::KindOf(envelope.Unwrap()) == WireMessageKind::EncryptedMessage);
        return Text(Deliver(receiver, std::get<models::EncryptedMessage>(envelope.Unwrap())).plaintext);
    }

    /// Bundle and handshake exchanged as JSON, the responder answering from
    /// nothing but what arrived on the wire.
    std::pair<std::unique_ptr<DoubleRatchetSession>, std::unique_ptr<DoubleRatchetSession>>
    HandshakeOverWire(IdentityManager& initiator, IdentityManager& responder, bool offer_one_time_pre_key) {
        auto bundle = responder.GetPreKeyBundle();
        REQUIRE(bundle.has_value());
        if (!offer_one_time_pre_key) {
            bundle->one_time_pre_key.reset();
            bundle->one_time_pre_key_id.reset();
        }
        auto bundle_json = WireCodec::EncodeEnvelope(WireMessage(*bundle)).Unwrap();

        auto received = WireCodec::DecodeEnvelope(bundle_json);
        REQUIRE(received.IsOk());
        auto& received_bundle = std::get<models::PreKeyBundle>(received.Unwrap());
        REQUIRE(received_bundle.signing_key.has_value());
        REQUIRE(IdentityManager::VerifyPreKeyBundle(received_bundle, *received_bundle.signing_key));

        auto initiator_session = std::make_unique<DoubleRatchetSession>();
        auto handshake = initiator_session->InitializeSender(
            initiator.GetIdentityKeyPair().Unwrap(), received_bundle);
        REQUIRE(handshake.IsOk());

        models::HandshakeInit init;
        init.identity_key = initiator.GetIdentityPublicKey().value();
        init.ephemeral_key = handshake.Unwrap().ephemeral_public_key;
        if (handshake.Unwrap().used_one_time_pre_key) {
            init.one_time_pre_key = received_bundle.one_time_pre_key;
        }
        init.signed_pre_key_id = received_bundle.signed_pre_key_id;
        init.registration_id = initiator.RegistrationId().value();
        auto init_json = WireCodec::EncodeEnvelope(WireMessage(init)).Unwrap();

        auto received_init = WireCodec::DecodeEnvelope(init_json);
        REQUIRE(received_init.IsOk());
        const auto& peer = std::get<models::HandshakeInit>(received_init.Unwrap());
        REQUIRE(peer.signed_pre_key_id == responder.SignedPreKeyId());

        std::optional<models::X25519KeyPair> one_time;
        if (peer.one_time_pre_key.has_value()) {
            auto lookup = responder.GetOneTimePreKeyPair(*peer.one_time_pre_key);
            REQUIRE(lookup.IsOk());
            REQUIRE(lookup.Unwrap().has_value());
            one_time = std::move(*std::move(lookup).Unwrap());
        }
        auto responder_session = std::make_unique<DoubleRatchetSession>();
        REQUIRE(responder_session->InitializeReceiver(
            responder.GetIdentityKeyPair().Unwrap(),
            responder.GetSignedPreKeyPair().Unwrap(),
            one_time.has_value() ? &*one_time : nullptr,
            peer.identity_key,
            peer.ephemeral_key).IsOk());
        if (peer.one_time_pre_key.has_value()) {
            REQUIRE(responder.MarkOneTimePreKeyUsed(*peer.one_time_pre_key).Unwrap());
        }
        return {std::move(initiator_session), std::move(responder_session)};
    }
}

TEST_CASE("End-to-end - Conversation over the JSON wire", "[integration]") {
    auto alice_identity = CreateIdentity();
    auto bob_identity = CreateIdentity();
    const size_t bob_unused = bob_identity->UnusedOneTimePreKeyCount();

    auto [alice, bob] = HandshakeOverWire(*alice_identity, *bob_identity, true);
    REQUIRE(bob_identity->UnusedOneTimePreKeyCount() == bob_unused - 1);

    REQUIRE(Receive(*bob, Send(*alice, "hi bob")) == "hi bob");
    REQUIRE(Receive(*alice, Send(*bob, "hi alice")) == "hi alice");

    for (int round = 0; round < 10; ++round) {
        const int burst = round % 3 + 1;
        for (int i = 0; i < burst; ++i) {
            const std::string text = "alice " + std::to_string(round) + "." + std::to_string(i);
            REQUIRE(Receive(*bob, Send(*alice, text)) == text);
        }
        const std::string reply = "bob " + std::to_string(round);
        REQUIRE(Receive(*alice, Send(*bob, reply)) == reply);
    }
    REQUIRE(alice->SkippedKeyCount() == 0);
    REQUIRE(bob->SkippedKeyCount() == 0);

    auto alice_number = alice_identity->ComputeSafetyNumber(bob_identity->GetIdentityPublicKey().value());
    auto bob_number = bob_identity->ComputeSafetyNumber(alice_identity->GetIdentityPublicKey().value());
    REQUIRE(alice_number.Unwrap() == bob_number.Unwrap());
}

TEST_CASE("End-to-end - Handshake without a one-time pre-key", "[integration]") {
    auto alice_identity = CreateIdentity();
    auto bob_identity = CreateIdentity();
    const size_t bob_unused = bob_identity->UnusedOneTimePreKeyCount();

    auto [alice, bob] = HandshakeOverWire(*alice_identity, *bob_identity, false);
    REQUIRE(bob_identity->UnusedOneTimePreKeyCount() == bob_unused);
    REQUIRE(Receive(*bob, Send(*alice, "no one-time key")) == "no one-time key");
    REQUIRE(Receive(*alice, Send(*bob, "still works")) == "still works");
}

TEST_CASE("End-to-end - Shuffled delivery", "[integration]") {
    auto alice_identity = CreateIdentity();
    auto bob_identity = CreateIdentity();
    auto [alice, bob] = HandshakeOverWire(*alice_identity, *bob_identity, true);

    std::vector<std::pair<std::string, std::string>> in_flight;
    for (int i = 0; i < 25; ++i) {
        const std::string text = "message " + std::to_string(i);
        in_flight.emplace_back(text, Send(*alice, text));
    }
    std::mt19937 rng(20240601);
    std::shuffle(in_flight.begin(), in_flight.end(), rng);

    for (const auto& [text, json] : in_flight) {
        REQUIRE(Receive(*bob, json) == text);
    }
    REQUIRE(bob->SkippedKeyCount() == 0);
    REQUIRE(Receive(*alice, Send(*bob, "got them all")) == "got them all");
}

TEST_CASE("End-to-end - Delayed messages across ratchet steps", "[integration]") {
    auto pair = CreateSessionPair();
    auto& alice = *pair.alice;
    auto& bob = *pair.bob;

    Relay(alice, bob, "start");
    const auto delayed_first = Send(alice, "delayed from chain one");
    Relay(alice, bob, "chain one continues");
    Relay(bob, alice, "bob turns the ratchet");

    const auto delayed_second = Send(alice, "delayed from chain two");
    Relay(alice, bob, "chain two continues");
    Relay(bob, alice, "another turn");
    REQUIRE(bob.SkippedKeyCount() == 2);

    REQUIRE(Receive(bob, delayed_second) == "delayed from chain two");
    REQUIRE(Receive(bob, delayed_first) == "delayed from chain one");
    REQUIRE(bob.SkippedKeyCount() == 0);
}

TEST_CASE("End-to-end - One identity talking to several peers", "[integration]") {
    auto bob_identity = CreateIdentity();
    std::vector<std::unique_ptr<IdentityManager>> peers;
    std::vector<std::pair<std::unique_ptr<DoubleRatchetSession>, std::unique_ptr<DoubleRatchetSession>>> sessions;

    // More peers than the initial pool forces a replenishment mid-way.
    const size_t peer_count = bob_identity->Config().GetInitialOneTimePreKeys() + 2;
    std::vector<std::vector<uint8_t>> offered_keys;
    for (size_t i = 0; i < peer_count; ++i) {
        offered_keys.push_back(*bob_identity->GetPreKeyBundle()->one_time_pre_key);
        peers.push_back(CreateIdentity());
        sessions.push_back(EstablishSessions(*peers.back(), *bob_identity));
    }
    std::sort(offered_keys.begin(), offered_keys.end());
    REQUIRE(std::adjacent_find(offered_keys.begin(), offered_keys.end()) == offered_keys.end());

    std::map<std::string, size_t> session_ids;
    for (size_t i = 0; i < peer_count; ++i) {
        auto& [peer_session, bob_session] = sessions[i];
        session_ids[bob_session->SessionId()] = i;
        const std::string text = "from peer " + std::to_string(i);
        REQUIRE(Receive(*bob_session, Send(*peer_session, text)) == text);
    }
    REQUIRE(session_ids.size() == peer_count);

    // A message for one peer's session is useless in another's.
    auto stray = EncryptText(*sessions[0].first, "for bob via peer 0");
    REQUIRE(sessions[1].second->Decrypt(stray).IsErr());
    REQUIRE(Text(Deliver(*sessions[0].second, stray).plaintext) == "for bob via peer 0");
}

TEST_CASE("End-to-end - Persisting both sides mid-conversation", "[integration]") {
    auto pair = CreateSessionPair();
    Relay(*pair.alice, *pair.bob, "before save 1");
    Relay(*pair.bob, *pair.alice, "before save 2");
    const auto in_flight = Send(*pair.alice, "sent before save");
    Relay(*pair.alice, *pair.bob, "overtakes the in-flight message");

    auto alice_json = pair.alice->ExportState();
    auto bob_json = pair.bob->ExportState();
    REQUIRE(alice_json.IsOk());
    REQUIRE(bob_json.IsOk());
    pair.alice.reset();
    pair.bob.reset();

    DoubleRatchetSession alice;
    DoubleRatchetSession bob;
    REQUIRE(alice.ImportState(alice_json.Unwrap()).IsOk());
    REQUIRE(bob.ImportState(bob_json.Unwrap()).IsOk());
    REQUIRE(bob.SkippedKeyCount() == 1);

    REQUIRE(Receive(bob, in_flight) == "sent before save");
    Relay(bob, alice, "after restore");
    Relay(alice, bob, "and back");

    // The identities themselves move to a new device through an encrypted backup.
    auto backup = pair.bob_identity->ExportIdentity("correct horse battery staple");
    REQUIRE(backup.IsOk());
    IdentityManager restored_identity(TestIdentityConfig());
    REQUIRE(restored_identity.ImportIdentity(backup.Unwrap(), "correct horse battery staple").IsOk());
    REQUIRE(restored_identity.GetFingerprint() == pair.bob_identity->GetFingerprint());

    auto fresh = EstablishSessions(*pair.alice_identity, restored_identity);
    Relay(*fresh.first, *fresh.second, "new session with restored identity");
}
