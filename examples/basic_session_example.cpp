/**
 * @file basic_session_example.cpp
 * @brief Two parties establish a session over the JSON wire format and exchange messages
 */

#include "vortex/crypto/sodium_interop.hpp"
#include "vortex/identity/identity_manager.hpp"
#include "vortex/protocol/double_ratchet_session.hpp"
#include "vortex/serialization/wire_codec.hpp"
#include "vortex/core/result.hpp"

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

using namespace vortex::protocol;
using namespace vortex::protocol::crypto;
using namespace vortex::protocol::identity;
using namespace vortex::protocol::serialization;

void print_hex(const std::string& label, const std::vector<uint8_t>& data) {
    std::cout << label << ": ";
    for (auto byte : data) {
        std::cout << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(byte);
    }
    std::cout << std::dec << std::endl;
}

std::vector<uint8_t> to_bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::string to_text(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

int main() {
    std::cout << "=== Vortex Protocol - Basic Session Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: "
                  << init_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Initialized successfully" << std::endl;
    std::cout << std::endl;

    std::cout << "2. Generating identities for Alice and Bob..." << std::endl;
    IdentityManager alice(IdentityConfig::Interactive());
    IdentityManager bob(IdentityConfig::Interactive());
    auto alice_summary = alice.GenerateIdentity();
    auto bob_summary = bob.GenerateIdentity();
    if (alice_summary.IsErr() || bob_summary.IsErr()) {
        std::cerr << "Failed to generate identities" << std::endl;
        return 1;
    }
    std::cout << "   ✓ Alice fingerprint: " << alice_summary.Unwrap().fingerprint << std::endl;
    std::cout << "   ✓ Bob fingerprint:   " << bob_summary.Unwrap().fingerprint << std::endl;
    std::cout << "   Bob has " << bob.UnusedOneTimePreKeyCount() << " one-time pre-keys" << std::endl;
    std::cout << std::endl;

    std::cout << "3. Bob publishes his pre-key bundle..." << std::endl;
    auto bob_bundle = bob.GetPreKeyBundle();
    if (!bob_bundle.has_value()) {
        std::cerr << "Bob has no bundle" << std::endl;
        return 1;
    }
    auto bundle_json = WireCodec::EncodePreKeyBundle(*bob_bundle);
    if (bundle_json.IsErr()) {
        std::cerr << "Failed to encode bundle: " << bundle_json.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   Bundle JSON: " << bundle_json.Unwrap() << std::endl;
    std::cout << std::endl;

    std::cout << "4. Alice verifies the bundle and starts a session..." << std::endl;
    auto received_bundle = WireCodec::DecodePreKeyBundle(bundle_json.Unwrap());
    if (received_bundle.IsErr()) {
        std::cerr << "Failed to decode bundle: " << received_bundle.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto& bundle = received_bundle.Unwrap();
    if (!bundle.signing_key.has_value() ||
        !IdentityManager::VerifyPreKeyBundle(bundle, *bundle.signing_key)) {
        std::cerr << "Bundle signature check failed" << std::endl;
        return 1;
    }
    std::cout << "   ✓ Signed pre-key signature verified" << std::endl;

    auto alice_identity = alice.GetIdentityKeyPair();
    if (alice_identity.IsErr()) {
        std::cerr << "Alice has no identity key" << std::endl;
        return 1;
    }
    DoubleRatchetSession alice_session;
    auto handshake_result = alice_session.InitializeSender(alice_identity.Unwrap(), bundle);
    if (handshake_result.IsErr()) {
        std::cerr << "X3DH failed: " << handshake_result.UnwrapErr().message << std::endl;
        return 1;
    }
    auto handshake = std::move(handshake_result).Unwrap();
    std::cout << "   ✓ Session " << alice_session.SessionId() << " ready" << std::endl;
    print_hex("   Ephemeral key", handshake.ephemeral_public_key);
    std::cout << std::endl;

    std::cout << "5. Alice sends the handshake to Bob..." << std::endl;
    models::HandshakeInit init;
    init.identity_key = alice.GetIdentityPublicKey().value();
    init.ephemeral_key = handshake.ephemeral_public_key;
    if (handshake.used_one_time_pre_key) {
        init.one_time_pre_key = bundle.one_time_pre_key;
    }
    init.signed_pre_key_id = bundle.signed_pre_key_id;
    init.registration_id = alice.RegistrationId().value();
    auto init_json = WireCodec::EncodeHandshakeInit(init);
    if (init_json.IsErr()) {
        std::cerr << "Failed to encode handshake: " << init_json.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   Handshake JSON: " << init_json.Unwrap() << std::endl;
    std::cout << std::endl;

    std::cout << "6. Bob answers the handshake..." << std::endl;
    auto received_init = WireCodec::DecodeHandshakeInit(init_json.Unwrap());
    if (received_init.IsErr()) {
        std::cerr << "Failed to decode handshake: " << received_init.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto& peer_init = received_init.Unwrap();
    std::optional<models::X25519KeyPair> bob_one_time;
    if (peer_init.one_time_pre_key.has_value()) {
        auto lookup = bob.GetOneTimePreKeyPair(*peer_init.one_time_pre_key);
        if (lookup.IsErr() || !lookup.Unwrap().has_value()) {
            std::cerr << "Unknown one-time pre-key" << std::endl;
            return 1;
        }
        bob_one_time = std::move(*std::move(lookup).Unwrap());
    }
    auto bob_identity = bob.GetIdentityKeyPair();
    auto bob_signed_pre_key = bob.GetSignedPreKeyPair();
    if (bob_identity.IsErr() || bob_signed_pre_key.IsErr()) {
        std::cerr << "Bob has no identity" << std::endl;
        return 1;
    }
    DoubleRatchetSession bob_session;
    auto receiver_result = bob_session.InitializeReceiver(
        bob_identity.Unwrap(),
        bob_signed_pre_key.Unwrap(),
        bob_one_time.has_value() ? &*bob_one_time : nullptr,
        peer_init.identity_key,
        peer_init.ephemeral_key);
    if (receiver_result.IsErr()) {
        std::cerr << "X3DH failed: " << receiver_result.UnwrapErr().message << std::endl;
        return 1;
    }
    if (peer_init.one_time_pre_key.has_value()) {
        auto marked = bob.MarkOneTimePreKeyUsed(*peer_init.one_time_pre_key);
        if (marked.IsErr()) {
            std::cerr << "Failed to consume one-time pre-key" << std::endl;
            return 1;
        }
    }
    std::cout << "   ✓ Bob session ready, " << bob.UnusedOneTimePreKeyCount()
              << " one-time pre-keys left" << std::endl;
    std::cout << std::endl;

    std::cout << "7. Alice sends three messages; the network reorders them..." << std::endl;
    std::vector<std::string> wire_messages;
    for (const std::string text : {"hello bob", "are you there?", "third message"}) {
        auto encrypted = alice_session.Encrypt(to_bytes(text));
        if (encrypted.IsErr()) {
            std::cerr << "Encrypt failed: " << encrypted.UnwrapErr().message << std::endl;
            return 1;
        }
        auto json = WireCodec::EncodeEncryptedMessage(encrypted.Unwrap());
        if (json.IsErr()) {
            std::cerr << "Encode failed: " << json.UnwrapErr().message << std::endl;
            return 1;
        }
        wire_messages.push_back(std::move(json).Unwrap());
    }
    for (size_t index : {size_t{0}, size_t{2}, size_t{1}}) {
        auto message = WireCodec::DecodeEncryptedMessage(wire_messages[index]);
        if (message.IsErr()) {
            std::cerr << "Decode failed: " << message.UnwrapErr().message << std::endl;
            return 1;
        }
        auto decrypted = bob_session.Decrypt(message.Unwrap());
        if (decrypted.IsErr()) {
            std::cerr << "Decrypt failed: " << decrypted.UnwrapErr().message << std::endl;
            return 1;
        }
        const auto& result = decrypted.Unwrap();
        std::cout << "   ✓ Bob read #" << index << ": \"" << to_text(result.plaintext) << "\"";
        if (result.event == RatchetEvent::SkippedKeyConsumed) {
            std::cout << " (from skipped-key cache)";
        }
        std::cout << std::endl;
    }
    std::cout << "   Cached skipped keys: " << bob_session.SkippedKeyCount() << std::endl;
    std::cout << std::endl;

    std::cout << "8. Bob replies, which ratchets both sides forward..." << std::endl;
    auto reply = bob_session.Encrypt(to_bytes("hi alice"));
    if (reply.IsErr()) {
        std::cerr << "Encrypt failed: " << reply.UnwrapErr().message << std::endl;
        return 1;
    }
    auto reply_plain = alice_session.Decrypt(reply.Unwrap());
    if (reply_plain.IsErr()) {
        std::cerr << "Decrypt failed: " << reply_plain.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Alice read: \"" << to_text(reply_plain.Unwrap().plaintext) << "\"" << std::endl;
    print_hex("   Alice ratchet key", alice_session.LocalRatchetPublicKey());
    print_hex("   Bob ratchet key  ", bob_session.LocalRatchetPublicKey());
    std::cout << std::endl;

    std::cout << "9. Comparing safety numbers..." << std::endl;
    auto alice_number = alice.ComputeSafetyNumber(bob.GetIdentityPublicKey().value());
    auto bob_number = bob.ComputeSafetyNumber(alice.GetIdentityPublicKey().value());
    if (alice_number.IsErr() || bob_number.IsErr()) {
        std::cerr << "Failed to compute safety numbers" << std::endl;
        return 1;
    }
    std::cout << "   Alice sees: " << alice_number.Unwrap() << std::endl;
    std::cout << "   Bob sees:   " << bob_number.Unwrap() << std::endl;
    std::cout << (alice_number.Unwrap() == bob_number.Unwrap() ? "   ✓ Match" : "   ✗ Mismatch")
              << std::endl;
    std::cout << std::endl;

    std::cout << "=== Example completed successfully ===" << std::endl;
    return 0;
}
