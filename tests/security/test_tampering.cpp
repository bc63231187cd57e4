#include <catch2/catch_test_macros.hpp>
#include "vortex/crypto/sodium_interop.hpp"
#include "vortex/models/key_materials/x25519_key_pair.hpp"
#include "helpers/session_fixture.hpp"
#include <algorithm>
#include <functional>
#include <string>
#include <vector>

using namespace vortex::protocol;
using namespace vortex::protocol::test_helpers;

namespace {
    struct Tamper {
        const char* name;
        ProtocolFailureType expected;
        std::function<void(models::EncryptedMessage&)> apply;
    };

    std::vector<Tamper> AuthenticationTampers() {
        return {
            {"header cipher bit", ProtocolFailureType::AuthenticationFailure,
             [](models::EncryptedMessage& m) { m.header_cipher[5] ^= 0x01; }},
            {"header tag bit", ProtocolFailureType::AuthenticationFailure,
             [](models::EncryptedMessage& m) { m.header_cipher.back() ^= 0x80; }},
            {"header nonce", ProtocolFailureType::AuthenticationFailure,
             [](models::EncryptedMessage& m) { m.header_nonce[0] ^= 0xff; }},
            {"body ciphertext bit", ProtocolFailureType::AuthenticationFailure,
             [](models::EncryptedMessage& m) { m.ciphertext[0] ^= 0x01; }},
            {"body tag bit", ProtocolFailureType::AuthenticationFailure,
             [](models::EncryptedMessage& m) { m.ciphertext.back() ^= 0x01; }},
            {"body nonce", ProtocolFailureType::AuthenticationFailure,
             [](models::EncryptedMessage& m) { m.nonce[11] ^= 0x10; }},
            {"routing counter", ProtocolFailureType::AuthenticationFailure,
             [](models::EncryptedMessage& m) { m.header.n += 1; }},
            {"routing previous chain length", ProtocolFailureType::AuthenticationFailure,
             [](models::EncryptedMessage& m) { m.header.pn += 1; }},
        };
    }

    std::vector<Tamper> ShapeTampers() {
        return {
            {"short header cipher", ProtocolFailureType::InvalidInput,
             [](models::EncryptedMessage& m) { m.header_cipher.pop_back(); }},
            {"long header cipher", ProtocolFailureType::InvalidInput,
             [](models::EncryptedMessage& m) { m.header_cipher.push_back(0); }},
            {"short ratchet key", ProtocolFailureType::InvalidInput,
             [](models::EncryptedMessage& m) { m.header.dh.pop_back(); }},
            {"short body nonce", ProtocolFailureType::InvalidInput,
             [](models::EncryptedMessage& m) { m.nonce.resize(8); }},
            {"short header nonce", ProtocolFailureType::InvalidInput,
             [](models::EncryptedMessage& m) { m.header_nonce.resize(24); }},
            {"ciphertext shorter than a tag", ProtocolFailureType::InvalidInput,
             [](models::EncryptedMessage& m) { m.ciphertext.resize(15); }},
            {"all-zero ratchet key", ProtocolFailureType::InvalidInput,
             [](models::EncryptedMessage& m) { std::fill(m.header.dh.begin(), m.header.dh.end(), 0); }},
        };
    }
}

TEST_CASE("Tampering - Every modification is rejected without touching state", "[security][tampering]") {
    auto pair = CreateSessionPair();
    Relay(*pair.alice, *pair.bob, "warm up");
    Relay(*pair.bob, *pair.alice, "and back");

    auto tampers = AuthenticationTampers();
    for (auto& extra : ShapeTampers()) {
        tampers.push_back(std::move(extra));
    }

    for (const auto& tamper : tampers) {
        INFO(tamper.name);
        EncryptText(*pair.alice, "not delivered");
        auto genuine = EncryptText(*pair.alice, "genuine " + std::string(tamper.name));
        const size_t skipped_before = pair.bob->SkippedKeyCount();
        const uint32_t received_before = pair.bob->ReceivingMessageNumber();
        const auto ratchet_before = pair.bob->LocalRatchetPublicKey();

        auto forged = genuine;
        tamper.apply(forged);
        auto result = pair.bob->Decrypt(forged);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == tamper.expected);

        REQUIRE(pair.bob->SkippedKeyCount() == skipped_before);
        REQUIRE(pair.bob->ReceivingMessageNumber() == received_before);
        REQUIRE(pair.bob->LocalRatchetPublicKey() == ratchet_before);

        auto delivered = Deliver(*pair.bob, genuine);
        REQUIRE(Text(delivered.plaintext) == "genuine " + std::string(tamper.name));
    }
}

TEST_CASE("Tampering - Forged message served from the skipped-key cache", "[security][tampering]") {
    auto pair = CreateSessionPair();
    auto early = EncryptText(*pair.alice, "early");
    Relay(*pair.alice, *pair.bob, "late");
    REQUIRE(pair.bob->SkippedKeyCount() == 1);

    auto forged = early;
    forged.ciphertext[2] ^= 0x04;
    auto result = pair.bob->Decrypt(forged);
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == ProtocolFailureType::AuthenticationFailure);
    REQUIRE(pair.bob->SkippedKeyCount() == 1);

    auto delivered = Deliver(*pair.bob, early);
    REQUIRE(delivered.event == RatchetEvent::SkippedKeyConsumed);
    REQUIRE(Text(delivered.plaintext) == "early");
}

TEST_CASE("Tampering - Substituted ratchet key", "[security][tampering]") {
    auto pair = CreateSessionPair();
    Relay(*pair.alice, *pair.bob, "first");
    auto genuine = EncryptText(*pair.alice, "second");

    auto attacker_key = models::X25519KeyPair::Generate("attacker");
    REQUIRE(attacker_key.IsOk());
    auto forged = genuine;
    forged.header.dh = attacker_key.Unwrap().GetPublicKey();

    const auto ratchet_before = pair.bob->LocalRatchetPublicKey();
    auto result = pair.bob->Decrypt(forged);
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == ProtocolFailureType::AuthenticationFailure);
    REQUIRE(pair.bob->LocalRatchetPublicKey() == ratchet_before);
    REQUIRE(pair.bob->SkippedKeyCount() == 0);

    REQUIRE(Text(Deliver(*pair.bob, genuine).plaintext) == "second");
}

TEST_CASE("Tampering - Spliced header from another message", "[security][tampering]") {
    auto pair = CreateSessionPair();
    auto first = EncryptText(*pair.alice, "first");
    auto second = EncryptText(*pair.alice, "second");

    // Header of message 1 with the body of message 0: the body key no longer matches.
    auto spliced = second;
    spliced.ciphertext = first.ciphertext;
    spliced.nonce = first.nonce;
    auto result = pair.bob->Decrypt(spliced);
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == ProtocolFailureType::AuthenticationFailure);

    REQUIRE(Text(Deliver(*pair.bob, first).plaintext) == "first");
    REQUIRE(Text(Deliver(*pair.bob, second).plaintext) == "second");
}

TEST_CASE("Tampering - Message for another recipient", "[security][tampering]") {
    auto alice_and_bob = CreateSessionPair();
    auto alice_and_carol = CreateSessionPair();
    Relay(*alice_and_bob.alice, *alice_and_bob.bob, "hello bob");
    Relay(*alice_and_carol.alice, *alice_and_carol.bob, "hello carol");

    auto for_bob = EncryptText(*alice_and_bob.alice, "only for bob");
    auto misdelivered = alice_and_carol.bob->Decrypt(for_bob);
    REQUIRE(misdelivered.IsErr());
    REQUIRE(alice_and_carol.bob->SkippedKeyCount() == 0);

    REQUIRE(Text(Deliver(*alice_and_bob.bob, for_bob).plaintext) == "only for bob");
    Relay(*alice_and_carol.alice, *alice_and_carol.bob, "carol is unaffected");
}

TEST_CASE("Tampering - Uninitialized session rejects everything", "[security][tampering]") {
    auto pair = CreateSessionPair();
    auto message = EncryptText(*pair.alice, "hello");

    DoubleRatchetSession fresh;
    auto result = fresh.Decrypt(message);
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == ProtocolFailureType::NotInitialized);
}
