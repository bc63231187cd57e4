#include <catch2/catch_test_macros.hpp>
#include "vortex/identity/identity_manager.hpp"
#include "vortex/crypto/sodium_interop.hpp"
#include "vortex/protocol/constants.hpp"
#include "helpers/session_fixture.hpp"
#include <cctype>
#include <limits>
#include <set>
#include <string>

using namespace vortex::protocol;
using namespace vortex::protocol::identity;
using namespace vortex::protocol::test_helpers;

namespace {
    bool IsGroupedString(const std::string& text, size_t groups, size_t width, bool digits_only) {
        if (text.size() != groups * width + (groups - 1)) {
            return false;
        }
        for (size_t i = 0; i < text.size(); ++i) {
            if (i % (width + 1) == width) {
                if (text[i] != ' ') {
                    return false;
                }
            } else if (digits_only ? !std::isdigit(static_cast<unsigned char>(text[i]))
                                   : !std::isxdigit(static_cast<unsigned char>(text[i]))) {
                return false;
            }
        }
        return true;
    }
}

TEST_CASE("IdentityManager - Generate identity", "[identity]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    IdentityManager manager(TestIdentityConfig());

    SECTION("Fresh manager has no identity") {
        REQUIRE_FALSE(manager.IsInitialized());
        REQUIRE_FALSE(manager.GetPreKeyBundle().has_value());
        REQUIRE(manager.GetFingerprint().empty());
        REQUIRE_FALSE(manager.RegistrationId().has_value());
        REQUIRE(manager.UnusedOneTimePreKeyCount() == 0);
        auto pair = manager.GetIdentityKeyPair();
        REQUIRE(pair.IsErr());
        REQUIRE(pair.UnwrapErr().type == ProtocolFailureType::NotInitialized);
        REQUIRE(manager.RotateSignedPreKey().IsErr());
        REQUIRE(manager.ExportIdentity("pw").IsErr());
    }
    SECTION("Summary describes the new identity") {
        auto summary_result = manager.GenerateIdentity();
        REQUIRE(summary_result.IsOk());
        const auto& summary = summary_result.Unwrap();
        REQUIRE(summary.identity_public_key.size() == kX25519PublicKeyBytes);
        REQUIRE(summary.signing_public_key.size() == kEd25519PublicKeyBytes);
        REQUIRE(summary.registration_id >= 1);
        REQUIRE(summary.registration_id <= 16380);
        REQUIRE(summary.signed_pre_key_id == 1);
        REQUIRE(summary.one_time_pre_key_count == 10);
        REQUIRE(summary.created_at > 0);
        REQUIRE(IsGroupedString(summary.fingerprint, 8, 4, false));

        REQUIRE(manager.IsInitialized());
        REQUIRE(manager.GetFingerprint() == summary.fingerprint);
        REQUIRE(manager.RegistrationId() == summary.registration_id);
        REQUIRE(manager.GetIdentityPublicKey() == summary.identity_public_key);
        REQUIRE(manager.UnusedOneTimePreKeyCount() == 10);
    }
    SECTION("Generating again replaces the identity") {
        auto first = manager.GenerateIdentity().Unwrap();
        auto second = manager.GenerateIdentity().Unwrap();
        REQUIRE(first.identity_public_key != second.identity_public_key);
        REQUIRE(manager.GetIdentityPublicKey() == second.identity_public_key);
    }
    SECTION("Identity key pair accessor returns a usable copy") {
        auto summary = manager.GenerateIdentity().Unwrap();
        auto pair = manager.GetIdentityKeyPair();
        REQUIRE(pair.IsOk());
        REQUIRE(pair.Unwrap().GetPublicKey() == summary.identity_public_key);
        auto derived = crypto::SodiumInterop::DeriveX25519PublicKey(pair.Unwrap().ReadPrivateKeyCopy().Unwrap());
        REQUIRE(derived.Unwrap() == summary.identity_public_key);
    }
    SECTION("Invalid configuration is refused") {
        IdentityManager broken(IdentityConfig(10, 3, 0, 100, crypto_pwhash_OPSLIMIT_INTERACTIVE,
                                              crypto_pwhash_MEMLIMIT_INTERACTIVE));
        auto result = broken.GenerateIdentity();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}

TEST_CASE("IdentityManager - Pre-key bundle", "[identity][bundle]") {
    auto manager = CreateIdentity();

    SECTION("Bundle carries the current public material") {
        auto bundle = manager->GetPreKeyBundle();
        REQUIRE(bundle.has_value());
        REQUIRE(bundle->identity_key == manager->GetIdentityPublicKey().value());
        REQUIRE(bundle->signed_pre_key.size() == kX25519PublicKeyBytes);
        REQUIRE(bundle->signed_pre_key_signature.size() == kEd25519SignatureBytes);
        REQUIRE(bundle->registration_id == manager->RegistrationId().value());
        REQUIRE(bundle->signing_key == manager->GetSigningPublicKey());
        REQUIRE(bundle->signed_pre_key_id == 1u);
        REQUIRE(bundle->one_time_pre_key.has_value());
        REQUIRE(bundle->one_time_pre_key_id == 1u);
    }
    SECTION("Signed pre-key signature verifies") {
        auto bundle = manager->GetPreKeyBundle().value();
        REQUIRE(IdentityManager::VerifyPreKeyBundle(bundle, manager->GetSigningPublicKey().value()));
    }
    SECTION("Tampered or mismatched bundles fail verification") {
        auto bundle = manager->GetPreKeyBundle().value();
        const auto signing_key = manager->GetSigningPublicKey().value();

        auto tampered = bundle;
        tampered.signed_pre_key[0] ^= 0x01;
        REQUIRE_FALSE(IdentityManager::VerifyPreKeyBundle(tampered, signing_key));

        auto other = CreateIdentity();
        REQUIRE_FALSE(IdentityManager::VerifyPreKeyBundle(bundle, other->GetSigningPublicKey().value()));

        auto truncated = bundle;
        truncated.signed_pre_key_signature.resize(10);
        REQUIRE_FALSE(IdentityManager::VerifyPreKeyBundle(truncated, signing_key));
        REQUIRE_FALSE(IdentityManager::VerifyPreKeyBundle(bundle, std::vector<uint8_t>(5, 0)));
    }
}

TEST_CASE("IdentityManager - One-time pre-key lifecycle", "[identity][prekeys]") {
    auto manager = CreateIdentity();

    SECTION("Unknown key is reported as not ours") {
        auto stranger = models::X25519KeyPair::Generate("stranger").Unwrap();
        auto result = manager->MarkOneTimePreKeyUsed(stranger.GetPublicKey());
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.Unwrap());
        REQUIRE(manager->UnusedOneTimePreKeyCount() == 10);
    }
    SECTION("Used key is never issued again") {
        auto first = manager->GetPreKeyBundle().value();
        REQUIRE(manager->MarkOneTimePreKeyUsed(*first.one_time_pre_key).Unwrap());
        REQUIRE(manager->UnusedOneTimePreKeyCount() == 9);

        auto second = manager->GetPreKeyBundle().value();
        REQUIRE(second.one_time_pre_key != first.one_time_pre_key);
        REQUIRE(second.one_time_pre_key_id == 2u);

        auto lookup = manager->GetOneTimePreKeyPair(*first.one_time_pre_key);
        REQUIRE(lookup.IsOk());
        REQUIRE_FALSE(lookup.Unwrap().has_value());
    }
    SECTION("Private half of an unused key is available") {
        auto bundle = manager->GetPreKeyBundle().value();
        auto lookup = manager->GetOneTimePreKeyPair(*bundle.one_time_pre_key);
        REQUIRE(lookup.IsOk());
        REQUIRE(lookup.Unwrap().has_value());
        REQUIRE(lookup.Unwrap()->GetPublicKey() == *bundle.one_time_pre_key);
    }
    SECTION("Pool is replenished below the low-water mark") {
        std::set<uint32_t> issued_ids;
        for (int i = 0; i < 7; ++i) {
            auto bundle = manager->GetPreKeyBundle().value();
            issued_ids.insert(bundle.one_time_pre_key_id.value());
            REQUIRE(manager->MarkOneTimePreKeyUsed(*bundle.one_time_pre_key).Unwrap());
        }
        REQUIRE(manager->UnusedOneTimePreKeyCount() == 3);

        auto bundle = manager->GetPreKeyBundle().value();
        REQUIRE(manager->MarkOneTimePreKeyUsed(*bundle.one_time_pre_key).Unwrap());
        REQUIRE(manager->UnusedOneTimePreKeyCount() == 2 + 5);

        for (int i = 0; i < 7; ++i) {
            auto next = manager->GetPreKeyBundle().value();
            REQUIRE(issued_ids.insert(next.one_time_pre_key_id.value()).second);
            REQUIRE(manager->MarkOneTimePreKeyUsed(*next.one_time_pre_key).Unwrap());
        }
        REQUIRE(issued_ids.count(15) == 1);
    }
    SECTION("Id overflow is refused") {
        auto result = IdentityManager::GenerateOneTimePreKeys(2, std::numeric_limits<uint32_t>::max());
        REQUIRE(result.IsErr());
        REQUIRE(IdentityManager::GenerateOneTimePreKeys(1, std::numeric_limits<uint32_t>::max()).IsOk());
        REQUIRE(IdentityManager::GenerateOneTimePreKeys(0, 1).Unwrap().empty());
    }
}

TEST_CASE("IdentityManager - Signed pre-key rotation", "[identity][prekeys]") {
    auto manager = CreateIdentity();
    const auto before = manager->GetPreKeyBundle().value();

    auto rotated = manager->RotateSignedPreKey();
    REQUIRE(rotated.IsOk());
    REQUIRE(rotated.Unwrap() == 2);
    REQUIRE(manager->SignedPreKeyId() == 2u);

    const auto after = manager->GetPreKeyBundle().value();
    REQUIRE(after.signed_pre_key != before.signed_pre_key);
    REQUIRE(after.signed_pre_key_id == 2u);
    REQUIRE(after.identity_key == before.identity_key);
    REQUIRE(IdentityManager::VerifyPreKeyBundle(after, manager->GetSigningPublicKey().value()));

    auto signed_pair = manager->GetSignedPreKeyPair();
    REQUIRE(signed_pair.IsOk());
    REQUIRE(signed_pair.Unwrap().GetPublicKey() == after.signed_pre_key);

    auto generated = manager->GenerateSignedPreKey(9);
    REQUIRE(generated.IsOk());
    REQUIRE(generated.Unwrap().GetKeyId() == 9);
    REQUIRE(manager->SignedPreKeyId() == 2u);
}

TEST_CASE("IdentityManager - Fingerprints and safety numbers", "[identity][fingerprint]") {
    auto alice = CreateIdentity();
    auto bob = CreateIdentity();
    const auto alice_key = alice->GetIdentityPublicKey().value();
    const auto bob_key = bob->GetIdentityPublicKey().value();

    SECTION("Fingerprint is the first 16 bytes of BLAKE2b-256 in hex groups") {
        auto fingerprint = IdentityManager::ComputeFingerprint(alice_key);
        REQUIRE(fingerprint.IsOk());
        REQUIRE(fingerprint.Unwrap() == alice->GetFingerprint());

        auto hash = crypto::SodiumInterop::GenericHash(alice_key, 32).Unwrap();
        auto hex = crypto::SodiumInterop::ToHex(hash);
        REQUIRE(fingerprint.Unwrap().substr(0, 4) == hex.substr(0, 4));
        REQUIRE(fingerprint.Unwrap().substr(35, 4) == hex.substr(28, 4));
    }
    SECTION("Fingerprint rejects keys of the wrong size") {
        REQUIRE(IdentityManager::ComputeFingerprint(std::vector<uint8_t>(31, 1)).IsErr());
    }
    SECTION("Safety number is the same from both sides") {
        auto from_alice = alice->ComputeSafetyNumber(bob_key);
        auto from_bob = bob->ComputeSafetyNumber(alice_key);
        REQUIRE(from_alice.IsOk());
        REQUIRE(from_bob.IsOk());
        REQUIRE(from_alice.Unwrap() == from_bob.Unwrap());
        REQUIRE(IsGroupedString(from_alice.Unwrap(), 6, 5, true));
    }
    SECTION("Safety number depends on the peer") {
        auto carol = CreateIdentity();
        auto with_bob = alice->ComputeSafetyNumber(bob_key).Unwrap();
        auto with_carol = alice->ComputeSafetyNumber(carol->GetIdentityPublicKey().value()).Unwrap();
        REQUIRE(with_bob != with_carol);
    }
    SECTION("Safety number rejects malformed keys") {
        auto result = alice->ComputeSafetyNumber(std::vector<uint8_t>(16, 0));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}
