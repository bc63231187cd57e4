#include <catch2/catch_test_macros.hpp>
#include "vortex/protocol/ratchet_kdf.hpp"
#include "vortex/protocol/constants.hpp"
#include "vortex/crypto/hkdf.hpp"
#include "vortex/crypto/sodium_interop.hpp"
#include <algorithm>
#include <vector>

using namespace vortex::protocol;
using namespace vortex::protocol::crypto;

namespace {
    std::vector<uint8_t> InfoBytes() {
        return std::vector<uint8_t>(kRatchetInfo.begin(), kRatchetInfo.end());
    }
}

TEST_CASE("RatchetKdf - Root key step", "[ratchet_kdf][protocol]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto root_key = SodiumInterop::GetRandomBytes(kRootKeyBytes);
    const auto dh_output = SodiumInterop::GetRandomBytes(kX25519SharedSecretBytes);

    SECTION("Splits 96 bytes of HKDF output into root, chain and header keys") {
        auto step = RatchetKdf::DeriveRootKeys(root_key, dh_output);
        REQUIRE(step.IsOk());
        const auto& keys = step.Unwrap();

        auto okm = Hkdf::DeriveKeyBytes(dh_output, kRootKdfOutputBytes, root_key, InfoBytes()).Unwrap();
        REQUIRE(keys.root_key == std::vector<uint8_t>(okm.begin(), okm.begin() + 32));
        REQUIRE(keys.chain_key == std::vector<uint8_t>(okm.begin() + 32, okm.begin() + 64));
        REQUIRE(keys.header_key == std::vector<uint8_t>(okm.begin() + 64, okm.end()));
    }
    SECTION("Deterministic for the same inputs") {
        auto a = RatchetKdf::DeriveRootKeys(root_key, dh_output).Unwrap();
        auto b = RatchetKdf::DeriveRootKeys(root_key, dh_output).Unwrap();
        REQUIRE(a.root_key == b.root_key);
        REQUIRE(a.chain_key == b.chain_key);
        REQUIRE(a.header_key == b.header_key);
    }
    SECTION("Wrong sizes are rejected") {
        std::vector<uint8_t> short_key(16, 0x01);
        REQUIRE(RatchetKdf::DeriveRootKeys(short_key, dh_output).IsErr());
        REQUIRE(RatchetKdf::DeriveRootKeys(root_key, short_key).IsErr());
    }
    SECTION("Wipe clears every field") {
        auto step = RatchetKdf::DeriveRootKeys(root_key, dh_output).Unwrap();
        step.Wipe();
        REQUIRE(step.root_key.empty());
        REQUIRE(step.chain_key.empty());
        REQUIRE(step.header_key.empty());
    }
}

TEST_CASE("RatchetKdf - Chain key step", "[ratchet_kdf][protocol]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto chain_key = SodiumInterop::GetRandomBytes(kChainKeyBytes);

    SECTION("Message key and next chain key use distinct constants") {
        auto step = RatchetKdf::DeriveChainKeys(chain_key);
        REQUIRE(step.IsOk());
        const std::vector<uint8_t> one = {kMessageKeySeed};
        const std::vector<uint8_t> two = {kChainKeySeed};
        REQUIRE(step.Unwrap().message_key == Hkdf::Mac(chain_key, one).Unwrap());
        REQUIRE(step.Unwrap().next_chain_key == Hkdf::Mac(chain_key, two).Unwrap());
        REQUIRE(step.Unwrap().message_key != step.Unwrap().next_chain_key);
    }
    SECTION("Successive steps never repeat a message key") {
        std::vector<std::vector<uint8_t>> seen;
        auto current = chain_key;
        for (int i = 0; i < 10; ++i) {
            auto step = RatchetKdf::DeriveChainKeys(current).Unwrap();
            REQUIRE(std::find(seen.begin(), seen.end(), step.message_key) == seen.end());
            seen.push_back(step.message_key);
            current = step.next_chain_key;
        }
    }
    SECTION("Short chain key is rejected") {
        std::vector<uint8_t> short_key(31, 0x01);
        REQUIRE(RatchetKdf::DeriveChainKeys(short_key).IsErr());
    }
}

TEST_CASE("RatchetKdf - X3DH secret", "[ratchet_kdf][x3dh][protocol]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Zero salt and 32-byte output") {
        auto dh = SodiumInterop::GetRandomBytes(3 * kX25519SharedSecretBytes);
        auto secret = RatchetKdf::DeriveX3dhSecret(dh);
        REQUIRE(secret.IsOk());
        REQUIRE(secret.Unwrap().size() == 32);
        std::vector<uint8_t> zero_salt(32, 0);
        REQUIRE(secret.Unwrap() == Hkdf::DeriveKeyBytes(dh, 32, zero_salt, InfoBytes()).Unwrap());
    }
    SECTION("Four agreements differ from three") {
        auto dh = SodiumInterop::GetRandomBytes(4 * kX25519SharedSecretBytes);
        std::vector<uint8_t> first_three(dh.begin(), dh.begin() + 96);
        REQUIRE(RatchetKdf::DeriveX3dhSecret(dh).Unwrap() !=
                RatchetKdf::DeriveX3dhSecret(first_three).Unwrap());
    }
    SECTION("Input must be whole agreements") {
        REQUIRE(RatchetKdf::DeriveX3dhSecret({}).IsErr());
        std::vector<uint8_t> ragged(33, 0x01);
        REQUIRE(RatchetKdf::DeriveX3dhSecret(ragged).IsErr());
    }
}
