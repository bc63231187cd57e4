#include <catch2/catch_test_macros.hpp>
#include "vortex/crypto/hkdf.hpp"
#include "vortex/crypto/sodium_interop.hpp"
#include <sodium.h>
#include <algorithm>
#include <string>
#include <vector>

using namespace vortex::protocol;
using namespace vortex::protocol::crypto;

namespace {
    // Reference HMAC-SHA-512/256 computed with libsodium's streaming API.
    std::vector<uint8_t> ReferenceMac(const std::vector<uint8_t>& key, const std::vector<uint8_t>& data) {
        crypto_auth_hmacsha512256_state state;
        crypto_auth_hmacsha512256_init(&state, key.data(), key.size());
        crypto_auth_hmacsha512256_update(&state, data.data(), data.size());
        std::vector<uint8_t> out(crypto_auth_hmacsha512256_BYTES);
        crypto_auth_hmacsha512256_final(&state, out.data());
        return out;
    }

    std::vector<uint8_t> Bytes(const std::string& s) {
        return std::vector<uint8_t>(s.begin(), s.end());
    }
}

TEST_CASE("Hkdf - MAC matches HMAC-SHA-512/256", "[hkdf][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("32-byte key") {
        auto key = SodiumInterop::GetRandomBytes(32);
        std::vector<uint8_t> data = {0x01};
        auto mac = Hkdf::Mac(key, data);
        REQUIRE(mac.IsOk());
        REQUIRE(mac.Unwrap().size() == Hkdf::HASH_LEN);

        std::vector<uint8_t> expected(crypto_auth_hmacsha512256_BYTES);
        crypto_auth_hmacsha512256(expected.data(), data.data(), data.size(), key.data());
        REQUIRE(mac.Unwrap() == expected);
    }
    SECTION("Long key and message") {
        auto key = SodiumInterop::GetRandomBytes(200);
        auto data = SodiumInterop::GetRandomBytes(1000);
        REQUIRE(Hkdf::Mac(key, data).Unwrap() == ReferenceMac(key, data));
    }
    SECTION("Empty key is rejected") {
        std::vector<uint8_t> data = {1, 2, 3};
        REQUIRE(Hkdf::Mac({}, data).IsErr());
    }
}

TEST_CASE("Hkdf - Extract and expand", "[hkdf][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto ikm = SodiumInterop::GetRandomBytes(32);
    const auto salt = SodiumInterop::GetRandomBytes(32);
    const auto info = Bytes("VORTEX_RATCHET");

    SECTION("Extract is MAC keyed by the salt") {
        REQUIRE(Hkdf::Extract(ikm, salt).Unwrap() == ReferenceMac(salt, ikm));
    }
    SECTION("Empty salt means HASH_LEN zero bytes") {
        std::vector<uint8_t> zero_salt(Hkdf::HASH_LEN, 0);
        REQUIRE(Hkdf::Extract(ikm).Unwrap() == Hkdf::Extract(ikm, zero_salt).Unwrap());
    }
    SECTION("Expand follows the T(i) chain") {
        auto prk = ReferenceMac(salt, ikm);
        auto t1_input = info;
        t1_input.push_back(0x01);
        auto t1 = ReferenceMac(prk, t1_input);
        auto t2_input = t1;
        t2_input.insert(t2_input.end(), info.begin(), info.end());
        t2_input.push_back(0x02);
        auto t2 = ReferenceMac(prk, t2_input);

        auto okm = Hkdf::DeriveKeyBytes(ikm, 48, salt, info);
        REQUIRE(okm.IsOk());
        std::vector<uint8_t> expected = t1;
        expected.insert(expected.end(), t2.begin(), t2.begin() + 16);
        REQUIRE(okm.Unwrap() == expected);
    }
    SECTION("Shorter output is a prefix of longer output") {
        auto short_okm = Hkdf::DeriveKeyBytes(ikm, 32, salt, info).Unwrap();
        auto long_okm = Hkdf::DeriveKeyBytes(ikm, 96, salt, info).Unwrap();
        REQUIRE(std::equal(short_okm.begin(), short_okm.end(), long_okm.begin()));
    }
    SECTION("Info separates outputs") {
        auto a = Hkdf::DeriveKeyBytes(ikm, 32, salt, Bytes("a")).Unwrap();
        auto b = Hkdf::DeriveKeyBytes(ikm, 32, salt, Bytes("b")).Unwrap();
        REQUIRE(a != b);
    }
}

TEST_CASE("Hkdf - Parameter validation", "[hkdf][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto ikm = SodiumInterop::GetRandomBytes(32);

    SECTION("Zero-length output") {
        REQUIRE(Hkdf::DeriveKeyBytes(ikm, 0).IsErr());
    }
    SECTION("Output above 255 blocks") {
        REQUIRE(Hkdf::DeriveKeyBytes(ikm, Hkdf::MAX_OUTPUT_LEN + 1).IsErr());
        REQUIRE(Hkdf::DeriveKeyBytes(ikm, Hkdf::MAX_OUTPUT_LEN).IsOk());
    }
    SECTION("Empty input key material") {
        REQUIRE(Hkdf::DeriveKeyBytes({}, 32).IsErr());
    }
    SECTION("PRK of the wrong size") {
        std::vector<uint8_t> prk(16, 0x01);
        REQUIRE(Hkdf::Expand(prk, 32).IsErr());
    }
}
