#include <catch2/catch_test_macros.hpp>
#include "vortex/crypto/sodium_secure_memory_handle.hpp"
#include "vortex/crypto/sodium_interop.hpp"
#include <algorithm>
#include <vector>
using namespace vortex::protocol;
using namespace vortex::protocol::crypto;
TEST_CASE("SecureMemoryHandle - Allocation", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Allocated region is sized and zeroed") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        REQUIRE_FALSE(handle.IsInvalid());
        REQUIRE(handle.Size() == 32);
        auto bytes = handle.ReadBytes(32).Unwrap();
        REQUIRE(std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Zero-byte allocation is refused") {
        REQUIRE(SecureMemoryHandle::Allocate(0).IsErr());
    }
    SECTION("Default-constructed handle is invalid") {
        SecureMemoryHandle handle;
        REQUIRE(handle.IsInvalid());
        REQUIRE(handle.Size() == 0);
    }
}
TEST_CASE("SecureMemoryHandle - FromBytes and Clone", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto secret = SodiumInterop::GetRandomBytes(32);
    SECTION("FromBytes copies the input") {
        auto handle = SecureMemoryHandle::FromBytes(secret).Unwrap();
        REQUIRE(handle.Size() == secret.size());
        REQUIRE(handle.ReadBytes(secret.size()).Unwrap() == secret);
    }
    SECTION("Clone is independent of the original") {
        auto original = SecureMemoryHandle::FromBytes(secret).Unwrap();
        auto copy = original.Clone().Unwrap();
        REQUIRE(copy.ReadBytes(32).Unwrap() == secret);

        std::vector<uint8_t> other(32, 0x11);
        REQUIRE(original.Write(other).IsOk());
        REQUIRE(copy.ReadBytes(32).Unwrap() == secret);
        REQUIRE(original.ReadBytes(32).Unwrap() == other);
    }
    SECTION("Clone of a moved-from handle fails") {
        auto original = SecureMemoryHandle::FromBytes(secret).Unwrap();
        auto moved = std::move(original);
        REQUIRE(original.Clone().IsErr());
        REQUIRE_FALSE(moved.IsInvalid());
    }
}
TEST_CASE("SecureMemoryHandle - Move Semantics", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Move construction transfers ownership") {
        auto first = SecureMemoryHandle::Allocate(32).Unwrap();
        SecureMemoryHandle second(std::move(first));
        REQUIRE(first.IsInvalid());
        REQUIRE(second.Size() == 32);
    }
    SECTION("Move assignment releases the previous region") {
        auto first = SecureMemoryHandle::Allocate(32).Unwrap();
        auto second = SecureMemoryHandle::Allocate(64).Unwrap();
        second = std::move(first);
        REQUIRE(first.IsInvalid());
        REQUIRE(second.Size() == 32);
    }
}
TEST_CASE("SecureMemoryHandle - Read and Write bounds", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Short write zero-fills the tail") {
        auto handle = SecureMemoryHandle::Allocate(8).Unwrap();
        REQUIRE(handle.Write(std::vector<uint8_t>(8, 0xAA)).IsOk());
        REQUIRE(handle.Write(std::vector<uint8_t>{1, 2}).IsOk());
        REQUIRE(handle.ReadBytes(8).Unwrap() == std::vector<uint8_t>{1, 2, 0, 0, 0, 0, 0, 0});
    }
    SECTION("Oversized write is rejected") {
        auto handle = SecureMemoryHandle::Allocate(16).Unwrap();
        auto result = handle.Write(std::vector<uint8_t>(17, 0x42));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::BufferTooSmall);
    }
    SECTION("Read into a short buffer is rejected") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        std::vector<uint8_t> buffer(16);
        REQUIRE(handle.Read(buffer).IsErr());
    }
    SECTION("ReadBytes of a prefix succeeds, beyond the end fails") {
        auto handle = SecureMemoryHandle::FromBytes(std::vector<uint8_t>{9, 8, 7, 6}).Unwrap();
        REQUIRE(handle.ReadBytes(2).Unwrap() == std::vector<uint8_t>{9, 8});
        REQUIRE(handle.ReadBytes(5).IsErr());
    }
}
TEST_CASE("SecureMemoryHandle - Scoped access", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("WithWriteAccess then WithReadAccess") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        auto written = handle.WithWriteAccess([](std::span<uint8_t> span) {
            std::fill(span.begin(), span.end(), 0x5A);
            return unit;
        });
        REQUIRE(written.IsOk());
        auto count = handle.WithReadAccess([](std::span<const uint8_t> span) {
            return std::count(span.begin(), span.end(), 0x5A);
        });
        REQUIRE(count.IsOk());
        REQUIRE(count.Unwrap() == 32);
    }
    SECTION("Access on an invalid handle fails") {
        SecureMemoryHandle handle;
        auto result = handle.WithReadAccess([](std::span<const uint8_t> span) { return span.size(); });
        REQUIRE(result.IsErr());
    }
}
