#include <catch2/catch_test_macros.hpp>
#include "vortex/core/result.hpp"
#include "vortex/core/failures.hpp"
#include <memory>
#include <string>
using namespace vortex::protocol;
TEST_CASE("Result - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErr());
        REQUIRE_FALSE(result.IsOk());
        REQUIRE(result.UnwrapErr() == "error");
    }
    SECTION("Unit type for void results") {
        auto result = Result<Unit, ProtocolFailure>::Ok(unit);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == unit);
    }
    SECTION("Unwrap on Err throws") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE_THROWS_AS(result.Unwrap(), std::logic_error);
    }
    SECTION("UnwrapErr on Ok throws") {
        auto result = Result<int, std::string>::Ok(1);
        REQUIRE_THROWS_AS(result.UnwrapErr(), std::logic_error);
    }
}
TEST_CASE("Result - Move-only payloads", "[result][core]") {
    SECTION("Unwrap on rvalue moves the value out") {
        auto result = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(7));
        auto value = std::move(result).Unwrap();
        REQUIRE(value != nullptr);
        REQUIRE(*value == 7);
    }
    SECTION("ProtocolFailure moves out of an Err") {
        auto result = Result<int, ProtocolFailure>::Err(ProtocolFailure::ReplayAttack("seen"));
        auto failure = std::move(result).UnwrapErr();
        REQUIRE(failure.type == ProtocolFailureType::ReplayAttack);
        REQUIRE(failure.message == "seen");
    }
}
TEST_CASE("Result - Monadic Operations", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto result = Result<int, std::string>::Ok(21);
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("Map preserves Err") {
        auto result = Result<int, std::string>::Err("error");
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error");
    }
    SECTION("Map can change the value type") {
        auto result = Result<int, ProtocolFailure>::Ok(5);
        auto mapped = std::move(result).Map([](int x) { return std::string(static_cast<size_t>(x), 'v'); });
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == "vvvvv");
    }
    SECTION("Map is not called on Err") {
        bool called = false;
        auto result = Result<int, ProtocolFailure>::Err(ProtocolFailure::Decode("bad"));
        auto mapped = std::move(result).Map([&called](int x) {
            called = true;
            return x;
        });
        REQUIRE_FALSE(called);
        REQUIRE(mapped.UnwrapErr().type == ProtocolFailureType::Decode);
    }
}

TEST_CASE("ProtocolFailure - FromSodiumFailure", "[result][core]") {
    SECTION("Initialization failure keeps its type") {
        auto failure = ProtocolFailure::FromSodiumFailure(SodiumFailure::InitializationFailed("x"));
        REQUIRE(failure.type == ProtocolFailureType::InitializationFailed);
    }
    SECTION("Other sodium failures become Generic") {
        auto failure = ProtocolFailure::FromSodiumFailure(SodiumFailure::BufferTooSmall("small"));
        REQUIRE(failure.type == ProtocolFailureType::Generic);
        REQUIRE(failure.message == "small");
    }
}
