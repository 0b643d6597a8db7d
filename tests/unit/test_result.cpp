#include <catch2/catch_test_macros.hpp>
#include "httpsig/core/result.hpp"
#include "httpsig/core/failures.hpp"
#include <string>
using namespace httpsig::auth;
TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, SigningFailure>::Err(SigningFailure::InvalidArgument("bad"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SigningFailureType::InvalidArgument);
        REQUIRE(result.UnwrapErr().message == "bad");
    }
    SECTION("Unwrap on Err throws") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE_THROWS_AS(result.Unwrap(), std::logic_error);
    }
}
TEST_CASE("Result<T, E> - Transformations", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto mapped = Result<int, std::string>::Ok(21).Map([](int x) { return x * 2; });
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("MapErr transforms Err value") {
        auto mapped = Result<int, SodiumFailure>::Err(SodiumFailure::AllocationFailed("oom"))
            .MapErr([](const SodiumFailure& f) { return SigningFailure::FromSodiumFailure(f); });
        REQUIRE(mapped.UnwrapErr().type == SigningFailureType::SecureMemory);
        REQUIRE(mapped.UnwrapErr().message == "oom");
    }
    SECTION("UnwrapOr returns default on Err") {
        REQUIRE(Result<bool, std::string>::Err("e").UnwrapOr(false) == false);
        REQUIRE(Result<bool, std::string>::Ok(true).UnwrapOr(false) == true);
    }
    SECTION("Sodium initialization failures keep their category") {
        auto failure = SigningFailure::FromSodiumFailure(SodiumFailure::InitializationFailed("init"));
        REQUIRE(failure.type == SigningFailureType::InitializationFailed);
    }
}
