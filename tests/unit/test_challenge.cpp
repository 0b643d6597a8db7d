#include <catch2/catch_test_macros.hpp>
#include "httpsig/models/challenge.hpp"
using namespace httpsig::auth;
using namespace httpsig::auth::models;
TEST_CASE("Challenge - Construction", "[challenge][models]") {
    SECTION("Headers are lower-cased and de-duplicated in order") {
        auto challenge = Challenge::Create("api", {"Host", "date", "HOST", "Digest"}, {Algorithm::RsaSha256});
        REQUIRE(challenge->GetHeaders() == std::vector<std::string>{"host", "date", "digest"});
        REQUIRE(challenge->GetRealm() == "api");
    }
    SECTION("Preemptive challenge accepts every algorithm and requires date") {
        const auto& preemptive = Challenge::Preemptive();
        REQUIRE(preemptive == Challenge::Preemptive());
        REQUIRE(preemptive->GetRealm() == "<preemptive>");
        REQUIRE(preemptive->GetHeaders() == std::vector<std::string>{"date"});
        REQUIRE(preemptive->GetAlgorithms() == AllAlgorithmSet());
    }
}
TEST_CASE("Challenge - Equality", "[challenge][models]") {
    auto a = Challenge::Create("one", {"date", "host"}, {Algorithm::RsaSha256, Algorithm::HmacSha256});
    SECTION("Header order and realm do not matter") {
        auto b = Challenge::Create("two", {"host", "date"}, {Algorithm::HmacSha256, Algorithm::RsaSha256});
        REQUIRE(*a == *b);
    }
    SECTION("Different headers differ") {
        auto b = Challenge::Create("one", {"date"}, {Algorithm::RsaSha256, Algorithm::HmacSha256});
        REQUIRE(*a != *b);
    }
    SECTION("Different algorithms differ") {
        auto b = Challenge::Create("one", {"date", "host"}, {Algorithm::RsaSha256});
        REQUIRE(*a != *b);
    }
    SECTION("Rebuilt preemptive challenge equals the singleton") {
        auto rebuilt = Challenge::Create("elsewhere", {"Date"}, AllAlgorithmSet());
        REQUIRE(*rebuilt == *Challenge::Preemptive());
    }
}
TEST_CASE("Challenge - Header value", "[challenge][models]") {
    auto challenge = Challenge::Create("users", {"(request-target)", "date"},
        {Algorithm::HmacSha256, Algorithm::RsaSha256});
    REQUIRE(challenge->HeaderValue() ==
        "Signature realm=\"users\",headers=\"(request-target) date\",algorithms=\"rsa-sha256 hmac-sha256\"");
}
