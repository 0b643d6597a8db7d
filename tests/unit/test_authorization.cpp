#include <catch2/catch_test_macros.hpp>
#include "httpsig/models/authorization.hpp"
using namespace httpsig::auth;
using namespace httpsig::auth::models;
TEST_CASE("Authorization - Accessors", "[authorization][models]") {
    Authorization authz("key-1", "c2ln", {"date", "host"}, Some(Algorithm::HmacSha256));
    REQUIRE(authz.GetKeyId() == "key-1");
    REQUIRE(authz.GetSignature() == "c2ln");
    REQUIRE(authz.GetHeaders() == std::vector<std::string>{"date", "host"});
    REQUIRE(authz.GetAlgorithm() == Algorithm::HmacSha256);
    REQUIRE(authz == Authorization("key-1", "c2ln", {"date", "host"}, Some(Algorithm::HmacSha256)));
    REQUIRE_FALSE(authz == Authorization("key-2", "c2ln", {"date", "host"}, Some(Algorithm::HmacSha256)));
}
TEST_CASE("Authorization - Header value", "[authorization][models]") {
    SECTION("All parameters") {
        Authorization authz("key-1", "c2ln", {"(request-target)", "date"}, Some(Algorithm::RsaSha256));
        REQUIRE(authz.HeaderValue() ==
            "Signature keyId=\"key-1\",headers=\"(request-target) date\",algorithm=\"rsa-sha256\",signature=\"c2ln\"");
    }
    SECTION("Date-only header list is implied") {
        Authorization authz("key-1", "c2ln", {"date"}, Some(Algorithm::HmacSha1));
        REQUIRE(authz.HeaderValue() == "Signature keyId=\"key-1\",algorithm=\"hmac-sha1\",signature=\"c2ln\"");
    }
    SECTION("Empty header list is written out") {
        Authorization authz("key-1", "c2ln", {}, Some(Algorithm::HmacSha256));
        REQUIRE(authz.HeaderValue() ==
            "Signature keyId=\"key-1\",headers=\"\",algorithm=\"hmac-sha256\",signature=\"c2ln\"");
    }
    SECTION("Date among other headers is listed") {
        Authorization authz("key-1", "c2ln", {"host", "date"}, Some(Algorithm::HmacSha256));
        REQUIRE(authz.HeaderValue() ==
            "Signature keyId=\"key-1\",headers=\"host date\",algorithm=\"hmac-sha256\",signature=\"c2ln\"");
    }
    SECTION("Unset algorithm is omitted") {
        Authorization authz("key-1", "c2ln", {"host"}, None<Algorithm>());
        REQUIRE(authz.HeaderValue() == "Signature keyId=\"key-1\",headers=\"host\",signature=\"c2ln\"");
    }
}
