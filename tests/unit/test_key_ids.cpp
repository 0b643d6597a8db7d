#include <catch2/catch_test_macros.hpp>
#include "helpers/mock_key.hpp"
#include "httpsig/keys/key_ids.hpp"
using namespace httpsig::auth;
using namespace httpsig::auth::keys;
using namespace httpsig::auth::test_helpers;

TEST_CASE("KeyIds - Strategies", "[keyid][keys]") {
    const auto key = MakeMockKey("aa:bb:cc", {Algorithm::RsaSha256});

    SECTION("DefaultKeyId returns the key's own id") {
        REQUIRE(DefaultKeyId().GetId(*key) == "aa:bb:cc");
        REQUIRE(DefaultKeyId::Instance() == DefaultKeyId::Instance());
    }
    SECTION("UserKeysFingerprintKeyId prefixes the user key path") {
        UserKeysFingerprintKeyId key_id("alice");
        REQUIRE(key_id.GetUsername() == "alice");
        REQUIRE(key_id.GetId(*key) == "/alice/keys/aa:bb:cc");
    }
}
