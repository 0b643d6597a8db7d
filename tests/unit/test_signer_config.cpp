#include <catch2/catch_test_macros.hpp>
#include "httpsig/configuration/signer_config.hpp"
using namespace httpsig::auth::configuration;
TEST_CASE("SignerConfig - Factory Methods", "[config]") {
    SECTION("Default passes unnegotiated requests through") {
        constexpr auto config = SignerConfig::Default();
        STATIC_REQUIRE(config.GetNegotiationPolicy() == NegotiationPolicy::PassThrough);
        REQUIRE_FALSE(config.IsStrictNegotiation());
    }
    SECTION("Strict fails fast") {
        constexpr auto config = SignerConfig::Strict();
        STATIC_REQUIRE(config.GetNegotiationPolicy() == NegotiationPolicy::Strict);
        REQUIRE(config.IsStrictNegotiation());
    }
    SECTION("Comparison") {
        REQUIRE(SignerConfig::Default() == SignerConfig::Default());
        REQUIRE(SignerConfig::Default() != SignerConfig::Strict());
    }
}
