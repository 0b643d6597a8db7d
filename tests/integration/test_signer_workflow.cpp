#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "httpsig/signing/signer.hpp"
#include "httpsig/keys/default_keychain.hpp"
#include "httpsig/keys/hmac_key.hpp"
#include "httpsig/keys/rsa_key.hpp"
#include "httpsig/keys/ed25519_key.hpp"
#include "httpsig/keys/key_ids.hpp"
#include "httpsig/crypto/sodium_interop.hpp"
#include <chrono>
#include <string>

using namespace httpsig::auth;
using namespace httpsig::auth::signing;
using namespace httpsig::auth::models;
using namespace httpsig::auth::keys;
using namespace httpsig::auth::crypto;

namespace {
    std::vector<uint8_t> Bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }

    bool VerifyAuthorization(const interfaces::IKey& key, const Authorization& authz, const RequestContent& request) {
        auto signature = SodiumInterop::FromBase64(authz.GetSignature());
        if (signature.IsErr() || !authz.GetAlgorithm().has_value()) {
            return false;
        }
        return key.Verify(*authz.GetAlgorithm(), request.GetBytesToSign(authz.GetHeaders()), signature.Unwrap())
            .UnwrapOr(false);
    }
}

TEST_CASE("Integration - Rotate from RSA to HMAC after rejection", "[integration][signer]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    auto rsa_key = RsaKey::Generate().Unwrap();
    auto hmac_key = HmacKey::Create("shared-secret", Bytes("0123456789abcdef"), {Algorithm::HmacSha256}).Unwrap();
    Signer signer(DefaultKeychain::Create({rsa_key, hmac_key}));

    const auto request = RequestContent::Builder()
        .SetRequestTarget("POST", "/orders")
        .SetDate(std::chrono::system_clock::now())
        .AddHeader("Host", "api.example.org")
        .Build();

    auto challenge = Challenge::Create("orders", {"date", "host"},
        {Algorithm::RsaSha256, Algorithm::HmacSha256});
    REQUIRE(signer.RotateKeys(challenge).Unwrap());
    REQUIRE(signer.GetCandidateKeys()->CurrentKey() == rsa_key);

    auto first = signer.Sign(request, {"date"});
    REQUIRE(first.has_value());
    REQUIRE(first->GetKeyId() == rsa_key->GetId());
    REQUIRE(first->GetAlgorithm() == Algorithm::RsaSha256);
    REQUIRE(first->GetHeaders() == std::vector<std::string>{"date", "host"});
    REQUIRE(VerifyAuthorization(*rsa_key, *first, request));

    // server rejects the RSA signature with the same challenge
    REQUIRE(signer.RotateKeys(challenge, first).Unwrap());

    auto second = signer.Sign(request, {"date"});
    REQUIRE(second.has_value());
    REQUIRE(second->GetKeyId() == "shared-secret");
    REQUIRE(second->GetAlgorithm() == Algorithm::HmacSha256);
    REQUIRE(VerifyAuthorization(*hmac_key, *second, request));
    REQUIRE_THAT(second->HeaderValue(), Catch::Matchers::StartsWith(
        "Signature keyId=\"shared-secret\",headers=\"date host\",algorithm=\"hmac-sha256\",signature=\""));

    // the HMAC key is rejected too; nothing is left
    REQUIRE_FALSE(signer.RotateKeys(challenge, second).Unwrap());
    REQUIRE_FALSE(signer.Sign(request, {"date"}).has_value());

    // a fresh challenge starts over from the RSA key
    REQUIRE(signer.RotateKeys().Unwrap());
    REQUIRE(signer.Sign(request, {"date"})->GetKeyId() == rsa_key->GetId());
}

TEST_CASE("Integration - Public-only keys are never selected", "[integration][signer]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    auto signing_key = Ed25519Key::Generate().Unwrap();
    auto verify_only = Ed25519Key::FromPublicKey(Ed25519Key::Generate().Unwrap()->GetPublicKey()).Unwrap();
    Signer signer(DefaultKeychain::Create({verify_only, signing_key}),
        std::make_shared<const UserKeysFingerprintKeyId>("deploy"));

    const auto request = RequestContent::Builder()
        .SetRequestTarget("GET", "/deploy/keys")
        .SetDate("Sun, 05 Jan 2014 21:31:40 GMT")
        .Build();

    auto authz = signer.Sign(request, {"(request-target)"});
    REQUIRE(authz.has_value());
    REQUIRE(authz->GetKeyId() == "/deploy/keys/" + signing_key->GetId());
    REQUIRE(authz->GetAlgorithm() == Algorithm::Ed25519);
    REQUIRE(authz->GetHeaders() == std::vector<std::string>{"(request-target)", "date"});
    REQUIRE(VerifyAuthorization(*signing_key, *authz, request));
    REQUIRE_FALSE(VerifyAuthorization(*verify_only, *authz, request));
}
