/**
 * @file basic_signing_example.cpp
 * @brief Signs a request, rotates after a simulated rejection and signs again
 */

#include "httpsig/signing/signer.hpp"
#include "httpsig/keys/default_keychain.hpp"
#include "httpsig/keys/hmac_key.hpp"
#include "httpsig/keys/rsa_key.hpp"
#include "httpsig/crypto/sodium_interop.hpp"

#include <chrono>
#include <iostream>
#include <span>
#include <string>

using namespace httpsig::auth;
using namespace httpsig::auth::crypto;
using namespace httpsig::auth::keys;
using namespace httpsig::auth::models;
using namespace httpsig::auth::signing;

void print_authorization(const std::string& label, const Option<Authorization>& authz) {
    if (!authz.has_value()) {
        std::cout << "   " << label << ": [no signature]" << std::endl;
        return;
    }
    std::cout << "   " << label << ": " << authz->HeaderValue() << std::endl;
}

int main() {
    std::cout << "=== httpsig - Basic Signing Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: "
                  << init_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Initialized successfully" << std::endl;
    std::cout << std::endl;

    std::cout << "2. Creating keys..." << std::endl;
    auto rsa_result = RsaKey::Generate();
    if (rsa_result.IsErr()) {
        std::cerr << "Failed to generate RSA key: " << rsa_result.UnwrapErr().message << std::endl;
        return 1;
    }
    auto rsa_key = std::move(rsa_result).Unwrap();
    std::cout << "   ✓ RSA key " << rsa_key->GetId() << std::endl;

    const std::string secret = "correct horse battery staple";
    auto hmac_result = HmacKey::Create(
        "shared-secret",
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(secret.data()), secret.size()),
        {Algorithm::HmacSha256});
    if (hmac_result.IsErr()) {
        std::cerr << "Failed to create HMAC key: " << hmac_result.UnwrapErr().message << std::endl;
        return 1;
    }
    auto hmac_key = std::move(hmac_result).Unwrap();
    std::cout << "   ✓ HMAC key " << hmac_key->GetId() << std::endl;
    std::cout << std::endl;

    Signer signer(DefaultKeychain::Create({rsa_key, hmac_key}));
    const auto request = RequestContent::Builder()
        .SetRequestTarget("GET", "/orders/42")
        .SetDate(std::chrono::system_clock::now())
        .AddHeader("Host", "api.example.org")
        .Build();

    std::cout << "3. Signing preemptively..." << std::endl;
    auto authz = signer.Sign(request, {"(request-target)", "host"});
    print_authorization("Authorization", authz);
    std::cout << std::endl;

    std::cout << "4. Server answers 401..." << std::endl;
    auto challenge = Challenge::Create("orders", {"(request-target)", "date", "host"},
        {Algorithm::RsaSha256, Algorithm::HmacSha256});
    std::cout << "   WWW-Authenticate: " << challenge->HeaderValue() << std::endl;
    auto rotated = signer.RotateKeys(challenge, authz);
    if (rotated.IsErr()) {
        std::cerr << "Rotation failed: " << rotated.UnwrapErr().message << std::endl;
        return 1;
    }
    authz = signer.Sign(request, {"(request-target)", "host"});
    print_authorization("Authorization", authz);
    std::cout << std::endl;

    std::cout << "5. Server rejects the key..." << std::endl;
    rotated = signer.RotateKeys(challenge, authz);
    if (rotated.IsErr() || !rotated.Unwrap()) {
        std::cerr << "No usable key left" << std::endl;
        return 1;
    }
    authz = signer.Sign(request, {"(request-target)", "host"});
    print_authorization("Authorization", authz);
    std::cout << std::endl;

    std::cout << "=== Example completed ===" << std::endl;
    return 0;
}
