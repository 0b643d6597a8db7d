#include <catch2/catch_test_macros.hpp>
#include "helpers/mock_key.hpp"
#include "httpsig/signing/signer.hpp"
#include "httpsig/crypto/sodium_interop.hpp"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace httpsig::auth;
using namespace httpsig::auth::signing;
using namespace httpsig::auth::models;
using namespace httpsig::auth::test_helpers;

TEST_CASE("Concurrency - Signing while rotating", "[concurrency][signer]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());

    auto rsa = MakeMockKey("rsa", {Algorithm::RsaSha256});
    auto hmac = MakeMockKey("hmac", {Algorithm::HmacSha256});
    Signer signer(MakeKeychain({rsa, hmac}), nullptr, configuration::SignerConfig::Default());

    auto rsa_only = Challenge::Create("api", {"date"}, {Algorithm::RsaSha256});
    auto hmac_only = Challenge::Create("api", {"date", "host"}, {Algorithm::HmacSha256});

    const auto request = RequestContent::Builder()
        .SetDate("Tue, 07 Jun 2014 20:51:35 GMT")
        .AddHeader("Host", "example.org")
        .Build();

    constexpr int ROTATOR_COUNT = 4;
    constexpr int SIGNER_COUNT = 8;
    constexpr int ITERATIONS = 2000;

    std::atomic<bool> mismatch_detected{false};
    std::atomic<bool> rotation_failed{false};
    std::atomic<int> signatures{0};

    std::vector<std::thread> threads;
    threads.reserve(ROTATOR_COUNT + SIGNER_COUNT);

    for (int t = 0; t < ROTATOR_COUNT; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < ITERATIONS; ++i) {
                const auto& next = (i + t) % 2 == 0 ? rsa_only : hmac_only;
                if (!signer.RotateKeys(next).IsOkAnd([](const bool usable) { return usable; })) {
                    rotation_failed.store(true);
                }
            }
        });
    }

    for (int t = 0; t < SIGNER_COUNT; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < ITERATIONS; ++i) {
                auto authz = signer.Sign(request, {"date"});
                if (!authz.has_value()) {
                    mismatch_detected.store(true);
                    continue;
                }
                // a key paired with the other challenge would negotiate no algorithm
                const bool consistent =
                    (authz->GetKeyId() == "rsa" && authz->GetAlgorithm() == Algorithm::RsaSha256
                        && authz->GetHeaders() == std::vector<std::string>{"date"})
                    || (authz->GetKeyId() == "hmac" && authz->GetAlgorithm() == Algorithm::HmacSha256
                        && authz->GetHeaders() == std::vector<std::string>{"date", "host"});
                if (!consistent) {
                    mismatch_detected.store(true);
                }
                signatures.fetch_add(1);
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE_FALSE(rotation_failed.load());
    REQUIRE_FALSE(mismatch_detected.load());
    REQUIRE(signatures.load() == SIGNER_COUNT * ITERATIONS);

    const auto challenge = signer.GetChallenge();
    const auto candidates = signer.GetCandidateKeys();
    REQUIRE(candidates->Size() == 1);
    REQUIRE(candidates->CurrentKey()->SupportsAnyOf(challenge->GetAlgorithms()));
}

TEST_CASE("Concurrency - Racing failure reports advance once", "[concurrency][signer]") {
    std::vector<std::shared_ptr<MockKey>> mocks;
    for (int i = 0; i < 16; ++i) {
        mocks.push_back(MakeMockKey("k" + std::to_string(i), {Algorithm::HmacSha256}));
    }
    Signer signer(MakeKeychain(mocks));
    const auto challenge = signer.GetChallenge();
    const Option<Authorization> failed = Authorization("k0", "c2ln", {"date"}, Some(Algorithm::HmacSha256));

    constexpr int THREAD_COUNT = 16;
    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&]() {
            (void)signer.RotateKeys(challenge, failed);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(signer.GetCandidateKeys()->CurrentKey()->GetId() == "k1");
    REQUIRE(signer.GetCandidateKeys()->Size() == 15);
}
