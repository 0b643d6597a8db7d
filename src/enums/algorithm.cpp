#include "httpsig/enums/algorithm.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace httpsig::auth {

namespace {
    std::string ToLower(std::string_view value) {
        std::string lowered(value);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
            [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lowered;
    }
}

std::string_view AlgorithmName(const Algorithm algorithm) noexcept {
    switch (algorithm) {
        case Algorithm::RsaSha1:
            return "rsa-sha1";
        case Algorithm::RsaSha256:
            return "rsa-sha256";
        case Algorithm::RsaSha512:
            return "rsa-sha512";
        case Algorithm::HmacSha1:
            return "hmac-sha1";
        case Algorithm::HmacSha256:
            return "hmac-sha256";
        case Algorithm::HmacSha512:
            return "hmac-sha512";
        case Algorithm::Ed25519:
            return "ed25519";
    }
    return "unknown";
}

Option<Algorithm> AlgorithmFromName(const std::string_view name) {
    const std::string lowered = ToLower(name);
    for (const Algorithm algorithm : AllAlgorithms()) {
        if (AlgorithmName(algorithm) == lowered) {
            return Some(algorithm);
        }
    }
    return None<Algorithm>();
}

const std::vector<Algorithm>& AllAlgorithms() {
    static const std::vector<Algorithm> all = {
        Algorithm::RsaSha1,
        Algorithm::RsaSha256,
        Algorithm::RsaSha512,
        Algorithm::HmacSha1,
        Algorithm::HmacSha256,
        Algorithm::HmacSha512,
        Algorithm::Ed25519
    };
    return all;
}

AlgorithmSet AllAlgorithmSet() {
    const auto& all = AllAlgorithms();
    return AlgorithmSet(all.begin(), all.end());
}

}
