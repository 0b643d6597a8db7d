#pragma once
#include "httpsig/enums/algorithm.hpp"
#include <memory>
#include <string>
#include <vector>
namespace httpsig::auth::models {
class Challenge;
using ChallengePtr = std::shared_ptr<const Challenge>;

/**
 * @brief Server requirements for an acceptable signature
 *
 * Immutable. Two challenges are equal when their algorithm sets and required
 * header sets are equal; the realm is informational only.
 */
class Challenge {
public:
    /// Header names are lower-cased and de-duplicated, first occurrence wins.
    [[nodiscard]] static ChallengePtr Create(
        std::string realm,
        const std::vector<std::string>& headers,
        AlgorithmSet algorithms);

    /// The challenge assumed before the server has sent one: every algorithm, "date" required.
    [[nodiscard]] static const ChallengePtr& Preemptive();

    [[nodiscard]] const std::string& GetRealm() const noexcept {
        return realm_;
    }
    [[nodiscard]] const std::vector<std::string>& GetHeaders() const noexcept {
        return headers_;
    }
    [[nodiscard]] const AlgorithmSet& GetAlgorithms() const noexcept {
        return algorithms_;
    }

    /// Serialized WWW-Authenticate value, e.g. Signature realm="x",headers="date",algorithms="rsa-sha256".
    [[nodiscard]] std::string HeaderValue() const;

    [[nodiscard]] bool operator==(const Challenge& other) const;
    [[nodiscard]] bool operator!=(const Challenge& other) const {
        return !(*this == other);
    }

    Challenge(std::string realm, std::vector<std::string> headers, AlgorithmSet algorithms);

private:
    std::string realm_;
    std::vector<std::string> headers_;
    AlgorithmSet algorithms_;
};
}
