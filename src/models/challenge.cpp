#include "httpsig/models/challenge.hpp"
#include "httpsig/models/header_names.hpp"
#include "httpsig/core/constants.hpp"
#include "httpsig/core/format.hpp"

#include <algorithm>
#include <set>

namespace httpsig::auth::models {

Challenge::Challenge(std::string realm, std::vector<std::string> headers, AlgorithmSet algorithms)
    : realm_(std::move(realm))
      , headers_(std::move(headers))
      , algorithms_(std::move(algorithms)) {
}

ChallengePtr Challenge::Create(
    std::string realm,
    const std::vector<std::string>& headers,
    AlgorithmSet algorithms) {
    return std::make_shared<const Challenge>(
        std::move(realm), HeaderNames::NormalizeUnique(headers), std::move(algorithms));
}

const ChallengePtr& Challenge::Preemptive() {
    static const ChallengePtr preemptive = Create(
        std::string(SignatureConstants::PREEMPTIVE_REALM),
        {std::string(SignatureConstants::HEADER_DATE)},
        AllAlgorithmSet());
    return preemptive;
}

std::string Challenge::HeaderValue() const {
    std::vector<std::string_view> algorithm_names;
    algorithm_names.reserve(algorithms_.size());
    for (const Algorithm algorithm : algorithms_) {
        algorithm_names.push_back(AlgorithmName(algorithm));
    }
    return compat::format("{} {}=\"{}\",{}=\"{}\",{}=\"{}\"",
        SignatureConstants::SCHEME,
        SignatureConstants::PARAM_REALM, realm_,
        SignatureConstants::PARAM_HEADERS, compat::join(headers_, " "),
        SignatureConstants::PARAM_ALGORITHMS, compat::join(algorithm_names, " "));
}

bool Challenge::operator==(const Challenge& other) const {
    if (algorithms_ != other.algorithms_) {
        return false;
    }
    const std::set<std::string> lhs(headers_.begin(), headers_.end());
    const std::set<std::string> rhs(other.headers_.begin(), other.headers_.end());
    return lhs == rhs;
}

}
