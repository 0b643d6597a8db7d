#include "httpsig/models/authorization.hpp"
#include "httpsig/core/constants.hpp"
#include "httpsig/core/format.hpp"

namespace httpsig::auth::models {

Authorization::Authorization(
    std::string key_id,
    std::string signature,
    std::vector<std::string> headers,
    Option<Algorithm> algorithm)
    : key_id_(std::move(key_id))
      , signature_(std::move(signature))
      , headers_(std::move(headers))
      , algorithm_(algorithm) {
}

std::string Authorization::HeaderValue() const {
    std::string value = compat::format("{} {}=\"{}\"",
        SignatureConstants::SCHEME, SignatureConstants::PARAM_KEY_ID, key_id_);

    // an absent headers parameter means "date" to the server, so an empty list is spelled out
    const bool only_date = headers_.size() == 1 && headers_.front() == SignatureConstants::HEADER_DATE;
    if (!only_date) {
        value += compat::format(",{}=\"{}\"",
            SignatureConstants::PARAM_HEADERS, compat::join(headers_, " "));
    }
    if (algorithm_.has_value()) {
        value += compat::format(",{}=\"{}\"",
            SignatureConstants::PARAM_ALGORITHM, AlgorithmName(*algorithm_));
    }
    value += compat::format(",{}=\"{}\"", SignatureConstants::PARAM_SIGNATURE, signature_);
    return value;
}

}
