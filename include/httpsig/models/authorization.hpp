#pragma once
#include "httpsig/core/option.hpp"
#include "httpsig/enums/algorithm.hpp"
#include <string>
#include <vector>
namespace httpsig::auth::models {

/**
 * @brief A signed Authorization header value
 *
 * The algorithm is unset only when the signing key accepted an unnegotiated
 * signing request.
 */
class Authorization {
public:
    Authorization(
        std::string key_id,
        std::string signature,
        std::vector<std::string> headers,
        Option<Algorithm> algorithm);

    [[nodiscard]] const std::string& GetKeyId() const noexcept {
        return key_id_;
    }
    [[nodiscard]] const std::string& GetSignature() const noexcept {
        return signature_;
    }
    [[nodiscard]] const std::vector<std::string>& GetHeaders() const noexcept {
        return headers_;
    }
    [[nodiscard]] const Option<Algorithm>& GetAlgorithm() const noexcept {
        return algorithm_;
    }

    /// Serialized Authorization value. The headers parameter is left out only
    /// when exactly "date" was signed, which is the default a server assumes.
    [[nodiscard]] std::string HeaderValue() const;

    [[nodiscard]] bool operator==(const Authorization& other) const = default;

private:
    std::string key_id_;
    std::string signature_;
    std::vector<std::string> headers_;
    Option<Algorithm> algorithm_;
};
}
