#pragma once
#include "httpsig/core/result.hpp"
#include "httpsig/core/option.hpp"
#include "httpsig/core/failures.hpp"
#include "httpsig/enums/algorithm.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>
namespace httpsig::auth::interfaces {
class IKey {
public:
    virtual ~IKey() = default;

    /// Identifier the key reports for itself, typically a public key fingerprint.
    [[nodiscard]] virtual std::string GetId() const = 0;

    /// Supported algorithms in order of preference.
    [[nodiscard]] virtual const std::vector<Algorithm>& GetAlgorithms() const = 0;

    [[nodiscard]] virtual bool CanSign() const = 0;

    [[nodiscard]] virtual bool CanVerify() const = 0;

    /// Sign content. An unset algorithm reaches the key unchanged; the key decides.
    [[nodiscard]] virtual Result<std::vector<uint8_t>, SigningFailure> Sign(
        Option<Algorithm> algorithm,
        std::span<const uint8_t> content) const = 0;

    [[nodiscard]] virtual Result<bool, SigningFailure> Verify(
        Algorithm algorithm,
        std::span<const uint8_t> content,
        std::span<const uint8_t> signature) const = 0;

    [[nodiscard]] bool SupportsAnyOf(const AlgorithmSet& algorithms) const {
        for (const Algorithm algorithm : GetAlgorithms()) {
            if (algorithms.contains(algorithm)) {
                return true;
            }
        }
        return false;
    }
};
using KeyPtr = std::shared_ptr<const IKey>;
}
