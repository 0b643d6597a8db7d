#pragma once
#include "httpsig/core/option.hpp"
#include <cstdint>
#include <set>
#include <string_view>
#include <vector>
namespace httpsig::auth {
enum class Algorithm : uint8_t {
    RsaSha1 = 0,
    RsaSha256 = 1,
    RsaSha512 = 2,
    HmacSha1 = 3,
    HmacSha256 = 4,
    HmacSha512 = 5,
    Ed25519 = 6
};
using AlgorithmSet = std::set<Algorithm>;

/// Wire name used in challenge and authorization headers, e.g. "rsa-sha256".
[[nodiscard]] std::string_view AlgorithmName(Algorithm algorithm) noexcept;

/// Case-insensitive lookup of a wire name. Unknown names yield None.
[[nodiscard]] Option<Algorithm> AlgorithmFromName(std::string_view name);

/// Every supported algorithm in declaration order.
[[nodiscard]] const std::vector<Algorithm>& AllAlgorithms();

[[nodiscard]] AlgorithmSet AllAlgorithmSet();
}
