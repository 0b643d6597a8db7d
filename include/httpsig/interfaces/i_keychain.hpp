#pragma once
#include "httpsig/interfaces/i_key.hpp"
#include "httpsig/enums/algorithm.hpp"
#include <cstddef>
#include <memory>
namespace httpsig::auth::interfaces {
class IKeychain;
using KeychainPtr = std::shared_ptr<const IKeychain>;

/**
 * @brief Ordered, immutable collection of keys with a rotation cursor
 *
 * Narrowing operations return new keychains and never modify this one, so a
 * holder of an earlier keychain never observes later discards.
 */
class IKeychain {
public:
    virtual ~IKeychain() = default;

    [[nodiscard]] virtual bool IsEmpty() const = 0;

    [[nodiscard]] virtual size_t Size() const = 0;

    /// Precondition: !IsEmpty().
    [[nodiscard]] virtual const KeyPtr& CurrentKey() const = 0;

    /// Keys supporting at least one of the algorithms, relative order preserved.
    [[nodiscard]] virtual KeychainPtr FilterAlgorithms(const AlgorithmSet& algorithms) const = 0;

    /// Keychain without the current key; the next key becomes current.
    [[nodiscard]] virtual KeychainPtr Discard() const = 0;
};
}
