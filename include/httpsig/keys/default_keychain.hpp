#pragma once
#include "httpsig/interfaces/i_keychain.hpp"
#include <cstddef>
#include <memory>
#include <vector>
namespace httpsig::auth::keys {
using interfaces::IKeychain;
using interfaces::KeychainPtr;
using interfaces::KeyPtr;

/**
 * @brief Persistent keychain view
 *
 * All views derived from one keychain share an immutable backing array.
 * Discard() moves a start cursor forward in a new view; FilterAlgorithms()
 * builds a new backing array. No view ever changes after construction.
 */
class DefaultKeychain final : public IKeychain {
public:
    /// Null entries are dropped.
    [[nodiscard]] static KeychainPtr Create(std::vector<KeyPtr> keys);

    [[nodiscard]] static KeychainPtr Empty();

    [[nodiscard]] bool IsEmpty() const override;
    [[nodiscard]] size_t Size() const override;
    [[nodiscard]] const KeyPtr& CurrentKey() const override;
    [[nodiscard]] KeychainPtr FilterAlgorithms(const AlgorithmSet& algorithms) const override;
    [[nodiscard]] KeychainPtr Discard() const override;

    /// Remaining keys, current key first.
    [[nodiscard]] std::vector<KeyPtr> Keys() const;

    DefaultKeychain(std::shared_ptr<const std::vector<KeyPtr>> keys, size_t start) noexcept;

private:
    std::shared_ptr<const std::vector<KeyPtr>> keys_;
    size_t start_;
};
}
