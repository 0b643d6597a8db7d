#include "httpsig/keys/default_keychain.hpp"
#include "httpsig/core/constants.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace httpsig::auth::keys {

DefaultKeychain::DefaultKeychain(std::shared_ptr<const std::vector<KeyPtr>> keys, const size_t start) noexcept
    : keys_(std::move(keys))
      , start_(start) {
}

KeychainPtr DefaultKeychain::Create(std::vector<KeyPtr> keys) {
    keys.erase(std::remove(keys.begin(), keys.end(), nullptr), keys.end());
    return std::make_shared<const DefaultKeychain>(
        std::make_shared<const std::vector<KeyPtr>>(std::move(keys)), 0);
}

KeychainPtr DefaultKeychain::Empty() {
    return Create({});
}

bool DefaultKeychain::IsEmpty() const {
    return start_ >= keys_->size();
}

size_t DefaultKeychain::Size() const {
    return IsEmpty() ? 0 : keys_->size() - start_;
}

const KeyPtr& DefaultKeychain::CurrentKey() const {
    if (IsEmpty()) {
        throw std::out_of_range(std::string(ErrorMessages::EMPTY_KEYCHAIN));
    }
    return (*keys_)[start_];
}

KeychainPtr DefaultKeychain::FilterAlgorithms(const AlgorithmSet& algorithms) const {
    std::vector<KeyPtr> filtered;
    for (size_t i = start_; i < keys_->size(); ++i) {
        if ((*keys_)[i]->SupportsAnyOf(algorithms)) {
            filtered.push_back((*keys_)[i]);
        }
    }
    return std::make_shared<const DefaultKeychain>(
        std::make_shared<const std::vector<KeyPtr>>(std::move(filtered)), 0);
}

KeychainPtr DefaultKeychain::Discard() const {
    const size_t next = IsEmpty() ? keys_->size() : start_ + 1;
    return std::make_shared<const DefaultKeychain>(keys_, next);
}

std::vector<KeyPtr> DefaultKeychain::Keys() const {
    if (IsEmpty()) {
        return {};
    }
    return std::vector<KeyPtr>(keys_->begin() + static_cast<std::ptrdiff_t>(start_), keys_->end());
}

}
