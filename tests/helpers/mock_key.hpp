#pragma once
#include "httpsig/interfaces/i_key.hpp"
#include "httpsig/keys/default_keychain.hpp"
#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace httpsig::auth::test_helpers {

using interfaces::IKey;
using interfaces::KeyPtr;
using interfaces::KeychainPtr;

/// Scriptable key: fixed algorithms, switchable capability, records what it was asked to sign.
class MockKey : public IKey {
public:
    MockKey(std::string id, std::vector<Algorithm> algorithms, const bool can_sign = true)
        : id_(std::move(id))
          , algorithms_(std::move(algorithms))
          , can_sign_(can_sign) {
    }

    [[nodiscard]] std::string GetId() const override {
        return id_;
    }

    [[nodiscard]] const std::vector<Algorithm>& GetAlgorithms() const override {
        return algorithms_;
    }

    [[nodiscard]] bool CanSign() const override {
        return can_sign_.load();
    }

    [[nodiscard]] bool CanVerify() const override {
        return true;
    }

    [[nodiscard]] Result<std::vector<uint8_t>, SigningFailure> Sign(
        const Option<Algorithm> algorithm,
        std::span<const uint8_t> content) const override {
        {
            std::lock_guard guard(mutex_);
            last_algorithm_ = algorithm;
            last_content_.assign(content.begin(), content.end());
        }
        sign_calls_.fetch_add(1);
        if (decline_.load()) {
            return Result<std::vector<uint8_t>, SigningFailure>::Err(
                SigningFailure::CryptoOperation("mock key declined"));
        }
        std::vector<uint8_t> signature(id_.begin(), id_.end());
        signature.insert(signature.end(), content.begin(), content.end());
        return Result<std::vector<uint8_t>, SigningFailure>::Ok(std::move(signature));
    }

    [[nodiscard]] Result<bool, SigningFailure> Verify(
        const Algorithm,
        std::span<const uint8_t> content,
        std::span<const uint8_t> signature) const override {
        std::vector<uint8_t> expected(id_.begin(), id_.end());
        expected.insert(expected.end(), content.begin(), content.end());
        return Result<bool, SigningFailure>::Ok(
            std::equal(expected.begin(), expected.end(), signature.begin(), signature.end()));
    }

    /// Not synchronized with GetAlgorithms; single-threaded tests only.
    void SetAlgorithms(std::vector<Algorithm> algorithms) {
        algorithms_ = std::move(algorithms);
    }

    void SetCanSign(const bool can_sign) {
        can_sign_.store(can_sign);
    }

    void SetDecline(const bool decline) {
        decline_.store(decline);
    }

    [[nodiscard]] int SignCalls() const {
        return sign_calls_.load();
    }

    [[nodiscard]] Option<Algorithm> LastAlgorithm() const {
        std::lock_guard guard(mutex_);
        return last_algorithm_;
    }

    [[nodiscard]] std::string LastContent() const {
        std::lock_guard guard(mutex_);
        return std::string(last_content_.begin(), last_content_.end());
    }

private:
    std::string id_;
    std::vector<Algorithm> algorithms_;
    std::atomic<bool> can_sign_;
    std::atomic<bool> decline_{false};
    mutable std::atomic<int> sign_calls_{0};
    mutable std::mutex mutex_;
    mutable Option<Algorithm> last_algorithm_;
    mutable std::vector<uint8_t> last_content_;
};

inline std::shared_ptr<MockKey> MakeMockKey(
    std::string id,
    std::vector<Algorithm> algorithms,
    const bool can_sign = true) {
    return std::make_shared<MockKey>(std::move(id), std::move(algorithms), can_sign);
}

inline KeychainPtr MakeKeychain(const std::vector<std::shared_ptr<MockKey>>& mocks) {
    std::vector<KeyPtr> keys(mocks.begin(), mocks.end());
    return keys::DefaultKeychain::Create(std::move(keys));
}

/// Ids of the remaining keys, current key first.
inline std::vector<std::string> KeychainIds(const KeychainPtr& keychain) {
    std::vector<std::string> ids;
    for (auto view = keychain; !view->IsEmpty(); view = view->Discard()) {
        ids.push_back(view->CurrentKey()->GetId());
    }
    return ids;
}

}
