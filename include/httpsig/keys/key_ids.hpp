#pragma once
#include "httpsig/interfaces/i_key_id.hpp"
#include <memory>
#include <string>
namespace httpsig::auth::keys {
using interfaces::IKey;
using interfaces::IKeyId;
using interfaces::KeyIdPtr;

/// Uses the key's own id. Default strategy of a Signer.
class DefaultKeyId final : public IKeyId {
public:
    [[nodiscard]] std::string GetId(const IKey& key) const override;

    [[nodiscard]] static const KeyIdPtr& Instance();
};

/// "/<username>/keys/<key id>", the layout of per-user key listings.
class UserKeysFingerprintKeyId final : public IKeyId {
public:
    explicit UserKeysFingerprintKeyId(std::string username);

    [[nodiscard]] std::string GetId(const IKey& key) const override;

    [[nodiscard]] const std::string& GetUsername() const noexcept {
        return username_;
    }

private:
    std::string username_;
};
}
