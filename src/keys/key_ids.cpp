#include "httpsig/keys/key_ids.hpp"
#include "httpsig/core/constants.hpp"
#include "httpsig/core/format.hpp"

namespace httpsig::auth::keys {

std::string DefaultKeyId::GetId(const IKey& key) const {
    return key.GetId();
}

const KeyIdPtr& DefaultKeyId::Instance() {
    static const KeyIdPtr instance = std::make_shared<const DefaultKeyId>();
    return instance;
}

UserKeysFingerprintKeyId::UserKeysFingerprintKeyId(std::string username)
    : username_(std::move(username)) {
}

std::string UserKeysFingerprintKeyId::GetId(const IKey& key) const {
    return compat::format("/{}{}{}", username_, SignatureConstants::USER_KEYS_SEGMENT, key.GetId());
}

}
