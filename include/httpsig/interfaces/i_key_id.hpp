#pragma once
#include "httpsig/interfaces/i_key.hpp"
#include <memory>
#include <string>
namespace httpsig::auth::interfaces {
class IKeyId {
public:
    virtual ~IKeyId() = default;
    /// Must be deterministic: failed authorizations are matched back to keys by this id.
    [[nodiscard]] virtual std::string GetId(const IKey& key) const = 0;
};
using KeyIdPtr = std::shared_ptr<const IKeyId>;
}
