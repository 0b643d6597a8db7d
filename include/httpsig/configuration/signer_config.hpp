#pragma once

#include <cstdint>

namespace httpsig::auth::configuration {

/// How the signer behaves when none of the current key's algorithms is
/// accepted by the active challenge.
enum class NegotiationPolicy : uint8_t {
    /// The key is still asked to sign, with no algorithm selected.
    /// The bundled keys reject this, so the attempt yields no signature.
    PassThrough = 0,

    /// Signing stops before the key is consulted and yields no signature.
    Strict = 1
};

/// Configuration for a Signer.
///
/// @example
/// ```cpp
/// // Behaviour compatible with existing clients
/// auto config = SignerConfig::Default();
///
/// // Refuse to hand an unset algorithm to the key
/// auto strict = SignerConfig::Strict();
/// ```
class SignerConfig {
public:
    /// Pass-through negotiation, the long-standing client behaviour.
    [[nodiscard]] static constexpr SignerConfig Default() noexcept {
        return SignerConfig(NegotiationPolicy::PassThrough);
    }

    /// Fail fast when the key and the challenge share no algorithm.
    [[nodiscard]] static constexpr SignerConfig Strict() noexcept {
        return SignerConfig(NegotiationPolicy::Strict);
    }

    [[nodiscard]] constexpr NegotiationPolicy GetNegotiationPolicy() const noexcept {
        return policy_;
    }

    [[nodiscard]] constexpr bool IsStrictNegotiation() const noexcept {
        return policy_ == NegotiationPolicy::Strict;
    }

    [[nodiscard]] constexpr bool operator==(const SignerConfig& other) const noexcept {
        return policy_ == other.policy_;
    }

    [[nodiscard]] constexpr bool operator!=(const SignerConfig& other) const noexcept {
        return policy_ != other.policy_;
    }

private:
    explicit constexpr SignerConfig(const NegotiationPolicy policy) noexcept
        : policy_(policy) {}

    NegotiationPolicy policy_;
};

} // namespace httpsig::auth::configuration
