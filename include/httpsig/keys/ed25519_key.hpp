#pragma once
#include "httpsig/interfaces/i_key.hpp"
#include "httpsig/crypto/sodium_secure_memory_handle.hpp"
#include <memory>
#include <span>
#include <string>
#include <vector>
namespace httpsig::auth::keys {

/**
 * @brief Ed25519 key backed by libsodium
 *
 * A key built from a public key alone can verify but not sign, which makes
 * the Signer skip it during candidate selection.
 */
class Ed25519Key final : public interfaces::IKey {
public:
    [[nodiscard]] static Result<std::shared_ptr<Ed25519Key>, SigningFailure> Generate();

    [[nodiscard]] static Result<std::shared_ptr<Ed25519Key>, SigningFailure> FromSeed(
        std::span<const uint8_t> seed);

    [[nodiscard]] static Result<std::shared_ptr<Ed25519Key>, SigningFailure> FromPublicKey(
        std::span<const uint8_t> public_key);

    [[nodiscard]] std::string GetId() const override;
    [[nodiscard]] const std::vector<Algorithm>& GetAlgorithms() const override;
    [[nodiscard]] bool CanSign() const override;
    [[nodiscard]] bool CanVerify() const override;
    [[nodiscard]] Result<std::vector<uint8_t>, SigningFailure> Sign(
        Option<Algorithm> algorithm,
        std::span<const uint8_t> content) const override;
    [[nodiscard]] Result<bool, SigningFailure> Verify(
        Algorithm algorithm,
        std::span<const uint8_t> content,
        std::span<const uint8_t> signature) const override;

    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }

    Ed25519Key(std::string fingerprint, std::vector<uint8_t> public_key, crypto::SecureMemoryHandle secret_key);

private:
    std::string fingerprint_;
    std::vector<uint8_t> public_key_;
    crypto::SecureMemoryHandle secret_key_;
};
}
