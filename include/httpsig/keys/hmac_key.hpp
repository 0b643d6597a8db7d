#pragma once
#include "httpsig/interfaces/i_key.hpp"
#include "httpsig/crypto/sodium_secure_memory_handle.hpp"
#include <memory>
#include <span>
#include <string>
#include <vector>
namespace httpsig::auth::keys {

/**
 * @brief Shared-secret key for the hmac-* algorithms
 *
 * The secret is held in libsodium secure memory. The id is chosen by the
 * caller since a shared secret has no public fingerprint.
 */
class HmacKey final : public interfaces::IKey {
public:
    /**
     * @param algorithms Preference order; only hmac-* algorithms are accepted.
     *                   Empty selects hmac-sha256, hmac-sha512, hmac-sha1.
     */
    [[nodiscard]] static Result<std::shared_ptr<HmacKey>, SigningFailure> Create(
        std::string id,
        std::span<const uint8_t> secret,
        std::vector<Algorithm> algorithms = {});

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

    HmacKey(std::string id, crypto::SecureMemoryHandle secret, std::vector<Algorithm> algorithms);

private:
    std::string id_;
    crypto::SecureMemoryHandle secret_;
    std::vector<Algorithm> algorithms_;
};
}
