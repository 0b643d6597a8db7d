#pragma once
#include "httpsig/interfaces/i_key.hpp"
#include "httpsig/crypto/openssl_interop.hpp"
#include "httpsig/core/constants.hpp"
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace httpsig::auth::keys {

/**
 * @brief RSA PKCS#1 v1.5 key for the rsa-* algorithms (OpenSSL)
 *
 * Keys loaded from a public PEM verify only. The id is the MD5 fingerprint
 * of the DER encoded SubjectPublicKeyInfo.
 */
class RsaKey final : public interfaces::IKey {
public:
    [[nodiscard]] static Result<std::shared_ptr<RsaKey>, SigningFailure> Generate(
        unsigned int bits = Constants::DEFAULT_RSA_KEY_BITS);

    [[nodiscard]] static Result<std::shared_ptr<RsaKey>, SigningFailure> FromPrivateKeyPem(
        std::string_view pem);

    [[nodiscard]] static Result<std::shared_ptr<RsaKey>, SigningFailure> FromPublicKeyPem(
        std::string_view pem);

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

    [[nodiscard]] Result<std::string, SigningFailure> PublicKeyPem() const;

    RsaKey(crypto::EvpPkeyPtr pkey, bool has_private, std::string fingerprint);

private:
    crypto::EvpPkeyPtr pkey_;
    bool has_private_;
    std::string fingerprint_;
};
}
