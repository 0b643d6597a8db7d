#include "httpsig/keys/rsa_key.hpp"
#include "httpsig/core/format.hpp"

#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

namespace httpsig::auth::keys {

using OpenSSL = OpenSSLConstants;
using crypto::OpenSslInterop;
using crypto::EvpPkeyPtr;
using crypto::EvpMdCtxPtr;
using crypto::BioPtr;

namespace {
    using KeyResult = Result<std::shared_ptr<RsaKey>, SigningFailure>;

    const std::vector<Algorithm>& RsaAlgorithms() {
        static const std::vector<Algorithm> algorithms = {
            Algorithm::RsaSha256, Algorithm::RsaSha512, Algorithm::RsaSha1
        };
        return algorithms;
    }

    const EVP_MD* DigestFor(const Algorithm algorithm) {
        switch (algorithm) {
            case Algorithm::RsaSha1:
                return EVP_sha1();
            case Algorithm::RsaSha256:
                return EVP_sha256();
            case Algorithm::RsaSha512:
                return EVP_sha512();
            default:
                return nullptr;
        }
    }

    KeyResult Wrap(EvpPkeyPtr pkey, const bool has_private) {
        if (EVP_PKEY_is_a(pkey.get(), "RSA") != OpenSSL::SUCCESS) {
            return KeyResult::Err(SigningFailure::KeyMaterial("PEM does not contain an RSA key"));
        }
        if (EVP_PKEY_get_bits(pkey.get()) < static_cast<int>(Constants::MIN_RSA_KEY_BITS)) {
            return KeyResult::Err(SigningFailure::KeyMaterial(
                compat::format("RSA key must be at least {} bits", Constants::MIN_RSA_KEY_BITS)));
        }

        unsigned char* der = nullptr;
        const int der_size = i2d_PUBKEY(pkey.get(), &der);
        if (der_size <= 0) {
            return KeyResult::Err(SigningFailure::Encode(
                compat::format("Failed to encode RSA public key: {}", OpenSslInterop::LastError())));
        }
        auto fingerprint = OpenSslInterop::Md5Fingerprint(
            std::span<const uint8_t>(der, static_cast<size_t>(der_size)));
        OPENSSL_free(der);
        if (fingerprint.IsErr()) {
            return KeyResult::Err(std::move(fingerprint).UnwrapErr());
        }
        return KeyResult::Ok(std::make_shared<RsaKey>(
            std::move(pkey), has_private, std::move(fingerprint).Unwrap()));
    }

    BioPtr ReadOnlyBio(const std::string_view pem) {
        return BioPtr(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    }
}

RsaKey::RsaKey(EvpPkeyPtr pkey, const bool has_private, std::string fingerprint)
    : pkey_(std::move(pkey))
      , has_private_(has_private)
      , fingerprint_(std::move(fingerprint)) {
}

Result<std::shared_ptr<RsaKey>, SigningFailure> RsaKey::Generate(const unsigned int bits) {
    if (bits < Constants::MIN_RSA_KEY_BITS) {
        return KeyResult::Err(SigningFailure::InvalidInput(
            compat::format("RSA key must be at least {} bits, got {}", Constants::MIN_RSA_KEY_BITS, bits)));
    }
    EvpPkeyPtr pkey(EVP_RSA_gen(bits));
    if (!pkey) {
        return KeyResult::Err(SigningFailure::KeyGeneration(
            compat::format("Failed to generate RSA key: {}", OpenSslInterop::LastError())));
    }
    return Wrap(std::move(pkey), true);
}

Result<std::shared_ptr<RsaKey>, SigningFailure> RsaKey::FromPrivateKeyPem(const std::string_view pem) {
    BioPtr bio = ReadOnlyBio(pem);
    if (!bio) {
        return KeyResult::Err(SigningFailure::Generic(
            compat::format("Failed to create BIO: {}", OpenSslInterop::LastError())));
    }
    EvpPkeyPtr pkey(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!pkey) {
        return KeyResult::Err(SigningFailure::Decode(
            compat::format("Failed to read RSA private key: {}", OpenSslInterop::LastError())));
    }
    return Wrap(std::move(pkey), true);
}

Result<std::shared_ptr<RsaKey>, SigningFailure> RsaKey::FromPublicKeyPem(const std::string_view pem) {
    BioPtr bio = ReadOnlyBio(pem);
    if (!bio) {
        return KeyResult::Err(SigningFailure::Generic(
            compat::format("Failed to create BIO: {}", OpenSslInterop::LastError())));
    }
    EvpPkeyPtr pkey(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!pkey) {
        return KeyResult::Err(SigningFailure::Decode(
            compat::format("Failed to read RSA public key: {}", OpenSslInterop::LastError())));
    }
    return Wrap(std::move(pkey), false);
}

std::string RsaKey::GetId() const {
    return fingerprint_;
}

const std::vector<Algorithm>& RsaKey::GetAlgorithms() const {
    return RsaAlgorithms();
}

bool RsaKey::CanSign() const {
    return has_private_;
}

bool RsaKey::CanVerify() const {
    return true;
}

Result<std::vector<uint8_t>, SigningFailure> RsaKey::Sign(
    const Option<Algorithm> algorithm,
    std::span<const uint8_t> content) const {

    const EVP_MD* md = algorithm.has_value() ? DigestFor(*algorithm) : nullptr;
    if (md == nullptr) {
        return Result<std::vector<uint8_t>, SigningFailure>::Err(
            SigningFailure::UnsupportedAlgorithm(algorithm.has_value()
                ? compat::format("RSA key cannot sign with {}", AlgorithmName(*algorithm))
                : std::string(ErrorMessages::NO_ALGORITHM_SELECTED)));
    }
    if (!has_private_) {
        return Result<std::vector<uint8_t>, SigningFailure>::Err(
            SigningFailure::KeyMaterial(std::string(ErrorMessages::KEY_CANNOT_SIGN)));
    }

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, SigningFailure>::Err(
            SigningFailure::CryptoOperation(
                compat::format("Failed to create digest context: {}", OpenSslInterop::LastError())));
    }
    if (EVP_DigestSignInit(ctx.get(), nullptr, md, nullptr, pkey_.get()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, SigningFailure>::Err(
            SigningFailure::CryptoOperation(
                compat::format("Failed to initialize RSA signing: {}", OpenSslInterop::LastError())));
    }

    size_t signature_size = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &signature_size,
                       content.data(), content.size()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, SigningFailure>::Err(
            SigningFailure::CryptoOperation(
                compat::format("Failed to size RSA signature: {}", OpenSslInterop::LastError())));
    }
    std::vector<uint8_t> signature(signature_size);
    if (EVP_DigestSign(ctx.get(), signature.data(), &signature_size,
                       content.data(), content.size()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, SigningFailure>::Err(
            SigningFailure::CryptoOperation(
                compat::format("RSA signing failed: {}", OpenSslInterop::LastError())));
    }
    signature.resize(signature_size);
    return Result<std::vector<uint8_t>, SigningFailure>::Ok(std::move(signature));
}

Result<bool, SigningFailure> RsaKey::Verify(
    const Algorithm algorithm,
    std::span<const uint8_t> content,
    std::span<const uint8_t> signature) const {

    const EVP_MD* md = DigestFor(algorithm);
    if (md == nullptr) {
        return Result<bool, SigningFailure>::Err(
            SigningFailure::UnsupportedAlgorithm(
                compat::format("RSA key cannot verify {}", AlgorithmName(algorithm))));
    }

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, md, nullptr, pkey_.get()) != OpenSSL::SUCCESS) {
        return Result<bool, SigningFailure>::Err(
            SigningFailure::CryptoOperation(
                compat::format("Failed to initialize RSA verification: {}", OpenSslInterop::LastError())));
    }

    const int verified = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                                          content.data(), content.size());
    if (verified != OpenSSL::SUCCESS) {
        // a mismatch leaves an entry on the error queue
        ERR_clear_error();
    }
    return Result<bool, SigningFailure>::Ok(verified == OpenSSL::SUCCESS);
}

Result<std::string, SigningFailure> RsaKey::PublicKeyPem() const {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), pkey_.get()) != OpenSSL::SUCCESS) {
        return Result<std::string, SigningFailure>::Err(
            SigningFailure::Encode(
                compat::format("Failed to write RSA public key: {}", OpenSslInterop::LastError())));
    }
    char* data = nullptr;
    const long size = BIO_get_mem_data(bio.get(), &data);
    return Result<std::string, SigningFailure>::Ok(std::string(data, static_cast<size_t>(size)));
}

}
