#include "httpsig/keys/hmac_key.hpp"
#include "httpsig/crypto/sodium_interop.hpp"
#include "httpsig/crypto/openssl_interop.hpp"
#include "httpsig/core/constants.hpp"
#include "httpsig/core/format.hpp"

#include <openssl/core_names.h>
#include <openssl/params.h>
#include <algorithm>

namespace httpsig::auth::keys {

using OpenSSL = OpenSSLConstants;
using crypto::OpenSslInterop;
using crypto::SodiumInterop;
using crypto::SecureMemoryHandle;

namespace {
    Option<const char*> DigestFor(const Algorithm algorithm) {
        switch (algorithm) {
            case Algorithm::HmacSha1:
                return Some("SHA1");
            case Algorithm::HmacSha256:
                return Some("SHA256");
            case Algorithm::HmacSha512:
                return Some("SHA512");
            default:
                return None<const char*>();
        }
    }

    Result<std::vector<uint8_t>, SigningFailure> ComputeMac(
        const char* digest,
        std::span<const uint8_t> secret,
        std::span<const uint8_t> content) {

        crypto::EvpMacPtr mac(EVP_MAC_fetch(nullptr, OpenSSL::ALGORITHM_HMAC.data(), nullptr));
        if (!mac) {
            return Result<std::vector<uint8_t>, SigningFailure>::Err(
                SigningFailure::CryptoOperation(
                    compat::format("Failed to fetch HMAC: {}", OpenSslInterop::LastError())));
        }
        crypto::EvpMacCtxPtr ctx(EVP_MAC_CTX_new(mac.get()));
        if (!ctx) {
            return Result<std::vector<uint8_t>, SigningFailure>::Err(
                SigningFailure::CryptoOperation(
                    compat::format("Failed to create HMAC context: {}", OpenSslInterop::LastError())));
        }

        OSSL_PARAM params[2];
        params[0] = OSSL_PARAM_construct_utf8_string(
            OSSL_MAC_PARAM_DIGEST, const_cast<char*>(digest), 0);
        params[1] = OSSL_PARAM_construct_end();

        if (EVP_MAC_init(ctx.get(), secret.data(), secret.size(), params) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, SigningFailure>::Err(
                SigningFailure::CryptoOperation(
                    compat::format("Failed to initialize HMAC-{}: {}", digest, OpenSslInterop::LastError())));
        }
        if (EVP_MAC_update(ctx.get(), content.data(), content.size()) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, SigningFailure>::Err(
                SigningFailure::CryptoOperation(
                    compat::format("Failed to update HMAC: {}", OpenSslInterop::LastError())));
        }

        std::vector<uint8_t> output(EVP_MAX_MD_SIZE);
        size_t output_size = 0;
        if (EVP_MAC_final(ctx.get(), output.data(), &output_size, output.size()) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, SigningFailure>::Err(
                SigningFailure::CryptoOperation(
                    compat::format("Failed to finalize HMAC: {}", OpenSslInterop::LastError())));
        }
        output.resize(output_size);
        return Result<std::vector<uint8_t>, SigningFailure>::Ok(std::move(output));
    }
}

HmacKey::HmacKey(std::string id, SecureMemoryHandle secret, std::vector<Algorithm> algorithms)
    : id_(std::move(id))
      , secret_(std::move(secret))
      , algorithms_(std::move(algorithms)) {
}

Result<std::shared_ptr<HmacKey>, SigningFailure> HmacKey::Create(
    std::string id,
    std::span<const uint8_t> secret,
    std::vector<Algorithm> algorithms) {

    if (secret.size() < Constants::MIN_HMAC_SECRET_SIZE) {
        return Result<std::shared_ptr<HmacKey>, SigningFailure>::Err(
            SigningFailure::KeyMaterial("HMAC secret cannot be empty"));
    }
    if (algorithms.empty()) {
        algorithms = {Algorithm::HmacSha256, Algorithm::HmacSha512, Algorithm::HmacSha1};
    }
    for (const Algorithm algorithm : algorithms) {
        if (!DigestFor(algorithm).has_value()) {
            return Result<std::shared_ptr<HmacKey>, SigningFailure>::Err(
                SigningFailure::UnsupportedAlgorithm(
                    compat::format("{} is not an HMAC algorithm", AlgorithmName(algorithm))));
        }
    }

    if (auto init_result = SodiumInterop::Initialize(); init_result.IsErr()) {
        return Result<std::shared_ptr<HmacKey>, SigningFailure>::Err(
            SigningFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }
    auto handle_result = SecureMemoryHandle::Allocate(secret.size())
        .MapErr(SigningFailure::FromSodiumFailure);
    if (handle_result.IsErr()) {
        return Result<std::shared_ptr<HmacKey>, SigningFailure>::Err(std::move(handle_result).UnwrapErr());
    }
    SecureMemoryHandle handle = std::move(handle_result).Unwrap();
    if (auto write_result = handle.Write(secret); write_result.IsErr()) {
        return Result<std::shared_ptr<HmacKey>, SigningFailure>::Err(
            SigningFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }

    return Result<std::shared_ptr<HmacKey>, SigningFailure>::Ok(
        std::make_shared<HmacKey>(std::move(id), std::move(handle), std::move(algorithms)));
}

std::string HmacKey::GetId() const {
    return id_;
}

const std::vector<Algorithm>& HmacKey::GetAlgorithms() const {
    return algorithms_;
}

bool HmacKey::CanSign() const {
    return !secret_.IsInvalid();
}

bool HmacKey::CanVerify() const {
    return !secret_.IsInvalid();
}

Result<std::vector<uint8_t>, SigningFailure> HmacKey::Sign(
    const Option<Algorithm> algorithm,
    std::span<const uint8_t> content) const {

    if (!algorithm.has_value()) {
        return Result<std::vector<uint8_t>, SigningFailure>::Err(
            SigningFailure::UnsupportedAlgorithm(std::string(ErrorMessages::NO_ALGORITHM_SELECTED)));
    }
    if (std::find(algorithms_.begin(), algorithms_.end(), *algorithm) == algorithms_.end()) {
        return Result<std::vector<uint8_t>, SigningFailure>::Err(
            SigningFailure::UnsupportedAlgorithm(
                compat::format("Key {} does not support {}", id_, AlgorithmName(*algorithm))));
    }

    const char* digest = *DigestFor(*algorithm);
    auto mac_result = secret_.WithReadAccess([digest, content](std::span<const uint8_t> secret) {
        return ComputeMac(digest, secret, content);
    });
    if (mac_result.IsErr()) {
        return Result<std::vector<uint8_t>, SigningFailure>::Err(
            SigningFailure::FromSodiumFailure(mac_result.UnwrapErr()));
    }
    return std::move(mac_result).Unwrap();
}

Result<bool, SigningFailure> HmacKey::Verify(
    const Algorithm algorithm,
    std::span<const uint8_t> content,
    std::span<const uint8_t> signature) const {

    auto expected = Sign(Some(algorithm), content);
    if (expected.IsErr()) {
        return Result<bool, SigningFailure>::Err(std::move(expected).UnwrapErr());
    }
    return Result<bool, SigningFailure>::Ok(
        SodiumInterop::ConstantTimeEquals(expected.Unwrap(), signature));
}

}
