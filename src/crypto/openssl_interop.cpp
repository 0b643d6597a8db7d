#include "httpsig/crypto/openssl_interop.hpp"
#include "httpsig/core/constants.hpp"
#include "httpsig/core/format.hpp"

#include <openssl/err.h>

namespace httpsig::auth::crypto {

using OpenSSL = OpenSSLConstants;

std::string OpenSslInterop::LastError() {
    const unsigned long err = ERR_get_error();
    if (err == OpenSSL::NO_ERROR) {
        return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
    }
    char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    return std::string(buffer);
}

Result<std::string, SigningFailure> OpenSslInterop::Md5Fingerprint(std::span<const uint8_t> data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_size = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &digest_size,
                   EVP_md5(), nullptr) != OpenSSL::SUCCESS) {
        return Result<std::string, SigningFailure>::Err(
            SigningFailure::CryptoOperation(
                compat::format("Failed to compute key fingerprint: {}", LastError())));
    }

    std::string fingerprint;
    fingerprint.reserve(digest_size * 3);
    for (unsigned int i = 0; i < digest_size; ++i) {
        if (i > 0) {
            fingerprint.push_back(':');
        }
        fingerprint += compat::format("{:02x}", digest[i]);
    }
    return Result<std::string, SigningFailure>::Ok(std::move(fingerprint));
}

} // namespace httpsig::auth::crypto
