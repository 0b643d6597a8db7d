#pragma once

#include "httpsig/core/result.hpp"
#include "httpsig/core/failures.hpp"

#include <openssl/evp.h>
#include <openssl/bio.h>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace httpsig::auth::crypto {

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
struct EvpMacDeleter {
    void operator()(EVP_MAC* mac) const { EVP_MAC_free(mac); }
};
struct EvpMacCtxDeleter {
    void operator()(EVP_MAC_CTX* ctx) const { EVP_MAC_CTX_free(ctx); }
};
struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;
using EvpMacPtr = std::unique_ptr<EVP_MAC, EvpMacDeleter>;
using EvpMacCtxPtr = std::unique_ptr<EVP_MAC_CTX, EvpMacCtxDeleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

class OpenSslInterop {
public:
    /// Pops the oldest queued OpenSSL error as text.
    [[nodiscard]] static std::string LastError();

    /**
     * @brief MD5 fingerprint formatted as colon-separated lowercase hex
     *
     * Produces the familiar "aa:bb:...:ff" form used as a public key id.
     */
    static Result<std::string, SigningFailure> Md5Fingerprint(std::span<const uint8_t> data);

private:
    OpenSslInterop() = delete;
};

} // namespace httpsig::auth::crypto
