#include "httpsig/keys/ed25519_key.hpp"
#include "httpsig/crypto/sodium_interop.hpp"
#include "httpsig/crypto/openssl_interop.hpp"
#include "httpsig/core/constants.hpp"
#include "httpsig/core/format.hpp"

namespace httpsig::auth::keys {

using crypto::OpenSslInterop;
using crypto::SodiumInterop;
using crypto::SecureMemoryHandle;

namespace {
    using KeyResult = Result<std::shared_ptr<Ed25519Key>, SigningFailure>;

    const std::vector<Algorithm>& Ed25519Algorithms() {
        static const std::vector<Algorithm> algorithms = {Algorithm::Ed25519};
        return algorithms;
    }

    KeyResult Assemble(std::vector<uint8_t> public_key, SecureMemoryHandle secret_key) {
        return OpenSslInterop::Md5Fingerprint(public_key).Map(
            [&public_key, &secret_key](std::string fingerprint) {
                return std::make_shared<Ed25519Key>(
                    std::move(fingerprint), std::move(public_key), std::move(secret_key));
            });
    }

    KeyResult FromKeypair(std::vector<uint8_t> public_key, std::vector<uint8_t> secret_key) {
        auto handle_result = SecureMemoryHandle::Allocate(Constants::ED_25519_SECRET_KEY_SIZE);
        if (handle_result.IsErr()) {
            (void)SodiumInterop::SecureWipe(secret_key);
            return KeyResult::Err(SigningFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        SecureMemoryHandle handle = std::move(handle_result).Unwrap();
        auto write_result = handle.Write(secret_key);
        (void)SodiumInterop::SecureWipe(secret_key);
        if (write_result.IsErr()) {
            return KeyResult::Err(SigningFailure::FromSodiumFailure(write_result.UnwrapErr()));
        }
        return Assemble(std::move(public_key), std::move(handle));
    }
}

Ed25519Key::Ed25519Key(std::string fingerprint, std::vector<uint8_t> public_key, SecureMemoryHandle secret_key)
    : fingerprint_(std::move(fingerprint))
      , public_key_(std::move(public_key))
      , secret_key_(std::move(secret_key)) {
}

Result<std::shared_ptr<Ed25519Key>, SigningFailure> Ed25519Key::Generate() {
    if (auto init_result = SodiumInterop::Initialize(); init_result.IsErr()) {
        return KeyResult::Err(SigningFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }
    std::vector<uint8_t> pk(Constants::ED_25519_PUBLIC_KEY_SIZE);
    std::vector<uint8_t> sk(Constants::ED_25519_SECRET_KEY_SIZE);
    if (crypto_sign_keypair(pk.data(), sk.data()) != 0) {
        (void)SodiumInterop::SecureWipe(sk);
        return KeyResult::Err(SigningFailure::KeyGeneration("Failed to generate Ed25519 key pair"));
    }
    return FromKeypair(std::move(pk), std::move(sk));
}

Result<std::shared_ptr<Ed25519Key>, SigningFailure> Ed25519Key::FromSeed(std::span<const uint8_t> seed) {
    if (seed.size() != Constants::ED_25519_SEED_SIZE) {
        return KeyResult::Err(SigningFailure::KeyMaterial(
            compat::format("Ed25519 seed must be {} bytes, got {}",
                Constants::ED_25519_SEED_SIZE, seed.size())));
    }
    if (auto init_result = SodiumInterop::Initialize(); init_result.IsErr()) {
        return KeyResult::Err(SigningFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }
    std::vector<uint8_t> pk(Constants::ED_25519_PUBLIC_KEY_SIZE);
    std::vector<uint8_t> sk(Constants::ED_25519_SECRET_KEY_SIZE);
    if (crypto_sign_seed_keypair(pk.data(), sk.data(), seed.data()) != 0) {
        (void)SodiumInterop::SecureWipe(sk);
        return KeyResult::Err(SigningFailure::KeyGeneration("Failed to derive Ed25519 key pair from seed"));
    }
    return FromKeypair(std::move(pk), std::move(sk));
}

Result<std::shared_ptr<Ed25519Key>, SigningFailure> Ed25519Key::FromPublicKey(std::span<const uint8_t> public_key) {
    if (public_key.size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        return KeyResult::Err(SigningFailure::KeyMaterial(
            compat::format("Ed25519 public key must be {} bytes, got {}",
                Constants::ED_25519_PUBLIC_KEY_SIZE, public_key.size())));
    }
    if (auto init_result = SodiumInterop::Initialize(); init_result.IsErr()) {
        return KeyResult::Err(SigningFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }
    return Assemble(std::vector<uint8_t>(public_key.begin(), public_key.end()), SecureMemoryHandle());
}

std::string Ed25519Key::GetId() const {
    return fingerprint_;
}

const std::vector<Algorithm>& Ed25519Key::GetAlgorithms() const {
    return Ed25519Algorithms();
}

bool Ed25519Key::CanSign() const {
    return !secret_key_.IsInvalid();
}

bool Ed25519Key::CanVerify() const {
    return true;
}

Result<std::vector<uint8_t>, SigningFailure> Ed25519Key::Sign(
    const Option<Algorithm> algorithm,
    std::span<const uint8_t> content) const {

    if (algorithm != Algorithm::Ed25519) {
        return Result<std::vector<uint8_t>, SigningFailure>::Err(
            SigningFailure::UnsupportedAlgorithm(algorithm.has_value()
                ? compat::format("Ed25519 key cannot sign with {}", AlgorithmName(*algorithm))
                : std::string(ErrorMessages::NO_ALGORITHM_SELECTED)));
    }
    if (!CanSign()) {
        return Result<std::vector<uint8_t>, SigningFailure>::Err(
            SigningFailure::KeyMaterial(std::string(ErrorMessages::KEY_CANNOT_SIGN)));
    }

    auto sign_result = secret_key_.WithReadAccess([content](std::span<const uint8_t> sk) {
        std::vector<uint8_t> signature(Constants::ED_25519_SIGNATURE_SIZE);
        unsigned long long signature_size = 0;
        if (crypto_sign_detached(signature.data(), &signature_size,
                                 content.data(), content.size(), sk.data()) != 0) {
            return Result<std::vector<uint8_t>, SigningFailure>::Err(
                SigningFailure::CryptoOperation("Ed25519 signing failed"));
        }
        signature.resize(static_cast<size_t>(signature_size));
        return Result<std::vector<uint8_t>, SigningFailure>::Ok(std::move(signature));
    });
    if (sign_result.IsErr()) {
        return Result<std::vector<uint8_t>, SigningFailure>::Err(
            SigningFailure::FromSodiumFailure(sign_result.UnwrapErr()));
    }
    return std::move(sign_result).Unwrap();
}

Result<bool, SigningFailure> Ed25519Key::Verify(
    const Algorithm algorithm,
    std::span<const uint8_t> content,
    std::span<const uint8_t> signature) const {

    if (algorithm != Algorithm::Ed25519) {
        return Result<bool, SigningFailure>::Err(
            SigningFailure::UnsupportedAlgorithm(
                compat::format("Ed25519 key cannot verify {}", AlgorithmName(algorithm))));
    }
    if (signature.size() != Constants::ED_25519_SIGNATURE_SIZE) {
        return Result<bool, SigningFailure>::Ok(false);
    }
    return Result<bool, SigningFailure>::Ok(
        crypto_sign_verify_detached(signature.data(), content.data(), content.size(),
                                    public_key_.data()) == 0);
}

}
