#pragma once
#include "httpsig/core/result.hpp"
#include "httpsig/core/option.hpp"
#include "httpsig/core/failures.hpp"
#include "httpsig/configuration/signer_config.hpp"
#include "httpsig/interfaces/i_keychain.hpp"
#include "httpsig/interfaces/i_key_id.hpp"
#include "httpsig/models/authorization.hpp"
#include "httpsig/models/challenge.hpp"
#include "httpsig/models/request_content.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>
namespace httpsig::auth::signing {
using configuration::SignerConfig;
using interfaces::KeychainPtr;
using interfaces::KeyIdPtr;
using interfaces::KeyPtr;
using models::Authorization;
using models::ChallengePtr;
using models::RequestContent;

/**
 * @brief Selects a signing key, signs requests and rotates keys on failure
 *
 * The signer keeps the keychain it was given and a candidate keychain that
 * holds only keys compatible with the current challenge and able to sign.
 * The candidate keychain and the challenge are guarded by one lock and are
 * always observed together.
 *
 * @example
 * ```cpp
 * Signer signer(DefaultKeychain::Create({rsa_key, hmac_key}));
 * auto authz = signer.Sign(request, {"(request-target)", "date"});
 * // server answered 401 with a challenge
 * if (signer.RotateKeys(challenge, authz).UnwrapOr(false)) {
 *     authz = signer.Sign(request, {"(request-target)", "date"});
 * }
 * ```
 */
class Signer {
public:
    /// A null keychain is treated as empty; a null key id selects DefaultKeyId.
    explicit Signer(
        KeychainPtr keychain,
        KeyIdPtr key_id = nullptr,
        SignerConfig config = SignerConfig::Default());

    Signer(
        KeyPtr single_key,
        KeyIdPtr key_id,
        SignerConfig config = SignerConfig::Default());

    /// A moved-from Signer holds no lock and must only be destroyed or assigned to.
    Signer(Signer&&) noexcept = default;
    Signer& operator=(Signer&&) noexcept = default;
    Signer(const Signer&) = delete;
    Signer& operator=(const Signer&) = delete;

    /// The keychain supplied at construction, never narrowed.
    [[nodiscard]] const KeychainPtr& GetKeychain() const noexcept {
        return keychain_;
    }

    /// The challenge-filtered and rotated keychain.
    [[nodiscard]] KeychainPtr GetCandidateKeys() const;

    [[nodiscard]] ChallengePtr GetChallenge() const;

    [[nodiscard]] const KeyIdPtr& GetKeyId() const noexcept {
        return key_id_;
    }

    [[nodiscard]] const SignerConfig& GetConfig() const noexcept {
        return config_;
    }

    /// Resets negotiation to the preemptive challenge.
    Result<bool, SigningFailure> RotateKeys();

    Result<bool, SigningFailure> RotateKeys(const ChallengePtr& next_challenge);

    /**
     * @brief Rotate candidate keys after a failed request
     *
     * With the same challenge as before, the current key is discarded only if
     * failed_authorization names it. A different challenge re-filters the
     * original keychain from scratch.
     *
     * @return Ok(true) if a key able to sign remains, Ok(false) if none does,
     *         Err(InvalidArgument) for a null challenge (state untouched)
     */
    Result<bool, SigningFailure> RotateKeys(
        const ChallengePtr& next_challenge,
        const Option<Authorization>& failed_authorization);

    /// Signs with every header present on the request as elective headers.
    [[nodiscard]] Option<Authorization> Sign(const RequestContent& request_content) const;

    /**
     * @brief Sign a request with the current candidate key
     *
     * Signed headers are elective_headers in the given order followed by any
     * header the challenge requires that was not already listed.
     *
     * @return None when no key is available or the key produced no signature
     */
    [[nodiscard]] Option<Authorization> Sign(
        const RequestContent& request_content,
        const std::vector<std::string>& elective_headers) const;

private:
    /// Caller holds mutex_.
    void RotateUntilCanSign();

    KeychainPtr keychain_;
    KeyIdPtr key_id_;
    SignerConfig config_;
    KeychainPtr candidate_keys_;
    ChallengePtr challenge_;
    std::unique_ptr<std::mutex> mutex_;
};
}
