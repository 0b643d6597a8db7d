#include "httpsig/signing/signer.hpp"
#include "httpsig/keys/default_keychain.hpp"
#include "httpsig/keys/key_ids.hpp"
#include "httpsig/models/header_names.hpp"
#include "httpsig/crypto/sodium_interop.hpp"
#include "httpsig/core/constants.hpp"
#include "httpsig/debug/sign_logger.hpp"

namespace httpsig::auth::signing {

using keys::DefaultKeychain;
using keys::DefaultKeyId;
using models::Challenge;
using models::HeaderNames;
using crypto::SodiumInterop;

namespace {
    Option<Algorithm> NegotiateAlgorithm(const interfaces::IKey& key, const AlgorithmSet& accepted) {
        for (const Algorithm algorithm : key.GetAlgorithms()) {
            if (accepted.contains(algorithm)) {
                return Some(algorithm);
            }
        }
        return None<Algorithm>();
    }
}

Signer::Signer(KeychainPtr keychain, KeyIdPtr key_id, const SignerConfig config)
    : keychain_(keychain ? std::move(keychain) : DefaultKeychain::Empty())
      , key_id_(key_id ? std::move(key_id) : DefaultKeyId::Instance())
      , config_(config)
      , challenge_(Challenge::Preemptive())
      , mutex_(std::make_unique<std::mutex>()) {
    std::lock_guard guard(*mutex_);
    candidate_keys_ = keychain_->FilterAlgorithms(challenge_->GetAlgorithms());
    RotateUntilCanSign();
    debug::LogCandidatesFiltered("INIT", candidate_keys_->Size());
}

Signer::Signer(KeyPtr single_key, KeyIdPtr key_id, const SignerConfig config)
    : Signer(DefaultKeychain::Create({std::move(single_key)}), std::move(key_id), config) {
}

void Signer::RotateUntilCanSign() {
    while (!candidate_keys_->IsEmpty() && !candidate_keys_->CurrentKey()->CanSign()) {
        debug::LogKeySkipped(key_id_->GetId(*candidate_keys_->CurrentKey()));
        candidate_keys_ = candidate_keys_->Discard();
    }
}

KeychainPtr Signer::GetCandidateKeys() const {
    std::lock_guard guard(*mutex_);
    return candidate_keys_;
}

ChallengePtr Signer::GetChallenge() const {
    std::lock_guard guard(*mutex_);
    return challenge_;
}

Result<bool, SigningFailure> Signer::RotateKeys() {
    return RotateKeys(Challenge::Preemptive());
}

Result<bool, SigningFailure> Signer::RotateKeys(const ChallengePtr& next_challenge) {
    return RotateKeys(next_challenge, None<Authorization>());
}

Result<bool, SigningFailure> Signer::RotateKeys(
    const ChallengePtr& next_challenge,
    const Option<Authorization>& failed_authorization) {

    if (!next_challenge) {
        return Result<bool, SigningFailure>::Err(
            SigningFailure::InvalidArgument(std::string(ErrorMessages::NULL_CHALLENGE)));
    }

    std::lock_guard guard(*mutex_);
    debug::RotationDecision decision = debug::RotationDecision::Kept;
    if (*challenge_ == *next_challenge) {
        if (!candidate_keys_->IsEmpty()
            && failed_authorization.has_value()
            && key_id_->GetId(*candidate_keys_->CurrentKey()) == failed_authorization->GetKeyId()) {
            candidate_keys_ = candidate_keys_->Discard();
            decision = debug::RotationDecision::Advanced;
        }
    } else {
        candidate_keys_ = keychain_->FilterAlgorithms(next_challenge->GetAlgorithms());
        decision = debug::RotationDecision::Refiltered;
    }
    RotateUntilCanSign();
    challenge_ = next_challenge;

    const bool has_candidates = !candidate_keys_->IsEmpty();
    debug::LogRotation(decision, has_candidates, candidate_keys_->Size());
    return Result<bool, SigningFailure>::Ok(has_candidates);
}

Option<Authorization> Signer::Sign(const RequestContent& request_content) const {
    return Sign(request_content, request_content.GetHeaderNames());
}

Option<Authorization> Signer::Sign(
    const RequestContent& request_content,
    const std::vector<std::string>& elective_headers) const {

    KeychainPtr candidates;
    ChallengePtr challenge;
    {
        std::lock_guard guard(*mutex_);
        candidates = candidate_keys_;
        challenge = challenge_;
    }

    if (candidates->IsEmpty()) {
        debug::LogNoSignature(ErrorMessages::EMPTY_KEYCHAIN);
        return None<Authorization>();
    }
    const KeyPtr key = candidates->CurrentKey();

    const Option<Algorithm> algorithm = NegotiateAlgorithm(*key, challenge->GetAlgorithms());
    if (!algorithm.has_value() && config_.IsStrictNegotiation()) {
        debug::LogNoSignature(ErrorMessages::NO_ALGORITHM_SELECTED);
        return None<Authorization>();
    }

    std::vector<std::string> headers = HeaderNames::Union(elective_headers, challenge->GetHeaders());

    auto signature = key->Sign(algorithm, request_content.GetBytesToSign(headers));
    if (signature.IsErr()) {
        debug::LogNoSignature(signature.UnwrapErr().message);
        return None<Authorization>();
    }

    if (auto init_result = SodiumInterop::Initialize(); init_result.IsErr()) {
        debug::LogNoSignature(init_result.UnwrapErr().message);
        return None<Authorization>();
    }
    auto encoded = SodiumInterop::ToBase64(signature.Unwrap());
    if (encoded.IsErr()) {
        debug::LogNoSignature(encoded.UnwrapErr().message);
        return None<Authorization>();
    }

    std::string key_id = key_id_->GetId(*key);
    debug::LogSignature(key_id, algorithm.has_value() ? AlgorithmName(*algorithm) : "none", headers);
    return Some(Authorization(
        std::move(key_id),
        std::move(encoded).Unwrap(),
        std::move(headers),
        algorithm));
}

}
