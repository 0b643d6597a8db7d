#pragma once

/**
 * @file sign_logger.hpp
 * @brief Debug logging for key selection, rotation and signing decisions.
 *
 * Writes to stdout only when built with HTTPSIG_DEBUG_SIGNING
 * (CMake: -DHTTPSIG_DEBUG_SIGNING=ON). Secret key material is never logged,
 * only key identifiers, algorithms and header lists.
 */

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#ifdef HTTPSIG_DEBUG_SIGNING
#include "httpsig/core/format.hpp"
#endif

namespace httpsig::debug {

enum class RotationDecision {
    Advanced,
    Kept,
    Refiltered
};

#ifdef HTTPSIG_DEBUG_SIGNING

inline const char* RotationDecisionToString(const RotationDecision decision) {
    switch (decision) {
        case RotationDecision::Advanced: return "ADVANCED";
        case RotationDecision::Kept: return "KEPT";
        case RotationDecision::Refiltered: return "REFILTERED";
    }
    return "UNKNOWN";
}

#define HTTPSIG_LOG_MSG(operation, message) \
    do { \
        fprintf(stdout, "[HTTPSIG-DEBUG] %s %s\n", operation, message); \
        fflush(stdout); \
    } while(0)

#define HTTPSIG_LOG_VALUE(operation, name, value) \
    do { \
        fprintf(stdout, "[HTTPSIG-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define HTTPSIG_LOG_TEXT(operation, name, text) \
    do { \
        fprintf(stdout, "[HTTPSIG-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            std::string(text).c_str()); \
        fflush(stdout); \
    } while(0)

inline void LogCandidatesFiltered(const char* operation, const size_t candidate_count) {
    HTTPSIG_LOG_VALUE(operation, "candidate_keys", candidate_count);
}

inline void LogKeySkipped(const std::string_view key_id) {
    HTTPSIG_LOG_TEXT("SKIP", "key_cannot_sign", key_id);
}

inline void LogRotation(
    const RotationDecision decision,
    const bool has_candidates,
    const size_t candidate_count) {

    HTTPSIG_LOG_MSG("ROTATE", RotationDecisionToString(decision));
    HTTPSIG_LOG_VALUE("ROTATE", "candidate_keys", candidate_count);
    HTTPSIG_LOG_MSG("ROTATE", has_candidates ? "usable_key: YES" : "usable_key: NO");
}

inline void LogSignature(
    const std::string_view key_id,
    const std::string_view algorithm,
    const std::vector<std::string>& headers) {

    HTTPSIG_LOG_TEXT("SIGN", "key_id", key_id);
    HTTPSIG_LOG_TEXT("SIGN", "algorithm", algorithm);
    HTTPSIG_LOG_TEXT("SIGN", "headers", compat::format("{}", compat::join(headers, " ")));
}

inline void LogNoSignature(const std::string_view reason) {
    HTTPSIG_LOG_TEXT("SIGN", "no_signature", reason);
}

#else // !HTTPSIG_DEBUG_SIGNING

#define HTTPSIG_LOG_MSG(operation, message) ((void)0)
#define HTTPSIG_LOG_VALUE(operation, name, value) ((void)0)
#define HTTPSIG_LOG_TEXT(operation, name, text) ((void)0)

inline void LogCandidatesFiltered(const char*, size_t) {}
inline void LogKeySkipped(std::string_view) {}
inline void LogRotation(RotationDecision, bool, size_t) {}
inline void LogSignature(std::string_view, std::string_view, const std::vector<std::string>&) {}
inline void LogNoSignature(std::string_view) {}

#endif // HTTPSIG_DEBUG_SIGNING

} // namespace httpsig::debug
