#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace httpsig::auth {
struct Constants {
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t ED_25519_SECRET_KEY_SIZE = 64;
    static constexpr size_t ED_25519_SEED_SIZE = 32;
    static constexpr size_t ED_25519_SIGNATURE_SIZE = 64;
    static constexpr size_t MIN_HMAC_SECRET_SIZE = 1;
    static constexpr size_t MIN_RSA_KEY_BITS = 1024;
    static constexpr unsigned int DEFAULT_RSA_KEY_BITS = 2048;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct SignatureConstants {
    static constexpr std::string_view SCHEME = "Signature";
    static constexpr std::string_view HEADER_DATE = "date";
    static constexpr std::string_view HEADER_REQUEST_TARGET = "(request-target)";
    static constexpr std::string_view PREEMPTIVE_REALM = "<preemptive>";
    static constexpr std::string_view PARAM_REALM = "realm";
    static constexpr std::string_view PARAM_KEY_ID = "keyId";
    static constexpr std::string_view PARAM_HEADERS = "headers";
    static constexpr std::string_view PARAM_ALGORITHM = "algorithm";
    static constexpr std::string_view PARAM_ALGORITHMS = "algorithms";
    static constexpr std::string_view PARAM_SIGNATURE = "signature";
    static constexpr std::string_view CONTENT_LINE_SEPARATOR = "\n";
    static constexpr std::string_view HEADER_VALUE_SEPARATOR = ", ";
    static constexpr std::string_view HEADER_NAME_SEPARATOR = ": ";
    static constexpr std::string_view USER_KEYS_SEGMENT = "/keys/";
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_HMAC = "HMAC";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view NULL_CHALLENGE = "Next challenge cannot be null";
    static constexpr std::string_view NO_ALGORITHM_SELECTED = "No signature algorithm selected";
    static constexpr std::string_view KEY_CANNOT_SIGN = "Key has no private material";
    static constexpr std::string_view EMPTY_KEYCHAIN = "Keychain is empty";
};
}
