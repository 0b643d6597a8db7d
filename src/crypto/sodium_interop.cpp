#include "httpsig/crypto/sodium_interop.hpp"
#include "httpsig/core/constants.hpp"

namespace httpsig::auth::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                "Buffer size " + std::to_string(buffer.size()) +
                " exceeds maximum " + std::to_string(MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        volatile uint8_t* vbuf = buffer.data();
        for (size_t i = 0; i < buffer.size(); ++i) {
            vbuf[i] = 0;
        }
    } else {
        sodium_memzero(buffer.data(), buffer.size());
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {

    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

// ============================================================================
// Base64
// ============================================================================

Result<std::string, SodiumFailure> SodiumInterop::ToBase64(std::span<const uint8_t> data) {
    if (!IsInitialized()) {
        return Result<std::string, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (data.empty()) {
        return Result<std::string, SodiumFailure>::Ok(std::string());
    }

    const size_t encoded_size = sodium_base64_encoded_len(
        data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string encoded(encoded_size, '\0');

    if (sodium_bin2base64(encoded.data(), encoded.size(),
                          data.data(), data.size(),
                          sodium_base64_VARIANT_ORIGINAL) == nullptr) {
        return Result<std::string, SodiumFailure>::Err(
            SodiumFailure::EncodingFailed("Base64 encoding failed"));
    }

    // encoded_size counts the terminating NUL
    encoded.resize(encoded_size - 1);
    return Result<std::string, SodiumFailure>::Ok(std::move(encoded));
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::FromBase64(std::string_view encoded) {
    if (!IsInitialized()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    std::vector<uint8_t> decoded(encoded.size() / 4 * 3 + 3);
    size_t decoded_size = 0;

    if (sodium_base642bin(decoded.data(), decoded.size(),
                          encoded.data(), encoded.size(),
                          nullptr, &decoded_size, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::EncodingFailed("Invalid Base64 input"));
    }

    decoded.resize(decoded_size);
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(decoded));
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(const size_t size) noexcept {
    if (!IsInitialized() || size == 0 || size > MAX_BUFFER_SIZE) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace httpsig::auth::crypto
