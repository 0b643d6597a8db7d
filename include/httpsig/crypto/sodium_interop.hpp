#pragma once

#include "httpsig/core/result.hpp"
#include "httpsig/core/failures.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace httpsig::auth::crypto {

/**
 * @brief Interop layer for libsodium
 *
 * Library initialization, secure memory, constant-time comparison and the
 * Base64 codec used for signature values in authorization headers.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Must succeed before secure memory is used.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are cleared through a volatile pointer, larger ones with
     * sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without inspecting content.
     */
    static bool ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    /**
     * @brief Encode bytes as padded standard Base64
     */
    static Result<std::string, SodiumFailure> ToBase64(std::span<const uint8_t> data);

    /**
     * @brief Decode padded standard Base64
     *
     * @return Ok(bytes) or Err when the input is not valid Base64
     */
    static Result<std::vector<uint8_t>, SodiumFailure> FromBase64(std::string_view encoded);

    /**
     * @brief Allocate guard-paged, locked memory with sodium_malloc
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace httpsig::auth::crypto
