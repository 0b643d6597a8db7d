#include <catch2/catch_test_macros.hpp>
#include "httpsig/crypto/sodium_secure_memory_handle.hpp"
#include "httpsig/crypto/sodium_interop.hpp"
#include <span>
#include <vector>
using namespace httpsig::auth;
using namespace httpsig::auth::crypto;

namespace {
    std::vector<uint8_t> Contents(const SecureMemoryHandle& handle) {
        return handle.WithReadAccess([](std::span<const uint8_t> bytes) {
            return std::vector<uint8_t>(bytes.begin(), bytes.end());
        }).Unwrap();
    }
}

TEST_CASE("SecureMemoryHandle - Allocation", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Allocate valid size") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        REQUIRE_FALSE(handle.IsInvalid());
        REQUIRE(handle.Size() == 32);
    }
    SECTION("Cannot allocate zero bytes") {
        REQUIRE(SecureMemoryHandle::Allocate(0).IsErr());
    }
    SECTION("Default handle is invalid") {
        SecureMemoryHandle handle;
        REQUIRE(handle.IsInvalid());
        auto access = handle.WithReadAccess([](std::span<const uint8_t> bytes) { return bytes.size(); });
        REQUIRE(access.IsErr());
        REQUIRE(access.UnwrapErr().type == SodiumFailureType::InvalidOperation);
        REQUIRE(handle.Write(std::vector<uint8_t>{1}).IsErr());
    }
}
TEST_CASE("SecureMemoryHandle - Move Semantics", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto handle1 = SecureMemoryHandle::Allocate(32).Unwrap();
    SecureMemoryHandle handle2(std::move(handle1));
    REQUIRE(handle1.IsInvalid());
    REQUIRE_FALSE(handle2.IsInvalid());
    REQUIRE(handle2.Size() == 32);
}
TEST_CASE("SecureMemoryHandle - Read and Write", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Written bytes are readable in place") {
        auto handle = SecureMemoryHandle::Allocate(4).Unwrap();
        const std::vector<uint8_t> data = {1, 2, 3, 4};
        REQUIRE(handle.Write(data).IsOk());
        REQUIRE(Contents(handle) == data);
    }
    SECTION("Short write zero-fills the tail") {
        auto handle = SecureMemoryHandle::Allocate(4).Unwrap();
        const std::vector<uint8_t> data = {9, 9};
        REQUIRE(handle.Write(data).IsOk());
        REQUIRE(Contents(handle) == std::vector<uint8_t>{9, 9, 0, 0});
    }
    SECTION("Oversized write is rejected") {
        auto handle = SecureMemoryHandle::Allocate(2).Unwrap();
        const std::vector<uint8_t> data = {1, 2, 3};
        auto result = handle.Write(data);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::BufferTooSmall);
    }
    SECTION("WithReadAccess exposes the region") {
        auto handle = SecureMemoryHandle::Allocate(3).Unwrap();
        const std::vector<uint8_t> data = {5, 6, 7};
        REQUIRE(handle.Write(data).IsOk());
        auto sum = handle.WithReadAccess([](std::span<const uint8_t> bytes) {
            int total = 0;
            for (const auto b : bytes) {
                total += b;
            }
            return total;
        });
        REQUIRE(sum.Unwrap() == 18);
    }
}
