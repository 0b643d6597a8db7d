#pragma once
#include <string>
#include <utility>
namespace httpsig::auth {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    EncodingFailed,
    InvalidOperation
};
enum class SigningFailureType {
    Generic,
    InvalidArgument,
    InvalidInput,
    KeyMaterial,
    KeyGeneration,
    UnsupportedAlgorithm,
    CryptoOperation,
    Encode,
    Decode,
    InitializationFailed,
    SecureMemory
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure EncodingFailed(std::string msg) {
        return {SodiumFailureType::EncodingFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class SigningFailure {
public:
    SigningFailureType type;
    std::string message;
    SigningFailure(const SigningFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SigningFailure Generic(std::string msg) {
        return {SigningFailureType::Generic, std::move(msg)};
    }
    static SigningFailure InvalidArgument(std::string msg) {
        return {SigningFailureType::InvalidArgument, std::move(msg)};
    }
    static SigningFailure InvalidInput(std::string msg) {
        return {SigningFailureType::InvalidInput, std::move(msg)};
    }
    static SigningFailure KeyMaterial(std::string msg) {
        return {SigningFailureType::KeyMaterial, std::move(msg)};
    }
    static SigningFailure KeyGeneration(std::string msg) {
        return {SigningFailureType::KeyGeneration, std::move(msg)};
    }
    static SigningFailure UnsupportedAlgorithm(std::string msg) {
        return {SigningFailureType::UnsupportedAlgorithm, std::move(msg)};
    }
    static SigningFailure CryptoOperation(std::string msg) {
        return {SigningFailureType::CryptoOperation, std::move(msg)};
    }
    static SigningFailure Encode(std::string msg) {
        return {SigningFailureType::Encode, std::move(msg)};
    }
    static SigningFailure Decode(std::string msg) {
        return {SigningFailureType::Decode, std::move(msg)};
    }
    static SigningFailure InitializationFailed(std::string msg) {
        return {SigningFailureType::InitializationFailed, std::move(msg)};
    }
    static SigningFailure SecureMemory(std::string msg) {
        return {SigningFailureType::SecureMemory, std::move(msg)};
    }
    static SigningFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::InitializationFailed) {
            return InitializationFailed(sf.message);
        }
        return SecureMemory(sf.message);
    }
};
}
