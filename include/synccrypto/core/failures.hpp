#pragma once
#include <string>
#include <utility>
namespace synccrypto {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    InvalidOperation
};
enum class CryptoFailureType {
    Generic,
    NotInitialized,
    InvalidInput,
    InvalidUserId,
    InvalidPassword,
    HashingFailed,
    DerivationFailed,
    AuthenticationFailed,
    RandomGenerationFailed,
    EncryptionFailed,
    PrimaryKeyDerivationFailed,
    VerifierDerivationFailed,
    StretchKeyDerivationFailed,
    EnvelopeEncryptionFailed
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
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class CryptoFailure {
public:
    CryptoFailureType type;
    std::string message;
    CryptoFailure(const CryptoFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    [[nodiscard]] bool IsInvalidInput() const noexcept {
        return type == CryptoFailureType::InvalidInput ||
               type == CryptoFailureType::InvalidUserId ||
               type == CryptoFailureType::InvalidPassword;
    }
    static CryptoFailure Generic(std::string msg) {
        return {CryptoFailureType::Generic, std::move(msg)};
    }
    static CryptoFailure NotInitialized(std::string msg) {
        return {CryptoFailureType::NotInitialized, std::move(msg)};
    }
    static CryptoFailure InvalidInput(std::string msg) {
        return {CryptoFailureType::InvalidInput, std::move(msg)};
    }
    static CryptoFailure InvalidUserId(std::string msg) {
        return {CryptoFailureType::InvalidUserId, std::move(msg)};
    }
    static CryptoFailure InvalidPassword(std::string msg) {
        return {CryptoFailureType::InvalidPassword, std::move(msg)};
    }
    static CryptoFailure HashingFailed(std::string msg) {
        return {CryptoFailureType::HashingFailed, std::move(msg)};
    }
    static CryptoFailure DerivationFailed(std::string msg) {
        return {CryptoFailureType::DerivationFailed, std::move(msg)};
    }
    static CryptoFailure AuthenticationFailed(std::string msg) {
        return {CryptoFailureType::AuthenticationFailed, std::move(msg)};
    }
    static CryptoFailure RandomGenerationFailed(std::string msg) {
        return {CryptoFailureType::RandomGenerationFailed, std::move(msg)};
    }
    static CryptoFailure EncryptionFailed(std::string msg) {
        return {CryptoFailureType::EncryptionFailed, std::move(msg)};
    }
    static CryptoFailure PrimaryKeyDerivationFailed(std::string msg) {
        return {CryptoFailureType::PrimaryKeyDerivationFailed, std::move(msg)};
    }
    static CryptoFailure VerifierDerivationFailed(std::string msg) {
        return {CryptoFailureType::VerifierDerivationFailed, std::move(msg)};
    }
    static CryptoFailure StretchKeyDerivationFailed(std::string msg) {
        return {CryptoFailureType::StretchKeyDerivationFailed, std::move(msg)};
    }
    static CryptoFailure EnvelopeEncryptionFailed(std::string msg) {
        return {CryptoFailureType::EnvelopeEncryptionFailed, std::move(msg)};
    }
    static CryptoFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::InitializationFailed) {
            return NotInitialized(sf.message);
        }
        return Generic(sf.message);
    }
};
}
