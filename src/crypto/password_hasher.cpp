#include "synccrypto/crypto/password_hasher.hpp"
#include "synccrypto/crypto/sodium_interop.hpp"
#include "synccrypto/core/format.hpp"

#include <sodium.h>

#include <algorithm>

namespace synccrypto::crypto {

static_assert(Constants::SALT_SIZE == crypto_pwhash_SALTBYTES);
static_assert(Constants::PWHASH_STRING_SIZE == crypto_pwhash_STRBYTES);
static_assert(PasswordHardness::Interactive().OpsLimit() == crypto_pwhash_OPSLIMIT_INTERACTIVE);
static_assert(PasswordHardness::Interactive().MemLimit() == crypto_pwhash_MEMLIMIT_INTERACTIVE);
static_assert(PasswordHardness::Moderate().OpsLimit() == crypto_pwhash_OPSLIMIT_MODERATE);
static_assert(PasswordHardness::Moderate().MemLimit() == crypto_pwhash_MEMLIMIT_MODERATE);
static_assert(PasswordHardness::Sensitive().OpsLimit() == crypto_pwhash_OPSLIMIT_SENSITIVE);
static_assert(PasswordHardness::Sensitive().MemLimit() == crypto_pwhash_MEMLIMIT_SENSITIVE);

Result<PasswordHasher::Salt, CryptoFailure> PasswordHasher::DeriveSalt(
    const std::span<const uint8_t> user_id) {
    if (user_id.empty()) {
        return Result<Salt, CryptoFailure>::Err(
            CryptoFailure::InvalidUserId(std::string(ErrorMessages::EMPTY_USER_ID)));
    }
    Salt salt{};
    const size_t copied = std::min(user_id.size(), salt.size());
    std::copy_n(user_id.begin(), copied, salt.begin());
    return Result<Salt, CryptoFailure>::Ok(salt);
}

Result<SecureMemoryHandle, CryptoFailure> PasswordHasher::Hash(
    const std::span<const uint8_t> password,
    const std::span<const uint8_t> salt,
    const PasswordHardness& hardness) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::NotInitialized(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (password.empty()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(std::string(ErrorMessages::EMPTY_PASSWORD)));
    }
    if (password.size() > crypto_pwhash_PASSWD_MAX) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(
                compat::format("Password of {} bytes exceeds the Argon2id maximum", password.size())));
    }
    if (salt.size() != Constants::SALT_SIZE) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(
                compat::format("Salt must be {} bytes, got {}", Constants::SALT_SIZE, salt.size())));
    }
    auto hardness_check = ValidateHardness(hardness);
    if (hardness_check.IsErr()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            std::move(hardness_check).UnwrapErr());
    }

    auto handle_result = SecureMemoryHandle::Allocate(Constants::PRIMARY_KEY_SIZE);
    if (handle_result.IsErr()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    SecureMemoryHandle primary_key = std::move(handle_result).Unwrap();

    auto hash_result = primary_key.WithWriteAccess([&](std::span<uint8_t> out) {
        return crypto_pwhash(
            out.data(),
            out.size(),
            reinterpret_cast<const char*>(password.data()),
            password.size(),
            salt.data(),
            hardness.OpsLimit(),
            hardness.MemLimit(),
            crypto_pwhash_ALG_ARGON2ID13);
    });
    if (hash_result.IsErr()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(hash_result.UnwrapErr()));
    }
    if (hash_result.Unwrap() != SodiumConstants::SUCCESS) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::HashingFailed(
                compat::format("crypto_pwhash failed (opslimit {}, memlimit {})",
                    hardness.OpsLimit(), hardness.MemLimit())));
    }

    return Result<SecureMemoryHandle, CryptoFailure>::Ok(std::move(primary_key));
}

Result<std::string, CryptoFailure> PasswordHasher::HashForVerifier(
    const std::span<const uint8_t> primary_key,
    const PasswordHardness& hardness) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<std::string, CryptoFailure>::Err(
            CryptoFailure::NotInitialized(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (primary_key.size() != Constants::PRIMARY_KEY_SIZE) {
        return Result<std::string, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(
                compat::format("Primary key must be {} bytes, got {}",
                    Constants::PRIMARY_KEY_SIZE, primary_key.size())));
    }
    auto hardness_check = ValidateHardness(hardness);
    if (hardness_check.IsErr()) {
        return Result<std::string, CryptoFailure>::Err(std::move(hardness_check).UnwrapErr());
    }

    std::array<char, crypto_pwhash_STRBYTES> out{};
    if (crypto_pwhash_str(
            out.data(),
            reinterpret_cast<const char*>(primary_key.data()),
            primary_key.size(),
            hardness.OpsLimit(),
            hardness.MemLimit()) != SodiumConstants::SUCCESS) {
        return Result<std::string, CryptoFailure>::Err(
            CryptoFailure::HashingFailed("crypto_pwhash_str failed"));
    }
    return Result<std::string, CryptoFailure>::Ok(std::string(out.data()));
}

Result<bool, CryptoFailure> PasswordHasher::VerifyHashString(
    const std::string_view hash_string,
    const std::span<const uint8_t> primary_key) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<bool, CryptoFailure>::Err(
            CryptoFailure::NotInitialized(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (primary_key.size() != Constants::PRIMARY_KEY_SIZE) {
        return Result<bool, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(
                compat::format("Primary key must be {} bytes, got {}",
                    Constants::PRIMARY_KEY_SIZE, primary_key.size())));
    }
    if (hash_string.empty() || hash_string.size() >= crypto_pwhash_STRBYTES) {
        return Result<bool, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(
                compat::format("Hash string length {} out of range", hash_string.size())));
    }

    const std::string terminated(hash_string);
    const int rc = crypto_pwhash_str_verify(
        terminated.c_str(),
        reinterpret_cast<const char*>(primary_key.data()),
        primary_key.size());
    return Result<bool, CryptoFailure>::Ok(rc == SodiumConstants::SUCCESS);
}

Result<bool, CryptoFailure> PasswordHasher::NeedsRehash(
    const std::string_view hash_string,
    const PasswordHardness& hardness) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<bool, CryptoFailure>::Err(
            CryptoFailure::NotInitialized(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (hash_string.empty() || hash_string.size() >= crypto_pwhash_STRBYTES) {
        return Result<bool, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(
                compat::format("Hash string length {} out of range", hash_string.size())));
    }

    const std::string terminated(hash_string);
    const int rc = crypto_pwhash_str_needs_rehash(
        terminated.c_str(), hardness.OpsLimit(), hardness.MemLimit());
    if (rc == SodiumConstants::FAILURE) {
        return Result<bool, CryptoFailure>::Err(
            CryptoFailure::InvalidInput("Hash string is not a valid Argon2id string"));
    }
    return Result<bool, CryptoFailure>::Ok(rc == SodiumConstants::PWHASH_NEEDS_REHASH);
}

Result<Unit, CryptoFailure> PasswordHasher::ValidateHardness(const PasswordHardness& hardness) {
    if (hardness.OpsLimit() < crypto_pwhash_OPSLIMIT_MIN ||
        hardness.OpsLimit() > crypto_pwhash_OPSLIMIT_MAX) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(
                compat::format("opslimit {} outside Argon2id range", hardness.OpsLimit())));
    }
    if (hardness.MemLimit() < crypto_pwhash_MEMLIMIT_MIN ||
        hardness.MemLimit() > crypto_pwhash_MEMLIMIT_MAX) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(
                compat::format("memlimit {} outside Argon2id range", hardness.MemLimit())));
    }
    return Result<Unit, CryptoFailure>::Ok(unit);
}

} // namespace synccrypto::crypto
