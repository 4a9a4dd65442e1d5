#pragma once

#include "synccrypto/core/result.hpp"
#include "synccrypto/core/failures.hpp"
#include "synccrypto/core/constants.hpp"
#include "synccrypto/configuration/account_key_config.hpp"
#include "synccrypto/crypto/sodium_secure_memory_handle.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace synccrypto::crypto {

using configuration::PasswordHardness;

/**
 * @brief Argon2id password hashing (libsodium crypto_pwhash)
 *
 * Hash() turns a password and a 16-byte salt into the 32-byte primary
 * key. The salt is derived from the user id with DeriveSalt():
 * ids shorter than 16 bytes are zero-padded on the right, longer ids are
 * truncated. Distinct ids that agree on their first 16 bytes, or that
 * differ only by trailing zero bytes, therefore share a salt.
 *
 * HashForVerifier() produces a self-describing PHC string
 * ("$argon2id$v=19$m=...,t=...,p=...$salt$hash") of the primary key for
 * APIs that store and compare string hashes.
 */
class PasswordHasher {
public:
    using Salt = std::array<uint8_t, Constants::SALT_SIZE>;

    [[nodiscard]] static Result<Salt, CryptoFailure> DeriveSalt(
        std::span<const uint8_t> user_id);

    /**
     * @brief Hash a password into a primary key
     *
     * @param password Non-empty password bytes (not copied)
     * @param salt Exactly Constants::SALT_SIZE bytes
     * @param hardness Argon2id cost parameters
     * @return Ok(32-byte secure handle), InvalidInput, NotInitialized or HashingFailed
     */
    [[nodiscard]] static Result<SecureMemoryHandle, CryptoFailure> Hash(
        std::span<const uint8_t> password,
        std::span<const uint8_t> salt,
        const PasswordHardness& hardness);

    [[nodiscard]] static Result<std::string, CryptoFailure> HashForVerifier(
        std::span<const uint8_t> primary_key,
        const PasswordHardness& hardness = PasswordHardness::Moderate());

    /**
     * @brief Check a primary key against a HashForVerifier() string
     *
     * Ok(false) covers both a mismatch and a malformed hash string.
     */
    [[nodiscard]] static Result<bool, CryptoFailure> VerifyHashString(
        std::string_view hash_string,
        std::span<const uint8_t> primary_key);

    [[nodiscard]] static Result<bool, CryptoFailure> NeedsRehash(
        std::string_view hash_string,
        const PasswordHardness& hardness);

private:
    static Result<Unit, CryptoFailure> ValidateHardness(const PasswordHardness& hardness);

    PasswordHasher() = delete;
};

} // namespace synccrypto::crypto
