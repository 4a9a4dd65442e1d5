#pragma once

#include "synccrypto/core/result.hpp"
#include "synccrypto/core/failures.hpp"
#include "synccrypto/configuration/account_key_config.hpp"
#include "synccrypto/crypto/sodium_secure_memory_handle.hpp"
#include "synccrypto/models/account_keys.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace synccrypto::account {

using configuration::AccountKeyConfig;
using crypto::SecureMemoryHandle;
using models::AccountKeys;
using models::LoginKeys;

/**
 * @brief Builds and recovers account key material
 *
 * Derivation chain:
 *
 *   salt              = user_id zero-padded / truncated to 16 bytes
 *   primary_key       = Argon2id(password, salt)                 32 bytes
 *   password_verifier = KDF(primary_key, 1, "Password")          32 bytes
 *   stretch_key       = KDF(primary_key, 2, "Stretchy")          32 bytes
 *   data_key          = random                                   32 bytes
 *   envelope          = SymmetricCodec::Encrypt(data_key, stretch_key)  72 bytes
 *
 * The data key is only recoverable through the stretch key, so the
 * envelope is safe to hand to a server that also knows the verifier.
 *
 * Stateless apart from its configuration; one instance may be shared by
 * several threads. SodiumInterop::Initialize() must have succeeded first.
 */
class AccountKeyFactory {
public:
    explicit AccountKeyFactory(AccountKeyConfig config = AccountKeyConfig::Default()) noexcept;

    /**
     * @brief Create the full key bundle for a new account
     *
     * Empty user_id / password fail with InvalidUserId / InvalidPassword
     * before any libsodium call. Later failures are reported as
     * PrimaryKeyDerivationFailed, VerifierDerivationFailed,
     * StretchKeyDerivationFailed, RandomGenerationFailed or
     * EnvelopeEncryptionFailed. No partial bundle is ever returned.
     *
     * user_id and password are read in place and never copied; the caller
     * owns those buffers and must wipe them (e.g. SodiumInterop::SecureWipe).
     */
    [[nodiscard]] Result<AccountKeys, CryptoFailure> CreateAccount(
        std::span<const uint8_t> user_id,
        std::span<const uint8_t> password) const;

    [[nodiscard]] Result<AccountKeys, CryptoFailure> CreateAccount(
        std::string_view user_id,
        std::string_view password) const;

    /**
     * @brief Re-derive the server verifier from a stored primary key
     */
    [[nodiscard]] Result<std::vector<uint8_t>, CryptoFailure> DerivePasswordVerifier(
        std::span<const uint8_t> primary_key) const;

    /**
     * @brief Verifier and stretch key for a login with a recovery key
     */
    [[nodiscard]] Result<LoginKeys, CryptoFailure> PrepareForLogin(
        std::span<const uint8_t> primary_key) const;

    /**
     * @brief Open a protected key envelope with a stretch key
     *
     * AuthenticationFailed means a wrong key or a modified envelope.
     */
    [[nodiscard]] Result<SecureMemoryHandle, CryptoFailure> ExtractDataKey(
        std::span<const uint8_t> protected_key_envelope,
        std::span<const uint8_t> stretch_key) const;

    /**
     * @brief Recover the data key from user id, password and envelope
     *
     * A wrong password surfaces as AuthenticationFailed, never as any
     * other failure kind. As with CreateAccount, the credential buffers are
     * not copied and stay the caller's to wipe.
     */
    [[nodiscard]] Result<SecureMemoryHandle, CryptoFailure> RecoverDataKey(
        std::span<const uint8_t> user_id,
        std::span<const uint8_t> password,
        std::span<const uint8_t> protected_key_envelope) const;

    [[nodiscard]] Result<SecureMemoryHandle, CryptoFailure> RecoverDataKey(
        std::string_view user_id,
        std::string_view password,
        std::span<const uint8_t> protected_key_envelope) const;

    /**
     * @brief Argon2id string hash of the primary key for string-hash APIs
     */
    [[nodiscard]] Result<std::string, CryptoFailure> CreateVerifierString(
        std::span<const uint8_t> primary_key) const;

    [[nodiscard]] const AccountKeyConfig& Config() const noexcept { return config_; }

private:
    [[nodiscard]] Result<SecureMemoryHandle, CryptoFailure> DerivePrimaryKey(
        std::span<const uint8_t> user_id,
        std::span<const uint8_t> password) const;

    AccountKeyConfig config_;
};

} // namespace synccrypto::account
