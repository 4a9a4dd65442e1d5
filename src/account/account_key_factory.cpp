#include "synccrypto/account/account_key_factory.hpp"
#include "synccrypto/crypto/key_deriver.hpp"
#include "synccrypto/crypto/password_hasher.hpp"
#include "synccrypto/crypto/sodium_interop.hpp"
#include "synccrypto/crypto/symmetric_codec.hpp"
#include "synccrypto/core/constants.hpp"
#include "synccrypto/core/format.hpp"
#include "synccrypto/debug/key_logger.hpp"

#include <utility>

namespace synccrypto::account {

using crypto::KeyDeriver;
using crypto::PasswordHasher;
using crypto::ScopedWipe;
using crypto::SodiumInterop;
using crypto::SymmetricCodec;

namespace {

template<typename T>
Result<T, CryptoFailure> Flatten(Result<Result<T, CryptoFailure>, SodiumFailure> nested) {
    if (nested.IsErr()) {
        return Result<T, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(nested.UnwrapErr()));
    }
    return std::move(nested).Unwrap();
}

std::span<const uint8_t> AsBytes(const std::string_view text) noexcept {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

Result<Unit, CryptoFailure> ValidateCredentials(
    const std::span<const uint8_t> user_id,
    const std::span<const uint8_t> password) {
    if (user_id.empty()) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::InvalidUserId(std::string(ErrorMessages::EMPTY_USER_ID)));
    }
    if (password.empty()) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::InvalidPassword(std::string(ErrorMessages::EMPTY_PASSWORD)));
    }
    return Result<Unit, CryptoFailure>::Ok(unit);
}

Result<Unit, CryptoFailure> RequireSize(
    const std::span<const uint8_t> value,
    const size_t expected,
    const std::string_view name) {
    if (value.size() != expected) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(
                compat::format("{} must be {} bytes, got {}", name, expected, value.size())));
    }
    return Result<Unit, CryptoFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, CryptoFailure> DeriveVerifierFrom(std::span<const uint8_t> primary_key) {
    return KeyDeriver::DeriveBytes(
        primary_key,
        KdfConstants::PASSWORD_VERIFIER_SUBKEY_ID,
        KdfConstants::PASSWORD_VERIFIER_CONTEXT,
        Constants::PASSWORD_VERIFIER_SIZE);
}

Result<SecureMemoryHandle, CryptoFailure> DeriveStretchKeyFrom(std::span<const uint8_t> primary_key) {
    return KeyDeriver::Derive(
        primary_key,
        KdfConstants::STRETCH_KEY_SUBKEY_ID,
        KdfConstants::STRETCH_KEY_CONTEXT,
        Constants::STRETCH_KEY_SIZE);
}

} // namespace

AccountKeyFactory::AccountKeyFactory(AccountKeyConfig config) noexcept
    : config_(config) {}

// ============================================================================
// Account creation
// ============================================================================

Result<AccountKeys, CryptoFailure> AccountKeyFactory::CreateAccount(
    const std::span<const uint8_t> user_id,
    const std::span<const uint8_t> password) const {
    auto credentials_check = ValidateCredentials(user_id, password);
    if (credentials_check.IsErr()) {
        return Result<AccountKeys, CryptoFailure>::Err(std::move(credentials_check).UnwrapErr());
    }

    auto primary_result = DerivePrimaryKey(user_id, password);
    if (primary_result.IsErr()) {
        return Result<AccountKeys, CryptoFailure>::Err(std::move(primary_result).UnwrapErr());
    }
    SecureMemoryHandle primary_key = std::move(primary_result).Unwrap();

    auto verifier_result = Flatten(primary_key.WithReadAccess([](std::span<const uint8_t> pk) {
        debug::LogPrimaryKey("CREATE", pk);
        return DeriveVerifierFrom(pk);
    })).MapErr([](CryptoFailure f) {
        return CryptoFailure::VerifierDerivationFailed(std::move(f.message));
    });
    if (verifier_result.IsErr()) {
        return Result<AccountKeys, CryptoFailure>::Err(std::move(verifier_result).UnwrapErr());
    }

    // Dropped (and zeroed by sodium_free) on every return below
    auto stretch_result = Flatten(primary_key.WithReadAccess([](std::span<const uint8_t> pk) {
        return DeriveStretchKeyFrom(pk);
    })).MapErr([](CryptoFailure f) {
        return CryptoFailure::StretchKeyDerivationFailed(std::move(f.message));
    });
    if (stretch_result.IsErr()) {
        return Result<AccountKeys, CryptoFailure>::Err(std::move(stretch_result).UnwrapErr());
    }
    const SecureMemoryHandle stretch_key = std::move(stretch_result).Unwrap();

    auto data_key_alloc = SecureMemoryHandle::Allocate(Constants::DATA_KEY_SIZE);
    if (data_key_alloc.IsErr()) {
        return Result<AccountKeys, CryptoFailure>::Err(
            CryptoFailure::RandomGenerationFailed(data_key_alloc.UnwrapErr().message));
    }
    SecureMemoryHandle data_key = std::move(data_key_alloc).Unwrap();
    auto random_result = Flatten(data_key.WithWriteAccess([](std::span<uint8_t> dk) {
        return SodiumInterop::FillRandom(dk);
    })).MapErr([](CryptoFailure f) {
        return CryptoFailure::RandomGenerationFailed(std::move(f.message));
    });
    if (random_result.IsErr()) {
        return Result<AccountKeys, CryptoFailure>::Err(std::move(random_result).UnwrapErr());
    }

    auto envelope_result = Flatten(data_key.WithReadAccess([&stretch_key](std::span<const uint8_t> dk) {
        return Flatten(stretch_key.WithReadAccess([dk](std::span<const uint8_t> sk) {
            return SymmetricCodec::Encrypt(dk, sk);
        }));
    })).MapErr([](CryptoFailure f) {
        return CryptoFailure::EnvelopeEncryptionFailed(std::move(f.message));
    });
    if (envelope_result.IsErr()) {
        return Result<AccountKeys, CryptoFailure>::Err(std::move(envelope_result).UnwrapErr());
    }

    AccountKeys keys{
        std::move(primary_key),
        std::move(data_key),
        std::move(verifier_result).Unwrap(),
        std::move(envelope_result).Unwrap()};

    auto logged = keys.data_key.WithReadAccess([&keys](std::span<const uint8_t> dk) {
        debug::LogAccountKeysCreated(dk, keys.protected_key_envelope);
        return keys.protected_key_envelope.size();
    });
    if (logged.IsErr()) {
        return Result<AccountKeys, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(logged.UnwrapErr()));
    }

    return Result<AccountKeys, CryptoFailure>::Ok(std::move(keys));
}

Result<AccountKeys, CryptoFailure> AccountKeyFactory::CreateAccount(
    const std::string_view user_id,
    const std::string_view password) const {
    return CreateAccount(AsBytes(user_id), AsBytes(password));
}

// ============================================================================
// Login / recovery
// ============================================================================

Result<std::vector<uint8_t>, CryptoFailure> AccountKeyFactory::DerivePasswordVerifier(
    const std::span<const uint8_t> primary_key) const {
    auto size_check = RequireSize(primary_key, Constants::PRIMARY_KEY_SIZE, "Primary key");
    if (size_check.IsErr()) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(std::move(size_check).UnwrapErr());
    }
    return DeriveVerifierFrom(primary_key).MapErr([](CryptoFailure f) {
        if (f.type == CryptoFailureType::NotInitialized) {
            return f;
        }
        return CryptoFailure::VerifierDerivationFailed(std::move(f.message));
    });
}

Result<LoginKeys, CryptoFailure> AccountKeyFactory::PrepareForLogin(
    const std::span<const uint8_t> primary_key) const {
    auto verifier_result = DerivePasswordVerifier(primary_key);
    if (verifier_result.IsErr()) {
        return Result<LoginKeys, CryptoFailure>::Err(std::move(verifier_result).UnwrapErr());
    }
    auto stretch_result = DeriveStretchKeyFrom(primary_key);
    if (stretch_result.IsErr()) {
        return Result<LoginKeys, CryptoFailure>::Err(
            CryptoFailure::StretchKeyDerivationFailed(stretch_result.UnwrapErr().message));
    }
    LoginKeys login{std::move(verifier_result).Unwrap(), std::move(stretch_result).Unwrap()};
    auto logged = login.stretch_key.WithReadAccess([&login](std::span<const uint8_t> sk) {
        debug::LogSubkeys("LOGIN", login.password_verifier, sk);
        return sk.size();
    });
    if (logged.IsErr()) {
        return Result<LoginKeys, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(logged.UnwrapErr()));
    }
    return Result<LoginKeys, CryptoFailure>::Ok(std::move(login));
}

Result<SecureMemoryHandle, CryptoFailure> AccountKeyFactory::ExtractDataKey(
    const std::span<const uint8_t> protected_key_envelope,
    const std::span<const uint8_t> stretch_key) const {
    auto envelope_check = RequireSize(
        protected_key_envelope, Constants::PROTECTED_KEY_ENVELOPE_SIZE, "Protected key envelope");
    if (envelope_check.IsErr()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(std::move(envelope_check).UnwrapErr());
    }
    auto key_check = RequireSize(stretch_key, Constants::STRETCH_KEY_SIZE, "Stretch key");
    if (key_check.IsErr()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(std::move(key_check).UnwrapErr());
    }

    auto decrypt_result = SymmetricCodec::Decrypt(protected_key_envelope, stretch_key);
    debug::LogEnvelopeOpened(decrypt_result.IsOk());
    if (decrypt_result.IsErr()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(std::move(decrypt_result).UnwrapErr());
    }
    std::vector<uint8_t> data_key = std::move(decrypt_result).Unwrap();
    ScopedWipe wipe_data_key(data_key);

    auto handle_result = SecureMemoryHandle::FromBytes(data_key);
    if (handle_result.IsErr()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    return Result<SecureMemoryHandle, CryptoFailure>::Ok(std::move(handle_result).Unwrap());
}

Result<SecureMemoryHandle, CryptoFailure> AccountKeyFactory::RecoverDataKey(
    const std::span<const uint8_t> user_id,
    const std::span<const uint8_t> password,
    const std::span<const uint8_t> protected_key_envelope) const {
    auto credentials_check = ValidateCredentials(user_id, password);
    if (credentials_check.IsErr()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(std::move(credentials_check).UnwrapErr());
    }
    auto envelope_check = RequireSize(
        protected_key_envelope, Constants::PROTECTED_KEY_ENVELOPE_SIZE, "Protected key envelope");
    if (envelope_check.IsErr()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(std::move(envelope_check).UnwrapErr());
    }

    auto primary_result = DerivePrimaryKey(user_id, password);
    if (primary_result.IsErr()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(std::move(primary_result).UnwrapErr());
    }
    const SecureMemoryHandle primary_key = std::move(primary_result).Unwrap();

    auto stretch_result = Flatten(primary_key.WithReadAccess([](std::span<const uint8_t> pk) {
        debug::LogPrimaryKey("RECOVER", pk);
        return DeriveStretchKeyFrom(pk);
    })).MapErr([](CryptoFailure f) {
        return CryptoFailure::StretchKeyDerivationFailed(std::move(f.message));
    });
    if (stretch_result.IsErr()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(std::move(stretch_result).UnwrapErr());
    }
    const SecureMemoryHandle stretch_key = std::move(stretch_result).Unwrap();

    return Flatten(stretch_key.WithReadAccess([this, protected_key_envelope](std::span<const uint8_t> sk) {
        return ExtractDataKey(protected_key_envelope, sk);
    }));
}

Result<SecureMemoryHandle, CryptoFailure> AccountKeyFactory::RecoverDataKey(
    const std::string_view user_id,
    const std::string_view password,
    const std::span<const uint8_t> protected_key_envelope) const {
    return RecoverDataKey(AsBytes(user_id), AsBytes(password), protected_key_envelope);
}

Result<std::string, CryptoFailure> AccountKeyFactory::CreateVerifierString(
    const std::span<const uint8_t> primary_key) const {
    return PasswordHasher::HashForVerifier(primary_key, config_.verifier_string_hardness);
}

// ============================================================================
// Internal
// ============================================================================

Result<SecureMemoryHandle, CryptoFailure> AccountKeyFactory::DerivePrimaryKey(
    const std::span<const uint8_t> user_id,
    const std::span<const uint8_t> password) const {
    auto salt_result = PasswordHasher::DeriveSalt(user_id);
    if (salt_result.IsErr()) {
        return Result<SecureMemoryHandle, CryptoFailure>::Err(std::move(salt_result).UnwrapErr());
    }
    PasswordHasher::Salt salt = salt_result.Unwrap();
    ScopedWipe wipe_salt(salt);
    debug::LogSaltDerived(salt);

    return PasswordHasher::Hash(password, salt, config_.primary_key_hardness)
        .MapErr([](CryptoFailure f) {
            if (f.type == CryptoFailureType::NotInitialized) {
                return f;
            }
            return CryptoFailure::PrimaryKeyDerivationFailed(std::move(f.message));
        });
}

} // namespace synccrypto::account
