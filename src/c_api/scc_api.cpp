/**
 * @file scc_api.cpp
 * @brief C API over AccountKeyFactory and SymmetricCodec
 */

#include "synccrypto/c_api/scc_api.h"
#include "scc_internal.hpp"
#include "synccrypto/account/account_key_factory.hpp"
#include "synccrypto/crypto/symmetric_codec.hpp"
#include "synccrypto/crypto/sodium_interop.hpp"
#include "synccrypto/core/constants.hpp"
#include <cstring>
#include <span>
#include <string>
#include <vector>

using namespace synccrypto;
using synccrypto::account::AccountKeyFactory;
using synccrypto::crypto::ScopedWipe;
using synccrypto::crypto::SecureMemoryHandle;
using synccrypto::crypto::SodiumInterop;
using synccrypto::crypto::SymmetricCodec;
using namespace scc::internal;

namespace {

SccErrorCode read_handle_into(
    const SecureMemoryHandle& handle,
    uint8_t* out,
    const size_t out_length,
    SccError* out_error) {
    auto result = handle.Read(std::span(out, out_length));
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, CryptoFailure::FromSodiumFailure(result.UnwrapErr()));
    }
    return SCC_SUCCESS;
}

// scc_init() is the only initialization path
SccErrorCode check_initialized(SccError* out_error) {
    if (!SodiumInterop::IsInitialized()) {
        fill_error(out_error, SCC_ERROR_NOT_INITIALIZED, std::string(ErrorMessages::NOT_INITIALIZED));
        return SCC_ERROR_NOT_INITIALIZED;
    }
    return SCC_SUCCESS;
}

} // namespace

extern "C" {

// ----------------------------------------------------------------------------
// Account Keys
// ----------------------------------------------------------------------------

SccErrorCode scc_generate_account_keys(
    const uint8_t* user_id,
    const size_t user_id_length,
    const uint8_t* password,
    const size_t password_length,
    uint8_t* out_primary_key,
    const size_t out_primary_key_length,
    uint8_t* out_data_key,
    const size_t out_data_key_length,
    uint8_t* out_password_verifier,
    const size_t out_password_verifier_length,
    uint8_t* out_protected_key_envelope,
    const size_t out_protected_key_envelope_length,
    SccError* out_error) {
    if (const auto err = check_initialized(out_error); err != SCC_SUCCESS) {
        return err;
    }
    if (!validate_buffer_param(user_id, user_id_length, out_error) ||
        !validate_buffer_param(password, password_length, out_error)) {
        return SCC_ERROR_NULL_POINTER;
    }
    if (const auto err = validate_output_key(
            out_primary_key, out_primary_key_length, Constants::PRIMARY_KEY_SIZE, "Primary key", out_error);
        err != SCC_SUCCESS) {
        return err;
    }
    if (const auto err = validate_output_key(
            out_data_key, out_data_key_length, Constants::DATA_KEY_SIZE, "Data key", out_error);
        err != SCC_SUCCESS) {
        return err;
    }
    if (const auto err = validate_output_key(
            out_password_verifier, out_password_verifier_length,
            Constants::PASSWORD_VERIFIER_SIZE, "Password verifier", out_error);
        err != SCC_SUCCESS) {
        return err;
    }
    if (const auto err = validate_output_key(
            out_protected_key_envelope, out_protected_key_envelope_length,
            Constants::PROTECTED_KEY_ENVELOPE_SIZE, "Protected key envelope", out_error);
        err != SCC_SUCCESS) {
        return err;
    }

    const AccountKeyFactory factory;
    auto result = factory.CreateAccount(
        std::span(user_id, user_id_length),
        std::span(password, password_length));
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    const auto keys = std::move(result).Unwrap();

    if (const auto err = read_handle_into(keys.primary_key, out_primary_key, out_primary_key_length, out_error);
        err != SCC_SUCCESS) {
        return err;
    }
    if (const auto err = read_handle_into(keys.data_key, out_data_key, out_data_key_length, out_error);
        err != SCC_SUCCESS) {
        SodiumInterop::SecureWipe(std::span(out_primary_key, out_primary_key_length));
        return err;
    }
    std::memcpy(out_password_verifier, keys.password_verifier.data(), keys.password_verifier.size());
    std::memcpy(out_protected_key_envelope, keys.protected_key_envelope.data(), keys.protected_key_envelope.size());
    return SCC_SUCCESS;
}

SccErrorCode scc_derive_password_verifier(
    const uint8_t* primary_key,
    const size_t primary_key_length,
    uint8_t* out_password_verifier,
    const size_t out_password_verifier_length,
    SccError* out_error) {
    if (const auto err = check_initialized(out_error); err != SCC_SUCCESS) {
        return err;
    }
    if (!validate_buffer_param(primary_key, primary_key_length, out_error)) {
        return SCC_ERROR_NULL_POINTER;
    }
    if (const auto err = validate_output_key(
            out_password_verifier, out_password_verifier_length,
            Constants::PASSWORD_VERIFIER_SIZE, "Password verifier", out_error);
        err != SCC_SUCCESS) {
        return err;
    }

    const AccountKeyFactory factory;
    auto result = factory.DerivePasswordVerifier(std::span(primary_key, primary_key_length));
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    const auto& verifier = result.Unwrap();
    std::memcpy(out_password_verifier, verifier.data(), verifier.size());
    return SCC_SUCCESS;
}

SccErrorCode scc_prepare_for_login(
    const uint8_t* primary_key,
    const size_t primary_key_length,
    uint8_t* out_password_verifier,
    const size_t out_password_verifier_length,
    uint8_t* out_stretch_key,
    const size_t out_stretch_key_length,
    SccError* out_error) {
    if (const auto err = check_initialized(out_error); err != SCC_SUCCESS) {
        return err;
    }
    if (!validate_buffer_param(primary_key, primary_key_length, out_error)) {
        return SCC_ERROR_NULL_POINTER;
    }
    if (const auto err = validate_output_key(
            out_password_verifier, out_password_verifier_length,
            Constants::PASSWORD_VERIFIER_SIZE, "Password verifier", out_error);
        err != SCC_SUCCESS) {
        return err;
    }
    if (const auto err = validate_output_key(
            out_stretch_key, out_stretch_key_length, Constants::STRETCH_KEY_SIZE, "Stretch key", out_error);
        err != SCC_SUCCESS) {
        return err;
    }

    const AccountKeyFactory factory;
    auto result = factory.PrepareForLogin(std::span(primary_key, primary_key_length));
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    const auto login = std::move(result).Unwrap();
    if (const auto err = read_handle_into(login.stretch_key, out_stretch_key, out_stretch_key_length, out_error);
        err != SCC_SUCCESS) {
        return err;
    }
    std::memcpy(out_password_verifier, login.password_verifier.data(), login.password_verifier.size());
    return SCC_SUCCESS;
}

SccErrorCode scc_extract_data_key(
    const uint8_t* protected_key_envelope,
    const size_t protected_key_envelope_length,
    const uint8_t* stretch_key,
    const size_t stretch_key_length,
    uint8_t* out_data_key,
    const size_t out_data_key_length,
    SccError* out_error) {
    if (const auto err = check_initialized(out_error); err != SCC_SUCCESS) {
        return err;
    }
    if (!validate_buffer_param(protected_key_envelope, protected_key_envelope_length, out_error) ||
        !validate_buffer_param(stretch_key, stretch_key_length, out_error)) {
        return SCC_ERROR_NULL_POINTER;
    }
    if (const auto err = validate_output_key(
            out_data_key, out_data_key_length, Constants::DATA_KEY_SIZE, "Data key", out_error);
        err != SCC_SUCCESS) {
        return err;
    }

    const AccountKeyFactory factory;
    auto result = factory.ExtractDataKey(
        std::span(protected_key_envelope, protected_key_envelope_length),
        std::span(stretch_key, stretch_key_length));
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    return read_handle_into(result.Unwrap(), out_data_key, out_data_key_length, out_error);
}

SccErrorCode scc_recover_data_key(
    const uint8_t* user_id,
    const size_t user_id_length,
    const uint8_t* password,
    const size_t password_length,
    const uint8_t* protected_key_envelope,
    const size_t protected_key_envelope_length,
    uint8_t* out_data_key,
    const size_t out_data_key_length,
    SccError* out_error) {
    if (const auto err = check_initialized(out_error); err != SCC_SUCCESS) {
        return err;
    }
    if (!validate_buffer_param(user_id, user_id_length, out_error) ||
        !validate_buffer_param(password, password_length, out_error) ||
        !validate_buffer_param(protected_key_envelope, protected_key_envelope_length, out_error)) {
        return SCC_ERROR_NULL_POINTER;
    }
    if (const auto err = validate_output_key(
            out_data_key, out_data_key_length, Constants::DATA_KEY_SIZE, "Data key", out_error);
        err != SCC_SUCCESS) {
        return err;
    }

    const AccountKeyFactory factory;
    auto result = factory.RecoverDataKey(
        std::span(user_id, user_id_length),
        std::span(password, password_length),
        std::span(protected_key_envelope, protected_key_envelope_length));
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    return read_handle_into(result.Unwrap(), out_data_key, out_data_key_length, out_error);
}

// ----------------------------------------------------------------------------
// Symmetric Encryption
// ----------------------------------------------------------------------------

SccErrorCode scc_encrypt(
    const uint8_t* plaintext,
    const size_t plaintext_length,
    const uint8_t* key,
    const size_t key_length,
    SccBuffer* out_ciphertext,
    SccError* out_error) {
    if (const auto err = check_initialized(out_error); err != SCC_SUCCESS) {
        return err;
    }
    if (!validate_buffer_param(plaintext, plaintext_length, out_error) ||
        !validate_buffer_param(key, key_length, out_error)) {
        return SCC_ERROR_NULL_POINTER;
    }

    auto result = SymmetricCodec::Encrypt(
        std::span(plaintext, plaintext_length),
        std::span(key, key_length));
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    if (!copy_to_buffer(result.Unwrap(), out_ciphertext, out_error)) {
        return out_ciphertext ? SCC_ERROR_OUT_OF_MEMORY : SCC_ERROR_NULL_POINTER;
    }
    return SCC_SUCCESS;
}

SccErrorCode scc_decrypt(
    const uint8_t* ciphertext,
    const size_t ciphertext_length,
    const uint8_t* key,
    const size_t key_length,
    SccBuffer* out_plaintext,
    SccError* out_error) {
    if (const auto err = check_initialized(out_error); err != SCC_SUCCESS) {
        return err;
    }
    if (!validate_buffer_param(ciphertext, ciphertext_length, out_error) ||
        !validate_buffer_param(key, key_length, out_error)) {
        return SCC_ERROR_NULL_POINTER;
    }

    auto result = SymmetricCodec::Decrypt(
        std::span(ciphertext, ciphertext_length),
        std::span(key, key_length));
    if (result.IsErr()) {
        return fill_error_from_failure(out_error, result.UnwrapErr());
    }
    std::vector<uint8_t> plaintext = std::move(result).Unwrap();
    ScopedWipe wipe_plaintext(plaintext);
    if (!copy_to_buffer(plaintext, out_plaintext, out_error)) {
        return out_plaintext ? SCC_ERROR_OUT_OF_MEMORY : SCC_ERROR_NULL_POINTER;
    }
    return SCC_SUCCESS;
}

} // extern "C"
