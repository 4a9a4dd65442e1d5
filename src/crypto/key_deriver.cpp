#include "synccrypto/crypto/key_deriver.hpp"
#include "synccrypto/crypto/sodium_interop.hpp"
#include "synccrypto/core/constants.hpp"
#include "synccrypto/core/format.hpp"
#include <sodium.h>

namespace synccrypto::crypto {
    static_assert(Constants::KDF_MASTER_KEY_SIZE == crypto_kdf_KEYBYTES);
    static_assert(Constants::KDF_CONTEXT_SIZE == crypto_kdf_CONTEXTBYTES);
    static_assert(Constants::KDF_SUBKEY_MIN_SIZE == crypto_kdf_BYTES_MIN);
    static_assert(Constants::KDF_SUBKEY_MAX_SIZE == crypto_kdf_BYTES_MAX);

    Result<SecureMemoryHandle, CryptoFailure> KeyDeriver::Derive(
        const std::span<const uint8_t> master_key,
        const uint64_t subkey_id,
        const std::string_view context,
        const size_t output_size) {
        if (output_size < Constants::KDF_SUBKEY_MIN_SIZE || output_size > Constants::KDF_SUBKEY_MAX_SIZE) {
            return Result<SecureMemoryHandle, CryptoFailure>::Err(
                CryptoFailure::DerivationFailed(
                    compat::format("Sub-key size must be in [{}, {}], got {}",
                        Constants::KDF_SUBKEY_MIN_SIZE, Constants::KDF_SUBKEY_MAX_SIZE, output_size)));
        }
        auto handle_result = SecureMemoryHandle::Allocate(output_size);
        if (handle_result.IsErr()) {
            return Result<SecureMemoryHandle, CryptoFailure>::Err(
                CryptoFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        SecureMemoryHandle subkey = std::move(handle_result).Unwrap();
        auto derive_result = subkey.WithWriteAccess([&](std::span<uint8_t> out) {
            return DeriveInto(master_key, subkey_id, context, out);
        });
        if (derive_result.IsErr()) {
            return Result<SecureMemoryHandle, CryptoFailure>::Err(
                CryptoFailure::FromSodiumFailure(derive_result.UnwrapErr()));
        }
        auto inner = std::move(derive_result).Unwrap();
        if (inner.IsErr()) {
            return Result<SecureMemoryHandle, CryptoFailure>::Err(std::move(inner).UnwrapErr());
        }
        return Result<SecureMemoryHandle, CryptoFailure>::Ok(std::move(subkey));
    }

    Result<std::vector<uint8_t>, CryptoFailure> KeyDeriver::DeriveBytes(
        const std::span<const uint8_t> master_key,
        const uint64_t subkey_id,
        const std::string_view context,
        const size_t output_size) {
        if (output_size < Constants::KDF_SUBKEY_MIN_SIZE || output_size > Constants::KDF_SUBKEY_MAX_SIZE) {
            return Result<std::vector<uint8_t>, CryptoFailure>::Err(
                CryptoFailure::DerivationFailed(
                    compat::format("Sub-key size must be in [{}, {}], got {}",
                        Constants::KDF_SUBKEY_MIN_SIZE, Constants::KDF_SUBKEY_MAX_SIZE, output_size)));
        }
        std::vector<uint8_t> output(output_size);
        auto result = DeriveInto(master_key, subkey_id, context, output);
        if (result.IsErr()) {
            SodiumInterop::SecureWipe(output);
            return Result<std::vector<uint8_t>, CryptoFailure>::Err(std::move(result).UnwrapErr());
        }
        return Result<std::vector<uint8_t>, CryptoFailure>::Ok(std::move(output));
    }

    Result<Unit, CryptoFailure> KeyDeriver::DeriveInto(
        const std::span<const uint8_t> master_key,
        const uint64_t subkey_id,
        const std::string_view context,
        const std::span<uint8_t> output) {
        if (!SodiumInterop::IsInitialized()) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::NotInitialized(std::string(ErrorMessages::NOT_INITIALIZED)));
        }
        if (master_key.size() != Constants::KDF_MASTER_KEY_SIZE) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::DerivationFailed(
                    compat::format("Master key must be {} bytes, got {}",
                        Constants::KDF_MASTER_KEY_SIZE, master_key.size())));
        }
        if (context.size() != Constants::KDF_CONTEXT_SIZE) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::DerivationFailed(
                    compat::format("Context must be {} bytes, got {}",
                        Constants::KDF_CONTEXT_SIZE, context.size())));
        }
        if (subkey_id == 0) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::DerivationFailed("Sub-key id must be positive"));
        }
        if (crypto_kdf_derive_from_key(
                output.data(),
                output.size(),
                subkey_id,
                context.data(),
                master_key.data()) != SodiumConstants::SUCCESS) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::DerivationFailed("crypto_kdf_derive_from_key failed"));
        }
        return Result<Unit, CryptoFailure>::Ok(unit);
    }
}
