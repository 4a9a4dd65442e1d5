#pragma once
#include "synccrypto/core/result.hpp"
#include "synccrypto/core/failures.hpp"
#include "synccrypto/crypto/sodium_secure_memory_handle.hpp"
#include <vector>
#include <string_view>
#include <span>
#include <cstdint>
namespace synccrypto::crypto {
/**
 * Sub-key derivation from a 32-byte master key (libsodium crypto_kdf,
 * BLAKE2b keyed with the master key over subkey_id and an 8-byte context).
 *
 * Outputs for distinct (subkey_id, context) pairs are independent, which
 * lets the password verifier and the stretch key share one primary key.
 */
class KeyDeriver {
public:
    [[nodiscard]] static Result<SecureMemoryHandle, CryptoFailure> Derive(
        std::span<const uint8_t> master_key,
        uint64_t subkey_id,
        std::string_view context,
        size_t output_size);
    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure> DeriveBytes(
        std::span<const uint8_t> master_key,
        uint64_t subkey_id,
        std::string_view context,
        size_t output_size);
private:
    static Result<Unit, CryptoFailure> DeriveInto(
        std::span<const uint8_t> master_key,
        uint64_t subkey_id,
        std::string_view context,
        std::span<uint8_t> output);
    KeyDeriver() = delete;
};
}
