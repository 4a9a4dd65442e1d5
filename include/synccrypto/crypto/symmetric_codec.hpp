#pragma once
#include "synccrypto/core/result.hpp"
#include "synccrypto/core/failures.hpp"
#include "synccrypto/core/constants.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace synccrypto::crypto {

/**
 * XSalsa20-Poly1305 authenticated encryption (libsodium crypto_secretbox)
 *
 * Bundle layout, fixed as part of the server wire contract:
 *
 *   [0 .. 16)            Poly1305 tag
 *   [16 .. 16 + n)       ciphertext
 *   [16 + n .. 40 + n)   XSalsa20 nonce
 *
 * Encrypt() draws a fresh random 24-byte nonce on every call; callers
 * never supply one. Decrypt() verifies the tag before writing any
 * plaintext out. A wrong key and any modified byte of tag, ciphertext or
 * nonce are all reported as the same AuthenticationFailed error.
 */
class SymmetricCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure>
    Encrypt(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> key);
    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure>
    Decrypt(
        std::span<const uint8_t> bundle,
        std::span<const uint8_t> key);
    [[nodiscard]] static constexpr size_t EncryptedSize(size_t plaintext_size) noexcept {
        return plaintext_size + Constants::ENCRYPTED_EXTRA_BYTES_SIZE;
    }
    [[nodiscard]] static constexpr size_t DecryptedSize(size_t bundle_size) noexcept {
        return bundle_size < Constants::ENCRYPTED_EXTRA_BYTES_SIZE
            ? 0
            : bundle_size - Constants::ENCRYPTED_EXTRA_BYTES_SIZE;
    }
private:
    SymmetricCodec() = delete;
};
}
