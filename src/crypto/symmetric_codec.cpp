#include "synccrypto/crypto/symmetric_codec.hpp"
#include "synccrypto/crypto/sodium_interop.hpp"
#include "synccrypto/core/format.hpp"
#include <sodium.h>
#include <array>
namespace synccrypto::crypto {
static_assert(Constants::SYMMETRIC_KEY_SIZE == crypto_secretbox_KEYBYTES);
static_assert(Constants::SECRETBOX_TAG_SIZE == crypto_secretbox_MACBYTES);
static_assert(Constants::SECRETBOX_NONCE_SIZE == crypto_secretbox_NONCEBYTES);
namespace {
    constexpr size_t TAG_OFFSET = 0;
    constexpr size_t CIPHERTEXT_OFFSET = Constants::SECRETBOX_TAG_SIZE;

    Result<Unit, CryptoFailure> ValidateKey(std::span<const uint8_t> key) {
        if (key.size() != Constants::SYMMETRIC_KEY_SIZE) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::InvalidInput(
                    compat::format("Symmetric key must be {} bytes, got {}",
                        Constants::SYMMETRIC_KEY_SIZE, key.size())));
        }
        if (!SodiumInterop::IsInitialized()) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::NotInitialized(std::string(ErrorMessages::NOT_INITIALIZED)));
        }
        return Result<Unit, CryptoFailure>::Ok(unit);
    }
}
Result<std::vector<uint8_t>, CryptoFailure>
SymmetricCodec::Encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> key) {
    auto key_check = ValidateKey(key);
    if (key_check.IsErr()) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(std::move(key_check).UnwrapErr());
    }
    if (plaintext.size() > SodiumInterop::MAX_BUFFER_SIZE) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(
                compat::format("Plaintext of {} bytes exceeds maximum {}",
                    plaintext.size(), SodiumInterop::MAX_BUFFER_SIZE)));
    }
    std::vector<uint8_t> output(EncryptedSize(plaintext.size()));
    const size_t nonce_offset = CIPHERTEXT_OFFSET + plaintext.size();
    auto nonce = std::span<uint8_t>(output).subspan(nonce_offset, Constants::SECRETBOX_NONCE_SIZE);
    auto random_result = SodiumInterop::FillRandom(nonce);
    if (random_result.IsErr()) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(std::move(random_result).UnwrapErr());
    }
    // libsodium reads no message bytes when mlen is zero, but wants a valid pointer
    static constexpr std::array<uint8_t, 1> EMPTY_MESSAGE{};
    const uint8_t* message = plaintext.empty() ? EMPTY_MESSAGE.data() : plaintext.data();
    if (crypto_secretbox_detached(
            output.data() + CIPHERTEXT_OFFSET,
            output.data() + TAG_OFFSET,
            message,
            plaintext.size(),
            nonce.data(),
            key.data()) != SodiumConstants::SUCCESS) {
        SodiumInterop::SecureWipe(output);
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::EncryptionFailed("crypto_secretbox_detached failed"));
    }
    return Result<std::vector<uint8_t>, CryptoFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, CryptoFailure>
SymmetricCodec::Decrypt(
    std::span<const uint8_t> bundle,
    std::span<const uint8_t> key) {
    if (bundle.size() < Constants::ENCRYPTED_EXTRA_BYTES_SIZE) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(
                compat::format("Ciphertext too small: {} bytes (minimum {} for tag and nonce)",
                    bundle.size(), Constants::ENCRYPTED_EXTRA_BYTES_SIZE)));
    }
    auto key_check = ValidateKey(key);
    if (key_check.IsErr()) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(std::move(key_check).UnwrapErr());
    }
    const size_t ciphertext_len = DecryptedSize(bundle.size());
    std::span<const uint8_t> tag = bundle.subspan(TAG_OFFSET, Constants::SECRETBOX_TAG_SIZE);
    std::span<const uint8_t> ciphertext = bundle.subspan(CIPHERTEXT_OFFSET, ciphertext_len);
    std::span<const uint8_t> nonce = bundle.subspan(CIPHERTEXT_OFFSET + ciphertext_len);
    // One spare byte keeps data() valid for an empty plaintext
    std::vector<uint8_t> output(ciphertext_len + 1);
    if (crypto_secretbox_open_detached(
            output.data(),
            ciphertext.data(),
            tag.data(),
            ciphertext.size(),
            nonce.data(),
            key.data()) != SodiumConstants::SUCCESS) {
        SodiumInterop::SecureWipe(output);
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::AuthenticationFailed(std::string(ErrorMessages::DECRYPTION_FAILED)));
    }
    output.resize(ciphertext_len);
    return Result<std::vector<uint8_t>, CryptoFailure>::Ok(std::move(output));
}
}
