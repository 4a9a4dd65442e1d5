#include <catch2/catch_test_macros.hpp>
#include "synccrypto/crypto/symmetric_codec.hpp"
#include "synccrypto/crypto/sodium_interop.hpp"
#include "synccrypto/core/constants.hpp"
#include <vector>
using namespace synccrypto;
using namespace synccrypto::crypto;
TEST_CASE("SymmetricCodec - Basic encryption and decryption", "[codec][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Encrypt and decrypt round-trip") {
        std::vector<uint8_t> key(Constants::SYMMETRIC_KEY_SIZE, 0xAA);
        std::vector<uint8_t> plaintext = {'H', 'e', 'l', 'l', 'o', ' ', 'W', 'o', 'r', 'l', 'd', '!'};
        auto encrypt_result = SymmetricCodec::Encrypt(plaintext, key);
        REQUIRE(encrypt_result.IsOk());
        auto bundle = encrypt_result.Unwrap();
        REQUIRE(bundle.size() == plaintext.size() + Constants::ENCRYPTED_EXTRA_BYTES_SIZE);
        auto decrypt_result = SymmetricCodec::Decrypt(bundle, key);
        REQUIRE(decrypt_result.IsOk());
        REQUIRE(decrypt_result.Unwrap() == plaintext);
    }
    SECTION("Empty plaintext") {
        std::vector<uint8_t> key(Constants::SYMMETRIC_KEY_SIZE, 0x11);
        std::vector<uint8_t> plaintext = {};
        auto encrypt_result = SymmetricCodec::Encrypt(plaintext, key);
        REQUIRE(encrypt_result.IsOk());
        auto bundle = encrypt_result.Unwrap();
        REQUIRE(bundle.size() == Constants::ENCRYPTED_EXTRA_BYTES_SIZE);
        auto decrypt_result = SymmetricCodec::Decrypt(bundle, key);
        REQUIRE(decrypt_result.IsOk());
        REQUIRE(decrypt_result.Unwrap().empty());
    }
    SECTION("Large plaintext") {
        std::vector<uint8_t> key(Constants::SYMMETRIC_KEY_SIZE, 0x33);
        std::vector<uint8_t> plaintext(10000, 0x55);
        auto encrypt_result = SymmetricCodec::Encrypt(plaintext, key);
        REQUIRE(encrypt_result.IsOk());
        auto decrypt_result = SymmetricCodec::Decrypt(encrypt_result.Unwrap(), key);
        REQUIRE(decrypt_result.IsOk());
        REQUIRE(decrypt_result.Unwrap() == plaintext);
    }
    SECTION("Nonce is fresh per call") {
        std::vector<uint8_t> key(Constants::SYMMETRIC_KEY_SIZE, 0x44);
        std::vector<uint8_t> plaintext(32, 0x66);
        auto first = SymmetricCodec::Encrypt(plaintext, key).Unwrap();
        auto second = SymmetricCodec::Encrypt(plaintext, key).Unwrap();
        REQUIRE(first != second);
        std::vector<uint8_t> nonce1(first.end() - Constants::SECRETBOX_NONCE_SIZE, first.end());
        std::vector<uint8_t> nonce2(second.end() - Constants::SECRETBOX_NONCE_SIZE, second.end());
        REQUIRE(nonce1 != nonce2);
    }
    SECTION("Size helpers") {
        STATIC_REQUIRE(SymmetricCodec::EncryptedSize(32) == Constants::PROTECTED_KEY_ENVELOPE_SIZE);
        STATIC_REQUIRE(SymmetricCodec::DecryptedSize(Constants::PROTECTED_KEY_ENVELOPE_SIZE) == 32);
    }
}
TEST_CASE("SymmetricCodec - Input validation", "[codec][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> key(Constants::SYMMETRIC_KEY_SIZE, 0x77);
    SECTION("Key of the wrong size is rejected") {
        std::vector<uint8_t> short_key(31, 0x77);
        std::vector<uint8_t> plaintext(8, 0x01);
        auto encrypt_result = SymmetricCodec::Encrypt(plaintext, short_key);
        REQUIRE(encrypt_result.IsErr());
        REQUIRE(encrypt_result.UnwrapErr().type == CryptoFailureType::InvalidInput);
        std::vector<uint8_t> bundle(Constants::ENCRYPTED_EXTRA_BYTES_SIZE + 8, 0x00);
        REQUIRE(SymmetricCodec::Decrypt(bundle, short_key).UnwrapErr().type ==
                CryptoFailureType::InvalidInput);
    }
    SECTION("Bundle shorter than tag and nonce is rejected") {
        std::vector<uint8_t> bundle(Constants::ENCRYPTED_EXTRA_BYTES_SIZE - 1, 0x00);
        auto result = SymmetricCodec::Decrypt(bundle, key);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::InvalidInput);
    }
    SECTION("Random bundle fails authentication") {
        std::vector<uint8_t> bundle(Constants::ENCRYPTED_EXTRA_BYTES_SIZE + 16);
        REQUIRE(SodiumInterop::FillRandom(bundle).IsOk());
        auto result = SymmetricCodec::Decrypt(bundle, key);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::AuthenticationFailed);
    }
}
