#include <catch2/catch_test_macros.hpp>
#include "synccrypto/account/account_key_factory.hpp"
#include "synccrypto/crypto/sodium_interop.hpp"
#include "synccrypto/crypto/symmetric_codec.hpp"
#include "synccrypto/core/constants.hpp"
#include <algorithm>
#include <vector>
using namespace synccrypto;
using namespace synccrypto::crypto;
using synccrypto::account::AccountKeyFactory;
TEST_CASE("Security - Symmetric bundle tampering", "[security][codec]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> key(Constants::SYMMETRIC_KEY_SIZE, 0x66);
    std::vector<uint8_t> plaintext = {'s', 'e', 'c', 'r', 'e', 't'};
    auto bundle = SymmetricCodec::Encrypt(plaintext, key).Unwrap();
    SECTION("Wrong key") {
        std::vector<uint8_t> wrong_key(Constants::SYMMETRIC_KEY_SIZE, 0x99);
        auto result = SymmetricCodec::Decrypt(bundle, wrong_key);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::AuthenticationFailed);
    }
    SECTION("Every single-bit flip is detected") {
        for (size_t i = 0; i < bundle.size(); ++i) {
            for (int bit = 0; bit < 8; ++bit) {
                auto tampered = bundle;
                tampered[i] ^= static_cast<uint8_t>(1u << bit);
                auto result = SymmetricCodec::Decrypt(tampered, key);
                REQUIRE(result.IsErr());
                REQUIRE(result.UnwrapErr().type == CryptoFailureType::AuthenticationFailed);
            }
        }
    }
    SECTION("Truncation and extension are detected") {
        std::vector<uint8_t> truncated(bundle.begin(), bundle.end() - 1);
        REQUIRE(SymmetricCodec::Decrypt(truncated, key).IsErr());
        auto extended = bundle;
        extended.push_back(0x00);
        REQUIRE(SymmetricCodec::Decrypt(extended, key).IsErr());
    }
    SECTION("Swapped tag region is detected") {
        auto other = SymmetricCodec::Encrypt(plaintext, key).Unwrap();
        auto spliced = bundle;
        std::copy_n(other.begin(), Constants::SECRETBOX_TAG_SIZE, spliced.begin());
        REQUIRE(SymmetricCodec::Decrypt(spliced, key).UnwrapErr().type ==
                CryptoFailureType::AuthenticationFailed);
    }
}
TEST_CASE("Security - Protected key envelope tampering", "[security][account]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const AccountKeyFactory factory;
    auto keys = factory.CreateAccount("user-1234", "correct horse").Unwrap();
    const auto primary_key = keys.primary_key.ReadBytes(Constants::PRIMARY_KEY_SIZE).Unwrap();
    auto login = factory.PrepareForLogin(primary_key).Unwrap();
    const auto stretch_key = login.stretch_key.ReadBytes(Constants::STRETCH_KEY_SIZE).Unwrap();
    SECTION("Flipping any envelope byte fails authentication") {
        for (size_t i = 0; i < keys.protected_key_envelope.size(); ++i) {
            auto tampered = keys.protected_key_envelope;
            tampered[i] ^= 0x01;
            auto result = factory.ExtractDataKey(tampered, stretch_key);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == CryptoFailureType::AuthenticationFailed);
        }
    }
    SECTION("Envelope of another account does not open") {
        auto other = factory.CreateAccount("user-5678", "correct horse").Unwrap();
        auto result = factory.ExtractDataKey(other.protected_key_envelope, stretch_key);
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::AuthenticationFailed);
    }
    SECTION("The verifier cannot open the envelope") {
        auto result = factory.ExtractDataKey(keys.protected_key_envelope, keys.password_verifier);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::AuthenticationFailed);
    }
    SECTION("Wrong password is distinct from every other failure") {
        auto result = factory.RecoverDataKey("user-1234", "wrong horse", keys.protected_key_envelope);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::AuthenticationFailed);
        REQUIRE_FALSE(result.UnwrapErr().IsInvalidInput());
    }
}
