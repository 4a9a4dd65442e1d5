#include <catch2/catch_test_macros.hpp>
#include "synccrypto/c_api/scc_api.h"
#include <array>
#include <cstring>
#include <string>
#include <vector>

namespace {

struct AccountOutputs {
    std::array<uint8_t, SCC_PRIMARY_KEY_SIZE> primary_key{};
    std::array<uint8_t, SCC_DATA_KEY_SIZE> data_key{};
    std::array<uint8_t, SCC_PASSWORD_VERIFIER_SIZE> password_verifier{};
    std::array<uint8_t, SCC_PROTECTED_KEY_ENVELOPE_SIZE> envelope{};
};

const uint8_t* AsBytes(const std::string& text) {
    return reinterpret_cast<const uint8_t*>(text.data());
}

SccErrorCode GenerateKeys(const std::string& user_id, const std::string& password,
                          AccountOutputs& out, SccError* error) {
    return scc_generate_account_keys(
        AsBytes(user_id), user_id.size(),
        AsBytes(password), password.size(),
        out.primary_key.data(), out.primary_key.size(),
        out.data_key.data(), out.data_key.size(),
        out.password_verifier.data(), out.password_verifier.size(),
        out.envelope.data(), out.envelope.size(),
        error);
}

} // namespace

TEST_CASE("C API - Initialization", "[c_api][init]") {
    SECTION("Initialize succeeds") {
        REQUIRE(scc_init() == SCC_SUCCESS);
    }

    SECTION("Version string is valid") {
        const char* version = scc_version();
        REQUIRE(version != nullptr);
        REQUIRE(std::strcmp(version, "1.0.0") == 0);
    }

    SECTION("Multiple initialize calls are safe") {
        REQUIRE(scc_init() == SCC_SUCCESS);
        REQUIRE(scc_init() == SCC_SUCCESS);
    }

    SECTION("Error strings cover every code") {
        REQUIRE(std::strcmp(scc_error_string(SCC_SUCCESS), "Success") == 0);
        REQUIRE(std::strcmp(scc_error_string(SCC_ERROR_AUTHENTICATION), "Authentication failed") == 0);
        REQUIRE(std::strcmp(scc_error_string(static_cast<SccErrorCode>(999)), "Unknown error") == 0);
    }
}

TEST_CASE("C API - Account key round trip", "[c_api][account]") {
    REQUIRE(scc_init() == SCC_SUCCESS);

    AccountOutputs keys;
    SccError error{};
    REQUIRE(GenerateKeys("user-1234", "correct horse", keys, &error) == SCC_SUCCESS);
    REQUIRE(error.message == nullptr);

    SECTION("Verifier is reproducible from the primary key") {
        std::array<uint8_t, SCC_PASSWORD_VERIFIER_SIZE> verifier{};
        REQUIRE(scc_derive_password_verifier(
            keys.primary_key.data(), keys.primary_key.size(),
            verifier.data(), verifier.size(), &error) == SCC_SUCCESS);
        REQUIRE(verifier == keys.password_verifier);
    }

    SECTION("Login keys open the envelope") {
        std::array<uint8_t, SCC_PASSWORD_VERIFIER_SIZE> verifier{};
        std::array<uint8_t, SCC_STRETCH_KEY_SIZE> stretch_key{};
        REQUIRE(scc_prepare_for_login(
            keys.primary_key.data(), keys.primary_key.size(),
            verifier.data(), verifier.size(),
            stretch_key.data(), stretch_key.size(), &error) == SCC_SUCCESS);
        REQUIRE(verifier == keys.password_verifier);

        std::array<uint8_t, SCC_DATA_KEY_SIZE> data_key{};
        REQUIRE(scc_extract_data_key(
            keys.envelope.data(), keys.envelope.size(),
            stretch_key.data(), stretch_key.size(),
            data_key.data(), data_key.size(), &error) == SCC_SUCCESS);
        REQUIRE(data_key == keys.data_key);
    }

    SECTION("Password recovery") {
        const std::string user_id = "user-1234";
        const std::string good = "correct horse";
        const std::string bad = "wrong horse";
        std::array<uint8_t, SCC_DATA_KEY_SIZE> data_key{};
        REQUIRE(scc_recover_data_key(
            AsBytes(user_id), user_id.size(), AsBytes(good), good.size(),
            keys.envelope.data(), keys.envelope.size(),
            data_key.data(), data_key.size(), &error) == SCC_SUCCESS);
        REQUIRE(data_key == keys.data_key);

        REQUIRE(scc_recover_data_key(
            AsBytes(user_id), user_id.size(), AsBytes(bad), bad.size(),
            keys.envelope.data(), keys.envelope.size(),
            data_key.data(), data_key.size(), &error) == SCC_ERROR_AUTHENTICATION);
        REQUIRE(error.code == SCC_ERROR_AUTHENTICATION);
        REQUIRE(error.message != nullptr);
        scc_error_free(&error);
        REQUIRE(error.message == nullptr);
    }

    SECTION("Tampered envelope") {
        std::array<uint8_t, SCC_PASSWORD_VERIFIER_SIZE> verifier{};
        std::array<uint8_t, SCC_STRETCH_KEY_SIZE> stretch_key{};
        REQUIRE(scc_prepare_for_login(
            keys.primary_key.data(), keys.primary_key.size(),
            verifier.data(), verifier.size(),
            stretch_key.data(), stretch_key.size(), nullptr) == SCC_SUCCESS);
        auto tampered = keys.envelope;
        tampered[0] ^= 0x01;
        std::array<uint8_t, SCC_DATA_KEY_SIZE> data_key{};
        REQUIRE(scc_extract_data_key(
            tampered.data(), tampered.size(),
            stretch_key.data(), stretch_key.size(),
            data_key.data(), data_key.size(), nullptr) == SCC_ERROR_AUTHENTICATION);
    }
}

TEST_CASE("C API - Account key validation", "[c_api][account][boundary]") {
    REQUIRE(scc_init() == SCC_SUCCESS);

    SECTION("Empty user id") {
        AccountOutputs keys;
        SccError error{};
        REQUIRE(GenerateKeys("", "correct horse", keys, &error) == SCC_ERROR_INVALID_USER_ID);
        scc_error_free(&error);
    }

    SECTION("Empty password") {
        AccountOutputs keys;
        SccError error{};
        REQUIRE(GenerateKeys("user-1234", "", keys, &error) == SCC_ERROR_INVALID_PASSWORD);
        scc_error_free(&error);
    }

    SECTION("NULL user id with non-zero length") {
        AccountOutputs keys;
        SccError error{};
        const std::string password = "pw";
        REQUIRE(scc_generate_account_keys(
            nullptr, 8, AsBytes(password), password.size(),
            keys.primary_key.data(), keys.primary_key.size(),
            keys.data_key.data(), keys.data_key.size(),
            keys.password_verifier.data(), keys.password_verifier.size(),
            keys.envelope.data(), keys.envelope.size(),
            &error) == SCC_ERROR_NULL_POINTER);
        scc_error_free(&error);
    }

    SECTION("Output buffer of the wrong size") {
        std::array<uint8_t, SCC_PRIMARY_KEY_SIZE> primary_key{};
        std::vector<uint8_t> verifier(SCC_PASSWORD_VERIFIER_SIZE - 1);
        SccError error{};
        REQUIRE(scc_derive_password_verifier(
            primary_key.data(), primary_key.size(),
            verifier.data(), verifier.size(), &error) == SCC_ERROR_BUFFER_TOO_SMALL);
        scc_error_free(&error);
    }

    SECTION("Primary key of the wrong size") {
        std::vector<uint8_t> primary_key(SCC_PRIMARY_KEY_SIZE + 1, 0x01);
        std::array<uint8_t, SCC_PASSWORD_VERIFIER_SIZE> verifier{};
        SccError error{};
        REQUIRE(scc_derive_password_verifier(
            primary_key.data(), primary_key.size(),
            verifier.data(), verifier.size(), &error) == SCC_ERROR_INVALID_INPUT);
        scc_error_free(&error);
    }
}

TEST_CASE("C API - Symmetric encryption", "[c_api][codec]") {
    REQUIRE(scc_init() == SCC_SUCCESS);
    std::vector<uint8_t> key(SCC_SYMMETRIC_KEY_SIZE, 0x42);
    const std::string message = "hello";

    SECTION("Round trip") {
        SccBuffer ciphertext{};
        REQUIRE(scc_encrypt(AsBytes(message), message.size(), key.data(), key.size(),
                            &ciphertext, nullptr) == SCC_SUCCESS);
        REQUIRE(ciphertext.length == message.size() + SCC_ENCRYPTED_EXTRA_BYTES_SIZE);

        SccBuffer plaintext{};
        REQUIRE(scc_decrypt(ciphertext.data, ciphertext.length, key.data(), key.size(),
                            &plaintext, nullptr) == SCC_SUCCESS);
        REQUIRE(std::string(reinterpret_cast<const char*>(plaintext.data), plaintext.length) == message);

        scc_buffer_free(&ciphertext);
        scc_buffer_free(&plaintext);
        REQUIRE(ciphertext.data == nullptr);
        REQUIRE(plaintext.length == 0);
    }

    SECTION("Empty plaintext") {
        SccBuffer ciphertext{};
        REQUIRE(scc_encrypt(nullptr, 0, key.data(), key.size(), &ciphertext, nullptr) == SCC_SUCCESS);
        SccBuffer plaintext{};
        REQUIRE(scc_decrypt(ciphertext.data, ciphertext.length, key.data(), key.size(),
                            &plaintext, nullptr) == SCC_SUCCESS);
        REQUIRE(plaintext.length == 0);
        scc_buffer_free(&ciphertext);
        scc_buffer_free(&plaintext);
    }

    SECTION("Short ciphertext and wrong key") {
        std::vector<uint8_t> short_bundle(SCC_ENCRYPTED_EXTRA_BYTES_SIZE - 1, 0x00);
        SccBuffer plaintext{};
        SccError error{};
        REQUIRE(scc_decrypt(short_bundle.data(), short_bundle.size(), key.data(), key.size(),
                            &plaintext, &error) == SCC_ERROR_INVALID_INPUT);
        scc_error_free(&error);

        SccBuffer ciphertext{};
        REQUIRE(scc_encrypt(AsBytes(message), message.size(), key.data(), key.size(),
                            &ciphertext, nullptr) == SCC_SUCCESS);
        std::vector<uint8_t> wrong_key(SCC_SYMMETRIC_KEY_SIZE, 0x43);
        REQUIRE(scc_decrypt(ciphertext.data, ciphertext.length, wrong_key.data(), wrong_key.size(),
                            &plaintext, nullptr) == SCC_ERROR_AUTHENTICATION);
        scc_buffer_free(&ciphertext);
    }

    SECTION("NULL output buffer") {
        REQUIRE(scc_encrypt(AsBytes(message), message.size(), key.data(), key.size(),
                            nullptr, nullptr) == SCC_ERROR_NULL_POINTER);
    }
}

TEST_CASE("C API - Secure wipe", "[c_api][memory]") {
    std::vector<uint8_t> data(16, 0xFF);
    REQUIRE(scc_secure_wipe(data.data(), data.size()) == SCC_SUCCESS);
    REQUIRE(data == std::vector<uint8_t>(16, 0x00));
    REQUIRE(scc_secure_wipe(nullptr, 4) == SCC_ERROR_NULL_POINTER);
    REQUIRE(scc_secure_wipe(nullptr, 0) == SCC_SUCCESS);
}
