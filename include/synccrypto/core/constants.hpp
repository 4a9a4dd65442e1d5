#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace synccrypto {
struct Constants {
    static constexpr size_t PRIMARY_KEY_SIZE = 32;
    static constexpr size_t DATA_KEY_SIZE = 32;
    static constexpr size_t PASSWORD_VERIFIER_SIZE = 32;
    static constexpr size_t STRETCH_KEY_SIZE = 32;
    static constexpr size_t SALT_SIZE = 16;
    static constexpr size_t SYMMETRIC_KEY_SIZE = 32;
    static constexpr size_t SECRETBOX_TAG_SIZE = 16;
    static constexpr size_t SECRETBOX_NONCE_SIZE = 24;
    static constexpr size_t ENCRYPTED_EXTRA_BYTES_SIZE = SECRETBOX_TAG_SIZE + SECRETBOX_NONCE_SIZE;
    static constexpr size_t PROTECTED_KEY_ENVELOPE_SIZE = DATA_KEY_SIZE + ENCRYPTED_EXTRA_BYTES_SIZE;
    static constexpr size_t KDF_MASTER_KEY_SIZE = 32;
    static constexpr size_t KDF_CONTEXT_SIZE = 8;
    static constexpr size_t KDF_SUBKEY_MIN_SIZE = 16;
    static constexpr size_t KDF_SUBKEY_MAX_SIZE = 64;
    static constexpr size_t PWHASH_STRING_SIZE = 128;
};
struct KdfConstants {
    static constexpr uint64_t PASSWORD_VERIFIER_SUBKEY_ID = 1;
    static constexpr uint64_t STRETCH_KEY_SUBKEY_ID = 2;
    static constexpr std::string_view PASSWORD_VERIFIER_CONTEXT = "Password";
    static constexpr std::string_view STRETCH_KEY_CONTEXT = "Stretchy";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
    static constexpr int PWHASH_NEEDS_REHASH = 1;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view EMPTY_USER_ID = "User id must not be empty";
    static constexpr std::string_view EMPTY_PASSWORD = "Password must not be empty";
    static constexpr std::string_view DECRYPTION_FAILED = "Decryption failed: wrong key or tampered ciphertext";
};
}
