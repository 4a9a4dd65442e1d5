#pragma once

#include "synccrypto/c_api/scc_export.h"

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

#define SCC_API_VERSION_MAJOR 1
#define SCC_API_VERSION_MINOR 0
#define SCC_API_VERSION_PATCH 0

enum {
    SCC_PRIMARY_KEY_SIZE = 32,
    SCC_DATA_KEY_SIZE = 32,
    SCC_PASSWORD_VERIFIER_SIZE = 32,
    SCC_STRETCH_KEY_SIZE = 32,
    SCC_SYMMETRIC_KEY_SIZE = 32,
    SCC_NONCE_SIZE = 24,
    SCC_TAG_SIZE = 16,
    SCC_ENCRYPTED_EXTRA_BYTES_SIZE = 40,
    SCC_PROTECTED_KEY_ENVELOPE_SIZE = 72
};

typedef enum {
    SCC_SUCCESS = 0,
    SCC_ERROR_GENERIC = 1,
    SCC_ERROR_INVALID_INPUT = 2,
    SCC_ERROR_INVALID_USER_ID = 3,
    SCC_ERROR_INVALID_PASSWORD = 4,
    SCC_ERROR_NOT_INITIALIZED = 5,
    SCC_ERROR_HASHING = 6,
    SCC_ERROR_DERIVE_KEY = 7,
    SCC_ERROR_AUTHENTICATION = 8,
    SCC_ERROR_RANDOM_GENERATION = 9,
    SCC_ERROR_ENCRYPTION = 10,
    SCC_ERROR_BUFFER_TOO_SMALL = 11,
    SCC_ERROR_OUT_OF_MEMORY = 12,
    SCC_ERROR_SODIUM_FAILURE = 13,
    SCC_ERROR_NULL_POINTER = 14
} SccErrorCode;

typedef struct SccBuffer {
    uint8_t* data;
    size_t length;
} SccBuffer;

typedef struct SccError {
    SccErrorCode code;
    char* message;
} SccError;

SCC_API const char* scc_version(void);

// Must succeed before any other call; until then they return SCC_ERROR_NOT_INITIALIZED.
SCC_API SccErrorCode scc_init(void);

// Derives primary key, password verifier and a fresh envelope-protected data key.
// Every output buffer must be exactly its SCC_*_SIZE.
SCC_API SccErrorCode scc_generate_account_keys(
    const uint8_t* user_id,
    size_t user_id_length,
    const uint8_t* password,
    size_t password_length,
    uint8_t* out_primary_key,
    size_t out_primary_key_length,
    uint8_t* out_data_key,
    size_t out_data_key_length,
    uint8_t* out_password_verifier,
    size_t out_password_verifier_length,
    uint8_t* out_protected_key_envelope,
    size_t out_protected_key_envelope_length,
    SccError* out_error);

SCC_API SccErrorCode scc_derive_password_verifier(
    const uint8_t* primary_key,
    size_t primary_key_length,
    uint8_t* out_password_verifier,
    size_t out_password_verifier_length,
    SccError* out_error);

SCC_API SccErrorCode scc_prepare_for_login(
    const uint8_t* primary_key,
    size_t primary_key_length,
    uint8_t* out_password_verifier,
    size_t out_password_verifier_length,
    uint8_t* out_stretch_key,
    size_t out_stretch_key_length,
    SccError* out_error);

// SCC_ERROR_AUTHENTICATION means a wrong stretch key or a modified envelope.
SCC_API SccErrorCode scc_extract_data_key(
    const uint8_t* protected_key_envelope,
    size_t protected_key_envelope_length,
    const uint8_t* stretch_key,
    size_t stretch_key_length,
    uint8_t* out_data_key,
    size_t out_data_key_length,
    SccError* out_error);

SCC_API SccErrorCode scc_recover_data_key(
    const uint8_t* user_id,
    size_t user_id_length,
    const uint8_t* password,
    size_t password_length,
    const uint8_t* protected_key_envelope,
    size_t protected_key_envelope_length,
    uint8_t* out_data_key,
    size_t out_data_key_length,
    SccError* out_error);

// Output is [tag][ciphertext][nonce]; release with scc_buffer_free.
SCC_API SccErrorCode scc_encrypt(
    const uint8_t* plaintext,
    size_t plaintext_length,
    const uint8_t* key,
    size_t key_length,
    SccBuffer* out_ciphertext,
    SccError* out_error);

SCC_API SccErrorCode scc_decrypt(
    const uint8_t* ciphertext,
    size_t ciphertext_length,
    const uint8_t* key,
    size_t key_length,
    SccBuffer* out_plaintext,
    SccError* out_error);

// Wipes and releases the data of a buffer filled by this library.
SCC_API void scc_buffer_free(SccBuffer* buffer);

SCC_API void scc_error_free(SccError* error);

SCC_API const char* scc_error_string(SccErrorCode code);

SCC_API SccErrorCode scc_secure_wipe(
    uint8_t* data,
    size_t length);

#ifdef __cplusplus
}
#endif
