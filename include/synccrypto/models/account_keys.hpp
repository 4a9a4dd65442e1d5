#pragma once

#include "synccrypto/crypto/sodium_secure_memory_handle.hpp"

#include <cstdint>
#include <vector>

namespace synccrypto::models {

using crypto::SecureMemoryHandle;

/**
 * @brief Output of account creation
 *
 * primary_key and data_key stay on the client (recovery secret and
 * payload key). password_verifier and protected_key_envelope are the
 * only values meant for the server.
 */
struct AccountKeys {
    SecureMemoryHandle primary_key;
    SecureMemoryHandle data_key;
    std::vector<uint8_t> password_verifier;
    std::vector<uint8_t> protected_key_envelope;
};

/**
 * @brief Values re-derived from a primary key when logging in
 *
 * password_verifier goes to the server; stretch_key opens the
 * protected_key_envelope the server sends back.
 */
struct LoginKeys {
    std::vector<uint8_t> password_verifier;
    SecureMemoryHandle stretch_key;
};

} // namespace synccrypto::models
