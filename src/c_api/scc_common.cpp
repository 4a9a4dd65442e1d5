/**
 * @file scc_common.cpp
 * @brief C API plumbing: initialization, error mapping and buffer management
 */

#include "synccrypto/c_api/scc_api.h"
#include "scc_internal.hpp"
#include "synccrypto/crypto/sodium_interop.hpp"
#include "synccrypto/core/format.hpp"
#include <cstdlib>
#include <cstring>
#include <new>
#include <span>
#include <string>

using synccrypto::CryptoFailureType;
using synccrypto::crypto::SodiumInterop;

// ============================================================================
// Internal Helper Implementations
// ============================================================================

namespace scc::internal {

void fill_error(SccError* out_error, const SccErrorCode code, const std::string& message) {
    if (out_error) {
        out_error->code = code;
#ifdef _WIN32
        out_error->message = _strdup(message.c_str());
#else
        out_error->message = strdup(message.c_str());
#endif
    }
}

SccErrorCode fill_error_from_failure(SccError* out_error, const CryptoFailure& failure) {
    SccErrorCode code = SCC_ERROR_GENERIC;

    switch (failure.type) {
        case CryptoFailureType::NotInitialized:
            code = SCC_ERROR_NOT_INITIALIZED;
            break;
        case CryptoFailureType::InvalidInput:
            code = SCC_ERROR_INVALID_INPUT;
            break;
        case CryptoFailureType::InvalidUserId:
            code = SCC_ERROR_INVALID_USER_ID;
            break;
        case CryptoFailureType::InvalidPassword:
            code = SCC_ERROR_INVALID_PASSWORD;
            break;
        case CryptoFailureType::HashingFailed:
        case CryptoFailureType::PrimaryKeyDerivationFailed:
            code = SCC_ERROR_HASHING;
            break;
        case CryptoFailureType::DerivationFailed:
        case CryptoFailureType::VerifierDerivationFailed:
        case CryptoFailureType::StretchKeyDerivationFailed:
            code = SCC_ERROR_DERIVE_KEY;
            break;
        case CryptoFailureType::AuthenticationFailed:
            code = SCC_ERROR_AUTHENTICATION;
            break;
        case CryptoFailureType::RandomGenerationFailed:
            code = SCC_ERROR_RANDOM_GENERATION;
            break;
        case CryptoFailureType::EncryptionFailed:
        case CryptoFailureType::EnvelopeEncryptionFailed:
            code = SCC_ERROR_ENCRYPTION;
            break;
        default:
            code = SCC_ERROR_GENERIC;
            break;
    }

    if (out_error) {
        fill_error(out_error, code, failure.message);
    }
    return code;
}

bool validate_buffer_param(const uint8_t* data, const size_t length, SccError* out_error) {
    if (!data && length > 0) {
        fill_error(out_error, SCC_ERROR_NULL_POINTER, "Buffer data is null but length is non-zero");
        return false;
    }
    return true;
}

SccErrorCode validate_output_key(
    const uint8_t* out,
    const size_t out_length,
    const size_t expected,
    const char* name,
    SccError* out_error) {
    if (!out) {
        fill_error(out_error, SCC_ERROR_NULL_POINTER, synccrypto::compat::format("{} output is null", name));
        return SCC_ERROR_NULL_POINTER;
    }
    if (out_length != expected) {
        fill_error(out_error, SCC_ERROR_BUFFER_TOO_SMALL,
                   synccrypto::compat::format("{} output must be {} bytes, got {}", name, expected, out_length));
        return SCC_ERROR_BUFFER_TOO_SMALL;
    }
    return SCC_SUCCESS;
}

bool copy_to_buffer(const std::span<const uint8_t> input, SccBuffer* out_buffer, SccError* out_error) {
    if (!out_buffer) {
        fill_error(out_error, SCC_ERROR_NULL_POINTER, "Output buffer is null");
        return false;
    }

    // Zero-length plaintexts still get a distinct allocation
    auto* data = new(std::nothrow) uint8_t[input.empty() ? 1 : input.size()];
    if (!data) {
        fill_error(out_error, SCC_ERROR_OUT_OF_MEMORY, "Failed to allocate output buffer");
        return false;
    }
    if (!input.empty()) {
        std::memcpy(data, input.data(), input.size());
    }
    out_buffer->data = data;
    out_buffer->length = input.size();
    return true;
}

} // namespace scc::internal

using namespace scc::internal;

extern "C" {

// ----------------------------------------------------------------------------
// Version & Initialization
// ----------------------------------------------------------------------------

const char* scc_version(void) {
    return "1.0.0";
}

SccErrorCode scc_init(void) {
    const auto result = SodiumInterop::Initialize();
    if (result.IsErr()) {
        return SCC_ERROR_SODIUM_FAILURE;
    }
    return SCC_SUCCESS;
}

// ----------------------------------------------------------------------------
// Memory & Error Management
// ----------------------------------------------------------------------------

void scc_buffer_free(SccBuffer* buffer) {
    if (buffer && buffer->data) {
        SodiumInterop::SecureWipe(std::span(buffer->data, buffer->length));
        delete[] buffer->data;
        buffer->data = nullptr;
        buffer->length = 0;
    }
}

void scc_error_free(SccError* error) {
    if (error && error->message) {
        free(error->message);
        error->message = nullptr;
    }
}

const char* scc_error_string(const SccErrorCode code) {
    switch (code) {
        case SCC_SUCCESS: return "Success";
        case SCC_ERROR_GENERIC: return "Generic error";
        case SCC_ERROR_INVALID_INPUT: return "Invalid input";
        case SCC_ERROR_INVALID_USER_ID: return "Invalid user id";
        case SCC_ERROR_INVALID_PASSWORD: return "Invalid password";
        case SCC_ERROR_NOT_INITIALIZED: return "Library not initialized";
        case SCC_ERROR_HASHING: return "Password hashing failed";
        case SCC_ERROR_DERIVE_KEY: return "Key derivation failed";
        case SCC_ERROR_AUTHENTICATION: return "Authentication failed";
        case SCC_ERROR_RANDOM_GENERATION: return "Random generation failed";
        case SCC_ERROR_ENCRYPTION: return "Encryption failed";
        case SCC_ERROR_BUFFER_TOO_SMALL: return "Buffer too small";
        case SCC_ERROR_OUT_OF_MEMORY: return "Out of memory";
        case SCC_ERROR_SODIUM_FAILURE: return "Sodium library failure";
        case SCC_ERROR_NULL_POINTER: return "Null pointer";
        default: return "Unknown error";
    }
}

SccErrorCode scc_secure_wipe(uint8_t* data, const size_t length) {
    if (!data && length > 0) {
        return SCC_ERROR_NULL_POINTER;
    }

    if (length > 0) {
        SodiumInterop::SecureWipe(std::span(data, length));
    }

    return SCC_SUCCESS;
}

} // extern "C"
