#pragma once

/**
 * @file key_logger.hpp
 * @brief Debug logging of derived key material.
 *
 * SECURITY WARNING: This module prints keys to stdout. Only enable
 * SYNCCRYPTO_DEBUG_KEYS to compare derivations against another
 * implementation during development. NEVER enable in production builds.
 * Passwords and user ids are never passed to the logger.
 *
 * Enable via CMake: -DSYNCCRYPTO_DEBUG_KEYS=ON
 */

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <span>
#include <string>

namespace synccrypto::debug {

#ifdef SYNCCRYPTO_DEBUG_KEYS

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

#define SCC_LOG_KEY(operation, key_name, data) \
    do { \
        fprintf(stdout, "[SCC-DEBUG] %s %s: %s\n", \
            operation, \
            key_name, \
            ::synccrypto::debug::ToHex(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define SCC_LOG_VALUE(operation, name, value) \
    do { \
        fprintf(stdout, "[SCC-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define SCC_LOG_MSG(operation, message) \
    do { \
        fprintf(stdout, "[SCC-DEBUG] %s %s\n", operation, message); \
        fflush(stdout); \
    } while(0)

#define SCC_LOG_SECTION(section_name) \
    do { \
        fprintf(stdout, "[SCC-DEBUG] ========== %s ==========\n", section_name); \
        fflush(stdout); \
    } while(0)

// ============================================================================
// Account creation / login
// ============================================================================

inline void LogSaltDerived(std::span<const uint8_t> salt) {
    SCC_LOG_KEY("PWHASH", "salt", salt);
}

inline void LogPrimaryKey(const char* operation, std::span<const uint8_t> primary_key) {
    SCC_LOG_KEY(operation, "primary_key", primary_key);
}

inline void LogSubkeys(
    const char* operation,
    std::span<const uint8_t> password_verifier,
    std::span<const uint8_t> stretch_key) {
    SCC_LOG_KEY(operation, "password_verifier", password_verifier);
    SCC_LOG_KEY(operation, "stretch_key", stretch_key);
}

inline void LogAccountKeysCreated(
    std::span<const uint8_t> data_key,
    std::span<const uint8_t> protected_key_envelope) {
    SCC_LOG_SECTION("ACCOUNT KEYS CREATED");
    SCC_LOG_KEY("ACCOUNT", "data_key", data_key);
    SCC_LOG_KEY("ACCOUNT", "protected_key_envelope", protected_key_envelope);
    SCC_LOG_VALUE("ACCOUNT", "envelope_size", protected_key_envelope.size());
}

inline void LogEnvelopeOpened(bool success) {
    SCC_LOG_MSG("LOGIN", success ? "envelope_opened: YES" : "envelope_opened: NO");
}

#else // !SYNCCRYPTO_DEBUG_KEYS

#define SCC_LOG_KEY(operation, key_name, data) ((void)0)
#define SCC_LOG_VALUE(operation, name, value) ((void)0)
#define SCC_LOG_MSG(operation, message) ((void)0)
#define SCC_LOG_SECTION(section_name) ((void)0)

inline void LogSaltDerived(std::span<const uint8_t>) {}
inline void LogPrimaryKey(const char*, std::span<const uint8_t>) {}
inline void LogSubkeys(const char*, std::span<const uint8_t>, std::span<const uint8_t>) {}
inline void LogAccountKeysCreated(std::span<const uint8_t>, std::span<const uint8_t>) {}
inline void LogEnvelopeOpened(bool) {}

#endif // SYNCCRYPTO_DEBUG_KEYS

} // namespace synccrypto::debug
