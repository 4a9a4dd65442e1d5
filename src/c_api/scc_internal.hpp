/**
 * @file scc_internal.hpp
 * @brief Internal helpers for the SyncCrypto C API
 *
 * This header is NOT part of the public API.
 */

#ifndef SCC_INTERNAL_HPP
#define SCC_INTERNAL_HPP

#include "synccrypto/c_api/scc_api.h"
#include "synccrypto/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>

namespace scc::internal {

using synccrypto::CryptoFailure;

void fill_error(SccError* out_error, SccErrorCode code, const std::string& message);

/**
 * @brief Convert a CryptoFailure to an error code and fill the error struct
 * @return The corresponding SccErrorCode
 */
SccErrorCode fill_error_from_failure(SccError* out_error, const CryptoFailure& failure);

/**
 * @brief Validate an input buffer parameter (data pointer vs length)
 * @return true if valid, false otherwise (fills out_error)
 */
bool validate_buffer_param(const uint8_t* data, size_t length, SccError* out_error);

/**
 * @brief Validate a fixed-size output buffer
 * @return SCC_SUCCESS if usable, error code otherwise (fills out_error)
 */
SccErrorCode validate_output_key(
    const uint8_t* out, size_t out_length, size_t expected, const char* name, SccError* out_error);

/**
 * @brief Copy data to an output buffer (allocates memory)
 * @return true on success, false on failure (fills out_error)
 */
bool copy_to_buffer(std::span<const uint8_t> input, SccBuffer* out_buffer, SccError* out_error);

} // namespace scc::internal

#endif // SCC_INTERNAL_HPP
