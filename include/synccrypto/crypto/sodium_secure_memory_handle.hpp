#pragma once

#include "synccrypto/core/result.hpp"
#include "synccrypto/core/failures.hpp"

#include <span>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

namespace synccrypto::crypto {

/**
 * @brief RAII wrapper for libsodium secure memory
 *
 * Manages memory allocated via sodium_malloc:
 * - Guard pages before/after (detect buffer overflows)
 * - Memory locked in RAM (no swap)
 * - Zeroed on free
 *
 * Move-only. Every secret this library hands out (primary key, data key,
 * stretch key) lives in one of these.
 *
 * Example:
 * @code
 * auto handle = SecureMemoryHandle::FromBytes(key_bytes).Unwrap();
 * auto copy = handle.ReadBytes(handle.Size());
 * @endcode
 */
class SecureMemoryHandle {
public:
    /**
     * @brief Allocate secure memory
     *
     * @param size Number of bytes to allocate (non-zero)
     * @return Ok(SecureMemoryHandle) or Err on allocation failure
     */
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /**
     * @brief Allocate and fill from an existing buffer
     */
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> data);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /**
     * @brief Copy the whole allocation into output
     *
     * @param output Must be at least Size() bytes
     */
    Result<Unit, SodiumFailure> Read(std::span<uint8_t> output) const;

    /**
     * @brief Copy the first size bytes into a new vector
     */
    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t size) const;

    /**
     * @brief Run func with read-only access to the secure memory
     *
     * The span is only valid during the call.
     */
    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }

        std::span<const uint8_t> secure_span(
            static_cast<const uint8_t*>(ptr_),
            size_);

        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    /**
     * @brief Run func with read-write access to the secure memory
     */
    template<typename F>
    auto WithWriteAccess(F&& func) -> Result<std::invoke_result_t<F, std::span<uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }

        std::span<uint8_t> secure_span(
            static_cast<uint8_t*>(ptr_),
            size_);

        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void* ptr_;
    size_t size_;
};

} // namespace synccrypto::crypto
