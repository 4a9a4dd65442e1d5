#pragma once

#include "synccrypto/core/result.hpp"
#include "synccrypto/core/failures.hpp"
#include "synccrypto/core/constants.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>

namespace synccrypto::crypto {

/**
 * @brief Interop layer for libsodium process-wide state and memory helpers
 *
 * The library never initializes libsodium lazily. The host application
 * calls Initialize() once at startup; every primitive in this project
 * checks IsInitialized() and fails with NotInitialized otherwise.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Thread-safe and idempotent. A failed first attempt is sticky:
     * later calls report the same failure.
     *
     * @return Ok if initialization succeeded, Err otherwise
     */
    static Result<Unit, SodiumFailure> Initialize();

    /**
     * @brief Check if libsodium is initialized
     */
    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Zero a buffer with sodium_memzero (never optimized away)
     */
    static void SecureWipe(std::span<uint8_t> buffer) noexcept;

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    /**
     * @brief Fill a buffer from the libsodium CSPRNG
     *
     * Fails with RandomGenerationFailed when libsodium has not been
     * initialized; there is no fallback entropy source.
     */
    static Result<Unit, CryptoFailure> FillRandom(std::span<uint8_t> buffer);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guard-paged, locked memory using sodium_malloc
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    /**
     * @brief Free memory from AllocateSecure (zeroed by sodium_free)
     */
    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

/**
 * @brief Wipes a stack or heap buffer when leaving scope
 */
class [[nodiscard]] ScopedWipe {
public:
    explicit ScopedWipe(std::span<uint8_t> buffer) noexcept : buffer_(buffer) {}
    ~ScopedWipe() { SodiumInterop::SecureWipe(buffer_); }

    ScopedWipe(const ScopedWipe&) = delete;
    ScopedWipe& operator=(const ScopedWipe&) = delete;
    ScopedWipe(ScopedWipe&&) = delete;
    ScopedWipe& operator=(ScopedWipe&&) = delete;

private:
    std::span<uint8_t> buffer_;
};

} // namespace synccrypto::crypto
