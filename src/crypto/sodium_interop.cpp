#include "synccrypto/crypto/sodium_interop.hpp"
#include "synccrypto/core/format.hpp"

#include <sodium.h>

#include <string>

namespace synccrypto::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        // sodium_init() returns 1 when already initialized by the host
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

void SodiumInterop::SecureWipe(std::span<uint8_t> buffer) noexcept {
    if (buffer.empty()) {
        return;
    }
    sodium_memzero(buffer.data(), buffer.size());
}

// ============================================================================
// Random Number Generation
// ============================================================================

Result<Unit, CryptoFailure> SodiumInterop::FillRandom(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::RandomGenerationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(
                compat::format("Random buffer of {} bytes exceeds maximum {}",
                               buffer.size(), MAX_BUFFER_SIZE)));
    }
    randombytes_buf(buffer.data(), buffer.size());
    return Result<Unit, CryptoFailure>::Ok(unit);
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace synccrypto::crypto
