#include "synccrypto/crypto/sodium_secure_memory_handle.hpp"
#include "synccrypto/crypto/sodium_interop.hpp"
#include "synccrypto/core/constants.hpp"
#include "synccrypto/core/format.hpp"

#include <cstring>
#include <string>

namespace synccrypto::crypto {

// ============================================================================
// Construction / Destruction
// ============================================================================

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(size_t size) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (size == 0) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed(
                "Cannot allocate zero-sized secure memory"));
    }

    if (size > SodiumInterop::MAX_BUFFER_SIZE) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                compat::format("Requested {} bytes of secure memory", size)));
    }

    void* ptr = SodiumInterop::AllocateSecure(size);
    if (ptr == nullptr) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed(
                compat::format("{}{} bytes", ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY, size)));
    }

    return Result<SecureMemoryHandle, SodiumFailure>::Ok(
        SecureMemoryHandle(ptr, size));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::FromBytes(std::span<const uint8_t> data) {
    auto handle_result = Allocate(data.size());
    if (handle_result.IsErr()) {
        return handle_result;
    }
    SecureMemoryHandle handle = std::move(handle_result).Unwrap();
    std::memcpy(handle.ptr_, data.data(), data.size());
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(std::move(handle));
}

SecureMemoryHandle::~SecureMemoryHandle() {
    if (ptr_ != nullptr) {
        SodiumInterop::FreeSecure(ptr_);
        ptr_ = nullptr;
        size_ = 0;
    }
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : ptr_(other.ptr_)
    , size_(other.size_) {
    other.ptr_ = nullptr;
    other.size_ = 0;
}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        if (ptr_ != nullptr) {
            SodiumInterop::FreeSecure(ptr_);
        }

        ptr_ = other.ptr_;
        size_ = other.size_;

        other.ptr_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

// ============================================================================
// Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SecureMemoryHandle::Read(std::span<uint8_t> output) const {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(
                std::string(ErrorMessages::HANDLE_DISPOSED)));
    }

    if (output.size() < size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                compat::format("Output buffer too small (requested: {}, provided: {})",
                               size_, output.size())));
    }

    std::memcpy(output.data(), ptr_, size_);
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SecureMemoryHandle::ReadBytes(size_t size) const {
    if (IsInvalid()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(
                std::string(ErrorMessages::HANDLE_DISPOSED)));
    }

    if (size > size_) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                "Requested size exceeds allocated size"));
    }

    std::vector<uint8_t> result(size);
    std::memcpy(result.data(), ptr_, size);
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(result));
}

} // namespace synccrypto::crypto
