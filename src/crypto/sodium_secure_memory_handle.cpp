#include "xkwire/crypto/sodium_secure_memory_handle.hpp"
#include "xkwire/crypto/sodium_interop.hpp"
#include "xkwire/core/constants.hpp"

#include <algorithm>
#include <new>
#include <string>

namespace xkwire::protocol::crypto {

namespace {
    SodiumFailure Disposed() {
        return SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED));
    }
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(size_t size) {
    using AllocateResult = Result<SecureMemoryHandle, SodiumFailure>;

    if (!SodiumInterop::IsInitialized()) {
        return AllocateResult::Err(SodiumFailure::InitializationFailed(
            std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (size == 0) {
        return AllocateResult::Err(SodiumFailure::AllocationFailed(
            "Cannot allocate zero-sized secure memory"));
    }

    void* ptr = SodiumInterop::AllocateSecure(size);
    if (ptr == nullptr) {
        return AllocateResult::Err(SodiumFailure::AllocationFailed(
            std::string(ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY) +
            std::to_string(size) + " bytes"));
    }
    return AllocateResult::Ok(SecureMemoryHandle(ptr, size));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::FromBytes(
    std::span<const uint8_t> data) {
    return Allocate(data.size()).Bind([data](SecureMemoryHandle handle) {
        auto written = handle.Write(data);
        if (written.IsErr()) {
            return Result<SecureMemoryHandle, SodiumFailure>::Err(std::move(written).UnwrapErr());
        }
        return Result<SecureMemoryHandle, SodiumFailure>::Ok(std::move(handle));
    });
}

SecureMemoryHandle::~SecureMemoryHandle() {
    Reset();
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : ptr_(std::exchange(other.ptr_, nullptr))
    , size_(std::exchange(other.size_, 0)) {
}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        Reset();
        ptr_ = std::exchange(other.ptr_, nullptr);
        size_ = std::exchange(other.size_, 0);
    }
    return *this;
}

void SecureMemoryHandle::Reset() noexcept {
    if (ptr_ == nullptr) {
        return;
    }
    // sodium_free zeroes too; wipe explicitly so it does not depend on the allocator.
    sodium_memzero(ptr_, size_);
    SodiumInterop::FreeSecure(ptr_);
    ptr_ = nullptr;
    size_ = 0;
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(Disposed());
    }
    if (data.size() > size_) {
        return Result<Unit, SodiumFailure>::Err(SodiumFailure::BufferTooSmall(
            std::string(ErrorMessages::DATA_EXCEEDS_BUFFER) +
            " (data: " + std::to_string(data.size()) +
            ", buffer: " + std::to_string(size_) + ")"));
    }

    const auto secret = Bytes();
    std::copy(data.begin(), data.end(), secret.begin());
    std::fill(secret.begin() + static_cast<std::ptrdiff_t>(data.size()), secret.end(), uint8_t{0});
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Read(std::span<uint8_t> output) const {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(Disposed());
    }
    if (output.size() < size_) {
        return Result<Unit, SodiumFailure>::Err(SodiumFailure::BufferTooSmall(
            "Output buffer too small (requested: " + std::to_string(size_) +
            ", provided: " + std::to_string(output.size()) + ")"));
    }

    const auto secret = Bytes();
    std::copy(secret.begin(), secret.end(), output.begin());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SecureMemoryHandle::ReadBytes(size_t size) const {
    using BytesResult = Result<std::vector<uint8_t>, SodiumFailure>;

    if (IsInvalid()) {
        return BytesResult::Err(Disposed());
    }
    if (size > size_) {
        return BytesResult::Err(SodiumFailure::BufferTooSmall(
            "Requested " + std::to_string(size) + " bytes from a " +
            std::to_string(size_) + "-byte handle"));
    }

    try {
        const auto secret = Bytes().first(size);
        return BytesResult::Ok(std::vector<uint8_t>(secret.begin(), secret.end()));
    } catch (const std::bad_alloc& ex) {
        return BytesResult::Err(SodiumFailure::ReadOperationFailed(
            std::string(ErrorMessages::FAILED_TO_READ_SECURE_MEMORY) + ex.what()));
    }
}

bool SecureMemoryHandle::ContentEquals(const SecureMemoryHandle& other) const noexcept {
    if (IsInvalid() || other.IsInvalid() || size_ != other.size_) {
        return false;
    }
    return sodium_memcmp(ptr_, other.ptr_, size_) == 0;
}

} // namespace xkwire::protocol::crypto
