#pragma once

#include "xkwire/core/result.hpp"
#include "xkwire/core/failures.hpp"
#include "xkwire/core/constants.hpp"

#include <span>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace xkwire::protocol::crypto {

/**
 * @brief RAII owner of sodium_malloc'ed key material
 *
 * Guard pages, mlock'ed, zeroed on destruction and on Reset(). Move-only so
 * a chaining key, cipher key or DH output has exactly one owner; a
 * moved-from or reset handle is invalid and every access to it fails.
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /**
     * @brief Allocate and fill in one step
     */
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> data);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /**
     * @brief Overwrite the contents; shorter data is zero-padded
     */
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    Result<Unit, SodiumFailure> Read(std::span<uint8_t> output) const;

    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t size) const;

    /**
     * @brief Run func over the secret without copying it out
     */
    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
        }
        return Result<T, SodiumFailure>::Ok(
            std::forward<F>(func)(std::span<const uint8_t>(Bytes())));
    }

    template<typename F>
    auto WithWriteAccess(F&& func) -> Result<std::invoke_result_t<F, std::span<uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
        }
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(Bytes()));
    }

    /// Constant-time comparison; false if either handle is disposed.
    [[nodiscard]] bool ContentEquals(const SecureMemoryHandle& other) const noexcept;

    /**
     * @brief Zero and release now instead of at destruction
     */
    void Reset() noexcept;

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    [[nodiscard]] std::span<uint8_t> Bytes() const noexcept {
        return {static_cast<uint8_t*>(ptr_), size_};
    }

    void* ptr_;
    size_t size_;
};

} // namespace xkwire::protocol::crypto
