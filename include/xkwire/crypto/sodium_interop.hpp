#pragma once

#include "xkwire/core/result.hpp"
#include "xkwire/core/failures.hpp"
#include "xkwire/core/constants.hpp"
#include "xkwire/crypto/sodium_secure_memory_handle.hpp"

#include <sodium.h>
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace xkwire::protocol::crypto {

/**
 * @brief Interop layer for libsodium operations
 *
 * Every key-holding object in the library goes through this class for
 * random bytes, X25519, hashing and memory wiping, so libsodium is touched
 * in one place only.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Must be called before any other operation. Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are cleared through a volatile pointer, larger ones with
     * sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // X25519
    // ========================================================================

    /**
     * @brief Generate an X25519 key pair
     *
     * The secret scalar never exists outside secure memory except for the
     * temporary used to derive the public point, which is wiped before
     * returning.
     *
     * @param key_purpose Description used in error messages
     * @return Ok((secret_handle, public_key)) or Err
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief Recompute the public point for a stored secret scalar
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveX25519PublicKey(
        const SecureMemoryHandle& secret_key);

    /**
     * @brief X25519 scalar multiplication into secure memory
     *
     * Fails when libsodium reports an all-zero output, which happens for
     * small-order peer points.
     */
    static Result<SecureMemoryHandle, ProtocolFailure> ScalarMult(
        const SecureMemoryHandle& secret_key,
        std::span<const uint8_t> peer_public_key);

    // ========================================================================
    // Hashing / Random
    // ========================================================================

    /**
     * @brief SHA-256(first || second) without building the concatenation
     */
    static std::array<uint8_t, crypto_hash_sha256_BYTES> Sha256(
        std::span<const uint8_t> first,
        std::span<const uint8_t> second = {});

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guard-paged, locked memory with sodium_malloc
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace xkwire::protocol::crypto
