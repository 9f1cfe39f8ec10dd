#include "xkwire/crypto/sodium_interop.hpp"
#include "xkwire/crypto/sodium_secure_memory_handle.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace xkwire::protocol::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
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

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                "Buffer size " + std::to_string(buffer.size()) +
                " exceeds maximum " + std::to_string(MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }

    return Result<bool, SodiumFailure>::Ok(
        sodium_memcmp(a.data(), b.data(), a.size()) == 0);
}

// ============================================================================
// X25519
// ============================================================================

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>;

    auto sk_handle_result = SecureMemoryHandle::Allocate(Constants::X_25519_PRIVATE_KEY_SIZE);
    if (sk_handle_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(sk_handle_result.UnwrapErr()));
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();

    auto fill_result = sk_handle.WithWriteAccess([](std::span<uint8_t> sk) {
        randombytes_buf(sk.data(), sk.size());
        return unit;
    });
    if (fill_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(fill_result.UnwrapErr()));
    }

    auto pk_result = DeriveX25519PublicKey(sk_handle);
    if (pk_result.IsErr()) {
        return KeyPairResult::Err(ProtocolFailure::KeyGeneration(
            "Failed to derive " + std::string(key_purpose) + " public key: " +
            pk_result.UnwrapErr().message));
    }

    return KeyPairResult::Ok(
        std::make_pair(std::move(sk_handle), std::move(pk_result).Unwrap()));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::DeriveX25519PublicKey(
    const SecureMemoryHandle& secret_key) {
    if (secret_key.Size() != Constants::X_25519_PRIVATE_KEY_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKeyMaterial(
                "X25519 secret key must be " +
                std::to_string(Constants::X_25519_PRIVATE_KEY_SIZE) + " bytes"));
    }

    std::vector<uint8_t> pk_bytes(Constants::X_25519_PUBLIC_KEY_SIZE);
    auto derive_result = secret_key.WithReadAccess([&pk_bytes](std::span<const uint8_t> sk) {
        return crypto_scalarmult_base(pk_bytes.data(), sk.data());
    });
    if (derive_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(derive_result.UnwrapErr()));
    }
    if (derive_result.Unwrap() != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("crypto_scalarmult_base failed"));
    }

    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(pk_bytes));
}

Result<SecureMemoryHandle, ProtocolFailure> SodiumInterop::ScalarMult(
    const SecureMemoryHandle& secret_key,
    std::span<const uint8_t> peer_public_key) {
    if (peer_public_key.size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKeyMaterial(
                "Peer public key must be " +
                std::to_string(Constants::X_25519_PUBLIC_KEY_SIZE) + " bytes"));
    }

    auto shared_result = SecureMemoryHandle::Allocate(Constants::X_25519_SHARED_SECRET_SIZE);
    if (shared_result.IsErr()) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(shared_result.UnwrapErr()));
    }
    SecureMemoryHandle shared = std::move(shared_result).Unwrap();

    auto dh_result = secret_key.WithReadAccess([&shared, peer_public_key](std::span<const uint8_t> sk) {
        auto inner = shared.WithWriteAccess([sk, peer_public_key](std::span<uint8_t> out) {
            return crypto_scalarmult(out.data(), sk.data(), peer_public_key.data());
        });
        return inner.IsOk() ? inner.Unwrap() : SodiumConstants::FAILURE;
    });
    if (dh_result.IsErr()) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(dh_result.UnwrapErr()));
    }
    if (dh_result.Unwrap() != SodiumConstants::SUCCESS) {
        return Result<SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKeyMaterial(
                "X25519 produced an all-zero shared secret"));
    }

    return Result<SecureMemoryHandle, ProtocolFailure>::Ok(std::move(shared));
}

// ============================================================================
// Hashing / Random
// ============================================================================

std::array<uint8_t, crypto_hash_sha256_BYTES> SodiumInterop::Sha256(
    std::span<const uint8_t> first,
    std::span<const uint8_t> second) {
    std::array<uint8_t, crypto_hash_sha256_BYTES> digest{};
    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);
    crypto_hash_sha256_update(&state, first.data(), first.size());
    crypto_hash_sha256_update(&state, second.data(), second.size());
    crypto_hash_sha256_final(&state, digest.data());
    sodium_memzero(&state, sizeof(state));
    return digest;
}

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    if (size > 0) {
        randombytes_buf(buffer.data(), size);
    }
    return buffer;
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

} // namespace xkwire::protocol::crypto
