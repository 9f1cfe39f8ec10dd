#pragma once
#include "xkwire/core/result.hpp"
#include "xkwire/core/failures.hpp"
#include "xkwire/crypto/sodium_secure_memory_handle.hpp"
#include <array>
#include <span>
#include <string_view>
#include <vector>
#include <cstdint>
namespace xkwire::protocol::models {
using X25519PublicKey = std::array<uint8_t, 32>;
class X25519KeyMaterial {
public:
    X25519KeyMaterial(
        crypto::SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key);
    static Result<X25519KeyMaterial, ProtocolFailure> Generate(std::string_view key_purpose);
    static Result<X25519KeyMaterial, ProtocolFailure> FromSecretKey(std::span<const uint8_t> secret_key);
    X25519KeyMaterial(X25519KeyMaterial&&) noexcept = default;
    X25519KeyMaterial& operator=(X25519KeyMaterial&&) noexcept = default;
    X25519KeyMaterial(const X25519KeyMaterial&) = delete;
    X25519KeyMaterial& operator=(const X25519KeyMaterial&) = delete;
    [[nodiscard]] const crypto::SecureMemoryHandle& GetSecretKeyHandle() const noexcept {
        return secret_key_handle_;
    }
    [[nodiscard]] std::span<const uint8_t> GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] X25519PublicKey GetPublicKeyArray() const noexcept;
    [[nodiscard]] bool IsWiped() const noexcept {
        return secret_key_handle_.IsInvalid();
    }
    void Wipe() noexcept {
        secret_key_handle_.Reset();
    }
private:
    crypto::SecureMemoryHandle secret_key_handle_;
    std::vector<uint8_t> public_key_;
};
}
