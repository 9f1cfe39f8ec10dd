#pragma once
#include "xkwire/models/key_materials/x25519_key_material.hpp"
namespace xkwire::protocol::models {

/**
 * Long-term node identity. Immutable once created; shared by every
 * handshake the node runs (see identity::KeyMaterial).
 */
class StaticKeyPair {
public:
    static Result<StaticKeyPair, ProtocolFailure> Generate();
    /**
     * Rebuild the identity from a stored 32-byte scalar. Where the scalar
     * comes from is the caller's business.
     */
    static Result<StaticKeyPair, ProtocolFailure> FromPrivateKey(std::span<const uint8_t> private_key);
    StaticKeyPair(StaticKeyPair&&) noexcept = default;
    StaticKeyPair& operator=(StaticKeyPair&&) noexcept = default;
    StaticKeyPair(const StaticKeyPair&) = delete;
    StaticKeyPair& operator=(const StaticKeyPair&) = delete;
    [[nodiscard]] const crypto::SecureMemoryHandle& GetPrivateKeyHandle() const noexcept {
        return material_.GetSecretKeyHandle();
    }
    [[nodiscard]] std::span<const uint8_t> GetPublicKey() const noexcept {
        return material_.GetPublicKey();
    }
    [[nodiscard]] X25519PublicKey GetPublicKeyArray() const noexcept {
        return material_.GetPublicKeyArray();
    }
private:
    explicit StaticKeyPair(X25519KeyMaterial material);
    X25519KeyMaterial material_;
};
}
