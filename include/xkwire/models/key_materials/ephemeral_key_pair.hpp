#pragma once
#include "xkwire/models/key_materials/x25519_key_material.hpp"
namespace xkwire::protocol::models {

/**
 * Single-use handshake key. Move-only; the secret scalar lives in
 * sodium_malloc'ed memory and is zeroed when the owning handshake state is
 * destroyed or Wipe() is called.
 */
class EphemeralKeyPair {
public:
    static Result<EphemeralKeyPair, ProtocolFailure> Generate();
    EphemeralKeyPair(EphemeralKeyPair&&) noexcept = default;
    EphemeralKeyPair& operator=(EphemeralKeyPair&&) noexcept = default;
    EphemeralKeyPair(const EphemeralKeyPair&) = delete;
    EphemeralKeyPair& operator=(const EphemeralKeyPair&) = delete;
    [[nodiscard]] const crypto::SecureMemoryHandle& GetPrivateKeyHandle() const noexcept {
        return material_.GetSecretKeyHandle();
    }
    [[nodiscard]] std::span<const uint8_t> GetPublicKey() const noexcept {
        return material_.GetPublicKey();
    }
    [[nodiscard]] bool IsWiped() const noexcept {
        return material_.IsWiped();
    }
    void Wipe() noexcept {
        material_.Wipe();
    }
private:
    explicit EphemeralKeyPair(X25519KeyMaterial material);
    X25519KeyMaterial material_;
};
}
