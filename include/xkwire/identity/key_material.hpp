#pragma once

#include "xkwire/core/result.hpp"
#include "xkwire/core/failures.hpp"
#include "xkwire/crypto/sodium_secure_memory_handle.hpp"
#include "xkwire/models/key_materials/static_key_pair.hpp"
#include "xkwire/models/key_materials/ephemeral_key_pair.hpp"
#include "xkwire/interfaces/peer_endpoint.hpp"

#include <memory>
#include <optional>
#include <span>

namespace xkwire::protocol::identity {

/// The peer's static public key as authenticated by a completed handshake.
class RemoteIdentity {
public:
    explicit RemoteIdentity(const models::X25519PublicKey& public_key) noexcept
        : public_key_(public_key) {}

    [[nodiscard]] std::span<const uint8_t> GetPublicKey() const noexcept {
        return public_key_;
    }

    [[nodiscard]] const models::X25519PublicKey& GetPublicKeyArray() const noexcept {
        return public_key_;
    }

    [[nodiscard]] bool Matches(std::span<const uint8_t> public_key) const noexcept;

    [[nodiscard]] bool operator==(const RemoteIdentity& other) const noexcept {
        return public_key_ == other.public_key_;
    }

private:
    models::X25519PublicKey public_key_;
};

/**
 * @brief Keys a node brings to a handshake
 *
 * Holds the local static identity (shared, immutable, so one KeyMaterial can
 * seed any number of concurrent handshakes) and, for the initiator role, the
 * responder's static public key learned out of band. Copies are cheap.
 */
class KeyMaterial {
public:
    /// Responder-side material: no expected remote key. Fails with
    /// InvalidKeyMaterial if the local key pair is missing.
    static Result<KeyMaterial, ProtocolFailure> ForResponder(
        std::shared_ptr<const models::StaticKeyPair> local_static);

    /// Initiator-side material. Fails with InvalidKeyMaterial if the remote
    /// key is not a usable X25519 point.
    static Result<KeyMaterial, ProtocolFailure> ForInitiator(
        std::shared_ptr<const models::StaticKeyPair> local_static,
        std::span<const uint8_t> remote_static_public);

    /// Initiator-side material for a peer whose endpoint carries its key.
    static Result<KeyMaterial, ProtocolFailure> ForPeer(
        std::shared_ptr<const models::StaticKeyPair> local_static,
        const interfaces::PeerEndpoint& endpoint);

    static Result<models::EphemeralKeyPair, ProtocolFailure> NewEphemeral();

    /**
     * X25519(local_private, remote_public) into secure memory.
     *
     * InvalidKeyMaterial when the remote point has the wrong length, is of
     * small order, is not canonical, or the shared secret comes out all-zero.
     */
    static Result<crypto::SecureMemoryHandle, ProtocolFailure> DiffieHellman(
        const crypto::SecureMemoryHandle& local_private,
        std::span<const uint8_t> remote_public);

    /// False only for moved-from material.
    [[nodiscard]] bool HasLocalStatic() const noexcept { return local_static_ != nullptr; }

    [[nodiscard]] const models::StaticKeyPair& LocalStatic() const noexcept {
        return *local_static_;
    }

    [[nodiscard]] const std::optional<models::X25519PublicKey>& RemoteStatic() const noexcept {
        return remote_static_;
    }

private:
    explicit KeyMaterial(std::shared_ptr<const models::StaticKeyPair> local_static);

    std::shared_ptr<const models::StaticKeyPair> local_static_;
    std::optional<models::X25519PublicKey> remote_static_;
};

} // namespace xkwire::protocol::identity
