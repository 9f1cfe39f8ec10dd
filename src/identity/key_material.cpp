#include "xkwire/identity/key_material.hpp"
#include "xkwire/crypto/sodium_interop.hpp"
#include "xkwire/security/validation/dh_validator.hpp"

#include <algorithm>
#include <string>

namespace xkwire::protocol::identity {

bool RemoteIdentity::Matches(std::span<const uint8_t> public_key) const noexcept {
    if (public_key.size() != public_key_.size()) {
        return false;
    }
    auto equal = crypto::SodiumInterop::ConstantTimeEquals(public_key_, public_key);
    return equal.IsOk() && equal.Unwrap();
}

KeyMaterial::KeyMaterial(std::shared_ptr<const models::StaticKeyPair> local_static)
    : local_static_(std::move(local_static)) {
}

Result<KeyMaterial, ProtocolFailure> KeyMaterial::ForResponder(
    std::shared_ptr<const models::StaticKeyPair> local_static) {
    if (!local_static) {
        return Result<KeyMaterial, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKeyMaterial("Local static key pair is required"));
    }
    return Result<KeyMaterial, ProtocolFailure>::Ok(KeyMaterial(std::move(local_static)));
}

Result<KeyMaterial, ProtocolFailure> KeyMaterial::ForInitiator(
    std::shared_ptr<const models::StaticKeyPair> local_static,
    std::span<const uint8_t> remote_static_public) {
    if (!local_static) {
        return Result<KeyMaterial, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKeyMaterial("Local static key pair is required"));
    }
    auto valid = security::DhValidator::ValidateX25519PublicKey(remote_static_public);
    if (valid.IsErr()) {
        return Result<KeyMaterial, ProtocolFailure>::Err(std::move(valid).UnwrapErr());
    }

    KeyMaterial material(std::move(local_static));
    models::X25519PublicKey remote{};
    std::copy(remote_static_public.begin(), remote_static_public.end(), remote.begin());
    material.remote_static_ = remote;
    return Result<KeyMaterial, ProtocolFailure>::Ok(std::move(material));
}

Result<KeyMaterial, ProtocolFailure> KeyMaterial::ForPeer(
    std::shared_ptr<const models::StaticKeyPair> local_static,
    const interfaces::PeerEndpoint& endpoint) {
    if (!endpoint.HasIdentity()) {
        return Result<KeyMaterial, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKeyMaterial(
                "Peer " + endpoint.host + ":" + std::to_string(endpoint.port) +
                " has no static public key"));
    }
    return ForInitiator(std::move(local_static), *endpoint.static_public_key);
}

Result<models::EphemeralKeyPair, ProtocolFailure> KeyMaterial::NewEphemeral() {
    return models::EphemeralKeyPair::Generate();
}

Result<crypto::SecureMemoryHandle, ProtocolFailure> KeyMaterial::DiffieHellman(
    const crypto::SecureMemoryHandle& local_private,
    std::span<const uint8_t> remote_public) {
    auto valid = security::DhValidator::ValidateX25519PublicKey(remote_public);
    if (valid.IsErr()) {
        return Result<crypto::SecureMemoryHandle, ProtocolFailure>::Err(
            std::move(valid).UnwrapErr());
    }
    if (local_private.IsInvalid()) {
        return Result<crypto::SecureMemoryHandle, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKeyMaterial("Local private key has been wiped"));
    }
    return crypto::SodiumInterop::ScalarMult(local_private, remote_public);
}

} // namespace xkwire::protocol::identity
