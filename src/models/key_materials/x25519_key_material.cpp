#include "xkwire/models/key_materials/x25519_key_material.hpp"
#include "xkwire/crypto/sodium_interop.hpp"
#include "xkwire/core/constants.hpp"
#include <algorithm>
#include <string>
namespace xkwire::protocol::models {
X25519KeyMaterial::X25519KeyMaterial(
    crypto::SecureMemoryHandle secret_key_handle,
    std::vector<uint8_t> public_key)
    : secret_key_handle_(std::move(secret_key_handle))
    , public_key_(std::move(public_key)) {
}
Result<X25519KeyMaterial, ProtocolFailure> X25519KeyMaterial::Generate(std::string_view key_purpose) {
    auto init_result = crypto::SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        return Result<X25519KeyMaterial, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }
    auto key_pair_result = crypto::SodiumInterop::GenerateX25519KeyPair(key_purpose);
    if (key_pair_result.IsErr()) {
        return Result<X25519KeyMaterial, ProtocolFailure>::Err(
            std::move(key_pair_result).UnwrapErr());
    }
    auto [secret_key, public_key] = std::move(key_pair_result).Unwrap();
    return Result<X25519KeyMaterial, ProtocolFailure>::Ok(
        X25519KeyMaterial(std::move(secret_key), std::move(public_key)));
}
Result<X25519KeyMaterial, ProtocolFailure> X25519KeyMaterial::FromSecretKey(
    std::span<const uint8_t> secret_key) {
    if (secret_key.size() != Constants::X_25519_PRIVATE_KEY_SIZE) {
        return Result<X25519KeyMaterial, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKeyMaterial(
                "X25519 secret key must be " +
                std::to_string(Constants::X_25519_PRIVATE_KEY_SIZE) + " bytes, got " +
                std::to_string(secret_key.size())));
    }
    auto init_result = crypto::SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        return Result<X25519KeyMaterial, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(init_result.UnwrapErr()));
    }
    auto handle_result = crypto::SecureMemoryHandle::FromBytes(secret_key);
    if (handle_result.IsErr()) {
        return Result<X25519KeyMaterial, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    auto handle = std::move(handle_result).Unwrap();
    auto public_result = crypto::SodiumInterop::DeriveX25519PublicKey(handle);
    if (public_result.IsErr()) {
        return Result<X25519KeyMaterial, ProtocolFailure>::Err(
            std::move(public_result).UnwrapErr());
    }
    return Result<X25519KeyMaterial, ProtocolFailure>::Ok(
        X25519KeyMaterial(std::move(handle), std::move(public_result).Unwrap()));
}
X25519PublicKey X25519KeyMaterial::GetPublicKeyArray() const noexcept {
    X25519PublicKey out{};
    std::copy_n(public_key_.begin(), std::min(public_key_.size(), out.size()), out.begin());
    return out;
}
}
