#include "xkwire/models/key_materials/static_key_pair.hpp"
namespace xkwire::protocol::models {
StaticKeyPair::StaticKeyPair(X25519KeyMaterial material)
    : material_(std::move(material)) {
}
Result<StaticKeyPair, ProtocolFailure> StaticKeyPair::Generate() {
    auto material_result = X25519KeyMaterial::Generate("static identity");
    if (material_result.IsErr()) {
        return Result<StaticKeyPair, ProtocolFailure>::Err(
            std::move(material_result).UnwrapErr());
    }
    return Result<StaticKeyPair, ProtocolFailure>::Ok(
        StaticKeyPair(std::move(material_result).Unwrap()));
}
Result<StaticKeyPair, ProtocolFailure> StaticKeyPair::FromPrivateKey(
    std::span<const uint8_t> private_key) {
    auto material_result = X25519KeyMaterial::FromSecretKey(private_key);
    if (material_result.IsErr()) {
        return Result<StaticKeyPair, ProtocolFailure>::Err(
            std::move(material_result).UnwrapErr());
    }
    return Result<StaticKeyPair, ProtocolFailure>::Ok(
        StaticKeyPair(std::move(material_result).Unwrap()));
}
}
