#include "xkwire/models/key_materials/ephemeral_key_pair.hpp"
namespace xkwire::protocol::models {
EphemeralKeyPair::EphemeralKeyPair(X25519KeyMaterial material)
    : material_(std::move(material)) {
}
Result<EphemeralKeyPair, ProtocolFailure> EphemeralKeyPair::Generate() {
    auto material_result = X25519KeyMaterial::Generate("ephemeral");
    if (material_result.IsErr()) {
        return Result<EphemeralKeyPair, ProtocolFailure>::Err(
            std::move(material_result).UnwrapErr());
    }
    return Result<EphemeralKeyPair, ProtocolFailure>::Ok(
        EphemeralKeyPair(std::move(material_result).Unwrap()));
}
}
