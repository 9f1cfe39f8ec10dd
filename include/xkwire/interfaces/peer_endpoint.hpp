#pragma once
#include "xkwire/models/key_materials/x25519_key_material.hpp"
#include <cstdint>
#include <optional>
#include <string>
namespace xkwire::protocol::interfaces {

enum class HostClass : uint8_t {
    IPv4,
    IPv6,
    OnionV2,
    OnionV3
};

/**
 * Where a peer lives and, when known, who it is.
 *
 * Parsing and formatting of addresses stay with the caller. The handshake
 * only reads `static_public_key`, which an initiator must have.
 */
struct PeerEndpoint {
    HostClass host_class = HostClass::IPv4;
    std::string host;
    uint16_t port = 0;
    std::optional<models::X25519PublicKey> static_public_key;

    [[nodiscard]] bool HasIdentity() const noexcept {
        return static_public_key.has_value();
    }

    [[nodiscard]] bool operator==(const PeerEndpoint& other) const = default;
};
}
