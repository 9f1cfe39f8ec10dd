#pragma once
#include "xkwire/configuration/session_config.hpp"
#include "xkwire/core/failures.hpp"
#include "xkwire/core/result.hpp"
#include "xkwire/identity/key_material.hpp"
#include "xkwire/interfaces/i_byte_stream.hpp"
#include "xkwire/protocol/handshake.hpp"
#include <optional>

namespace xkwire::protocol {

/// Runs a full XK exchange over a byte stream.
///
/// Handshake messages go on the wire raw, without a length prefix, so the
/// reader relies on the fixed sizes of the empty-payload exchange. Every read
/// gets the deadline; when none is given it is now + the config's handshake
/// timeout. On any failure the in-flight state is destroyed before returning.
class HandshakeDriver {
public:
    [[nodiscard]] static Result<HandshakeResult, ProtocolFailure> RunInitiator(
        interfaces::IByteStream& stream,
        identity::KeyMaterial keys,
        configuration::SessionConfig config = configuration::SessionConfig::Default(),
        std::optional<interfaces::Deadline> deadline = std::nullopt);

    [[nodiscard]] static Result<HandshakeResult, ProtocolFailure> RunResponder(
        interfaces::IByteStream& stream,
        identity::KeyMaterial keys,
        configuration::SessionConfig config = configuration::SessionConfig::Default(),
        std::optional<interfaces::Deadline> deadline = std::nullopt);

private:
    HandshakeDriver() = delete;
};

}  // namespace xkwire::protocol
