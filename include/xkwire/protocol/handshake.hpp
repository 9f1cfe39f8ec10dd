#pragma once
#include "xkwire/configuration/session_config.hpp"
#include "xkwire/core/failures.hpp"
#include "xkwire/core/result.hpp"
#include "xkwire/debug/key_logger.hpp"
#include "xkwire/identity/key_material.hpp"
#include "xkwire/protocol/cipher_state.hpp"
#include "xkwire/protocol/symmetric_state.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace xkwire::protocol {

/// Output of a completed XK handshake, ready for SessionTransport.
struct HandshakeResult {
    CipherState send;
    CipherState receive;
    identity::RemoteIdentity remote_identity;
    /// Final h; identical on both sides, usable as a channel binding.
    HandshakeHash handshake_hash;
    /// Last payload received from the peer: message 2 for the initiator,
    /// message 3 for the responder. Usually empty.
    std::vector<uint8_t> payload;
    configuration::SessionConfig config;
    debug::Side side = debug::Side::Unknown;
};

/// A write transition yields the next state and the bytes to transmit.
template<typename Next>
struct Outbound {
    Next next;
    std::vector<uint8_t> message;
};

namespace detail {
    struct HandshakeContext;
}

class InitiatorSentMessage1;
class InitiatorReceivedMessage2;
class ResponderReceivedMessage1;
class ResponderSentMessage2;

// Initiator:  InitiatorHandshake -> InitiatorSentMessage1 -> InitiatorReceivedMessage2 -> HandshakeResult
// Responder:  ResponderHandshake -> ResponderReceivedMessage1 -> ResponderSentMessage2 -> HandshakeResult
//
// Every transition consumes the state it is called on. On error the consumed
// state's ephemeral key and transcript are destroyed before returning. A
// transition on a moved-from state returns UnexpectedMessage.

class InitiatorHandshake {
public:
    /// Requires keys.RemoteStatic(); the prologue and responder key are mixed
    /// into the transcript here.
    [[nodiscard]] static Result<InitiatorHandshake, ProtocolFailure> Create(
        identity::KeyMaterial keys,
        configuration::SessionConfig config = configuration::SessionConfig::Default());

    /// -> e, es
    [[nodiscard]] Result<Outbound<InitiatorSentMessage1>, ProtocolFailure> WriteMessage1(
        std::span<const uint8_t> payload = {}) &&;

    InitiatorHandshake(InitiatorHandshake&&) noexcept;
    InitiatorHandshake& operator=(InitiatorHandshake&&) noexcept;
    InitiatorHandshake(const InitiatorHandshake&) = delete;
    InitiatorHandshake& operator=(const InitiatorHandshake&) = delete;
    ~InitiatorHandshake();

private:
    explicit InitiatorHandshake(std::unique_ptr<detail::HandshakeContext> context);
    std::unique_ptr<detail::HandshakeContext> context_;
};

class InitiatorSentMessage1 {
public:
    /// <- e, ee
    [[nodiscard]] Result<InitiatorReceivedMessage2, ProtocolFailure> ReadMessage2(
        std::span<const uint8_t> message) &&;

    InitiatorSentMessage1(InitiatorSentMessage1&&) noexcept;
    InitiatorSentMessage1& operator=(InitiatorSentMessage1&&) noexcept;
    InitiatorSentMessage1(const InitiatorSentMessage1&) = delete;
    InitiatorSentMessage1& operator=(const InitiatorSentMessage1&) = delete;
    ~InitiatorSentMessage1();

private:
    friend class InitiatorHandshake;
    explicit InitiatorSentMessage1(std::unique_ptr<detail::HandshakeContext> context);
    std::unique_ptr<detail::HandshakeContext> context_;
};

class InitiatorReceivedMessage2 {
public:
    /// -> s, se, then Split
    [[nodiscard]] Result<Outbound<HandshakeResult>, ProtocolFailure> WriteMessage3(
        std::span<const uint8_t> payload = {}) &&;

    [[nodiscard]] const std::vector<uint8_t>& Payload() const noexcept { return payload_; }

    InitiatorReceivedMessage2(InitiatorReceivedMessage2&&) noexcept;
    InitiatorReceivedMessage2& operator=(InitiatorReceivedMessage2&&) noexcept;
    InitiatorReceivedMessage2(const InitiatorReceivedMessage2&) = delete;
    InitiatorReceivedMessage2& operator=(const InitiatorReceivedMessage2&) = delete;
    ~InitiatorReceivedMessage2();

private:
    friend class InitiatorSentMessage1;
    InitiatorReceivedMessage2(
        std::unique_ptr<detail::HandshakeContext> context,
        std::vector<uint8_t> payload);
    std::unique_ptr<detail::HandshakeContext> context_;
    std::vector<uint8_t> payload_;
};

class ResponderHandshake {
public:
    [[nodiscard]] static Result<ResponderHandshake, ProtocolFailure> Create(
        identity::KeyMaterial keys,
        configuration::SessionConfig config = configuration::SessionConfig::Default());

    /// e, es ->
    [[nodiscard]] Result<ResponderReceivedMessage1, ProtocolFailure> ReadMessage1(
        std::span<const uint8_t> message) &&;

    ResponderHandshake(ResponderHandshake&&) noexcept;
    ResponderHandshake& operator=(ResponderHandshake&&) noexcept;
    ResponderHandshake(const ResponderHandshake&) = delete;
    ResponderHandshake& operator=(const ResponderHandshake&) = delete;
    ~ResponderHandshake();

private:
    explicit ResponderHandshake(std::unique_ptr<detail::HandshakeContext> context);
    std::unique_ptr<detail::HandshakeContext> context_;
};

class ResponderReceivedMessage1 {
public:
    /// <- e, ee
    [[nodiscard]] Result<Outbound<ResponderSentMessage2>, ProtocolFailure> WriteMessage2(
        std::span<const uint8_t> payload = {}) &&;

    [[nodiscard]] const std::vector<uint8_t>& Payload() const noexcept { return payload_; }

    ResponderReceivedMessage1(ResponderReceivedMessage1&&) noexcept;
    ResponderReceivedMessage1& operator=(ResponderReceivedMessage1&&) noexcept;
    ResponderReceivedMessage1(const ResponderReceivedMessage1&) = delete;
    ResponderReceivedMessage1& operator=(const ResponderReceivedMessage1&) = delete;
    ~ResponderReceivedMessage1();

private:
    friend class ResponderHandshake;
    ResponderReceivedMessage1(
        std::unique_ptr<detail::HandshakeContext> context,
        std::vector<uint8_t> payload);
    std::unique_ptr<detail::HandshakeContext> context_;
    std::vector<uint8_t> payload_;
};

class ResponderSentMessage2 {
public:
    /// s, se ->, then Split. The remote identity is known only after this.
    [[nodiscard]] Result<HandshakeResult, ProtocolFailure> ReadMessage3(
        std::span<const uint8_t> message) &&;

    ResponderSentMessage2(ResponderSentMessage2&&) noexcept;
    ResponderSentMessage2& operator=(ResponderSentMessage2&&) noexcept;
    ResponderSentMessage2(const ResponderSentMessage2&) = delete;
    ResponderSentMessage2& operator=(const ResponderSentMessage2&) = delete;
    ~ResponderSentMessage2();

private:
    friend class ResponderReceivedMessage1;
    explicit ResponderSentMessage2(std::unique_ptr<detail::HandshakeContext> context);
    std::unique_ptr<detail::HandshakeContext> context_;
};

}  // namespace xkwire::protocol
