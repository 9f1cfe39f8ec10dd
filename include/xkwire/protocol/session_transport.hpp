#pragma once
#include "xkwire/configuration/session_config.hpp"
#include "xkwire/core/failures.hpp"
#include "xkwire/core/result.hpp"
#include "xkwire/debug/key_logger.hpp"
#include "xkwire/identity/key_material.hpp"
#include "xkwire/interfaces/i_byte_stream.hpp"
#include "xkwire/interfaces/i_session_event_handler.hpp"
#include "xkwire/protocol/cipher_state.hpp"
#include "xkwire/protocol/handshake.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace xkwire::protocol {

namespace detail {
    /// Close flag and event handler shared by both directions of a session,
    /// including after Split().
    class SessionLink {
    public:
        explicit SessionLink(debug::Side side) noexcept : side_(side) {}

        [[nodiscard]] bool IsClosed() const noexcept {
            return closed_.load(std::memory_order_acquire);
        }

        /// First caller wins; the handler hears about it once.
        void Close(const ProtocolFailure& reason);

        void SetEventHandler(std::shared_ptr<interfaces::ISessionEventHandler> handler);
        void NotifyRekey(interfaces::Direction direction, uint64_t rekey_count);

        [[nodiscard]] debug::Side Side() const noexcept { return side_; }

    private:
        debug::Side side_;
        std::atomic<bool> closed_{false};
        std::mutex handler_mutex_;
        std::shared_ptr<interfaces::ISessionEventHandler> handler_;
    };
}

/// Sending half: frames and encrypts under the send CipherState.
class SessionWriter {
public:
    /// len(2, big-endian) || ciphertext || tag, written to the stream.
    [[nodiscard]] Result<Unit, ProtocolFailure> Send(std::span<const uint8_t> payload);

    /// The same frame returned instead of written.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Seal(std::span<const uint8_t> payload);

    void Close();

    [[nodiscard]] bool IsClosed() const noexcept;
    [[nodiscard]] uint64_t Nonce() const noexcept { return cipher_.Nonce(); }
    [[nodiscard]] uint64_t RekeyCount() const noexcept { return cipher_.RekeyCount(); }

    SessionWriter(SessionWriter&&) noexcept = default;
    SessionWriter& operator=(SessionWriter&&) noexcept = default;
    SessionWriter(const SessionWriter&) = delete;
    SessionWriter& operator=(const SessionWriter&) = delete;
    ~SessionWriter() = default;

private:
    friend class SessionTransport;

    SessionWriter(
        CipherState cipher,
        std::shared_ptr<interfaces::IByteStream> stream,
        std::shared_ptr<detail::SessionLink> link,
        size_t max_payload);

    [[nodiscard]] ProtocolFailure Fail(ProtocolFailure failure);

    CipherState cipher_;
    std::shared_ptr<interfaces::IByteStream> stream_;
    std::shared_ptr<detail::SessionLink> link_;
    size_t max_payload_;
};

/// Receiving half: reads frames and decrypts under the receive CipherState.
class SessionReader {
public:
    /// A Timeout keeps the session open; a frame whose body timed out is
    /// resumed by the next call.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Receive(
        std::optional<interfaces::Deadline> deadline = std::nullopt);

    /// Decrypts one whole frame taken from a message-oriented carrier.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Open(std::span<const uint8_t> frame);

    void Close();

    [[nodiscard]] bool IsClosed() const noexcept;
    [[nodiscard]] uint64_t Nonce() const noexcept { return cipher_.Nonce(); }
    [[nodiscard]] uint64_t RekeyCount() const noexcept { return cipher_.RekeyCount(); }

    SessionReader(SessionReader&&) noexcept = default;
    SessionReader& operator=(SessionReader&&) noexcept = default;
    SessionReader(const SessionReader&) = delete;
    SessionReader& operator=(const SessionReader&) = delete;
    ~SessionReader() = default;

private:
    friend class SessionTransport;

    SessionReader(
        CipherState cipher,
        std::shared_ptr<interfaces::IByteStream> stream,
        std::shared_ptr<detail::SessionLink> link,
        size_t max_payload);

    [[nodiscard]] Result<size_t, ProtocolFailure> ParseLength(std::span<const uint8_t> prefix);
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> DecryptBody(
        std::span<const uint8_t> prefix,
        std::span<const uint8_t> body);
    [[nodiscard]] ProtocolFailure Fail(ProtocolFailure failure);

    CipherState cipher_;
    std::shared_ptr<interfaces::IByteStream> stream_;
    std::shared_ptr<detail::SessionLink> link_;
    size_t max_payload_;
    std::optional<std::array<uint8_t, kFrameLengthPrefixBytes>> pending_prefix_;
};

/// Encrypted, length-framed channel established by an XK handshake.
///
/// Owns one send and one receive CipherState. Each direction has its own
/// mutex, so one thread may Send while another Receives. Any
/// AuthenticationFailed, FramingError (on input), NonceExhausted or Io
/// failure closes both directions; later calls return SessionClosed.
///
/// Thread Safety: Send/Seal and Receive/Open are each serialised.
class SessionTransport {
public:
    /// Wrap a completed handshake. `stream` may be null when only Seal/Open
    /// are used.
    [[nodiscard]] static Result<std::unique_ptr<SessionTransport>, ProtocolFailure> Establish(
        HandshakeResult handshake,
        std::shared_ptr<interfaces::IByteStream> stream);

    /// HandshakeDriver::RunInitiator over `stream`, then Establish.
    [[nodiscard]] static Result<std::unique_ptr<SessionTransport>, ProtocolFailure> Connect(
        std::shared_ptr<interfaces::IByteStream> stream,
        identity::KeyMaterial keys,
        configuration::SessionConfig config = configuration::SessionConfig::Default(),
        std::optional<interfaces::Deadline> deadline = std::nullopt);

    /// HandshakeDriver::RunResponder over `stream`, then Establish.
    [[nodiscard]] static Result<std::unique_ptr<SessionTransport>, ProtocolFailure> Accept(
        std::shared_ptr<interfaces::IByteStream> stream,
        identity::KeyMaterial keys,
        configuration::SessionConfig config = configuration::SessionConfig::Default(),
        std::optional<interfaces::Deadline> deadline = std::nullopt);

    [[nodiscard]] Result<Unit, ProtocolFailure> Send(std::span<const uint8_t> payload);
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Receive(
        std::optional<interfaces::Deadline> deadline = std::nullopt);
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Seal(std::span<const uint8_t> payload);
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Open(std::span<const uint8_t> frame);

    /// Close both directions. A direction busy in another thread zeroes its
    /// key when that call returns.
    void Close();

    /// Hand the two directions to separate owners. Consumes the transport.
    [[nodiscard]] std::pair<SessionWriter, SessionReader> Split() &&;

    void SetEventHandler(std::shared_ptr<interfaces::ISessionEventHandler> handler);

    [[nodiscard]] bool IsClosed() const noexcept { return link_->IsClosed(); }
    [[nodiscard]] const identity::RemoteIdentity& RemoteIdentity() const noexcept { return remote_identity_; }
    [[nodiscard]] const HandshakeHash& GetHandshakeHash() const noexcept { return handshake_hash_; }
    [[nodiscard]] uint64_t SendNonce() const;
    [[nodiscard]] uint64_t ReceiveNonce() const;

    SessionTransport(const SessionTransport&) = delete;
    SessionTransport& operator=(const SessionTransport&) = delete;
    SessionTransport(SessionTransport&&) = delete;
    SessionTransport& operator=(SessionTransport&&) = delete;
    ~SessionTransport() = default;

private:
    SessionTransport(
        SessionWriter writer,
        SessionReader reader,
        std::shared_ptr<detail::SessionLink> link,
        identity::RemoteIdentity remote_identity,
        const HandshakeHash& handshake_hash);

    /// Once the link is closed, zero the direction whose lock is held and the
    /// other one too if it is idle; a busy one is zeroed when its call returns.
    void SweepClosed(interfaces::Direction held);

    mutable std::mutex send_mutex_;
    SessionWriter writer_;
    mutable std::mutex receive_mutex_;
    SessionReader reader_;
    std::shared_ptr<detail::SessionLink> link_;
    identity::RemoteIdentity remote_identity_;
    HandshakeHash handshake_hash_;
};

}  // namespace xkwire::protocol
