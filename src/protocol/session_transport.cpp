#include "xkwire/protocol/session_transport.hpp"
#include "xkwire/core/constants.hpp"
#include "xkwire/protocol/handshake_driver.hpp"
#include <algorithm>
#include <string>

namespace xkwire::protocol {
    using interfaces::Deadline;
    using interfaces::Direction;
    using interfaces::IByteStream;

    namespace {
        using FrameResult = Result<std::vector<uint8_t>, ProtocolFailure>;
        using LengthPrefix = std::array<uint8_t, kFrameLengthPrefixBytes>;

        bool ClosesSession(ProtocolFailureType type) noexcept {
            switch (type) {
                case ProtocolFailureType::AuthenticationFailed:
                case ProtocolFailureType::FramingError:
                case ProtocolFailureType::NonceExhausted:
                case ProtocolFailureType::Io:
                    return true;
                default:
                    return false;
            }
        }

        ProtocolFailure Closed() {
            return ProtocolFailure::SessionClosed(std::string(ErrorMessages::SESSION_CLOSED));
        }

        LengthPrefix EncodeLength(size_t length) noexcept {
            return {static_cast<uint8_t>(length >> 8), static_cast<uint8_t>(length & 0xFF)};
        }

        size_t DecodeLength(std::span<const uint8_t> prefix) noexcept {
            return (static_cast<size_t>(prefix[0]) << 8) | static_cast<size_t>(prefix[1]);
        }
    }

    // =========================================================================
    // SessionLink
    // =========================================================================

    void detail::SessionLink::Close(const ProtocolFailure& reason) {
        bool expected = false;
        if (!closed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return;
        }
        debug::LogSessionClosed(side_, reason.message);

        std::shared_ptr<interfaces::ISessionEventHandler> handler;
        {
            std::lock_guard lock(handler_mutex_);
            handler = handler_;
        }
        if (handler) {
            handler->OnSessionClosed(reason);
        }
    }

    void detail::SessionLink::SetEventHandler(std::shared_ptr<interfaces::ISessionEventHandler> handler) {
        std::lock_guard lock(handler_mutex_);
        handler_ = std::move(handler);
    }

    void detail::SessionLink::NotifyRekey(Direction direction, uint64_t rekey_count) {
        debug::LogRekey(side_, direction == Direction::Send ? "SEND" : "RECV", rekey_count);

        std::shared_ptr<interfaces::ISessionEventHandler> handler;
        {
            std::lock_guard lock(handler_mutex_);
            handler = handler_;
        }
        if (handler) {
            handler->OnRekey(direction, rekey_count);
        }
    }

    // =========================================================================
    // SessionWriter
    // =========================================================================

    SessionWriter::SessionWriter(
        CipherState cipher,
        std::shared_ptr<IByteStream> stream,
        std::shared_ptr<detail::SessionLink> link,
        size_t max_payload)
        : cipher_(std::move(cipher))
        , stream_(std::move(stream))
        , link_(std::move(link))
        , max_payload_(max_payload) {
    }

    bool SessionWriter::IsClosed() const noexcept {
        return !link_ || link_->IsClosed() || cipher_.IsDestroyed();
    }

    ProtocolFailure SessionWriter::Fail(ProtocolFailure failure) {
        if (ClosesSession(failure.type)) {
            cipher_.Destroy();
            link_->Close(failure);
        }
        return failure;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> SessionWriter::Seal(std::span<const uint8_t> payload) {
        if (IsClosed()) {
            cipher_.Destroy();
            return FrameResult::Err(Closed());
        }
        if (payload.size() > max_payload_) {
            return FrameResult::Err(ProtocolFailure::FramingError(
                "Payload of " + std::to_string(payload.size()) +
                " bytes exceeds the frame limit of " + std::to_string(max_payload_)));
        }

        const LengthPrefix prefix = EncodeLength(payload.size());
        const uint64_t nonce = cipher_.Nonce();
        const uint64_t rekeys_before = cipher_.RekeyCount();

        auto ciphertext = cipher_.Encrypt(payload, prefix);
        if (ciphertext.IsErr()) {
            return FrameResult::Err(Fail(std::move(ciphertext).UnwrapErr()));
        }
        debug::LogFrame(link_->Side(), "SEND", nonce, payload.size());
        if (cipher_.RekeyCount() != rekeys_before) {
            link_->NotifyRekey(Direction::Send, cipher_.RekeyCount());
        }

        const auto& body = ciphertext.Unwrap();
        std::vector<uint8_t> frame;
        frame.reserve(prefix.size() + body.size());
        frame.insert(frame.end(), prefix.begin(), prefix.end());
        frame.insert(frame.end(), body.begin(), body.end());
        return FrameResult::Ok(std::move(frame));
    }

    Result<Unit, ProtocolFailure> SessionWriter::Send(std::span<const uint8_t> payload) {
        if (!IsClosed() && !stream_) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Session has no byte stream; use Seal"));
        }
        auto frame = Seal(payload);
        if (frame.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(frame).UnwrapErr());
        }
        if (auto written = stream_->Write(frame.Unwrap()); written.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(Fail(std::move(written).UnwrapErr()));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    void SessionWriter::Close() {
        cipher_.Destroy();
        if (link_) {
            link_->Close(ProtocolFailure::SessionClosed("Closed locally"));
        }
    }

    // =========================================================================
    // SessionReader
    // =========================================================================

    SessionReader::SessionReader(
        CipherState cipher,
        std::shared_ptr<IByteStream> stream,
        std::shared_ptr<detail::SessionLink> link,
        size_t max_payload)
        : cipher_(std::move(cipher))
        , stream_(std::move(stream))
        , link_(std::move(link))
        , max_payload_(max_payload) {
    }

    bool SessionReader::IsClosed() const noexcept {
        return !link_ || link_->IsClosed() || cipher_.IsDestroyed();
    }

    ProtocolFailure SessionReader::Fail(ProtocolFailure failure) {
        if (ClosesSession(failure.type)) {
            cipher_.Destroy();
            pending_prefix_.reset();
            link_->Close(failure);
        }
        return failure;
    }

    Result<size_t, ProtocolFailure> SessionReader::ParseLength(std::span<const uint8_t> prefix) {
        const size_t length = DecodeLength(prefix);
        if (length > max_payload_) {
            return Result<size_t, ProtocolFailure>::Err(Fail(ProtocolFailure::FramingError(
                "Frame length " + std::to_string(length) +
                " exceeds the limit of " + std::to_string(max_payload_))));
        }
        return Result<size_t, ProtocolFailure>::Ok(length);
    }

    Result<std::vector<uint8_t>, ProtocolFailure> SessionReader::DecryptBody(
        std::span<const uint8_t> prefix,
        std::span<const uint8_t> body) {
        const uint64_t nonce = cipher_.Nonce();
        const uint64_t rekeys_before = cipher_.RekeyCount();

        auto plaintext = cipher_.Decrypt(body, prefix);
        if (plaintext.IsErr()) {
            return FrameResult::Err(Fail(std::move(plaintext).UnwrapErr()));
        }
        debug::LogFrame(link_->Side(), "RECV", nonce, plaintext.Unwrap().size());
        if (cipher_.RekeyCount() != rekeys_before) {
            link_->NotifyRekey(Direction::Receive, cipher_.RekeyCount());
        }
        return plaintext;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> SessionReader::Receive(std::optional<Deadline> deadline) {
        if (IsClosed()) {
            cipher_.Destroy();
            return FrameResult::Err(Closed());
        }
        if (!stream_) {
            return FrameResult::Err(
                ProtocolFailure::InvalidState("Session has no byte stream; use Open"));
        }

        if (!pending_prefix_.has_value()) {
            auto prefix = stream_->ReadExact(kFrameLengthPrefixBytes, deadline);
            if (prefix.IsErr()) {
                return FrameResult::Err(Fail(std::move(prefix).UnwrapErr()));
            }
            LengthPrefix bytes{};
            std::copy_n(prefix.Unwrap().begin(), bytes.size(), bytes.begin());
            pending_prefix_ = bytes;
        }

        const LengthPrefix prefix = *pending_prefix_;
        auto length = ParseLength(prefix);
        if (length.IsErr()) {
            return FrameResult::Err(std::move(length).UnwrapErr());
        }

        auto body = stream_->ReadExact(length.Unwrap() + kAeadTagBytes, deadline);
        if (body.IsErr()) {
            return FrameResult::Err(Fail(std::move(body).UnwrapErr()));
        }
        pending_prefix_.reset();

        if (link_->IsClosed()) {
            cipher_.Destroy();
            return FrameResult::Err(Closed());
        }
        return DecryptBody(prefix, body.Unwrap());
    }

    Result<std::vector<uint8_t>, ProtocolFailure> SessionReader::Open(std::span<const uint8_t> frame) {
        if (IsClosed()) {
            cipher_.Destroy();
            return FrameResult::Err(Closed());
        }
        if (frame.size() < kFrameLengthPrefixBytes + kAeadTagBytes) {
            return FrameResult::Err(Fail(ProtocolFailure::FramingError(
                "Frame of " + std::to_string(frame.size()) + " bytes is shorter than its overhead")));
        }

        const auto prefix = frame.first(kFrameLengthPrefixBytes);
        auto length = ParseLength(prefix);
        if (length.IsErr()) {
            return FrameResult::Err(std::move(length).UnwrapErr());
        }
        const size_t expected = kFrameLengthPrefixBytes + length.Unwrap() + kAeadTagBytes;
        if (frame.size() != expected) {
            return FrameResult::Err(Fail(ProtocolFailure::FramingError(
                "Frame is " + std::to_string(frame.size()) + " bytes, prefix says " +
                std::to_string(expected))));
        }
        return DecryptBody(prefix, frame.subspan(kFrameLengthPrefixBytes));
    }

    void SessionReader::Close() {
        cipher_.Destroy();
        pending_prefix_.reset();
        if (link_) {
            link_->Close(ProtocolFailure::SessionClosed("Closed locally"));
        }
    }

    // =========================================================================
    // SessionTransport
    // =========================================================================

    SessionTransport::SessionTransport(
        SessionWriter writer,
        SessionReader reader,
        std::shared_ptr<detail::SessionLink> link,
        identity::RemoteIdentity remote_identity,
        const HandshakeHash& handshake_hash)
        : writer_(std::move(writer))
        , reader_(std::move(reader))
        , link_(std::move(link))
        , remote_identity_(remote_identity)
        , handshake_hash_(handshake_hash) {
    }

    Result<std::unique_ptr<SessionTransport>, ProtocolFailure> SessionTransport::Establish(
        HandshakeResult handshake,
        std::shared_ptr<IByteStream> stream) {
        using TransportResult = Result<std::unique_ptr<SessionTransport>, ProtocolFailure>;

        if (handshake.send.IsDestroyed() || handshake.receive.IsDestroyed()) {
            return TransportResult::Err(
                ProtocolFailure::InvalidState("Handshake result holds destroyed keys"));
        }
        if (handshake.send.SharesKeyWith(handshake.receive)) {
            return TransportResult::Err(
                ProtocolFailure::InvalidState("Send and receive keys must differ"));
        }
        if (auto valid = handshake.config.Validate(); valid.IsErr()) {
            return TransportResult::Err(std::move(valid).UnwrapErr());
        }

        const size_t max_payload = handshake.config.GetMaxFramePayload();
        auto link = std::make_shared<detail::SessionLink>(handshake.side);
        SessionWriter writer(std::move(handshake.send), stream, link, max_payload);
        SessionReader reader(std::move(handshake.receive), std::move(stream), link, max_payload);

        return TransportResult::Ok(std::unique_ptr<SessionTransport>(new SessionTransport(
            std::move(writer),
            std::move(reader),
            std::move(link),
            handshake.remote_identity,
            handshake.handshake_hash)));
    }

    Result<std::unique_ptr<SessionTransport>, ProtocolFailure> SessionTransport::Connect(
        std::shared_ptr<IByteStream> stream,
        identity::KeyMaterial keys,
        configuration::SessionConfig config,
        std::optional<Deadline> deadline) {
        if (!stream) {
            return Result<std::unique_ptr<SessionTransport>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Connect requires a byte stream"));
        }
        return HandshakeDriver::RunInitiator(*stream, std::move(keys), std::move(config), deadline)
            .Bind([&stream](HandshakeResult handshake) {
                return Establish(std::move(handshake), std::move(stream));
            });
    }

    Result<std::unique_ptr<SessionTransport>, ProtocolFailure> SessionTransport::Accept(
        std::shared_ptr<IByteStream> stream,
        identity::KeyMaterial keys,
        configuration::SessionConfig config,
        std::optional<Deadline> deadline) {
        if (!stream) {
            return Result<std::unique_ptr<SessionTransport>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Accept requires a byte stream"));
        }
        return HandshakeDriver::RunResponder(*stream, std::move(keys), std::move(config), deadline)
            .Bind([&stream](HandshakeResult handshake) {
                return Establish(std::move(handshake), std::move(stream));
            });
    }

    void SessionTransport::SweepClosed(Direction held) {
        if (!link_->IsClosed()) {
            return;
        }
        if (held == Direction::Send) {
            writer_.Close();
            std::unique_lock other(receive_mutex_, std::try_to_lock);
            if (other.owns_lock()) {
                reader_.Close();
            }
        } else {
            reader_.Close();
            std::unique_lock other(send_mutex_, std::try_to_lock);
            if (other.owns_lock()) {
                writer_.Close();
            }
        }
    }

    Result<Unit, ProtocolFailure> SessionTransport::Send(std::span<const uint8_t> payload) {
        std::lock_guard lock(send_mutex_);
        auto result = writer_.Send(payload);
        SweepClosed(Direction::Send);
        return result;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> SessionTransport::Seal(std::span<const uint8_t> payload) {
        std::lock_guard lock(send_mutex_);
        auto result = writer_.Seal(payload);
        SweepClosed(Direction::Send);
        return result;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> SessionTransport::Receive(std::optional<Deadline> deadline) {
        std::lock_guard lock(receive_mutex_);
        auto result = reader_.Receive(deadline);
        SweepClosed(Direction::Receive);
        return result;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> SessionTransport::Open(std::span<const uint8_t> frame) {
        std::lock_guard lock(receive_mutex_);
        auto result = reader_.Open(frame);
        SweepClosed(Direction::Receive);
        return result;
    }

    void SessionTransport::Close() {
        link_->Close(ProtocolFailure::SessionClosed("Closed locally"));
        {
            std::unique_lock send(send_mutex_, std::try_to_lock);
            if (send.owns_lock()) {
                writer_.Close();
            }
        }
        std::unique_lock receive(receive_mutex_, std::try_to_lock);
        if (receive.owns_lock()) {
            reader_.Close();
        }
    }

    std::pair<SessionWriter, SessionReader> SessionTransport::Split() && {
        std::scoped_lock lock(send_mutex_, receive_mutex_);
        return {std::move(writer_), std::move(reader_)};
    }

    void SessionTransport::SetEventHandler(std::shared_ptr<interfaces::ISessionEventHandler> handler) {
        link_->SetEventHandler(std::move(handler));
    }

    uint64_t SessionTransport::SendNonce() const {
        std::lock_guard lock(send_mutex_);
        return writer_.Nonce();
    }

    uint64_t SessionTransport::ReceiveNonce() const {
        std::lock_guard lock(receive_mutex_);
        return reader_.Nonce();
    }

}
