#include <catch2/catch_test_macros.hpp>
#include "xkwire/protocol/session_transport.hpp"
#include "xkwire/crypto/sodium_interop.hpp"
#include "xkwire/transport/fd_byte_stream.hpp"
#include "helpers/handshake_fixture.hpp"
#include "helpers/memory_stream.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <sys/socket.h>

using namespace xkwire::protocol;
using namespace xkwire::protocol::crypto;
using namespace xkwire::protocol::test_helpers;
using xkwire::protocol::configuration::RekeyPolicy;
using xkwire::protocol::configuration::SessionConfig;
using xkwire::protocol::interfaces::Direction;

namespace {
    class RecordingHandler final : public interfaces::ISessionEventHandler {
    public:
        void OnRekey(Direction direction, uint64_t rekey_count) override {
            std::lock_guard lock(mutex_);
            rekeys_.emplace_back(direction, rekey_count);
        }

        void OnSessionClosed(const ProtocolFailure& reason) override {
            std::lock_guard lock(mutex_);
            closes_.push_back(reason.type);
        }

        std::vector<std::pair<Direction, uint64_t>> Rekeys() {
            std::lock_guard lock(mutex_);
            return rekeys_;
        }

        std::vector<ProtocolFailureType> Closes() {
            std::lock_guard lock(mutex_);
            return closes_;
        }

    private:
        std::mutex mutex_;
        std::vector<std::pair<Direction, uint64_t>> rekeys_;
        std::vector<ProtocolFailureType> closes_;
    };

    /// Reads the opposite direction's nonce from inside each callback.
    class CrossDirectionHandler final : public interfaces::ISessionEventHandler {
    public:
        explicit CrossDirectionHandler(const SessionTransport& transport)
            : transport_(transport) {
        }

        void OnRekey(Direction direction, uint64_t) override {
            seen_.push_back(direction == Direction::Send
                ? transport_.ReceiveNonce()
                : transport_.SendNonce());
        }

        void OnSessionClosed(const ProtocolFailure&) override {
            seen_.push_back(transport_.SendNonce());
        }

        const std::vector<uint64_t>& Seen() const { return seen_; }

    private:
        const SessionTransport& transport_;
        std::vector<uint64_t> seen_;
    };

    interfaces::Deadline In(std::chrono::milliseconds delay) {
        return std::chrono::steady_clock::now() + delay;
    }

    std::vector<uint8_t> Numbered(size_t i) {
        return Bytes("message " + std::to_string(i));
    }
}

TEST_CASE("SessionTransport - Ping pong over a stream", "[transport][integration]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto peers = NewPeerKeys();
    auto [initiator_stream, responder_stream] = MemoryStream::CreatePair();
    auto pair = ConnectPair(peers, initiator_stream, responder_stream);

    REQUIRE(pair.initiator->RemoteIdentity().Matches(peers.responder_static->GetPublicKey()));
    REQUIRE(pair.responder->RemoteIdentity().Matches(peers.initiator_static->GetPublicKey()));
    REQUIRE(pair.initiator->GetHandshakeHash() == pair.responder->GetHandshakeHash());

    REQUIRE(pair.initiator->Send(Bytes("ping")).IsOk());
    auto ping = pair.responder->Receive(In(std::chrono::seconds(5)));
    REQUIRE(ping.IsOk());
    REQUIRE(ping.Unwrap() == Bytes("ping"));

    REQUIRE(pair.responder->Send(Bytes("pong")).IsOk());
    auto pong = pair.initiator->Receive(In(std::chrono::seconds(5)));
    REQUIRE(pong.IsOk());
    REQUIRE(pong.Unwrap() == Bytes("pong"));

    REQUIRE(pair.initiator->SendNonce() == 1);
    REQUIRE(pair.initiator->ReceiveNonce() == 1);

    SECTION("Frame on the wire is length, ciphertext, tag") {
        REQUIRE(pair.initiator->Send(Bytes("hello")).IsOk());
        const auto& frame = initiator_stream->Written().back();
        REQUIRE(frame.size() == 2 + 5 + 16);
        REQUIRE(frame[0] == 0x00);
        REQUIRE(frame[1] == 0x05);
    }

    SECTION("Empty payloads are frames too") {
        REQUIRE(pair.initiator->Send({}).IsOk());
        auto empty = pair.responder->Receive(In(std::chrono::seconds(5)));
        REQUIRE(empty.IsOk());
        REQUIRE(empty.Unwrap().empty());
    }
}

TEST_CASE("SessionTransport - Long exchange across rekeys", "[transport][integration]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto pair = EstablishPair(RunHandshake(NewPeerKeys()));

    for (size_t i = 0; i < 10000; ++i) {
        auto frame = pair.initiator->Seal(Numbered(i));
        REQUIRE(frame.IsOk());
        auto opened = pair.responder->Open(frame.Unwrap());
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == Numbered(i));

        auto reply = pair.responder->Seal(Numbered(i + 1));
        REQUIRE(reply.IsOk());
        REQUIRE(pair.initiator->Open(reply.Unwrap()).IsOk());
    }
    REQUIRE_FALSE(pair.initiator->IsClosed());
    REQUIRE_FALSE(pair.responder->IsClosed());
}

TEST_CASE("SessionTransport - Replay and tampering close the session", "[transport][integration][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto pair = EstablishPair(RunHandshake(NewPeerKeys()));

    auto frame = pair.initiator->Seal(Bytes("once")).Unwrap();
    REQUIRE(pair.responder->Open(frame).IsOk());

    SECTION("Replay") {
        auto replay = pair.responder->Open(frame);
        REQUIRE(replay.IsErr());
        REQUIRE(replay.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);
        REQUIRE(pair.responder->IsClosed());
    }

    SECTION("Flipped ciphertext bit") {
        auto next = pair.initiator->Seal(Bytes("twice")).Unwrap();
        next[3] ^= 0x01;
        auto result = pair.responder->Open(next);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);
    }

    SECTION("Rewritten length prefix is authenticated") {
        auto next = pair.initiator->Seal(Bytes("twice")).Unwrap();
        next.push_back(0x00);
        next[1] = static_cast<uint8_t>(next[1] + 1);
        auto result = pair.responder->Open(next);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);
    }

    // Whatever failed above, both directions are now unusable.
    REQUIRE(pair.responder->IsClosed());
    auto after = pair.responder->Open(frame);
    REQUIRE(after.IsErr());
    REQUIRE(after.UnwrapErr().type == ProtocolFailureType::SessionClosed);
    auto send = pair.responder->Seal(Bytes("reply"));
    REQUIRE(send.IsErr());
    REQUIRE(send.UnwrapErr().type == ProtocolFailureType::SessionClosed);
}

TEST_CASE("SessionTransport - Framing", "[transport][integration]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Largest payload fits one frame") {
        auto pair = EstablishPair(RunHandshake(NewPeerKeys()));
        const std::vector<uint8_t> largest(kMaxFramePayloadBytes, 0x5A);
        auto frame = pair.initiator->Seal(largest);
        REQUIRE(frame.IsOk());
        REQUIRE(frame.Unwrap().size() == 2 + kMaxFramePayloadBytes + 16);
        REQUIRE(pair.responder->Open(frame.Unwrap()).Unwrap() == largest);
    }

    SECTION("Oversized outbound payload is refused without closing") {
        auto pair = EstablishPair(RunHandshake(NewPeerKeys()));
        const std::vector<uint8_t> too_big(kMaxFramePayloadBytes + 1, 0x5A);
        auto result = pair.initiator->Seal(too_big);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::FramingError);
        REQUIRE_FALSE(pair.initiator->IsClosed());
        REQUIRE(pair.initiator->SendNonce() == 0);

        auto frame = pair.initiator->Seal(Bytes("still fine"));
        REQUIRE(frame.IsOk());
        REQUIRE(pair.responder->Open(frame.Unwrap()).IsOk());
    }

    SECTION("Configured limit applies to both ends") {
        const auto config = SessionConfig::Default().WithMaxFramePayload(16);
        auto pair = EstablishPair(RunHandshake(NewPeerKeys(), config, config));
        REQUIRE(pair.initiator->Seal(std::vector<uint8_t>(17, 0x01)).IsErr());

        std::vector<uint8_t> forged(2 + 17 + 16, 0x00);
        forged[1] = 17;
        auto result = pair.responder->Open(forged);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::FramingError);
        REQUIRE(pair.responder->IsClosed());
    }

    SECTION("Frame shorter than its overhead") {
        auto pair = EstablishPair(RunHandshake(NewPeerKeys()));
        const std::vector<uint8_t> runt(10, 0x00);
        auto result = pair.responder->Open(runt);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::FramingError);
        REQUIRE(pair.responder->IsClosed());
    }
}

TEST_CASE("SessionTransport - Timeouts", "[transport][integration]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto peers = NewPeerKeys();
    auto [initiator_stream, responder_stream] = MemoryStream::CreatePair();
    auto pair = ConnectPair(peers, initiator_stream, responder_stream);

    SECTION("Nothing arrives") {
        auto result = pair.responder->Receive(In(std::chrono::milliseconds(50)));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Timeout);
        REQUIRE_FALSE(pair.responder->IsClosed());

        REQUIRE(pair.initiator->Send(Bytes("late")).IsOk());
        REQUIRE(pair.responder->Receive(In(std::chrono::seconds(5))).Unwrap() == Bytes("late"));
    }

    SECTION("Half a frame arrives, then the rest") {
        auto frame = pair.initiator->Seal(Bytes("split across reads")).Unwrap();
        const size_t cut = 7;
        initiator_stream->Inject(std::span<const uint8_t>(frame).first(cut));

        auto partial = pair.responder->Receive(In(std::chrono::milliseconds(50)));
        REQUIRE(partial.IsErr());
        REQUIRE(partial.UnwrapErr().type == ProtocolFailureType::Timeout);
        REQUIRE_FALSE(pair.responder->IsClosed());

        initiator_stream->Inject(std::span<const uint8_t>(frame).subspan(cut));
        auto complete = pair.responder->Receive(In(std::chrono::seconds(5)));
        REQUIRE(complete.IsOk());
        REQUIRE(complete.Unwrap() == Bytes("split across reads"));
    }

    SECTION("Peer hangs up") {
        initiator_stream->Close();
        auto result = pair.responder->Receive(In(std::chrono::seconds(5)));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Io);
        REQUIRE(pair.responder->IsClosed());
    }
}

TEST_CASE("SessionTransport - Event handler", "[transport][integration]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto config = SessionConfig::Default().WithRekeyPolicy(RekeyPolicy::Messages(3));
    auto pair = EstablishPair(RunHandshake(NewPeerKeys(), config, config));
    auto sender_events = std::make_shared<RecordingHandler>();
    auto receiver_events = std::make_shared<RecordingHandler>();
    pair.initiator->SetEventHandler(sender_events);
    pair.responder->SetEventHandler(receiver_events);

    for (size_t i = 0; i < 7; ++i) {
        auto frame = pair.initiator->Seal(Numbered(i)).Unwrap();
        REQUIRE(pair.responder->Open(frame).IsOk());
    }

    SECTION("Rekeys are reported per direction") {
        const auto sent = sender_events->Rekeys();
        REQUIRE(sent.size() == 2);
        REQUIRE(sent[0] == std::make_pair(Direction::Send, uint64_t{1}));
        REQUIRE(sent[1] == std::make_pair(Direction::Send, uint64_t{2}));

        const auto received = receiver_events->Rekeys();
        REQUIRE(received.size() == 2);
        REQUIRE(received[1] == std::make_pair(Direction::Receive, uint64_t{2}));
        REQUIRE(pair.initiator->SendNonce() == 1);
    }

    SECTION("Close is reported once") {
        pair.initiator->Close();
        pair.initiator->Close();
        const auto closes = sender_events->Closes();
        REQUIRE(closes.size() == 1);
        REQUIRE(closes[0] == ProtocolFailureType::SessionClosed);

        auto send = pair.initiator->Seal(Bytes("after close"));
        REQUIRE(send.IsErr());
        REQUIRE(send.UnwrapErr().type == ProtocolFailureType::SessionClosed);
    }

    SECTION("Failure reason reaches the handler") {
        const std::vector<uint8_t> runt(4, 0x00);
        REQUIRE(pair.responder->Open(runt).IsErr());
        const auto closes = receiver_events->Closes();
        REQUIRE(closes.size() == 1);
        REQUIRE(closes[0] == ProtocolFailureType::FramingError);
    }
}

TEST_CASE("SessionTransport - Handler reads the other direction", "[transport][integration][concurrency]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto config = SessionConfig::Default().WithRekeyPolicy(RekeyPolicy::Messages(3));
    auto pair = EstablishPair(RunHandshake(NewPeerKeys(), config, config));
    auto sender_events = std::make_shared<CrossDirectionHandler>(*pair.initiator);
    auto receiver_events = std::make_shared<CrossDirectionHandler>(*pair.responder);
    pair.initiator->SetEventHandler(sender_events);
    pair.responder->SetEventHandler(receiver_events);

    for (size_t i = 0; i < 7; ++i) {
        auto frame = pair.initiator->Seal(Numbered(i)).Unwrap();
        REQUIRE(pair.responder->Open(frame).IsOk());
    }

    SECTION("Rekey callbacks return") {
        REQUIRE(sender_events->Seen() == std::vector<uint64_t>{0, 0});
        REQUIRE(receiver_events->Seen() == std::vector<uint64_t>{0, 0});
    }

    SECTION("Close callback from a failed receive returns") {
        REQUIRE(pair.responder->Seal(Bytes("reply")).IsOk());
        const std::vector<uint8_t> runt(4, 0x00);
        auto opened = pair.responder->Open(runt);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == ProtocolFailureType::FramingError);
        REQUIRE(receiver_events->Seen() == std::vector<uint64_t>{0, 0, 1});
        REQUIRE(pair.responder->IsClosed());
    }
}

TEST_CASE("SessionTransport - Concurrent directions", "[transport][integration][concurrency]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    constexpr size_t kMessages = 2500;
    const auto peers = NewPeerKeys();
    auto [initiator_stream, responder_stream] = MemoryStream::CreatePair();
    auto pair = ConnectPair(peers, initiator_stream, responder_stream);

    SECTION("Send and Receive on one transport from two threads") {
        std::atomic<size_t> received{0};
        std::atomic<bool> mismatch{false};
        std::thread reader([&] {
            for (size_t i = 0; i < kMessages; ++i) {
                auto message = pair.initiator->Receive(In(std::chrono::seconds(10)));
                if (message.IsErr() || message.Unwrap() != Numbered(i)) {
                    mismatch = true;
                    return;
                }
                ++received;
            }
        });
        std::thread echo([&] {
            for (size_t i = 0; i < kMessages; ++i) {
                auto message = pair.responder->Receive(In(std::chrono::seconds(10)));
                if (message.IsErr() || pair.responder->Send(message.Unwrap()).IsErr()) {
                    mismatch = true;
                    return;
                }
            }
        });
        for (size_t i = 0; i < kMessages; ++i) {
            REQUIRE(pair.initiator->Send(Numbered(i)).IsOk());
        }
        reader.join();
        echo.join();

        REQUIRE_FALSE(mismatch.load());
        REQUIRE(received.load() == kMessages);
    }

    SECTION("Split halves owned by different threads") {
        auto [writer, reader] = std::move(*pair.initiator).Split();
        std::atomic<bool> failed{false};
        std::thread consumer([&] {
            for (size_t i = 0; i < kMessages; ++i) {
                auto message = pair.responder->Receive(In(std::chrono::seconds(10)));
                if (message.IsErr() || message.Unwrap() != Numbered(i)) {
                    failed = true;
                    return;
                }
            }
            if (pair.responder->Send(Bytes("done")).IsErr()) {
                failed = true;
            }
        });
        for (size_t i = 0; i < kMessages; ++i) {
            REQUIRE(writer.Send(Numbered(i)).IsOk());
        }
        auto done = reader.Receive(In(std::chrono::seconds(10)));
        consumer.join();

        REQUIRE_FALSE(failed.load());
        REQUIRE(done.IsOk());
        REQUIRE(done.Unwrap() == Bytes("done"));
        REQUIRE(writer.RekeyCount() == 2);

        SECTION("Closing one half closes the other") {
            reader.Close();
            REQUIRE(writer.IsClosed());
            auto send = writer.Send(Bytes("after"));
            REQUIRE(send.IsErr());
            REQUIRE(send.UnwrapErr().type == ProtocolFailureType::SessionClosed);
        }
    }
}

TEST_CASE("SessionTransport - Over a socket pair", "[transport][integration]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    auto initiator_stream = std::make_shared<transport::FdByteStream>(fds[0]);
    auto responder_stream = std::make_shared<transport::FdByteStream>(fds[1]);

    const auto peers = NewPeerKeys();
    auto pair = ConnectPair(peers, initiator_stream, responder_stream);

    REQUIRE(pair.initiator->Send(Bytes("ping")).IsOk());
    REQUIRE(pair.responder->Receive(In(std::chrono::seconds(5))).Unwrap() == Bytes("ping"));
    REQUIRE(pair.responder->Send(Bytes("pong")).IsOk());
    REQUIRE(pair.initiator->Receive(In(std::chrono::seconds(5))).Unwrap() == Bytes("pong"));

    SECTION("Half-close surfaces as Io") {
        REQUIRE(initiator_stream->ShutdownWrite().IsOk());
        auto result = pair.responder->Receive(In(std::chrono::seconds(5)));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Io);
    }
}

TEST_CASE("SessionTransport - Setup errors", "[transport][integration]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto peers = NewPeerKeys();

    SECTION("Connect needs a stream") {
        auto result = SessionTransport::Connect(nullptr, InitiatorKeys(peers));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }

    SECTION("Send without a stream") {
        auto pair = EstablishPair(RunHandshake(peers));
        auto result = pair.initiator->Send(Bytes("nowhere"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidState);
        REQUIRE_FALSE(pair.initiator->IsClosed());
    }

    SECTION("Responder that never answers") {
        auto [initiator_stream, responder_stream] = MemoryStream::CreatePair();
        auto result = SessionTransport::Connect(
            initiator_stream, InitiatorKeys(peers), SessionConfig::Default(),
            In(std::chrono::milliseconds(100)));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Timeout);
        REQUIRE(responder_stream->PendingInbound() == kHandshakeMessage1Bytes);
    }

    SECTION("Initiator that never finishes") {
        auto [initiator_stream, responder_stream] = MemoryStream::CreatePair();
        auto result = SessionTransport::Accept(
            responder_stream, ResponderKeys(peers),
            SessionConfig::Default().WithHandshakeTimeout(std::chrono::milliseconds(100)));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Timeout);
    }
}
