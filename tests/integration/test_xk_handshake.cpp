#include <catch2/catch_test_macros.hpp>
#include "xkwire/protocol/handshake.hpp"
#include "xkwire/crypto/sodium_interop.hpp"
#include "helpers/handshake_fixture.hpp"
#include <algorithm>
#include <string>
#include <vector>

using namespace xkwire::protocol;
using namespace xkwire::protocol::crypto;
using namespace xkwire::protocol::test_helpers;
using xkwire::protocol::configuration::SessionConfig;

namespace {
    bool IsRejection(const ProtocolFailure& failure) {
        return failure.type == ProtocolFailureType::AuthenticationFailed ||
               failure.type == ProtocolFailureType::InvalidKeyMaterial;
    }

    std::vector<uint8_t> PublicKeyOf(const models::StaticKeyPair& pair) {
        auto key = pair.GetPublicKey();
        return std::vector<uint8_t>(key.begin(), key.end());
    }
}

TEST_CASE("XK Handshake - Honest run", "[handshake][integration]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto peers = NewPeerKeys();
    auto run = RunHandshake(peers);

    SECTION("Messages have the fixed empty-payload sizes") {
        REQUIRE(run.message1.size() == 48);
        REQUIRE(run.message2.size() == 48);
        REQUIRE(run.message3.size() == 64);
    }

    SECTION("Directions are crossed") {
        REQUIRE(run.initiator.send.DebugKeyBytes() == run.responder.receive.DebugKeyBytes());
        REQUIRE(run.initiator.receive.DebugKeyBytes() == run.responder.send.DebugKeyBytes());
        REQUIRE(run.initiator.send.DebugKeyBytes() != run.initiator.receive.DebugKeyBytes());
        REQUIRE(run.initiator.send.SharesKeyWith(run.responder.receive));
        REQUIRE_FALSE(run.initiator.send.SharesKeyWith(run.initiator.receive));
        REQUIRE(run.initiator.send.Nonce() == 0);
        REQUIRE(run.responder.receive.Nonce() == 0);
    }

    SECTION("Both sides learn each other's identity") {
        REQUIRE(run.initiator.remote_identity.Matches(PublicKeyOf(*peers.responder_static)));
        REQUIRE(run.responder.remote_identity.Matches(PublicKeyOf(*peers.initiator_static)));
    }

    SECTION("Handshake hash is shared") {
        REQUIRE(run.initiator.handshake_hash == run.responder.handshake_hash);
        REQUIRE(run.initiator.side == xkwire::debug::Side::Initiator);
        REQUIRE(run.responder.side == xkwire::debug::Side::Responder);
    }

    SECTION("Keys work end to end") {
        const auto ping = Bytes("ping");
        auto ciphertext = run.initiator.send.Encrypt(ping);
        REQUIRE(ciphertext.IsOk());
        auto plaintext = run.responder.receive.Decrypt(ciphertext.Unwrap());
        REQUIRE(plaintext.IsOk());
        REQUIRE(plaintext.Unwrap() == ping);
    }
}

TEST_CASE("XK Handshake - Fresh keys every attempt", "[handshake][integration][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto peers = NewPeerKeys();
    auto first = RunHandshake(peers);
    auto second = RunHandshake(peers);

    REQUIRE(first.message1 != second.message1);
    REQUIRE(first.initiator.handshake_hash != second.initiator.handshake_hash);
    REQUIRE(first.initiator.send.DebugKeyBytes() != second.initiator.send.DebugKeyBytes());
    REQUIRE(first.initiator.receive.DebugKeyBytes() != second.initiator.receive.DebugKeyBytes());
}

TEST_CASE("XK Handshake - Same static key on both ends", "[handshake][integration][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto shared = NewStaticKey();
    const PeerKeys peers{shared, shared};
    auto run = RunHandshake(peers);

    SECTION("Each side still gets two different keys") {
        REQUIRE_FALSE(run.initiator.send.SharesKeyWith(run.initiator.receive));
        REQUIRE_FALSE(run.responder.send.SharesKeyWith(run.responder.receive));
        REQUIRE(run.initiator.send.SharesKeyWith(run.responder.receive));
        REQUIRE(run.initiator.receive.SharesKeyWith(run.responder.send));
    }

    SECTION("Both ends see the same identity") {
        REQUIRE(run.initiator.remote_identity.Matches(PublicKeyOf(*shared)));
        REQUIRE(run.responder.remote_identity.Matches(PublicKeyOf(*shared)));
        REQUIRE(run.initiator.handshake_hash == run.responder.handshake_hash);
    }

    SECTION("Sessions can be established and talk") {
        auto pair = EstablishPair(std::move(run));
        auto sealed = pair.initiator->Seal(Bytes("mirror"));
        REQUIRE(sealed.IsOk());
        REQUIRE(pair.responder->Open(sealed.Unwrap()).Unwrap() == Bytes("mirror"));
        auto reply = pair.responder->Seal(Bytes("image"));
        REQUIRE(reply.IsOk());
        REQUIRE(pair.initiator->Open(reply.Unwrap()).Unwrap() == Bytes("image"));
    }
}

TEST_CASE("XK Handshake - AESGCM suite", "[handshake][integration]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto config = SessionConfig::Default().WithCipherSuite(CipherSuite::AesGcm);
    auto run = RunHandshake(NewPeerKeys(), config, config);

    REQUIRE(run.initiator.send.Suite() == CipherSuite::AesGcm);
    auto ciphertext = run.responder.send.Encrypt(Bytes("pong")).Unwrap();
    REQUIRE(run.initiator.receive.Decrypt(ciphertext).Unwrap() == Bytes("pong"));
}

TEST_CASE("XK Handshake - Payloads", "[handshake][integration]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto peers = NewPeerKeys();
    const auto hello = Bytes("hello responder");
    const auto welcome = Bytes("welcome");
    const auto finished = Bytes("finished");

    auto initiator = InitiatorHandshake::Create(InitiatorKeys(peers)).Unwrap();
    auto responder = ResponderHandshake::Create(ResponderKeys(peers)).Unwrap();

    auto [sent1, message1] = std::move(initiator).WriteMessage1(hello).Unwrap();
    REQUIRE(message1.size() == 48 + hello.size());
    REQUIRE(std::search(message1.begin(), message1.end(), hello.begin(), hello.end()) == message1.end());

    auto received1 = std::move(responder).ReadMessage1(message1).Unwrap();
    REQUIRE(received1.Payload() == hello);

    auto [sent2, message2] = std::move(received1).WriteMessage2(welcome).Unwrap();
    auto received2 = std::move(sent1).ReadMessage2(message2).Unwrap();
    REQUIRE(received2.Payload() == welcome);

    auto [initiator_result, message3] = std::move(received2).WriteMessage3(finished).Unwrap();
    REQUIRE(message3.size() == 64 + finished.size());
    REQUIRE(initiator_result.payload == welcome);

    auto responder_result = std::move(sent2).ReadMessage3(message3).Unwrap();
    REQUIRE(responder_result.payload == finished);
    REQUIRE(responder_result.handshake_hash == initiator_result.handshake_hash);
}

TEST_CASE("XK Handshake - Tampered messages are rejected", "[handshake][integration][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto peers = NewPeerKeys();
    const auto honest = RunHandshake(peers);

    SECTION("Every byte of message 1") {
        for (size_t i = 0; i < honest.message1.size(); ++i) {
            auto tampered = honest.message1;
            tampered[i] ^= 0x01;
            auto responder = ResponderHandshake::Create(ResponderKeys(peers)).Unwrap();
            auto result = std::move(responder).ReadMessage1(tampered);
            INFO("byte " << i);
            REQUIRE(result.IsErr());
            REQUIRE(IsRejection(result.UnwrapErr()));
        }
    }

    SECTION("Every byte of message 2") {
        for (size_t i = 0; i < kHandshakeMessage2Bytes; ++i) {
            auto initiator = InitiatorHandshake::Create(InitiatorKeys(peers)).Unwrap();
            auto responder = ResponderHandshake::Create(ResponderKeys(peers)).Unwrap();
            auto [sent1, message1] = std::move(initiator).WriteMessage1().Unwrap();
            auto received1 = std::move(responder).ReadMessage1(message1).Unwrap();
            auto [sent2, message2] = std::move(received1).WriteMessage2().Unwrap();

            message2[i] ^= 0x01;
            auto result = std::move(sent1).ReadMessage2(message2);
            INFO("byte " << i);
            REQUIRE(result.IsErr());
            REQUIRE(IsRejection(result.UnwrapErr()));
        }
    }

    SECTION("Every byte of message 3") {
        for (size_t i = 0; i < kHandshakeMessage3Bytes; ++i) {
            auto initiator = InitiatorHandshake::Create(InitiatorKeys(peers)).Unwrap();
            auto responder = ResponderHandshake::Create(ResponderKeys(peers)).Unwrap();
            auto [sent1, message1] = std::move(initiator).WriteMessage1().Unwrap();
            auto received1 = std::move(responder).ReadMessage1(message1).Unwrap();
            auto [sent2, message2] = std::move(received1).WriteMessage2().Unwrap();
            auto received2 = std::move(sent1).ReadMessage2(message2).Unwrap();
            auto [result, message3] = std::move(received2).WriteMessage3().Unwrap();

            message3[i] ^= 0x01;
            auto rejected = std::move(sent2).ReadMessage3(message3);
            INFO("byte " << i);
            REQUIRE(rejected.IsErr());
            REQUIRE(IsRejection(rejected.UnwrapErr()));
        }
    }

    SECTION("Truncated and oversized messages") {
        auto responder = ResponderHandshake::Create(ResponderKeys(peers)).Unwrap();
        std::vector<uint8_t> short_message(honest.message1.begin(), honest.message1.end() - 1);
        auto result = std::move(responder).ReadMessage1(short_message);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::UnexpectedMessage);

        auto another = ResponderHandshake::Create(ResponderKeys(peers)).Unwrap();
        std::vector<uint8_t> huge(kMaxNoiseMessageBytes + 1, 0x42);
        auto oversized = std::move(another).ReadMessage1(huge);
        REQUIRE(oversized.IsErr());
        REQUIRE(oversized.UnwrapErr().type == ProtocolFailureType::UnexpectedMessage);
    }
}

TEST_CASE("XK Handshake - Mismatched setup", "[handshake][integration][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto peers = NewPeerKeys();

    auto first_message = [&](const PeerKeys& initiator_view, const SessionConfig& config) {
        auto initiator = InitiatorHandshake::Create(InitiatorKeys(initiator_view), config).Unwrap();
        auto [sent1, message1] = std::move(initiator).WriteMessage1().Unwrap();
        return message1;
    };

    SECTION("Initiator expects a different responder") {
        PeerKeys wrong{peers.initiator_static, NewStaticKey()};
        auto message1 = first_message(wrong, SessionConfig::Default());
        auto responder = ResponderHandshake::Create(ResponderKeys(peers)).Unwrap();
        auto result = std::move(responder).ReadMessage1(message1);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);
    }

    SECTION("Prologue mismatch") {
        auto message1 = first_message(peers, SessionConfig::Default().WithPrologue("other-app"));
        auto responder = ResponderHandshake::Create(ResponderKeys(peers)).Unwrap();
        auto result = std::move(responder).ReadMessage1(message1);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);
    }

    SECTION("Cipher suite mismatch") {
        auto message1 = first_message(peers, SessionConfig::Default().WithCipherSuite(CipherSuite::AesGcm));
        auto responder = ResponderHandshake::Create(ResponderKeys(peers)).Unwrap();
        auto result = std::move(responder).ReadMessage1(message1);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);
    }

    SECTION("Initiator without a responder key") {
        auto result = InitiatorHandshake::Create(ResponderKeys(peers));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidKeyMaterial);
    }

    SECTION("Invalid configuration") {
        auto result = ResponderHandshake::Create(
            ResponderKeys(peers), SessionConfig::Default().WithMaxFramePayload(0));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}

TEST_CASE("XK Handshake - Consumed states", "[handshake][integration]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto peers = NewPeerKeys();
    auto initiator = InitiatorHandshake::Create(InitiatorKeys(peers)).Unwrap();

    auto first = std::move(initiator).WriteMessage1();
    REQUIRE(first.IsOk());

    auto again = std::move(initiator).WriteMessage1();
    REQUIRE(again.IsErr());
    REQUIRE(again.UnwrapErr().type == ProtocolFailureType::UnexpectedMessage);
    REQUIRE(again.UnwrapErr().message.find("consumed") != std::string::npos);

    SECTION("A failed read consumes the state too") {
        auto [sent1, message1] = std::move(first).Unwrap();
        std::vector<uint8_t> garbage(kHandshakeMessage2Bytes, 0x00);
        REQUIRE(std::move(sent1).ReadMessage2(garbage).IsErr());

        auto retry = std::move(sent1).ReadMessage2(garbage);
        REQUIRE(retry.IsErr());
        REQUIRE(retry.UnwrapErr().type == ProtocolFailureType::UnexpectedMessage);
    }
}
