/**
 * @file xk_session_example.cpp
 * @brief Two peers over a socketpair: XK handshake, then a ping/pong exchange
 */

#include "xkwire/crypto/sodium_interop.hpp"
#include "xkwire/identity/key_material.hpp"
#include "xkwire/models/key_materials/static_key_pair.hpp"
#include "xkwire/protocol/session_transport.hpp"
#include "xkwire/transport/fd_byte_stream.hpp"

#include <sys/socket.h>

#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace xkwire::protocol;
using namespace xkwire::protocol::crypto;

namespace {

void print_hex(const std::string& label, std::span<const uint8_t> data) {
    std::cout << label << ": ";
    for (auto byte : data) {
        std::cout << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(byte);
    }
    std::cout << std::dec << std::endl;
}

void print_failure(const std::string& label, const ProtocolFailure& failure) {
    std::cerr << label << ": [" << ToString(failure.type) << "] "
              << failure.message << std::endl;
}

std::vector<uint8_t> to_bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::string to_text(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

using TransportResult = Result<std::unique_ptr<SessionTransport>, ProtocolFailure>;

}

int main() {
    std::cout << "=== xkwire - Noise XK Session Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: "
                  << init_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << std::endl;

    std::cout << "2. Generating static identities..." << std::endl;
    auto initiator_static = models::StaticKeyPair::Generate();
    auto responder_static = models::StaticKeyPair::Generate();
    if (initiator_static.IsErr() || responder_static.IsErr()) {
        std::cerr << "Failed to generate static key pairs" << std::endl;
        return 1;
    }
    auto initiator_key = std::make_shared<const models::StaticKeyPair>(
        std::move(initiator_static).Unwrap());
    auto responder_key = std::make_shared<const models::StaticKeyPair>(
        std::move(responder_static).Unwrap());
    print_hex("   Initiator public", initiator_key->GetPublicKey());
    print_hex("   Responder public", responder_key->GetPublicKey());
    std::cout << std::endl;

    // The initiator must know the responder's static key in advance.
    auto initiator_keys = identity::KeyMaterial::ForInitiator(
        initiator_key, responder_key->GetPublicKey());
    if (initiator_keys.IsErr()) {
        std::cerr << "Invalid responder key: "
                  << initiator_keys.UnwrapErr().message << std::endl;
        return 1;
    }
    auto responder_keys = identity::KeyMaterial::ForResponder(responder_key);
    if (responder_keys.IsErr()) {
        std::cerr << "Invalid responder key: "
                  << responder_keys.UnwrapErr().message << std::endl;
        return 1;
    }

    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
        std::cerr << "socketpair failed" << std::endl;
        return 1;
    }
    auto initiator_stream = std::make_shared<transport::FdByteStream>(fds[0]);
    auto responder_stream = std::make_shared<transport::FdByteStream>(fds[1]);

    std::cout << "3. Running the XK handshake over a socketpair..." << std::endl;
    std::optional<TransportResult> accepted;
    std::thread responder_thread([&] {
        accepted.emplace(SessionTransport::Accept(
            responder_stream, std::move(responder_keys).Unwrap()));
    });
    auto connected = SessionTransport::Connect(
        initiator_stream, std::move(initiator_keys).Unwrap());
    responder_thread.join();

    if (connected.IsErr()) {
        print_failure("Connect failed", connected.UnwrapErr());
        return 1;
    }
    if (!accepted.has_value()) {
        std::cerr << "Accept did not run" << std::endl;
        return 1;
    }
    if (accepted->IsErr()) {
        print_failure("Accept failed", accepted->UnwrapErr());
        return 1;
    }
    auto initiator = std::move(connected).Unwrap();
    auto responder = std::move(*accepted).Unwrap();

    print_hex("   Handshake hash (initiator)", initiator->GetHandshakeHash());
    print_hex("   Handshake hash (responder)", responder->GetHandshakeHash());
    print_hex("   Responder sees initiator", responder->RemoteIdentity().GetPublicKey());
    std::cout << std::endl;

    std::cout << "4. Exchanging messages..." << std::endl;
    std::thread echo_thread([&responder] {
        for (int i = 0; i < 3; ++i) {
            auto message = responder->Receive();
            if (message.IsErr()) {
                print_failure("   Responder receive failed", message.UnwrapErr());
                return;
            }
            auto reply = "pong: " + to_text(message.Unwrap());
            if (auto sent = responder->Send(to_bytes(reply)); sent.IsErr()) {
                std::cerr << "   Responder send failed: "
                          << sent.UnwrapErr().message << std::endl;
                return;
            }
        }
    });

    int exit_code = 0;
    for (int i = 0; i < 3; ++i) {
        const auto ping = "ping " + std::to_string(i);
        if (auto sent = initiator->Send(to_bytes(ping)); sent.IsErr()) {
            std::cerr << "   Send failed: " << sent.UnwrapErr().message << std::endl;
            exit_code = 1;
            break;
        }
        auto reply = initiator->Receive();
        if (reply.IsErr()) {
            print_failure("   Receive failed", reply.UnwrapErr());
            exit_code = 1;
            break;
        }
        std::cout << "   " << ping << " -> " << to_text(reply.Unwrap()) << std::endl;
    }
    if (exit_code != 0) {
        initiator->Close();
        if (auto shut = initiator_stream->ShutdownWrite(); shut.IsErr()) {
            std::cerr << "   Shutdown failed: " << shut.UnwrapErr().message << std::endl;
        }
    }
    echo_thread.join();
    std::cout << std::endl;

    std::cout << "   Initiator send nonce: " << initiator->SendNonce() << std::endl;
    std::cout << "   Responder receive nonce: " << responder->ReceiveNonce() << std::endl;

    initiator->Close();
    responder->Close();

    std::cout << std::endl;
    std::cout << "=== Example completed ===" << std::endl;
    return exit_code;
}
