#include "xkwire/protocol/handshake_driver.hpp"
#include <chrono>
#include <string>

namespace xkwire::protocol {
    using interfaces::Deadline;
    using interfaces::IByteStream;

    namespace {
        Deadline ResolveDeadline(
            const configuration::SessionConfig& config,
            std::optional<Deadline> deadline) {
            if (deadline.has_value()) {
                return *deadline;
            }
            return std::chrono::steady_clock::now() + config.GetHandshakeTimeout();
        }

        Result<Unit, ProtocolFailure> CheckDeadline(Deadline deadline, const char* stage) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::Timeout(
                    std::string("Handshake deadline elapsed before ") + stage));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
    }

    Result<HandshakeResult, ProtocolFailure> HandshakeDriver::RunInitiator(
        IByteStream& stream,
        identity::KeyMaterial keys,
        configuration::SessionConfig config,
        std::optional<Deadline> deadline) {
        using DriverResult = Result<HandshakeResult, ProtocolFailure>;
        const Deadline until = ResolveDeadline(config, deadline);

        auto start = InitiatorHandshake::Create(std::move(keys), std::move(config));
        if (start.IsErr()) {
            return DriverResult::Err(std::move(start).UnwrapErr());
        }

        auto first = std::move(start).Unwrap().WriteMessage1();
        if (first.IsErr()) {
            return DriverResult::Err(std::move(first).UnwrapErr());
        }
        auto [sent_message1, message1] = std::move(first).Unwrap();
        if (auto written = stream.Write(message1); written.IsErr()) {
            return DriverResult::Err(std::move(written).UnwrapErr());
        }

        auto message2 = stream.ReadExact(kHandshakeMessage2Bytes, until);
        if (message2.IsErr()) {
            return DriverResult::Err(std::move(message2).UnwrapErr());
        }
        auto received_message2 = std::move(sent_message1).ReadMessage2(message2.Unwrap());
        if (received_message2.IsErr()) {
            return DriverResult::Err(std::move(received_message2).UnwrapErr());
        }

        if (auto in_time = CheckDeadline(until, "message 3"); in_time.IsErr()) {
            return DriverResult::Err(std::move(in_time).UnwrapErr());
        }
        auto third = std::move(received_message2).Unwrap().WriteMessage3();
        if (third.IsErr()) {
            return DriverResult::Err(std::move(third).UnwrapErr());
        }
        auto [result, message3] = std::move(third).Unwrap();
        if (auto written = stream.Write(message3); written.IsErr()) {
            return DriverResult::Err(std::move(written).UnwrapErr());
        }
        return DriverResult::Ok(std::move(result));
    }

    Result<HandshakeResult, ProtocolFailure> HandshakeDriver::RunResponder(
        IByteStream& stream,
        identity::KeyMaterial keys,
        configuration::SessionConfig config,
        std::optional<Deadline> deadline) {
        using DriverResult = Result<HandshakeResult, ProtocolFailure>;
        const Deadline until = ResolveDeadline(config, deadline);

        auto start = ResponderHandshake::Create(std::move(keys), std::move(config));
        if (start.IsErr()) {
            return DriverResult::Err(std::move(start).UnwrapErr());
        }

        auto message1 = stream.ReadExact(kHandshakeMessage1Bytes, until);
        if (message1.IsErr()) {
            return DriverResult::Err(std::move(message1).UnwrapErr());
        }
        auto received_message1 = std::move(start).Unwrap().ReadMessage1(message1.Unwrap());
        if (received_message1.IsErr()) {
            return DriverResult::Err(std::move(received_message1).UnwrapErr());
        }

        auto second = std::move(received_message1).Unwrap().WriteMessage2();
        if (second.IsErr()) {
            return DriverResult::Err(std::move(second).UnwrapErr());
        }
        auto [sent_message2, message2] = std::move(second).Unwrap();
        if (auto written = stream.Write(message2); written.IsErr()) {
            return DriverResult::Err(std::move(written).UnwrapErr());
        }

        auto message3 = stream.ReadExact(kHandshakeMessage3Bytes, until);
        if (message3.IsErr()) {
            return DriverResult::Err(std::move(message3).UnwrapErr());
        }
        return std::move(sent_message2).ReadMessage3(message3.Unwrap());
    }

}
