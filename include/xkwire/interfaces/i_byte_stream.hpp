#pragma once
#include "xkwire/core/result.hpp"
#include "xkwire/core/failures.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
namespace xkwire::protocol::interfaces {

using Deadline = std::chrono::steady_clock::time_point;

/// Reliable, ordered byte stream the handshake and the session run over.
/// Errors are Io (including end of stream) or Timeout.
class IByteStream {
public:
    virtual ~IByteStream() = default;
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> Write(std::span<const uint8_t> bytes) = 0;
    /// Exactly `size` bytes or an error; never a short read. A Timeout
    /// consumes nothing: bytes that did arrive are returned by the next call.
    [[nodiscard]] virtual Result<std::vector<uint8_t>, ProtocolFailure> ReadExact(
        size_t size,
        std::optional<Deadline> deadline = std::nullopt) = 0;
};
}
