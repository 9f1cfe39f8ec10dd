#pragma once

#include "xkwire/interfaces/i_byte_stream.hpp"

namespace xkwire::protocol::transport {

/**
 * @brief IByteStream over a connected POSIX descriptor
 *
 * Blocking writes; reads wait with poll(2) so a deadline can interrupt
 * them. Owns and closes the descriptor unless constructed as a borrower.
 */
class FdByteStream final : public interfaces::IByteStream {
public:
    enum class Ownership { Owned, Borrowed };

    explicit FdByteStream(int fd, Ownership ownership = Ownership::Owned) noexcept;
    ~FdByteStream() override;

    FdByteStream(FdByteStream&& other) noexcept;
    FdByteStream& operator=(FdByteStream&& other) noexcept;
    FdByteStream(const FdByteStream&) = delete;
    FdByteStream& operator=(const FdByteStream&) = delete;

    [[nodiscard]] Result<Unit, ProtocolFailure> Write(std::span<const uint8_t> bytes) override;

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> ReadExact(
        size_t size,
        std::optional<interfaces::Deadline> deadline = std::nullopt) override;

    /// Half-close the write side (sockets only); the peer then reads EOF.
    Result<Unit, ProtocolFailure> ShutdownWrite();

    [[nodiscard]] int NativeHandle() const noexcept { return fd_; }

private:
    void Close() noexcept;

    int fd_;
    Ownership ownership_;
    std::vector<uint8_t> pending_;
};

} // namespace xkwire::protocol::transport
