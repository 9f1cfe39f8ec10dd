#include "xkwire/transport/fd_byte_stream.hpp"

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace xkwire::protocol::transport {

namespace {
    constexpr int kInvalidFd = -1;

    std::string ErrnoMessage(const char* what, int error) {
        return std::string(what) + ": " + std::strerror(error);
    }

    ssize_t WriteSome(int fd, const uint8_t* data, size_t len) {
        // MSG_NOSIGNAL keeps a closed peer from raising SIGPIPE.
        ssize_t n = ::send(fd, data, len, MSG_NOSIGNAL);
        if (n < 0 && errno == ENOTSOCK) {
            n = ::write(fd, data, len);
        }
        return n;
    }

    /// Milliseconds left until the deadline for poll(2); -1 waits forever.
    int PollTimeout(const std::optional<interfaces::Deadline>& deadline) {
        if (!deadline.has_value()) {
            return -1;
        }
        const auto now = std::chrono::steady_clock::now();
        if (*deadline <= now) {
            return 0;
        }
        const auto remaining =
            std::chrono::ceil<std::chrono::milliseconds>(*deadline - now).count();
        constexpr long long kMaxPollMs = 1'000'000'000;
        return static_cast<int>(remaining > kMaxPollMs ? kMaxPollMs : remaining);
    }
}

FdByteStream::FdByteStream(int fd, Ownership ownership) noexcept
    : fd_(fd), ownership_(ownership) {
}

FdByteStream::~FdByteStream() {
    Close();
}

FdByteStream::FdByteStream(FdByteStream&& other) noexcept
    : fd_(other.fd_), ownership_(other.ownership_), pending_(std::move(other.pending_)) {
    other.fd_ = kInvalidFd;
}

FdByteStream& FdByteStream::operator=(FdByteStream&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = other.fd_;
        ownership_ = other.ownership_;
        pending_ = std::move(other.pending_);
        other.fd_ = kInvalidFd;
    }
    return *this;
}

void FdByteStream::Close() noexcept {
    if (fd_ != kInvalidFd && ownership_ == Ownership::Owned) {
        ::close(fd_);
    }
    fd_ = kInvalidFd;
}

Result<Unit, ProtocolFailure> FdByteStream::Write(std::span<const uint8_t> bytes) {
    if (fd_ == kInvalidFd) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Io("Stream is closed"));
    }

    size_t sent = 0;
    while (sent < bytes.size()) {
        const ssize_t n = WriteSome(fd_, bytes.data() + sent, bytes.size() - sent);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Io(ErrnoMessage("write failed", errno)));
        }
        if (n == 0) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Io("write returned 0 bytes"));
        }
        sent += static_cast<size_t>(n);
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, ProtocolFailure> FdByteStream::ReadExact(
    size_t size,
    std::optional<interfaces::Deadline> deadline) {
    if (fd_ == kInvalidFd) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Io("Stream is closed"));
    }

    if (pending_.size() >= size) {
        std::vector<uint8_t> head(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(size));
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(size));
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(head));
    }

    std::vector<uint8_t> buffer = std::move(pending_);
    pending_.clear();
    size_t got = buffer.size();
    buffer.resize(size);
    while (got < size) {
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;

        const int rc = ::poll(&pfd, 1, PollTimeout(deadline));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Io(ErrnoMessage("poll failed", errno)));
        }
        if (rc == 0) {
            // Keep what arrived so a retry resumes mid-message.
            buffer.resize(got);
            pending_ = std::move(buffer);
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Timeout(
                    "Deadline elapsed after " + std::to_string(got) + " of " +
                    std::to_string(size) + " bytes"));
        }
        if ((pfd.revents & POLLNVAL) != 0) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Io("Descriptor is not open"));
        }

        const ssize_t n = ::read(fd_, buffer.data() + got, size - got);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Io(ErrnoMessage("read failed", errno)));
        }
        if (n == 0) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Io(
                    "Unexpected end of stream after " + std::to_string(got) + " of " +
                    std::to_string(size) + " bytes"));
        }
        got += static_cast<size_t>(n);
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(buffer));
}

Result<Unit, ProtocolFailure> FdByteStream::ShutdownWrite() {
    if (fd_ == kInvalidFd) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Io("Stream is closed"));
    }
    if (::shutdown(fd_, SHUT_WR) != 0) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Io(ErrnoMessage("shutdown failed", errno)));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

} // namespace xkwire::protocol::transport
