#pragma once

#include "xkwire/interfaces/i_byte_stream.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace xkwire::protocol::test_helpers {

/// One direction of an in-memory connection.
struct MemoryPipe {
    std::mutex mutex;
    std::condition_variable ready;
    std::deque<uint8_t> bytes;
    bool closed = false;

    void Push(std::span<const uint8_t> data) {
        {
            std::lock_guard lock(mutex);
            bytes.insert(bytes.end(), data.begin(), data.end());
        }
        ready.notify_all();
    }

    void Shut() {
        {
            std::lock_guard lock(mutex);
            closed = true;
        }
        ready.notify_all();
    }

    size_t Buffered() {
        std::lock_guard lock(mutex);
        return bytes.size();
    }
};

/**
 * IByteStream over two MemoryPipes, one per direction.
 *
 * ReadExact waits until enough bytes are buffered; on Timeout nothing is
 * consumed. Once the peer closes and the buffer runs dry, reads fail with Io.
 * `tamper` lets a test rewrite outgoing bytes before the peer sees them.
 */
class MemoryStream final : public interfaces::IByteStream {
public:
    using Tamper = std::function<void(std::vector<uint8_t>&)>;

    MemoryStream(std::shared_ptr<MemoryPipe> inbound, std::shared_ptr<MemoryPipe> outbound)
        : inbound_(std::move(inbound)), outbound_(std::move(outbound)) {}

    ~MemoryStream() override { Close(); }

    static std::pair<std::shared_ptr<MemoryStream>, std::shared_ptr<MemoryStream>> CreatePair() {
        auto a_to_b = std::make_shared<MemoryPipe>();
        auto b_to_a = std::make_shared<MemoryPipe>();
        return {
            std::make_shared<MemoryStream>(b_to_a, a_to_b),
            std::make_shared<MemoryStream>(a_to_b, b_to_a)
        };
    }

    Result<Unit, ProtocolFailure> Write(std::span<const uint8_t> bytes) override {
        {
            std::lock_guard lock(outbound_->mutex);
            if (outbound_->closed) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::Io("Memory stream is closed"));
            }
        }
        std::vector<uint8_t> copy(bytes.begin(), bytes.end());
        if (tamper_) {
            tamper_(copy);
        }
        written_.push_back(copy);
        outbound_->Push(copy);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::vector<uint8_t>, ProtocolFailure> ReadExact(
        size_t size,
        std::optional<interfaces::Deadline> deadline = std::nullopt) override {
        std::unique_lock lock(inbound_->mutex);
        auto enough = [&] { return inbound_->bytes.size() >= size || inbound_->closed; };
        if (deadline.has_value()) {
            if (!inbound_->ready.wait_until(lock, *deadline, enough)) {
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                    ProtocolFailure::Timeout("Memory stream read timed out"));
            }
        } else {
            inbound_->ready.wait(lock, enough);
        }
        if (inbound_->bytes.size() < size) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Io("Memory stream reached end of stream"));
        }
        std::vector<uint8_t> out(inbound_->bytes.begin(), inbound_->bytes.begin() + static_cast<std::ptrdiff_t>(size));
        inbound_->bytes.erase(inbound_->bytes.begin(), inbound_->bytes.begin() + static_cast<std::ptrdiff_t>(size));
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(out));
    }

    /// Bytes that bypass `tamper` and the write log, as if the network sent them.
    void Inject(std::span<const uint8_t> bytes) { outbound_->Push(bytes); }

    /// The peer sees end of stream after draining what was written.
    void Close() { outbound_->Shut(); }

    void SetTamper(Tamper tamper) { tamper_ = std::move(tamper); }

    [[nodiscard]] const std::vector<std::vector<uint8_t>>& Written() const noexcept { return written_; }

    [[nodiscard]] size_t PendingInbound() { return inbound_->Buffered(); }

private:
    std::shared_ptr<MemoryPipe> inbound_;
    std::shared_ptr<MemoryPipe> outbound_;
    Tamper tamper_;
    std::vector<std::vector<uint8_t>> written_;
};

}
