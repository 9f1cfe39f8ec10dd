#pragma once
#include "xkwire/core/failures.hpp"
#include <cstdint>
namespace xkwire::protocol::interfaces {

enum class Direction : uint8_t {
    Send,
    Receive
};

/**
 * @brief Observer for rekeys and session closure
 *
 * Callbacks run on the thread that triggered the event, while that
 * direction is locked. A handler must not call back into the same
 * direction (Send, Seal or SendNonce from OnRekey(Send); Receive, Open or
 * ReceiveNonce from OnRekey(Receive) or OnSessionClosed) and must not call
 * Close(). Reading the other direction is allowed.
 */
class ISessionEventHandler {
public:
    virtual ~ISessionEventHandler() = default;
    virtual void OnRekey(Direction direction, uint64_t rekey_count) = 0;
    virtual void OnSessionClosed(const ProtocolFailure& reason) = 0;
};
}
