#pragma once

#include "xkwire/protocol/constants.hpp"
#include <cstdint>

namespace xkwire::protocol::configuration {

/**
 * @brief When a CipherState replaces its key with REKEY(k)
 *
 * A rekey is due once EITHER threshold is reached under the current key:
 * 1. `messages` messages encrypted (or decrypted) under it
 * 2. `bytes` plaintext bytes processed under it
 *
 * A threshold of 0 disables that trigger. The sender checks after each
 * Encrypt and the receiver after each successful Decrypt, so both ends of
 * a direction rekey at the same message as long as they share the policy.
 *
 * **Usage Example**:
 * ```cpp
 * auto policy = RekeyPolicy::Default();          // every 1000 messages
 * auto bulk   = RekeyPolicy::MessagesOrBytes(1000, 1ull << 30);
 * if (policy.ShouldRekey(messages_under_key, bytes_under_key)) {
 *     cipher.Rekey();
 * }
 * ```
 */
class RekeyPolicy {
public:
    constexpr RekeyPolicy(uint64_t after_messages, uint64_t after_bytes) noexcept
        : after_messages_(after_messages), after_bytes_(after_bytes) {}

    /// Every 1000 messages, byte trigger off (the Lightning transport rule).
    [[nodiscard]] static constexpr RekeyPolicy Default() noexcept {
        return RekeyPolicy(kDefaultRekeyAfterMessages, kDefaultRekeyAfterBytes);
    }

    /// Never rekey automatically; CipherState::Rekey() still works.
    [[nodiscard]] static constexpr RekeyPolicy Disabled() noexcept {
        return RekeyPolicy(0, 0);
    }

    [[nodiscard]] static constexpr RekeyPolicy Messages(uint64_t after_messages) noexcept {
        return RekeyPolicy(after_messages, 0);
    }

    [[nodiscard]] static constexpr RekeyPolicy Bytes(uint64_t after_bytes) noexcept {
        return RekeyPolicy(0, after_bytes);
    }

    [[nodiscard]] static constexpr RekeyPolicy MessagesOrBytes(
        uint64_t after_messages, uint64_t after_bytes) noexcept {
        return RekeyPolicy(after_messages, after_bytes);
    }

    [[nodiscard]] constexpr bool ShouldRekey(
        uint64_t messages_under_key, uint64_t bytes_under_key) const noexcept {
        const bool message_trigger = after_messages_ > 0 && messages_under_key >= after_messages_;
        const bool byte_trigger = after_bytes_ > 0 && bytes_under_key >= after_bytes_;
        return message_trigger || byte_trigger;
    }

    [[nodiscard]] constexpr bool IsEnabled() const noexcept {
        return after_messages_ > 0 || after_bytes_ > 0;
    }

    [[nodiscard]] constexpr uint64_t GetAfterMessages() const noexcept {
        return after_messages_;
    }

    [[nodiscard]] constexpr uint64_t GetAfterBytes() const noexcept {
        return after_bytes_;
    }

    [[nodiscard]] constexpr bool operator==(const RekeyPolicy& other) const noexcept {
        return after_messages_ == other.after_messages_ && after_bytes_ == other.after_bytes_;
    }

    [[nodiscard]] constexpr bool operator!=(const RekeyPolicy& other) const noexcept {
        return !(*this == other);
    }

private:
    uint64_t after_messages_;
    uint64_t after_bytes_;
};

} // namespace xkwire::protocol::configuration
