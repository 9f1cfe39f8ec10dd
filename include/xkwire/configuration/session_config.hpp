#pragma once

#include "xkwire/configuration/rekey_policy.hpp"
#include "xkwire/crypto/aead.hpp"
#include "xkwire/core/result.hpp"
#include "xkwire/core/failures.hpp"
#include "xkwire/protocol/constants.hpp"

#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace xkwire::protocol::configuration {

/// Everything both peers must agree on before a handshake, plus local
/// limits for the transport.
///
/// - cipher suite and prologue change the transcript: a mismatch makes the
///   first handshake message fail authentication on the responder
/// - rekey policy must match or the second direction key diverges after the
///   first automatic rekey
/// - max frame payload and handshake timeout are local
///
/// @example
/// ```cpp
/// auto config = SessionConfig::Default()
///     .WithCipherSuite(crypto::CipherSuite::AesGcm)
///     .WithPrologue("my-app/1");
/// if (auto valid = config.Validate(); valid.IsErr()) { ... }
/// ```
class SessionConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// ChaChaPoly, rekey every 1000 messages, 65535-byte frames, prologue
    /// "xkwire", 30 s handshake deadline.
    [[nodiscard]] static SessionConfig Default();

    /// Same transport rules as Lightning's BOLT-8 (message-count rekey at
    /// 1000, 65535-byte frames) with prologue "lightning". The curve is
    /// still X25519, so this does not interoperate with BOLT-8 peers.
    [[nodiscard]] static SessionConfig Lightning();

    // =========================================================================
    // Builders
    // =========================================================================

    [[nodiscard]] SessionConfig WithCipherSuite(crypto::CipherSuite suite) const;
    [[nodiscard]] SessionConfig WithRekeyPolicy(RekeyPolicy policy) const;
    [[nodiscard]] SessionConfig WithMaxFramePayload(size_t max_payload) const;
    [[nodiscard]] SessionConfig WithPrologue(std::string_view prologue) const;
    [[nodiscard]] SessionConfig WithPrologue(std::span<const uint8_t> prologue) const;
    [[nodiscard]] SessionConfig WithHandshakeTimeout(std::chrono::milliseconds timeout) const;

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] crypto::CipherSuite GetCipherSuite() const noexcept { return cipher_suite_; }
    [[nodiscard]] const RekeyPolicy& GetRekeyPolicy() const noexcept { return rekey_policy_; }
    [[nodiscard]] size_t GetMaxFramePayload() const noexcept { return max_frame_payload_; }
    [[nodiscard]] std::span<const uint8_t> GetPrologue() const noexcept { return prologue_; }
    [[nodiscard]] std::chrono::milliseconds GetHandshakeTimeout() const noexcept { return handshake_timeout_; }

    /// "Noise_XK_25519_ChaChaPoly_SHA256" or "Noise_XK_25519_AESGCM_SHA256".
    [[nodiscard]] std::string ProtocolName() const;

    /// InvalidInput when the frame limit is 0 or above 65535, or the
    /// handshake timeout is not positive.
    [[nodiscard]] Result<Unit, ProtocolFailure> Validate() const;

private:
    SessionConfig(
        crypto::CipherSuite cipher_suite,
        RekeyPolicy rekey_policy,
        size_t max_frame_payload,
        std::vector<uint8_t> prologue,
        std::chrono::milliseconds handshake_timeout);

    crypto::CipherSuite cipher_suite_;
    RekeyPolicy rekey_policy_;
    size_t max_frame_payload_;
    std::vector<uint8_t> prologue_;
    std::chrono::milliseconds handshake_timeout_;
};

} // namespace xkwire::protocol::configuration
