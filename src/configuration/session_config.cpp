#include "xkwire/configuration/session_config.hpp"

#include <string>

namespace xkwire::protocol::configuration {

namespace {
    constexpr std::chrono::milliseconds kDefaultHandshakeTimeout{30'000};

    std::vector<uint8_t> ToBytes(std::string_view text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }
}

SessionConfig::SessionConfig(
    crypto::CipherSuite cipher_suite,
    RekeyPolicy rekey_policy,
    size_t max_frame_payload,
    std::vector<uint8_t> prologue,
    std::chrono::milliseconds handshake_timeout)
    : cipher_suite_(cipher_suite)
    , rekey_policy_(rekey_policy)
    , max_frame_payload_(max_frame_payload)
    , prologue_(std::move(prologue))
    , handshake_timeout_(handshake_timeout) {
}

SessionConfig SessionConfig::Default() {
    return SessionConfig(
        crypto::CipherSuite::ChaChaPoly,
        RekeyPolicy::Default(),
        kMaxFramePayloadBytes,
        ToBytes(kDefaultPrologue),
        kDefaultHandshakeTimeout);
}

SessionConfig SessionConfig::Lightning() {
    return SessionConfig(
        crypto::CipherSuite::ChaChaPoly,
        RekeyPolicy::Messages(kDefaultRekeyAfterMessages),
        kMaxFramePayloadBytes,
        ToBytes(kLightningPrologue),
        kDefaultHandshakeTimeout);
}

SessionConfig SessionConfig::WithCipherSuite(crypto::CipherSuite suite) const {
    SessionConfig copy = *this;
    copy.cipher_suite_ = suite;
    return copy;
}

SessionConfig SessionConfig::WithRekeyPolicy(RekeyPolicy policy) const {
    SessionConfig copy = *this;
    copy.rekey_policy_ = policy;
    return copy;
}

SessionConfig SessionConfig::WithMaxFramePayload(size_t max_payload) const {
    SessionConfig copy = *this;
    copy.max_frame_payload_ = max_payload;
    return copy;
}

SessionConfig SessionConfig::WithPrologue(std::string_view prologue) const {
    SessionConfig copy = *this;
    copy.prologue_ = ToBytes(prologue);
    return copy;
}

SessionConfig SessionConfig::WithPrologue(std::span<const uint8_t> prologue) const {
    SessionConfig copy = *this;
    copy.prologue_.assign(prologue.begin(), prologue.end());
    return copy;
}

SessionConfig SessionConfig::WithHandshakeTimeout(std::chrono::milliseconds timeout) const {
    SessionConfig copy = *this;
    copy.handshake_timeout_ = timeout;
    return copy;
}

std::string SessionConfig::ProtocolName() const {
    std::string name(kProtocolNamePrefix);
    name += crypto::CipherSuiteName(cipher_suite_);
    name += kProtocolNameSuffix;
    return name;
}

Result<Unit, ProtocolFailure> SessionConfig::Validate() const {
    if (max_frame_payload_ == 0 || max_frame_payload_ > kMaxFramePayloadBytes) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                "max_frame_payload must be in 1.." + std::to_string(kMaxFramePayloadBytes) +
                ", got " + std::to_string(max_frame_payload_)));
    }
    if (handshake_timeout_.count() <= 0) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("handshake_timeout must be positive"));
    }
    if (prologue_.size() > kMaxNoiseMessageBytes) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("prologue longer than " +
                                          std::to_string(kMaxNoiseMessageBytes) + " bytes"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

} // namespace xkwire::protocol::configuration
