#pragma once
#include <string>
#include <string_view>
#include <cstdint>
namespace xkwire::protocol {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    ReadOperationFailed,
    InvalidOperation
};
enum class ProtocolFailureType {
    InvalidKeyMaterial,
    InvalidInput,
    KeyGeneration,
    DeriveKey,
    UnexpectedMessage,
    AuthenticationFailed,
    FramingError,
    NonceExhausted,
    Timeout,
    Io,
    SessionClosed,
    InvalidState
};

/// Who has to act on a failure.
///
/// - Configuration: the local caller passed something unusable; fixable.
/// - PeerViolation: the remote side (or the path to it) is not behaving;
///   drop the connection and distrust the peer.
/// - Transient: I/O or deadline problem; a fresh attempt may succeed.
/// - Fatal: the session cannot continue and must be re-established.
/// - Internal: a local backend (RNG, allocator, crypto library) failed.
enum class FailureClass : uint8_t {
    Configuration,
    PeerViolation,
    Transient,
    Fatal,
    Internal
};

class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;
    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ProtocolFailure InvalidKeyMaterial(std::string msg) {
        return {ProtocolFailureType::InvalidKeyMaterial, std::move(msg)};
    }
    static ProtocolFailure InvalidInput(std::string msg) {
        return {ProtocolFailureType::InvalidInput, std::move(msg)};
    }
    static ProtocolFailure KeyGeneration(std::string msg) {
        return {ProtocolFailureType::KeyGeneration, std::move(msg)};
    }
    static ProtocolFailure DeriveKey(std::string msg) {
        return {ProtocolFailureType::DeriveKey, std::move(msg)};
    }
    static ProtocolFailure UnexpectedMessage(std::string msg) {
        return {ProtocolFailureType::UnexpectedMessage, std::move(msg)};
    }
    static ProtocolFailure AuthenticationFailed(std::string msg) {
        return {ProtocolFailureType::AuthenticationFailed, std::move(msg)};
    }
    static ProtocolFailure FramingError(std::string msg) {
        return {ProtocolFailureType::FramingError, std::move(msg)};
    }
    static ProtocolFailure NonceExhausted(std::string msg) {
        return {ProtocolFailureType::NonceExhausted, std::move(msg)};
    }
    static ProtocolFailure Timeout(std::string msg) {
        return {ProtocolFailureType::Timeout, std::move(msg)};
    }
    static ProtocolFailure Io(std::string msg) {
        return {ProtocolFailureType::Io, std::move(msg)};
    }
    static ProtocolFailure SessionClosed(std::string msg) {
        return {ProtocolFailureType::SessionClosed, std::move(msg)};
    }
    static ProtocolFailure InvalidState(std::string msg) {
        return {ProtocolFailureType::InvalidState, std::move(msg)};
    }
    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::AllocationFailed ||
            sf.type == SodiumFailureType::InitializationFailed) {
            return KeyGeneration(sf.message);
        }
        return InvalidState(sf.message);
    }

    [[nodiscard]] FailureClass Class() const noexcept {
        switch (type) {
            case ProtocolFailureType::InvalidKeyMaterial:
            case ProtocolFailureType::InvalidInput:
                return FailureClass::Configuration;
            case ProtocolFailureType::UnexpectedMessage:
            case ProtocolFailureType::AuthenticationFailed:
            case ProtocolFailureType::FramingError:
                return FailureClass::PeerViolation;
            case ProtocolFailureType::Timeout:
            case ProtocolFailureType::Io:
                return FailureClass::Transient;
            case ProtocolFailureType::NonceExhausted:
            case ProtocolFailureType::SessionClosed:
                return FailureClass::Fatal;
            case ProtocolFailureType::KeyGeneration:
            case ProtocolFailureType::DeriveKey:
            case ProtocolFailureType::InvalidState:
                return FailureClass::Internal;
        }
        return FailureClass::Internal;
    }

    [[nodiscard]] bool IsRetryable() const noexcept {
        return Class() == FailureClass::Transient;
    }
};

[[nodiscard]] constexpr std::string_view ToString(ProtocolFailureType type) noexcept {
    switch (type) {
        case ProtocolFailureType::InvalidKeyMaterial: return "InvalidKeyMaterial";
        case ProtocolFailureType::InvalidInput: return "InvalidInput";
        case ProtocolFailureType::KeyGeneration: return "KeyGeneration";
        case ProtocolFailureType::DeriveKey: return "DeriveKey";
        case ProtocolFailureType::UnexpectedMessage: return "UnexpectedMessage";
        case ProtocolFailureType::AuthenticationFailed: return "AuthenticationFailed";
        case ProtocolFailureType::FramingError: return "FramingError";
        case ProtocolFailureType::NonceExhausted: return "NonceExhausted";
        case ProtocolFailureType::Timeout: return "Timeout";
        case ProtocolFailureType::Io: return "Io";
        case ProtocolFailureType::SessionClosed: return "SessionClosed";
        case ProtocolFailureType::InvalidState: return "InvalidState";
    }
    return "Unknown";
}
}
