#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

namespace xkwire::protocol {

inline constexpr size_t kX25519PublicKeyBytes = 32;

inline constexpr size_t kHashBytes = 32;
inline constexpr size_t kCipherKeyBytes = 32;
inline constexpr size_t kAeadNonceBytes = 12;
inline constexpr size_t kAeadTagBytes = 16;

// Noise reserves 2^64-1: it is never used for a message, only for REKEY.
inline constexpr uint64_t kRekeyNonce = std::numeric_limits<uint64_t>::max();
inline constexpr uint64_t kMaxMessageNonce = kRekeyNonce - 1;

// Handshake message sizes with empty payloads.
inline constexpr size_t kHandshakeMessage1Bytes = kX25519PublicKeyBytes + kAeadTagBytes;
inline constexpr size_t kHandshakeMessage2Bytes = kX25519PublicKeyBytes + kAeadTagBytes;
inline constexpr size_t kHandshakeMessage3Bytes =
    kX25519PublicKeyBytes + kAeadTagBytes + kAeadTagBytes;
inline constexpr size_t kMaxNoiseMessageBytes = 65535;

inline constexpr size_t kFrameLengthPrefixBytes = 2;
inline constexpr size_t kMaxFramePayloadBytes = 0xFFFF;

inline constexpr uint64_t kDefaultRekeyAfterMessages = 1000;
inline constexpr uint64_t kDefaultRekeyAfterBytes = 0;

inline constexpr std::string_view kProtocolNamePrefix = "Noise_XK_25519_";
inline constexpr std::string_view kProtocolNameSuffix = "_SHA256";
inline constexpr std::string_view kChaChaPolyName = "ChaChaPoly";
inline constexpr std::string_view kAesGcmName = "AESGCM";
inline constexpr std::string_view kDefaultPrologue = "xkwire";
inline constexpr std::string_view kLightningPrologue = "lightning";

}  // namespace xkwire::protocol
