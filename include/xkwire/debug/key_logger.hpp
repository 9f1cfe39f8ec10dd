#pragma once

/**
 * @file key_logger.hpp
 * @brief Debug tracing of handshake secrets and session state.
 *
 * SECURITY WARNING: with XKWIRE_DEBUG_KEYS defined this prints chaining
 * keys, DH outputs and transport keys to stdout. Only for checking
 * interoperability against another Noise implementation.
 * NEVER enable in production builds.
 *
 * Enable via CMake: -DXKWIRE_DEBUG_KEYS=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace xkwire::debug {

enum class Side {
    Initiator,
    Responder,
    Unknown
};

#ifdef XKWIRE_DEBUG_KEYS

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline std::string ToHexTruncated(std::span<const uint8_t> data, size_t max_bytes = 64) {
    if (data.size() <= max_bytes) {
        return ToHex(data);
    }
    auto truncated = ToHex(data.subspan(0, max_bytes));
    truncated += "...(" + std::to_string(data.size()) + " bytes)";
    return truncated;
}

inline const char* SideToString(Side side) {
    switch (side) {
        case Side::Initiator: return "INITIATOR";
        case Side::Responder: return "RESPONDER";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Core logging macros
// ============================================================================

#define XKW_LOG_KEY(side, operation, key_name, data) \
    do { \
        fprintf(stdout, "[XKW-DEBUG] %s %s %s: %s\n", \
            ::xkwire::debug::SideToString(side), \
            operation, \
            key_name, \
            ::xkwire::debug::ToHexTruncated(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define XKW_LOG_VALUE(side, operation, name, value) \
    do { \
        fprintf(stdout, "[XKW-DEBUG] %s %s %s: %s\n", \
            ::xkwire::debug::SideToString(side), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define XKW_LOG_MSG(side, operation, message) \
    do { \
        fprintf(stdout, "[XKW-DEBUG] %s %s %s\n", \
            ::xkwire::debug::SideToString(side), \
            operation, \
            message); \
        fflush(stdout); \
    } while(0)

#define XKW_LOG_SECTION(side, section_name) \
    do { \
        fprintf(stdout, "[XKW-DEBUG] %s ========== %s ==========\n", \
            ::xkwire::debug::SideToString(side), \
            section_name); \
        fflush(stdout); \
    } while(0)

// ============================================================================
// Handshake
// ============================================================================

inline void LogHandshakeStart(Side side, std::string_view protocol_name) {
    XKW_LOG_SECTION(side, side == Side::Initiator ? "XK INITIATOR" : "XK RESPONDER");
    XKW_LOG_MSG(side, "HANDSHAKE", std::string(protocol_name).c_str());
}

inline void LogHandshakeStep(
    Side side,
    const char* step,
    std::span<const uint8_t> handshake_hash,
    std::span<const uint8_t> chaining_key) {

    XKW_LOG_KEY(side, step, "h", handshake_hash);
    XKW_LOG_KEY(side, step, "ck", chaining_key);
}

inline void LogDh(Side side, const char* token, std::span<const uint8_t> shared_secret) {
    XKW_LOG_KEY(side, "DH", token, shared_secret);
}

inline void LogSplit(
    Side side,
    std::span<const uint8_t> send_key,
    std::span<const uint8_t> receive_key,
    std::span<const uint8_t> handshake_hash) {

    XKW_LOG_SECTION(side, "SPLIT");
    XKW_LOG_KEY(side, "SPLIT", "send_key", send_key);
    XKW_LOG_KEY(side, "SPLIT", "receive_key", receive_key);
    XKW_LOG_KEY(side, "SPLIT", "handshake_hash", handshake_hash);
}

// ============================================================================
// Transport
// ============================================================================

inline void LogFrame(Side side, const char* direction, uint64_t nonce, size_t payload_size) {
    XKW_LOG_VALUE(side, direction, "nonce", nonce);
    XKW_LOG_VALUE(side, direction, "payload_size", payload_size);
}

inline void LogRekey(Side side, const char* direction, uint64_t rekey_count) {
    XKW_LOG_VALUE(side, direction, "rekey_count", rekey_count);
}

inline void LogSessionClosed(Side side, std::string_view reason) {
    XKW_LOG_MSG(side, "SESSION CLOSED", std::string(reason).c_str());
}

#else // !XKWIRE_DEBUG_KEYS

#define XKW_LOG_KEY(side, operation, key_name, data) ((void)0)
#define XKW_LOG_VALUE(side, operation, name, value) ((void)0)
#define XKW_LOG_MSG(side, operation, message) ((void)0)
#define XKW_LOG_SECTION(side, section_name) ((void)0)

inline void LogHandshakeStart(Side, std::string_view) {}
inline void LogHandshakeStep(Side, const char*, std::span<const uint8_t>, std::span<const uint8_t>) {}
inline void LogDh(Side, const char*, std::span<const uint8_t>) {}
inline void LogSplit(Side, std::span<const uint8_t>, std::span<const uint8_t>, std::span<const uint8_t>) {}
inline void LogFrame(Side, const char*, uint64_t, size_t) {}
inline void LogRekey(Side, const char*, uint64_t) {}
inline void LogSessionClosed(Side, std::string_view) {}

#endif // XKWIRE_DEBUG_KEYS

} // namespace xkwire::debug
