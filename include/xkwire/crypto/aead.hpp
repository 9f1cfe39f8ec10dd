#pragma once

#include "xkwire/core/result.hpp"
#include "xkwire/core/failures.hpp"
#include "xkwire/protocol/constants.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace xkwire::protocol::crypto {

enum class CipherSuite : uint8_t {
    ChaChaPoly,
    AesGcm
};

/// Name of the suite as it appears in the Noise protocol name.
[[nodiscard]] constexpr std::string_view CipherSuiteName(CipherSuite suite) noexcept {
    return suite == CipherSuite::AesGcm ? kAesGcmName : kChaChaPolyName;
}

/**
 * @brief Noise AEAD functions ENCRYPT(k, n, ad, p) / DECRYPT(k, n, ad, c)
 *
 * The 64-bit counter n becomes a 96-bit nonce of four zero bytes followed
 * by n, little-endian for ChaChaPoly and big-endian for AESGCM.
 */
class Aead {
public:
    using Nonce = std::array<uint8_t, kAeadNonceBytes>;

    [[nodiscard]] static Nonce EncodeNonce(CipherSuite suite, uint64_t counter) noexcept;

    /**
     * @return ciphertext || 16-byte tag
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Seal(
        CipherSuite suite,
        std::span<const uint8_t> key,
        uint64_t counter,
        std::span<const uint8_t> associated_data,
        std::span<const uint8_t> plaintext);

    /**
     * @return plaintext, or AuthenticationFailed on any tag mismatch
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Open(
        CipherSuite suite,
        std::span<const uint8_t> key,
        uint64_t counter,
        std::span<const uint8_t> associated_data,
        std::span<const uint8_t> ciphertext_with_tag);

    /**
     * @brief Noise REKEY(k): first 32 bytes of ENCRYPT(k, 2^64-1, empty, zeros)
     */
    static Result<Unit, ProtocolFailure> Rekey(
        CipherSuite suite,
        std::span<const uint8_t> key,
        std::span<uint8_t> new_key);

    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t TAG_SIZE = 16;

private:
    Aead() = delete;
};

} // namespace xkwire::protocol::crypto
