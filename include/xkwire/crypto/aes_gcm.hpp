#pragma once
#include "xkwire/core/result.hpp"
#include "xkwire/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace xkwire::protocol::crypto {

/**
 * AES-256-GCM with a 96-bit nonce and 128-bit tag (OpenSSL EVP).
 *
 * Stateless. The caller owns nonce uniqueness; in this library that is the
 * 64-bit counter of CipherState, which is never reused under one key.
 *
 * Output of Encrypt is ciphertext || tag. Decrypt reports a tag mismatch as
 * AuthenticationFailed and never returns partial plaintext.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});

    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t NONCE_SIZE = 12;
    static constexpr size_t TAG_SIZE = 16;
private:
    AesGcm() = delete;
};
}
