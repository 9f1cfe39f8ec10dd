#pragma once

#include "xkwire/core/result.hpp"
#include "xkwire/core/failures.hpp"

#include <span>
#include <vector>
#include <cstdint>

namespace xkwire::protocol::crypto {

/**
 * @brief HMAC-SHA256 and HKDF primitives
 *
 * Extract/Expand follow RFC 5869. NoiseDerive is the HKDF function of the
 * Noise framework: Extract with the chaining key as salt, then two or three
 * 32-byte blocks of Expand with empty info.
 */
class Hkdf {
public:
    /**
     * @brief HMAC-SHA256 over key and data
     *
     * @param output Must be at least HASH_LEN bytes
     */
    static Result<Unit, ProtocolFailure> HmacSha256(
        std::span<const uint8_t> key,
        std::span<const uint8_t> data,
        std::span<uint8_t> output);

    /**
     * @brief Derive key using HKDF-SHA256
     *
     * @param ikm Input key material, may be empty
     * @param output Output buffer to fill with derived key
     * @param salt Optional salt; empty means HASH_LEN zero bytes
     * @param info Optional context info
     */
    static Result<Unit, ProtocolFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    /**
     * @brief HKDF Extract phase
     *
     * @return Ok(prk) where prk is HASH_LEN bytes, or Err
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> Extract(
        std::span<const uint8_t> ikm,
        std::span<const uint8_t> salt = {});

    /**
     * @brief HKDF Expand phase
     *
     * @param prk Pseudorandom key from Extract
     * @param output Output buffer, at most MAX_OUTPUT_LEN bytes
     */
    static Result<Unit, ProtocolFailure> Expand(
        std::span<const uint8_t> prk,
        std::span<uint8_t> output,
        std::span<const uint8_t> info = {});

    /**
     * @brief Noise HKDF(chaining_key, ikm)
     *
     * Writes HASH_LEN bytes into each of output1, output2 and, when it is not
     * empty, output3. Every output span must be exactly HASH_LEN bytes.
     */
    static Result<Unit, ProtocolFailure> NoiseDerive(
        std::span<const uint8_t> chaining_key,
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output1,
        std::span<uint8_t> output2,
        std::span<uint8_t> output3 = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace xkwire::protocol::crypto
