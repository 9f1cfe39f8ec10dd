#include "xkwire/crypto/hkdf.hpp"
#include "xkwire/crypto/sodium_interop.hpp"
#include "xkwire/core/constants.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <algorithm>
#include <array>
#include <cstring>
#include <string>

namespace xkwire::protocol::crypto {

namespace {
    constexpr std::array<uint8_t, Hkdf::HASH_LEN> kZeroSalt{};

    void WipeScratch(std::span<uint8_t> buffer) {
        auto wipe_result = SodiumInterop::SecureWipe(buffer);
        if (wipe_result.IsErr()) {
            sodium_memzero(buffer.data(), buffer.size());
        }
    }
}

Result<Unit, ProtocolFailure> Hkdf::HmacSha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data,
    std::span<uint8_t> output) {

    if (output.size() < HASH_LEN) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                "HMAC output buffer must be at least " + std::to_string(HASH_LEN) + " bytes"));
    }

    // OpenSSL wants a non-null key pointer even for an empty key.
    const uint8_t* key_ptr = key.empty() ? kZeroSalt.data() : key.data();
    const uint8_t* data_ptr = data.empty() ? kZeroSalt.data() : data.data();

    unsigned int out_len = 0;
    const unsigned char* mac = HMAC(
        EVP_sha256(),
        key_ptr, static_cast<int>(key.size()),
        data_ptr, data.size(),
        output.data(), &out_len);

    if (mac == nullptr || out_len != HASH_LEN) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("HMAC-SHA256 computation failed"));
    }

    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    auto prk_result = Extract(ikm, salt);
    if (prk_result.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(std::move(prk_result).UnwrapErr());
    }
    auto prk = std::move(prk_result).Unwrap();

    auto expand_result = Expand(prk, output, info);
    WipeScratch(prk);
    return expand_result;
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::Extract(
    std::span<const uint8_t> ikm,
    std::span<const uint8_t> salt) {

    std::vector<uint8_t> prk(HASH_LEN);
    auto mac_result = HmacSha256(salt.empty() ? std::span<const uint8_t>(kZeroSalt) : salt, ikm, prk);
    if (mac_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            std::move(mac_result).UnwrapErr());
    }

    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(prk));
}

Result<Unit, ProtocolFailure> Hkdf::Expand(
    std::span<const uint8_t> prk,
    std::span<uint8_t> output,
    std::span<const uint8_t> info) {

    if (output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                "HKDF output size exceeds maximum allowed: " +
                std::to_string(output.size()) + " > " + std::to_string(MAX_OUTPUT_LEN)));
    }
    if (prk.size() < HASH_LEN) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("HKDF PRK must be at least " +
                                          std::to_string(HASH_LEN) + " bytes"));
    }

    // T(i) = HMAC(PRK, T(i-1) | info | i)
    std::vector<uint8_t> block_input;
    block_input.reserve(HASH_LEN + info.size() + 1);
    std::array<uint8_t, HASH_LEN> previous{};
    size_t previous_len = 0;
    size_t written = 0;
    uint8_t counter = 1;

    while (written < output.size()) {
        block_input.assign(previous.begin(), previous.begin() + static_cast<std::ptrdiff_t>(previous_len));
        block_input.insert(block_input.end(), info.begin(), info.end());
        block_input.push_back(counter);

        auto mac_result = HmacSha256(prk, block_input, previous);
        if (mac_result.IsErr()) {
            WipeScratch(previous);
            WipeScratch(block_input);
            return mac_result;
        }
        previous_len = HASH_LEN;

        const size_t take = std::min(HASH_LEN, output.size() - written);
        std::memcpy(output.data() + written, previous.data(), take);
        written += take;
        ++counter;
    }

    WipeScratch(previous);
    WipeScratch(block_input);
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> Hkdf::NoiseDerive(
    std::span<const uint8_t> chaining_key,
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output1,
    std::span<uint8_t> output2,
    std::span<uint8_t> output3) {

    if (chaining_key.size() != HASH_LEN) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Chaining key must be " +
                                          std::to_string(HASH_LEN) + " bytes"));
    }
    if (output1.size() != HASH_LEN || output2.size() != HASH_LEN ||
        (!output3.empty() && output3.size() != HASH_LEN)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Noise HKDF outputs must be " +
                                          std::to_string(HASH_LEN) + " bytes each"));
    }

    const size_t output_count = output3.empty() ? 2 : 3;
    std::array<uint8_t, 3 * HASH_LEN> okm{};

    auto derive_result = DeriveKey(
        ikm,
        std::span<uint8_t>(okm.data(), output_count * HASH_LEN),
        chaining_key,
        {});
    if (derive_result.IsErr()) {
        WipeScratch(okm);
        return derive_result;
    }

    std::memcpy(output1.data(), okm.data(), HASH_LEN);
    std::memcpy(output2.data(), okm.data() + HASH_LEN, HASH_LEN);
    if (output_count == 3) {
        std::memcpy(output3.data(), okm.data() + 2 * HASH_LEN, HASH_LEN);
    }

    WipeScratch(okm);
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

} // namespace xkwire::protocol::crypto
