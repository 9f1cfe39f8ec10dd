#include "xkwire/crypto/aead.hpp"
#include "xkwire/crypto/aes_gcm.hpp"
#include "xkwire/crypto/sodium_interop.hpp"
#include "xkwire/core/constants.hpp"

#include <sodium.h>
#include <cstring>
#include <limits>
#include <string>
#include <tuple>

namespace xkwire::protocol::crypto {

namespace {
    static_assert(crypto_aead_chacha20poly1305_ietf_KEYBYTES == Aead::KEY_SIZE);
    static_assert(crypto_aead_chacha20poly1305_ietf_NPUBBYTES == std::tuple_size_v<Aead::Nonce>);
    static_assert(crypto_aead_chacha20poly1305_ietf_ABYTES == Aead::TAG_SIZE);

    constexpr size_t kCounterOffset = 4;

    Result<std::vector<uint8_t>, ProtocolFailure> ChaChaSeal(
        std::span<const uint8_t> key,
        const Aead::Nonce& nonce,
        std::span<const uint8_t> associated_data,
        std::span<const uint8_t> plaintext) {
        std::vector<uint8_t> output(plaintext.size() + Aead::TAG_SIZE);
        unsigned long long output_len = 0;
        if (crypto_aead_chacha20poly1305_ietf_encrypt(
                output.data(), &output_len,
                plaintext.data(), plaintext.size(),
                associated_data.data(), associated_data.size(),
                nullptr, nonce.data(), key.data()) != SodiumConstants::SUCCESS) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("ChaCha20-Poly1305 encryption failed"));
        }
        output.resize(static_cast<size_t>(output_len));
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> ChaChaOpen(
        std::span<const uint8_t> key,
        const Aead::Nonce& nonce,
        std::span<const uint8_t> associated_data,
        std::span<const uint8_t> ciphertext_with_tag) {
        std::vector<uint8_t> output(ciphertext_with_tag.size() - Aead::TAG_SIZE);
        unsigned long long output_len = 0;
        if (crypto_aead_chacha20poly1305_ietf_decrypt(
                output.data(), &output_len,
                nullptr,
                ciphertext_with_tag.data(), ciphertext_with_tag.size(),
                associated_data.data(), associated_data.size(),
                nonce.data(), key.data()) != SodiumConstants::SUCCESS) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::AuthenticationFailed(std::string(ErrorMessages::AEAD_TAG_MISMATCH)));
        }
        output.resize(static_cast<size_t>(output_len));
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
    }

    Result<Unit, ProtocolFailure> CheckKey(std::span<const uint8_t> key) {
        if (key.size() != Aead::KEY_SIZE) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    "AEAD key must be " + std::to_string(Aead::KEY_SIZE) +
                    " bytes, got " + std::to_string(key.size())));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}

Aead::Nonce Aead::EncodeNonce(CipherSuite suite, uint64_t counter) noexcept {
    Nonce nonce{};
    for (size_t i = 0; i < sizeof(uint64_t); ++i) {
        const auto byte = static_cast<uint8_t>(counter >> (8 * i));
        if (suite == CipherSuite::AesGcm) {
            nonce[nonce.size() - 1 - i] = byte;
        } else {
            nonce[kCounterOffset + i] = byte;
        }
    }
    return nonce;
}

Result<std::vector<uint8_t>, ProtocolFailure> Aead::Seal(
    CipherSuite suite,
    std::span<const uint8_t> key,
    uint64_t counter,
    std::span<const uint8_t> associated_data,
    std::span<const uint8_t> plaintext) {

    if (auto check = CheckKey(key); check.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(check).UnwrapErr());
    }

    const Nonce nonce = EncodeNonce(suite, counter);
    if (suite == CipherSuite::AesGcm) {
        return AesGcm::Encrypt(key, nonce, plaintext, associated_data);
    }
    return ChaChaSeal(key, nonce, associated_data, plaintext);
}

Result<std::vector<uint8_t>, ProtocolFailure> Aead::Open(
    CipherSuite suite,
    std::span<const uint8_t> key,
    uint64_t counter,
    std::span<const uint8_t> associated_data,
    std::span<const uint8_t> ciphertext_with_tag) {

    if (auto check = CheckKey(key); check.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(check).UnwrapErr());
    }
    if (ciphertext_with_tag.size() < TAG_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::AuthenticationFailed(
                "Ciphertext shorter than the " + std::to_string(TAG_SIZE) + "-byte tag"));
    }

    const Nonce nonce = EncodeNonce(suite, counter);
    if (suite == CipherSuite::AesGcm) {
        return AesGcm::Decrypt(key, nonce, ciphertext_with_tag, associated_data);
    }
    return ChaChaOpen(key, nonce, associated_data, ciphertext_with_tag);
}

Result<Unit, ProtocolFailure> Aead::Rekey(
    CipherSuite suite,
    std::span<const uint8_t> key,
    std::span<uint8_t> new_key) {

    if (new_key.size() != KEY_SIZE) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Rekey output must be " +
                                          std::to_string(KEY_SIZE) + " bytes"));
    }

    const std::array<uint8_t, KEY_SIZE> zeros{};
    auto sealed = Seal(suite, key, std::numeric_limits<uint64_t>::max(), {}, zeros);
    if (sealed.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(std::move(sealed).UnwrapErr());
    }

    auto& block = sealed.Unwrap();
    std::memcpy(new_key.data(), block.data(), KEY_SIZE);
    if (SodiumInterop::SecureWipe(std::span<uint8_t>(block)).IsErr()) {
        sodium_memzero(block.data(), block.size());
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

} // namespace xkwire::protocol::crypto
