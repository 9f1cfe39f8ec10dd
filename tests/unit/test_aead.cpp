#include <catch2/catch_test_macros.hpp>
#include "xkwire/crypto/aead.hpp"
#include "xkwire/crypto/aes_gcm.hpp"
#include "xkwire/crypto/sodium_interop.hpp"
#include "xkwire/protocol/constants.hpp"
#include "helpers/hex.hpp"
#include <algorithm>
#include <array>
#include <vector>

using namespace xkwire::protocol;
using namespace xkwire::protocol::crypto;
using test_helpers::FromHex;

TEST_CASE("Aead - Nonce encoding", "[aead][crypto]") {
    SECTION("ChaChaPoly puts the counter little-endian after four zero bytes") {
        auto nonce = Aead::EncodeNonce(CipherSuite::ChaChaPoly, 0x0102030405060708ULL);
        const Aead::Nonce expected = {0, 0, 0, 0, 0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01};
        REQUIRE(nonce == expected);
    }
    SECTION("AESGCM puts the counter big-endian after four zero bytes") {
        auto nonce = Aead::EncodeNonce(CipherSuite::AesGcm, 0x0102030405060708ULL);
        const Aead::Nonce expected = {0, 0, 0, 0, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
        REQUIRE(nonce == expected);
    }
    SECTION("Counter zero is all zeros") {
        REQUIRE(Aead::EncodeNonce(CipherSuite::ChaChaPoly, 0) == Aead::Nonce{});
        REQUIRE(Aead::EncodeNonce(CipherSuite::AesGcm, 0) == Aead::Nonce{});
    }
}

TEST_CASE("Aead - AESGCM known answers", "[aead][aes_gcm][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(32, 0x00);

    SECTION("Empty plaintext under the zero key") {
        auto sealed = Aead::Seal(CipherSuite::AesGcm, key, 0, {}, {});
        REQUIRE(sealed.IsOk());
        REQUIRE(sealed.Unwrap() == FromHex("530f8afbc74536b9a963b4f1c4cb738b"));
    }

    SECTION("One zero block under the zero key") {
        const std::vector<uint8_t> plaintext(16, 0x00);
        auto sealed = Aead::Seal(CipherSuite::AesGcm, key, 0, {}, plaintext);
        REQUIRE(sealed.IsOk());
        REQUIRE(sealed.Unwrap() == FromHex(
            "cea7403d4d606b6e074ec5d3baf39d18d0d1c8a799996bf0265b98b5d48ab919"));
    }
}

TEST_CASE("Aead - Seal and Open", "[aead][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(32, 0x42);
    const std::vector<uint8_t> ad = {'h', 'a', 's', 'h'};
    const std::vector<uint8_t> plaintext = {'p', 'i', 'n', 'g'};

    for (const auto suite : {CipherSuite::ChaChaPoly, CipherSuite::AesGcm}) {
        INFO("suite " << CipherSuiteName(suite));
        auto sealed = Aead::Seal(suite, key, 7, ad, plaintext);
        REQUIRE(sealed.IsOk());
        auto ciphertext = sealed.Unwrap();
        REQUIRE(ciphertext.size() == plaintext.size() + kAeadTagBytes);

        auto opened = Aead::Open(suite, key, 7, ad, ciphertext);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == plaintext);

        {
            // wrong counter fails authentication
            auto result = Aead::Open(suite, key, 8, ad, ciphertext);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);
        }
        {
            // wrong associated data fails authentication
            const std::vector<uint8_t> other_ad = {'h', 'a', 's', 'H'};
            auto result = Aead::Open(suite, key, 7, other_ad, ciphertext);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);
        }
        {
            // any flipped bit fails authentication
            for (size_t i = 0; i < ciphertext.size(); ++i) {
                auto tampered = ciphertext;
                tampered[i] ^= 0x01;
                REQUIRE(Aead::Open(suite, key, 7, ad, tampered).IsErr());
            }
        }
        {
            // truncated input fails authentication
            std::vector<uint8_t> short_input(ciphertext.begin(), ciphertext.begin() + 8);
            auto result = Aead::Open(suite, key, 7, ad, short_input);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == ProtocolFailureType::AuthenticationFailed);
        }
        {
            // wrong key size is rejected
            std::vector<uint8_t> short_key(16, 0x42);
            auto result = Aead::Seal(suite, short_key, 0, ad, plaintext);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
        }
    }
}

TEST_CASE("Aead - Suites are not interchangeable", "[aead][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(32, 0x42);
    const std::vector<uint8_t> plaintext(20, 0x01);
    auto sealed = Aead::Seal(CipherSuite::ChaChaPoly, key, 1, {}, plaintext).Unwrap();
    REQUIRE(Aead::Open(CipherSuite::AesGcm, key, 1, {}, sealed).IsErr());
}

TEST_CASE("Aead - Rekey", "[aead][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(32, 0x42);

    for (const auto suite : {CipherSuite::ChaChaPoly, CipherSuite::AesGcm}) {
        INFO("suite " << CipherSuiteName(suite));
        std::array<uint8_t, 32> next{};
        REQUIRE(Aead::Rekey(suite, key, next).IsOk());

        {
            // first 32 bytes of ENCRYPT(k, 2^64-1, "", zeros)
            const std::vector<uint8_t> zeros(32, 0x00);
            auto sealed = Aead::Seal(suite, key, kRekeyNonce, {}, zeros).Unwrap();
            REQUIRE(std::equal(next.begin(), next.end(), sealed.begin()));
        }
        {
            // deterministic, and differs from the old key
            std::array<uint8_t, 32> again{};
            REQUIRE(Aead::Rekey(suite, key, again).IsOk());
            REQUIRE(next == again);
            REQUIRE(!std::equal(next.begin(), next.end(), key.begin()));
        }
        {
            // output must hold a full key
            std::array<uint8_t, 16> small{};
            REQUIRE(Aead::Rekey(suite, key, small).IsErr());
        }
    }
}

TEST_CASE("AES-GCM - Direct interface", "[aes_gcm][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> key(AesGcm::KEY_SIZE, 0x66);
    std::vector<uint8_t> nonce(AesGcm::NONCE_SIZE, 0x77);
    std::vector<uint8_t> plaintext = {'s', 'e', 'c', 'r', 'e', 't'};

    SECTION("Wrong nonce size is rejected") {
        std::vector<uint8_t> short_nonce(8, 0x77);
        auto result = AesGcm::Encrypt(key, short_nonce, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
    SECTION("Large plaintext") {
        std::vector<uint8_t> large(10000, 0x55);
        auto sealed = AesGcm::Encrypt(key, nonce, large);
        REQUIRE(sealed.IsOk());
        auto opened = AesGcm::Decrypt(key, nonce, sealed.Unwrap());
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == large);
    }
}
