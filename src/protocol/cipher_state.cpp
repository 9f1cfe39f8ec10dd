#include "xkwire/protocol/cipher_state.hpp"
#include "xkwire/core/constants.hpp"
#include "xkwire/crypto/sodium_interop.hpp"
#include <algorithm>
#include <array>
#include <string>

namespace xkwire::protocol {
    using crypto::Aead;
    using crypto::SecureMemoryHandle;

    CipherState::CipherState(
        crypto::CipherSuite suite,
        SecureMemoryHandle key,
        configuration::RekeyPolicy rekey_policy)
        : suite_(suite)
        , key_(std::move(key))
        , rekey_policy_(rekey_policy) {
    }

    Result<CipherState, ProtocolFailure> CipherState::Create(
        crypto::CipherSuite suite,
        std::span<const uint8_t> key,
        configuration::RekeyPolicy rekey_policy) {
        if (key.size() != kCipherKeyBytes) {
            return Result<CipherState, ProtocolFailure>::Err(
                ProtocolFailure::InvalidKeyMaterial(
                    "Cipher key must be " + std::to_string(kCipherKeyBytes) +
                    " bytes, got " + std::to_string(key.size())));
        }
        auto handle_result = SecureMemoryHandle::FromBytes(key);
        if (handle_result.IsErr()) {
            return Result<CipherState, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        return Result<CipherState, ProtocolFailure>::Ok(
            CipherState(suite, std::move(handle_result).Unwrap(), rekey_policy));
    }

    Result<Unit, ProtocolFailure> CipherState::EnsureUsable() const {
        if (key_.IsInvalid()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::SessionClosed(std::string(ErrorMessages::CIPHER_STATE_DESTROYED)));
        }
        if (nonce_ > kMaxMessageNonce) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::NonceExhausted("Nonce space for this key is used up"));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::vector<uint8_t>, ProtocolFailure> CipherState::Encrypt(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data) {
        if (auto usable = EnsureUsable(); usable.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(usable).UnwrapErr());
        }

        auto sealed = key_.WithReadAccess([&](std::span<const uint8_t> key) {
            return Aead::Seal(suite_, key, nonce_, associated_data, plaintext);
        });
        if (sealed.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(sealed.UnwrapErr()));
        }
        auto ciphertext = std::move(sealed).Unwrap();
        if (ciphertext.IsErr()) {
            return ciphertext;
        }

        ++nonce_;
        if (auto after = AfterMessage(plaintext.size()); after.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(after).UnwrapErr());
        }
        return ciphertext;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> CipherState::Decrypt(
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> associated_data) {
        if (auto usable = EnsureUsable(); usable.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(usable).UnwrapErr());
        }

        auto opened = key_.WithReadAccess([&](std::span<const uint8_t> key) {
            return Aead::Open(suite_, key, nonce_, associated_data, ciphertext);
        });
        if (opened.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(opened.UnwrapErr()));
        }
        auto plaintext = std::move(opened).Unwrap();
        if (plaintext.IsErr()) {
            return plaintext;
        }

        ++nonce_;
        if (auto after = AfterMessage(plaintext.Unwrap().size()); after.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(after).UnwrapErr());
        }
        return plaintext;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> CipherState::DecryptAt(
        uint64_t nonce,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> associated_data) {
        if (auto usable = EnsureUsable(); usable.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(usable).UnwrapErr());
        }
        if (nonce != nonce_) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::UnexpectedMessage(
                    "Expected nonce " + std::to_string(nonce_) + ", got " + std::to_string(nonce)));
        }
        return Decrypt(ciphertext, associated_data);
    }

    Result<Unit, ProtocolFailure> CipherState::Rekey() {
        if (key_.IsInvalid()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::SessionClosed(std::string(ErrorMessages::CIPHER_STATE_DESTROYED)));
        }

        auto rekeyed = key_.WithWriteAccess([this](std::span<uint8_t> key) {
            std::array<uint8_t, kCipherKeyBytes> next{};
            auto result = Aead::Rekey(suite_, key, next);
            if (result.IsOk()) {
                std::copy(next.begin(), next.end(), key.begin());
            }
            sodium_memzero(next.data(), next.size());
            return result;
        });
        if (rekeyed.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(rekeyed.UnwrapErr()));
        }
        auto outcome = std::move(rekeyed).Unwrap();
        if (outcome.IsErr()) {
            return outcome;
        }

        nonce_ = 0;
        messages_under_key_ = 0;
        bytes_under_key_ = 0;
        ++rekey_count_;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> CipherState::AfterMessage(size_t plaintext_size) {
        ++messages_under_key_;
        bytes_under_key_ += plaintext_size;
        if (rekey_policy_.ShouldRekey(messages_under_key_, bytes_under_key_)) {
            return Rekey();
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    void CipherState::Destroy() noexcept {
        key_.Reset();
        messages_under_key_ = 0;
        bytes_under_key_ = 0;
    }

#ifdef XKWIRE_TEST_BUILD
    std::vector<uint8_t> CipherState::DebugKeyBytes() const {
        auto bytes = key_.ReadBytes(key_.Size());
        if (bytes.IsErr()) {
            return {};
        }
        return std::move(bytes).Unwrap();
    }
#endif

}
