#pragma once
#include "xkwire/configuration/rekey_policy.hpp"
#include "xkwire/core/failures.hpp"
#include "xkwire/core/result.hpp"
#include "xkwire/crypto/aead.hpp"
#include "xkwire/crypto/sodium_secure_memory_handle.hpp"
#include "xkwire/protocol/constants.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace xkwire::protocol {

/// One direction of a completed session: AEAD key plus its 64-bit nonce.
///
/// The nonce starts at 0 and moves by exactly one per successful Encrypt or
/// Decrypt. 2^64-1 is reserved for REKEY and never used for a message. A
/// failed Decrypt leaves the nonce where it was.
///
/// Not synchronised; SessionTransport serialises access per direction.
class CipherState {
public:
    [[nodiscard]] static Result<CipherState, ProtocolFailure> Create(
        crypto::CipherSuite suite,
        std::span<const uint8_t> key,
        configuration::RekeyPolicy rekey_policy = configuration::RekeyPolicy::Default());

    CipherState(CipherState&&) noexcept = default;
    CipherState& operator=(CipherState&&) noexcept = default;
    CipherState(const CipherState&) = delete;
    CipherState& operator=(const CipherState&) = delete;
    ~CipherState() = default;

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Encrypt(
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Decrypt(
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> associated_data = {});

    /// For carriers that transmit the counter: anything other than the
    /// expected nonce is UnexpectedMessage, checked before decrypting.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> DecryptAt(
        uint64_t nonce,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> associated_data = {});

    /// k = ENCRYPT(k, 2^64-1, "", zeros)[0..32], nonce back to 0.
    [[nodiscard]] Result<Unit, ProtocolFailure> Rekey();

    /// Zero the key now; every later call returns SessionClosed.
    void Destroy() noexcept;

    [[nodiscard]] bool IsDestroyed() const noexcept { return key_.IsInvalid(); }

    /// Constant-time key comparison; a destroyed state matches nothing.
    [[nodiscard]] bool SharesKeyWith(const CipherState& other) const noexcept {
        return key_.ContentEquals(other.key_);
    }
    [[nodiscard]] uint64_t Nonce() const noexcept { return nonce_; }
    [[nodiscard]] crypto::CipherSuite Suite() const noexcept { return suite_; }
    [[nodiscard]] uint64_t RekeyCount() const noexcept { return rekey_count_; }
    [[nodiscard]] uint64_t MessagesUnderKey() const noexcept { return messages_under_key_; }
    [[nodiscard]] uint64_t BytesUnderKey() const noexcept { return bytes_under_key_; }
    [[nodiscard]] const configuration::RekeyPolicy& GetRekeyPolicy() const noexcept { return rekey_policy_; }

#ifdef XKWIRE_TEST_BUILD
    [[nodiscard]] std::vector<uint8_t> DebugKeyBytes() const;
    void DebugSetNonce(uint64_t nonce) noexcept { nonce_ = nonce; }
#endif

private:
    CipherState(
        crypto::CipherSuite suite,
        crypto::SecureMemoryHandle key,
        configuration::RekeyPolicy rekey_policy);

    [[nodiscard]] Result<Unit, ProtocolFailure> EnsureUsable() const;
    [[nodiscard]] Result<Unit, ProtocolFailure> AfterMessage(size_t plaintext_size);

    crypto::CipherSuite suite_;
    crypto::SecureMemoryHandle key_;
    configuration::RekeyPolicy rekey_policy_;
    uint64_t nonce_ = 0;
    uint64_t rekey_count_ = 0;
    uint64_t messages_under_key_ = 0;
    uint64_t bytes_under_key_ = 0;
};

}  // namespace xkwire::protocol
