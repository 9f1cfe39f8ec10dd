#pragma once
#include "xkwire/configuration/rekey_policy.hpp"
#include "xkwire/core/failures.hpp"
#include "xkwire/core/result.hpp"
#include "xkwire/crypto/aead.hpp"
#include "xkwire/crypto/sodium_secure_memory_handle.hpp"
#include "xkwire/debug/key_logger.hpp"
#include "xkwire/protocol/cipher_state.hpp"
#include "xkwire/protocol/constants.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace xkwire::protocol {

using HandshakeHash = std::array<uint8_t, kHashBytes>;

/// Noise SymmetricState: running transcript hash h, chaining key ck and the
/// handshake cipher key k with its nonce.
///
/// ck and k live in secure memory. h is wiped on destruction.
class SymmetricState {
public:
    /// h = protocol name padded to 32 bytes (or hashed when longer), ck = h.
    [[nodiscard]] static Result<SymmetricState, ProtocolFailure> Initialize(
        std::string_view protocol_name,
        crypto::CipherSuite suite);

    SymmetricState(SymmetricState&& other) noexcept;
    SymmetricState& operator=(SymmetricState&& other) noexcept;
    SymmetricState(const SymmetricState&) = delete;
    SymmetricState& operator=(const SymmetricState&) = delete;
    ~SymmetricState();

    void MixHash(std::span<const uint8_t> data);

    /// (ck, k) = HKDF(ck, input_key_material); handshake nonce back to 0.
    [[nodiscard]] Result<Unit, ProtocolFailure> MixKey(std::span<const uint8_t> input_key_material);

    /// Encrypts with AD = h once a key exists, plaintext passthrough before.
    /// The output is mixed into h either way.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> EncryptAndHash(
        std::span<const uint8_t> plaintext);

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> DecryptAndHash(
        std::span<const uint8_t> ciphertext);

    /// (k1, k2) = HKDF(ck, ""). Wipes ck and k afterwards. `side` only
    /// labels the debug trace.
    [[nodiscard]] Result<std::pair<CipherState, CipherState>, ProtocolFailure> Split(
        configuration::RekeyPolicy rekey_policy,
        debug::Side side = debug::Side::Unknown);

    [[nodiscard]] const HandshakeHash& GetHandshakeHash() const noexcept { return h_; }
    [[nodiscard]] bool HasKey() const noexcept { return has_key_; }
    [[nodiscard]] crypto::CipherSuite Suite() const noexcept { return suite_; }

    void Trace(debug::Side side, const char* step) const;

private:
    SymmetricState(
        crypto::CipherSuite suite,
        const HandshakeHash& h,
        crypto::SecureMemoryHandle chaining_key,
        crypto::SecureMemoryHandle cipher_key);

    void Wipe() noexcept;

    crypto::CipherSuite suite_;
    HandshakeHash h_{};
    crypto::SecureMemoryHandle ck_;
    crypto::SecureMemoryHandle k_;
    bool has_key_ = false;
    uint64_t n_ = 0;
};

}  // namespace xkwire::protocol
