#include "xkwire/protocol/symmetric_state.hpp"
#include "xkwire/crypto/hkdf.hpp"
#include "xkwire/crypto/sodium_interop.hpp"
#include <algorithm>
#include <string>

namespace xkwire::protocol {
    using crypto::Aead;
    using crypto::Hkdf;
    using crypto::SecureMemoryHandle;
    using crypto::SodiumInterop;

    namespace {
        template<size_t N>
        void WipeArray(std::array<uint8_t, N>& bytes) noexcept {
            sodium_memzero(bytes.data(), bytes.size());
        }

        std::span<const uint8_t> AsBytes(std::string_view text) noexcept {
            return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
        }
    }

    SymmetricState::SymmetricState(
        crypto::CipherSuite suite,
        const HandshakeHash& h,
        SecureMemoryHandle chaining_key,
        SecureMemoryHandle cipher_key)
        : suite_(suite)
        , h_(h)
        , ck_(std::move(chaining_key))
        , k_(std::move(cipher_key)) {
    }

    SymmetricState::SymmetricState(SymmetricState&& other) noexcept
        : suite_(other.suite_)
        , h_(other.h_)
        , ck_(std::move(other.ck_))
        , k_(std::move(other.k_))
        , has_key_(other.has_key_)
        , n_(other.n_) {
        other.Wipe();
    }

    SymmetricState& SymmetricState::operator=(SymmetricState&& other) noexcept {
        if (this != &other) {
            Wipe();
            suite_ = other.suite_;
            h_ = other.h_;
            ck_ = std::move(other.ck_);
            k_ = std::move(other.k_);
            has_key_ = other.has_key_;
            n_ = other.n_;
            other.Wipe();
        }
        return *this;
    }

    SymmetricState::~SymmetricState() {
        Wipe();
    }

    void SymmetricState::Wipe() noexcept {
        WipeArray(h_);
        ck_.Reset();
        k_.Reset();
        has_key_ = false;
        n_ = 0;
    }

    Result<SymmetricState, ProtocolFailure> SymmetricState::Initialize(
        std::string_view protocol_name,
        crypto::CipherSuite suite) {
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<SymmetricState, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(init.UnwrapErr()));
        }
        if (protocol_name.empty()) {
            return Result<SymmetricState, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Protocol name must not be empty"));
        }

        HandshakeHash h{};
        if (protocol_name.size() <= h.size()) {
            std::copy(protocol_name.begin(), protocol_name.end(), h.begin());
        } else {
            h = SodiumInterop::Sha256(AsBytes(protocol_name));
        }

        auto ck_result = SecureMemoryHandle::FromBytes(h);
        if (ck_result.IsErr()) {
            return Result<SymmetricState, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(ck_result.UnwrapErr()));
        }
        auto k_result = SecureMemoryHandle::Allocate(kCipherKeyBytes);
        if (k_result.IsErr()) {
            return Result<SymmetricState, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(k_result.UnwrapErr()));
        }

        return Result<SymmetricState, ProtocolFailure>::Ok(SymmetricState(
            suite, h, std::move(ck_result).Unwrap(), std::move(k_result).Unwrap()));
    }

    void SymmetricState::MixHash(std::span<const uint8_t> data) {
        h_ = SodiumInterop::Sha256(h_, data);
    }

    Result<Unit, ProtocolFailure> SymmetricState::MixKey(std::span<const uint8_t> input_key_material) {
        std::array<uint8_t, kHashBytes> next_ck{};
        std::array<uint8_t, kCipherKeyBytes> next_k{};

        auto derived = ck_.WithReadAccess([&](std::span<const uint8_t> ck) {
            return Hkdf::NoiseDerive(ck, input_key_material, next_ck, next_k);
        });
        if (derived.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(derived.UnwrapErr()));
        }
        if (auto outcome = std::move(derived).Unwrap(); outcome.IsErr()) {
            WipeArray(next_ck);
            WipeArray(next_k);
            return outcome;
        }

        auto ck_written = ck_.Write(next_ck);
        auto k_written = k_.Write(next_k);
        WipeArray(next_ck);
        WipeArray(next_k);
        if (ck_written.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(ck_written.UnwrapErr()));
        }
        if (k_written.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(k_written.UnwrapErr()));
        }

        has_key_ = true;
        n_ = 0;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::vector<uint8_t>, ProtocolFailure> SymmetricState::EncryptAndHash(
        std::span<const uint8_t> plaintext) {
        if (!has_key_) {
            std::vector<uint8_t> passthrough(plaintext.begin(), plaintext.end());
            MixHash(passthrough);
            return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(passthrough));
        }
        if (n_ > kMaxMessageNonce) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::NonceExhausted("Handshake nonce exhausted"));
        }

        auto sealed = k_.WithReadAccess([&](std::span<const uint8_t> key) {
            return Aead::Seal(suite_, key, n_, h_, plaintext);
        });
        if (sealed.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(sealed.UnwrapErr()));
        }
        auto ciphertext = std::move(sealed).Unwrap();
        if (ciphertext.IsErr()) {
            return ciphertext;
        }

        ++n_;
        MixHash(ciphertext.Unwrap());
        return ciphertext;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> SymmetricState::DecryptAndHash(
        std::span<const uint8_t> ciphertext) {
        if (!has_key_) {
            std::vector<uint8_t> passthrough(ciphertext.begin(), ciphertext.end());
            MixHash(ciphertext);
            return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(passthrough));
        }
        if (n_ > kMaxMessageNonce) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::NonceExhausted("Handshake nonce exhausted"));
        }

        auto opened = k_.WithReadAccess([&](std::span<const uint8_t> key) {
            return Aead::Open(suite_, key, n_, h_, ciphertext);
        });
        if (opened.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(opened.UnwrapErr()));
        }
        auto plaintext = std::move(opened).Unwrap();
        if (plaintext.IsErr()) {
            return plaintext;
        }

        ++n_;
        MixHash(ciphertext);
        return plaintext;
    }

    Result<std::pair<CipherState, CipherState>, ProtocolFailure> SymmetricState::Split(
        configuration::RekeyPolicy rekey_policy,
        debug::Side side) {
        using SplitResult = Result<std::pair<CipherState, CipherState>, ProtocolFailure>;

        std::array<uint8_t, kCipherKeyBytes> k1{};
        std::array<uint8_t, kCipherKeyBytes> k2{};

        auto derived = ck_.WithReadAccess([&](std::span<const uint8_t> ck) {
            return Hkdf::NoiseDerive(ck, {}, k1, k2);
        });
        if (derived.IsErr()) {
            return SplitResult::Err(ProtocolFailure::FromSodiumFailure(derived.UnwrapErr()));
        }
        if (auto outcome = std::move(derived).Unwrap(); outcome.IsErr()) {
            WipeArray(k1);
            WipeArray(k2);
            return SplitResult::Err(std::move(outcome).UnwrapErr());
        }

        if (side == debug::Side::Responder) {
            debug::LogSplit(side, k2, k1, h_);
        } else {
            debug::LogSplit(side, k1, k2, h_);
        }

        auto first = CipherState::Create(suite_, k1, rekey_policy);
        auto second = CipherState::Create(suite_, k2, rekey_policy);
        WipeArray(k1);
        WipeArray(k2);
        ck_.Reset();
        k_.Reset();
        has_key_ = false;

        if (first.IsErr()) {
            return SplitResult::Err(std::move(first).UnwrapErr());
        }
        if (second.IsErr()) {
            return SplitResult::Err(std::move(second).UnwrapErr());
        }
        return SplitResult::Ok(std::make_pair(std::move(first).Unwrap(), std::move(second).Unwrap()));
    }

    void SymmetricState::Trace(debug::Side side, const char* step) const {
#ifdef XKWIRE_DEBUG_KEYS
        auto traced = ck_.WithReadAccess([&](std::span<const uint8_t> ck) {
            debug::LogHandshakeStep(side, step, h_, ck);
            return unit;
        });
        if (traced.IsErr()) {
            XKW_LOG_MSG(side, step, "chaining key already wiped");
        }
#else
        (void)side;
        (void)step;
#endif
    }

}
