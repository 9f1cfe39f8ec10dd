#include "xkwire/protocol/handshake.hpp"
#include "xkwire/crypto/sodium_interop.hpp"
#include "xkwire/debug/key_logger.hpp"
#include "xkwire/security/validation/dh_validator.hpp"
#include <algorithm>
#include <optional>
#include <string>

namespace xkwire::protocol {
    using crypto::SecureMemoryHandle;
    using identity::KeyMaterial;
    using security::DhValidator;

    namespace detail {
        struct HandshakeContext {
            debug::Side side;
            configuration::SessionConfig config;
            KeyMaterial keys;
            SymmetricState symmetric;
            std::optional<models::EphemeralKeyPair> ephemeral;
            models::X25519PublicKey remote_ephemeral{};
            std::optional<models::X25519PublicKey> remote_static;
        };
    }

    namespace {
        using detail::HandshakeContext;
        using ContextPtr = std::unique_ptr<HandshakeContext>;

        constexpr size_t kEncryptedStaticBytes = kX25519PublicKeyBytes + kAeadTagBytes;

        template<typename T>
        Result<T, ProtocolFailure> Consumed(const char* transition) {
            return Result<T, ProtocolFailure>::Err(ProtocolFailure::UnexpectedMessage(
                std::string(transition) + " called on a consumed handshake state"));
        }

        Result<Unit, ProtocolFailure> CheckMessageLength(
            std::span<const uint8_t> message,
            size_t minimum,
            const char* which) {
            if (message.size() < minimum || message.size() > kMaxNoiseMessageBytes) {
                return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::UnexpectedMessage(
                    std::string(which) + " must be " + std::to_string(minimum) + ".." +
                    std::to_string(kMaxNoiseMessageBytes) + " bytes, got " +
                    std::to_string(message.size())));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<Unit, ProtocolFailure> CheckPayloadFits(
            std::span<const uint8_t> payload,
            size_t overhead) {
            if (payload.size() + overhead + kAeadTagBytes > kMaxNoiseMessageBytes) {
                return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                    "Handshake payload of " + std::to_string(payload.size()) +
                    " bytes exceeds the Noise message limit"));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        models::X25519PublicKey ToPublicKey(std::span<const uint8_t> bytes) {
            models::X25519PublicKey key{};
            std::copy_n(bytes.begin(), key.size(), key.begin());
            return key;
        }

        std::vector<uint8_t> Concat(std::span<const uint8_t> first, std::span<const uint8_t> second) {
            std::vector<uint8_t> out;
            out.reserve(first.size() + second.size());
            out.insert(out.end(), first.begin(), first.end());
            out.insert(out.end(), second.begin(), second.end());
            return out;
        }

        /// MixKey(DH(local_private, remote_public)); the shared secret is
        /// zeroed when `shared` goes out of scope.
        Result<Unit, ProtocolFailure> MixDh(
            HandshakeContext& context,
            const SecureMemoryHandle& local_private,
            std::span<const uint8_t> remote_public,
            const char* token) {
            auto dh_result = KeyMaterial::DiffieHellman(local_private, remote_public);
            if (dh_result.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(std::move(dh_result).UnwrapErr());
            }
            SecureMemoryHandle shared = std::move(dh_result).Unwrap();

            auto mixed = shared.WithReadAccess([&](std::span<const uint8_t> secret) {
                debug::LogDh(context.side, token, secret);
                return context.symmetric.MixKey(secret);
            });
            if (mixed.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::FromSodiumFailure(mixed.UnwrapErr()));
            }
            return std::move(mixed).Unwrap();
        }

        Result<Unit, ProtocolFailure> GenerateEphemeral(HandshakeContext& context) {
            auto ephemeral = KeyMaterial::NewEphemeral();
            if (ephemeral.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(std::move(ephemeral).UnwrapErr());
            }
            context.ephemeral.emplace(std::move(ephemeral).Unwrap());
            XKW_LOG_KEY(context.side, "EPHEMERAL", "e.pub", context.ephemeral->GetPublicKey());
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<ContextPtr, ProtocolFailure> BuildContext(
            debug::Side side,
            KeyMaterial keys,
            configuration::SessionConfig config,
            const models::X25519PublicKey& responder_static) {
            if (auto valid = config.Validate(); valid.IsErr()) {
                return Result<ContextPtr, ProtocolFailure>::Err(std::move(valid).UnwrapErr());
            }

            const std::string protocol_name = config.ProtocolName();
            debug::LogHandshakeStart(side, protocol_name);

            auto symmetric = SymmetricState::Initialize(protocol_name, config.GetCipherSuite());
            if (symmetric.IsErr()) {
                return Result<ContextPtr, ProtocolFailure>::Err(std::move(symmetric).UnwrapErr());
            }

            ContextPtr context(new HandshakeContext{
                side,
                std::move(config),
                std::move(keys),
                std::move(symmetric).Unwrap(),
                std::nullopt,
                {},
                std::nullopt});

            context->symmetric.MixHash(context->config.GetPrologue());
            context->symmetric.MixHash(responder_static);
            context->symmetric.Trace(side, "INIT");
            return Result<ContextPtr, ProtocolFailure>::Ok(std::move(context));
        }

        Result<HandshakeResult, ProtocolFailure> Complete(
            HandshakeContext& context,
            std::vector<uint8_t> payload) {
            if (!context.remote_static.has_value()) {
                return Result<HandshakeResult, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidState("Remote static key missing at Split"));
            }

            auto split = context.symmetric.Split(context.config.GetRekeyPolicy(), context.side);
            if (split.IsErr()) {
                return Result<HandshakeResult, ProtocolFailure>::Err(std::move(split).UnwrapErr());
            }
            auto [first, second] = std::move(split).Unwrap();
            context.ephemeral.reset();

            const bool initiator = context.side == debug::Side::Initiator;
            return Result<HandshakeResult, ProtocolFailure>::Ok(HandshakeResult{
                initiator ? std::move(first) : std::move(second),
                initiator ? std::move(second) : std::move(first),
                identity::RemoteIdentity(*context.remote_static),
                context.symmetric.GetHandshakeHash(),
                std::move(payload),
                context.config,
                context.side});
        }
    }

    // =========================================================================
    // Initiator
    // =========================================================================

    InitiatorHandshake::InitiatorHandshake(ContextPtr context)
        : context_(std::move(context)) {
    }
    InitiatorHandshake::InitiatorHandshake(InitiatorHandshake&&) noexcept = default;
    InitiatorHandshake& InitiatorHandshake::operator=(InitiatorHandshake&&) noexcept = default;
    InitiatorHandshake::~InitiatorHandshake() = default;

    Result<InitiatorHandshake, ProtocolFailure> InitiatorHandshake::Create(
        KeyMaterial keys,
        configuration::SessionConfig config) {
        if (!keys.HasLocalStatic()) {
            return Result<InitiatorHandshake, ProtocolFailure>::Err(
                ProtocolFailure::InvalidKeyMaterial("Local static key pair is required"));
        }
        const auto remote_static = keys.RemoteStatic();
        if (!remote_static.has_value()) {
            return Result<InitiatorHandshake, ProtocolFailure>::Err(
                ProtocolFailure::InvalidKeyMaterial(
                    "Initiator requires the responder's static public key"));
        }

        auto context = BuildContext(
            debug::Side::Initiator, std::move(keys), std::move(config), *remote_static);
        if (context.IsErr()) {
            return Result<InitiatorHandshake, ProtocolFailure>::Err(std::move(context).UnwrapErr());
        }
        auto built = std::move(context).Unwrap();
        built->remote_static = remote_static;
        return Result<InitiatorHandshake, ProtocolFailure>::Ok(InitiatorHandshake(std::move(built)));
    }

    Result<Outbound<InitiatorSentMessage1>, ProtocolFailure> InitiatorHandshake::WriteMessage1(
        std::span<const uint8_t> payload) && {
        using WriteResult = Result<Outbound<InitiatorSentMessage1>, ProtocolFailure>;

        ContextPtr context = std::move(context_);
        if (!context) {
            return Consumed<Outbound<InitiatorSentMessage1>>("WriteMessage1");
        }
        if (auto fits = CheckPayloadFits(payload, kX25519PublicKeyBytes); fits.IsErr()) {
            return WriteResult::Err(std::move(fits).UnwrapErr());
        }

        if (auto generated = GenerateEphemeral(*context); generated.IsErr()) {
            return WriteResult::Err(std::move(generated).UnwrapErr());
        }
        const auto e_pub = context->ephemeral->GetPublicKey();
        context->symmetric.MixHash(e_pub);

        if (auto es = MixDh(*context, context->ephemeral->GetPrivateKeyHandle(),
                            *context->remote_static, "es"); es.IsErr()) {
            return WriteResult::Err(std::move(es).UnwrapErr());
        }

        auto ciphertext = context->symmetric.EncryptAndHash(payload);
        if (ciphertext.IsErr()) {
            return WriteResult::Err(std::move(ciphertext).UnwrapErr());
        }
        context->symmetric.Trace(context->side, "MSG1 WRITE");

        std::vector<uint8_t> message = Concat(e_pub, ciphertext.Unwrap());
        return WriteResult::Ok(Outbound<InitiatorSentMessage1>{
            InitiatorSentMessage1(std::move(context)),
            std::move(message)});
    }

    InitiatorSentMessage1::InitiatorSentMessage1(ContextPtr context)
        : context_(std::move(context)) {
    }
    InitiatorSentMessage1::InitiatorSentMessage1(InitiatorSentMessage1&&) noexcept = default;
    InitiatorSentMessage1& InitiatorSentMessage1::operator=(InitiatorSentMessage1&&) noexcept = default;
    InitiatorSentMessage1::~InitiatorSentMessage1() = default;

    Result<InitiatorReceivedMessage2, ProtocolFailure> InitiatorSentMessage1::ReadMessage2(
        std::span<const uint8_t> message) && {
        using ReadResult = Result<InitiatorReceivedMessage2, ProtocolFailure>;

        ContextPtr context = std::move(context_);
        if (!context) {
            return Consumed<InitiatorReceivedMessage2>("ReadMessage2");
        }
        if (auto length = CheckMessageLength(message, kHandshakeMessage2Bytes, "Message 2");
            length.IsErr()) {
            return ReadResult::Err(std::move(length).UnwrapErr());
        }

        const auto re = message.first(kX25519PublicKeyBytes);
        context->remote_ephemeral = ToPublicKey(re);
        context->symmetric.MixHash(re);

        if (auto ee = MixDh(*context, context->ephemeral->GetPrivateKeyHandle(), re, "ee");
            ee.IsErr()) {
            return ReadResult::Err(std::move(ee).UnwrapErr());
        }

        auto payload = context->symmetric.DecryptAndHash(message.subspan(kX25519PublicKeyBytes));
        if (payload.IsErr()) {
            return ReadResult::Err(std::move(payload).UnwrapErr());
        }
        context->symmetric.Trace(context->side, "MSG2 READ");

        return ReadResult::Ok(InitiatorReceivedMessage2(std::move(context), std::move(payload).Unwrap()));
    }

    InitiatorReceivedMessage2::InitiatorReceivedMessage2(
        ContextPtr context,
        std::vector<uint8_t> payload)
        : context_(std::move(context))
        , payload_(std::move(payload)) {
    }
    InitiatorReceivedMessage2::InitiatorReceivedMessage2(InitiatorReceivedMessage2&&) noexcept = default;
    InitiatorReceivedMessage2& InitiatorReceivedMessage2::operator=(InitiatorReceivedMessage2&&) noexcept = default;
    InitiatorReceivedMessage2::~InitiatorReceivedMessage2() = default;

    Result<Outbound<HandshakeResult>, ProtocolFailure> InitiatorReceivedMessage2::WriteMessage3(
        std::span<const uint8_t> payload) && {
        using WriteResult = Result<Outbound<HandshakeResult>, ProtocolFailure>;

        ContextPtr context = std::move(context_);
        if (!context) {
            return Consumed<Outbound<HandshakeResult>>("WriteMessage3");
        }
        if (auto fits = CheckPayloadFits(payload, kEncryptedStaticBytes); fits.IsErr()) {
            return WriteResult::Err(std::move(fits).UnwrapErr());
        }

        const auto& local_static = context->keys.LocalStatic();
        auto encrypted_static = context->symmetric.EncryptAndHash(local_static.GetPublicKey());
        if (encrypted_static.IsErr()) {
            return WriteResult::Err(std::move(encrypted_static).UnwrapErr());
        }

        if (auto se = MixDh(*context, local_static.GetPrivateKeyHandle(),
                            context->remote_ephemeral, "se"); se.IsErr()) {
            return WriteResult::Err(std::move(se).UnwrapErr());
        }

        auto ciphertext = context->symmetric.EncryptAndHash(payload);
        if (ciphertext.IsErr()) {
            return WriteResult::Err(std::move(ciphertext).UnwrapErr());
        }
        context->symmetric.Trace(context->side, "MSG3 WRITE");

        std::vector<uint8_t> message = Concat(encrypted_static.Unwrap(), ciphertext.Unwrap());
        auto result = Complete(*context, std::move(payload_));
        if (result.IsErr()) {
            return WriteResult::Err(std::move(result).UnwrapErr());
        }
        return WriteResult::Ok(Outbound<HandshakeResult>{
            std::move(result).Unwrap(),
            std::move(message)});
    }

    // =========================================================================
    // Responder
    // =========================================================================

    ResponderHandshake::ResponderHandshake(ContextPtr context)
        : context_(std::move(context)) {
    }
    ResponderHandshake::ResponderHandshake(ResponderHandshake&&) noexcept = default;
    ResponderHandshake& ResponderHandshake::operator=(ResponderHandshake&&) noexcept = default;
    ResponderHandshake::~ResponderHandshake() = default;

    Result<ResponderHandshake, ProtocolFailure> ResponderHandshake::Create(
        KeyMaterial keys,
        configuration::SessionConfig config) {
        if (!keys.HasLocalStatic()) {
            return Result<ResponderHandshake, ProtocolFailure>::Err(
                ProtocolFailure::InvalidKeyMaterial("Local static key pair is required"));
        }
        const auto local_public = keys.LocalStatic().GetPublicKeyArray();
        auto context = BuildContext(
            debug::Side::Responder, std::move(keys), std::move(config), local_public);
        if (context.IsErr()) {
            return Result<ResponderHandshake, ProtocolFailure>::Err(std::move(context).UnwrapErr());
        }
        return Result<ResponderHandshake, ProtocolFailure>::Ok(
            ResponderHandshake(std::move(context).Unwrap()));
    }

    Result<ResponderReceivedMessage1, ProtocolFailure> ResponderHandshake::ReadMessage1(
        std::span<const uint8_t> message) && {
        using ReadResult = Result<ResponderReceivedMessage1, ProtocolFailure>;

        ContextPtr context = std::move(context_);
        if (!context) {
            return Consumed<ResponderReceivedMessage1>("ReadMessage1");
        }
        if (auto length = CheckMessageLength(message, kHandshakeMessage1Bytes, "Message 1");
            length.IsErr()) {
            return ReadResult::Err(std::move(length).UnwrapErr());
        }

        const auto re = message.first(kX25519PublicKeyBytes);
        context->remote_ephemeral = ToPublicKey(re);
        context->symmetric.MixHash(re);

        if (auto es = MixDh(*context, context->keys.LocalStatic().GetPrivateKeyHandle(), re, "es");
            es.IsErr()) {
            return ReadResult::Err(std::move(es).UnwrapErr());
        }

        auto payload = context->symmetric.DecryptAndHash(message.subspan(kX25519PublicKeyBytes));
        if (payload.IsErr()) {
            return ReadResult::Err(std::move(payload).UnwrapErr());
        }
        context->symmetric.Trace(context->side, "MSG1 READ");

        return ReadResult::Ok(ResponderReceivedMessage1(std::move(context), std::move(payload).Unwrap()));
    }

    ResponderReceivedMessage1::ResponderReceivedMessage1(
        ContextPtr context,
        std::vector<uint8_t> payload)
        : context_(std::move(context))
        , payload_(std::move(payload)) {
    }
    ResponderReceivedMessage1::ResponderReceivedMessage1(ResponderReceivedMessage1&&) noexcept = default;
    ResponderReceivedMessage1& ResponderReceivedMessage1::operator=(ResponderReceivedMessage1&&) noexcept = default;
    ResponderReceivedMessage1::~ResponderReceivedMessage1() = default;

    Result<Outbound<ResponderSentMessage2>, ProtocolFailure> ResponderReceivedMessage1::WriteMessage2(
        std::span<const uint8_t> payload) && {
        using WriteResult = Result<Outbound<ResponderSentMessage2>, ProtocolFailure>;

        ContextPtr context = std::move(context_);
        if (!context) {
            return Consumed<Outbound<ResponderSentMessage2>>("WriteMessage2");
        }
        if (auto fits = CheckPayloadFits(payload, kX25519PublicKeyBytes); fits.IsErr()) {
            return WriteResult::Err(std::move(fits).UnwrapErr());
        }

        if (auto generated = GenerateEphemeral(*context); generated.IsErr()) {
            return WriteResult::Err(std::move(generated).UnwrapErr());
        }
        const auto e_pub = context->ephemeral->GetPublicKey();
        context->symmetric.MixHash(e_pub);

        if (auto ee = MixDh(*context, context->ephemeral->GetPrivateKeyHandle(),
                            context->remote_ephemeral, "ee"); ee.IsErr()) {
            return WriteResult::Err(std::move(ee).UnwrapErr());
        }

        auto ciphertext = context->symmetric.EncryptAndHash(payload);
        if (ciphertext.IsErr()) {
            return WriteResult::Err(std::move(ciphertext).UnwrapErr());
        }
        context->symmetric.Trace(context->side, "MSG2 WRITE");

        std::vector<uint8_t> message = Concat(e_pub, ciphertext.Unwrap());
        return WriteResult::Ok(Outbound<ResponderSentMessage2>{
            ResponderSentMessage2(std::move(context)),
            std::move(message)});
    }

    ResponderSentMessage2::ResponderSentMessage2(ContextPtr context)
        : context_(std::move(context)) {
    }
    ResponderSentMessage2::ResponderSentMessage2(ResponderSentMessage2&&) noexcept = default;
    ResponderSentMessage2& ResponderSentMessage2::operator=(ResponderSentMessage2&&) noexcept = default;
    ResponderSentMessage2::~ResponderSentMessage2() = default;

    Result<HandshakeResult, ProtocolFailure> ResponderSentMessage2::ReadMessage3(
        std::span<const uint8_t> message) && {
        using ReadResult = Result<HandshakeResult, ProtocolFailure>;

        ContextPtr context = std::move(context_);
        if (!context) {
            return Consumed<HandshakeResult>("ReadMessage3");
        }
        if (auto length = CheckMessageLength(message, kHandshakeMessage3Bytes, "Message 3");
            length.IsErr()) {
            return ReadResult::Err(std::move(length).UnwrapErr());
        }

        auto remote_static = context->symmetric.DecryptAndHash(message.first(kEncryptedStaticBytes));
        if (remote_static.IsErr()) {
            return ReadResult::Err(std::move(remote_static).UnwrapErr());
        }
        if (auto valid = DhValidator::ValidateX25519PublicKey(remote_static.Unwrap()); valid.IsErr()) {
            return ReadResult::Err(std::move(valid).UnwrapErr());
        }
        context->remote_static = ToPublicKey(remote_static.Unwrap());

        if (auto se = MixDh(*context, context->ephemeral->GetPrivateKeyHandle(),
                            *context->remote_static, "se"); se.IsErr()) {
            return ReadResult::Err(std::move(se).UnwrapErr());
        }

        auto payload = context->symmetric.DecryptAndHash(message.subspan(kEncryptedStaticBytes));
        if (payload.IsErr()) {
            return ReadResult::Err(std::move(payload).UnwrapErr());
        }
        context->symmetric.Trace(context->side, "MSG3 READ");

        return Complete(*context, std::move(payload).Unwrap());
    }

}
