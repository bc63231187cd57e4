#include "vortex/serialization/wire_codec.hpp"
#include "vortex/protocol/constants.hpp"
#include "json_support.hpp"
#include "protocol/wire.pb.h"
#include <type_traits>

namespace vortex::protocol::serialization {
    using detail::DecodeBytes;
    using detail::DecodeOptionalBytes;
    using detail::EncodeBytes;
    using detail::ParseJson;
    using detail::PrintJson;
    namespace proto = vortex::proto::protocol;

    namespace {
        void ToProto(const models::PreKeyBundle& bundle, proto::PreKeyBundle* out) {
            out->set_identity_key(EncodeBytes(bundle.identity_key));
            out->set_signed_pre_key(EncodeBytes(bundle.signed_pre_key));
            out->set_signed_pre_key_sig(EncodeBytes(bundle.signed_pre_key_signature));
            if (bundle.one_time_pre_key.has_value()) {
                out->set_one_time_pre_key(EncodeBytes(*bundle.one_time_pre_key));
            }
            out->set_registration_id(bundle.registration_id);
            if (bundle.signing_key.has_value()) {
                out->set_signing_key(EncodeBytes(*bundle.signing_key));
            }
            if (bundle.signed_pre_key_id.has_value()) {
                out->set_signed_pre_key_id(*bundle.signed_pre_key_id);
            }
            if (bundle.one_time_pre_key_id.has_value()) {
                out->set_one_time_pre_key_id(*bundle.one_time_pre_key_id);
            }
        }

        Result<models::PreKeyBundle, ProtocolFailure> FromProto(const proto::PreKeyBundle& in) {
            using R = Result<models::PreKeyBundle, ProtocolFailure>;
            models::PreKeyBundle bundle;
            auto identity_key = DecodeBytes(in.identity_key(), kX25519PublicKeyBytes, "identityKey");
            if (identity_key.IsErr()) {
                return R::Err(std::move(identity_key).UnwrapErr());
            }
            auto signed_pre_key = DecodeBytes(in.signed_pre_key(), kX25519PublicKeyBytes, "signedPreKey");
            if (signed_pre_key.IsErr()) {
                return R::Err(std::move(signed_pre_key).UnwrapErr());
            }
            auto signature = DecodeBytes(in.signed_pre_key_sig(), kEd25519SignatureBytes, "signedPreKeySig");
            if (signature.IsErr()) {
                return R::Err(std::move(signature).UnwrapErr());
            }
            auto one_time = DecodeOptionalBytes(
                in.has_one_time_pre_key(), in.one_time_pre_key(), kX25519PublicKeyBytes, "oneTimePreKey");
            if (one_time.IsErr()) {
                return R::Err(std::move(one_time).UnwrapErr());
            }
            auto signing_key = DecodeOptionalBytes(
                in.has_signing_key(), in.signing_key(), kEd25519PublicKeyBytes, "signingKey");
            if (signing_key.IsErr()) {
                return R::Err(std::move(signing_key).UnwrapErr());
            }
            bundle.identity_key = std::move(identity_key).Unwrap();
            bundle.signed_pre_key = std::move(signed_pre_key).Unwrap();
            bundle.signed_pre_key_signature = std::move(signature).Unwrap();
            bundle.one_time_pre_key = std::move(one_time).Unwrap();
            bundle.registration_id = in.registration_id();
            bundle.signing_key = std::move(signing_key).Unwrap();
            if (in.has_signed_pre_key_id()) {
                bundle.signed_pre_key_id = in.signed_pre_key_id();
            }
            if (in.has_one_time_pre_key_id() && bundle.one_time_pre_key.has_value()) {
                bundle.one_time_pre_key_id = in.one_time_pre_key_id();
            }
            return R::Ok(std::move(bundle));
        }

        void ToProto(const models::HandshakeInit& handshake, proto::HandshakeInit* out) {
            out->set_identity_key(EncodeBytes(handshake.identity_key));
            out->set_ephemeral_key(EncodeBytes(handshake.ephemeral_key));
            if (handshake.one_time_pre_key.has_value()) {
                out->set_one_time_pre_key(EncodeBytes(*handshake.one_time_pre_key));
            }
            if (handshake.signed_pre_key_id.has_value()) {
                out->set_signed_pre_key_id(*handshake.signed_pre_key_id);
            }
            out->set_registration_id(handshake.registration_id);
        }

        Result<models::HandshakeInit, ProtocolFailure> FromProto(const proto::HandshakeInit& in) {
            using R = Result<models::HandshakeInit, ProtocolFailure>;
            auto identity_key = DecodeBytes(in.identity_key(), kX25519PublicKeyBytes, "identityKey");
            if (identity_key.IsErr()) {
                return R::Err(std::move(identity_key).UnwrapErr());
            }
            auto ephemeral_key = DecodeBytes(in.ephemeral_key(), kX25519PublicKeyBytes, "ephemeralKey");
            if (ephemeral_key.IsErr()) {
                return R::Err(std::move(ephemeral_key).UnwrapErr());
            }
            auto one_time = DecodeOptionalBytes(
                in.has_one_time_pre_key(), in.one_time_pre_key(), kX25519PublicKeyBytes, "oneTimePreKey");
            if (one_time.IsErr()) {
                return R::Err(std::move(one_time).UnwrapErr());
            }
            models::HandshakeInit handshake;
            handshake.identity_key = std::move(identity_key).Unwrap();
            handshake.ephemeral_key = std::move(ephemeral_key).Unwrap();
            handshake.one_time_pre_key = std::move(one_time).Unwrap();
            if (in.has_signed_pre_key_id()) {
                handshake.signed_pre_key_id = in.signed_pre_key_id();
            }
            handshake.registration_id = in.registration_id();
            return R::Ok(std::move(handshake));
        }

        void ToProto(const models::EncryptedMessage& message, proto::EncryptedMessage* out) {
            auto* header = out->mutable_header();
            header->set_dh(EncodeBytes(message.header.dh));
            header->set_pn(message.header.pn);
            header->set_n(message.header.n);
            out->set_header_cipher(EncodeBytes(message.header_cipher));
            out->set_header_nonce(EncodeBytes(message.header_nonce));
            out->set_ciphertext(EncodeBytes(message.ciphertext));
            out->set_nonce(EncodeBytes(message.nonce));
        }

        Result<models::EncryptedMessage, ProtocolFailure> FromProto(const proto::EncryptedMessage& in) {
            using R = Result<models::EncryptedMessage, ProtocolFailure>;
            if (!in.has_header()) {
                return R::Err(ProtocolFailure::Decode("Field 'header' is missing"));
            }
            auto dh = DecodeBytes(in.header().dh(), kX25519PublicKeyBytes, "header.dh");
            if (dh.IsErr()) {
                return R::Err(std::move(dh).UnwrapErr());
            }
            auto header_cipher = DecodeBytes(in.header_cipher(), 0, "headerCipher");
            if (header_cipher.IsErr()) {
                return R::Err(std::move(header_cipher).UnwrapErr());
            }
            auto header_nonce = DecodeBytes(in.header_nonce(), kAeadNonceBytes, "headerNonce");
            if (header_nonce.IsErr()) {
                return R::Err(std::move(header_nonce).UnwrapErr());
            }
            auto ciphertext = DecodeBytes(in.ciphertext(), 0, "ciphertext");
            if (ciphertext.IsErr()) {
                return R::Err(std::move(ciphertext).UnwrapErr());
            }
            auto nonce = DecodeBytes(in.nonce(), kAeadNonceBytes, "nonce");
            if (nonce.IsErr()) {
                return R::Err(std::move(nonce).UnwrapErr());
            }
            models::EncryptedMessage message;
            message.header.dh = std::move(dh).Unwrap();
            message.header.pn = in.header().pn();
            message.header.n = in.header().n();
            message.header_cipher = std::move(header_cipher).Unwrap();
            message.header_nonce = std::move(header_nonce).Unwrap();
            message.ciphertext = std::move(ciphertext).Unwrap();
            message.nonce = std::move(nonce).Unwrap();
            return R::Ok(std::move(message));
        }

        template<typename Model, typename Proto>
        Result<Model, ProtocolFailure> DecodeDocument(std::string_view json) {
            Proto document;
            if (auto parsed = ParseJson(json, &document, true); parsed.IsErr()) {
                return Result<Model, ProtocolFailure>::Err(std::move(parsed).UnwrapErr());
            }
            return FromProto(document);
        }

        template<typename Model, typename Proto>
        Result<std::string, ProtocolFailure> EncodeDocument(const Model& model) {
            Proto document;
            ToProto(model, &document);
            return PrintJson(document);
        }
    }

    Result<std::string, ProtocolFailure> WireCodec::EncodePreKeyBundle(const models::PreKeyBundle& bundle) {
        return EncodeDocument<models::PreKeyBundle, proto::PreKeyBundle>(bundle);
    }

    Result<models::PreKeyBundle, ProtocolFailure> WireCodec::DecodePreKeyBundle(std::string_view json) {
        return DecodeDocument<models::PreKeyBundle, proto::PreKeyBundle>(json);
    }

    Result<std::string, ProtocolFailure> WireCodec::EncodeHandshakeInit(const models::HandshakeInit& handshake) {
        return EncodeDocument<models::HandshakeInit, proto::HandshakeInit>(handshake);
    }

    Result<models::HandshakeInit, ProtocolFailure> WireCodec::DecodeHandshakeInit(std::string_view json) {
        return DecodeDocument<models::HandshakeInit, proto::HandshakeInit>(json);
    }

    Result<std::string, ProtocolFailure> WireCodec::EncodeEncryptedMessage(
        const models::EncryptedMessage& message) {
        return EncodeDocument<models::EncryptedMessage, proto::EncryptedMessage>(message);
    }

    Result<models::EncryptedMessage, ProtocolFailure> WireCodec::DecodeEncryptedMessage(std::string_view json) {
        return DecodeDocument<models::EncryptedMessage, proto::EncryptedMessage>(json);
    }

    Result<std::string, ProtocolFailure> WireCodec::EncodeEnvelope(const WireMessage& message) {
        proto::WireEnvelope envelope;
        std::visit([&envelope](const auto& body) {
            using T = std::decay_t<decltype(body)>;
            if constexpr (std::is_same_v<T, models::PreKeyBundle>) {
                envelope.set_kind(proto::WIRE_MESSAGE_KIND_PRE_KEY_BUNDLE);
                ToProto(body, envelope.mutable_pre_key_bundle());
            } else if constexpr (std::is_same_v<T, models::HandshakeInit>) {
                envelope.set_kind(proto::WIRE_MESSAGE_KIND_HANDSHAKE_INIT);
                ToProto(body, envelope.mutable_handshake_init());
            } else {
                static_assert(std::is_same_v<T, models::EncryptedMessage>, "Unhandled wire message");
                envelope.set_kind(proto::WIRE_MESSAGE_KIND_ENCRYPTED_MESSAGE);
                ToProto(body, envelope.mutable_encrypted_message());
            }
        }, message);
        return PrintJson(envelope);
    }

    Result<WireMessage, ProtocolFailure> WireCodec::DecodeEnvelope(std::string_view json) {
        using R = Result<WireMessage, ProtocolFailure>;
        proto::WireEnvelope envelope;
        if (auto parsed = ParseJson(json, &envelope, true); parsed.IsErr()) {
            return R::Err(std::move(parsed).UnwrapErr());
        }
        switch (envelope.kind()) {
            case proto::WIRE_MESSAGE_KIND_PRE_KEY_BUNDLE:
                if (envelope.body_case() != proto::WireEnvelope::kPreKeyBundle) {
                    break;
                }
                return FromProto(envelope.pre_key_bundle()).Map([](models::PreKeyBundle b) {
                    return WireMessage(std::move(b));
                });
            case proto::WIRE_MESSAGE_KIND_HANDSHAKE_INIT:
                if (envelope.body_case() != proto::WireEnvelope::kHandshakeInit) {
                    break;
                }
                return FromProto(envelope.handshake_init()).Map([](models::HandshakeInit h) {
                    return WireMessage(std::move(h));
                });
            case proto::WIRE_MESSAGE_KIND_ENCRYPTED_MESSAGE:
                if (envelope.body_case() != proto::WireEnvelope::kEncryptedMessage) {
                    break;
                }
                return FromProto(envelope.encrypted_message()).Map([](models::EncryptedMessage m) {
                    return WireMessage(std::move(m));
                });
            default:
                return R::Err(ProtocolFailure::Decode("Unknown wire message kind"));
        }
        return R::Err(ProtocolFailure::Decode("Wire message body does not match its kind"));
    }

    WireMessageKind WireCodec::KindOf(const WireMessage& message) noexcept {
        switch (message.index()) {
            case 0: return WireMessageKind::PreKeyBundle;
            case 1: return WireMessageKind::HandshakeInit;
            default: return WireMessageKind::EncryptedMessage;
        }
    }
}
