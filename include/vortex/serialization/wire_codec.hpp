#pragma once
#include "vortex/core/result.hpp"
#include "vortex/core/failures.hpp"
#include "vortex/models/bundles/pre_key_bundle.hpp"
#include "vortex/models/messages/encrypted_message.hpp"
#include "vortex/models/messages/handshake_init.hpp"
#include <string>
#include <string_view>
#include <variant>

namespace vortex::protocol::serialization {

enum class WireMessageKind {
    PreKeyBundle,
    HandshakeInit,
    EncryptedMessage
};

using WireMessage = std::variant<models::PreKeyBundle, models::HandshakeInit, models::EncryptedMessage>;

/**
 * JSON wire format exchanged with the transport.
 *
 * Byte fields are unpadded base64url strings. Field names are camelCase:
 *
 * ```json
 * {"identityKey":"...","signedPreKey":"...","signedPreKeySig":"...",
 *  "oneTimePreKey":"...","registrationId":1234}
 *
 * {"header":{"dh":"...","pn":0,"n":3},"headerCipher":"...","headerNonce":"...",
 *  "ciphertext":"...","nonce":"..."}
 * ```
 *
 * Decoding checks every key, signature and nonce length and ignores
 * unknown fields so that newer peers can add fields.
 */
class WireCodec {
public:
    [[nodiscard]] static Result<std::string, ProtocolFailure> EncodePreKeyBundle(
        const models::PreKeyBundle& bundle);
    [[nodiscard]] static Result<models::PreKeyBundle, ProtocolFailure> DecodePreKeyBundle(
        std::string_view json);

    [[nodiscard]] static Result<std::string, ProtocolFailure> EncodeHandshakeInit(
        const models::HandshakeInit& handshake);
    [[nodiscard]] static Result<models::HandshakeInit, ProtocolFailure> DecodeHandshakeInit(
        std::string_view json);

    [[nodiscard]] static Result<std::string, ProtocolFailure> EncodeEncryptedMessage(
        const models::EncryptedMessage& message);
    [[nodiscard]] static Result<models::EncryptedMessage, ProtocolFailure> DecodeEncryptedMessage(
        std::string_view json);

    /// {"kind": "WIRE_MESSAGE_KIND_...", "<body field>": {...}}
    [[nodiscard]] static Result<std::string, ProtocolFailure> EncodeEnvelope(const WireMessage& message);

    /// Fails when the declared kind and the body present disagree.
    [[nodiscard]] static Result<WireMessage, ProtocolFailure> DecodeEnvelope(std::string_view json);

    [[nodiscard]] static WireMessageKind KindOf(const WireMessage& message) noexcept;

private:
    WireCodec() = delete;
};

}
