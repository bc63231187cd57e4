#include "vortex/serialization/state_codec.hpp"
#include "vortex/protocol/constants.hpp"
#include "vortex/crypto/sodium_interop.hpp"
#include "json_support.hpp"
#include "protocol/state.pb.h"
#include <google/protobuf/struct.pb.h>
#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>

namespace vortex::protocol::serialization {
    using crypto::SodiumInterop;
    using detail::DecodeBytes;
    using detail::DecodeOptionalBytes;
    using detail::EncodeBytes;
    using detail::ParseJson;
    using detail::PrintJson;
    using models::Ed25519KeyPair;
    using models::OneTimePreKey;
    using models::SignedPreKey;
    using models::X25519KeyPair;
    namespace proto = vortex::proto::protocol;

    namespace {
        constexpr std::string_view kMessageKeyField = "messageKey";
        constexpr std::string_view kTimestampField = "timestamp";

        void WipeBytes(std::vector<uint8_t>& bytes) {
            if (!bytes.empty()) {
                auto _wipe = SodiumInterop::SecureWipe(std::span(bytes));
                (void) _wipe;
            }
            bytes.clear();
        }

        void WipeString(std::string* text) {
            if (!text->empty()) {
                auto _wipe = SodiumInterop::SecureWipe(
                    std::span<uint8_t>(reinterpret_cast<uint8_t*>(text->data()), text->size()));
                (void) _wipe;
            }
            text->clear();
        }

        void WipeKeyPairState(proto::KeyPairState* state) {
            WipeString(state->mutable_private_key());
        }

        Result<Unit, ProtocolFailure> SetSecret(
            Result<std::vector<uint8_t>, ProtocolFailure> secret,
            std::string* out) {
            if (secret.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(std::move(secret).UnwrapErr());
            }
            auto bytes = std::move(secret).Unwrap();
            *out = EncodeBytes(bytes);
            WipeBytes(bytes);
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<Unit, ProtocolFailure> EncodeX25519(const X25519KeyPair& pair, proto::KeyPairState* out) {
            out->set_public_key(EncodeBytes(pair.GetPublicKey()));
            return SetSecret(pair.ReadPrivateKeyCopy(), out->mutable_private_key());
        }

        Result<Unit, ProtocolFailure> EncodeEd25519(const Ed25519KeyPair& pair, proto::KeyPairState* out) {
            out->set_public_key(EncodeBytes(pair.GetPublicKey()));
            return SetSecret(pair.ReadSecretKeyCopy(), out->mutable_private_key());
        }

        template<typename Pair>
        Result<Pair, ProtocolFailure> DecodeKeyPair(
            const proto::KeyPairState& state,
            size_t public_size,
            size_t private_size,
            std::string_view field) {
            auto public_key = DecodeBytes(state.public_key(), public_size, std::string(field) + ".publicKey");
            if (public_key.IsErr()) {
                return Result<Pair, ProtocolFailure>::Err(std::move(public_key).UnwrapErr());
            }
            auto private_key = DecodeBytes(state.private_key(), private_size, std::string(field) + ".privateKey");
            if (private_key.IsErr()) {
                return Result<Pair, ProtocolFailure>::Err(std::move(private_key).UnwrapErr());
            }
            auto secret = std::move(private_key).Unwrap();
            auto pair = Pair::FromParts(secret, public_key.Unwrap());
            WipeBytes(secret);
            if (pair.IsErr()) {
                return Result<Pair, ProtocolFailure>::Err(
                    ProtocolFailure::Decode(std::string(field) + ": " + pair.UnwrapErr().message));
            }
            return pair;
        }

        std::optional<std::string> EncodeOptional(const std::optional<std::vector<uint8_t>>& bytes) {
            if (!bytes.has_value()) {
                return std::nullopt;
            }
            return EncodeBytes(*bytes);
        }

        Result<int64_t, ProtocolFailure> ReadTimestamp(const google::protobuf::Value& value) {
            if (value.kind_case() == google::protobuf::Value::kNumberValue) {
                const double number = value.number_value();
                if (!std::isfinite(number) || number < 0 || number != std::floor(number) ||
                    number > static_cast<double>(std::numeric_limits<int64_t>::max() / 2)) {
                    return Result<int64_t, ProtocolFailure>::Err(
                        ProtocolFailure::Decode("Skipped key timestamp is not a valid millisecond count"));
                }
                return Result<int64_t, ProtocolFailure>::Ok(static_cast<int64_t>(number));
            }
            if (value.kind_case() == google::protobuf::Value::kStringValue) {
                const auto& text = value.string_value();
                int64_t parsed = 0;
                const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
                if (ec == std::errc() && end == text.data() + text.size() && parsed >= 0) {
                    return Result<int64_t, ProtocolFailure>::Ok(parsed);
                }
            }
            return Result<int64_t, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Skipped key timestamp is missing"));
        }

        void EncodeSkippedKey(
            const SkippedKeyId& id,
            const SkippedMessageKey& entry,
            google::protobuf::ListValue* out) {
            out->add_values()->set_string_value(id.ToString());
            auto* fields = out->add_values()->mutable_struct_value()->mutable_fields();
            (*fields)[std::string(kMessageKeyField)].set_string_value(EncodeBytes(entry.message_key));
            (*fields)[std::string(kTimestampField)].set_number_value(static_cast<double>(entry.timestamp_ms));
        }

        Result<Unit, ProtocolFailure> DecodeSkippedKey(
            const google::protobuf::ListValue& pair,
            SkippedKeyMap& out) {
            if (pair.values_size() != 2 ||
                pair.values(0).kind_case() != google::protobuf::Value::kStringValue ||
                pair.values(1).kind_case() != google::protobuf::Value::kStructValue) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::Decode("MKSKIPPED entries must be [key, {messageKey, timestamp}] pairs"));
            }
            auto id = SkippedKeyId::Parse(pair.values(0).string_value());
            if (id.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(std::move(id).UnwrapErr());
            }
            const auto& fields = pair.values(1).struct_value().fields();
            const auto message_key_it = fields.find(std::string(kMessageKeyField));
            const auto timestamp_it = fields.find(std::string(kTimestampField));
            if (message_key_it == fields.end() || timestamp_it == fields.end() ||
                message_key_it->second.kind_case() != google::protobuf::Value::kStringValue) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::Decode("MKSKIPPED entry is missing messageKey or timestamp"));
            }
            auto message_key = DecodeBytes(message_key_it->second.string_value(), kMessageKeyBytes, "messageKey");
            if (message_key.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(std::move(message_key).UnwrapErr());
            }
            auto timestamp = ReadTimestamp(timestamp_it->second);
            if (timestamp.IsErr()) {
                auto key = std::move(message_key).Unwrap();
                WipeBytes(key);
                return Result<Unit, ProtocolFailure>::Err(std::move(timestamp).UnwrapErr());
            }
            auto [it, inserted] = out.emplace(
                std::move(id).Unwrap(),
                SkippedMessageKey{std::move(message_key).Unwrap(), timestamp.Unwrap()});
            if (!inserted) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::Decode("Duplicate MKSKIPPED entry " + it->first.ToString()));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        /// Insertion order is not exported; rebuild it from the timestamps.
        void AssignSkippedSequences(SessionState& state) {
            std::vector<SkippedMessageKey*> entries;
            entries.reserve(state.skipped.size());
            for (auto& [id, entry] : state.skipped) {
                entries.push_back(&entry);
            }
            std::stable_sort(entries.begin(), entries.end(), [](const auto* a, const auto* b) {
                return a->timestamp_ms < b->timestamp_ms;
            });
            uint64_t sequence = 0;
            for (auto* entry : entries) {
                entry->sequence = sequence++;
            }
            state.next_skipped_sequence = sequence;
        }

        Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> DecodeOptionalKey(
            bool present,
            const std::string& encoded,
            std::string_view field) {
            return DecodeOptionalBytes(present, encoded, kRootKeyBytes, field);
        }
    }

    Result<std::string, ProtocolFailure> StateCodec::EncodeSession(const SessionState& state) {
        using R = Result<std::string, ProtocolFailure>;
        const auto& ratchet = state.ratchet;
        if (!ratchet.dhs.has_value()) {
            return R::Err(ProtocolFailure::InvalidState("Session has no local ratchet key pair"));
        }

        proto::SessionStateDocument document;
        document.set_version(kSessionStateVersion);
        document.set_session_id(state.session_id);
        document.set_role(state.role == SessionRole::Sender
                              ? proto::SESSION_ROLE_SENDER
                              : proto::SESSION_ROLE_RECEIVER);
        if (auto dhs = EncodeX25519(*ratchet.dhs, document.mutable_dhs()); dhs.IsErr()) {
            return R::Err(std::move(dhs).UnwrapErr());
        }
        if (auto dhr = EncodeOptional(ratchet.dhr)) {
            document.set_dhr(*dhr);
        }
        document.set_rk(EncodeBytes(ratchet.root_key));
        if (auto cks = EncodeOptional(ratchet.cks)) {
            document.set_cks(*cks);
        }
        if (auto ckr = EncodeOptional(ratchet.ckr)) {
            document.set_ckr(*ckr);
        }
        document.set_ns(ratchet.ns);
        document.set_nr(ratchet.nr);
        document.set_pn(ratchet.pn);
        if (auto hks = EncodeOptional(ratchet.hks)) {
            document.set_hks(*hks);
        }
        if (auto hkr = EncodeOptional(ratchet.hkr)) {
            document.set_hkr(*hkr);
        }
        for (const auto& [id, entry] : state.skipped) {
            EncodeSkippedKey(id, entry, document.add_mkskipped());
        }
        document.set_remote_identity_key(EncodeBytes(state.remote_identity_key));
        document.set_local_identity_key(EncodeBytes(state.local_identity_key));
        document.set_created_at(state.created_at_ms);
        document.set_last_activity(state.last_activity_ms);

        auto json = PrintJson(document);
        WipeKeyPairState(document.mutable_dhs());
        WipeString(document.mutable_rk());
        WipeString(document.mutable_cks());
        WipeString(document.mutable_ckr());
        WipeString(document.mutable_hks());
        WipeString(document.mutable_hkr());
        for (auto& entry : *document.mutable_mkskipped()) {
            if (entry.values_size() == 2 && entry.values(1).has_struct_value()) {
                auto* fields = entry.mutable_values(1)->mutable_struct_value()->mutable_fields();
                if (auto it = fields->find(std::string(kMessageKeyField)); it != fields->end()) {
                    WipeString(it->second.mutable_string_value());
                }
            }
        }
        return json;
    }

    Result<SessionState, ProtocolFailure> StateCodec::DecodeSession(std::string_view json) {
        using R = Result<SessionState, ProtocolFailure>;
        proto::SessionStateDocument document;
        if (auto parsed = ParseJson(json, &document, false); parsed.IsErr()) {
            return R::Err(std::move(parsed).UnwrapErr());
        }
        if (document.version() != kSessionStateVersion) {
            return R::Err(ProtocolFailure::Decode(
                "Unsupported session state version " + std::to_string(document.version())));
        }
        if (document.session_id().empty()) {
            return R::Err(ProtocolFailure::Decode("Field 'sessionId' is missing"));
        }

        SessionState state;
        state.session_id = document.session_id();
        switch (document.role()) {
            case proto::SESSION_ROLE_SENDER:
                state.role = SessionRole::Sender;
                break;
            case proto::SESSION_ROLE_RECEIVER:
                state.role = SessionRole::Receiver;
                break;
            default:
                return R::Err(ProtocolFailure::Decode("Field 'role' must be sender or receiver"));
        }

        if (!document.has_dhs()) {
            return R::Err(ProtocolFailure::Decode("Field 'DHs' is missing"));
        }
        auto dhs = DecodeKeyPair<X25519KeyPair>(
            document.dhs(), kX25519PublicKeyBytes, kX25519PrivateKeyBytes, "DHs");
        WipeKeyPairState(document.mutable_dhs());
        if (dhs.IsErr()) {
            return R::Err(std::move(dhs).UnwrapErr());
        }
        state.ratchet.dhs.emplace(std::move(dhs).Unwrap());

        auto dhr = DecodeOptionalBytes(document.has_dhr(), document.dhr(), kX25519PublicKeyBytes, "DHr");
        if (dhr.IsErr()) {
            return R::Err(std::move(dhr).UnwrapErr());
        }
        state.ratchet.dhr = std::move(dhr).Unwrap();

        auto rk = DecodeBytes(document.rk(), kRootKeyBytes, "RK");
        WipeString(document.mutable_rk());
        if (rk.IsErr()) {
            return R::Err(std::move(rk).UnwrapErr());
        }
        state.ratchet.root_key = std::move(rk).Unwrap();

        auto cks = DecodeOptionalKey(document.has_cks(), document.cks(), "CKs");
        auto ckr = DecodeOptionalKey(document.has_ckr(), document.ckr(), "CKr");
        auto hks = DecodeOptionalKey(document.has_hks(), document.hks(), "HKs");
        auto hkr = DecodeOptionalKey(document.has_hkr(), document.hkr(), "HKr");
        for (auto* field : {&cks, &ckr, &hks, &hkr}) {
            if (field->IsErr()) {
                return R::Err(field->UnwrapErr());
            }
        }
        state.ratchet.cks = std::move(cks).Unwrap();
        state.ratchet.ckr = std::move(ckr).Unwrap();
        state.ratchet.hks = std::move(hks).Unwrap();
        state.ratchet.hkr = std::move(hkr).Unwrap();
        if (state.ratchet.ckr.has_value() && !state.ratchet.dhr.has_value()) {
            return R::Err(ProtocolFailure::Decode("CKr present without DHr"));
        }
        state.ratchet.ns = document.ns();
        state.ratchet.nr = document.nr();
        state.ratchet.pn = document.pn();

        for (const auto& entry : document.mkskipped()) {
            if (auto decoded = DecodeSkippedKey(entry, state.skipped); decoded.IsErr()) {
                return R::Err(std::move(decoded).UnwrapErr());
            }
        }
        AssignSkippedSequences(state);

        auto remote_identity = DecodeBytes(document.remote_identity_key(), kX25519PublicKeyBytes, "remoteIdentityKey");
        if (remote_identity.IsErr()) {
            return R::Err(std::move(remote_identity).UnwrapErr());
        }
        auto local_identity = DecodeBytes(document.local_identity_key(), kX25519PublicKeyBytes, "localIdentityKey");
        if (local_identity.IsErr()) {
            return R::Err(std::move(local_identity).UnwrapErr());
        }
        state.remote_identity_key = std::move(remote_identity).Unwrap();
        state.local_identity_key = std::move(local_identity).Unwrap();
        state.created_at_ms = document.created_at();
        state.last_activity_ms = document.last_activity();
        return R::Ok(std::move(state));
    }

    Result<std::string, ProtocolFailure> StateCodec::EncodeIdentity(const identity::IdentityStore& store) {
        using R = Result<std::string, ProtocolFailure>;
        proto::IdentityDocument document;
        document.set_version(kIdentityBackupVersion);
        if (auto encoded = EncodeX25519(store.GetIdentityKeyPair(), document.mutable_identity_key_pair());
            encoded.IsErr()) {
            return R::Err(std::move(encoded).UnwrapErr());
        }
        if (auto encoded = EncodeEd25519(store.GetSigningKeyPair(), document.mutable_signing_key_pair());
            encoded.IsErr()) {
            WipeKeyPairState(document.mutable_identity_key_pair());
            return R::Err(std::move(encoded).UnwrapErr());
        }
        document.set_registration_id(store.GetRegistrationId());

        const auto& signed_pre_key = store.GetSignedPreKey();
        auto* spk = document.mutable_signed_pre_key();
        spk->set_key_id(signed_pre_key.GetKeyId());
        spk->set_signature(EncodeBytes(signed_pre_key.GetSignature()));
        spk->set_timestamp(signed_pre_key.GetTimestamp());
        auto spk_encoded = EncodeX25519(signed_pre_key.GetKeyPair(), spk->mutable_key_pair());

        auto one_time_encoded = Result<Unit, ProtocolFailure>::Ok(unit);
        for (const auto& key : store.GetOneTimePreKeys()) {
            if (spk_encoded.IsErr() || one_time_encoded.IsErr()) {
                break;
            }
            auto* entry = document.add_one_time_pre_keys();
            entry->set_key_id(key.GetKeyId());
            entry->set_used(key.IsUsed());
            one_time_encoded = EncodeX25519(key.GetKeyPair(), entry->mutable_key_pair());
        }
        document.set_created_at(store.GetCreatedAt());
        document.set_fingerprint(store.GetFingerprint());

        auto json = [&]() -> R {
            if (spk_encoded.IsErr()) {
                return R::Err(std::move(spk_encoded).UnwrapErr());
            }
            if (one_time_encoded.IsErr()) {
                return R::Err(std::move(one_time_encoded).UnwrapErr());
            }
            return PrintJson(document);
        }();

        WipeKeyPairState(document.mutable_identity_key_pair());
        WipeKeyPairState(document.mutable_signing_key_pair());
        WipeKeyPairState(spk->mutable_key_pair());
        for (auto& entry : *document.mutable_one_time_pre_keys()) {
            WipeKeyPairState(entry.mutable_key_pair());
        }
        return json;
    }

    Result<identity::IdentityStore, ProtocolFailure> StateCodec::DecodeIdentity(std::string_view json) {
        using R = Result<identity::IdentityStore, ProtocolFailure>;
        proto::IdentityDocument document;
        if (auto parsed = ParseJson(json, &document, false); parsed.IsErr()) {
            return R::Err(std::move(parsed).UnwrapErr());
        }

        auto wipe_document = [&document]() {
            WipeKeyPairState(document.mutable_identity_key_pair());
            WipeKeyPairState(document.mutable_signing_key_pair());
            WipeKeyPairState(document.mutable_signed_pre_key()->mutable_key_pair());
            for (auto& entry : *document.mutable_one_time_pre_keys()) {
                WipeKeyPairState(entry.mutable_key_pair());
            }
        };
        auto fail = [&wipe_document](ProtocolFailure failure) {
            wipe_document();
            return R::Err(std::move(failure));
        };

        if (document.version() != kIdentityBackupVersion) {
            return fail(ProtocolFailure::Decode(
                "Unsupported identity document version " + std::to_string(document.version())));
        }
        if (document.registration_id() == 0) {
            return fail(ProtocolFailure::Decode("Field 'registrationId' must be positive"));
        }
        if (!document.has_identity_key_pair() || !document.has_signing_key_pair() ||
            !document.has_signed_pre_key()) {
            return fail(ProtocolFailure::Decode("Identity document is missing key material"));
        }

        auto identity_pair = DecodeKeyPair<X25519KeyPair>(
            document.identity_key_pair(), kX25519PublicKeyBytes, kX25519PrivateKeyBytes, "identityKeyPair");
        if (identity_pair.IsErr()) {
            return fail(std::move(identity_pair).UnwrapErr());
        }
        auto signing_pair = DecodeKeyPair<Ed25519KeyPair>(
            document.signing_key_pair(), kEd25519PublicKeyBytes, kEd25519SecretKeyBytes, "signingKeyPair");
        if (signing_pair.IsErr()) {
            return fail(std::move(signing_pair).UnwrapErr());
        }

        const auto& spk_state = document.signed_pre_key();
        auto spk_pair = DecodeKeyPair<X25519KeyPair>(
            spk_state.key_pair(), kX25519PublicKeyBytes, kX25519PrivateKeyBytes, "signedPreKey.keyPair");
        if (spk_pair.IsErr()) {
            return fail(std::move(spk_pair).UnwrapErr());
        }
        auto spk_signature = DecodeBytes(spk_state.signature(), kEd25519SignatureBytes, "signedPreKey.signature");
        if (spk_signature.IsErr()) {
            return fail(std::move(spk_signature).UnwrapErr());
        }

        std::vector<OneTimePreKey> one_time_pre_keys;
        one_time_pre_keys.reserve(static_cast<size_t>(document.one_time_pre_keys_size()));
        for (const auto& entry : document.one_time_pre_keys()) {
            auto pair = DecodeKeyPair<X25519KeyPair>(
                entry.key_pair(), kX25519PublicKeyBytes, kX25519PrivateKeyBytes,
                "oneTimePreKeys[" + std::to_string(entry.key_id()) + "]");
            if (pair.IsErr()) {
                return fail(std::move(pair).UnwrapErr());
            }
            one_time_pre_keys.emplace_back(entry.key_id(), std::move(pair).Unwrap(), entry.used());
        }
        wipe_document();

        return R::Ok(identity::IdentityStore(
            std::move(identity_pair).Unwrap(),
            std::move(signing_pair).Unwrap(),
            document.registration_id(),
            SignedPreKey(spk_state.key_id(), std::move(spk_pair).Unwrap(),
                         std::move(spk_signature).Unwrap(), spk_state.timestamp()),
            std::move(one_time_pre_keys),
            document.created_at(),
            document.fingerprint()));
    }

    Result<std::string, ProtocolFailure> StateCodec::EncodeBackup(const IdentityBackupBlob& blob) {
        proto::IdentityBackup document;
        document.set_v(blob.version);
        document.set_salt(EncodeBytes(blob.salt));
        document.set_nonce(EncodeBytes(blob.nonce));
        document.set_data(EncodeBytes(blob.data));
        return PrintJson(document);
    }

    Result<IdentityBackupBlob, ProtocolFailure> StateCodec::DecodeBackup(std::string_view json) {
        using R = Result<IdentityBackupBlob, ProtocolFailure>;
        proto::IdentityBackup document;
        if (auto parsed = ParseJson(json, &document, false); parsed.IsErr()) {
            return R::Err(std::move(parsed).UnwrapErr());
        }
        IdentityBackupBlob blob;
        blob.version = document.v();
        if (blob.version != kIdentityBackupVersion) {
            return R::Ok(std::move(blob));
        }
        auto salt = DecodeBytes(document.salt(), kBackupSaltBytes, "salt");
        if (salt.IsErr()) {
            return R::Err(std::move(salt).UnwrapErr());
        }
        auto nonce = DecodeBytes(document.nonce(), kAeadNonceBytes, "nonce");
        if (nonce.IsErr()) {
            return R::Err(std::move(nonce).UnwrapErr());
        }
        auto data = DecodeBytes(document.data(), 0, "data");
        if (data.IsErr()) {
            return R::Err(std::move(data).UnwrapErr());
        }
        blob.salt = std::move(salt).Unwrap();
        blob.nonce = std::move(nonce).Unwrap();
        blob.data = std::move(data).Unwrap();
        return R::Ok(std::move(blob));
    }
}
