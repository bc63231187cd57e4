#include "vortex/protocol/double_ratchet_session.hpp"
#include "vortex/protocol/constants.hpp"
#include "vortex/protocol/header_codec.hpp"
#include "vortex/protocol/ratchet_kdf.hpp"
#include "vortex/protocol/x3dh.hpp"
#include "vortex/core/constants.hpp"
#include "vortex/crypto/aead.hpp"
#include "vortex/crypto/sodium_interop.hpp"
#include "vortex/security/dh_validator.hpp"
#include "vortex/serialization/state_codec.hpp"
#include "vortex/debug/protocol_logger.hpp"
#include <algorithm>
#include <limits>
#include <utility>

namespace vortex::protocol {
    using crypto::Aead;
    using crypto::SodiumInterop;
    using models::EncryptedMessage;
    using models::MessageHeader;
    using models::PreKeyBundle;
    using models::X25519KeyPair;
    using security::DhValidator;
    using serialization::StateCodec;

    namespace {
        int64_t NowMs() {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        }

        void WipeBytes(std::vector<uint8_t>& bytes) {
            if (!bytes.empty()) {
                auto _wipe = SodiumInterop::SecureWipe(std::span(bytes));
                (void) _wipe;
            }
            bytes.clear();
        }

        debug::Side LogSide(const std::optional<SessionState>& state) {
            if (!state.has_value()) {
                return debug::Side::Unknown;
            }
            return state->role == SessionRole::Sender ? debug::Side::Sender : debug::Side::Receiver;
        }

        std::vector<uint8_t> Concat(
            std::span<const uint8_t> a,
            std::span<const uint8_t> b,
            std::span<const uint8_t> c) {
            std::vector<uint8_t> out;
            out.reserve(a.size() + b.size() + c.size());
            out.insert(out.end(), a.begin(), a.end());
            out.insert(out.end(), b.begin(), b.end());
            out.insert(out.end(), c.begin(), c.end());
            return out;
        }

        bool BytesEqual(std::span<const uint8_t> a, std::span<const uint8_t> b) {
            auto result = SodiumInterop::ConstantTimeEquals(a, b);
            return result.IsOk() && result.Unwrap();
        }

        Result<Unit, ProtocolFailure> ValidateMessageShape(const EncryptedMessage& message) {
            if (message.header.dh.size() != kX25519PublicKeyBytes) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput("Header ratchet key must be " +
                                                  std::to_string(kX25519PublicKeyBytes) + " bytes"));
            }
            if (message.nonce.size() != kAeadNonceBytes || message.header_nonce.size() != kAeadNonceBytes) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput("Nonces must be " + std::to_string(kAeadNonceBytes) + " bytes"));
            }
            if (message.header_cipher.size() != kMessageHeaderBytes + kAeadTagBytes) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput("Header cipher has unexpected length " +
                                                  std::to_string(message.header_cipher.size())));
            }
            if (message.ciphertext.size() < kAeadTagBytes) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput("Ciphertext shorter than the authentication tag"));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<Unit, ProtocolFailure> ValidateIdentityKey(std::span<const uint8_t> key, const char* name) {
            if (key.size() != kX25519PublicKeyBytes) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput(std::string(name) + " must be " +
                                                  std::to_string(kX25519PublicKeyBytes) + " bytes"));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
    }

    DoubleRatchetSession::DoubleRatchetSession(
        configuration::RatchetConfig config,
        std::optional<std::string> session_id)
        : config_(config)
        , session_id_(session_id.has_value() ? std::move(*session_id) : SodiumInterop::GenerateUuid()) {
    }

    Result<DoubleRatchetSession::SenderHandshake, ProtocolFailure> DoubleRatchetSession::InitializeSender(
        const X25519KeyPair& local_identity,
        const PreKeyBundle& remote_bundle) {
        std::lock_guard<std::mutex> guard(lock_);
        if (state_.has_value()) {
            return Result<SenderHandshake, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Session already initialized"));
        }
        if (!config_.IsValid()) {
            return Result<SenderHandshake, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Ratchet configuration is invalid"));
        }
        if (auto check = ValidateIdentityKey(local_identity.GetPublicKey(), "Local identity key"); check.IsErr()) {
            return Result<SenderHandshake, ProtocolFailure>::Err(std::move(check).UnwrapErr());
        }

        auto x3dh_result = X3dh::AgreeAsInitiator(local_identity, remote_bundle);
        if (x3dh_result.IsErr()) {
            return Result<SenderHandshake, ProtocolFailure>::Err(std::move(x3dh_result).UnwrapErr());
        }
        auto x3dh = std::move(x3dh_result).Unwrap();

        auto dhs_result = X25519KeyPair::Generate("ratchet");
        if (dhs_result.IsErr()) {
            WipeBytes(x3dh.shared_secret);
            return Result<SenderHandshake, ProtocolFailure>::Err(std::move(dhs_result).UnwrapErr());
        }
        auto dhs = std::move(dhs_result).Unwrap();

        auto dh_out_result = dhs.Agree(remote_bundle.signed_pre_key);
        if (dh_out_result.IsErr()) {
            WipeBytes(x3dh.shared_secret);
            return Result<SenderHandshake, ProtocolFailure>::Err(std::move(dh_out_result).UnwrapErr());
        }
        auto dh_out = std::move(dh_out_result).Unwrap();
        auto root_result = RatchetKdf::DeriveRootKeys(x3dh.shared_secret, dh_out);
        WipeBytes(dh_out);
        WipeBytes(x3dh.shared_secret);
        if (root_result.IsErr()) {
            return Result<SenderHandshake, ProtocolFailure>::Err(std::move(root_result).UnwrapErr());
        }
        auto root = std::move(root_result).Unwrap();

        SessionState state;
        state.session_id = session_id_;
        state.role = SessionRole::Sender;
        state.ratchet.dhs.emplace(std::move(dhs));
        state.ratchet.dhr = remote_bundle.signed_pre_key;
        state.ratchet.root_key = std::move(root.root_key);
        state.ratchet.cks = std::move(root.chain_key);
        state.ratchet.hks = std::move(root.header_key);
        state.local_identity_key = local_identity.GetPublicKeyCopy();
        state.remote_identity_key = remote_bundle.identity_key;
        state.created_at_ms = NowMs();
        state.last_activity_ms = state.created_at_ms;
        state_.emplace(std::move(state));

        debug::LogSessionInitialized(debug::Side::Sender, session_id_,
                                     state_->ratchet.dhs->GetPublicKey(), x3dh.used_one_time_pre_key);

        return Result<SenderHandshake, ProtocolFailure>::Ok(SenderHandshake{
            x3dh.ephemeral_key_pair.GetPublicKeyCopy(),
            x3dh.used_one_time_pre_key
        });
    }

    Result<Unit, ProtocolFailure> DoubleRatchetSession::InitializeReceiver(
        const X25519KeyPair& local_identity,
        const X25519KeyPair& local_signed_pre_key,
        const X25519KeyPair* local_one_time_pre_key,
        std::span<const uint8_t> remote_identity_key,
        std::span<const uint8_t> remote_ephemeral_key) {
        std::lock_guard<std::mutex> guard(lock_);
        if (state_.has_value()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Session already initialized"));
        }
        if (!config_.IsValid()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Ratchet configuration is invalid"));
        }
        if (auto check = ValidateIdentityKey(local_identity.GetPublicKey(), "Local identity key"); check.IsErr()) {
            return check;
        }

        auto sk_result = X3dh::AgreeAsResponder(
            local_identity, local_signed_pre_key, local_one_time_pre_key,
            remote_identity_key, remote_ephemeral_key);
        if (sk_result.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(sk_result).UnwrapErr());
        }
        auto shared_secret = std::move(sk_result).Unwrap();

        auto dhs_result = local_signed_pre_key.Clone();
        if (dhs_result.IsErr()) {
            WipeBytes(shared_secret);
            return Result<Unit, ProtocolFailure>::Err(std::move(dhs_result).UnwrapErr());
        }

        SessionState state;
        state.session_id = session_id_;
        state.role = SessionRole::Receiver;
        state.ratchet.dhs.emplace(std::move(dhs_result).Unwrap());
        state.ratchet.root_key = std::move(shared_secret);
        state.local_identity_key = local_identity.GetPublicKeyCopy();
        state.remote_identity_key.assign(remote_identity_key.begin(), remote_identity_key.end());
        state.created_at_ms = NowMs();
        state.last_activity_ms = state.created_at_ms;
        state_.emplace(std::move(state));

        debug::LogSessionInitialized(debug::Side::Receiver, session_id_,
                                     state_->ratchet.dhs->GetPublicKey(), local_one_time_pre_key != nullptr);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<EncryptedMessage, ProtocolFailure> DoubleRatchetSession::Encrypt(
        std::span<const uint8_t> plaintext) {
        std::lock_guard<std::mutex> guard(lock_);
        if (!state_.has_value()) {
            return Result<EncryptedMessage, ProtocolFailure>::Err(
                ProtocolFailure::NotInitialized(std::string(ErrorMessages::SESSION_NOT_READY)));
        }
        auto& ratchet = state_->ratchet;
        if (!ratchet.cks.has_value() || !ratchet.dhs.has_value()) {
            return Result<EncryptedMessage, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Sending chain not started; a message must be received first"));
        }
        if (ratchet.ns == std::numeric_limits<uint32_t>::max()) {
            return Result<EncryptedMessage, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Sending chain exhausted"));
        }

        auto chain_result = RatchetKdf::DeriveChainKeys(*ratchet.cks);
        if (chain_result.IsErr()) {
            return Result<EncryptedMessage, ProtocolFailure>::Err(std::move(chain_result).UnwrapErr());
        }
        auto chain = std::move(chain_result).Unwrap();

        MessageHeader header{ratchet.dhs->GetPublicKeyCopy(), ratchet.pn, ratchet.ns};
        auto header_bytes_result = HeaderCodec::Encode(header);
        if (header_bytes_result.IsErr()) {
            chain.Wipe();
            return Result<EncryptedMessage, ProtocolFailure>::Err(std::move(header_bytes_result).UnwrapErr());
        }
        auto header_bytes = std::move(header_bytes_result).Unwrap();

        const std::span<const uint8_t> header_key = ratchet.hks.has_value()
            ? std::span<const uint8_t>(*ratchet.hks)
            : std::span<const uint8_t>(chain.message_key);
        auto header_nonce = Aead::GenerateNonce();
        auto header_cipher_result = Aead::Encrypt(
            header_key, header_nonce, header_bytes, state_->local_identity_key);
        if (header_cipher_result.IsErr()) {
            chain.Wipe();
            return Result<EncryptedMessage, ProtocolFailure>::Err(std::move(header_cipher_result).UnwrapErr());
        }
        auto header_cipher = std::move(header_cipher_result).Unwrap();

        const auto ad = Concat(state_->local_identity_key, state_->remote_identity_key, header_cipher);
        auto nonce = Aead::GenerateNonce();
        auto ciphertext_result = Aead::Encrypt(chain.message_key, nonce, plaintext, ad);
        if (ciphertext_result.IsErr()) {
            chain.Wipe();
            return Result<EncryptedMessage, ProtocolFailure>::Err(std::move(ciphertext_result).UnwrapErr());
        }

        ReplaceSecret(ratchet.cks, std::move(chain.next_chain_key));
        chain.Wipe();
        ratchet.ns += 1;
        state_->last_activity_ms = NowMs();

        EncryptedMessage message;
        message.header = std::move(header);
        message.header_cipher = std::move(header_cipher);
        message.header_nonce = std::move(header_nonce);
        message.ciphertext = std::move(ciphertext_result).Unwrap();
        message.nonce = std::move(nonce);
        return Result<EncryptedMessage, ProtocolFailure>::Ok(std::move(message));
    }

    Result<DoubleRatchetSession::DecryptResult, ProtocolFailure> DoubleRatchetSession::Decrypt(
        const EncryptedMessage& message) {
        std::lock_guard<std::mutex> guard(lock_);
        if (!state_.has_value()) {
            return Result<DecryptResult, ProtocolFailure>::Err(
                ProtocolFailure::NotInitialized(std::string(ErrorMessages::SESSION_NOT_READY)));
        }
        if (auto shape = ValidateMessageShape(message); shape.IsErr()) {
            return Result<DecryptResult, ProtocolFailure>::Err(std::move(shape).UnwrapErr());
        }
        const auto side = LogSide(state_);
        const int64_t now_ms = NowMs();

        if (auto entry = state_->skipped.find(SkippedKeyId{message.header.dh, message.header.n});
            entry != state_->skipped.end()) {
            return DecryptWithSkippedKey(entry, message, now_ms);
        }

        auto staged_result = state_->ratchet.Clone();
        if (staged_result.IsErr()) {
            return Result<DecryptResult, ProtocolFailure>::Err(std::move(staged_result).UnwrapErr());
        }
        auto staged = std::move(staged_result).Unwrap();
        SkippedKeyMap newly_skipped;
        uint64_t next_sequence = state_->next_skipped_sequence;
        auto fail = [&newly_skipped, side](ProtocolFailure failure, const char* reason) {
            WipeSkippedKeys(newly_skipped);
            debug::LogDecryptRejected(side, reason);
            return Result<DecryptResult, ProtocolFailure>::Err(std::move(failure));
        };

        bool ratchet_step = false;
        if (!staged.dhr.has_value() || !BytesEqual(*staged.dhr, message.header.dh)) {
            if (auto validation = DhValidator::ValidateX25519PublicKey(message.header.dh); validation.IsErr()) {
                return fail(std::move(validation).UnwrapErr(), "invalid ratchet key");
            }
            if (auto skip = SkipMessageKeys(staged, message.header.pn, newly_skipped, now_ms, next_sequence); skip.IsErr()) {
                return fail(std::move(skip).UnwrapErr(), "skip bound (previous chain)");
            }
            if (auto step = DhRatchetStep(staged, message.header.dh); step.IsErr()) {
                return fail(std::move(step).UnwrapErr(), "ratchet step");
            }
            ratchet_step = true;
        } else if (message.header.n < staged.nr) {
            return fail(ProtocolFailure::ReplayAttack(
                            "Message " + std::to_string(message.header.n) + " already received"),
                        "replay");
        }

        if (auto skip = SkipMessageKeys(staged, message.header.n, newly_skipped, now_ms, next_sequence); skip.IsErr()) {
            return fail(std::move(skip).UnwrapErr(), "skip bound (current chain)");
        }
        if (!staged.ckr.has_value()) {
            return fail(ProtocolFailure::InvalidState("Receiving chain not started"), "no receiving chain");
        }
        if (staged.nr == std::numeric_limits<uint32_t>::max()) {
            return fail(ProtocolFailure::InvalidState("Receiving chain exhausted"), "chain exhausted");
        }

        auto chain_result = RatchetKdf::DeriveChainKeys(*staged.ckr);
        if (chain_result.IsErr()) {
            return fail(std::move(chain_result).UnwrapErr(), "chain step");
        }
        auto chain = std::move(chain_result).Unwrap();
        ReplaceSecret(staged.ckr, std::move(chain.next_chain_key));
        staged.nr += 1;

        const std::span<const uint8_t> header_key = staged.hkr.has_value()
            ? std::span<const uint8_t>(*staged.hkr)
            : std::span<const uint8_t>(chain.message_key);
        auto header_plain_result = Aead::Decrypt(
            header_key, message.header_nonce, message.header_cipher, state_->remote_identity_key);
        if (header_plain_result.IsErr()) {
            chain.Wipe();
            return fail(std::move(header_plain_result).UnwrapErr(), "header authentication");
        }
        auto sealed_header = HeaderCodec::Decode(header_plain_result.Unwrap());
        if (sealed_header.IsErr() ||
            !BytesEqual(sealed_header.Unwrap().dh, message.header.dh) ||
            sealed_header.Unwrap().pn != message.header.pn ||
            sealed_header.Unwrap().n != message.header.n) {
            chain.Wipe();
            return fail(ProtocolFailure::AuthenticationFailure("Routing header does not match encrypted header"),
                        "header mismatch");
        }

        const auto ad = Concat(state_->remote_identity_key, state_->local_identity_key, message.header_cipher);
        auto plaintext_result = Aead::Decrypt(chain.message_key, message.nonce, message.ciphertext, ad);
        chain.Wipe();
        if (plaintext_result.IsErr()) {
            return fail(std::move(plaintext_result).UnwrapErr(), "body authentication");
        }

        const uint64_t first_new_sequence = state_->next_skipped_sequence;
        size_t newly_cached = newly_skipped.size();
        state_->ratchet = std::move(staged);
        state_->skipped.merge(newly_skipped);
        WipeSkippedKeys(newly_skipped);
        state_->next_skipped_sequence = next_sequence;
        const size_t evicted = EnforceSkippedKeyCap(first_new_sequence);
        if (evicted > 0) {
            newly_cached = static_cast<size_t>(std::count_if(
                state_->skipped.begin(), state_->skipped.end(), [first_new_sequence](const auto& entry) {
                    return entry.second.sequence >= first_new_sequence;
                }));
        }
        state_->last_activity_ms = now_ms;

        if (ratchet_step) {
            debug::LogDhRatchetStep(side, message.header.dh,
                                    state_->ratchet.dhs->GetPublicKey(), state_->ratchet.pn);
        }
        if (newly_cached > 0) {
            debug::LogSkippedKeysCached(side, newly_cached, state_->skipped.size());
        }
        if (evicted > 0) {
            debug::LogSkippedKeysRemoved(side, "evicted_over_cap", evicted);
        }

        return Result<DecryptResult, ProtocolFailure>::Ok(DecryptResult{
            std::move(plaintext_result).Unwrap(),
            ratchet_step ? RatchetEvent::DhRatchetStep : RatchetEvent::None,
            newly_cached,
            evicted
        });
    }

    Result<DoubleRatchetSession::DecryptResult, ProtocolFailure> DoubleRatchetSession::DecryptWithSkippedKey(
        SkippedKeyMap::iterator entry,
        const EncryptedMessage& message,
        int64_t now_ms) {
        const auto ad = Concat(state_->remote_identity_key, state_->local_identity_key, message.header_cipher);
        auto plaintext_result = Aead::Decrypt(entry->second.message_key, message.nonce, message.ciphertext, ad);
        if (plaintext_result.IsErr()) {
            debug::LogDecryptRejected(LogSide(state_), "skipped key authentication");
            return Result<DecryptResult, ProtocolFailure>::Err(std::move(plaintext_result).UnwrapErr());
        }
        WipeBytes(entry->second.message_key);
        state_->skipped.erase(entry);
        state_->last_activity_ms = now_ms;
        return Result<DecryptResult, ProtocolFailure>::Ok(DecryptResult{
            std::move(plaintext_result).Unwrap(),
            RatchetEvent::SkippedKeyConsumed,
            0,
            0
        });
    }

    Result<Unit, ProtocolFailure> DoubleRatchetSession::SkipMessageKeys(
        RatchetState& staged,
        uint32_t until,
        SkippedKeyMap& newly_skipped,
        int64_t now_ms,
        uint64_t& next_sequence) const {
        if (static_cast<uint64_t>(staged.nr) + config_.GetMaxSkip() < until) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::TooManySkippedMessages(
                    "Message " + std::to_string(until) + " is more than " +
                    std::to_string(config_.GetMaxSkip()) + " ahead of " + std::to_string(staged.nr)));
        }
        if (!staged.ckr.has_value() || !staged.dhr.has_value()) {
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
        while (staged.nr < until) {
            auto chain_result = RatchetKdf::DeriveChainKeys(*staged.ckr);
            if (chain_result.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(std::move(chain_result).UnwrapErr());
            }
            auto chain = std::move(chain_result).Unwrap();
            newly_skipped.insert_or_assign(
                SkippedKeyId{*staged.dhr, staged.nr},
                SkippedMessageKey{std::move(chain.message_key), now_ms, next_sequence++});
            ReplaceSecret(staged.ckr, std::move(chain.next_chain_key));
            staged.nr += 1;
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> DoubleRatchetSession::DhRatchetStep(
        RatchetState& staged,
        std::span<const uint8_t> remote_ratchet_key) const {
        if (!staged.dhs.has_value()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("No local ratchet key pair"));
        }
        staged.pn = staged.ns;
        staged.ns = 0;
        staged.nr = 0;
        staged.dhr = std::vector<uint8_t>(remote_ratchet_key.begin(), remote_ratchet_key.end());

        auto recv_dh_result = staged.dhs->Agree(*staged.dhr);
        if (recv_dh_result.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(recv_dh_result).UnwrapErr());
        }
        auto recv_dh = std::move(recv_dh_result).Unwrap();
        auto recv_result = RatchetKdf::DeriveRootKeys(staged.root_key, recv_dh);
        WipeBytes(recv_dh);
        if (recv_result.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(recv_result).UnwrapErr());
        }
        auto recv = std::move(recv_result).Unwrap();
        ReplaceSecret(staged.root_key, std::move(recv.root_key));
        ReplaceSecret(staged.ckr, std::move(recv.chain_key));
        ReplaceSecret(staged.hkr, std::move(recv.header_key));

        auto dhs_result = X25519KeyPair::Generate("ratchet");
        if (dhs_result.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(dhs_result).UnwrapErr());
        }
        staged.dhs.emplace(std::move(dhs_result).Unwrap());

        auto send_dh_result = staged.dhs->Agree(*staged.dhr);
        if (send_dh_result.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(send_dh_result).UnwrapErr());
        }
        auto send_dh = std::move(send_dh_result).Unwrap();
        auto send_result = RatchetKdf::DeriveRootKeys(staged.root_key, send_dh);
        WipeBytes(send_dh);
        if (send_result.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(send_result).UnwrapErr());
        }
        auto send = std::move(send_result).Unwrap();
        ReplaceSecret(staged.root_key, std::move(send.root_key));
        ReplaceSecret(staged.cks, std::move(send.chain_key));
        ReplaceSecret(staged.hks, std::move(send.header_key));
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    size_t DoubleRatchetSession::EnforceSkippedKeyCap(uint64_t protected_from) {
        auto& skipped = state_->skipped;
        const size_t cap = config_.GetMaxSkippedKeys();
        if (skipped.size() <= cap) {
            return 0;
        }
        std::vector<SkippedKeyMap::iterator> entries;
        entries.reserve(skipped.size());
        for (auto it = skipped.begin(); it != skipped.end(); ++it) {
            entries.push_back(it);
        }
        // Oldest first; keys cached by the current call go last whatever the clock says.
        std::sort(entries.begin(), entries.end(), [protected_from](const auto& a, const auto& b) {
            const bool a_new = a->second.sequence >= protected_from;
            const bool b_new = b->second.sequence >= protected_from;
            if (a_new != b_new) {
                return b_new;
            }
            if (a->second.timestamp_ms != b->second.timestamp_ms) {
                return a->second.timestamp_ms < b->second.timestamp_ms;
            }
            return a->second.sequence < b->second.sequence;
        });
        const size_t excess = skipped.size() - cap;
        for (size_t i = 0; i < excess; ++i) {
            WipeBytes(entries[i]->second.message_key);
            skipped.erase(entries[i]);
        }
        return excess;
    }

    size_t DoubleRatchetSession::CleanupSkippedKeys() {
        return CleanupSkippedKeysAt(std::chrono::system_clock::now(), config_.GetSkippedKeyMaxAge());
    }

    size_t DoubleRatchetSession::CleanupSkippedKeys(std::chrono::milliseconds max_age) {
        return CleanupSkippedKeysAt(std::chrono::system_clock::now(), max_age);
    }

    size_t DoubleRatchetSession::CleanupSkippedKeysAt(
        std::chrono::system_clock::time_point now,
        std::chrono::milliseconds max_age) {
        std::lock_guard<std::mutex> guard(lock_);
        if (!state_.has_value()) {
            return 0;
        }
        const int64_t now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count();
        size_t removed = 0;
        for (auto it = state_->skipped.begin(); it != state_->skipped.end();) {
            if (now_ms - it->second.timestamp_ms > max_age.count()) {
                WipeBytes(it->second.message_key);
                it = state_->skipped.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        if (removed > 0) {
            debug::LogSkippedKeysRemoved(LogSide(state_), "expired", removed);
        }
        return removed;
    }

    Result<std::string, ProtocolFailure> DoubleRatchetSession::ExportState() const {
        std::lock_guard<std::mutex> guard(lock_);
        if (!state_.has_value()) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::NotInitialized(std::string(ErrorMessages::SESSION_NOT_READY)));
        }
        return StateCodec::EncodeSession(*state_);
    }

    Result<Unit, ProtocolFailure> DoubleRatchetSession::ImportState(std::string_view json) {
        auto decoded = StateCodec::DecodeSession(json);
        if (decoded.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(decoded).UnwrapErr());
        }
        std::lock_guard<std::mutex> guard(lock_);
        if (state_.has_value()) {
            *state_ = std::move(decoded).Unwrap();
        } else {
            state_.emplace(std::move(decoded).Unwrap());
        }
        session_id_ = state_->session_id;
        EnforceSkippedKeyCap(state_->next_skipped_sequence);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    std::string DoubleRatchetSession::SessionId() const {
        std::lock_guard<std::mutex> guard(lock_);
        return session_id_;
    }

    bool DoubleRatchetSession::IsReady() const {
        std::lock_guard<std::mutex> guard(lock_);
        return state_.has_value();
    }

    std::optional<SessionRole> DoubleRatchetSession::Role() const {
        std::lock_guard<std::mutex> guard(lock_);
        if (!state_.has_value()) {
            return std::nullopt;
        }
        return state_->role;
    }

    uint32_t DoubleRatchetSession::SendingMessageNumber() const {
        std::lock_guard<std::mutex> guard(lock_);
        return state_.has_value() ? state_->ratchet.ns : 0;
    }

    uint32_t DoubleRatchetSession::ReceivingMessageNumber() const {
        std::lock_guard<std::mutex> guard(lock_);
        return state_.has_value() ? state_->ratchet.nr : 0;
    }

    uint32_t DoubleRatchetSession::PreviousSendingChainLength() const {
        std::lock_guard<std::mutex> guard(lock_);
        return state_.has_value() ? state_->ratchet.pn : 0;
    }

    size_t DoubleRatchetSession::SkippedKeyCount() const {
        std::lock_guard<std::mutex> guard(lock_);
        return state_.has_value() ? state_->skipped.size() : 0;
    }

    std::vector<uint8_t> DoubleRatchetSession::LocalRatchetPublicKey() const {
        std::lock_guard<std::mutex> guard(lock_);
        if (!state_.has_value() || !state_->ratchet.dhs.has_value()) {
            return {};
        }
        return state_->ratchet.dhs->GetPublicKeyCopy();
    }

    int64_t DoubleRatchetSession::CreatedAt() const {
        std::lock_guard<std::mutex> guard(lock_);
        return state_.has_value() ? state_->created_at_ms : 0;
    }

    int64_t DoubleRatchetSession::LastActivity() const {
        std::lock_guard<std::mutex> guard(lock_);
        return state_.has_value() ? state_->last_activity_ms : 0;
    }
}
