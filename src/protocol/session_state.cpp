#include "vortex/protocol/session_state.hpp"
#include "vortex/protocol/constants.hpp"
#include "vortex/crypto/sodium_interop.hpp"
#include <charconv>
#include <limits>

namespace vortex::protocol {
    using crypto::SodiumInterop;

    namespace {
        void WipeBytes(std::vector<uint8_t>& bytes) noexcept {
            if (!bytes.empty()) {
                auto _wipe = SodiumInterop::SecureWipe(std::span(bytes));
                (void) _wipe;
            }
            bytes.clear();
        }

        void WipeOptional(std::optional<std::vector<uint8_t>>& bytes) noexcept {
            if (bytes.has_value()) {
                WipeBytes(*bytes);
                bytes.reset();
            }
        }
    }

    std::string SkippedKeyId::ToString() const {
        return SodiumInterop::ToBase64Url(dh) + ":" + std::to_string(n);
    }

    Result<SkippedKeyId, ProtocolFailure> SkippedKeyId::Parse(std::string_view text) {
        const auto separator = text.rfind(':');
        if (separator == std::string_view::npos || separator == 0 || separator + 1 == text.size()) {
            return Result<SkippedKeyId, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Skipped key id must have the form <dh>:<n>"));
        }

        const auto counter_text = text.substr(separator + 1);
        uint32_t n = 0;
        const auto [end, ec] = std::from_chars(counter_text.data(), counter_text.data() + counter_text.size(), n);
        if (ec != std::errc() || end != counter_text.data() + counter_text.size()) {
            return Result<SkippedKeyId, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Skipped key counter is not a valid uint32"));
        }

        auto dh_result = SodiumInterop::FromBase64Url(text.substr(0, separator));
        if (dh_result.IsErr()) {
            return Result<SkippedKeyId, ProtocolFailure>::Err(std::move(dh_result).UnwrapErr());
        }
        auto dh = std::move(dh_result).Unwrap();
        if (dh.size() != kX25519PublicKeyBytes) {
            return Result<SkippedKeyId, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Skipped key ratchet key must be " +
                                        std::to_string(kX25519PublicKeyBytes) + " bytes"));
        }
        return Result<SkippedKeyId, ProtocolFailure>::Ok(SkippedKeyId{std::move(dh), n});
    }

    void WipeSkippedKeys(SkippedKeyMap& skipped) noexcept {
        for (auto& [id, entry] : skipped) {
            WipeBytes(entry.message_key);
        }
        skipped.clear();
    }

    void ReplaceSecret(std::vector<uint8_t>& target, std::vector<uint8_t>&& value) noexcept {
        WipeBytes(target);
        target = std::move(value);
    }

    void ReplaceSecret(std::optional<std::vector<uint8_t>>& target, std::vector<uint8_t>&& value) noexcept {
        WipeOptional(target);
        target = std::move(value);
    }

    RatchetState& RatchetState::operator=(RatchetState&& other) noexcept {
        if (this != &other) {
            Wipe();
            dhs = std::move(other.dhs);
            dhr = std::move(other.dhr);
            root_key = std::move(other.root_key);
            cks = std::move(other.cks);
            ckr = std::move(other.ckr);
            hks = std::move(other.hks);
            hkr = std::move(other.hkr);
            ns = other.ns;
            nr = other.nr;
            pn = other.pn;
        }
        return *this;
    }

    RatchetState::~RatchetState() {
        Wipe();
    }

    Result<RatchetState, ProtocolFailure> RatchetState::Clone() const {
        RatchetState copy;
        if (dhs.has_value()) {
            auto dhs_result = dhs->Clone();
            if (dhs_result.IsErr()) {
                return Result<RatchetState, ProtocolFailure>::Err(std::move(dhs_result).UnwrapErr());
            }
            copy.dhs.emplace(std::move(dhs_result).Unwrap());
        }
        copy.dhr = dhr;
        copy.root_key = root_key;
        copy.cks = cks;
        copy.ckr = ckr;
        copy.hks = hks;
        copy.hkr = hkr;
        copy.ns = ns;
        copy.nr = nr;
        copy.pn = pn;
        return Result<RatchetState, ProtocolFailure>::Ok(std::move(copy));
    }

    void RatchetState::Wipe() noexcept {
        WipeBytes(root_key);
        WipeOptional(cks);
        WipeOptional(ckr);
        WipeOptional(hks);
        WipeOptional(hkr);
    }

    SessionState& SessionState::operator=(SessionState&& other) noexcept {
        if (this != &other) {
            WipeSkippedKeys(skipped);
            session_id = std::move(other.session_id);
            role = other.role;
            ratchet = std::move(other.ratchet);
            skipped = std::move(other.skipped);
            local_identity_key = std::move(other.local_identity_key);
            remote_identity_key = std::move(other.remote_identity_key);
            created_at_ms = other.created_at_ms;
            last_activity_ms = other.last_activity_ms;
            next_skipped_sequence = other.next_skipped_sequence;
        }
        return *this;
    }

    SessionState::~SessionState() {
        WipeSkippedKeys(skipped);
        ratchet.Wipe();
    }
}
