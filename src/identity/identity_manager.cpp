#include "vortex/identity/identity_manager.hpp"
#include "vortex/core/constants.hpp"
#include "vortex/protocol/constants.hpp"
#include "vortex/crypto/aead.hpp"
#include "vortex/crypto/sodium_interop.hpp"
#include "vortex/serialization/state_codec.hpp"
#include "vortex/debug/protocol_logger.hpp"
#include <algorithm>
#include <chrono>
#include <limits>

namespace vortex::protocol::identity {
    using crypto::Aead;
    using crypto::SodiumInterop;
    using serialization::IdentityBackupBlob;
    using serialization::StateCodec;

    namespace {
        int64_t NowMs() {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        }

        template<typename T>
        Result<T, ProtocolFailure> NoIdentity() {
            return Result<T, ProtocolFailure>::Err(
                ProtocolFailure::NotInitialized(std::string(ErrorMessages::NO_IDENTITY)));
        }

        std::span<const uint8_t> AsBytes(std::string_view text) {
            return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
        }

        void WipeString(std::string& text) {
            if (!text.empty()) {
                auto _wipe = SodiumInterop::SecureWipe(
                    std::span<uint8_t>(reinterpret_cast<uint8_t*>(text.data()), text.size()));
                (void) _wipe;
            }
            text.clear();
        }

        void WipeBytes(std::vector<uint8_t>& bytes) {
            if (!bytes.empty()) {
                auto _wipe = SodiumInterop::SecureWipe(std::span(bytes));
                (void) _wipe;
            }
            bytes.clear();
        }
    }

    IdentityManager::IdentityManager(IdentityConfig config)
        : config_(config)
          , store_(std::nullopt)
          , lock_(std::make_unique<std::shared_mutex>()) {
    }

    IdentitySummary IdentityManager::Summarize(const IdentityStore& store) {
        IdentitySummary summary;
        summary.identity_public_key = store.GetIdentityKeyPair().GetPublicKeyCopy();
        summary.signing_public_key = store.GetSigningKeyPair().GetPublicKey();
        summary.registration_id = store.GetRegistrationId();
        summary.signed_pre_key_id = store.GetSignedPreKey().GetKeyId();
        summary.one_time_pre_key_count = store.GetOneTimePreKeys().size();
        summary.fingerprint = store.GetFingerprint();
        summary.created_at = store.GetCreatedAt();
        return summary;
    }

    Result<IdentitySummary, ProtocolFailure> IdentityManager::GenerateIdentity() {
        if (!SodiumInterop::IsInitialized()) {
            return Result<IdentitySummary, ProtocolFailure>::Err(
                ProtocolFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
        }
        if (!config_.IsValid()) {
            return Result<IdentitySummary, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Identity configuration is invalid"));
        }

        auto identity_result = X25519KeyPair::Generate("identity");
        if (identity_result.IsErr()) {
            return Result<IdentitySummary, ProtocolFailure>::Err(std::move(identity_result).UnwrapErr());
        }
        auto signing_result = Ed25519KeyPair::Generate();
        if (signing_result.IsErr()) {
            return Result<IdentitySummary, ProtocolFailure>::Err(std::move(signing_result).UnwrapErr());
        }
        auto identity_key_pair = std::move(identity_result).Unwrap();
        auto signing_key_pair = std::move(signing_result).Unwrap();

        auto signed_pre_key_result = SignedPreKey::Generate(1, signing_key_pair);
        if (signed_pre_key_result.IsErr()) {
            return Result<IdentitySummary, ProtocolFailure>::Err(std::move(signed_pre_key_result).UnwrapErr());
        }
        auto one_time_result = GenerateOneTimePreKeys(config_.GetInitialOneTimePreKeys(), 1);
        if (one_time_result.IsErr()) {
            return Result<IdentitySummary, ProtocolFailure>::Err(std::move(one_time_result).UnwrapErr());
        }
        auto fingerprint_result = ComputeFingerprint(identity_key_pair.GetPublicKey());
        if (fingerprint_result.IsErr()) {
            return Result<IdentitySummary, ProtocolFailure>::Err(std::move(fingerprint_result).UnwrapErr());
        }
        const uint32_t registration_id = SodiumInterop::GenerateRandomUniform(config_.GetMaxRegistrationId()) + 1;

        IdentityStore store(
            std::move(identity_key_pair),
            std::move(signing_key_pair),
            registration_id,
            std::move(signed_pre_key_result).Unwrap(),
            std::move(one_time_result).Unwrap(),
            NowMs(),
            std::move(fingerprint_result).Unwrap());

        std::unique_lock lock(*lock_);
        store_.emplace(std::move(store));
        VORTEX_LOG_VALUE(debug::Side::Identity, "GENERATE", "registration_id", registration_id);
        VORTEX_LOG_PUBLIC_KEY(debug::Side::Identity, "GENERATE", "identity_public",
                              store_->GetIdentityKeyPair().GetPublicKey());
        return Result<IdentitySummary, ProtocolFailure>::Ok(Summarize(*store_));
    }

    Result<models::SignedPreKey, ProtocolFailure> IdentityManager::GenerateSignedPreKey(uint32_t key_id) const {
        std::shared_lock lock(*lock_);
        return GenerateSignedPreKeyLocked(key_id);
    }

    Result<models::SignedPreKey, ProtocolFailure> IdentityManager::GenerateSignedPreKeyLocked(
        uint32_t key_id) const {
        if (!store_.has_value()) {
            return NoIdentity<SignedPreKey>();
        }
        return SignedPreKey::Generate(key_id, store_->GetSigningKeyPair());
    }

    Result<std::vector<models::OneTimePreKey>, ProtocolFailure> IdentityManager::GenerateOneTimePreKeys(
        uint32_t count,
        uint32_t start_id) {
        if (count > 0 && start_id > std::numeric_limits<uint32_t>::max() - (count - 1)) {
            return Result<std::vector<OneTimePreKey>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("One-time pre-key ids would overflow"));
        }
        std::vector<OneTimePreKey> keys;
        keys.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            auto key_result = OneTimePreKey::Generate(start_id + i);
            if (key_result.IsErr()) {
                return Result<std::vector<OneTimePreKey>, ProtocolFailure>::Err(std::move(key_result).UnwrapErr());
            }
            keys.push_back(std::move(key_result).Unwrap());
        }
        return Result<std::vector<OneTimePreKey>, ProtocolFailure>::Ok(std::move(keys));
    }

    std::optional<PreKeyBundle> IdentityManager::GetPreKeyBundle() const {
        std::shared_lock lock(*lock_);
        if (!store_.has_value()) {
            return std::nullopt;
        }
        const auto& signed_pre_key = store_->GetSignedPreKey();
        PreKeyBundle bundle;
        bundle.identity_key = store_->GetIdentityKeyPair().GetPublicKeyCopy();
        bundle.signed_pre_key = signed_pre_key.GetKeyPair().GetPublicKeyCopy();
        bundle.signed_pre_key_signature = signed_pre_key.GetSignature();
        bundle.registration_id = store_->GetRegistrationId();
        bundle.signing_key = store_->GetSigningKeyPair().GetPublicKey();
        bundle.signed_pre_key_id = signed_pre_key.GetKeyId();
        if (const auto* one_time = store_->FirstUnusedOneTimePreKey(); one_time != nullptr) {
            bundle.one_time_pre_key = one_time->GetKeyPair().GetPublicKeyCopy();
            bundle.one_time_pre_key_id = one_time->GetKeyId();
        }
        return bundle;
    }

    Result<bool, ProtocolFailure> IdentityManager::MarkOneTimePreKeyUsed(std::span<const uint8_t> public_key) {
        std::unique_lock lock(*lock_);
        if (!store_.has_value()) {
            return NoIdentity<bool>();
        }
        auto* key = store_->FindOneTimePreKey(public_key);
        if (key == nullptr) {
            return Result<bool, ProtocolFailure>::Ok(false);
        }
        key->MarkUsed();
        VORTEX_LOG_VALUE(debug::Side::Identity, "PREKEYS", "marked_used", key->GetKeyId());

        if (store_->UnusedOneTimePreKeyCount() < config_.GetLowWaterMark()) {
            auto replenish = ReplenishOneTimePreKeysLocked();
            if (replenish.IsErr()) {
                return Result<bool, ProtocolFailure>::Err(std::move(replenish).UnwrapErr());
            }
        }
        return Result<bool, ProtocolFailure>::Ok(true);
    }

    Result<Unit, ProtocolFailure> IdentityManager::ReplenishOneTimePreKeysLocked() {
        const uint32_t first_id = store_->MaxOneTimePreKeyId() + 1;
        auto batch = GenerateOneTimePreKeys(config_.GetBatchSize(), first_id);
        if (batch.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(batch).UnwrapErr());
        }
        store_->AppendOneTimePreKeys(std::move(batch).Unwrap());
        debug::LogPreKeysReplenished(first_id, config_.GetBatchSize());
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::optional<X25519KeyPair>, ProtocolFailure> IdentityManager::GetOneTimePreKeyPair(
        std::span<const uint8_t> public_key) const {
        std::shared_lock lock(*lock_);
        if (!store_.has_value()) {
            return NoIdentity<std::optional<X25519KeyPair>>();
        }
        const auto* key = store_->FindOneTimePreKey(public_key);
        if (key == nullptr || key->IsUsed()) {
            return Result<std::optional<X25519KeyPair>, ProtocolFailure>::Ok(std::nullopt);
        }
        auto clone = key->GetKeyPair().Clone();
        if (clone.IsErr()) {
            return Result<std::optional<X25519KeyPair>, ProtocolFailure>::Err(std::move(clone).UnwrapErr());
        }
        return Result<std::optional<X25519KeyPair>, ProtocolFailure>::Ok(
            std::optional<X25519KeyPair>(std::move(clone).Unwrap()));
    }

    Result<uint32_t, ProtocolFailure> IdentityManager::RotateSignedPreKey() {
        std::unique_lock lock(*lock_);
        if (!store_.has_value()) {
            return NoIdentity<uint32_t>();
        }
        const uint32_t current_id = store_->GetSignedPreKey().GetKeyId();
        if (current_id == std::numeric_limits<uint32_t>::max()) {
            return Result<uint32_t, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Signed pre-key id space exhausted"));
        }
        auto next = GenerateSignedPreKeyLocked(current_id + 1);
        if (next.IsErr()) {
            return Result<uint32_t, ProtocolFailure>::Err(std::move(next).UnwrapErr());
        }
        store_->ReplaceSignedPreKey(std::move(next).Unwrap());
        debug::LogSignedPreKeyRotated(current_id + 1, store_->GetSignedPreKey().GetKeyPair().GetPublicKey());
        return Result<uint32_t, ProtocolFailure>::Ok(current_id + 1);
    }

    bool IdentityManager::VerifyPreKeyBundle(
        const PreKeyBundle& bundle,
        std::span<const uint8_t> signing_public_key) noexcept {
        if (signing_public_key.size() != kEd25519PublicKeyBytes ||
            bundle.signed_pre_key.size() != kX25519PublicKeyBytes ||
            bundle.signed_pre_key_signature.size() != kEd25519SignatureBytes) {
            return false;
        }
        return SodiumInterop::VerifyDetached(
            signing_public_key, bundle.signed_pre_key, bundle.signed_pre_key_signature);
    }

    Result<std::string, ProtocolFailure> IdentityManager::ComputeSafetyNumber(
        std::span<const uint8_t> their_identity_key) const {
        std::shared_lock lock(*lock_);
        if (!store_.has_value()) {
            return NoIdentity<std::string>();
        }
        if (their_identity_key.size() != kX25519PublicKeyBytes) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Identity key must be " +
                                              std::to_string(kX25519PublicKeyBytes) + " bytes"));
        }
        const auto& mine = store_->GetIdentityKeyPair().GetPublicKey();
        const bool mine_first = std::lexicographical_compare(
            mine.begin(), mine.end(), their_identity_key.begin(), their_identity_key.end());
        const std::span<const uint8_t> first = mine_first ? std::span<const uint8_t>(mine) : their_identity_key;
        const std::span<const uint8_t> second = mine_first ? their_identity_key : std::span<const uint8_t>(mine);

        std::vector<uint8_t> combined;
        combined.reserve(first.size() + second.size());
        combined.insert(combined.end(), first.begin(), first.end());
        combined.insert(combined.end(), second.begin(), second.end());

        auto hash_result = SodiumInterop::GenericHash(combined, kFingerprintHashBytes);
        if (hash_result.IsErr()) {
            return Result<std::string, ProtocolFailure>::Err(std::move(hash_result).UnwrapErr());
        }
        const auto hash = std::move(hash_result).Unwrap();

        std::string safety_number;
        for (size_t group = 0; group < kSafetyNumberGroups; ++group) {
            uint64_t window = 0;
            for (size_t i = 0; i < kSafetyNumberWindowBytes; ++i) {
                window = (window << 8) | hash[group * kSafetyNumberWindowBytes + i];
            }
            std::string digits = std::to_string(window % kSafetyNumberModulus);
            digits.insert(0, 5 - digits.size(), '0');
            if (!safety_number.empty()) {
                safety_number.push_back(' ');
            }
            safety_number += digits;
        }
        return Result<std::string, ProtocolFailure>::Ok(std::move(safety_number));
    }

    Result<std::string, ProtocolFailure> IdentityManager::ComputeFingerprint(
        std::span<const uint8_t> identity_public_key) {
        if (identity_public_key.size() != kX25519PublicKeyBytes) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Identity key must be " +
                                              std::to_string(kX25519PublicKeyBytes) + " bytes"));
        }
        auto hash_result = SodiumInterop::GenericHash(identity_public_key, kFingerprintHashBytes);
        if (hash_result.IsErr()) {
            return Result<std::string, ProtocolFailure>::Err(std::move(hash_result).UnwrapErr());
        }
        const std::string hex = SodiumInterop::ToHex(hash_result.Unwrap());
        std::string fingerprint;
        for (size_t group = 0; group < kFingerprintGroups; ++group) {
            if (group > 0) {
                fingerprint.push_back(' ');
            }
            fingerprint += hex.substr(group * kFingerprintGroupChars, kFingerprintGroupChars);
        }
        return Result<std::string, ProtocolFailure>::Ok(std::move(fingerprint));
    }

    std::string IdentityManager::GetFingerprint() const {
        std::shared_lock lock(*lock_);
        return store_.has_value() ? store_->GetFingerprint() : std::string();
    }

    Result<std::string, ProtocolFailure> IdentityManager::ExportIdentity(std::string_view password) const {
        std::shared_lock lock(*lock_);
        if (!store_.has_value()) {
            return NoIdentity<std::string>();
        }
        auto document_result = StateCodec::EncodeIdentity(*store_);
        if (document_result.IsErr()) {
            return Result<std::string, ProtocolFailure>::Err(std::move(document_result).UnwrapErr());
        }
        auto document = std::move(document_result).Unwrap();

        IdentityBackupBlob blob;
        blob.version = kIdentityBackupVersion;
        blob.salt = SodiumInterop::GetRandomBytes(kBackupSaltBytes);
        auto key_result = SodiumInterop::DeriveKeyFromPassword(
            password, blob.salt, kAeadKeyBytes,
            config_.GetPasswordOpsLimit(), config_.GetPasswordMemLimit());
        if (key_result.IsErr()) {
            WipeString(document);
            return Result<std::string, ProtocolFailure>::Err(std::move(key_result).UnwrapErr());
        }
        auto key = std::move(key_result).Unwrap();
        blob.nonce = Aead::GenerateNonce();
        auto data_result = Aead::Encrypt(key, blob.nonce, AsBytes(document));
        WipeBytes(key);
        WipeString(document);
        if (data_result.IsErr()) {
            return Result<std::string, ProtocolFailure>::Err(std::move(data_result).UnwrapErr());
        }
        blob.data = std::move(data_result).Unwrap();
        return StateCodec::EncodeBackup(blob);
    }

    Result<IdentitySummary, ProtocolFailure> IdentityManager::ImportIdentity(
        std::string_view backup,
        std::string_view password) {
        auto blob_result = StateCodec::DecodeBackup(backup);
        if (blob_result.IsErr()) {
            return Result<IdentitySummary, ProtocolFailure>::Err(std::move(blob_result).UnwrapErr());
        }
        const auto blob = std::move(blob_result).Unwrap();
        if (blob.version != kIdentityBackupVersion) {
            return Result<IdentitySummary, ProtocolFailure>::Err(
                ProtocolFailure::BackupVersionMismatch(
                    "Unsupported backup version " + std::to_string(blob.version)));
        }

        auto key_result = SodiumInterop::DeriveKeyFromPassword(
            password, blob.salt, kAeadKeyBytes,
            config_.GetPasswordOpsLimit(), config_.GetPasswordMemLimit());
        if (key_result.IsErr()) {
            return Result<IdentitySummary, ProtocolFailure>::Err(std::move(key_result).UnwrapErr());
        }
        auto key = std::move(key_result).Unwrap();
        auto plaintext_result = Aead::Decrypt(key, blob.nonce, blob.data);
        WipeBytes(key);
        if (plaintext_result.IsErr()) {
            return Result<IdentitySummary, ProtocolFailure>::Err(
                ProtocolFailure::BackupAuthenticationFailure(std::string(ErrorMessages::BACKUP_AUTHENTICATION_FAILED)));
        }
        auto plaintext = std::move(plaintext_result).Unwrap();
        std::string document(plaintext.begin(), plaintext.end());
        WipeBytes(plaintext);

        auto store_result = StateCodec::DecodeIdentity(document);
        WipeString(document);
        if (store_result.IsErr()) {
            return Result<IdentitySummary, ProtocolFailure>::Err(std::move(store_result).UnwrapErr());
        }
        auto store = std::move(store_result).Unwrap();

        auto fingerprint = ComputeFingerprint(store.GetIdentityKeyPair().GetPublicKey());
        if (fingerprint.IsErr() || fingerprint.Unwrap() != store.GetFingerprint()) {
            return Result<IdentitySummary, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Backup fingerprint does not match its identity key"));
        }
        if (!SodiumInterop::VerifyDetached(
                store.GetSigningKeyPair().GetPublicKey(),
                store.GetSignedPreKey().GetKeyPair().GetPublicKey(),
                store.GetSignedPreKey().GetSignature())) {
            return Result<IdentitySummary, ProtocolFailure>::Err(
                ProtocolFailure::InvalidBundleSignature("Backup signed pre-key signature is invalid"));
        }

        std::unique_lock lock(*lock_);
        store_.emplace(std::move(store));
        return Result<IdentitySummary, ProtocolFailure>::Ok(Summarize(*store_));
    }

    Result<X25519KeyPair, ProtocolFailure> IdentityManager::GetIdentityKeyPair() const {
        std::shared_lock lock(*lock_);
        if (!store_.has_value()) {
            return NoIdentity<X25519KeyPair>();
        }
        return store_->GetIdentityKeyPair().Clone();
    }

    Result<X25519KeyPair, ProtocolFailure> IdentityManager::GetSignedPreKeyPair() const {
        std::shared_lock lock(*lock_);
        if (!store_.has_value()) {
            return NoIdentity<X25519KeyPair>();
        }
        return store_->GetSignedPreKey().GetKeyPair().Clone();
    }

    std::optional<std::vector<uint8_t>> IdentityManager::GetIdentityPublicKey() const {
        std::shared_lock lock(*lock_);
        if (!store_.has_value()) {
            return std::nullopt;
        }
        return store_->GetIdentityKeyPair().GetPublicKeyCopy();
    }

    std::optional<std::vector<uint8_t>> IdentityManager::GetSigningPublicKey() const {
        std::shared_lock lock(*lock_);
        if (!store_.has_value()) {
            return std::nullopt;
        }
        return store_->GetSigningKeyPair().GetPublicKey();
    }

    bool IdentityManager::IsInitialized() const {
        std::shared_lock lock(*lock_);
        return store_.has_value();
    }

    std::optional<uint32_t> IdentityManager::RegistrationId() const {
        std::shared_lock lock(*lock_);
        if (!store_.has_value()) {
            return std::nullopt;
        }
        return store_->GetRegistrationId();
    }

    std::optional<uint32_t> IdentityManager::SignedPreKeyId() const {
        std::shared_lock lock(*lock_);
        if (!store_.has_value()) {
            return std::nullopt;
        }
        return store_->GetSignedPreKey().GetKeyId();
    }

    size_t IdentityManager::UnusedOneTimePreKeyCount() const {
        std::shared_lock lock(*lock_);
        return store_.has_value() ? store_->UnusedOneTimePreKeyCount() : 0;
    }
}
