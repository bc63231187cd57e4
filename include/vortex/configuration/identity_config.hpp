#pragma once

#include <sodium.h>
#include <cstddef>
#include <cstdint>

namespace vortex::protocol::configuration {

/**
 * @brief Pre-key pool sizing and backup password-hash cost for IdentityManager
 *
 * The password-hash limits are not recorded in the backup blob, so a backup
 * can only be imported by a manager configured with the same limits that
 * exported it. Default() uses the libsodium MODERATE preset.
 */
class IdentityConfig {
public:
    IdentityConfig(
        uint32_t initial_one_time_pre_keys,
        uint32_t low_water_mark,
        uint32_t batch_size,
        uint32_t max_registration_id,
        unsigned long long password_ops_limit,
        size_t password_mem_limit) noexcept
        : initial_one_time_pre_keys_(initial_one_time_pre_keys)
        , low_water_mark_(low_water_mark)
        , batch_size_(batch_size)
        , max_registration_id_(max_registration_id)
        , password_ops_limit_(password_ops_limit)
        , password_mem_limit_(password_mem_limit) {}

    [[nodiscard]] static IdentityConfig Default() noexcept {
        return {100, 20, 50, 16380,
                crypto_pwhash_OPSLIMIT_MODERATE, crypto_pwhash_MEMLIMIT_MODERATE};
    }

    /// Same pool sizing, cheaper password hash for constrained devices.
    [[nodiscard]] static IdentityConfig Interactive() noexcept {
        return {100, 20, 50, 16380,
                crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE};
    }

    [[nodiscard]] uint32_t GetInitialOneTimePreKeys() const noexcept { return initial_one_time_pre_keys_; }
    [[nodiscard]] uint32_t GetLowWaterMark() const noexcept { return low_water_mark_; }
    [[nodiscard]] uint32_t GetBatchSize() const noexcept { return batch_size_; }
    [[nodiscard]] uint32_t GetMaxRegistrationId() const noexcept { return max_registration_id_; }
    [[nodiscard]] unsigned long long GetPasswordOpsLimit() const noexcept { return password_ops_limit_; }
    [[nodiscard]] size_t GetPasswordMemLimit() const noexcept { return password_mem_limit_; }

    [[nodiscard]] bool IsValid() const noexcept {
        return batch_size_ > 0 &&
               max_registration_id_ > 0 &&
               password_ops_limit_ >= crypto_pwhash_OPSLIMIT_MIN &&
               password_mem_limit_ >= crypto_pwhash_MEMLIMIT_MIN;
    }

private:
    uint32_t initial_one_time_pre_keys_;
    uint32_t low_water_mark_;
    uint32_t batch_size_;
    uint32_t max_registration_id_;
    unsigned long long password_ops_limit_;
    size_t password_mem_limit_;
};

}
