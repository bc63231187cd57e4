#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace vortex::protocol::configuration {

/**
 * @brief Limits applied by a DoubleRatchetSession to skipped-message bookkeeping
 *
 * **max_skip**: the largest number of receive-chain steps a single incoming
 * message may force. A header whose counter lies further ahead is rejected
 * with TooManySkippedMessages before any key is derived.
 *
 * **skipped_key_max_age**: default age used by CleanupSkippedKeys().
 *
 * **max_skipped_keys**: hard cap on cached skipped keys across all chains.
 * When the cap is exceeded the oldest entries are evicted first.
 *
 * ```cpp
 * auto config = RatchetConfig::Default();   // 1000 / 7 days / 2000
 * DoubleRatchetSession session(config);
 * ```
 */
class RatchetConfig {
public:
    RatchetConfig(
        uint32_t max_skip,
        std::chrono::milliseconds skipped_key_max_age,
        size_t max_skipped_keys) noexcept
        : max_skip_(max_skip)
        , skipped_key_max_age_(skipped_key_max_age)
        , max_skipped_keys_(max_skipped_keys) {}

    [[nodiscard]] static RatchetConfig Default() noexcept {
        return {kDefaultMaxSkip, kDefaultSkippedKeyMaxAge, kDefaultMaxSkippedKeys};
    }

    [[nodiscard]] uint32_t GetMaxSkip() const noexcept {
        return max_skip_;
    }

    [[nodiscard]] std::chrono::milliseconds GetSkippedKeyMaxAge() const noexcept {
        return skipped_key_max_age_;
    }

    [[nodiscard]] size_t GetMaxSkippedKeys() const noexcept {
        return max_skipped_keys_;
    }

    /// A single decrypt can cache up to two skip windows (the rest of the
    /// previous chain plus the gap in the new one), so the cache must hold both.
    [[nodiscard]] bool IsValid() const noexcept {
        return max_skip_ > 0 &&
               skipped_key_max_age_.count() > 0 &&
               max_skipped_keys_ >= 2 * static_cast<size_t>(max_skip_);
    }

    [[nodiscard]] bool operator==(const RatchetConfig& other) const noexcept {
        return max_skip_ == other.max_skip_ &&
               skipped_key_max_age_ == other.skipped_key_max_age_ &&
               max_skipped_keys_ == other.max_skipped_keys_;
    }

    [[nodiscard]] bool operator!=(const RatchetConfig& other) const noexcept {
        return !(*this == other);
    }

    static constexpr uint32_t kDefaultMaxSkip = 1000;
    static constexpr std::chrono::milliseconds kDefaultSkippedKeyMaxAge{7LL * 24 * 60 * 60 * 1000};
    static constexpr size_t kDefaultMaxSkippedKeys = 2000;

private:
    uint32_t max_skip_;
    std::chrono::milliseconds skipped_key_max_age_;
    size_t max_skipped_keys_;
};

}
