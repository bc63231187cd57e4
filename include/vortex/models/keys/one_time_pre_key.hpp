#pragma once
#include "vortex/core/result.hpp"
#include "vortex/core/failures.hpp"
#include "vortex/models/key_materials/x25519_key_pair.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace vortex::protocol::models {

class OneTimePreKey {
public:
    [[nodiscard]] static Result<OneTimePreKey, ProtocolFailure> Generate(uint32_t key_id);

    OneTimePreKey(uint32_t key_id, X25519KeyPair key_pair, bool used = false);
    OneTimePreKey(OneTimePreKey&&) noexcept = default;
    OneTimePreKey& operator=(OneTimePreKey&&) noexcept = default;
    OneTimePreKey(const OneTimePreKey&) = delete;
    OneTimePreKey& operator=(const OneTimePreKey&) = delete;
    ~OneTimePreKey() = default;

    [[nodiscard]] uint32_t GetKeyId() const noexcept {
        return key_id_;
    }
    [[nodiscard]] const X25519KeyPair& GetKeyPair() const noexcept {
        return key_pair_;
    }
    [[nodiscard]] std::span<const uint8_t> GetPublicKeySpan() const noexcept {
        return std::span<const uint8_t>(key_pair_.GetPublicKey());
    }
    [[nodiscard]] bool IsUsed() const noexcept {
        return used_;
    }
    void MarkUsed() noexcept {
        used_ = true;
    }

private:
    uint32_t key_id_;
    X25519KeyPair key_pair_;
    bool used_;
};

}
