#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace vortex::protocol {

inline constexpr uint32_t kSessionStateVersion = 1;
inline constexpr uint32_t kIdentityBackupVersion = 1;

inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kX25519SharedSecretBytes = 32;
inline constexpr size_t kEd25519PublicKeyBytes = 32;
inline constexpr size_t kEd25519SecretKeyBytes = 64;
inline constexpr size_t kEd25519SignatureBytes = 64;

inline constexpr size_t kRootKeyBytes = 32;
inline constexpr size_t kChainKeyBytes = 32;
inline constexpr size_t kMessageKeyBytes = 32;
inline constexpr size_t kHeaderKeyBytes = 32;
inline constexpr size_t kMacBytes = 32;
inline constexpr size_t kRootKdfOutputBytes = kRootKeyBytes + kChainKeyBytes + kHeaderKeyBytes;

inline constexpr size_t kAeadKeyBytes = 32;
inline constexpr size_t kAeadNonceBytes = 12;
inline constexpr size_t kAeadTagBytes = 16;

inline constexpr size_t kMessageHeaderBytes = kX25519PublicKeyBytes + 4 + 4;
inline constexpr size_t kBackupSaltBytes = 16;
inline constexpr size_t kFingerprintHashBytes = 32;
inline constexpr size_t kFingerprintGroups = 8;
inline constexpr size_t kFingerprintGroupChars = 4;
inline constexpr size_t kSafetyNumberGroups = 6;
inline constexpr size_t kSafetyNumberWindowBytes = 5;
inline constexpr uint64_t kSafetyNumberModulus = 100000;

inline constexpr uint8_t kMessageKeySeed = 0x01;
inline constexpr uint8_t kChainKeySeed = 0x02;

inline constexpr std::string_view kRatchetInfo = "VORTEX_RATCHET";

}
