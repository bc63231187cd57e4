#pragma once
#include "vortex/core/result.hpp"
#include "vortex/core/failures.hpp"
#include "vortex/identity/identity_store.hpp"
#include "vortex/protocol/session_state.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace vortex::protocol::serialization {

/// Outer envelope of an encrypted identity backup: {"v":1,"salt":..,"nonce":..,"data":..}
struct IdentityBackupBlob {
    uint32_t version = 0;
    std::vector<uint8_t> salt;
    std::vector<uint8_t> nonce;
    std::vector<uint8_t> data;
};

/**
 * @brief JSON documents for everything that leaves the core for persistence
 *
 * Session export (version 1):
 *
 * ```json
 * {"version":1,"sessionId":"...","role":"SESSION_ROLE_SENDER",
 *  "DHs":{"publicKey":"...","privateKey":"..."},"DHr":"...","RK":"...",
 *  "CKs":"...","CKr":"...","Ns":3,"Nr":1,"PN":0,"HKs":"...","HKr":"...",
 *  "MKSKIPPED":[["<dh>:<n>",{"messageKey":"...","timestamp":1700000000000}]],
 *  "remoteIdentityKey":"...","localIdentityKey":"...",
 *  "createdAt":"1700000000000","lastActivity":"1700000000000"}
 * ```
 *
 * 64-bit timestamps outside MKSKIPPED are written as JSON strings and
 * accepted as either strings or numbers. Absent optional keys are omitted;
 * an empty string is read as absent.
 *
 * Every document carries private key material. Callers encrypt it before
 * it reaches storage.
 */
class StateCodec {
public:
    [[nodiscard]] static Result<std::string, ProtocolFailure> EncodeSession(const SessionState& state);

    /// Validates version, key sizes and key-pair consistency.
    [[nodiscard]] static Result<SessionState, ProtocolFailure> DecodeSession(std::string_view json);

    [[nodiscard]] static Result<std::string, ProtocolFailure> EncodeIdentity(const identity::IdentityStore& store);

    [[nodiscard]] static Result<identity::IdentityStore, ProtocolFailure> DecodeIdentity(std::string_view json);

    [[nodiscard]] static Result<std::string, ProtocolFailure> EncodeBackup(const IdentityBackupBlob& blob);

    /// Parses the envelope only; the version is checked by the caller.
    [[nodiscard]] static Result<IdentityBackupBlob, ProtocolFailure> DecodeBackup(std::string_view json);

private:
    StateCodec() = delete;
};

}
