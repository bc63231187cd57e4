#pragma once
#include "vortex/core/result.hpp"
#include "vortex/core/failures.hpp"
#include "vortex/models/bundles/pre_key_bundle.hpp"
#include "vortex/models/key_materials/x25519_key_pair.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace vortex::protocol {

/// Initiator side of X3DH: the shared secret plus the ephemeral pair whose
/// public half must reach the responder.
struct X3dhInitiatorOutput {
    std::vector<uint8_t> shared_secret;
    models::X25519KeyPair ephemeral_key_pair;
    bool used_one_time_pre_key = false;
};

/**
 * Extended Triple Diffie-Hellman.
 *
 * Initiator A against bundle B:
 *   DH1 = DH(IK_a, SPK_b)   DH2 = DH(E_a, IK_b)
 *   DH3 = DH(E_a, SPK_b)    DH4 = DH(E_a, OPK_b)  (only with a one-time pre-key)
 *
 * Responder B computes the same values with the roles swapped, so both
 * sides feed DH1 || DH2 || DH3 [|| DH4] into RatchetKdf::DeriveX3dhSecret.
 * Every peer public key is checked with DhValidator first.
 */
class X3dh {
public:
    [[nodiscard]] static Result<X3dhInitiatorOutput, ProtocolFailure> AgreeAsInitiator(
        const models::X25519KeyPair& local_identity,
        const models::PreKeyBundle& remote_bundle);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> AgreeAsResponder(
        const models::X25519KeyPair& local_identity,
        const models::X25519KeyPair& local_signed_pre_key,
        const models::X25519KeyPair* local_one_time_pre_key,
        std::span<const uint8_t> remote_identity_key,
        std::span<const uint8_t> remote_ephemeral_key);

private:
    X3dh() = delete;
};

}
