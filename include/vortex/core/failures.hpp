#pragma once
#include <string>
#include <utility>

namespace vortex::protocol {

enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};

enum class ProtocolFailureType {
    Generic,
    InitializationFailed,
    NotInitialized,
    KeyGeneration,
    DeriveKey,
    InvalidInput,
    InvalidState,
    Decode,
    Encode,
    AuthenticationFailure,
    ReplayAttack,
    TooManySkippedMessages,
    InvalidBundleSignature,
    BackupVersionMismatch,
    BackupAuthenticationFailure
};

class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/// Error value carried by every fallible public operation.
///
/// Messages describe what went wrong in terms of sizes, counters and ids.
/// They never embed key material or plaintext.
class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;
    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ProtocolFailure Generic(std::string msg) {
        return {ProtocolFailureType::Generic, std::move(msg)};
    }
    static ProtocolFailure InitializationFailed(std::string msg) {
        return {ProtocolFailureType::InitializationFailed, std::move(msg)};
    }
    static ProtocolFailure NotInitialized(std::string msg) {
        return {ProtocolFailureType::NotInitialized, std::move(msg)};
    }
    static ProtocolFailure KeyGeneration(std::string msg) {
        return {ProtocolFailureType::KeyGeneration, std::move(msg)};
    }
    static ProtocolFailure DeriveKey(std::string msg) {
        return {ProtocolFailureType::DeriveKey, std::move(msg)};
    }
    static ProtocolFailure InvalidInput(std::string msg) {
        return {ProtocolFailureType::InvalidInput, std::move(msg)};
    }
    static ProtocolFailure InvalidState(std::string msg) {
        return {ProtocolFailureType::InvalidState, std::move(msg)};
    }
    static ProtocolFailure Decode(std::string msg) {
        return {ProtocolFailureType::Decode, std::move(msg)};
    }
    static ProtocolFailure Encode(std::string msg) {
        return {ProtocolFailureType::Encode, std::move(msg)};
    }
    static ProtocolFailure AuthenticationFailure(std::string msg) {
        return {ProtocolFailureType::AuthenticationFailure, std::move(msg)};
    }
    static ProtocolFailure ReplayAttack(std::string msg) {
        return {ProtocolFailureType::ReplayAttack, std::move(msg)};
    }
    static ProtocolFailure TooManySkippedMessages(std::string msg) {
        return {ProtocolFailureType::TooManySkippedMessages, std::move(msg)};
    }
    static ProtocolFailure InvalidBundleSignature(std::string msg) {
        return {ProtocolFailureType::InvalidBundleSignature, std::move(msg)};
    }
    static ProtocolFailure BackupVersionMismatch(std::string msg) {
        return {ProtocolFailureType::BackupVersionMismatch, std::move(msg)};
    }
    static ProtocolFailure BackupAuthenticationFailure(std::string msg) {
        return {ProtocolFailureType::BackupAuthenticationFailure, std::move(msg)};
    }
    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::InitializationFailed) {
            return InitializationFailed(sf.message);
        }
        return Generic(sf.message);
    }
};

}
