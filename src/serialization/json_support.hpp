#pragma once
#include "vortex/core/result.hpp"
#include "vortex/core/failures.hpp"
#include "vortex/crypto/sodium_interop.hpp"
#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vortex::protocol::serialization::detail {

inline Result<std::string, ProtocolFailure> PrintJson(const google::protobuf::Message& message) {
    google::protobuf::util::JsonPrintOptions options;
    options.always_print_primitive_fields = true;
    options.preserve_proto_field_names = false;
    std::string json;
    const auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
    if (!status.ok()) {
        return Result<std::string, ProtocolFailure>::Err(
            ProtocolFailure::Encode("JSON encoding failed: " + status.ToString()));
    }
    return Result<std::string, ProtocolFailure>::Ok(std::move(json));
}

inline Result<Unit, ProtocolFailure> ParseJson(
    std::string_view json,
    google::protobuf::Message* message,
    bool ignore_unknown_fields) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = ignore_unknown_fields;
    const auto status = google::protobuf::util::JsonStringToMessage(
        std::string(json), message, options);
    if (!status.ok()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Decode("Malformed JSON document: " + status.ToString()));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

inline std::string EncodeBytes(std::span<const uint8_t> bytes) {
    return crypto::SodiumInterop::ToBase64Url(bytes);
}

/// Decodes a base64url field and checks its length; expected_size 0 accepts any length.
inline Result<std::vector<uint8_t>, ProtocolFailure> DecodeBytes(
    const std::string& encoded,
    size_t expected_size,
    std::string_view field) {
    auto decoded = crypto::SodiumInterop::FromBase64Url(encoded);
    if (decoded.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Decode("Field '" + std::string(field) + "' is not valid base64url"));
    }
    auto bytes = std::move(decoded).Unwrap();
    if (expected_size != 0 && bytes.size() != expected_size) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Decode("Field '" + std::string(field) + "' must be " +
                                    std::to_string(expected_size) + " bytes, got " +
                                    std::to_string(bytes.size())));
    }
    if (expected_size == 0 && bytes.empty()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Decode("Field '" + std::string(field) + "' is missing"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(bytes));
}

/// An absent or empty optional field decodes to nullopt.
inline Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> DecodeOptionalBytes(
    bool present,
    const std::string& encoded,
    size_t expected_size,
    std::string_view field) {
    if (!present || encoded.empty()) {
        return Result<std::optional<std::vector<uint8_t>>, ProtocolFailure>::Ok(std::nullopt);
    }
    auto decoded = DecodeBytes(encoded, expected_size, field);
    if (decoded.IsErr()) {
        return Result<std::optional<std::vector<uint8_t>>, ProtocolFailure>::Err(std::move(decoded).UnwrapErr());
    }
    return Result<std::optional<std::vector<uint8_t>>, ProtocolFailure>::Ok(std::move(decoded).Unwrap());
}

}
