#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace natscred::internal {

/// Create the fixed token header as JSON string
/// @return {"alg":"ed25519-nkey","typ":"JWT"}
std::string createHeader();

/// Parsed token components
struct JwtParts {
    std::string header_b64;
    std::string payload_b64;
    std::string signature_b64;
    std::string signing_input;  // "header.payload"
};

/// Split a token into its components
/// @throws DecodingFailure if the format is invalid
JwtParts parseJwt(std::string_view jwt);

/// Decode the header and payload of a token, checking the header
/// @return The parsed payload object
/// @throws DecodingFailure if any part cannot be decoded
nlohmann::json decodePayload(std::string_view jwt);

/// Payload "nats" object, checking its type tag and version
/// @throws DecodingFailure on mismatch
const nlohmann::json& natsSection(const nlohmann::json& payload, const char* expectedType);

} // namespace natscred::internal
