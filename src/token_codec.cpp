#include "token_codec.hpp"
#include "base64url.hpp"
#include "natscred/constants.hpp"
#include "natscred/errors.hpp"

namespace natscred::internal {

namespace {
    nlohmann::json parseSegment(const std::string& b64, const char* what) {
        try {
            auto bytes = base64url_decode(b64);
            auto value = nlohmann::json::parse(bytes.begin(), bytes.end());
            if (!value.is_object()) {
                throw DecodingFailure(std::string(what) + " is not a JSON object");
            }
            return value;
        } catch (const DecodingFailure&) {
            throw;
        } catch (const std::exception& e) {
            throw DecodingFailure(std::string("invalid ") + what + ": " + e.what());
        }
    }
}

std::string createHeader() {
    nlohmann::json header;
    header["typ"] = JWT_TYPE;
    header["alg"] = JWT_ALGORITHM;
    return header.dump();
}

JwtParts parseJwt(std::string_view jwt) {
    if (jwt.size() > MAX_JWT_SIZE) {
        throw DecodingFailure("token exceeds " + std::to_string(MAX_JWT_SIZE) + " bytes");
    }

    // Find the two dots separating header.payload.signature
    std::size_t first_dot = jwt.find('.');
    if (first_dot == std::string_view::npos) {
        throw DecodingFailure("Invalid JWT format: missing first '.'");
    }

    std::size_t second_dot = jwt.find('.', first_dot + 1);
    if (second_dot == std::string_view::npos) {
        throw DecodingFailure("Invalid JWT format: missing second '.'");
    }

    if (jwt.find('.', second_dot + 1) != std::string_view::npos) {
        throw DecodingFailure("Invalid JWT format: too many parts");
    }

    JwtParts parts{
        std::string(jwt.substr(0, first_dot)),
        std::string(jwt.substr(first_dot + 1, second_dot - first_dot - 1)),
        std::string(jwt.substr(second_dot + 1)),
        std::string(jwt.substr(0, second_dot))
    };

    if (parts.header_b64.empty()) {
        throw DecodingFailure("Invalid JWT format: empty header");
    }
    if (parts.payload_b64.empty()) {
        throw DecodingFailure("Invalid JWT format: empty payload");
    }
    if (parts.signature_b64.empty()) {
        throw DecodingFailure("Invalid JWT format: empty signature");
    }

    return parts;
}

nlohmann::json decodePayload(std::string_view jwt) {
    auto parts = parseJwt(jwt);

    auto header = parseSegment(parts.header_b64, "header");
    if (!header.contains("alg") || header["alg"] != JWT_ALGORITHM) {
        throw DecodingFailure(
            "Unsupported algorithm: expected '" + std::string(JWT_ALGORITHM) + "'"
        );
    }
    if (header.contains("typ") && header["typ"] != JWT_TYPE) {
        throw DecodingFailure("Unsupported token type: expected '" + std::string(JWT_TYPE) + "'");
    }

    return parseSegment(parts.payload_b64, "payload");
}

const nlohmann::json& natsSection(const nlohmann::json& payload, const char* expectedType) {
    auto it = payload.find("nats");
    if (it == payload.end() || !it->is_object()) {
        throw DecodingFailure("Missing 'nats' object in JWT payload");
    }
    const auto& nats = *it;

    auto type = nats.find("type");
    if (type == nats.end() || !type->is_string()) {
        throw DecodingFailure("Missing 'type' field in nats object");
    }
    if (expectedType != nullptr && *type != expectedType) {
        throw DecodingFailure("JWT type mismatch: expected '" + std::string(expectedType) +
                              "', got '" + type->get<std::string>() + "'");
    }

    auto version = nats.find("version");
    if (version == nats.end() || *version != JWT_VERSION) {
        throw DecodingFailure("Unsupported JWT version: expected " + std::to_string(JWT_VERSION));
    }
    return nats;
}

} // namespace natscred::internal
