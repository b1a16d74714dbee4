#include "natscred/claim_set.hpp"
#include "natscred/errors.hpp"
#include "base64url.hpp"
#include "token_codec.hpp"

namespace natscred {

namespace {
    template <class... Ts>
    struct overloaded : Ts... { using Ts::operator()...; };
    template <class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;
}

const ClaimsData& common(const ClaimSet& claims) {
    return std::visit([](const auto& c) -> const ClaimsData& { return c; }, claims);
}

ClaimsData& common(ClaimSet& claims) {
    return std::visit([](auto& c) -> ClaimsData& { return c; }, claims);
}

KeyKind subjectKind(const ClaimSet& claims) {
    return std::visit(overloaded{
        [](const OperatorClaims&) { return KeyKind::Operator; },
        [](const AccountClaims&) { return KeyKind::Account; },
        [](const UserClaims&) { return KeyKind::User; }
    }, claims);
}

KeyKind issuerKind(const ClaimSet& claims) {
    return std::visit(overloaded{
        [](const OperatorClaims&) { return KeyKind::Operator; },
        [](const AccountClaims&) { return KeyKind::Operator; },
        [](const UserClaims&) { return KeyKind::Account; }
    }, claims);
}

void validate(const ClaimSet& claims) {
    std::visit([](const auto& c) { validate(c); }, claims);
}

ClaimSet decode(const std::string& jwt) {
    using namespace internal;

    auto payload = decodePayload(jwt);
    const auto& nats = natsSection(payload, nullptr);

    // Dispatch to type-specific decoder
    if (auto type = nats["type"].get<std::string>(); type == "operator") {
        return decodeOperatorClaims(jwt);
    } else if (type == "account") {
        return decodeAccountClaims(jwt);
    } else if (type == "user") {
        return decodeUserClaims(jwt);
    } else {
        throw DecodingFailure("Unknown JWT type: " + type);
    }
}

bool verify(const std::string& jwt) {
    using namespace internal;

    try {
        auto parts = parseJwt(jwt);
        auto payload = decodePayload(jwt);

        // The issuer is the public key that signed this token
        auto issuer = payload.find("iss");
        if (issuer == payload.end() || !issuer->is_string()) {
            return false;
        }

        auto signature = base64url_decode(parts.signature_b64);
        return verifySignature(issuer->get<std::string>(), asBytes(parts.signing_input), signature);

    } catch (const std::invalid_argument&) {
        // Malformed token or signature encoding
        return false;
    }
}

} // namespace natscred
