#include "natscred/operator_claims.hpp"
#include "natscred/constants.hpp"
#include "natscred/errors.hpp"
#include "claims_json.hpp"
#include "token_codec.hpp"
#include <initializer_list>

namespace natscred {

namespace {
    bool hasScheme(const std::string& url, std::initializer_list<const char*> schemes) {
        for (const char* scheme : schemes) {
            std::string prefix = std::string(scheme) + "://";
            if (url.size() > prefix.size() && url.compare(0, prefix.size(), prefix) == 0) {
                return true;
            }
        }
        return false;
    }
}

void validate(const OperatorClaims& claims) {
    internal::validateCommon(claims, KeyKind::Operator, KeyKind::Operator);

    for (const auto& key : claims.signingKeys) {
        requirePublicKey("signing_keys", key, KeyKind::Operator);
    }
    if (!claims.systemAccount.empty()) {
        requirePublicKey("system_account", claims.systemAccount, KeyKind::Account);
    }
    if (!claims.accountServerUrl.empty() &&
        !hasScheme(claims.accountServerUrl, {"http", "https", "nats"})) {
        throw MalformedInput("account_server_url",
                             "'" + claims.accountServerUrl + "' must be an http, https or nats URL");
    }
    for (const auto& url : claims.operatorServiceUrls) {
        if (!hasScheme(url, {"nats", "tls"})) {
            throw MalformedInput("operator_service_urls", "'" + url + "' must be a nats or tls URL");
        }
    }
}

namespace internal {

json natsToJson(const OperatorClaims& claims) {
    json nats = {
        {"type", "operator"},
        {"version", JWT_VERSION}
    };
    putSet(nats, "signing_keys", claims.signingKeys);
    putString(nats, "account_server_url", claims.accountServerUrl);
    if (!claims.operatorServiceUrls.empty()) {
        nats["operator_service_urls"] = claims.operatorServiceUrls;
    }
    putString(nats, "system_account", claims.systemAccount);
    if (claims.strictSigningKeyUsage) {
        nats["strict_signing_key_usage"] = true;
    }
    putTags(nats, claims.tags);
    return nats;
}

void natsFromJson(const json& nats, OperatorClaims& claims) {
    claims.signingKeys = stringSet(nats, "signing_keys");
    claims.accountServerUrl = stringOr(nats, "account_server_url");
    claims.operatorServiceUrls = stringList(nats, "operator_service_urls");
    claims.systemAccount = stringOr(nats, "system_account");
    claims.strictSigningKeyUsage = boolOr(nats, "strict_signing_key_usage", false);
    claims.tags = stringSet(nats, "tags");
}

} // namespace internal

OperatorClaims decodeOperatorClaims(const std::string& jwt) {
    using namespace internal;

    auto payload = decodePayload(jwt);
    const auto& nats = natsSection(payload, "operator");

    OperatorClaims claims;
    commonFromJson(payload, claims);
    natsFromJson(nats, claims);

    try {
        validate(claims);
    } catch (const std::invalid_argument& e) {
        throw DecodingFailure(std::string("invalid operator claims: ") + e.what());
    }
    return claims;
}

} // namespace natscred
