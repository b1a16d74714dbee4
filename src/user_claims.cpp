#include "natscred/user_claims.hpp"
#include "natscred/constants.hpp"
#include "natscred/errors.hpp"
#include "claims_json.hpp"
#include "restrictions.hpp"
#include "token_codec.hpp"

namespace natscred {

void validate(const UserClaims& claims) {
    internal::validateCommon(claims, KeyKind::User, KeyKind::Account);

    if (!claims.issuerAccount.empty()) {
        requirePublicKey("issuer_account", claims.issuerAccount, KeyKind::Account);
    }

    internal::validatePermissions("permissions", claims.permissions);

    if (claims.limits.subs < NO_LIMIT || claims.limits.data < NO_LIMIT ||
        claims.limits.payload < NO_LIMIT) {
        throw MalformedInput("limits", "limits must be -1 (unlimited) or more");
    }

    for (const auto& network : claims.sourceNetworks) {
        internal::checkCidr("source_networks", network);
    }

    for (const auto& range : claims.timeRestrictions) {
        internal::checkTimeOfDay("time_restrictions.start", range.start);
        internal::checkTimeOfDay("time_restrictions.end", range.end);
    }

    // A time window is meaningless without the zone it is evaluated in
    if (!claims.timeRestrictions.empty() && claims.locale.empty()) {
        throw MalformedInput("locale", "required when time_restrictions are set");
    }
    if (!claims.locale.empty()) {
        internal::checkLocale("locale", claims.locale);
    }
}

namespace internal {

json natsToJson(const UserClaims& claims) {
    json nats = permissionsToJson(claims.permissions);
    nats["type"] = "user";
    nats["version"] = JWT_VERSION;

    nats.update(natsLimitsToJson(claims.limits));
    putString(nats, "issuer_account", claims.issuerAccount);
    if (claims.bearerToken) {
        nats["bearer_token"] = true;
    }
    if (!claims.allowedConnectionTypes.empty()) {
        json types = json::array();
        for (auto type : claims.allowedConnectionTypes) {
            types.push_back(toString(type));
        }
        nats["allowed_connection_types"] = std::move(types);
    }
    putSet(nats, "src", claims.sourceNetworks);
    if (!claims.timeRestrictions.empty()) {
        json times = json::array();
        for (const auto& range : claims.timeRestrictions) {
            times.push_back(json{{"start", range.start}, {"end", range.end}});
        }
        nats["times"] = std::move(times);
    }
    putString(nats, "times_location", claims.locale);
    putTags(nats, claims.tags);
    return nats;
}

void natsFromJson(const json& nats, UserClaims& claims) {
    claims.permissions = permissionsFromJson(nats);
    claims.limits = natsLimitsFromJson(nats);
    claims.issuerAccount = stringOr(nats, "issuer_account");
    claims.bearerToken = boolOr(nats, "bearer_token", false);
    try {
        for (const auto& name : stringList(nats, "allowed_connection_types")) {
            claims.allowedConnectionTypes.insert(parseConnectionType("allowed_connection_types", name));
        }
    } catch (const MalformedInput& e) {
        throw DecodingFailure(e.what());
    }
    claims.sourceNetworks = stringSet(nats, "src");
    if (auto it = nats.find("times"); it != nats.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw DecodingFailure("field 'times' must be an array");
        }
        for (const auto& range : *it) {
            if (!range.is_object()) {
                throw DecodingFailure("field 'times' must contain objects");
            }
            claims.timeRestrictions.push_back(TimeRange{stringOr(range, "start"), stringOr(range, "end")});
        }
    }
    claims.locale = stringOr(nats, "times_location");
    claims.tags = stringSet(nats, "tags");
}

} // namespace internal

UserClaims decodeUserClaims(const std::string& jwt) {
    using namespace internal;

    auto payload = decodePayload(jwt);
    const auto& nats = natsSection(payload, "user");

    UserClaims claims;
    commonFromJson(payload, claims);
    natsFromJson(nats, claims);

    try {
        validate(claims);
    } catch (const std::invalid_argument& e) {
        throw DecodingFailure(std::string("invalid user claims: ") + e.what());
    }
    return claims;
}

} // namespace natscred
