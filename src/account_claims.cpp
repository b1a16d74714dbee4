#include "natscred/account_claims.hpp"
#include "natscred/constants.hpp"
#include "natscred/errors.hpp"
#include "claims_json.hpp"
#include "restrictions.hpp"
#include "token_codec.hpp"
#include <algorithm>

namespace natscred {

namespace {
    using internal::json;

    void checkLimit(const std::string& field, std::int64_t value) {
        if (value < NO_LIMIT) {
            throw MalformedInput(field, "must be -1 (unlimited) or more, got " + std::to_string(value));
        }
    }

    void checkJetStream(const std::string& field, const JetStreamLimits& limits) {
        checkLimit(field + ".mem_storage", limits.memoryStorage);
        checkLimit(field + ".disk_storage", limits.diskStorage);
        checkLimit(field + ".streams", limits.streams);
        checkLimit(field + ".consumer", limits.consumer);
        checkLimit(field + ".max_ack_pending", limits.maxAckPending);
        checkLimit(field + ".mem_max_stream_bytes", limits.memoryMaxStreamBytes);
        checkLimit(field + ".disk_max_stream_bytes", limits.diskMaxStreamBytes);
    }

    // The token at accountTokenPosition (1-based) must be a '*' wildcard
    void checkTokenPosition(const Export& exp) {
        if (exp.accountTokenPosition < 0) {
            throw MalformedInput("exports.account_token_position", "cannot be negative");
        }
        if (exp.accountTokenPosition == 0) {
            return;
        }
        std::int64_t position = 1;
        std::size_t start = 0;
        while (position < exp.accountTokenPosition) {
            std::size_t dot = exp.subject.find('.', start);
            if (dot == std::string::npos) {
                throw MalformedInput("exports.account_token_position",
                                     "subject '" + exp.subject + "' has fewer than " +
                                     std::to_string(exp.accountTokenPosition) + " tokens");
            }
            start = dot + 1;
            ++position;
        }
        std::size_t end = exp.subject.find('.', start);
        if (exp.subject.substr(start, end == std::string::npos ? std::string::npos : end - start) != "*") {
            throw MalformedInput("exports.account_token_position",
                                 "token " + std::to_string(exp.accountTokenPosition) +
                                 " of '" + exp.subject + "' is not '*'");
        }
    }

    json jetStreamToJson(const JetStreamLimits& limits) {
        json out = {
            {"mem_storage", limits.memoryStorage},
            {"disk_storage", limits.diskStorage},
            {"streams", limits.streams},
            {"consumer", limits.consumer},
            {"max_ack_pending", limits.maxAckPending},
            {"mem_max_stream_bytes", limits.memoryMaxStreamBytes},
            {"disk_max_stream_bytes", limits.diskMaxStreamBytes}
        };
        if (limits.maxBytesRequired) {
            out["max_bytes_required"] = true;
        }
        return out;
    }

    JetStreamLimits jetStreamFromJson(const json& object) {
        using namespace internal;
        JetStreamLimits limits;
        limits.memoryStorage = intOr(object, "mem_storage", 0);
        limits.diskStorage = intOr(object, "disk_storage", 0);
        limits.streams = intOr(object, "streams", 0);
        limits.consumer = intOr(object, "consumer", 0);
        limits.maxAckPending = intOr(object, "max_ack_pending", 0);
        limits.memoryMaxStreamBytes = intOr(object, "mem_max_stream_bytes", 0);
        limits.diskMaxStreamBytes = intOr(object, "disk_max_stream_bytes", 0);
        limits.maxBytesRequired = boolOr(object, "max_bytes_required", false);
        return limits;
    }

    ExportType parseExportType(const std::string& name) {
        if (name == "stream") return ExportType::Stream;
        if (name == "service") return ExportType::Service;
        throw DecodingFailure("unknown export type '" + name + "'");
    }

    ResponseType parseResponseType(const std::string& name) {
        if (name == "Singleton") return ResponseType::Singleton;
        if (name == "Stream") return ResponseType::Stream;
        if (name == "Chunked") return ResponseType::Chunked;
        throw DecodingFailure("unknown response type '" + name + "'");
    }
}

std::string toString(ExportType type) {
    return type == ExportType::Service ? "service" : "stream";
}

std::string toString(ResponseType type) {
    switch (type) {
        case ResponseType::Singleton: return "Singleton";
        case ResponseType::Stream: return "Stream";
        case ResponseType::Chunked: return "Chunked";
    }
    return "Singleton";
}

const JetStreamLimits& AccountClaims::jetStreamFor(const std::string& tier) const {
    auto it = tieredLimits.find(tier);
    return it != tieredLimits.end() ? it->second : jetStreamLimits;
}

bool AccountClaims::isAuthorizedSigner(const std::string& publicKey) const {
    return publicKey == subject || signingKeys.count(publicKey) > 0;
}

void validate(const AccountClaims& claims) {
    internal::validateCommon(claims, KeyKind::Account, KeyKind::Operator);

    for (const auto& key : claims.signingKeys) {
        requirePublicKey("signing_keys", key, KeyKind::Account);
    }

    std::set<std::string> exportSubjects;
    for (const auto& exp : claims.exports) {
        internal::checkSubject("exports.subject", exp.subject);
        if (!exportSubjects.insert(exp.subject).second) {
            throw MalformedInput("exports", "duplicate export subject '" + exp.subject + "'");
        }
        if (exp.responseType && exp.type != ExportType::Service) {
            throw MalformedInput("exports.response_type",
                                 "only service exports have a response type ('" + exp.subject + "')");
        }
        checkTokenPosition(exp);
    }

    checkLimit("nats_limits.subs", claims.natsLimits.subs);
    checkLimit("nats_limits.data", claims.natsLimits.data);
    checkLimit("nats_limits.payload", claims.natsLimits.payload);
    checkLimit("account_limits.imports", claims.accountLimits.imports);
    checkLimit("account_limits.exports", claims.accountLimits.exports);
    checkLimit("account_limits.conn", claims.accountLimits.conn);
    checkLimit("account_limits.leaf_node_conn", claims.accountLimits.leafNodeConn);

    checkJetStream("jetstream_limits", claims.jetStreamLimits);
    for (const auto& [tier, limits] : claims.tieredLimits) {
        if (tier.empty() || tier.find_first_of(" \t\r\n.") != std::string::npos) {
            throw MalformedInput("jetstream_limits.tier", "'" + tier + "' is not a valid tier name");
        }
        checkJetStream("jetstream_limits[" + tier + "]", limits);
    }
    bool globalEnabled = claims.jetStreamLimits.memoryStorage != 0 ||
                         claims.jetStreamLimits.diskStorage != 0;
    if (globalEnabled && !claims.tieredLimits.empty()) {
        throw MalformedInput("jetstream_limits",
                             "global and tiered JetStream limits are mutually exclusive");
    }

    internal::validatePermissions("default_permissions", claims.defaultPermissions);

    if (claims.trace) {
        internal::checkSubject("trace.destination", claims.trace->destination);
        if (claims.trace->destination.find_first_of("*>") != std::string::npos) {
            throw MalformedInput("trace.destination", "cannot contain wildcards");
        }
        internal::checkPercent("trace.sampling", claims.trace->sampling);
    }
}

namespace internal {

json natsToJson(const AccountClaims& claims) {
    json nats = {
        {"type", "account"},
        {"version", JWT_VERSION}
    };
    putSet(nats, "signing_keys", claims.signingKeys);
    putString(nats, "description", claims.description);
    putString(nats, "info_url", claims.infoUrl);

    if (!claims.exports.empty()) {
        json exports = json::array();
        for (const auto& exp : claims.exports) {
            json e = {
                {"subject", exp.subject},
                {"type", toString(exp.type)}
            };
            putString(e, "name", exp.name);
            if (exp.responseType) {
                e["response_type"] = toString(*exp.responseType);
            }
            if (exp.accountTokenPosition > 0) {
                e["account_token_position"] = exp.accountTokenPosition;
            }
            putString(e, "description", exp.description);
            putString(e, "info_url", exp.infoUrl);
            exports.push_back(std::move(e));
        }
        nats["exports"] = std::move(exports);
    }

    // Limits are one flat object: connection, account and global JetStream
    json limits = natsLimitsToJson(claims.natsLimits);
    limits["imports"] = claims.accountLimits.imports;
    limits["exports"] = claims.accountLimits.exports;
    limits["wildcards"] = claims.accountLimits.wildcardExports;
    limits["conn"] = claims.accountLimits.conn;
    limits["leaf"] = claims.accountLimits.leafNodeConn;
    if (claims.accountLimits.disallowBearer) {
        limits["disallow_bearer"] = true;
    }
    limits.update(jetStreamToJson(claims.jetStreamLimits));
    if (!claims.tieredLimits.empty()) {
        json tiered = json::object();
        for (const auto& [tier, tierLimits] : claims.tieredLimits) {
            tiered[tier] = jetStreamToJson(tierLimits);
        }
        limits["tiered_limits"] = std::move(tiered);
    }
    nats["limits"] = std::move(limits);

    json permissions = permissionsToJson(claims.defaultPermissions);
    if (!permissions.empty()) {
        nats["default_permissions"] = std::move(permissions);
    }

    if (claims.trace) {
        nats["trace"] = json{
            {"dest", claims.trace->destination},
            {"sampling", claims.trace->sampling}
        };
    }

    putTags(nats, claims.tags);
    return nats;
}

void natsFromJson(const json& nats, AccountClaims& claims) {
    claims.signingKeys = stringSet(nats, "signing_keys");
    claims.description = stringOr(nats, "description");
    claims.infoUrl = stringOr(nats, "info_url");
    claims.tags = stringSet(nats, "tags");

    if (auto it = nats.find("exports"); it != nats.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw DecodingFailure("field 'exports' must be an array");
        }
        for (const auto& e : *it) {
            if (!e.is_object()) {
                throw DecodingFailure("field 'exports' must contain objects");
            }
            Export exp;
            exp.name = stringOr(e, "name");
            exp.subject = stringOr(e, "subject");
            exp.type = parseExportType(stringOr(e, "type", "stream"));
            if (e.contains("response_type")) {
                exp.responseType = parseResponseType(stringOr(e, "response_type"));
            }
            exp.accountTokenPosition = intOr(e, "account_token_position", 0);
            exp.description = stringOr(e, "description");
            exp.infoUrl = stringOr(e, "info_url");
            claims.exports.push_back(std::move(exp));
        }
    }

    if (const json* limits = objectOrNull(nats, "limits")) {
        claims.natsLimits = natsLimitsFromJson(*limits);
        claims.accountLimits.imports = intOr(*limits, "imports", NO_LIMIT);
        claims.accountLimits.exports = intOr(*limits, "exports", NO_LIMIT);
        claims.accountLimits.wildcardExports = boolOr(*limits, "wildcards", true);
        claims.accountLimits.disallowBearer = boolOr(*limits, "disallow_bearer", false);
        claims.accountLimits.conn = intOr(*limits, "conn", NO_LIMIT);
        claims.accountLimits.leafNodeConn = intOr(*limits, "leaf", NO_LIMIT);
        claims.jetStreamLimits = jetStreamFromJson(*limits);
        if (const json* tiered = objectOrNull(*limits, "tiered_limits")) {
            for (const auto& [tier, value] : tiered->items()) {
                if (!value.is_object()) {
                    throw DecodingFailure("tier '" + tier + "' must be an object");
                }
                claims.tieredLimits[tier] = jetStreamFromJson(value);
            }
        }
    }

    if (const json* permissions = objectOrNull(nats, "default_permissions")) {
        claims.defaultPermissions = permissionsFromJson(*permissions);
    }

    if (const json* trace = objectOrNull(nats, "trace")) {
        claims.trace = MsgTrace{stringOr(*trace, "dest"), intOr(*trace, "sampling", 0)};
    }
}

} // namespace internal

AccountClaims decodeAccountClaims(const std::string& jwt) {
    using namespace internal;

    auto payload = decodePayload(jwt);
    const auto& nats = natsSection(payload, "account");

    AccountClaims claims;
    commonFromJson(payload, claims);
    natsFromJson(nats, claims);

    try {
        validate(claims);
    } catch (const std::invalid_argument& e) {
        throw DecodingFailure(std::string("invalid account claims: ") + e.what());
    }
    return claims;
}

} // namespace natscred
