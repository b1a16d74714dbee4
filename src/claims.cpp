#include "natscred/claims.hpp"
#include "natscred/errors.hpp"
#include "claims_json.hpp"
#include "restrictions.hpp"
#include <algorithm>
#include <cctype>

namespace natscred {

std::string toString(ConnectionType type) {
    switch (type) {
        case ConnectionType::Standard: return "STANDARD";
        case ConnectionType::Websocket: return "WEBSOCKET";
        case ConnectionType::Leafnode: return "LEAFNODE";
        case ConnectionType::Mqtt: return "MQTT";
    }
    return "UNKNOWN";
}

ConnectionType parseConnectionType(std::string_view field, std::string_view name) {
    if (name == "STANDARD") return ConnectionType::Standard;
    if (name == "WEBSOCKET") return ConnectionType::Websocket;
    if (name == "LEAFNODE") return ConnectionType::Leafnode;
    if (name == "MQTT") return ConnectionType::Mqtt;
    throw MalformedInput(std::string(field),
                         "must be one of: STANDARD, WEBSOCKET, LEAFNODE, MQTT. Got: " +
                         std::string(name));
}

std::set<std::string> normalizeTags(const std::vector<std::string>& tags) {
    std::set<std::string> result;
    for (auto tag : tags) {
        std::transform(tag.begin(), tag.end(), tag.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!tag.empty()) {
            result.insert(std::move(tag));
        }
    }
    return result;
}

namespace internal {

namespace {
    [[noreturn]] void wrongType(const char* key, const char* expected) {
        throw DecodingFailure(std::string("field '") + key + "' must be " + expected);
    }
}

json commonToJson(const ClaimsData& claims) {
    return json{
        {"exp", claims.expires},
        {"iat", claims.issuedAt},
        {"iss", claims.issuer},
        {"jti", claims.id},
        {"name", claims.name},
        {"nbf", claims.notBefore},
        {"sub", claims.subject}
    };
}

void commonFromJson(const json& payload, ClaimsData& claims) {
    if (!payload.contains("sub")) {
        throw DecodingFailure("missing 'sub'");
    }
    if (!payload.contains("iss")) {
        throw DecodingFailure("missing 'iss'");
    }
    claims.subject = stringOr(payload, "sub");
    claims.issuer = stringOr(payload, "iss");
    claims.name = stringOr(payload, "name");
    claims.id = stringOr(payload, "jti");
    claims.issuedAt = intOr(payload, "iat", 0);
    claims.expires = intOr(payload, "exp", 0);
    claims.notBefore = intOr(payload, "nbf", 0);
}

void putTags(json& nats, const std::set<std::string>& tags) {
    putSet(nats, "tags", tags);
}

json permissionToJson(const Permission& permission) {
    json out = json::object();
    putSet(out, "allow", permission.allow);
    putSet(out, "deny", permission.deny);
    return out;
}

json permissionsToJson(const Permissions& permissions) {
    json out = json::object();
    if (!permissions.pub.empty()) {
        out["pub"] = permissionToJson(permissions.pub);
    }
    if (!permissions.sub.empty()) {
        out["sub"] = permissionToJson(permissions.sub);
    }
    if (permissions.resp) {
        out["resp"] = json{
            {"max", permissions.resp->maxMsgs},
            {"ttl", permissions.resp->ttlNanos}
        };
    }
    return out;
}

Permissions permissionsFromJson(const json& object) {
    Permissions permissions;
    if (const json* pub = objectOrNull(object, "pub")) {
        permissions.pub.allow = stringSet(*pub, "allow");
        permissions.pub.deny = stringSet(*pub, "deny");
    }
    if (const json* sub = objectOrNull(object, "sub")) {
        permissions.sub.allow = stringSet(*sub, "allow");
        permissions.sub.deny = stringSet(*sub, "deny");
    }
    if (const json* resp = objectOrNull(object, "resp")) {
        permissions.resp = ResponsePermission{
            intOr(*resp, "max", 0),
            intOr(*resp, "ttl", 0)
        };
    }
    return permissions;
}

json natsLimitsToJson(const NatsLimits& limits) {
    return json{
        {"subs", limits.subs},
        {"data", limits.data},
        {"payload", limits.payload}
    };
}

NatsLimits natsLimitsFromJson(const json& object) {
    return NatsLimits{
        intOr(object, "subs", NO_LIMIT),
        intOr(object, "data", NO_LIMIT),
        intOr(object, "payload", NO_LIMIT)
    };
}

std::string stringOr(const json& object, const char* key, const std::string& fallback) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return fallback;
    if (!it->is_string()) wrongType(key, "a string");
    return it->get<std::string>();
}

std::int64_t intOr(const json& object, const char* key, std::int64_t fallback) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return fallback;
    if (!it->is_number_integer()) wrongType(key, "an integer");
    return it->get<std::int64_t>();
}

bool boolOr(const json& object, const char* key, bool fallback) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return fallback;
    if (!it->is_boolean()) wrongType(key, "a boolean");
    return it->get<bool>();
}

std::vector<std::string> stringList(const json& object, const char* key) {
    std::vector<std::string> result;
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return result;
    if (!it->is_array()) wrongType(key, "an array of strings");
    for (const auto& item : *it) {
        if (!item.is_string()) wrongType(key, "an array of strings");
        result.push_back(item.get<std::string>());
    }
    return result;
}

std::set<std::string> stringSet(const json& object, const char* key) {
    auto list = stringList(object, key);
    return {list.begin(), list.end()};
}

const json* objectOrNull(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return nullptr;
    if (!it->is_object()) wrongType(key, "an object");
    return &*it;
}

void putSet(json& object, const char* key, const std::set<std::string>& values) {
    if (!values.empty()) {
        object[key] = values;
    }
}

void putString(json& object, const char* key, const std::string& value) {
    if (!value.empty()) {
        object[key] = value;
    }
}

void validateCommon(const ClaimsData& claims, KeyKind subjectKind, KeyKind issuerKind) {
    requirePublicKey("sub", claims.subject, subjectKind);
    if (!claims.issuer.empty()) {
        requirePublicKey("iss", claims.issuer, issuerKind);
    }
    if (claims.issuedAt < 0) {
        throw MalformedInput("iat", "cannot be negative");
    }
    if (claims.expires < 0) {
        throw MalformedInput("exp", "cannot be negative");
    }
    if (claims.notBefore < 0) {
        throw MalformedInput("nbf", "cannot be negative");
    }
    if (claims.expires > 0 && claims.expires <= claims.issuedAt) {
        throw MalformedInput("exp", "expiration must be after issuedAt");
    }
    for (const auto& tag : claims.tags) {
        if (tag.empty() || tag.find_first_of(" \t\r\n") != std::string::npos) {
            throw MalformedInput("tags", "'" + tag + "' is not a valid tag");
        }
    }
}

void validatePermissions(const char* field, const Permissions& permissions) {
    const std::string base(field);
    auto check = [&](const std::set<std::string>& subjects, const char* part) {
        for (const auto& subject : subjects) {
            checkSubject(base + "." + part, subject);
        }
    };
    check(permissions.pub.allow, "pub_allow");
    check(permissions.pub.deny, "pub_deny");
    check(permissions.sub.allow, "sub_allow");
    check(permissions.sub.deny, "sub_deny");
    if (permissions.resp) {
        if (permissions.resp->maxMsgs < -1) {
            throw MalformedInput(base + ".resp_max_msgs", "must be -1 (unlimited) or more");
        }
        if (permissions.resp->ttlNanos < 0) {
            throw MalformedInput(base + ".resp_ttl", "cannot be negative");
        }
    }
}

} // namespace internal
} // namespace natscred
