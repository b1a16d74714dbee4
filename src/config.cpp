#include "natscred/config.hpp"
#include "natscred/errors.hpp"
#include <nlohmann/json.hpp>
#include <initializer_list>
#include <set>
#include <utility>

namespace natscred {

namespace {

using json = nlohmann::json;

json parseDocument(const std::string& jsonText) {
    try {
        json doc = json::parse(jsonText);
        if (!doc.is_object()) {
            throw MalformedInput("config", "document must be a JSON object");
        }
        return doc;
    } catch (const json::parse_error& e) {
        throw MalformedInput("config", e.what());
    }
}

/**
 * Typed access to one JSON object. Field names in errors carry the
 * path of the enclosing object ("account_limits.conn").
 */
class ObjectReader {
public:
    ObjectReader(const json& object, std::string path)
        : object_(object), path_(std::move(path)) {}

    /// Reject keys outside the allowed set
    void allowOnly(std::initializer_list<const char*> keys) const {
        std::set<std::string> allowed(keys.begin(), keys.end());
        for (const auto& [key, value] : object_.items()) {
            if (allowed.count(key) == 0) {
                throw MalformedInput(field(key), "unknown key");
            }
        }
    }

    [[nodiscard]] bool has(const char* key) const {
        auto it = object_.find(key);
        return it != object_.end() && !it->is_null();
    }

    [[nodiscard]] std::string requiredString(const char* key) const {
        auto value = optionalString(key);
        if (!value || value->empty()) {
            throw MalformedInput(field(key), "required");
        }
        return *value;
    }

    [[nodiscard]] std::optional<std::string> optionalString(const char* key) const {
        if (!has(key)) {
            return std::nullopt;
        }
        const auto& value = object_.at(key);
        if (!value.is_string()) {
            throw MalformedInput(field(key), "expected a string");
        }
        return value.get<std::string>();
    }

    [[nodiscard]] std::optional<std::int64_t> optionalInt(const char* key) const {
        if (!has(key)) {
            return std::nullopt;
        }
        const auto& value = object_.at(key);
        if (!value.is_number_integer()) {
            throw MalformedInput(field(key), "expected an integer");
        }
        return value.get<std::int64_t>();
    }

    [[nodiscard]] std::optional<bool> optionalBool(const char* key) const {
        if (!has(key)) {
            return std::nullopt;
        }
        const auto& value = object_.at(key);
        if (!value.is_boolean()) {
            throw MalformedInput(field(key), "expected a boolean");
        }
        return value.get<bool>();
    }

    [[nodiscard]] std::vector<std::string> stringList(const char* key) const {
        std::vector<std::string> result;
        for (const auto& item : array(key)) {
            if (!item.is_string()) {
                throw MalformedInput(field(key), "expected an array of strings");
            }
            result.push_back(item.get<std::string>());
        }
        return result;
    }

    /// Array under key, empty if absent
    [[nodiscard]] json array(const char* key) const {
        if (!has(key)) {
            return json::array();
        }
        const auto& value = object_.at(key);
        if (!value.is_array()) {
            throw MalformedInput(field(key), "expected an array");
        }
        return value;
    }

    /// Nested object reader, nullopt if absent
    [[nodiscard]] std::optional<ObjectReader> object(const char* key) const {
        if (!has(key)) {
            return std::nullopt;
        }
        const auto& value = object_.at(key);
        if (!value.is_object()) {
            throw MalformedInput(field(key), "expected an object");
        }
        return ObjectReader(value, field(key));
    }

    [[nodiscard]] std::string field(const std::string& key) const {
        return path_.empty() ? key : path_ + "." + key;
    }

private:
    const json& object_;
    std::string path_;
};

/// Reader over the i-th element of an array of objects
ObjectReader element(const json& item, const std::string& path, std::size_t index) {
    std::string itemPath = path + "[" + std::to_string(index) + "]";
    if (!item.is_object()) {
        throw MalformedInput(itemPath, "expected an object");
    }
    return ObjectReader(item, itemPath);
}

TemporalOptions readTemporal(const ObjectReader& r) {
    TemporalOptions temporal;
    temporal.issuedAt = r.optionalInt("issued_at");
    temporal.expires = r.optionalInt("expires");
    temporal.notBefore = r.optionalInt("not_before");
    return temporal;
}

ConflictPolicy readConflictPolicy(const ObjectReader& r) {
    auto policy = r.optionalString("conflict_policy");
    if (!policy || *policy == "last_write_wins") {
        return ConflictPolicy::LastWriteWins;
    }
    if (*policy == "reject") {
        return ConflictPolicy::Reject;
    }
    throw MalformedInput(r.field("conflict_policy"), "expected \"last_write_wins\" or \"reject\"");
}

NatsLimitsOptions readNatsLimits(const ObjectReader& r) {
    r.allowOnly({"subs", "data", "payload"});
    NatsLimitsOptions limits;
    limits.subs = r.optionalInt("subs");
    limits.data = r.optionalInt("data");
    limits.payload = r.optionalInt("payload");
    return limits;
}

AccountLimitsOptions readAccountLimits(const ObjectReader& r) {
    r.allowOnly({"imports", "exports", "wildcard_exports", "disallow_bearer", "conn", "leaf_node_conn"});
    AccountLimitsOptions limits;
    limits.imports = r.optionalInt("imports");
    limits.exports = r.optionalInt("exports");
    limits.wildcardExports = r.optionalBool("wildcard_exports");
    limits.disallowBearer = r.optionalBool("disallow_bearer");
    limits.conn = r.optionalInt("conn");
    limits.leafNodeConn = r.optionalInt("leaf_node_conn");
    return limits;
}

JetStreamLimitsOptions readJetStreamLimits(const ObjectReader& r) {
    r.allowOnly({"tier", "mem_storage", "disk_storage", "streams", "consumer", "max_ack_pending",
                 "mem_max_stream_bytes", "disk_max_stream_bytes", "max_bytes_required"});
    JetStreamLimitsOptions limits;
    limits.tier = r.optionalString("tier");
    limits.memoryStorage = r.optionalInt("mem_storage");
    limits.diskStorage = r.optionalInt("disk_storage");
    limits.streams = r.optionalInt("streams");
    limits.consumer = r.optionalInt("consumer");
    limits.maxAckPending = r.optionalInt("max_ack_pending");
    limits.memoryMaxStreamBytes = r.optionalInt("mem_max_stream_bytes");
    limits.diskMaxStreamBytes = r.optionalInt("disk_max_stream_bytes");
    limits.maxBytesRequired = r.optionalBool("max_bytes_required");
    return limits;
}

void readPermissionLists(const ObjectReader& r, PermissionOptions& perms) {
    perms.pubAllow = r.stringList("pub_allow");
    perms.pubDeny = r.stringList("pub_deny");
    perms.subAllow = r.stringList("sub_allow");
    perms.subDeny = r.stringList("sub_deny");
}

Export readExport(const ObjectReader& r) {
    r.allowOnly({"name", "subject", "type", "response_type", "account_token_position", "description", "info_url"});
    Export exp;
    exp.name = r.optionalString("name").value_or("");
    exp.subject = r.requiredString("subject");

    std::string type = r.optionalString("type").value_or("stream");
    if (type == "stream") {
        exp.type = ExportType::Stream;
    } else if (type == "service") {
        exp.type = ExportType::Service;
    } else {
        throw MalformedInput(r.field("type"), "expected \"stream\" or \"service\"");
    }

    if (auto response = r.optionalString("response_type")) {
        if (*response == "Singleton") {
            exp.responseType = ResponseType::Singleton;
        } else if (*response == "Stream") {
            exp.responseType = ResponseType::Stream;
        } else if (*response == "Chunked") {
            exp.responseType = ResponseType::Chunked;
        } else {
            throw MalformedInput(r.field("response_type"), "expected Singleton, Stream or Chunked");
        }
    }

    exp.accountTokenPosition = r.optionalInt("account_token_position").value_or(0);
    exp.description = r.optionalString("description").value_or("");
    exp.infoUrl = r.optionalString("info_url").value_or("");
    return exp;
}

} // namespace

OperatorConfig parseOperatorConfig(const std::string& jsonText) {
    json doc = parseDocument(jsonText);
    ObjectReader r(doc, "");
    r.allowOnly({"name", "seed", "signing_keys", "account_server_url", "operator_service_urls",
                 "system_account", "strict_signing_key_usage", "issued_at", "expires", "not_before", "tags"});

    OperatorConfig config;
    config.name = r.requiredString("name");
    config.seed = r.requiredString("seed");

    auto& options = config.options;
    options.temporal = readTemporal(r);
    options.signingKeys = r.stringList("signing_keys");
    options.accountServerUrl = r.optionalString("account_server_url");
    options.operatorServiceUrls = r.stringList("operator_service_urls");
    options.systemAccount = r.optionalString("system_account");
    options.strictSigningKeyUsage = r.optionalBool("strict_signing_key_usage");
    options.tags = r.stringList("tags");
    return config;
}

AccountConfig parseAccountConfig(const std::string& jsonText) {
    json doc = parseDocument(jsonText);
    ObjectReader r(doc, "");
    r.allowOnly({"name", "seed", "operator_seed", "signing_keys", "issued_at", "expires", "not_before",
                 "description", "info_url", "tags", "nats_limits", "account_limits", "jetstream_limits",
                 "default_permissions", "trace", "exports", "system_account", "conflict_policy"});

    AccountConfig config;
    config.name = r.requiredString("name");
    config.seed = r.requiredString("seed");
    config.operatorSeed = r.requiredString("operator_seed");
    config.systemAccount = r.optionalBool("system_account").value_or(false);

    auto& options = config.options;
    options.temporal = readTemporal(r);
    options.signingKeys = r.stringList("signing_keys");
    options.description = r.optionalString("description");
    options.infoUrl = r.optionalString("info_url");
    options.tags = r.stringList("tags");
    options.conflictPolicy = readConflictPolicy(r);

    if (auto limits = r.object("nats_limits")) {
        options.natsLimits = readNatsLimits(*limits);
    }
    if (auto limits = r.object("account_limits")) {
        options.accountLimits = readAccountLimits(*limits);
    }

    json jetstream = r.array("jetstream_limits");
    for (std::size_t i = 0; i < jetstream.size(); ++i) {
        options.jetStreamLimits.push_back(readJetStreamLimits(element(jetstream[i], "jetstream_limits", i)));
    }

    if (auto perms = r.object("default_permissions")) {
        perms->allowOnly({"pub_allow", "pub_deny", "sub_allow", "sub_deny"});
        PermissionOptions defaults;
        readPermissionLists(*perms, defaults);
        options.defaultPermissions = defaults;
    }

    if (auto trace = r.object("trace")) {
        trace->allowOnly({"destination", "sampling"});
        TraceOptions traceOptions;
        traceOptions.destination = trace->optionalString("destination");
        traceOptions.sampling = trace->optionalInt("sampling");
        options.trace = traceOptions;
    }

    json exports = r.array("exports");
    for (std::size_t i = 0; i < exports.size(); ++i) {
        options.exports.push_back(readExport(element(exports[i], "exports", i)));
    }

    return config;
}

UserConfig parseUserConfig(const std::string& jsonText) {
    json doc = parseDocument(jsonText);
    ObjectReader r(doc, "");
    r.allowOnly({"name", "seed", "account_seed", "issuer_account", "issued_at", "expires", "not_before",
                 "permissions", "limits", "bearer_token", "allowed_connection_types", "source_networks",
                 "time_restrictions", "locale", "tags"});

    UserConfig config;
    config.name = r.requiredString("name");
    config.seed = r.requiredString("seed");
    config.accountSeed = r.requiredString("account_seed");

    auto& options = config.options;
    options.temporal = readTemporal(r);
    options.issuerAccount = r.optionalString("issuer_account");
    options.bearerToken = r.optionalBool("bearer_token");
    options.allowedConnectionTypes = r.stringList("allowed_connection_types");
    options.sourceNetworks = r.stringList("source_networks");
    options.locale = r.optionalString("locale");
    options.tags = r.stringList("tags");

    if (auto perms = r.object("permissions")) {
        perms->allowOnly({"pub_allow", "pub_deny", "sub_allow", "sub_deny", "resp_max_msgs", "resp_ttl"});
        UserPermissionOptions userPerms;
        readPermissionLists(*perms, userPerms);
        userPerms.respMaxMsgs = perms->optionalInt("resp_max_msgs");
        userPerms.respTtl = perms->optionalString("resp_ttl");
        options.permissions = userPerms;
    }

    if (auto limits = r.object("limits")) {
        options.limits = readNatsLimits(*limits);
    }

    json ranges = r.array("time_restrictions");
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        ObjectReader range = element(ranges[i], "time_restrictions", i);
        range.allowOnly({"start", "end"});
        options.timeRestrictions.push_back(TimeRange{range.requiredString("start"), range.requiredString("end")});
    }

    return config;
}

BundleConfig parseBundleConfig(const std::string& jsonText) {
    json doc = parseDocument(jsonText);
    ObjectReader r(doc, "");
    r.allowOnly({"operator_jwt", "system_account_jwt", "account_jwts", "resolver_type", "conflict_policy"});

    BundleConfig config;
    config.operatorJwt = r.requiredString("operator_jwt");
    config.systemAccountJwt = r.optionalString("system_account_jwt");
    config.accountJwts = r.stringList("account_jwts");
    config.resolver = parseResolverKind(r.optionalString("resolver_type").value_or("MEMORY"));
    config.conflictPolicy = readConflictPolicy(r);
    return config;
}

} // namespace natscred
