#include "natscred/hierarchy.hpp"
#include "natscred/claim_set.hpp"
#include "natscred/constants.hpp"
#include "natscred/errors.hpp"
#include "natscred/signer.hpp"
#include "restrictions.hpp"
#include <algorithm>

namespace natscred {

namespace {
    void applyTemporal(ClaimsData& claims, const TemporalOptions& temporal) {
        claims.issuedAt = temporal.issuedAt.value_or(0);
        claims.expires = temporal.expires.value_or(0);
        claims.notBefore = temporal.notBefore.value_or(claims.issuedAt);
    }

    std::set<std::string> publicKeySet(const char* field,
                                       const std::vector<std::string>& keys,
                                       KeyKind kind) {
        std::set<std::string> result;
        for (const auto& key : keys) {
            requirePublicKey(field, key, kind);
            result.insert(key);
        }
        return result;
    }

    Permissions toPermissions(const PermissionOptions& options) {
        Permissions permissions;
        permissions.pub.allow = {options.pubAllow.begin(), options.pubAllow.end()};
        permissions.pub.deny = {options.pubDeny.begin(), options.pubDeny.end()};
        permissions.sub.allow = {options.subAllow.begin(), options.subAllow.end()};
        permissions.sub.deny = {options.subDeny.begin(), options.subDeny.end()};
        return permissions;
    }

    // Unset fields of a supplied block: storage sizes are 0, counts unlimited
    JetStreamLimits toJetStreamLimits(const JetStreamLimitsOptions& options) {
        JetStreamLimits limits;
        limits.memoryStorage = options.memoryStorage.value_or(0);
        limits.diskStorage = options.diskStorage.value_or(0);
        limits.streams = options.streams.value_or(NO_LIMIT);
        limits.consumer = options.consumer.value_or(NO_LIMIT);
        limits.maxAckPending = options.maxAckPending.value_or(NO_LIMIT);
        limits.memoryMaxStreamBytes = options.memoryMaxStreamBytes.value_or(0);
        limits.diskMaxStreamBytes = options.diskMaxStreamBytes.value_or(0);
        limits.maxBytesRequired = options.maxBytesRequired.value_or(false);
        return limits;
    }

    void recordConflict(ConflictPolicy policy, std::vector<Conflict>& conflicts,
                        std::string field, std::string key) {
        if (policy == ConflictPolicy::Reject) {
            throw ConflictingConfiguration(std::move(field), std::move(key));
        }
        conflicts.push_back(Conflict{std::move(field), std::move(key)});
    }

    bool hasExportSubject(const AccountClaims& claims, const std::string& subject) {
        return std::any_of(claims.exports.begin(), claims.exports.end(),
                           [&](const Export& e) { return e.subject == subject; });
    }
}

OperatorClaims makeOperatorClaims(const std::string& name,
                                  const KeyMaterial& ownKey,
                                  const OperatorOptions& options) {
    ownKey.require("seed", KeyKind::Operator);

    OperatorClaims claims;
    claims.subject = ownKey.publicKey();
    claims.name = name;
    applyTemporal(claims, options.temporal);

    claims.signingKeys = publicKeySet("signing_keys", options.signingKeys, KeyKind::Operator);
    claims.accountServerUrl = options.accountServerUrl.value_or("");
    claims.operatorServiceUrls = options.operatorServiceUrls;
    if (options.systemAccount) {
        requirePublicKey("system_account", *options.systemAccount, KeyKind::Account);
        claims.systemAccount = *options.systemAccount;
    }
    claims.strictSigningKeyUsage = options.strictSigningKeyUsage.value_or(false);
    claims.tags = normalizeTags(options.tags);

    validate(claims);
    return claims;
}

AccountClaims makeAccountClaims(const std::string& name,
                                const KeyMaterial& ownKey,
                                const AccountOptions& options,
                                std::vector<Conflict>& conflicts) {
    ownKey.require("seed", KeyKind::Account);

    AccountClaims claims;
    claims.subject = ownKey.publicKey();
    claims.name = name;
    applyTemporal(claims, options.temporal);

    claims.signingKeys = publicKeySet("signing_keys", options.signingKeys, KeyKind::Account);
    claims.description = options.description.value_or("");
    claims.infoUrl = options.infoUrl.value_or("");
    claims.tags = normalizeTags(options.tags);
    claims.exports = options.exports;

    if (options.natsLimits) {
        const auto& nl = *options.natsLimits;
        claims.natsLimits = NatsLimits{
            nl.subs.value_or(NO_LIMIT),
            nl.data.value_or(NO_LIMIT),
            nl.payload.value_or(NO_LIMIT)
        };
    }

    if (options.accountLimits) {
        const auto& al = *options.accountLimits;
        claims.accountLimits.imports = al.imports.value_or(NO_LIMIT);
        claims.accountLimits.exports = al.exports.value_or(NO_LIMIT);
        claims.accountLimits.wildcardExports = al.wildcardExports.value_or(true);
        claims.accountLimits.disallowBearer = al.disallowBearer.value_or(false);
        claims.accountLimits.conn = al.conn.value_or(NO_LIMIT);
        claims.accountLimits.leafNodeConn = al.leafNodeConn.value_or(NO_LIMIT);
    }

    // Unlabeled blocks overwrite the global record, labeled blocks upsert a tier
    bool globalSeen = false;
    for (const auto& block : options.jetStreamLimits) {
        auto limits = toJetStreamLimits(block);
        if (!block.tier || block.tier->empty()) {
            if (globalSeen) {
                recordConflict(options.conflictPolicy, conflicts, "jetstream_limits", "");
            }
            globalSeen = true;
            claims.jetStreamLimits = limits;
        } else {
            auto [it, inserted] = claims.tieredLimits.insert_or_assign(*block.tier, limits);
            if (!inserted) {
                recordConflict(options.conflictPolicy, conflicts, "jetstream_limits", it->first);
            }
        }
    }

    if (options.defaultPermissions) {
        claims.defaultPermissions = toPermissions(*options.defaultPermissions);
    }

    if (options.trace) {
        if (!options.trace->destination) {
            throw MalformedInput("trace.destination", "required when trace is set");
        }
        claims.trace = MsgTrace{*options.trace->destination, options.trace->sampling.value_or(0)};
    }

    validate(claims);
    return claims;
}

UserClaims makeUserClaims(const std::string& name,
                          const KeyMaterial& ownKey,
                          const UserOptions& options) {
    ownKey.require("seed", KeyKind::User);

    UserClaims claims;
    claims.subject = ownKey.publicKey();
    claims.name = name;
    applyTemporal(claims, options.temporal);

    if (options.issuerAccount) {
        requirePublicKey("issuer_account", *options.issuerAccount, KeyKind::Account);
        claims.issuerAccount = *options.issuerAccount;
    }

    if (options.permissions) {
        const auto& perms = *options.permissions;
        claims.permissions = toPermissions(perms);
        if (perms.respMaxMsgs || perms.respTtl) {
            ResponsePermission resp;
            resp.maxMsgs = perms.respMaxMsgs.value_or(0);
            if (perms.respTtl) {
                resp.ttlNanos = internal::parseDuration("permissions.resp_ttl", *perms.respTtl);
            }
            claims.permissions.resp = resp;
        }
    }

    if (options.limits) {
        const auto& limits = *options.limits;
        claims.limits = NatsLimits{
            limits.subs.value_or(NO_LIMIT),
            limits.data.value_or(NO_LIMIT),
            limits.payload.value_or(NO_LIMIT)
        };
    }

    claims.bearerToken = options.bearerToken.value_or(false);

    for (const auto& type : options.allowedConnectionTypes) {
        claims.allowedConnectionTypes.insert(parseConnectionType("allowed_connection_types", type));
    }

    for (const auto& network : options.sourceNetworks) {
        internal::checkCidr("source_networks", network);
        claims.sourceNetworks.insert(network);
    }

    claims.timeRestrictions = options.timeRestrictions;
    claims.locale = options.locale.value_or("");
    claims.tags = normalizeTags(options.tags);

    validate(claims);
    return claims;
}

void applySystemAccountDefaults(AccountClaims& claims) {
    if (!hasExportSubject(claims, SYS_SERVICE_EXPORT_SUBJECT)) {
        Export service;
        service.name = SYS_SERVICE_EXPORT_NAME;
        service.subject = SYS_SERVICE_EXPORT_SUBJECT;
        service.type = ExportType::Service;
        service.responseType = ResponseType::Singleton;
        service.accountTokenPosition = 4;
        service.infoUrl = SYS_EXPORT_INFO_URL;
        claims.exports.push_back(std::move(service));
    }
    if (!hasExportSubject(claims, SYS_STREAM_EXPORT_SUBJECT)) {
        Export stream;
        stream.name = SYS_STREAM_EXPORT_NAME;
        stream.subject = SYS_STREAM_EXPORT_SUBJECT;
        stream.type = ExportType::Stream;
        stream.accountTokenPosition = 3;
        stream.infoUrl = SYS_EXPORT_INFO_URL;
        claims.exports.push_back(std::move(stream));
    }
}

SignedEntity buildOperator(const std::string& name,
                           const KeyMaterial& ownKey,
                           const KeyMaterial& signerKey,
                           const OperatorOptions& options) {
    ownKey.require("seed", KeyKind::Operator);
    signerKey.require("signer_seed", KeyKind::Operator);

    auto claims = makeOperatorClaims(name, ownKey, options);
    return SignedEntity{sign(std::move(claims), signerKey), ownKey.publicKey(), {}};
}

SignedEntity buildAccount(const std::string& name,
                          const KeyMaterial& ownKey,
                          const KeyMaterial& signerKey,
                          const AccountOptions& options) {
    ownKey.require("seed", KeyKind::Account);
    signerKey.require("operator_seed", KeyKind::Operator);

    SignedEntity result;
    auto claims = makeAccountClaims(name, ownKey, options, result.conflicts);
    result.jwt = sign(std::move(claims), signerKey);
    result.publicKey = ownKey.publicKey();
    return result;
}

SignedEntity buildSystemAccount(const std::string& name,
                                const KeyMaterial& ownKey,
                                const KeyMaterial& signerKey,
                                const AccountOptions& options) {
    ownKey.require("seed", KeyKind::Account);
    signerKey.require("operator_seed", KeyKind::Operator);

    SignedEntity result;
    auto claims = makeAccountClaims(name, ownKey, options, result.conflicts);
    applySystemAccountDefaults(claims);
    result.jwt = sign(std::move(claims), signerKey);
    result.publicKey = ownKey.publicKey();
    return result;
}

SignedEntity buildUser(const std::string& name,
                       const KeyMaterial& ownKey,
                       const KeyMaterial& signerKey,
                       const UserOptions& options) {
    ownKey.require("seed", KeyKind::User);
    signerKey.require("account_seed", KeyKind::Account);

    auto claims = makeUserClaims(name, ownKey, options);
    if (claims.issuerAccount == signerKey.publicKey()) {
        throw MalformedInput("issuer_account",
                             "equals the signing account key; set it only when signing with an account signing key");
    }
    return SignedEntity{sign(std::move(claims), signerKey), ownKey.publicKey(), {}};
}

} // namespace natscred
