#pragma once
#include "natscred/account_claims.hpp"
#include "natscred/key_material.hpp"
#include "natscred/operator_claims.hpp"
#include "natscred/user_claims.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace natscred {

/// How ambiguous duplicated input is resolved
enum class ConflictPolicy {
    LastWriteWins,   // keep the later value and record a Conflict
    Reject           // throw ConflictingConfiguration
};

/// A duplicated key that was overwritten under LastWriteWins
struct Conflict {
    std::string field;   // e.g. "jetstream_limits"
    std::string key;     // e.g. tier name, "" for the global record

    bool operator==(const Conflict&) const = default;
};

/// Temporal bounds shared by all entities; unset issuedAt is the epoch 0
struct TemporalOptions {
    std::optional<std::int64_t> issuedAt;
    std::optional<std::int64_t> expires;
    std::optional<std::int64_t> notBefore;   // defaults to issuedAt
};

struct OperatorOptions {
    TemporalOptions temporal;
    std::vector<std::string> signingKeys;
    std::optional<std::string> accountServerUrl;
    std::vector<std::string> operatorServiceUrls;
    std::optional<std::string> systemAccount;
    std::optional<bool> strictSigningKeyUsage;
    std::vector<std::string> tags;
};

struct NatsLimitsOptions {
    std::optional<std::int64_t> subs;
    std::optional<std::int64_t> data;
    std::optional<std::int64_t> payload;
};

struct AccountLimitsOptions {
    std::optional<std::int64_t> imports;
    std::optional<std::int64_t> exports;
    std::optional<bool> wildcardExports;
    std::optional<bool> disallowBearer;
    std::optional<std::int64_t> conn;
    std::optional<std::int64_t> leafNodeConn;
};

/// One JetStream limit block; no tier label means the global record
struct JetStreamLimitsOptions {
    std::optional<std::string> tier;
    std::optional<std::int64_t> memoryStorage;
    std::optional<std::int64_t> diskStorage;
    std::optional<std::int64_t> streams;
    std::optional<std::int64_t> consumer;
    std::optional<std::int64_t> maxAckPending;
    std::optional<std::int64_t> memoryMaxStreamBytes;
    std::optional<std::int64_t> diskMaxStreamBytes;
    std::optional<bool> maxBytesRequired;
};

struct PermissionOptions {
    std::vector<std::string> pubAllow;
    std::vector<std::string> pubDeny;
    std::vector<std::string> subAllow;
    std::vector<std::string> subDeny;
};

struct TraceOptions {
    std::optional<std::string> destination;
    std::optional<std::int64_t> sampling;
};

struct AccountOptions {
    TemporalOptions temporal;
    std::vector<std::string> signingKeys;
    std::optional<std::string> description;
    std::optional<std::string> infoUrl;
    std::vector<std::string> tags;
    std::optional<NatsLimitsOptions> natsLimits;
    std::optional<AccountLimitsOptions> accountLimits;
    std::vector<JetStreamLimitsOptions> jetStreamLimits;
    std::optional<PermissionOptions> defaultPermissions;
    std::optional<TraceOptions> trace;
    std::vector<Export> exports;
    ConflictPolicy conflictPolicy = ConflictPolicy::LastWriteWins;
};

struct UserPermissionOptions : PermissionOptions {
    std::optional<std::int64_t> respMaxMsgs;
    std::optional<std::string> respTtl;   // duration string, e.g. "1h30m"
};

struct UserOptions {
    TemporalOptions temporal;
    std::optional<std::string> issuerAccount;
    std::optional<UserPermissionOptions> permissions;
    std::optional<NatsLimitsOptions> limits;
    std::optional<bool> bearerToken;
    std::vector<std::string> allowedConnectionTypes;
    std::vector<std::string> sourceNetworks;
    std::vector<TimeRange> timeRestrictions;
    std::optional<std::string> locale;
    std::vector<std::string> tags;
};

/// Result of one build: the token plus anything overwritten along the way
struct SignedEntity {
    std::string jwt;
    std::string publicKey;
    std::vector<Conflict> conflicts;
};

// Claim construction. Each is all-or-nothing and performs no signing.

[[nodiscard]] OperatorClaims makeOperatorClaims(const std::string& name,
                                                const KeyMaterial& ownKey,
                                                const OperatorOptions& options);

[[nodiscard]] AccountClaims makeAccountClaims(const std::string& name,
                                              const KeyMaterial& ownKey,
                                              const AccountOptions& options,
                                              std::vector<Conflict>& conflicts);

[[nodiscard]] UserClaims makeUserClaims(const std::string& name,
                                        const KeyMaterial& ownKey,
                                        const UserOptions& options);

/// Merge the two monitoring exports unless exports on those subjects exist
void applySystemAccountDefaults(AccountClaims& claims);

// Build and sign. Role checks throw KeyTypeMismatch before anything else.

/// Operator token; ownKey and signerKey must both be operator keys
[[nodiscard]] SignedEntity buildOperator(const std::string& name,
                                         const KeyMaterial& ownKey,
                                         const KeyMaterial& signerKey,
                                         const OperatorOptions& options = {});

/// Account token; ownKey must be an account key, signerKey an operator key
[[nodiscard]] SignedEntity buildAccount(const std::string& name,
                                        const KeyMaterial& ownKey,
                                        const KeyMaterial& signerKey,
                                        const AccountOptions& options = {});

/// Account token with the system monitoring exports merged in
[[nodiscard]] SignedEntity buildSystemAccount(const std::string& name,
                                              const KeyMaterial& ownKey,
                                              const KeyMaterial& signerKey,
                                              const AccountOptions& options = {});

/// User token; ownKey must be a user key, signerKey an account key
[[nodiscard]] SignedEntity buildUser(const std::string& name,
                                     const KeyMaterial& ownKey,
                                     const KeyMaterial& signerKey,
                                     const UserOptions& options = {});

} // namespace natscred
