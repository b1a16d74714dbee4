#pragma once
#include "natscred/claims.hpp"
#include <map>

namespace natscred {

/// Account-wide limits (-1 = unlimited)
struct AccountLimits {
    std::int64_t imports = NO_LIMIT;
    std::int64_t exports = NO_LIMIT;
    bool wildcardExports = true;
    bool disallowBearer = false;
    std::int64_t conn = NO_LIMIT;
    std::int64_t leafNodeConn = NO_LIMIT;

    bool operator==(const AccountLimits&) const = default;
};

/// JetStream resource limits; the all-zero default means JetStream is disabled
struct JetStreamLimits {
    std::int64_t memoryStorage = 0;
    std::int64_t diskStorage = 0;
    std::int64_t streams = 0;
    std::int64_t consumer = 0;
    std::int64_t maxAckPending = 0;
    std::int64_t memoryMaxStreamBytes = 0;
    std::int64_t diskMaxStreamBytes = 0;
    bool maxBytesRequired = false;

    bool operator==(const JetStreamLimits&) const = default;
};

enum class ExportType {
    Stream,
    Service
};

enum class ResponseType {
    Singleton,
    Stream,
    Chunked
};

[[nodiscard]] std::string toString(ExportType type);
[[nodiscard]] std::string toString(ResponseType type);

/// A subject the account makes available to other accounts
struct Export {
    std::string name;
    std::string subject;
    ExportType type = ExportType::Stream;
    std::optional<ResponseType> responseType;   // services only
    std::int64_t accountTokenPosition = 0;
    std::string description;
    std::string infoUrl;

    bool operator==(const Export&) const = default;
};

/// Message tracing destination
struct MsgTrace {
    std::string destination;
    std::int64_t sampling = 0;   // percent, 0-100

    bool operator==(const MsgTrace&) const = default;
};

/// Account-level claims (middle of the trust hierarchy, signed by the operator)
struct AccountClaims : ClaimsData {
    std::set<std::string> signingKeys;
    std::string description;
    std::string infoUrl;
    std::vector<Export> exports;
    NatsLimits natsLimits;
    AccountLimits accountLimits;
    JetStreamLimits jetStreamLimits;                       // global record
    std::map<std::string, JetStreamLimits> tieredLimits;   // tier absent => global
    Permissions defaultPermissions;
    std::optional<MsgTrace> trace;

    bool operator==(const AccountClaims&) const = default;

    /// JetStream limits applying to a tier, falling back to the global record
    [[nodiscard]] const JetStreamLimits& jetStreamFor(const std::string& tier) const;

    /// True if key is the account key itself or one of its signing keys
    [[nodiscard]] bool isAuthorizedSigner(const std::string& publicKey) const;
};

/// Check the account claim invariants
/// @throws MalformedInput or KeyTypeMismatch on the first offending field
void validate(const AccountClaims& claims);

/// Decode an account JWT (no signature check)
/// @throws DecodingFailure if the token is not an account token
[[nodiscard]] AccountClaims decodeAccountClaims(const std::string& jwt);

} // namespace natscred
