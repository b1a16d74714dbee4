#pragma once
#include "natscred/constants.hpp"
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace natscred {

/// Fields shared by every claim kind
struct ClaimsData {
    std::string subject;        // public key of the claim holder
    std::string issuer;         // public key of the signer, set at sign time
    std::string name;
    std::string id;             // "jti", always empty in deterministic tokens
    std::int64_t issuedAt = 0;  // domain epoch, never wall-clock
    std::int64_t expires = 0;   // 0 = never
    std::int64_t notBefore = 0;
    std::set<std::string> tags;

    bool operator==(const ClaimsData&) const = default;
};

/// Allow/deny subject patterns for one direction
struct Permission {
    std::set<std::string> allow;
    std::set<std::string> deny;

    [[nodiscard]] bool empty() const { return allow.empty() && deny.empty(); }
    bool operator==(const Permission&) const = default;
};

/// Reply permission granted to request handlers
struct ResponsePermission {
    std::int64_t maxMsgs = 0;
    std::int64_t ttlNanos = 0;

    bool operator==(const ResponsePermission&) const = default;
};

/// Publish/subscribe permission set
struct Permissions {
    Permission pub;
    Permission sub;
    std::optional<ResponsePermission> resp;

    [[nodiscard]] bool empty() const { return pub.empty() && sub.empty() && !resp; }
    bool operator==(const Permissions&) const = default;
};

/// Connection-level limits (-1 = unlimited)
struct NatsLimits {
    std::int64_t subs = NO_LIMIT;
    std::int64_t data = NO_LIMIT;
    std::int64_t payload = NO_LIMIT;

    bool operator==(const NatsLimits&) const = default;
};

/// Connection transports a user may connect over
enum class ConnectionType {
    Standard,
    Websocket,
    Leafnode,
    Mqtt
};

/// Wire name ("STANDARD", "WEBSOCKET", "LEAFNODE", "MQTT")
[[nodiscard]] std::string toString(ConnectionType type);

/// @throws MalformedInput naming field if the name is unknown
[[nodiscard]] ConnectionType parseConnectionType(std::string_view field, std::string_view name);

/// Daily time window, "HH:MM:SS" in the user's locale
struct TimeRange {
    std::string start;
    std::string end;

    bool operator==(const TimeRange&) const = default;
};

/// Lowercase a tag list into set form
[[nodiscard]] std::set<std::string> normalizeTags(const std::vector<std::string>& tags);

} // namespace natscred
