#pragma once
#include "natscred/claims.hpp"

namespace natscred {

/// User-level claims (leaf of the trust hierarchy, signed by an account)
struct UserClaims : ClaimsData {
    std::string issuerAccount;   // set when signed by an account signing key
    Permissions permissions;
    NatsLimits limits;
    bool bearerToken = false;
    std::set<ConnectionType> allowedConnectionTypes;
    std::set<std::string> sourceNetworks;   // canonical CIDR blocks
    std::vector<TimeRange> timeRestrictions;
    std::string locale;                     // IANA zone, required with timeRestrictions

    bool operator==(const UserClaims&) const = default;
};

/// Check the user claim invariants, including the locale/time window rule
/// @throws MalformedInput or KeyTypeMismatch on the first offending field
void validate(const UserClaims& claims);

/// Decode a user JWT (no signature check)
/// @throws DecodingFailure if the token is not a user token
[[nodiscard]] UserClaims decodeUserClaims(const std::string& jwt);

} // namespace natscred
