#pragma once
#include "natscred/claims.hpp"

namespace natscred {

/// Operator-level claims (root of the trust hierarchy, self-signed)
struct OperatorClaims : ClaimsData {
    std::set<std::string> signingKeys;
    std::string accountServerUrl;
    std::vector<std::string> operatorServiceUrls;
    std::string systemAccount;
    bool strictSigningKeyUsage = false;

    bool operator==(const OperatorClaims&) const = default;
};

/// Check the operator claim invariants
/// @throws MalformedInput or KeyTypeMismatch on the first offending field
void validate(const OperatorClaims& claims);

/// Decode an operator JWT (no signature check)
/// @throws DecodingFailure if the token is not an operator token
[[nodiscard]] OperatorClaims decodeOperatorClaims(const std::string& jwt);

} // namespace natscred
