#pragma once
#include "natscred/operator_claims.hpp"
#include "natscred/account_claims.hpp"
#include "natscred/user_claims.hpp"
#include "natscred/key_material.hpp"
#include <variant>

namespace natscred {

/// Tagged union over the three entity kinds
using ClaimSet = std::variant<OperatorClaims, AccountClaims, UserClaims>;

/// Common fields of whichever alternative is held
[[nodiscard]] const ClaimsData& common(const ClaimSet& claims);
[[nodiscard]] ClaimsData& common(ClaimSet& claims);

/// Role the subject of the held alternative must have
[[nodiscard]] KeyKind subjectKind(const ClaimSet& claims);

/// Role the issuer of the held alternative must have
[[nodiscard]] KeyKind issuerKind(const ClaimSet& claims);

/// Validate whichever alternative is held
void validate(const ClaimSet& claims);

/// Decode a JWT string into the matching claim kind (no signature check)
/// @throws DecodingFailure if the token cannot be parsed
[[nodiscard]] ClaimSet decode(const std::string& jwt);

/// Verify a JWT signature against its own "iss" field
[[nodiscard]] bool verify(const std::string& jwt);

} // namespace natscred
