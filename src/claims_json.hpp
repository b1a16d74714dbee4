#pragma once

#include "natscred/account_claims.hpp"
#include "natscred/claims.hpp"
#include "natscred/key_material.hpp"
#include "natscred/operator_claims.hpp"
#include "natscred/user_claims.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace natscred::internal {

using json = nlohmann::json;

/// Top-level payload fields ("iss", "sub", "iat", ...) without "nats"
json commonToJson(const ClaimsData& claims);

/// Read the top-level payload fields
/// @throws DecodingFailure on missing or mistyped fields
void commonFromJson(const json& payload, ClaimsData& claims);

/// "tags" member of a nats object; omitted when empty
void putTags(json& nats, const std::set<std::string>& tags);

json permissionToJson(const Permission& permission);
json permissionsToJson(const Permissions& permissions);
Permissions permissionsFromJson(const json& object);

json natsLimitsToJson(const NatsLimits& limits);
NatsLimits natsLimitsFromJson(const json& object);

// Typed field accessors. Absent keys give the fallback; keys present with
// the wrong type throw DecodingFailure naming the key.
std::string stringOr(const json& object, const char* key, const std::string& fallback = {});
std::int64_t intOr(const json& object, const char* key, std::int64_t fallback);
bool boolOr(const json& object, const char* key, bool fallback);
std::vector<std::string> stringList(const json& object, const char* key);
std::set<std::string> stringSet(const json& object, const char* key);
const json* objectOrNull(const json& object, const char* key);

/// Store a set as a sorted array unless it is empty
void putSet(json& object, const char* key, const std::set<std::string>& values);

/// Store a string unless it is empty
void putString(json& object, const char* key, const std::string& value);

/// Subject/issuer roles, temporal ordering and tags of any claim kind
void validateCommon(const ClaimsData& claims, KeyKind subjectKind, KeyKind issuerKind);

/// Check every pattern of a permission set
void validatePermissions(const char* field, const Permissions& permissions);

// Per-kind "nats" sections, defined beside each claim kind

json natsToJson(const OperatorClaims& claims);
json natsToJson(const AccountClaims& claims);
json natsToJson(const UserClaims& claims);

void natsFromJson(const json& nats, OperatorClaims& claims);
void natsFromJson(const json& nats, AccountClaims& claims);
void natsFromJson(const json& nats, UserClaims& claims);

} // namespace natscred::internal
