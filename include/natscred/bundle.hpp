#pragma once
#include "natscred/hierarchy.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace natscred {

/// Account resolver kinds understood by the server; only Memory is assembled
enum class ResolverKind {
    Memory,
    Full,
    Cache
};

[[nodiscard]] std::string toString(ResolverKind kind);

/// @throws AssemblyError reason "unsupported resolver" for unknown names
[[nodiscard]] ResolverKind parseResolverKind(std::string_view name);

/// Server trust configuration assembled from already-signed tokens
struct Bundle {
    std::string operatorJwt;
    std::string systemAccountPublicKey;          // empty without a system account
    ResolverKind resolverKind = ResolverKind::Memory;
    std::map<std::string, std::string> preload;  // account public key -> JWT
    std::vector<Conflict> conflicts;             // subjects supplied twice
};

/**
 * Build the resolver preload map from signed tokens.
 *
 * Needs no seeds: each account token is decoded only for its subject.
 * The system account token (if any) is inserted first, then accountJwts
 * in order; a repeated subject keeps the later token.
 *
 * @throws AssemblyError reason "unsupported resolver" if resolver != Memory
 * @throws AssemblyError reason "malformed operator token" / "malformed account token"
 * @throws ConflictingConfiguration for a repeated subject under ConflictPolicy::Reject
 */
[[nodiscard]] Bundle assemble(const std::string& operatorJwt,
                              const std::optional<std::string>& systemAccountJwt,
                              const std::vector<std::string>& accountJwts,
                              ResolverKind resolver = ResolverKind::Memory,
                              ConflictPolicy policy = ConflictPolicy::LastWriteWins);

/// Render a bundle as a server configuration fragment
[[nodiscard]] std::string renderServerConfig(const Bundle& bundle);

} // namespace natscred
