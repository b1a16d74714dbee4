#include "natscred/bundle.hpp"
#include "natscred/account_claims.hpp"
#include "natscred/errors.hpp"
#include "natscred/operator_claims.hpp"
#include <sstream>

namespace natscred {

std::string toString(ResolverKind kind) {
    switch (kind) {
        case ResolverKind::Memory: return "MEMORY";
        case ResolverKind::Full: return "full";
        case ResolverKind::Cache: return "cache";
    }
    return "unknown";
}

ResolverKind parseResolverKind(std::string_view name) {
    if (name == "MEMORY") return ResolverKind::Memory;
    if (name == "full") return ResolverKind::Full;
    if (name == "cache") return ResolverKind::Cache;
    throw AssemblyError("unsupported resolver", "unknown resolver type '" + std::string(name) + "'");
}

Bundle assemble(const std::string& operatorJwt,
                const std::optional<std::string>& systemAccountJwt,
                const std::vector<std::string>& accountJwts,
                ResolverKind resolver,
                ConflictPolicy policy) {
    if (resolver != ResolverKind::Memory) {
        throw AssemblyError("unsupported resolver",
                            "only MEMORY resolver is currently supported, got: " + toString(resolver));
    }

    try {
        static_cast<void>(decodeOperatorClaims(operatorJwt));
    } catch (const DecodingFailure& e) {
        throw AssemblyError("malformed operator token", e.what());
    }

    Bundle bundle;
    bundle.operatorJwt = operatorJwt;
    bundle.resolverKind = resolver;

    // Only the subject is needed; no key material is involved
    auto add = [&](const std::string& jwt, const std::string& what) {
        std::string subject;
        try {
            subject = decodeAccountClaims(jwt).subject;
        } catch (const DecodingFailure& e) {
            throw AssemblyError("malformed account token", what + ": " + e.what());
        }
        if (auto [it, inserted] = bundle.preload.insert_or_assign(subject, jwt); !inserted) {
            if (policy == ConflictPolicy::Reject) {
                throw ConflictingConfiguration("resolver_preload", subject);
            }
            bundle.conflicts.push_back(Conflict{"resolver_preload", subject});
        }
        return subject;
    };

    if (systemAccountJwt) {
        bundle.systemAccountPublicKey = add(*systemAccountJwt, "system account");
    }
    for (std::size_t i = 0; i < accountJwts.size(); ++i) {
        add(accountJwts[i], "account at index " + std::to_string(i));
    }

    return bundle;
}

std::string renderServerConfig(const Bundle& bundle) {
    std::ostringstream oss;
    oss << "operator: " << bundle.operatorJwt << "\n";
    if (!bundle.systemAccountPublicKey.empty()) {
        oss << "system_account: " << bundle.systemAccountPublicKey << "\n";
    }
    oss << "resolver: " << toString(bundle.resolverKind) << "\n";
    if (!bundle.preload.empty()) {
        oss << "resolver_preload: {\n";
        for (const auto& [publicKey, jwt] : bundle.preload) {
            oss << "  " << publicKey << ": " << jwt << "\n";
        }
        oss << "}\n";
    }
    return oss.str();
}

} // namespace natscred
