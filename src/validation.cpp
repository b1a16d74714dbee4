#include "natscred/validation.hpp"
#include <chrono>
#include <sstream>

namespace natscred {

namespace {
    /**
     * Reference time: the caller's fixed time or the current Unix time
     */
    std::int64_t currentTime(const ValidationOptions& opts) {
        if (opts.now > 0) {
            return opts.now;
        }
        auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count();
    }

    const AccountClaims* asAccount(const ClaimSet& claims) {
        return std::get_if<AccountClaims>(&claims);
    }
}

ValidationResult validateExpiration(const ClaimsData& claims, const ValidationOptions& opts) {
    std::int64_t exp = claims.expires;

    // 0 means the token never expires
    if (exp <= 0) {
        return ValidationResult::success();
    }

    std::int64_t now = currentTime(opts);
    if (now > exp + opts.clockSkewSeconds) {
        std::ostringstream oss;
        oss << "JWT has expired (exp: " << exp << ", now: " << now << ")";
        return ValidationResult::failure(oss.str());
    }

    return ValidationResult::success();
}

ValidationResult validateNotBefore(const ClaimsData& claims, const ValidationOptions& opts) {
    std::int64_t nbf = claims.notBefore;

    if (nbf <= 0) {
        return ValidationResult::success();
    }

    std::int64_t now = currentTime(opts);
    if (now < nbf - opts.clockSkewSeconds) {
        std::ostringstream oss;
        oss << "JWT is not yet valid (nbf: " << nbf << ", now: " << now << ")";
        return ValidationResult::failure(oss.str());
    }

    return ValidationResult::success();
}

ValidationResult validateTiming(const ClaimsData& claims, const ValidationOptions& opts) {
    if (opts.checkNotBefore) {
        auto nbfResult = validateNotBefore(claims, opts);
        if (!nbfResult.valid) {
            return nbfResult;
        }
    }

    if (opts.checkExpiration) {
        auto expResult = validateExpiration(claims, opts);
        if (!expResult.valid) {
            return expResult;
        }
    }

    return ValidationResult::success();
}

ValidationResult validateIssuerChain(const ClaimSet& child, const ClaimSet& parent) {
    const auto& childIssuer = common(child).issuer;
    const auto& parentSubject = common(parent).subject;

    if (childIssuer.empty()) {
        return ValidationResult::failure("Child issuer is empty");
    }

    if (parentSubject.empty()) {
        return ValidationResult::failure("Parent subject is empty");
    }

    if (childIssuer == parentSubject) {
        if (const auto* user = std::get_if<UserClaims>(&child);
            user && !user->issuerAccount.empty() && user->issuerAccount != parentSubject) {
            return ValidationResult::failure("User issuer_account '" + user->issuerAccount +
                                             "' does not match account '" + parentSubject + "'");
        }
        return ValidationResult::success();
    }

    // Signed through one of the parent's signing keys
    const std::set<std::string>* signingKeys = nullptr;
    if (const auto* account = asAccount(parent)) {
        signingKeys = &account->signingKeys;
    } else if (const auto* op = std::get_if<OperatorClaims>(&parent)) {
        signingKeys = &op->signingKeys;
    }

    if (signingKeys == nullptr || signingKeys->count(childIssuer) == 0) {
        std::ostringstream oss;
        oss << "Issuer chain broken: child issuer '" << childIssuer
            << "' is neither parent subject '" << parentSubject
            << "' nor one of its signing keys";
        return ValidationResult::failure(oss.str());
    }

    if (const auto* user = std::get_if<UserClaims>(&child); user && user->issuerAccount != parentSubject) {
        return ValidationResult::failure("User signed by an account signing key must set issuer_account to '" +
                                         parentSubject + "'");
    }

    return ValidationResult::success();
}

ValidationResult validateKeyHierarchy(const ClaimSet& child, const ClaimSet& parent) {
    KeyKind childType = subjectKind(child);
    KeyKind parentType = subjectKind(parent);

    if (childType == KeyKind::Operator && parentType == KeyKind::Operator) {
        // Operators sign themselves, directly or through a signing key
        if (common(child).subject != common(parent).subject) {
            return ValidationResult::failure("Operator must be self-signed");
        }
    } else if (childType != KeyKind::Account || parentType != KeyKind::Operator) {
        if (childType != KeyKind::User || parentType != KeyKind::Account) {
            std::ostringstream oss;
            oss << "Invalid hierarchy: " << toString(childType)
                << " cannot be signed by " << toString(parentType);
            return ValidationResult::failure(oss.str());
        }
    }

    if (issuerKind(child) != parentType) {
        std::ostringstream oss;
        oss << "Issuer type mismatch: " << toString(childType)
            << " must be issued by " << toString(issuerKind(child));
        return ValidationResult::failure(oss.str());
    }

    return ValidationResult::success();
}

ValidationResult validate(const std::string& jwt, const ValidationOptions& opts) {
    ClaimSet claims;
    try {
        claims = decode(jwt);
    } catch (const std::exception& e) {
        std::ostringstream oss;
        oss << e.what();
        return ValidationResult::failure(oss.str());
    }

    if (opts.checkSignature && !verify(jwt)) {
        return ValidationResult::failure("Invalid JWT signature");
    }

    return validate(claims, opts);
}

ValidationResult validate(const ClaimSet& claims, const ValidationOptions& opts) {
    auto timingResult = validateTiming(common(claims), opts);
    if (!timingResult.valid) {
        return timingResult;
    }

    // Perform structural validation
    try {
        validate(claims);
    } catch (const std::invalid_argument& e) {
        std::ostringstream oss;
        oss << "Structural validation failed: " << e.what();
        return ValidationResult::failure(oss.str());
    }

    return ValidationResult::success();
}

ValidationResult validateChain(const std::vector<std::string>& jwts, const ValidationOptions& opts) {
    if (jwts.empty()) {
        return ValidationResult::failure("Empty JWT chain");
    }

    std::vector<ClaimSet> claimsChain;
    for (std::size_t i = 0; i < jwts.size(); ++i) {
        auto result = validate(jwts[i], opts);
        if (!result.valid) {
            std::ostringstream oss;
            oss << "JWT at index " << i << " failed validation: " << result.error.value_or("unknown error");
            return ValidationResult::failure(oss.str());
        }
        claimsChain.push_back(decode(jwts[i]));
    }

    if (opts.checkIssuerChain && claimsChain.size() > 1) {
        for (std::size_t i = 1; i < claimsChain.size(); ++i) {
            const ClaimSet& child = claimsChain[i];
            const ClaimSet& parent = claimsChain[i - 1];

            auto hierarchyResult = validateKeyHierarchy(child, parent);
            if (!hierarchyResult.valid) {
                std::ostringstream oss;
                oss << "Hierarchy validation failed at index " << i << ": " << hierarchyResult.error.value_or("unknown error");
                return ValidationResult::failure(oss.str());
            }

            auto chainResult = validateIssuerChain(child, parent);
            if (!chainResult.valid) {
                std::ostringstream oss;
                oss << "Chain validation failed at index " << i << ": " << chainResult.error.value_or("unknown error");
                return ValidationResult::failure(oss.str());
            }
        }
    }

    return ValidationResult::success();
}

Permissions effectivePermissions(const AccountClaims& account, const UserClaims& user) {
    if (!user.permissions.pub.empty() || !user.permissions.sub.empty()) {
        return user.permissions;
    }
    Permissions inherited = account.defaultPermissions;
    if (user.permissions.resp) {
        inherited.resp = user.permissions.resp;
    }
    return inherited;
}

}
