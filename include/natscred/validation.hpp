#pragma once

#include "natscred/claim_set.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace natscred {

/**
 * Validation result indicating success or failure with optional error message
 */
struct ValidationResult {
    bool valid;
    std::optional<std::string> error;

    explicit operator bool() const { return valid; }

    static ValidationResult success() {
        return ValidationResult{true, std::nullopt};
    }

    static ValidationResult failure(const std::string& msg) {
        return ValidationResult{false, msg};
    }
};

/**
 * Options for configuring token validation behavior
 */
struct ValidationOptions {
    // Time-based validation
    bool checkExpiration = true;        // Check if the token has expired
    bool checkNotBefore = false;        // Check if the token is not yet valid (nbf claim)
    std::int64_t clockSkewSeconds = 0;  // Allow clock skew tolerance
    std::int64_t now = 0;               // Reference time, 0 = system clock

    // Signature validation
    bool checkSignature = true;         // Verify signature

    // Chain validation
    bool checkIssuerChain = false;      // Verify issuer chain (parent signed child)

    static ValidationOptions strict() {
        ValidationOptions opts;
        opts.checkExpiration = true;
        opts.checkNotBefore = true;
        opts.checkSignature = true;
        opts.checkIssuerChain = true;
        opts.clockSkewSeconds = 0;
        return opts;
    }

    static ValidationOptions permissive() {
        ValidationOptions opts;
        opts.checkExpiration = false;
        opts.checkNotBefore = false;
        opts.checkSignature = false;
        opts.checkIssuerChain = false;
        opts.clockSkewSeconds = 300;  // 5 minutes
        return opts;
    }
};

/**
 * Check if a token has expired
 * @param claims The claims to validate
 * @param opts Reference time and clock skew tolerance
 * @return ValidationResult indicating if the token is expired
 */
ValidationResult validateExpiration(const ClaimsData& claims, const ValidationOptions& opts = ValidationOptions{});

/**
 * Check if a token is not yet valid (nbf)
 * @param claims The claims to validate
 * @param opts Reference time and clock skew tolerance
 * @return ValidationResult indicating if the token is not yet valid
 */
ValidationResult validateNotBefore(const ClaimsData& claims, const ValidationOptions& opts = ValidationOptions{});

/**
 * Perform comprehensive time-based validation
 */
ValidationResult validateTiming(const ClaimsData& claims, const ValidationOptions& opts = ValidationOptions{});

/**
 * Validate the issuer chain. The child's issuer must be the parent's
 * subject or one of the parent's signing keys; a user signed through an
 * account signing key must name the account in issuer_account.
 * @param child The child claims (signed by parent)
 * @param parent The parent claims (issuer)
 */
ValidationResult validateIssuerChain(const ClaimSet& child, const ClaimSet& parent);

/**
 * Validate the role of child and parent (operator -> account -> user)
 */
ValidationResult validateKeyHierarchy(const ClaimSet& child, const ClaimSet& parent);

/**
 * Perform comprehensive validation on a token string
 */
ValidationResult validate(const std::string& jwt, const ValidationOptions& opts = ValidationOptions{});

/**
 * Perform timing and structural validation on decoded claims
 */
ValidationResult validate(const ClaimSet& claims, const ValidationOptions& opts);

/**
 * Validate a complete trust chain (Operator -> Account -> User)
 * @param jwts Tokens in hierarchy order [operator, account, user]
 */
ValidationResult validateChain(const std::vector<std::string>& jwts, const ValidationOptions& opts = ValidationOptions{});

/**
 * Permissions a user effectively connects with: its own set if it declares
 * any rule, otherwise the account's default permissions.
 */
[[nodiscard]] Permissions effectivePermissions(const AccountClaims& account, const UserClaims& user);

}
