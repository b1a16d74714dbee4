#include <gtest/gtest.h>
#include "natscred/hierarchy.hpp"
#include "natscred/validation.hpp"
#include <string>
#include <vector>

using namespace natscred;

namespace {
ValidationOptions at(std::int64_t now) {
    ValidationOptions opts;
    opts.now = now;
    return opts;
}
}

// ============================================================================
// Time-Based Validation Tests
// ============================================================================

TEST(ValidationTest, NonExpiredTokenIsValid) {
    ClaimsData claims;
    claims.issuedAt = 1000;
    claims.expires = 2000;

    auto result = validateExpiration(claims, at(1500));
    EXPECT_TRUE(result.valid);
    EXPECT_FALSE(result.error.has_value());
}

TEST(ValidationTest, ExpiredTokenIsInvalid) {
    ClaimsData claims;
    claims.expires = 2000;

    auto result = validateExpiration(claims, at(2001));
    EXPECT_FALSE(result.valid);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("expired"), std::string::npos);
}

TEST(ValidationTest, TokenWithoutExpirationIsValid) {
    ClaimsData claims;
    EXPECT_TRUE(validateExpiration(claims).valid);
    EXPECT_TRUE(validateExpiration(claims, at(9999999999)).valid);
}

TEST(ValidationTest, ClockSkewAllowsRecentlyExpiredToken) {
    ClaimsData claims;
    claims.expires = 2000;

    auto opts = at(2030);
    EXPECT_FALSE(validateExpiration(claims, opts).valid);

    opts.clockSkewSeconds = 60;
    EXPECT_TRUE(validateExpiration(claims, opts).valid);
}

TEST(ValidationTest, NotYetValidTokenIsInvalid) {
    ClaimsData claims;
    claims.notBefore = 5000;

    auto result = validateNotBefore(claims, at(4000));
    EXPECT_FALSE(result.valid);
    EXPECT_NE(result.error->find("not yet valid"), std::string::npos);

    EXPECT_TRUE(validateNotBefore(claims, at(5000)).valid);
}

TEST(ValidationTest, ComprehensiveTimingValidation) {
    ClaimsData claims;
    claims.notBefore = 5000;
    claims.expires = 6000;

    // Not-before is only checked on request
    EXPECT_TRUE(validateTiming(claims, at(4000)).valid);

    auto opts = at(4000);
    opts.checkNotBefore = true;
    EXPECT_FALSE(validateTiming(claims, opts).valid);

    opts.now = 5500;
    EXPECT_TRUE(validateTiming(claims, opts).valid);

    opts.now = 7000;
    EXPECT_FALSE(validateTiming(claims, opts).valid);
}

TEST(ValidationTest, SystemClockUsedWhenNowUnset) {
    ClaimsData claims;
    claims.expires = 1;   // long past
    EXPECT_FALSE(validateExpiration(claims).valid);
}

// ============================================================================
// Issuer Chain / Hierarchy Tests
// ============================================================================

class ChainValidationTest : public ::testing::Test {
protected:
    KeyMaterial operatorKey = KeyMaterial::generate(KeyKind::Operator);
    KeyMaterial accountKey = KeyMaterial::generate(KeyKind::Account);
    KeyMaterial userKey = KeyMaterial::generate(KeyKind::User);

    std::string operatorJwt;
    std::string accountJwt;
    std::string userJwt;

    void SetUp() override {
        operatorJwt = buildOperator("op", operatorKey, operatorKey).jwt;
        accountJwt = buildAccount("acme", accountKey, operatorKey).jwt;
        userJwt = buildUser("alice", userKey, accountKey).jwt;
    }
};

TEST_F(ChainValidationTest, ValidIssuerChain) {
    EXPECT_TRUE(validateIssuerChain(decode(accountJwt), decode(operatorJwt)).valid);
    EXPECT_TRUE(validateIssuerChain(decode(userJwt), decode(accountJwt)).valid);
}

TEST_F(ChainValidationTest, BrokenIssuerChain) {
    auto otherAccount = KeyMaterial::generate(KeyKind::Account);
    std::string otherJwt = buildAccount("other", otherAccount, operatorKey).jwt;

    auto result = validateIssuerChain(decode(userJwt), decode(otherJwt));
    EXPECT_FALSE(result.valid);
    EXPECT_NE(result.error->find("Issuer chain broken"), std::string::npos);
}

TEST_F(ChainValidationTest, SigningKeyChain) {
    auto signingKey = KeyMaterial::generate(KeyKind::Account);
    AccountOptions accountOptions;
    accountOptions.signingKeys = {signingKey.publicKey()};
    std::string parent = buildAccount("acme", accountKey, operatorKey, accountOptions).jwt;

    UserOptions userOptions;
    userOptions.issuerAccount = accountKey.publicKey();
    std::string child = buildUser("alice", userKey, signingKey, userOptions).jwt;

    EXPECT_TRUE(validateIssuerChain(decode(child), decode(parent)).valid);
    EXPECT_TRUE(validateChain({operatorJwt, parent, child}, ValidationOptions::strict()).valid);

    // Same signing key, but the account does not declare it
    EXPECT_FALSE(validateIssuerChain(decode(child), decode(accountJwt)).valid);
}

TEST_F(ChainValidationTest, SigningKeyChainRequiresIssuerAccount) {
    auto signingKey = KeyMaterial::generate(KeyKind::Account);
    AccountOptions accountOptions;
    accountOptions.signingKeys = {signingKey.publicKey()};
    std::string parent = buildAccount("acme", accountKey, operatorKey, accountOptions).jwt;

    std::string child = buildUser("alice", userKey, signingKey).jwt;

    auto result = validateIssuerChain(decode(child), decode(parent));
    EXPECT_FALSE(result.valid);
    EXPECT_NE(result.error->find("issuer_account"), std::string::npos);
}

TEST_F(ChainValidationTest, ValidHierarchies) {
    EXPECT_TRUE(validateKeyHierarchy(decode(operatorJwt), decode(operatorJwt)).valid);
    EXPECT_TRUE(validateKeyHierarchy(decode(accountJwt), decode(operatorJwt)).valid);
    EXPECT_TRUE(validateKeyHierarchy(decode(userJwt), decode(accountJwt)).valid);
}

TEST_F(ChainValidationTest, InvalidHierarchies) {
    auto userUnderOperator = validateKeyHierarchy(decode(userJwt), decode(operatorJwt));
    EXPECT_FALSE(userUnderOperator.valid);
    EXPECT_NE(userUnderOperator.error->find("Invalid hierarchy"), std::string::npos);

    EXPECT_FALSE(validateKeyHierarchy(decode(accountJwt), decode(userJwt)).valid);
    EXPECT_FALSE(validateKeyHierarchy(decode(operatorJwt), decode(accountJwt)).valid);

    auto otherOperator = KeyMaterial::generate(KeyKind::Operator);
    std::string otherJwt = buildOperator("other", otherOperator, otherOperator).jwt;
    EXPECT_FALSE(validateKeyHierarchy(decode(operatorJwt), decode(otherJwt)).valid);
}

// ============================================================================
// Comprehensive Validation
// ============================================================================

TEST_F(ChainValidationTest, ValidateJwtString) {
    EXPECT_TRUE(validate(accountJwt).valid);
    EXPECT_TRUE(validate(userJwt, ValidationOptions::strict()).valid);
}

TEST_F(ChainValidationTest, ValidateExpiredJwtString) {
    AccountOptions options;
    options.temporal.issuedAt = 1000;
    options.temporal.expires = 2000;
    std::string jwt = buildAccount("acme", accountKey, operatorKey, options).jwt;

    auto result = validate(jwt, at(3000));
    EXPECT_FALSE(result.valid);
    EXPECT_NE(result.error->find("expired"), std::string::npos);

    EXPECT_TRUE(validate(jwt, at(1500)).valid);
    EXPECT_TRUE(validate(jwt, ValidationOptions::permissive()).valid);
}

TEST_F(ChainValidationTest, ValidateWithInvalidSignature) {
    std::string otherJwt = buildAccount("other", accountKey, operatorKey).jwt;
    std::string tampered = accountJwt.substr(0, accountJwt.rfind('.')) + otherJwt.substr(otherJwt.rfind('.'));

    auto result = validate(tampered);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error.value_or(""), "Invalid JWT signature");

    auto opts = ValidationOptions::permissive();
    EXPECT_TRUE(validate(tampered, opts).valid);
}

TEST_F(ChainValidationTest, ValidateGarbage) {
    auto result = validate(std::string("garbage"));
    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(result.error.has_value());
}

TEST_F(ChainValidationTest, ValidateCompleteChain) {
    auto result = validateChain({operatorJwt, accountJwt, userJwt}, ValidationOptions::strict());
    EXPECT_TRUE(result.valid) << result.error.value_or("");
}

TEST_F(ChainValidationTest, ValidateChainWithBrokenLink) {
    auto otherOperator = KeyMaterial::generate(KeyKind::Operator);
    std::string foreignAccount = buildAccount("acme", accountKey, otherOperator).jwt;

    auto result = validateChain({operatorJwt, foreignAccount, userJwt}, ValidationOptions::strict());
    EXPECT_FALSE(result.valid);
    EXPECT_NE(result.error->find("index 1"), std::string::npos);
}

TEST_F(ChainValidationTest, ValidateChainChecksLinksOnlyWhenAsked) {
    auto otherOperator = KeyMaterial::generate(KeyKind::Operator);
    std::string foreignAccount = buildAccount("acme", accountKey, otherOperator).jwt;

    EXPECT_TRUE(validateChain({operatorJwt, foreignAccount, userJwt}).valid);
}

TEST(ValidationTest, ValidateEmptyChain) {
    auto result = validateChain({});
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error.value_or(""), "Empty JWT chain");
}

TEST(ValidationTest, StrictAndPermissiveOptions) {
    auto strict = ValidationOptions::strict();
    EXPECT_TRUE(strict.checkExpiration);
    EXPECT_TRUE(strict.checkNotBefore);
    EXPECT_TRUE(strict.checkSignature);
    EXPECT_TRUE(strict.checkIssuerChain);
    EXPECT_EQ(strict.clockSkewSeconds, 0);

    auto permissive = ValidationOptions::permissive();
    EXPECT_FALSE(permissive.checkExpiration);
    EXPECT_FALSE(permissive.checkSignature);
    EXPECT_EQ(permissive.clockSkewSeconds, 300);
}

TEST(ValidationTest, ValidationResultBoolConversion) {
    EXPECT_TRUE(static_cast<bool>(ValidationResult::success()));
    EXPECT_FALSE(static_cast<bool>(ValidationResult::failure("nope")));
}

// ============================================================================
// Effective Permissions
// ============================================================================

TEST(EffectivePermissionsTest, UserWithoutRulesInheritsAccountDefaults) {
    AccountClaims account;
    account.defaultPermissions.pub.allow = {"orders.>"};
    UserClaims user;

    EXPECT_EQ(effectivePermissions(account, user), account.defaultPermissions);
}

TEST(EffectivePermissionsTest, UserRulesReplaceDefaults) {
    AccountClaims account;
    account.defaultPermissions.pub.allow = {"orders.>"};
    UserClaims user;
    user.permissions.sub.allow = {"_INBOX.>"};

    EXPECT_EQ(effectivePermissions(account, user), user.permissions);
}

TEST(EffectivePermissionsTest, ResponsePermissionKeptWhenInheriting) {
    AccountClaims account;
    account.defaultPermissions.pub.allow = {"orders.>"};
    UserClaims user;
    user.permissions.resp = ResponsePermission{1, 1000};

    auto effective = effectivePermissions(account, user);
    EXPECT_EQ(effective.pub.allow, account.defaultPermissions.pub.allow);
    ASSERT_TRUE(effective.resp.has_value());
    EXPECT_EQ(effective.resp->maxMsgs, 1);
}
