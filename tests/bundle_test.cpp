#include <gtest/gtest.h>
#include "natscred/bundle.hpp"
#include "natscred/errors.hpp"
#include <string>

using namespace natscred;

class BundleTest : public ::testing::Test {
protected:
    KeyMaterial operatorKey = KeyMaterial::generate(KeyKind::Operator);
    KeyMaterial sysKey = KeyMaterial::generate(KeyKind::Account);
    KeyMaterial a2Key = KeyMaterial::generate(KeyKind::Account);
    KeyMaterial a3Key = KeyMaterial::generate(KeyKind::Account);

    std::string operatorJwt;
    std::string sysJwt;
    std::string a2Jwt;
    std::string a3Jwt;

    void SetUp() override {
        OperatorOptions options;
        options.systemAccount = sysKey.publicKey();
        operatorJwt = buildOperator("op", operatorKey, operatorKey, options).jwt;
        sysJwt = buildSystemAccount("SYS", sysKey, operatorKey).jwt;
        a2Jwt = buildAccount("A2", a2Key, operatorKey).jwt;
        a3Jwt = buildAccount("A3", a3Key, operatorKey).jwt;
    }

    static size_t count(const std::string& haystack, const std::string& needle) {
        size_t n = 0;
        for (size_t pos = haystack.find(needle); pos != std::string::npos;
             pos = haystack.find(needle, pos + needle.size())) {
            ++n;
        }
        return n;
    }
};

TEST_F(BundleTest, EndToEndPreloadAndConfig) {
    auto bundle = assemble(operatorJwt, sysJwt, {a2Jwt, a3Jwt});

    ASSERT_EQ(bundle.preload.size(), 3u);
    EXPECT_EQ(bundle.preload.at(sysKey.publicKey()), sysJwt);
    EXPECT_EQ(bundle.preload.at(a2Key.publicKey()), a2Jwt);
    EXPECT_EQ(bundle.preload.at(a3Key.publicKey()), a3Jwt);
    EXPECT_EQ(bundle.systemAccountPublicKey, sysKey.publicKey());
    EXPECT_EQ(bundle.operatorJwt, operatorJwt);
    EXPECT_TRUE(bundle.conflicts.empty());

    std::string config = renderServerConfig(bundle);
    EXPECT_NE(config.find("operator: " + operatorJwt + "\n"), std::string::npos);
    EXPECT_NE(config.find("system_account: " + sysKey.publicKey() + "\n"), std::string::npos);
    EXPECT_NE(config.find("resolver: MEMORY\n"), std::string::npos);
    EXPECT_EQ(count(config, "resolver_preload:"), 1u);
    EXPECT_NE(config.find("  " + sysKey.publicKey() + ": " + sysJwt + "\n"), std::string::npos);
    EXPECT_NE(config.find("  " + a2Key.publicKey() + ": " + a2Jwt + "\n"), std::string::npos);
    EXPECT_NE(config.find("  " + a3Key.publicKey() + ": " + a3Jwt + "\n"), std::string::npos);
}

TEST_F(BundleTest, WithoutSystemAccount) {
    auto bundle = assemble(operatorJwt, std::nullopt, {a2Jwt});

    EXPECT_TRUE(bundle.systemAccountPublicKey.empty());
    EXPECT_EQ(bundle.preload.size(), 1u);

    std::string config = renderServerConfig(bundle);
    EXPECT_EQ(config.find("system_account:"), std::string::npos);
    EXPECT_NE(config.find("resolver_preload: {"), std::string::npos);
}

TEST_F(BundleTest, EmptyPreloadOmitsBlock) {
    auto bundle = assemble(operatorJwt, std::nullopt, {});
    std::string config = renderServerConfig(bundle);

    EXPECT_EQ(config, "operator: " + operatorJwt + "\nresolver: MEMORY\n");
}

TEST_F(BundleTest, UnsupportedResolverRejected) {
    try {
        (void)assemble(operatorJwt, sysJwt, {a2Jwt}, ResolverKind::Full);
        FAIL() << "Expected AssemblyError";
    } catch (const AssemblyError& e) {
        EXPECT_EQ(e.reason(), "unsupported resolver");
    }
}

TEST_F(BundleTest, ResolverNames) {
    EXPECT_EQ(parseResolverKind("MEMORY"), ResolverKind::Memory);
    EXPECT_EQ(parseResolverKind("full"), ResolverKind::Full);
    EXPECT_EQ(toString(ResolverKind::Memory), "MEMORY");
    try {
        (void)parseResolverKind("URL");
        FAIL() << "Expected AssemblyError";
    } catch (const AssemblyError& e) {
        EXPECT_EQ(e.reason(), "unsupported resolver");
    }
}

TEST_F(BundleTest, MalformedAccountTokenRejected) {
    try {
        (void)assemble(operatorJwt, sysJwt, {a2Jwt, "not.a.token"});
        FAIL() << "Expected AssemblyError";
    } catch (const AssemblyError& e) {
        EXPECT_EQ(e.reason(), "malformed account token");
    }
}

TEST_F(BundleTest, NonAccountTokenInAccountListRejected) {
    try {
        (void)assemble(operatorJwt, std::nullopt, {operatorJwt});
        FAIL() << "Expected AssemblyError";
    } catch (const AssemblyError& e) {
        EXPECT_EQ(e.reason(), "malformed account token");
    }
}

TEST_F(BundleTest, MalformedOperatorTokenRejected) {
    try {
        (void)assemble(a2Jwt, std::nullopt, {a3Jwt});
        FAIL() << "Expected AssemblyError";
    } catch (const AssemblyError& e) {
        EXPECT_EQ(e.reason(), "malformed operator token");
    }
}

TEST_F(BundleTest, DuplicateSubjectLastWinsAndIsRecorded) {
    AccountOptions renamed;
    renamed.description = "rebuilt";
    std::string sysAgain = buildAccount("SYS", sysKey, operatorKey, renamed).jwt;

    auto bundle = assemble(operatorJwt, sysJwt, {a2Jwt, sysAgain});

    EXPECT_EQ(bundle.preload.size(), 2u);
    EXPECT_EQ(bundle.preload.at(sysKey.publicKey()), sysAgain);
    ASSERT_EQ(bundle.conflicts.size(), 1u);
    EXPECT_EQ(bundle.conflicts[0], (Conflict{"resolver_preload", sysKey.publicKey()}));
}

TEST_F(BundleTest, DuplicateSubjectRejectedUnderRejectPolicy) {
    EXPECT_THROW((void)assemble(operatorJwt, std::nullopt, {a2Jwt, a2Jwt},
                                ResolverKind::Memory, ConflictPolicy::Reject),
                 ConflictingConfiguration);
}

TEST_F(BundleTest, AssemblyNeedsNoSeeds) {
    // Only token strings cross the interface
    const std::string op = operatorJwt;
    const std::vector<std::string> accounts = {a3Jwt, a2Jwt};
    auto first = renderServerConfig(assemble(op, std::nullopt, accounts));
    auto second = renderServerConfig(assemble(op, std::nullopt, accounts));
    EXPECT_EQ(first, second);
}
