#pragma once
#include "natscred/bundle.hpp"
#include "natscred/hierarchy.hpp"
#include <optional>
#include <string>
#include <vector>

namespace natscred {

struct OperatorConfig {
    std::string name;
    std::string seed;
    OperatorOptions options;
};

struct AccountConfig {
    std::string name;
    std::string seed;
    std::string operatorSeed;
    bool systemAccount = false;
    AccountOptions options;
};

struct UserConfig {
    std::string name;
    std::string seed;
    std::string accountSeed;
    UserOptions options;
};

struct BundleConfig {
    std::string operatorJwt;
    std::optional<std::string> systemAccountJwt;
    std::vector<std::string> accountJwts;
    ResolverKind resolver = ResolverKind::Memory;
    ConflictPolicy conflictPolicy = ConflictPolicy::LastWriteWins;
};

// Parse JSON configuration documents. Keys use the snake_case attribute
// names ("operator_seed", "jetstream_limits", ...).
// All throw MalformedInput naming the offending key on unknown keys, wrong
// types, missing required keys or invalid JSON.

[[nodiscard]] OperatorConfig parseOperatorConfig(const std::string& jsonText);
[[nodiscard]] AccountConfig parseAccountConfig(const std::string& jsonText);
[[nodiscard]] UserConfig parseUserConfig(const std::string& jsonText);
[[nodiscard]] BundleConfig parseBundleConfig(const std::string& jsonText);

} // namespace natscred
