#include "natscred/natscred.hpp"
#include "cmd_args.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using natscred::tools::cmd_args;
using natscred::tools::trim;

namespace {

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void writeFile(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

/// Contents of the file if the argument names one, otherwise the argument itself
std::string readInput(const std::string& fileOrValue) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(fileOrValue, ec)) {
        return trim(readFile(fileOrValue));
    }
    return trim(fileOrValue);
}

/// Write to --out if given, stdout otherwise
void emit(const cmd_args& args, const std::string& content, const char* what) {
    auto out_opt = args.get("out");
    if (!out_opt) {
        std::cout << content;
    } else {
        writeFile(*out_opt, content);
        std::cerr << what << " written to: " << *out_opt << "\n";
    }
}

void warnConflicts(const std::vector<natscred::Conflict>& conflicts) {
    for (const auto& conflict : conflicts) {
        std::cerr << "Warning: " << conflict.field;
        if (!conflict.key.empty()) {
            std::cerr << "[" << conflict.key << "]";
        }
        std::cerr << " supplied more than once, the last value was kept\n";
    }
}

void printUsage() {
    std::cerr << R"(natscred - offline NATS operator/account/user credential issuer

Usage: natscred [command] [options]

Commands:
    --operator <config.json>   Issue an operator token (self-signed)
    --account <config.json>    Issue an account token (signed by operator_seed)
    --user <config.json>       Issue a user token (signed by account_seed)
    --bundle <config.json>     Assemble the server trust configuration
    --decode <jwt|file>        Decode and display the token claims
    --verify <jwt|file>        Verify the token signature
    --generate-nkey            Generate a key pair (requires --type)
    --public-key <seed|file>   Print the public key of a seed
    --generate-creds <jwt|file>
                               Generate a user credentials file (requires --inkey)
    --check-creds <creds file> Check a credentials file (requires --jwt)

Options:
    --version, -v              Show version
    --help, -h                 Show this help
    --type <type>              Key role: operator, account, user
    --inkey <seed|file>        User seed for --generate-creds
    --jwt <jwt|file>           Expected token for --check-creds
    --json                     Print token, public key and conflicts as JSON
    --creds                    With --user, print a credentials file instead of the token
    --out <file>               Output file (default: stdout)
    --compact                  Compact JSON output (for decode)

Examples:
    natscred --generate-nkey --type operator
    natscred --operator operator.json --out operator.jwt
    natscred --account account.json --json
    natscred --user user.json --creds --out user.creds
    natscred --bundle bundle.json
    natscred --verify user.jwt
)";
}

/// Print a build result as requested by --json
void emitSigned(const cmd_args& args, const natscred::SignedEntity& entity) {
    warnConflicts(entity.conflicts);
    if (args.flag("json")) {
        nlohmann::json output;
        output["jwt"] = entity.jwt;
        output["public_key"] = entity.publicKey;
        output["conflicts"] = nlohmann::json::array();
        for (const auto& conflict : entity.conflicts) {
            output["conflicts"].push_back({{"field", conflict.field}, {"key", conflict.key}});
        }
        emit(args, output.dump(2) + "\n", "JWT");
    } else {
        emit(args, entity.jwt + "\n", "JWT");
    }
}

int operatorCommand(const cmd_args& args) {
    auto config = natscred::parseOperatorConfig(readFile(args.require("operator", "config.json")));
    auto key = natscred::KeyMaterial::fromSeed(config.seed);
    emitSigned(args, natscred::buildOperator(config.name, key, key, config.options));
    return 0;
}

int accountCommand(const cmd_args& args) {
    auto config = natscred::parseAccountConfig(readFile(args.require("account", "config.json")));
    auto key = natscred::KeyMaterial::fromSeed(config.seed);
    auto operatorKey = natscred::KeyMaterial::fromSeed(config.operatorSeed);

    auto entity = config.systemAccount
        ? natscred::buildSystemAccount(config.name, key, operatorKey, config.options)
        : natscred::buildAccount(config.name, key, operatorKey, config.options);
    emitSigned(args, entity);
    return 0;
}

int userCommand(const cmd_args& args) {
    auto config = natscred::parseUserConfig(readFile(args.require("user", "config.json")));
    auto key = natscred::KeyMaterial::fromSeed(config.seed);
    auto accountKey = natscred::KeyMaterial::fromSeed(config.accountSeed);

    auto entity = natscred::buildUser(config.name, key, accountKey, config.options);
    if (args.flag("creds")) {
        emit(args, natscred::renderCreds(entity.jwt, config.seed), "Credentials");
        return 0;
    }
    emitSigned(args, entity);
    return 0;
}

int bundleCommand(const cmd_args& args) {
    auto config = natscred::parseBundleConfig(readFile(args.require("bundle", "config.json")));

    std::vector<std::string> accounts;
    for (const auto& jwt : config.accountJwts) {
        accounts.push_back(readInput(jwt));
    }
    std::optional<std::string> system;
    if (config.systemAccountJwt) {
        system = readInput(*config.systemAccountJwt);
    }

    auto bundle = natscred::assemble(readInput(config.operatorJwt), system, accounts,
                                     config.resolver, config.conflictPolicy);
    warnConflicts(bundle.conflicts);
    emit(args, natscred::renderServerConfig(bundle), "Server configuration");
    return 0;
}

int decodeCommand(const cmd_args& args) {
    std::string jwt_string = readInput(args.operand("decode", "JWT string or file"));

    auto claims = natscred::decode(jwt_string);

    auto compact_opt = args.get("compact");
    bool compact = compact_opt && (*compact_opt == "true");
    int indent = compact ? -1 : 2;

    auto output = nlohmann::json::parse(natscred::canonicalPayload(claims));
    std::cout << output.dump(indent) << "\n";
    return 0;
}

int verifyCommand(const cmd_args& args) {
    std::string jwt_string = readInput(args.operand("verify", "JWT string or file"));

    if (natscred::verify(jwt_string)) {
        std::cout << "Signature valid\n";
        return 0;
    }
    std::cerr << "Signature invalid\n";
    return 1;
}

int generateNkeyCommand(const cmd_args& args) {
    auto kind = natscred::parseKeyKind(args.require("type", "operator|account|user"));
    auto key = natscred::KeyMaterial::generate(kind);
    emit(args, key.seed() + "\n" + key.publicKey() + "\n", "Key pair");
    return 0;
}

int publicKeyCommand(const cmd_args& args) {
    std::string seed = readInput(args.operand("public-key", "Seed or seed file"));
    std::cout << natscred::publicKeyFromSeed(seed) << "\n";
    return 0;
}

int generateCredsCommand(const cmd_args& args) {
    std::string jwt_string = readInput(args.operand("generate-creds", "JWT string or file"));
    std::string seed = readInput(args.require("inkey", "user seed file"));

    emit(args, natscred::renderCreds(jwt_string, seed), "Credentials");
    return 0;
}

int checkCredsCommand(const cmd_args& args) {
    std::string creds = readFile(args.operand("check-creds", "Credentials file"));
    std::string jwt_string = readInput(args.require("jwt", "expected JWT or file"));

    auto parsed = natscred::checkCreds(creds, jwt_string);
    std::cout << "Credentials match " << natscred::publicKeyFromSeed(parsed.seed) << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        auto args = cmd_args::parse(argc, argv);

        if (args.has("version") || args.has("v")) {
            std::cout << "natscred version 1.0.0\n";
            return 0;
        }

        if (args.has("help") || args.has("h") || argc == 1) {
            printUsage();
            return 0;
        }

        // Dispatch commands
        if (args.has("operator")) {
            return operatorCommand(args);
        } else if (args.has("account")) {
            return accountCommand(args);
        } else if (args.has("user")) {
            return userCommand(args);
        } else if (args.has("bundle")) {
            return bundleCommand(args);
        } else if (args.has("decode")) {
            return decodeCommand(args);
        } else if (args.has("verify")) {
            return verifyCommand(args);
        } else if (args.has("generate-nkey")) {
            return generateNkeyCommand(args);
        } else if (args.has("public-key")) {
            return publicKeyCommand(args);
        } else if (args.has("generate-creds")) {
            return generateCredsCommand(args);
        } else if (args.has("check-creds")) {
            return checkCredsCommand(args);
        }

        std::cerr << "No command specified. Use --help for usage.\n";
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
