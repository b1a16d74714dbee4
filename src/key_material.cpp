#include "natscred/key_material.hpp"
#include "natscred/constants.hpp"
#include "natscred/errors.hpp"
#include <nkeys/nkeys.hpp>
#include <algorithm>
#include <optional>
#include <utility>

namespace natscred {

namespace {
    // Encoded nkey public keys and seeds are 56 / 58 base32 characters
    constexpr std::size_t PUBLIC_KEY_LENGTH = 56;

    char prefixChar(KeyKind kind) {
        switch (kind) {
            case KeyKind::Operator: return 'O';
            case KeyKind::Account: return 'A';
            case KeyKind::User: return 'U';
            case KeyKind::Server: return 'N';
        }
        return '?';
    }

    std::optional<KeyKind> kindFromPrefix(char c) {
        switch (c) {
            case 'O': return KeyKind::Operator;
            case 'A': return KeyKind::Account;
            case 'U': return KeyKind::User;
            case 'N': return KeyKind::Server;
            default: return std::nullopt;
        }
    }

    bool isBase32(std::string_view s) {
        return std::all_of(s.begin(), s.end(), [](char c) {
            return (c >= 'A' && c <= 'Z') || (c >= '2' && c <= '7');
        });
    }
}

std::string toString(KeyKind kind) {
    switch (kind) {
        case KeyKind::Operator: return "operator";
        case KeyKind::Account: return "account";
        case KeyKind::User: return "user";
        case KeyKind::Server: return "server";
    }
    return "unknown";
}

KeyKind parseKeyKind(std::string_view name) {
    if (name == "operator") return KeyKind::Operator;
    if (name == "account") return KeyKind::Account;
    if (name == "user") return KeyKind::User;
    if (name == "server") return KeyKind::Server;
    throw MalformedInput("type", "must be one of: operator, account, user, server. Got: " +
                                 std::string(name));
}

KeyKind kindOfPublicKey(std::string_view publicKey) {
    if (publicKey.empty()) {
        throw MalformedInput("public_key", "public key cannot be empty");
    }
    auto kind = kindFromPrefix(publicKey[0]);
    if (!kind) {
        throw MalformedInput("public_key", "unknown public key prefix '" +
                                           std::string(1, publicKey[0]) + "'");
    }
    return *kind;
}

void requirePublicKey(std::string_view field, const std::string& publicKey, KeyKind expected) {
    if (publicKey.size() != PUBLIC_KEY_LENGTH || !isBase32(publicKey)) {
        throw MalformedInput(std::string(field), "not a valid nkey public key: '" + publicKey + "'");
    }
    auto kind = kindFromPrefix(publicKey[0]);
    if (!kind) {
        throw MalformedInput(std::string(field), "unknown public key prefix '" +
                                                 std::string(1, publicKey[0]) + "'");
    }
    try {
        // Decoding checks the CRC
        static_cast<void>(nkeys::FromPublicKey(publicKey));
    } catch (const std::exception& e) {
        throw MalformedInput(std::string(field), std::string("not a valid nkey public key: ") + e.what());
    }
    if (*kind != expected) {
        throw KeyTypeMismatch(std::string(field), expected, *kind);
    }
}

KeyMaterial::KeyMaterial(KeyKind kind, std::string seed, std::string publicKey)
    : kind_(kind), seed_(std::move(seed)), publicKey_(std::move(publicKey)) {}

KeyMaterial KeyMaterial::fromSeed(const std::string& seed) {
    if (seed.size() < 2 || seed[0] != 'S') {
        throw MalformedInput("seed", "not an nkey seed (must start with 'S')");
    }
    auto kind = kindFromPrefix(seed[1]);
    if (!kind) {
        throw MalformedInput("seed", "unknown seed prefix 'S" + std::string(1, seed[1]) + "'");
    }

    std::string publicKey;
    try {
        auto kp = nkeys::FromSeed(seed);
        publicKey = kp->publicString();
    } catch (const std::exception& e) {
        throw MalformedInput("seed", std::string("could not decode seed: ") + e.what());
    }

    if (publicKey.empty() || publicKey[0] != prefixChar(*kind)) {
        throw MalformedInput("seed", "seed prefix does not match its public key");
    }
    return KeyMaterial(*kind, seed, std::move(publicKey));
}

KeyMaterial KeyMaterial::generate(KeyKind kind) {
    switch (kind) {
        case KeyKind::Operator: return fromSeed(nkeys::CreateOperator()->seedString());
        case KeyKind::Account: return fromSeed(nkeys::CreateAccount()->seedString());
        case KeyKind::User: return fromSeed(nkeys::CreateUser()->seedString());
        case KeyKind::Server: break;
    }
    throw MalformedInput("type", "key generation supports operator, account and user keys only");
}

void KeyMaterial::require(std::string_view field, KeyKind expected) const {
    if (kind_ != expected) {
        throw KeyTypeMismatch(std::string(field), expected, kind_);
    }
}

std::vector<std::uint8_t> KeyMaterial::sign(std::span<const std::uint8_t> data) const {
    std::vector<std::uint8_t> signature;
    try {
        auto kp = nkeys::FromSeed(seed_);
        signature = kp->sign(data);
    } catch (const std::exception& e) {
        throw SigningError("sign failure", e.what());
    }
    if (signature.size() != SIGNATURE_SIZE) {
        throw SigningError("sign failure", "unexpected signature size " +
                                           std::to_string(signature.size()));
    }
    return signature;
}

std::string publicKeyFromSeed(const std::string& seed) {
    return KeyMaterial::fromSeed(seed).publicKey();
}

bool verifySignature(const std::string& publicKey,
                     std::span<const std::uint8_t> data,
                     const std::vector<std::uint8_t>& signature) {
    if (signature.size() != SIGNATURE_SIZE) {
        return false;
    }
    try {
        auto verifier = nkeys::FromPublicKey(publicKey);
        return verifier->verify(data, signature);
    } catch (const std::exception&) {
        // Malformed key: the signature cannot be valid
        return false;
    }
}

} // namespace natscred
