#include "natscred/creds.hpp"
#include "natscred/claim_set.hpp"
#include "natscred/errors.hpp"
#include "natscred/key_material.hpp"
#include <sstream>

namespace natscred {

namespace {
    std::string trim(const std::string& s) {
        auto b = s.find_first_not_of(" \t\r\n");
        if (b == std::string::npos) return {};
        auto e = s.find_last_not_of(" \t\r\n");
        return s.substr(b, e - b + 1);
    }

    bool isMarker(const std::string& line, const char* word) {
        return line.rfind("---", 0) == 0 && line.find(word) != std::string::npos;
    }
}

std::string renderCreds(const std::string& jwt, const std::string& seed) {
    if (jwt.empty()) {
        throw MalformedInput("jwt", "JWT cannot be empty");
    }
    if (seed.empty()) {
        throw MalformedInput("seed", "Seed cannot be empty");
    }

    auto key = KeyMaterial::fromSeed(seed);
    key.require("seed", KeyKind::User);

    auto claims = decodeUserClaims(jwt);
    if (claims.subject != key.publicKey()) {
        throw MalformedInput("seed", "seed does not belong to the JWT subject " + claims.subject);
    }

    std::ostringstream oss;

    oss << "-----BEGIN NATS USER JWT-----\n";
    oss << jwt << "\n";
    oss << "------END NATS USER JWT------\n";
    oss << "\n";

    oss << "************************* IMPORTANT *************************\n";
    oss << "NKEY Seed printed below can be used to sign and prove identity.\n";
    oss << "NKEYs are sensitive and should be treated as secrets.\n";
    oss << "\n";

    oss << "-----BEGIN USER NKEY SEED-----\n";
    oss << seed << "\n";
    oss << "------END USER NKEY SEED------\n";
    oss << "\n";
    oss << "*************************************************************\n";

    return oss.str();
}

Creds parseCreds(const std::string& text) {
    Creds creds;
    std::istringstream in(text);
    std::string line;

    std::string* target = nullptr;
    bool open = false;
    while (std::getline(in, line)) {
        line = trim(line);
        if (!open && isMarker(line, "BEGIN")) {
            if (line.find("JWT") != std::string::npos) {
                target = &creds.jwt;
            } else if (line.find("SEED") != std::string::npos) {
                target = &creds.seed;
            } else {
                target = nullptr;
            }
            open = true;
        } else if (open && isMarker(line, "END")) {
            open = false;
            target = nullptr;
        } else if (open && target != nullptr) {
            // Content may be wrapped over several lines
            *target += line;
        }
    }

    if (open) {
        throw MalformedInput("creds", "unterminated block");
    }
    if (creds.jwt.empty()) {
        throw MalformedInput("creds", "missing JWT block");
    }
    if (creds.seed.empty()) {
        throw MalformedInput("creds", "missing NKEY seed block");
    }
    return creds;
}

Creds checkCreds(const std::string& text, const std::string& expectedJwt) {
    auto creds = parseCreds(text);
    if (creds.jwt != expectedJwt) {
        throw MalformedInput("creds.jwt", "embedded JWT does not match the issued token");
    }

    std::string subject = common(decode(creds.jwt)).subject;
    if (publicKeyFromSeed(creds.seed) != subject) {
        throw MalformedInput("creds.seed", "embedded seed does not belong to " + subject);
    }
    return creds;
}

} // namespace natscred
