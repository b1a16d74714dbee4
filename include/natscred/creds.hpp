#pragma once
#include <string>

namespace natscred {

/// Token and seed recovered from a creds file
struct Creds {
    std::string jwt;
    std::string seed;
};

/// Format a user JWT and its seed into a creds file
/// @throws MalformedInput if the token is empty or the seed is not a user seed
[[nodiscard]] std::string renderCreds(const std::string& jwt, const std::string& seed);

/// Extract the JWT and seed blocks from a creds file
/// @throws MalformedInput if either block is missing or unterminated
[[nodiscard]] Creds parseCreds(const std::string& text);

/**
 * Parse a creds file and confirm it belongs to the expected token.
 *
 * The embedded token must equal expectedJwt and the seed's public key must
 * equal the token subject.
 * @throws MalformedInput on any mismatch
 */
[[nodiscard]] Creds checkCreds(const std::string& text, const std::string& expectedJwt);

} // namespace natscred
