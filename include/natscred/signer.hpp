#pragma once
#include "natscred/claim_set.hpp"
#include "natscred/key_material.hpp"
#include <string>

namespace natscred {

/**
 * Produce a canonical signed token for a claim set.
 *
 * The issuer is taken from the signer, the "jti" is always empty and
 * "iat" is exactly the value carried by the claims. The payload is the
 * sorted-key JSON serialization of the claims, so identical inputs give
 * byte-identical tokens across calls and process restarts.
 *
 * @param claims Claims to sign (taken by value, issuer is overwritten)
 * @param signer Key pair whose public key becomes the issuer
 * @return "header.payload.signature"
 * @throws SigningError reason "invalid claim data" if the claims fail validation
 * @throws SigningError reason "sign failure" if the key cannot sign
 */
[[nodiscard]] std::string sign(ClaimSet claims, const KeyMaterial& signer);

/// Canonical payload JSON of a claim set (what sign() base64url-encodes)
[[nodiscard]] std::string canonicalPayload(const ClaimSet& claims);

} // namespace natscred
