#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace natscred {

/// Role encoded in the prefix of seeds and public keys
enum class KeyKind {
    Operator,   // 'O' / "SO"
    Account,    // 'A' / "SA"
    User,       // 'U' / "SU"
    Server      // 'N' / "SN"
};

/// Lowercase role name ("operator", "account", ...)
[[nodiscard]] std::string toString(KeyKind kind);

/// Parse a role name as accepted on the command line
/// @throws MalformedInput if the name is not a known role
[[nodiscard]] KeyKind parseKeyKind(std::string_view name);

/// Role of a public key, from its first character
/// @throws MalformedInput if the key is empty or has an unknown prefix
[[nodiscard]] KeyKind kindOfPublicKey(std::string_view publicKey);

/// Check that a public key is well formed and of the expected role
/// @throws MalformedInput if the key is not a valid public key
/// @throws KeyTypeMismatch if the key has a different role
void requirePublicKey(std::string_view field, const std::string& publicKey, KeyKind expected);

/**
 * An nkey pair decoded from a seed.
 *
 * Immutable once constructed. publicKey() is a pure function of seed().
 */
class KeyMaterial {
public:
    /// Decode a seed ("SO...", "SA...", "SU...", "SN...")
    /// @throws MalformedInput if the seed cannot be decoded
    [[nodiscard]] static KeyMaterial fromSeed(const std::string& seed);

    /// Generate a fresh key pair of the given role
    [[nodiscard]] static KeyMaterial generate(KeyKind kind);

    [[nodiscard]] KeyKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& seed() const noexcept { return seed_; }
    [[nodiscard]] const std::string& publicKey() const noexcept { return publicKey_; }

    /// Require this key to have the given role
    /// @throws KeyTypeMismatch naming field otherwise
    void require(std::string_view field, KeyKind expected) const;

    /// Sign data with the private half of the pair
    /// @return 64-byte Ed25519 signature
    /// @throws SigningError with reason "sign failure"
    [[nodiscard]] std::vector<std::uint8_t> sign(std::span<const std::uint8_t> data) const;

private:
    KeyMaterial(KeyKind kind, std::string seed, std::string publicKey);

    KeyKind kind_;
    std::string seed_;
    std::string publicKey_;
};

/// Derive the public key of a seed
[[nodiscard]] std::string publicKeyFromSeed(const std::string& seed);

/// Verify an Ed25519 signature against a public key
/// @return false if the signature does not match or the key is invalid
[[nodiscard]] bool verifySignature(const std::string& publicKey,
                                   std::span<const std::uint8_t> data,
                                   const std::vector<std::uint8_t>& signature);

} // namespace natscred
