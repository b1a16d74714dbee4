#pragma once
#include <stdexcept>
#include <string>

namespace natscred {

enum class KeyKind;

/// A seed or public key of the wrong role was supplied
class KeyTypeMismatch : public std::invalid_argument {
public:
    KeyTypeMismatch(std::string field, KeyKind expected, KeyKind actual);

    [[nodiscard]] const std::string& field() const noexcept { return field_; }
    [[nodiscard]] KeyKind expected() const noexcept { return expected_; }
    [[nodiscard]] KeyKind actual() const noexcept { return actual_; }

private:
    std::string field_;
    KeyKind expected_;
    KeyKind actual_;
};

/// A structurally invalid field (bad CIDR, time of day, duration, ...)
class MalformedInput : public std::invalid_argument {
public:
    MalformedInput(std::string field, const std::string& detail);

    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

/// Ambiguous caller input rejected under ConflictPolicy::Reject
class ConflictingConfiguration : public std::invalid_argument {
public:
    ConflictingConfiguration(std::string field, std::string key);

    [[nodiscard]] const std::string& field() const noexcept { return field_; }
    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string field_;
    std::string key_;
};

/// A token string could not be parsed as a signed token
class DecodingFailure : public std::invalid_argument {
public:
    explicit DecodingFailure(const std::string& detail);
};

/// The signing step failed ("sign failure" or "invalid claim data")
class SigningError : public std::runtime_error {
public:
    SigningError(std::string reason, const std::string& detail);

    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

private:
    std::string reason_;
};

/// Trust bundle assembly failed
class AssemblyError : public std::runtime_error {
public:
    AssemblyError(std::string reason, const std::string& detail);

    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

private:
    std::string reason_;
};

} // namespace natscred
