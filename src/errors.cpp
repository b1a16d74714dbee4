#include "natscred/errors.hpp"
#include "natscred/key_material.hpp"
#include <utility>

namespace natscred {

KeyTypeMismatch::KeyTypeMismatch(std::string field, KeyKind expected, KeyKind actual)
    : std::invalid_argument(field + ": expected " + toString(expected) +
                            " key, got " + toString(actual) + " key"),
      field_(std::move(field)),
      expected_(expected),
      actual_(actual) {}

MalformedInput::MalformedInput(std::string field, const std::string& detail)
    : std::invalid_argument(field + ": " + detail),
      field_(std::move(field)) {}

ConflictingConfiguration::ConflictingConfiguration(std::string field, std::string key)
    : std::invalid_argument(field + (key.empty() ? std::string(": global entry")
                                                 : ": '" + key + "'") +
                            " supplied more than once"),
      field_(std::move(field)),
      key_(std::move(key)) {}

DecodingFailure::DecodingFailure(const std::string& detail)
    : std::invalid_argument("Failed to decode JWT: " + detail) {}

SigningError::SigningError(std::string reason, const std::string& detail)
    : std::runtime_error(reason + ": " + detail),
      reason_(std::move(reason)) {}

AssemblyError::AssemblyError(std::string reason, const std::string& detail)
    : std::runtime_error(reason + ": " + detail),
      reason_(std::move(reason)) {}

} // namespace natscred
