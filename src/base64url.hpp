#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <cstdint>

namespace natscred::internal {

/// Encode bytes to Base64 URL format (RFC 4648, no padding)
std::string base64url_encode(std::span<const std::uint8_t> data);

/// Encode the bytes of a string to Base64 URL format
std::string base64url_encode(std::string_view text);

/// Decode Base64 URL format to bytes (RFC 4648, padding optional)
/// @throws std::invalid_argument if input is invalid
std::vector<std::uint8_t> base64url_decode(std::string_view input);

/// View the bytes of a string
inline std::span<const std::uint8_t> asBytes(std::string_view text) {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

} // namespace natscred::internal
