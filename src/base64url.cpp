#include "base64url.hpp"
#include <stdexcept>
#include <array>

namespace natscred::internal {

namespace {
    // Base64 URL alphabet (RFC 4648): differs from standard in chars 62 and 63
    constexpr char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    constexpr std::uint8_t INVALID = 0xFF;

    // Maps ASCII value to 6-bit value
    constexpr std::array<std::uint8_t, 256> createDecodeLookup() {
        std::array<std::uint8_t, 256> lookup{};
        for (auto& val : lookup) val = INVALID;
        for (std::uint8_t i = 0; i < 64; ++i) {
            lookup[static_cast<std::uint8_t>(alphabet[i])] = i;
        }
        return lookup;
    }

    constexpr auto decode_lookup = createDecodeLookup();

    std::uint32_t sextet(char c) {
        std::uint8_t v = decode_lookup[static_cast<std::uint8_t>(c)];
        if (v == INVALID) {
            throw std::invalid_argument("Invalid Base64 URL character in input");
        }
        return v;
    }
}

std::string base64url_encode(std::span<const std::uint8_t> data) {
    std::string result;
    result.reserve((data.size() * 4 + 2) / 3);

    std::size_t i = 0;
    // Complete 3-byte groups
    for (; i + 2 < data.size(); i += 3) {
        std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16) |
                               (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                                static_cast<std::uint32_t>(data[i + 2]);
        result.push_back(alphabet[(triple >> 18) & 0x3F]);
        result.push_back(alphabet[(triple >> 12) & 0x3F]);
        result.push_back(alphabet[(triple >> 6) & 0x3F]);
        result.push_back(alphabet[triple & 0x3F]);
    }

    // 1 or 2 trailing bytes, no padding
    if (i < data.size()) {
        std::uint32_t rest = static_cast<std::uint32_t>(data[i]) << 16;
        bool two = i + 1 < data.size();
        if (two) {
            rest |= static_cast<std::uint32_t>(data[i + 1]) << 8;
        }
        result.push_back(alphabet[(rest >> 18) & 0x3F]);
        result.push_back(alphabet[(rest >> 12) & 0x3F]);
        if (two) {
            result.push_back(alphabet[(rest >> 6) & 0x3F]);
        }
    }

    return result;
}

std::string base64url_encode(std::string_view text) {
    return base64url_encode(asBytes(text));
}

std::vector<std::uint8_t> base64url_decode(std::string_view input) {
    while (!input.empty() && input.back() == '=') {
        input.remove_suffix(1);
    }

    std::vector<std::uint8_t> result;
    result.reserve((input.size() * 3) / 4 + 1);

    std::size_t i = 0;
    for (; i + 3 < input.size(); i += 4) {
        std::uint32_t quad = (sextet(input[i]) << 18) |
                             (sextet(input[i + 1]) << 12) |
                             (sextet(input[i + 2]) << 6) |
                              sextet(input[i + 3]);
        result.push_back(static_cast<std::uint8_t>((quad >> 16) & 0xFF));
        result.push_back(static_cast<std::uint8_t>((quad >> 8) & 0xFF));
        result.push_back(static_cast<std::uint8_t>(quad & 0xFF));
    }

    std::size_t remaining = input.size() - i;
    if (remaining == 1) {
        throw std::invalid_argument("Invalid Base64 URL input length");
    }
    if (remaining >= 2) {
        std::uint32_t partial = (sextet(input[i]) << 18) | (sextet(input[i + 1]) << 12);
        result.push_back(static_cast<std::uint8_t>((partial >> 16) & 0xFF));
        if (remaining == 3) {
            partial |= sextet(input[i + 2]) << 6;
            result.push_back(static_cast<std::uint8_t>((partial >> 8) & 0xFF));
        }
    }

    return result;
}

} // namespace natscred::internal
