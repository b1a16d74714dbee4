#include "restrictions.hpp"
#include "natscred/errors.hpp"
#include <arpa/inet.h>
#include <array>
#include <cctype>
#include <chrono>
#include <limits>
#include <stdexcept>

namespace natscred::internal {

namespace {
    [[noreturn]] void fail(std::string_view field, const std::string& detail) {
        throw MalformedInput(std::string(field), detail);
    }

    bool parsePrefixLength(std::string_view text, int max, int& out) {
        if (text.empty() || text.size() > 3) return false;
        int value = 0;
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            value = value * 10 + (c - '0');
        }
        // Reject "08" style lengths: canonical form has no leading zeros
        if (text.size() > 1 && text[0] == '0') return false;
        if (value > max) return false;
        out = value;
        return true;
    }

    // True if every bit past prefixLength is zero
    bool hostBitsClear(const std::uint8_t* addr, std::size_t size, int prefixLength) {
        for (std::size_t i = 0; i < size; ++i) {
            int bitsInByte = prefixLength - static_cast<int>(i) * 8;
            std::uint8_t mask;
            if (bitsInByte >= 8) {
                mask = 0x00;
            } else if (bitsInByte <= 0) {
                mask = 0xFF;
            } else {
                mask = static_cast<std::uint8_t>(0xFF >> bitsInByte);
            }
            if ((addr[i] & mask) != 0) return false;
        }
        return true;
    }

    // Nanoseconds per unit, longest suffixes first
    struct DurationUnit {
        std::string_view suffix;
        std::int64_t nanos;
    };

    constexpr std::array<DurationUnit, 8> durationUnits{{
        {"ns", 1},
        {"us", 1000},
        {"\xC2\xB5s", 1000},   // U+00B5 micro sign
        {"\xCE\xBCs", 1000},   // U+03BC greek mu
        {"ms", 1000 * 1000},
        {"s", 1000LL * 1000 * 1000},
        {"m", 60LL * 1000 * 1000 * 1000},
        {"h", 3600LL * 1000 * 1000 * 1000},
    }};
}

void checkCidr(std::string_view field, const std::string& cidr) {
    auto slash = cidr.find('/');
    if (slash == std::string::npos) {
        fail(field, "'" + cidr + "' is not a CIDR block (missing prefix length)");
    }
    std::string address = cidr.substr(0, slash);
    std::string_view length = std::string_view(cidr).substr(slash + 1);

    std::array<std::uint8_t, 16> raw{};
    std::array<char, INET6_ADDRSTRLEN> rendered{};
    int family = address.find(':') == std::string::npos ? AF_INET : AF_INET6;
    std::size_t size = family == AF_INET ? 4 : 16;

    if (inet_pton(family, address.c_str(), raw.data()) != 1) {
        fail(field, "'" + cidr + "' has an invalid address");
    }
    int prefixLength = 0;
    if (!parsePrefixLength(length, family == AF_INET ? 32 : 128, prefixLength)) {
        fail(field, "'" + cidr + "' has an invalid prefix length");
    }
    if (inet_ntop(family, raw.data(), rendered.data(), rendered.size()) == nullptr ||
        address != rendered.data()) {
        fail(field, "'" + cidr + "' is not canonical (expected '" +
                    std::string(rendered.data()) + "/" + std::string(length) + "')");
    }
    if (!hostBitsClear(raw.data(), size, prefixLength)) {
        fail(field, "'" + cidr + "' is not canonical (host bits set)");
    }
}

void checkTimeOfDay(std::string_view field, const std::string& value) {
    auto twoDigits = [&](std::size_t pos, int max) {
        if (!std::isdigit(static_cast<unsigned char>(value[pos])) ||
            !std::isdigit(static_cast<unsigned char>(value[pos + 1]))) {
            return false;
        }
        return (value[pos] - '0') * 10 + (value[pos + 1] - '0') <= max;
    };
    if (value.size() != 8 || value[2] != ':' || value[5] != ':' ||
        !twoDigits(0, 23) || !twoDigits(3, 59) || !twoDigits(6, 59)) {
        fail(field, "'" + value + "' is not a time of day in HH:MM:SS format");
    }
}

void checkLocale(std::string_view field, const std::string& locale) {
    if (locale.empty()) {
        fail(field, "locale cannot be empty");
    }
    bool valid = locale.front() != '/' && locale.back() != '/' &&
                 locale.find("//") == std::string::npos &&
                 locale.find("..") == std::string::npos;
    for (char c : locale) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '/' && c != '_' && c != '-' && c != '+') {
            valid = false;
        }
    }
    if (!valid) {
        fail(field, "'" + locale + "' is not an IANA time zone name");
    }
    try {
        static_cast<void>(std::chrono::locate_zone(locale));
    } catch (const std::runtime_error& e) {
        fail(field, "unknown time zone '" + locale + "': " + e.what());
    }
}

void checkSubject(std::string_view field, const std::string& subject) {
    if (subject.empty()) {
        fail(field, "subject cannot be empty");
    }
    std::size_t start = 0;
    while (true) {
        std::size_t dot = subject.find('.', start);
        std::string_view token = std::string_view(subject).substr(
            start, dot == std::string::npos ? std::string::npos : dot - start);
        if (token.empty()) {
            fail(field, "'" + subject + "' has an empty token");
        }
        if (token.find_first_of(" \t\r\n") != std::string_view::npos) {
            fail(field, "'" + subject + "' contains whitespace");
        }
        if (token.size() > 1 && token.find_first_of("*>") != std::string_view::npos) {
            fail(field, "'" + subject + "' has a wildcard inside a token");
        }
        if (token == ">" && dot != std::string::npos) {
            fail(field, "'" + subject + "' has '>' before the last token");
        }
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
}

void checkPercent(std::string_view field, std::int64_t value) {
    if (value < 0 || value > 100) {
        fail(field, std::to_string(value) + " is outside 0-100");
    }
}

std::int64_t parseDuration(std::string_view field, const std::string& text) {
    std::string_view s = text;
    bool negative = false;
    if (!s.empty() && (s[0] == '-' || s[0] == '+')) {
        negative = s[0] == '-';
        s.remove_prefix(1);
    }
    if (s == "0") {
        return 0;
    }
    if (s.empty()) {
        fail(field, "invalid duration '" + text + "'");
    }

    constexpr auto maxNanos = std::numeric_limits<std::int64_t>::max();
    std::int64_t total = 0;
    while (!s.empty()) {
        // number: digits [ "." digits ]
        std::int64_t whole = 0;
        std::int64_t fraction = 0;
        std::int64_t scale = 1;
        bool digits = false;
        while (!s.empty() && std::isdigit(static_cast<unsigned char>(s[0]))) {
            if (whole > (maxNanos - 9) / 10) {
                fail(field, "duration '" + text + "' overflows");
            }
            whole = whole * 10 + (s[0] - '0');
            digits = true;
            s.remove_prefix(1);
        }
        if (!s.empty() && s[0] == '.') {
            s.remove_prefix(1);
            while (!s.empty() && std::isdigit(static_cast<unsigned char>(s[0]))) {
                // Digits beyond nanosecond precision are dropped
                if (scale < 1000LL * 1000 * 1000) {
                    fraction = fraction * 10 + (s[0] - '0');
                    scale *= 10;
                }
                digits = true;
                s.remove_prefix(1);
            }
        }
        if (!digits) {
            fail(field, "invalid duration '" + text + "'");
        }

        const DurationUnit* unit = nullptr;
        for (const auto& candidate : durationUnits) {
            if (s.substr(0, candidate.suffix.size()) == candidate.suffix &&
                (unit == nullptr || candidate.suffix.size() > unit->suffix.size())) {
                unit = &candidate;
            }
        }
        if (unit == nullptr) {
            fail(field, "missing or unknown unit in duration '" + text + "'");
        }
        s.remove_prefix(unit->suffix.size());

        // fraction < scale, so fractionNanos < unit->nanos
        auto fractionNanos =
            static_cast<std::int64_t>(static_cast<long double>(fraction) * unit->nanos / scale);
        if (whole > (maxNanos - fractionNanos) / unit->nanos) {
            fail(field, "duration '" + text + "' overflows");
        }
        std::int64_t value = whole * unit->nanos + fractionNanos;
        if (total > maxNanos - value) {
            fail(field, "duration '" + text + "' overflows");
        }
        total += value;
    }
    return negative ? -total : total;
}

} // namespace natscred::internal
