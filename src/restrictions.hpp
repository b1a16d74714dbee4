#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace natscred::internal {

/// Check a CIDR block is valid and canonical ("10.0.0.0/8", "fd00::/8")
/// @throws MalformedInput naming field otherwise
void checkCidr(std::string_view field, const std::string& cidr);

/// Check a "HH:MM:SS" time of day
void checkTimeOfDay(std::string_view field, const std::string& value);

/// Check an IANA zone name ("UTC", "America/New_York")
void checkLocale(std::string_view field, const std::string& locale);

/// Check a subject or subject pattern ("orders.*", "$SYS.>")
void checkSubject(std::string_view field, const std::string& subject);

/// Check a percentage in 0-100
void checkPercent(std::string_view field, std::int64_t value);

/// Parse a duration ("1h30m", "500ms", "1.5s") into nanoseconds
/// @throws MalformedInput naming field if the string does not parse
std::int64_t parseDuration(std::string_view field, const std::string& text);

} // namespace natscred::internal
