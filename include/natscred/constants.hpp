#pragma once
#include <cstddef>
#include <cstdint>

namespace natscred {

// Claim format version written into every "nats" object
inline constexpr int JWT_VERSION = 2;

// JWT header algorithm
inline constexpr const char* JWT_ALGORITHM = "ed25519-nkey";

// JWT type
inline constexpr const char* JWT_TYPE = "JWT";

// Maximum token size accepted by the decoder (1MB)
inline constexpr std::size_t MAX_JWT_SIZE = 1024 * 1024;

// Limit sentinel meaning "unlimited"
inline constexpr std::int64_t NO_LIMIT = -1;

// Ed25519 signature length in bytes
inline constexpr std::size_t SIGNATURE_SIZE = 64;

// Default exports merged into every system account
inline constexpr const char* SYS_SERVICE_EXPORT_NAME = "account-monitoring-services";
inline constexpr const char* SYS_SERVICE_EXPORT_SUBJECT = "$SYS.REQ.ACCOUNT.*.*";
inline constexpr const char* SYS_STREAM_EXPORT_NAME = "account-monitoring-streams";
inline constexpr const char* SYS_STREAM_EXPORT_SUBJECT = "$SYS.ACCOUNT.*.>";
inline constexpr const char* SYS_EXPORT_INFO_URL =
    "https://docs.nats.io/nats-server/configuration/sys_accounts";

} // namespace natscred
