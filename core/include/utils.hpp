#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>
#include <cstdint>

namespace core {
namespace utils {

    // Timestamp -> ISO 8601 in UTC, e.g. "2025-01-01T00:00:00+00:00"
    // (milliseconds are appended only when non-zero)
    std::string timestampToString(const Timestamp& ts);

    // ISO 8601 with 'Z' or +HH:MM/-HH:MM offset -> Timestamp
    Timestamp stringToTimestamp(const std::string& iso_string);

    Timestamp millisToTimestamp(std::int64_t epoch_ms);
    std::int64_t timestampToMillis(const Timestamp& ts);

    // "YYYY-MM-DD" of the UTC calendar day containing ts
    std::string utcDateString(const Timestamp& ts);

    // Accepts 1/true/yes/y/on (case-insensitive) as true, anything else as false
    bool parseBool(const std::string& value);

    std::string toUpper(std::string value);

    // Random RFC 4122 version-4 identifier used to tag a backtest run
    std::string generateRunId();

} // namespace utils
} // namespace core
