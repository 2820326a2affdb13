#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Timestamp -> "YYYY-MM-DDTHH:MM:SSZ" (UTC)
    std::string timestampToString(const Timestamp& ts);

    // Timestamp -> "YYYY-MM-DD" (UTC)
    std::string timestampToDateString(const Timestamp& ts);

    // Parses "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS[.fff]" with optional "Z" or "+HH:MM"/"-HH:MM".
    // A missing zone is read as UTC.
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Midnight UTC of the day containing ts
    Timestamp startOfDay(const Timestamp& ts);

    Timestamp addDays(const Timestamp& ts, int days);

    // Calendar month arithmetic in UTC; the day of month is clamped to the target month's length
    Timestamp addMonths(const Timestamp& ts, int months);

    // Fractional days between two instants (b - a)
    double daysBetween(const Timestamp& a, const Timestamp& b);

    // Random RFC 4122 version-4 identifier
    std::string generateRunId();

} // namespace utils
} // namespace core
