#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace rainsight {

/**
 * Date calendaire (UTC, sans heure)
 */
struct CivilDate {
    int year = 1970;
    int month = 1;   // 1..12
    int day = 1;     // 1..31

    auto operator<=>(const CivilDate&) const = default;
};

/**
 * Current date in UTC
 */
CivilDate todayUtc();

/**
 * Seconds since epoch at 00:00:00 UTC of the given date
 */
int64_t toTimestamp(const CivilDate& date);

/**
 * Date (UTC) containing the given Unix timestamp
 */
CivilDate fromTimestamp(int64_t timestamp);

CivilDate addDays(const CivilDate& date, int days);

/**
 * First day of the month, shifted by a number of months (year roll-over handled)
 */
CivilDate addMonths(const CivilDate& date, int months);

CivilDate firstOfMonth(const CivilDate& date);

/**
 * Day of week, 0 = Sunday .. 6 = Saturday
 */
int weekday(const CivilDate& date);

/**
 * "YYYY-MM-DD"
 */
std::string toIsoString(const CivilDate& date);

/**
 * Parse "YYYY-MM-DD", "YYYYMMDD" or "YYYYMM" (day = 1)
 * Throws ValidationError on malformed input or impossible dates
 */
CivilDate parseDate(const std::string& text);

/**
 * Current UTC timestamp in ISO 8601 format with milliseconds
 */
std::string currentTimestamp();

} // namespace rainsight
