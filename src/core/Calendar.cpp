#include "core/Calendar.hpp"
#include "core/Errors.hpp"
#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace rainsight {

namespace {

constexpr int64_t kSecondsPerDay = 86400;

bool allDigits(const std::string& s) {
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return !s.empty();
}

} // anonymous namespace

CivilDate todayUtc() {
    auto now = std::chrono::system_clock::now();
    return fromTimestamp(static_cast<int64_t>(std::chrono::system_clock::to_time_t(now)));
}

int64_t toTimestamp(const CivilDate& date) {
    struct tm timeinfo = {};
    timeinfo.tm_mday = date.day;
    timeinfo.tm_mon = date.month - 1;
    timeinfo.tm_year = date.year - 1900;

    time_t timestamp = timegm(&timeinfo);
    return static_cast<int64_t>(timestamp);
}

CivilDate fromTimestamp(int64_t timestamp) {
    time_t t = static_cast<time_t>(timestamp);
    struct tm timeinfo = {};
    gmtime_r(&t, &timeinfo);

    CivilDate date;
    date.year = timeinfo.tm_year + 1900;
    date.month = timeinfo.tm_mon + 1;
    date.day = timeinfo.tm_mday;
    return date;
}

CivilDate addDays(const CivilDate& date, int days) {
    return fromTimestamp(toTimestamp(date) + static_cast<int64_t>(days) * kSecondsPerDay);
}

CivilDate addMonths(const CivilDate& date, int months) {
    int index = date.year * 12 + (date.month - 1) + months;
    CivilDate result;
    result.year = index / 12;
    result.month = index % 12 + 1;
    result.day = 1;
    return result;
}

CivilDate firstOfMonth(const CivilDate& date) {
    return CivilDate{date.year, date.month, 1};
}

int weekday(const CivilDate& date) {
    time_t t = static_cast<time_t>(toTimestamp(date));
    struct tm timeinfo = {};
    gmtime_r(&t, &timeinfo);
    return timeinfo.tm_wday;
}

std::string toIsoString(const CivilDate& date) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << date.year << '-'
        << std::setw(2) << date.month << '-'
        << std::setw(2) << date.day;
    return oss.str();
}

CivilDate parseDate(const std::string& text) {
    CivilDate date;

    // yyyy-mm-dd
    if (text.size() == 10 && text[4] == '-' && text[7] == '-') {
        std::string y = text.substr(0, 4), m = text.substr(5, 2), d = text.substr(8, 2);
        if (!allDigits(y) || !allDigits(m) || !allDigits(d)) {
            throw ValidationError("Unable to parse date: " + text);
        }
        date = CivilDate{std::stoi(y), std::stoi(m), std::stoi(d)};
    }
    // yyyymmdd (NASA POWER daily keys)
    else if (text.size() == 8 && allDigits(text)) {
        date = CivilDate{std::stoi(text.substr(0, 4)), std::stoi(text.substr(4, 2)),
                         std::stoi(text.substr(6, 2))};
    }
    // yyyymm (NASA POWER monthly keys)
    else if (text.size() == 6 && allDigits(text)) {
        date = CivilDate{std::stoi(text.substr(0, 4)), std::stoi(text.substr(4, 2)), 1};
    }
    else {
        throw ValidationError("Unable to parse date: " + text);
    }

    if (date.month < 1 || date.month > 12 || date.day < 1 || date.day > 31) {
        throw ValidationError("Invalid date: " + text);
    }
    // timegm normalises 2023-02-30 into March; reject it
    if (fromTimestamp(toTimestamp(date)) != date) {
        throw ValidationError("Invalid date: " + text);
    }
    return date;
}

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    struct tm timeinfo = {};
    gmtime_r(&time, &timeinfo);

    std::ostringstream oss;
    oss << std::put_time(&timeinfo, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

} // namespace rainsight
