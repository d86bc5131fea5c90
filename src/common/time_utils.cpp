/**
 * @file time_utils.cpp
 * @brief Time conversion utilities implementation
 */

#include "zatca/common/time_utils.h"

#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace zatca::common {

std::optional<std::chrono::system_clock::time_point> asn1TimeToTimePoint(const ASN1_TIME* asn1Time) {
    if (!asn1Time) {
        return std::nullopt;
    }

    struct tm tmTime;
    std::memset(&tmTime, 0, sizeof(tmTime));
    if (ASN1_TIME_to_tm(asn1Time, &tmTime) != 1) {
        return std::nullopt;
    }

    time_t epoch = timegm(&tmTime);
    if (epoch == static_cast<time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(epoch);
}

std::string formatIso8601(const std::chrono::system_clock::time_point& tp) {
    std::time_t value = std::chrono::system_clock::to_time_t(tp);

    struct tm tmTime;
    if (!gmtime_r(&value, &tmTime)) {
        return "";
    }

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (tmTime.tm_year + 1900) << '-'
        << std::setw(2) << (tmTime.tm_mon + 1) << '-'
        << std::setw(2) << tmTime.tm_mday << 'T'
        << std::setw(2) << tmTime.tm_hour << ':'
        << std::setw(2) << tmTime.tm_min << ':'
        << std::setw(2) << tmTime.tm_sec << 'Z';
    return oss.str();
}

std::optional<std::chrono::system_clock::time_point> parseIso8601(const std::string& iso8601) {
    if (iso8601.size() < 19) {
        return std::nullopt;
    }

    struct tm tmTime;
    std::memset(&tmTime, 0, sizeof(tmTime));

    char sep = 0;
    int consumed = 0;
    int scanned = std::sscanf(iso8601.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                              &tmTime.tm_year, &tmTime.tm_mon, &tmTime.tm_mday, &sep,
                              &tmTime.tm_hour, &tmTime.tm_min, &tmTime.tm_sec, &consumed);
    if (scanned != 7 || (sep != 'T' && sep != ' ')) {
        return std::nullopt;
    }

    // Optional fraction and zone designator
    size_t pos = static_cast<size_t>(consumed);
    if (pos < iso8601.size() && iso8601[pos] == '.') {
        pos++;
        while (pos < iso8601.size() && iso8601[pos] >= '0' && iso8601[pos] <= '9') pos++;
    }
    if (pos < iso8601.size() && iso8601[pos] == 'Z') pos++;
    if (pos != iso8601.size()) {
        return std::nullopt;
    }

    if (tmTime.tm_mon < 1 || tmTime.tm_mon > 12 || tmTime.tm_mday < 1 || tmTime.tm_mday > 31 ||
        tmTime.tm_hour > 23 || tmTime.tm_min > 59 || tmTime.tm_sec > 60) {
        return std::nullopt;
    }

    tmTime.tm_year -= 1900;
    tmTime.tm_mon -= 1;

    time_t epoch = timegm(&tmTime);
    if (epoch == static_cast<time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(epoch);
}

int daysBetween(const std::chrono::system_clock::time_point& start,
                const std::chrono::system_clock::time_point& end) {
    auto hours = std::chrono::duration_cast<std::chrono::hours>(end - start).count();
    return static_cast<int>(hours / 24);
}

} // namespace zatca::common
