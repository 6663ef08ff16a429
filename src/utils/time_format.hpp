#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

using TimePoint = std::chrono::system_clock::time_point;

namespace time_format {

// Formats as RFC3339 in UTC, second precision: 2026-10-20T09:30:00Z
inline std::string toRfc3339(TimePoint t) {
    std::time_t secs = std::chrono::system_clock::to_time_t(t);
    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

// Accepts "YYYY-MM-DDTHH:MM:SS[.fff]Z" and "YYYY-MM-DDTHH:MM:SS+HH:MM" / "-HH:MM".
inline TimePoint fromRfc3339(const std::string& text) {
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("Invalid RFC3339 time: " + text);
    }

    long offset_seconds = 0;
    char zone = 0;
    if (!(ss >> zone)) {
        throw std::invalid_argument("Missing time zone in RFC3339 time: " + text);
    }
    // fractional seconds are dropped
    if (zone == '.') {
        while (ss >> zone && std::isdigit(static_cast<unsigned char>(zone))) {
        }
        if (!ss) {
            throw std::invalid_argument("Missing time zone in RFC3339 time: " + text);
        }
    }
    if (zone == 'Z' || zone == 'z') {
        offset_seconds = 0;
    } else if (zone == '+' || zone == '-') {
        int hours = 0, minutes = 0;
        char colon = 0;
        if (!(ss >> hours >> colon >> minutes) || colon != ':') {
            throw std::invalid_argument("Invalid zone offset in RFC3339 time: " + text);
        }
        offset_seconds = (hours * 60L + minutes) * 60L;
        if (zone == '-') offset_seconds = -offset_seconds;
    } else {
        throw std::invalid_argument("Invalid zone designator in RFC3339 time: " + text);
    }

    std::time_t secs = timegm(&tm) - offset_seconds;
    return std::chrono::system_clock::from_time_t(secs);
}

} // namespace time_format
