#ifndef DATETIME_HPP
#define DATETIME_HPP

#include <string>
#include <chrono>
#include <expected>

/**
 * @brief An RFC 3339 timestamp as accepted by the "datetime" string format.
 *
 * Parsing is strict: uppercase 'T' separator, a mandatory timezone ('Z' or +/-HH:MM),
 * no "-00:00" unknown-offset marker, and calendar fields checked against the real calendar.
 */
struct DateTime {
    std::chrono::sys_seconds utc;   // the instant, offset already applied
    int offsetMinutes = 0;          // as written, east of UTC

    static std::expected<DateTime, std::string> parse(const std::string& dateTimeString);
};

#endif
