#include "dateTime.hpp"

#include <cctype>

using namespace std;

static bool readDigits(const string& s, size_t pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    out = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!isdigit(static_cast<unsigned char>(s[i]))) return false;
        out = out * 10 + (s[i] - '0');
    }
    return true;
}

expected<DateTime, string> DateTime::parse(const string& s) {
    // YYYY-MM-DDTHH:MM:SS is the shortest prefix, timezone follows
    if (s.size() < 20) return unexpected("datetime too short");

    int year, month, day, hour, minute, second;
    if (!readDigits(s, 0, 4, year) || s[4] != '-' ||
        !readDigits(s, 5, 2, month) || s[7] != '-' ||
        !readDigits(s, 8, 2, day)) {
        return unexpected("invalid date component");
    }

    if (s[10] != 'T') return unexpected("expected 'T' between date and time");

    if (!readDigits(s, 11, 2, hour) || s[13] != ':' ||
        !readDigits(s, 14, 2, minute) || s[16] != ':' ||
        !readDigits(s, 17, 2, second)) {
        return unexpected("invalid time component");
    }

    size_t pos = 19;
    if (s[pos] == '.') {
        size_t fractionStart = ++pos;
        while (pos < s.size() && isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
        if (pos == fractionStart || pos - fractionStart > 20) return unexpected("invalid fractional seconds");
    }

    int offset = 0;
    if (pos < s.size() && s[pos] == 'Z') {
        ++pos;
    } else if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
        if (s.compare(pos, string::npos, "-00:00") == 0) return unexpected("unknown local offset -00:00 not allowed");

        int offsetHours, offsetMins;
        if (!readDigits(s, pos + 1, 2, offsetHours) || pos + 3 >= s.size() || s[pos + 3] != ':' ||
            !readDigits(s, pos + 4, 2, offsetMins)) {
            return unexpected("invalid timezone offset");
        }
        if (offsetHours > 23 || offsetMins > 59) return unexpected("timezone offset out of range");

        offset = (offsetHours * 60 + offsetMins) * (s[pos] == '-' ? -1 : 1);
        pos += 6;
    } else {
        return unexpected("missing timezone");
    }

    if (pos != s.size()) return unexpected("unexpected trailing characters");

    chrono::year_month_day date{chrono::year{year}, chrono::month{static_cast<unsigned>(month)},
                                chrono::day{static_cast<unsigned>(day)}};
    if (!date.ok()) return unexpected("invalid calendar date");

    if (hour > 23 || minute > 59 || second > 59) return unexpected("time out of range");

    DateTime result;
    result.utc = chrono::sys_days{date}
               + chrono::hours{hour} + chrono::minutes{minute} + chrono::seconds{second}
               - chrono::minutes{offset};
    result.offsetMinutes = offset;
    return result;
}
