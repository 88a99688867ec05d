// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "timestamp.hh"

#include <charconv>
#include <cstdio>

namespace gqlc {
    namespace {
        // days since 1970-01-01 in the proleptic Gregorian calendar
        constexpr long long daysFromCivil(long long y, unsigned m, unsigned d) noexcept {
            y -= m <= 2;
            long long const era = (y >= 0 ? y : y - 399) / 400;
            unsigned const yoe = static_cast<unsigned>(y - era * 400);
            unsigned const doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
            unsigned const doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<long long>(doe) - 719468;
        }

        constexpr void civilFromDays(long long z, long long& y, unsigned& m, unsigned& d) noexcept {
            z += 719468;
            long long const era = (z >= 0 ? z : z - 146096) / 146097;
            unsigned const doe = static_cast<unsigned>(z - era * 146097);
            unsigned const yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            unsigned const doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            unsigned const mp = (5 * doy + 2) / 153;
            d = doy - (153 * mp + 2) / 5 + 1;
            m = mp < 10 ? mp + 3 : mp - 9;
            y = static_cast<long long>(yoe) + era * 400 + (m <= 2);
        }

        constexpr bool isLeapYear(long long y) noexcept { return y % 4 == 0 && (y % 100 != 0 || y % 400 == 0); }

        constexpr int daysInMonth(long long y, int m) noexcept {
            constexpr int days[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
            return m == 2 && isLeapYear(y) ? 29 : days[m - 1];
        }

        static_assert(daysInMonth(2024, 2) == 29);
        static_assert(daysInMonth(1900, 2) == 28);
        static_assert(daysInMonth(2000, 2) == 29);

        static_assert(daysFromCivil(1970, 1, 1) == 0);
        static_assert(daysFromCivil(2000, 3, 1) == 11017);

        struct Cursor {
            std::string_view text;
            size_t position = 0;

            bool digits(size_t count, int& out) {
                if (position + count > text.size())
                    return false;
                for (size_t i = 0; i != count; ++i)
                    if (text[position + i] < '0' || text[position + i] > '9')
                        return false;
                std::from_chars(text.data() + position, text.data() + position + count, out);
                position += count;
                return true;
            }

            bool literal(char ch) {
                if (position >= text.size() || text[position] != ch)
                    return false;
                ++position;
                return true;
            }

            bool literalOneOf(char lower, char upper) {
                return literal(lower) || literal(upper);
            }

            bool atEnd() const noexcept { return position == text.size(); }
        };
    }

    bool parseTimestamp(std::string_view text, Timestamp& out) {
        Cursor cur{ text };

        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        if (!cur.digits(4, year) || !cur.literal('-') || !cur.digits(2, month) || !cur.literal('-') || !cur.digits(2, day))
            return false;
        if (!cur.literalOneOf('T', 't') && !cur.literal(' '))
            return false;
        if (!cur.digits(2, hour) || !cur.literal(':') || !cur.digits(2, minute) || !cur.literal(':') || !cur.digits(2, second))
            return false;

        if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) || hour > 23 || minute > 59 || second > 60)
            return false;

        int millis = 0;
        if (cur.literal('.')) {
            int scale = 100;
            size_t count = 0;
            while (!cur.atEnd() && text[cur.position] >= '0' && text[cur.position] <= '9') {
                millis += (text[cur.position] - '0') * scale;
                scale /= 10;
                ++cur.position;
                ++count;
            }
            if (count == 0)
                return false;
        }

        int offsetMinutes = 0;
        if (!cur.literalOneOf('Z', 'z')) {
            int sign = 0;
            if (cur.literal('+'))
                sign = 1;
            else if (cur.literal('-'))
                sign = -1;
            else
                return false;

            int offsetHour = 0, offsetMinute = 0;
            if (!cur.digits(2, offsetHour) || !cur.literal(':') || !cur.digits(2, offsetMinute))
                return false;
            if (offsetHour > 23 || offsetMinute > 59)
                return false;
            offsetMinutes = sign * (offsetHour * 60 + offsetMinute);
        }

        if (!cur.atEnd())
            return false;

        long long const days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
        long long const seconds = days * 86400 + hour * 3600 + minute * 60 + second - offsetMinutes * 60;

        out = Timestamp{ std::chrono::milliseconds{ seconds * 1000 + millis } };
        return true;
    }

    std::string formatTimestamp(Timestamp ts) {
        long long const millis = ts.time_since_epoch().count();
        long long days = millis / 86400000;
        long long rem = millis % 86400000;
        if (rem < 0) {
            rem += 86400000;
            --days;
        }

        long long year = 0;
        unsigned month = 0, day = 0;
        civilFromDays(days, year, month, day);

        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%03lldZ",
            year, month, day, rem / 3600000, rem / 60000 % 60, rem / 1000 % 60, rem % 1000);
        return buffer;
    }
}
