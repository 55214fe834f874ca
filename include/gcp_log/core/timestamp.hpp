#ifndef GCP_LOG_TIMESTAMP_HPP
#define GCP_LOG_TIMESTAMP_HPP

#include "log_common.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <limits>
#include <stdexcept>
#include <string>

namespace gcplog {
    using Timestamp = std::chrono::system_clock::time_point;

    /// Format a time point as RFC 3339 in UTC with nanosecond precision.
    /// Example: "2021-12-20T16:33:41.643966093Z"
    ///
    /// The fraction always has nine digits; clocks coarser than a nanosecond
    /// simply produce trailing zeros.
    inline std::string formatTimestamp(const Timestamp &time) {
        long long nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
            time.time_since_epoch()).count();
        long long seconds = nanos / 1000000000LL;
        long long fraction = nanos % 1000000000LL;
        // Floor toward negative infinity for pre-epoch instants.
        if (fraction < 0) {
            fraction += 1000000000LL;
            --seconds;
        }

        std::tm tmBuf = detail::toUtcTm(static_cast<std::time_t>(seconds));

        char buf[48];
        size_t pos = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tmBuf);
        if (pos == 0) {
            throw std::invalid_argument("Timestamp out of formattable range");
        }
        std::snprintf(buf + pos, sizeof(buf) - pos, ".%09lldZ", fraction);
        return std::string(buf);
    }

    namespace detail {
        inline bool readDigits(const std::string &text, size_t &pos, size_t count, int &out) {
            if (pos + count > text.size()) return false;
            int value = 0;
            for (size_t i = 0; i < count; ++i) {
                char c = text[pos + i];
                if (c < '0' || c > '9') return false;
                value = value * 10 + (c - '0');
            }
            out = value;
            pos += count;
            return true;
        }

        inline bool expectChar(const std::string &text, size_t &pos, char expected) {
            if (pos >= text.size() || text[pos] != expected) return false;
            ++pos;
            return true;
        }
    } // namespace detail

    /// Parse an RFC 3339 date-time ("2021-12-20T16:33:41.643966093Z").
    /// Accepts 0-9 fractional digits, a 't'/'T' separator and either a
    /// 'Z' suffix or a "+HH:MM"/"-HH:MM" offset.  The result is in UTC.
    inline Timestamp parseTimestamp(const std::string &text) {
        size_t pos = 0;
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        bool ok = detail::readDigits(text, pos, 4, year)
                  && detail::expectChar(text, pos, '-')
                  && detail::readDigits(text, pos, 2, month)
                  && detail::expectChar(text, pos, '-')
                  && detail::readDigits(text, pos, 2, day);
        if (ok) {
            ok = pos < text.size() && (text[pos] == 'T' || text[pos] == 't');
            ++pos;
        }
        ok = ok && detail::readDigits(text, pos, 2, hour)
                && detail::expectChar(text, pos, ':')
                && detail::readDigits(text, pos, 2, minute)
                && detail::expectChar(text, pos, ':')
                && detail::readDigits(text, pos, 2, second);
        if (!ok || month < 1 || month > 12 || day < 1 || day > 31
            || hour > 23 || minute > 59 || second > 60) {
            throw std::invalid_argument("Invalid RFC 3339 timestamp: " + text);
        }
        if (static_cast<unsigned>(day) > detail::daysInMonth(year, static_cast<unsigned>(month))) {
            throw std::invalid_argument("Day out of range for month in timestamp: " + text);
        }

        long long fractionNanos = 0;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            size_t digits = 0;
            long long scale = 100000000LL;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                if (digits < 9) {
                    fractionNanos += (text[pos] - '0') * scale;
                    scale /= 10;
                }
                ++digits;
                ++pos;
            }
            if (digits == 0 || digits > 9) {
                throw std::invalid_argument("Invalid fractional seconds in timestamp: " + text);
            }
        }

        long long offsetSeconds = 0;
        if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
            ++pos;
        } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            int offHour = 0, offMinute = 0;
            if (!detail::readDigits(text, pos, 2, offHour)
                || !detail::expectChar(text, pos, ':')
                || !detail::readDigits(text, pos, 2, offMinute)
                || offHour > 23 || offMinute > 59) {
                throw std::invalid_argument("Invalid UTC offset in timestamp: " + text);
            }
            offsetSeconds = sign * (offHour * 3600LL + offMinute * 60LL);
        } else {
            throw std::invalid_argument("Timestamp is missing a UTC designator: " + text);
        }
        if (pos != text.size()) {
            throw std::invalid_argument("Trailing characters in timestamp: " + text);
        }

        long long days = detail::daysFromCivil(year, static_cast<unsigned>(month),
                                               static_cast<unsigned>(day));
        long long epochSeconds = days * 86400LL + hour * 3600LL + minute * 60LL
                                 + second - offsetSeconds;

        // The clock's representation bounds the range; one second of margin
        // on each side leaves room for the fraction.
        typedef Timestamp::duration::rep Rep;
        typedef Timestamp::duration::period Period;
        const long long ticksPerSecond = static_cast<long long>(Period::den / Period::num);
        const long long maxSeconds = static_cast<long long>(std::numeric_limits<Rep>::max() / ticksPerSecond) - 1;
        const long long minSeconds = static_cast<long long>(std::numeric_limits<Rep>::min() / ticksPerSecond) + 1;
        if (epochSeconds > maxSeconds || epochSeconds < minSeconds) {
            throw std::invalid_argument("Timestamp outside the representable range: " + text);
        }
        return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::seconds(epochSeconds))
                         + std::chrono::duration_cast<Timestamp::duration>(std::chrono::nanoseconds(fractionNanos)));
    }
} // namespace gcplog

#endif // GCP_LOG_TIMESTAMP_HPP
