// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Day/hour/minute groups of METAR and TAF reports.
 *
 * All report times are UTC and carry only a day of month. No calendar
 * is attached: a day number is compared as a plain number and a period
 * whose end day is smaller than its start day is taken to run into the
 * next month without resolving which month that is.
 */

#pragma once

#include <string>

namespace avgear {

/**
 * A point on a report's day/hour/minute timeline.
 */
struct ReportTime
{
    ReportTime() = default;
    ReportTime(int d, int h, int m = 0) : day(d), hour(h), minute(m) {}

    int day = 0;
    int hour = 0;
    int minute = 0;

    /// minutes since the start of the month
    int minutes() const { return (day * 24 + hour) * 60 + minute; }

    bool operator==(const ReportTime& o) const
    {
        return day == o.day && hour == o.hour && minute == o.minute;
    }
    bool operator!=(const ReportTime& o) const { return !(*this == o); }
};


/**
 * A from/to range, used for the overall TAF validity and for
 * BECMG/TEMPO change groups. Hours are always 0..23; an encoded
 * hour 24 has been moved to hour 0 of the following day.
 */
struct ValidityPeriod
{
    ReportTime from;
    ReportTime to;

    bool crossesDay() const { return from.day != to.day; }
};


/**
 * Day of month with its English ordinal suffix: 1st, 2nd, 3rd, 4th,
 * 11th, 12th, 13th, 21st, ...
 */
std::string ordinalLabel(int day);

/**
 * Parse a DDHHMM group. A single trailing 'Z' is accepted; the rest
 * must be exactly six digits with day 1..31, hour 0..23 and minute
 * 0..59, otherwise av_malformed_time_exception is thrown.
 */
ReportTime parseIssueTime(const std::string& token);

/**
 * Parse a DDHH group (TAF periods, TX/TN times). Hour 24 is normalised
 * to hour 0 of the next day. A single trailing 'Z' is accepted.
 */
ReportTime parseDayHour(const std::string& token);

/**
 * Parse a DDHH/DDHH validity group. Throws av_malformed_time_exception
 * if either half is malformed or the end is not after the start.
 */
ValidityPeriod parseValidityToken(const std::string& token);

/// "HH:MMZ"
std::string formatClock(const ReportTime& t);

/// "HH:MMZ on <ordinal>"
std::string formatInstant(const ReportTime& t);

/**
 * "HH:MMZ to HH:MMZ" when both ends fall on the same day, otherwise
 * "HH:MMZ on <ordinal> to HH:MMZ on <ordinal>".
 */
std::string formatPeriod(const ReportTime& from, const ReportTime& to);

inline std::string formatPeriod(const ValidityPeriod& p)
{
    return formatPeriod(p.from, p.to);
}

} // namespace avgear
