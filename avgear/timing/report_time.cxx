// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Day/hour/minute groups of METAR and TAF reports.
 */

#include "report_time.hxx"

#include <cctype>
#include <cstdio>

#include <avgear/debug/logstream.hxx>
#include <avgear/structure/exception.hxx>

namespace avgear {

namespace {

// strip one trailing 'Z' and require exactly n digits
std::string digitsOf(const std::string& token, std::size_t n, const char* what)
{
    std::string s = token;
    if (!s.empty() && s.back() == 'Z')
        s.pop_back();

    if (s.size() != n)
        throw av_malformed_time_exception(std::string(what) + " needs "
                                          + std::to_string(n) + " digits", token);
    for (unsigned char c : s) {
        if (!std::isdigit(c))
            throw av_malformed_time_exception(std::string(what) + " is not numeric", token);
    }
    return s;
}

int field(const std::string& s, std::size_t pos)
{
    return (s[pos] - '0') * 10 + (s[pos + 1] - '0');
}

void checkDay(int day, const std::string& token)
{
    if (day < 1 || day > 31)
        throw av_malformed_time_exception("day out of range", token);
}

} // anonymous namespace


std::string ordinalLabel(int day)
{
    const char* suffix = "th";
    const int tens = day % 100;
    if (tens < 11 || tens > 13) {
        switch (day % 10) {
        case 1: suffix = "st"; break;
        case 2: suffix = "nd"; break;
        case 3: suffix = "rd"; break;
        default: break;
        }
    }
    return std::to_string(day) + suffix;
}

ReportTime parseIssueTime(const std::string& token)
{
    const std::string s = digitsOf(token, 6, "time group");
    ReportTime t(field(s, 0), field(s, 2), field(s, 4));

    checkDay(t.day, token);
    if (t.hour > 23)
        throw av_malformed_time_exception("hour out of range", token);
    if (t.minute > 59)
        throw av_malformed_time_exception("minute out of range", token);
    return t;
}

ReportTime parseDayHour(const std::string& token)
{
    const std::string s = digitsOf(token, 4, "day/hour group");
    ReportTime t(field(s, 0), field(s, 2));

    checkDay(t.day, token);
    if (t.hour > 24)
        throw av_malformed_time_exception("hour out of range", token);
    if (t.hour == 24) {
        // end of day: the next day number, no month resolution
        t.day += 1;
        t.hour = 0;
    }
    return t;
}

ValidityPeriod parseValidityToken(const std::string& token)
{
    const auto slash = token.find('/');
    if (slash == std::string::npos)
        throw av_malformed_time_exception("validity period needs DDHH/DDHH", token);

    ValidityPeriod p;
    p.from = parseDayHour(token.substr(0, slash));
    p.to = parseDayHour(token.substr(slash + 1));

    if (p.to.day < p.from.day) {
        AV_LOG(AV_TIMING, AV_DEBUG, "validity " << token << " runs into the next month");
    } else if (p.to.minutes() <= p.from.minutes()) {
        throw av_malformed_time_exception("validity period ends before it starts", token);
    }
    return p;
}

std::string formatClock(const ReportTime& t)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02d:%02dZ", t.hour, t.minute);
    return buf;
}

std::string formatInstant(const ReportTime& t)
{
    return formatClock(t) + " on " + ordinalLabel(t.day);
}

std::string formatPeriod(const ReportTime& from, const ReportTime& to)
{
    if (from.day == to.day)
        return formatClock(from) + " to " + formatClock(to);
    return formatInstant(from) + " to " + formatInstant(to);
}

} // namespace avgear
