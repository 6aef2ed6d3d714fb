// SPDX-License-Identifier: GPL-2.0-or-later
// SPDX-FileCopyrightText: 2003 Melchior Franz <mfranz@aon.at>

/**
 * @file
 * @brief Interface for encoded Meteorological Aerodrome Reports (METAR).
 *
 * @see WMO-49
 * Technical Regulations, Basic Documents No. 2 (WMO No. 49)
 * Volume II - Meteorological Service for International Air Navigation
 *
 * Refer to Table A3-2 (Template for METAR and SPECI).
 */

#include "metar.hxx"

#include <cctype>
#include <cstring>

#include <avgear/debug/logstream.hxx>
#include <avgear/structure/exception.hxx>

#include "report_description.hxx"
#include "report_tokens.hxx"

namespace avgear {

namespace {

const char* const ORIGIN = "AVMetar";

bool allSlashes(const std::string& s)
{
    return !s.empty() && s.find_first_not_of('/') == std::string::npos;
}

// M?\d{1,2}
bool scanSignedTemperature(const char** src, int* value)
{
    bool negative = false;
    if (**src == 'M') {
        negative = true;
        (*src)++;
    }
    if (!scanNumber(src, value, 1, 2))
        return false;
    if (negative)
        *value = -*value;
    return true;
}

} // anonymous namespace


/**
 * The constructor takes a METAR string and throws
 * av_empty_input_exception, av_missing_station_exception,
 * av_missing_time_exception or av_malformed_time_exception if the
 * report cannot be identified. The "METAR" and "SPECI" keywords are
 * optional.
 *
 * Groups are recognised by their shape rather than their position, so
 * a missing or garbled group does not shift the meaning of the ones
 * after it.
 */
AVMetar::AVMetar(const std::string& m) :
    _raw(m)
{
    ReportTokens tokens(m);
    TokenCursor c(tokens);

    // METAR header
    scanType(c);
    scanId(c);
    scanDate(c);
    while (scanModifier(c)) { /* empty loop body */ }

    if (_nil) {
        AV_LOG(AV_METAR, AV_INFO, "NIL report for " << _id.str());
        return;
    }

    FieldScanner fields(c, _errors, AV_METAR);
    while (!c.atEnd()) {
        if (scanRemark(c))
            break;
        if (scanTrendForecast(c))
            continue;

        if (fields.scanVariability(_conditions))
            continue;
        if (!_conditions.wind && fields.scanWind(_conditions))
            continue;
        if (!_conditions.windShear && fields.scanWindShear(_conditions))
            continue;
        if (!_conditions.visibility && fields.scanVisibility(_conditions))
            continue;
        if (fields.scanWeather(_conditions))
            continue;
        if (fields.scanSkyCondition(_conditions))
            continue;
        if (!_temperature && scanTemperature(c, fields))
            continue;
        if (!_altimeter && scanPressure(c, fields))
            continue;

        const ReportToken& tok = c.next();
        AV_LOG(AV_METAR, AV_DEBUG, _id.str() << ": skipping unrecognised group '"
               << tok.text() << "'");
        _conditions.unparsed.push_back(tok.text());
    }

    if (!_errors.empty())
        AV_LOG(AV_METAR, AV_INFO, _id.str() << ": " << _errors.size()
               << " group(s) could not be decoded");
}


std::vector<std::string> AVMetar::getDescriptionLines() const
{
    return describeMetar(*this);
}


std::string AVMetar::getDescription(const std::string& eol) const
{
    return joinLines(getDescriptionLines(), eol);
}


// (METAR|SPECI)
bool AVMetar::scanType(TokenCursor& c)
{
    if (c.atEnd())
        return false;
    switch (c.peek().keyword()) {
    case ReportToken::KW_METAR:
        _report_type = ROUTINE;
        break;
    case ReportToken::KW_SPECI:
        _report_type = SPECIAL;
        break;
    default:
        return false;
    }
    c.skip();
    return true;
}


// [A-Z]{4}
void AVMetar::scanId(TokenCursor& c)
{
    if (c.atEnd()) {
        AV_LOG(AV_METAR, AV_INFO, "rejected report without station: " << _raw);
        throw av_missing_station_exception("", av_location(), ORIGIN);
    }

    const ReportToken& tok = c.peek();
    auto id = AVStationId::parse(tok.text());
    if (!id) {
        AV_LOG(AV_METAR, AV_INFO, "rejected report without station: " << _raw);
        throw av_missing_station_exception(tok.text(), tok.location(), ORIGIN);
    }
    _id = *id;
    c.skip();
}


// \d{6}Z
void AVMetar::scanDate(TokenCursor& c)
{
    if (c.atEnd()) {
        AV_LOG(AV_METAR, AV_INFO, _id.str() << ": rejected report without time");
        throw av_missing_time_exception("", av_location(), ORIGIN);
    }

    const ReportToken& tok = c.peek();
    const std::string& s = tok.text();
    const bool zulu = tok.shape() == ReportToken::SHAPE_MIXED && s.back() == 'Z'
                      && std::isdigit(static_cast<unsigned char>(s[0]));
    const bool unknown = tok.shape() == ReportToken::SHAPE_DIGITS && tok.matches("999999");
    if (!zulu && !unknown) {
        AV_LOG(AV_METAR, AV_INFO, _id.str() << ": rejected report without time");
        throw av_missing_time_exception(s, tok.location(), ORIGIN);
    }

    try {
        _time = parseIssueTime(s);
    } catch (av_malformed_time_exception& e) {
        AV_LOG(AV_METAR, AV_INFO, _id.str() << ": " << e.getMessage());
        e.setLocation(tok.location());
        e.setOrigin(ORIGIN);
        throw;
    }
    c.skip();
}


// (AUTO|COR|CC[A-Z]|NIL)
bool AVMetar::scanModifier(TokenCursor& c)
{
    if (c.atEnd())
        return false;

    const ReportToken& tok = c.peek();
    switch (tok.keyword()) {
    case ReportToken::KW_AUTO:
        _auto = true;
        break;
    case ReportToken::KW_COR:
        _corrected = true;
        break;
    case ReportToken::KW_NIL:
        _nil = true;
        break;
    default:
        if (!tok.matches("CCA"))
            return false;
        _corrected = true;
    }
    c.skip();
    return true;
}


// (M?\d{1,2})/(M?\d{1,2}|//|XX)?
bool AVMetar::scanTemperature(TokenCursor& c, FieldScanner& fields)
{
    const ReportToken& tok = c.peek();
    const std::string& s = tok.text();
    if (s.find('/') == std::string::npos || tok.endsWith("SM") || tok.startsWith("R")
            || tok.startsWith("WS"))
        return false;

    if (allSlashes(s)) {
        AV_LOG(AV_METAR, AV_DEBUG, "temperature not measured: " << s);
        c.skip();
        return true;
    }

    const char* m = s.c_str();
    int temp, dew;
    if (!scanSignedTemperature(&m, &temp) || *m++ != '/') {
        if (s[0] == 'M' || std::isdigit(static_cast<unsigned char>(s[0]))) {
            fields.reportMalformed("temperature", "temperature needs one or two digits");
            return true;
        }
        return false;
    }

    AVTemperature t;
    t.temperature = temp;
    if (!*m || !std::strcmp(m, "//") || !std::strcmp(m, "XX")) {
        // dewpoint not reported
    } else if (scanSignedTemperature(&m, &dew) && !*m) {
        t.dewpoint = dew;
    } else {
        fields.reportMalformed("temperature", "dewpoint needs one or two digits");
        return true;
    }

    _temperature = t;
    c.skip();
    return true;
}


// [QA]\d{4}
bool AVMetar::scanPressure(TokenCursor& c, FieldScanner& fields)
{
    const ReportToken& tok = c.peek();
    const std::string& s = tok.text();
    if (s.size() < 2 || (s[0] != 'Q' && s[0] != 'A'))
        return false;

    const std::string rest = s.substr(1);
    if (rest.find_first_not_of("0123456789/") != std::string::npos)
        return false;

    if (allSlashes(rest)) {
        AV_LOG(AV_METAR, AV_DEBUG, "pressure not measured: " << s);
        c.skip();
        return true;
    }

    const char* m = rest.c_str();
    int press;
    if (!scanNumber(&m, &press, 4) || *m) {
        fields.reportMalformed("altimeter", "pressure needs four digits");
        return true;
    }

    AVAltimeter a;
    a.unit = s[0] == 'Q' ? AVAltimeter::HECTOPASCAL : AVAltimeter::INCHES_HG;
    a.value = press;
    _altimeter = a;
    c.skip();
    return true;
}


// (NOSIG|BECMG ...|TEMPO ...), up to RMK
bool AVMetar::scanTrendForecast(TokenCursor& c)
{
    const ReportToken::Keyword k = c.peek().keyword();
    if (k != ReportToken::KW_NOSIG && k != ReportToken::KW_BECMG && k != ReportToken::KW_TEMPO)
        return false;

    while (!c.atEnd() && c.peek().keyword() != ReportToken::KW_RMK) {
        if (!_trend.empty())
            _trend += ' ';
        _trend += c.next().text();
    }
    return true;
}


// RMK.*
bool AVMetar::scanRemark(TokenCursor& c)
{
    if (c.peek().keyword() != ReportToken::KW_RMK)
        return false;
    c.skip();
    _remarks = c.remainder();
    while (!c.atEnd())
        c.skip();
    return true;
}

} // namespace avgear
