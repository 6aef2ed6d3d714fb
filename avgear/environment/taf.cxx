// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Interface for encoded Terminal Aerodrome Forecasts (TAF).
 *
 * @see WMO-49 Volume II, Table A5-1 (Template for TAF)
 */

#include "taf.hxx"

#include <cctype>
#include <cstring>

#include <avgear/debug/logstream.hxx>
#include <avgear/structure/exception.hxx>

#include "report_description.hxx"
#include "report_tokens.hxx"

namespace avgear {

namespace {

const char* const ORIGIN = "AVTaf";

bool isDigit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// digits and a slash only, "2018/2102" or a garbled variant of it
bool looksLikePeriod(const std::string& s)
{
    return !s.empty() && isDigit(s[0]) && s.find('/') != std::string::npos
        && s.find_first_not_of("0123456789/") == std::string::npos;
}

} // anonymous namespace


std::string AVForecastChange::label() const
{
    switch (kind) {
    case FROM:
        return "FROM";
    case BECOMING:
        return "BECOMING";
    case TEMPORARY:
        return "TEMPORARY";
    case PROBABLE_TEMPORARY:
        if (probability)
            return "PROB" + std::to_string(*probability) + " TEMPORARY";
        return "PROB TEMPORARY";
    }
    return "UNKNOWN";
}


/**
 * The constructor takes a TAF string and throws
 * av_empty_input_exception, av_missing_station_exception,
 * av_missing_time_exception or av_malformed_time_exception if the
 * forecast cannot be identified.
 *
 * Everything between the validity period and the first change group
 * introducer is the base forecast. Each FM, BECMG, TEMPO or PROBnn TEMPO
 * then opens a change group that collects field groups until the next
 * introducer. TX/TN, QNH and AMD NOT SKED groups belong to the forecast
 * as a whole wherever they appear; RMK ends the coded part.
 */
AVTaf::AVTaf(const std::string& t) :
    _raw(t)
{
    ReportTokens tokens(t);
    TokenCursor c(tokens);

    scanHeader(c);
    scanId(c);
    scanIssueTime(c);
    scanValidity(c);

    if (_nil) {
        AV_LOG(AV_TAF, AV_INFO, "NIL forecast for " << _id.str());
        return;
    }

    FieldScanner fields(c, _errors, AV_TAF);
    while (!c.atEnd()) {
        if (scanRemark(c))
            break;
        if (scanChangeIntroducer(c, fields))
            continue;
        if (scanTemperatureForecast(c, fields))
            continue;
        if (scanPressureForecast(c, fields))
            continue;
        if (scanAmendmentNotice(c))
            continue;
        if (fields.scanAny(current()))
            continue;

        const ReportToken& tok = c.next();
        AV_LOG(AV_TAF, AV_DEBUG, _id.str() << ": keeping unrecognised group '"
               << tok.text() << "' in " << (_changes.empty() ? "base forecast" : "change group"));
        current().unparsed.push_back(tok.text());
    }

    AV_LOG(AV_TAF, AV_DEBUG, _id.str() << ": " << _changes.size() << " change group(s), "
           << _errors.size() << " field error(s)");
}


std::vector<std::string> AVTaf::getDescriptionLines() const
{
    return describeTaf(*this);
}


std::string AVTaf::getDescription(const std::string& eol) const
{
    return joinLines(getDescriptionLines(), eol);
}


// TAF (AMD|COR|AUTO)*
void AVTaf::scanHeader(TokenCursor& c)
{
    if (c.peek().keyword() == ReportToken::KW_TAF)
        c.skip();

    for (; !c.atEnd(); c.skip()) {
        const ReportToken::Keyword k = c.peek().keyword();
        if (k == ReportToken::KW_AMD)
            _amended = true;
        else if (k == ReportToken::KW_COR)
            _corrected = true;
        else if (k == ReportToken::KW_AUTO)
            _auto = true;
        else
            break;
    }
}


// [A-Z]{4}
void AVTaf::scanId(TokenCursor& c)
{
    if (c.atEnd()) {
        AV_LOG(AV_TAF, AV_INFO, "rejected forecast without station: " << _raw);
        throw av_missing_station_exception("", av_location(), ORIGIN);
    }

    const ReportToken& tok = c.peek();
    auto id = AVStationId::parse(tok.text());
    if (!id) {
        AV_LOG(AV_TAF, AV_INFO, "rejected forecast without station: " << _raw);
        throw av_missing_station_exception(tok.text(), tok.location(), ORIGIN);
    }
    _id = *id;
    c.skip();
}


// \d{6}Z
void AVTaf::scanIssueTime(TokenCursor& c)
{
    if (c.atEnd()) {
        AV_LOG(AV_TAF, AV_INFO, _id.str() << ": rejected forecast without issue time");
        throw av_missing_time_exception("", av_location(), ORIGIN);
    }

    const ReportToken& tok = c.peek();
    const std::string& s = tok.text();
    const bool zulu = tok.shape() == ReportToken::SHAPE_MIXED && s.back() == 'Z'
                      && isDigit(s[0]);
    const bool unknown = tok.shape() == ReportToken::SHAPE_DIGITS && tok.matches("999999");
    if (!zulu && !unknown) {
        AV_LOG(AV_TAF, AV_INFO, _id.str() << ": rejected forecast without issue time");
        throw av_missing_time_exception(s, tok.location(), ORIGIN);
    }

    try {
        _issue_time = parseIssueTime(s);
    } catch (av_malformed_time_exception& e) {
        AV_LOG(AV_TAF, AV_INFO, _id.str() << ": " << e.getMessage());
        e.setLocation(tok.location());
        e.setOrigin(ORIGIN);
        throw;
    }
    c.skip();
}


// NIL? \d{4}/\d{4} NIL?
void AVTaf::scanValidity(TokenCursor& c)
{
    if (!c.atEnd() && c.peek().keyword() == ReportToken::KW_NIL) {
        _nil = true;
        c.skip();
    }

    if (!c.atEnd() && looksLikePeriod(c.peek().text())) {
        const ReportToken& tok = c.peek();
        try {
            _validity = parseValidityToken(tok.text());
        } catch (av_malformed_time_exception& e) {
            AV_LOG(AV_TAF, AV_INFO, _id.str() << ": " << e.getMessage());
            e.setLocation(tok.location());
            e.setOrigin(ORIGIN);
            throw;
        }
        c.skip();
    } else if (!_nil) {
        AV_LOG(AV_TAF, AV_INFO, _id.str() << ": rejected forecast without validity period");
        if (c.atEnd())
            throw av_missing_time_exception("", av_location(), ORIGIN);
        throw av_missing_time_exception(c.peek().text(), c.peek().location(), ORIGIN);
    }

    if (!c.atEnd() && c.peek().keyword() == ReportToken::KW_NIL) {
        _nil = true;
        c.skip();
    }
}


// FM\d{6} | BECMG period | TEMPO period | PROB(30|40) TEMPO period
bool AVTaf::scanChangeIntroducer(TokenCursor& c, FieldScanner& fields)
{
    const ReportToken& tok = c.peek();
    AVForecastChange change;

    switch (tok.keyword()) {
    case ReportToken::KW_BECMG:
        change.kind = AVForecastChange::BECOMING;
        c.skip();
        break;
    case ReportToken::KW_TEMPO:
        change.kind = AVForecastChange::TEMPORARY;
        c.skip();
        break;
    case ReportToken::KW_PROB30:
    case ReportToken::KW_PROB40:
        if (!c.has(1) || c.peek(1).keyword() != ReportToken::KW_TEMPO) {
            AV_LOG(AV_TAF, AV_DEBUG, _id.str() << ": " << tok.text()
                   << " without TEMPO, groups stay with the current forecast");
            return false;
        }
        change.kind = AVForecastChange::PROBABLE_TEMPORARY;
        change.probability = tok.keyword() == ReportToken::KW_PROB30 ? 30 : 40;
        c.skip(2);
        break;
    default:
        if (tok.text().size() < 3 || !tok.startsWith("FM") || !isDigit(tok.text()[2]))
            return false;
        if (tok.text().find_first_not_of("0123456789", 2) != std::string::npos)
            return false;

        change.kind = AVForecastChange::FROM;
        try {
            change.start = parseIssueTime(tok.text().substr(2));
            c.skip();
        } catch (const av_malformed_time_exception& e) {
            fields.reportMalformed("change group time", e.getMessage());
        }
        _changes.push_back(change);
        return true;
    }

    _changes.push_back(change);
    scanGroupPeriod(c, fields, _changes.back());
    return true;
}


// \d{4}/\d{4} following BECMG or TEMPO
void AVTaf::scanGroupPeriod(TokenCursor& c, FieldScanner& fields, AVForecastChange& change)
{
    if (c.atEnd() || !looksLikePeriod(c.peek().text())) {
        const std::string text = c.atEnd() ? std::string() : c.peek().text();
        const av_location where = c.atEnd() ? av_location() : c.peek().location();
        AV_LOG(AV_TAF, AV_WARN, _id.str() << ": " << change.label()
               << " group without period");
        _errors.emplace_back("change group period", "period missing", text, where);
        return;
    }

    try {
        const ValidityPeriod p = parseValidityToken(c.peek().text());
        change.start = p.from;
        change.end = p.to;
        c.skip();
    } catch (const av_malformed_time_exception& e) {
        fields.reportMalformed("change group period", e.getMessage());
    }
}


// T[XN]M?\d{2}/\d{4}Z
bool AVTaf::scanTemperatureForecast(TokenCursor& c, FieldScanner& fields)
{
    const ReportToken& tok = c.peek();
    if (!(tok.startsWith("TX") || tok.startsWith("TN")) || tok.text().find('/') == std::string::npos)
        return false;

    AVTemperatureForecast tf;
    tf.kind = tok.text()[1] == 'X' ? AVTemperatureForecast::MAXIMUM
                                   : AVTemperatureForecast::MINIMUM;

    const char* m = tok.text().c_str() + 2;
    bool negative = false;
    if (*m == 'M') {
        negative = true;
        m++;
    }
    int temp;
    if (!scanNumber(&m, &temp, 1, 2) || *m++ != '/') {
        fields.reportMalformed("temperature forecast", "temperature needs one or two digits");
        return true;
    }
    tf.temperature = negative ? -temp : temp;

    try {
        tf.time = parseDayHour(m);
    } catch (const av_malformed_time_exception& e) {
        fields.reportMalformed("temperature forecast", e.getMessage());
        return true;
    }

    _temperatures.push_back(tf);
    c.skip();
    return true;
}


// QNH\d{4}INS
bool AVTaf::scanPressureForecast(TokenCursor& c, FieldScanner& fields)
{
    const ReportToken& tok = c.peek();
    if (!tok.startsWith("QNH"))
        return false;

    const char* m = tok.text().c_str() + 3;
    int press;
    if (!scanNumber(&m, &press, 4) || std::strcmp(m, "INS")) {
        fields.reportMalformed("pressure forecast", "expected QNHnnnnINS");
        return true;
    }

    _pressures.push_back(press);
    c.skip();
    return true;
}


// AMD NOT SKED
bool AVTaf::scanAmendmentNotice(TokenCursor& c)
{
    if (c.peek().keyword() != ReportToken::KW_AMD || !c.has(2)
            || c.peek(1).text() != "NOT" || c.peek(2).text() != "SKED")
        return false;

    _amd_not_sked = true;
    c.skip(3);
    return true;
}


// RMK.*
bool AVTaf::scanRemark(TokenCursor& c)
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
