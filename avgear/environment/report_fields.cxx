// SPDX-License-Identifier: GPL-2.0-or-later
// SPDX-FileCopyrightText: 2003 Melchior Franz <mfranz@aon.at>

/**
 * @file
 * @brief Field groups shared by METAR and TAF reports.
 */

#include "report_fields.hxx"

#include <cctype>
#include <cmath>
#include <cstring>

#include <avgear/debug/logstream.hxx>

#include "report_tokens.hxx"

namespace avgear {

namespace {

const double MPS_TO_KT = 1.94384;
const double KMH_TO_KT = 0.539957;

struct Token {
    const char* id;
    const char* text;
};

const Token description[] = {
    { "MI", "Shallow" },
    { "PR", "Partial" },
    { "BC", "Patches" },
    { "DR", "Drifting" },
    { "BL", "Blowing" },
    { "SH", "Showers" },
    { "TS", "Thunderstorm" },
    { "FZ", "Freezing" },
    { "RE", "Recent" },
    { 0, 0 }
};

const Token phenomenon[] = {
    { "DZ", "Drizzle" },
    { "RA", "Rain" },
    { "SN", "Snow" },
    { "SG", "Snow Grains" },
    { "IC", "Ice Crystals" },
    { "PL", "Ice Pellets" },
    { "PE", "Ice Pellets" },
    { "GR", "Hail" },
    { "GS", "Small Hail/Snow Pellets" },
    { "UP", "Unknown Precipitation" },
    { "BR", "Mist" },
    { "FG", "Fog" },
    { "FU", "Smoke" },
    { "VA", "Volcanic Ash" },
    { "DU", "Dust" },
    { "SA", "Sand" },
    { "HZ", "Haze" },
    { "PY", "Spray" },
    { "PO", "Dust/Sand Whirls" },
    { "SQ", "Squall" },
    { "FC", "Funnel Cloud" },
    { "SS", "Sandstorm" },
    { "DS", "Duststorm" },
    { 0, 0 }
};

const Token sky_clear[] = {
    { "NSC", "No Significant Cloud" },
    { "SKC", "Sky Clear" },
    { "CLR", "Clear" },
    { "NCD", "No Cloud Detected" },
    { 0, 0 }
};

const Token cloud_types[] = {
    { "CB",  "Cumulonimbus" },
    { "TCU", "Towering Cumulus" },
    { 0, 0 }
};

// find longest match of *str in list
const Token* scanToken(const char** str, const Token* list)
{
    const Token* longest = 0;
    std::size_t maxlen = 0;
    for (int i = 0; list[i].id; i++) {
        const std::size_t len = std::strlen(list[i].id);
        if (!std::strncmp(list[i].id, *str, len) && len > maxlen) {
            maxlen = len;
            longest = &list[i];
        }
    }
    *str += maxlen;
    return longest;
}

const char* lookup(const Token* list, const std::string& id)
{
    for (int i = 0; list[i].id; i++) {
        if (id == list[i].id)
            return list[i].text;
    }
    return 0;
}

// N, N/D or a plain integer, followed by nothing
bool scanFraction(const char** src, double* value)
{
    int n, d;
    if (!scanNumber(src, &n, 1, 2))
        return false;
    *value = n;
    if (**src == '/') {
        (*src)++;
        if (!scanNumber(src, &d, 1, 2) || d == 0)
            return false;
        *value = double(n) / d;
    }
    return true;
}

} // anonymous namespace


int scanNumber(const char** src, int* num, int min, int max)
{
    int i;
    const char* s = *src;
    *num = 0;
    if (max < min)
        max = min;
    for (i = 0; i < min; i++) {
        if (!std::isdigit(static_cast<unsigned char>(*s)))
            return 0;
        *num = *num * 10 + *s++ - '0';
    }
    for (; i < max && std::isdigit(static_cast<unsigned char>(*s)); i++)
        *num = *num * 10 + *s++ - '0';
    *src = s;
    return i;
}


std::optional<AVStationId> AVStationId::parse(const std::string& token)
{
    if (token.size() != 4)
        return std::nullopt;
    for (unsigned char c : token) {
        if (!std::isupper(c))
            return std::nullopt;
    }
    return AVStationId(token);
}

AVStationId parseStation(const std::string& token)
{
    auto id = AVStationId::parse(token);
    if (!id)
        throw av_missing_station_exception(token, av_location());
    return *id;
}


bool AVConditions::empty() const
{
    return !wind && !visibility && weather.empty() && clouds.empty()
        && skyClear.empty() && !windShear && unparsed.empty();
}


FieldScanner::FieldScanner(TokenCursor& cursor, ErrorList& errors, avDebugClass logClass) :
    _cursor(cursor),
    _errors(errors),
    _logClass(logClass)
{
}

void FieldScanner::reportMalformed(const char* field, const std::string& message)
{
    const ReportToken& tok = _cursor.next();
    AV_LOG(_logClass, AV_WARN, "malformed " << field << " group '" << tok.text()
           << "': " << message);
    _errors.emplace_back(field, message, tok.text(), tok.location());
    _afterWind = false;
}


bool FieldScanner::parseWind(const std::string& text, AVWind& wind, std::string& problem) const
{
    const char* m = text.c_str();
    int dir, speed, gust = -1;

    if (!std::strncmp(m, "VRB", 3)) {
        m += 3;
    } else if (scanNumber(&m, &dir, 3)) {
        if (dir > 360) {
            problem = "direction out of range";
            return false;
        }
        wind.direction = dir;
    } else {
        problem = "direction is not numeric or VRB";
        return false;
    }

    if (!scanNumber(&m, &speed, 2, 3)) {
        problem = "speed needs two or three digits";
        return false;
    }

    if (*m == 'G') {
        m++;
        if (!scanNumber(&m, &gust, 2, 3)) {
            problem = "gust needs two or three digits";
            return false;
        }
    }

    double factor;
    if (!std::strcmp(m, "KT"))
        factor = 1.0;
    else if (!std::strcmp(m, "MPS"))
        factor = MPS_TO_KT;
    else if (!std::strcmp(m, "KMH"))
        factor = KMH_TO_KT;
    else {
        problem = "unknown speed unit";
        return false;
    }

    wind.speed = static_cast<int>(std::lround(speed * factor));
    if (gust >= 0)
        wind.gust = static_cast<int>(std::lround(gust * factor));
    return true;
}


bool FieldScanner::scanWind(AVConditions& c)
{
    if (_cursor.atEnd())
        return false;

    const ReportToken& tok = _cursor.peek();
    if (!(tok.endsWith("KT") || tok.endsWith("MPS") || tok.endsWith("KMH"))
            || tok.startsWith("WS"))
        return false;

    if (tok.startsWith("/////")) {
        // sensor failure, wind not measured
        AV_LOG(_logClass, AV_DEBUG, "wind not measured: " << tok.text());
        _cursor.skip();
        _afterWind = false;
        return true;
    }

    AVWind wind;
    std::string problem;
    if (!parseWind(tok.text(), wind, problem)) {
        reportMalformed("wind", problem);
        return true;
    }

    if (wind.gust && *wind.gust <= wind.speed) {
        AV_LOG(_logClass, AV_WARN, "gust " << *wind.gust << " KT not above speed "
               << wind.speed << " KT in '" << tok.text() << "'");
        _errors.emplace_back("wind", "gust not above mean speed", tok.text(), tok.location());
    }

    c.wind = wind;
    _cursor.skip();
    _afterWind = true;
    return true;
}


bool FieldScanner::scanVariability(AVConditions& c)
{
    if (_cursor.atEnd() || !_afterWind || !c.wind)
        return false;

    const ReportToken& tok = _cursor.peek();
    if (!tok.matches("999V999"))
        return false;

    const char* m = tok.text().c_str();
    int from, to;
    scanNumber(&m, &from, 3);
    m++;
    scanNumber(&m, &to, 3);
    if (from > 360 || to > 360) {
        reportMalformed("wind variability", "direction out of range");
        return true;
    }

    c.wind->variableBetween = std::make_pair(from, to);
    _cursor.skip();
    _afterWind = false;
    return true;
}


bool FieldScanner::scanVisibility(AVConditions& c)
{
    if (_cursor.atEnd())
        return false;

    const ReportToken& tok = _cursor.peek();
    AVVisibility vis;
    vis.text = tok.text();

    if (tok.keyword() == ReportToken::KW_CAVOK) {
        vis.cavok = true;
        vis.distance = 9999;
        vis.modifier = AVVisibility::GREATER_THAN;
        c.visibility = vis;
        _cursor.skip();
        _afterWind = false;
        return true;
    }

    if (tok.text() == "////" || tok.text() == "////SM") {
        AV_LOG(_logClass, AV_DEBUG, "visibility not measured: " << tok.text());
        _cursor.skip();
        _afterWind = false;
        return true;
    }

    const char* m = tok.text().c_str();
    int i;

    // \d{4}(NDV|N|NE|E|SE|S|SW|W|NW)?
    if (tok.text().size() >= 4 && scanNumber(&m, &i, 4)) {
        static const char* directions[] = {
            "", "NDV", "N", "NE", "E", "SE", "S", "SW", "W", "NW", 0
        };
        bool known = false;
        for (int d = 0; directions[d]; d++) {
            if (!std::strcmp(m, directions[d]))
                known = true;
        }
        if (!known)
            return false;

        vis.distance = i;
        if (i == 9999)
            vis.modifier = AVVisibility::GREATER_THAN;
        else if (i == 0)
            vis.modifier = AVVisibility::LESS_THAN;
        c.visibility = vis;
        _cursor.skip();
        _afterWind = false;
        return true;
    }

    // whole miles followed by a fraction: "1 1/2SM"
    if (tok.shape() == ReportToken::SHAPE_DIGITS && tok.text().size() <= 2 && _cursor.has(1)
            && _cursor.peek(1).endsWith("SM")
            && _cursor.peek(1).text().find('/') != std::string::npos) {
        const std::string& frac = _cursor.peek(1).text();
        const char* f = frac.c_str();
        double part;
        if (scanFraction(&f, &part) && !std::strcmp(f, "SM")) {
            vis.unit = AVVisibility::STATUTE_MILES;
            vis.distance = std::stoi(tok.text()) + part;
            vis.text = tok.text() + " " + frac;
            c.visibility = vis;
            _cursor.skip(2);
            _afterWind = false;
            return true;
        }
    }

    // P6SM, M1/4SM, 10SM, 3/4SM, 6+, 6+SM
    const bool miles = tok.endsWith("SM");
    const bool plus = tok.text().find('+') != std::string::npos
                      && std::isdigit(static_cast<unsigned char>(tok.text()[0]));
    if (!miles && !plus)
        return false;

    m = tok.text().c_str();
    if (*m == 'P')
        m++, vis.modifier = AVVisibility::GREATER_THAN;
    else if (*m == 'M')
        m++, vis.modifier = AVVisibility::LESS_THAN;

    double distance;
    if (!scanFraction(&m, &distance)) {
        reportMalformed("visibility", "distance is not numeric");
        return true;
    }
    if (*m == '+')
        m++, vis.modifier = AVVisibility::GREATER_THAN;
    if (*m && std::strcmp(m, "SM")) {
        reportMalformed("visibility", "unexpected characters after distance");
        return true;
    }

    vis.unit = AVVisibility::STATUTE_MILES;
    vis.distance = distance;
    c.visibility = vis;
    _cursor.skip();
    _afterWind = false;
    return true;
}


bool FieldScanner::scanWeather(AVConditions& c)
{
    if (_cursor.atEnd())
        return false;

    const ReportToken& tok = _cursor.peek();

    // @see WMO-49 Section 4.4.2.9
    // Denotes a temporary failure of the sensor
    if (tok.text() == "//") {
        _cursor.skip();
        _afterWind = false;
        return true;
    }

    AVWeather w;
    w.text = tok.text();

    if (tok.keyword() == ReportToken::KW_NSW) {
        w.noSignificantWeather = true;
        c.weather.push_back(w);
        _cursor.skip();
        _afterWind = false;
        return true;
    }

    const char* m = tok.text().c_str();
    if (*m == '-')
        m++, w.intensity = AVWeather::LIGHT;
    else if (*m == '+')
        m++, w.intensity = AVWeather::HEAVY;
    else if (!std::strncmp(m, "VC", 2))
        m += 2, w.vicinity = true;

    const Token* a;
    for (int i = 0; i < 2; i++) {
        if (!(a = scanToken(&m, description)))
            break;
        w.descriptors.push_back(a->id);
    }

    for (int i = 0; i < 3; i++) {
        if (!(a = scanToken(&m, phenomenon)))
            break;
        w.phenomena.push_back(a->id);
    }

    if (*m || (w.descriptors.empty() && w.phenomena.empty()))
        return false;

    c.weather.push_back(w);
    _cursor.skip();
    _afterWind = false;
    return true;
}


bool FieldScanner::scanSkyCondition(AVConditions& c)
{
    if (_cursor.atEnd())
        return false;

    const ReportToken& tok = _cursor.peek();
    const char* m = tok.text().c_str();

    if (const Token* clear = scanToken(&m, sky_clear)) {
        if (*m)
            return false;
        c.skyClear = clear->id;
        _cursor.skip();
        _afterWind = false;
        return true;
    }

    AVCloudLayer cl;
    int i;
    if (!std::strncmp(m, "VV", i = 2))
        cl.coverage = AVCloudLayer::COVERAGE_VERTICAL_VISIBILITY;
    else if (!std::strncmp(m, "FEW", i = 3))
        cl.coverage = AVCloudLayer::COVERAGE_FEW;
    else if (!std::strncmp(m, "SCT", i = 3))
        cl.coverage = AVCloudLayer::COVERAGE_SCATTERED;
    else if (!std::strncmp(m, "BKN", i = 3))
        cl.coverage = AVCloudLayer::COVERAGE_BROKEN;
    else if (!std::strncmp(m, "OVC", i = 3))
        cl.coverage = AVCloudLayer::COVERAGE_OVERCAST;
    else
        return false;
    m += i;

    int height;
    if (!std::strncmp(m, "///", 3)) {
        m += 3;             // base not measurable
    } else if (scanNumber(&m, &height, 3)) {
        cl.height = height * 100;
    } else {
        reportMalformed("cloud", "layer height needs three digits");
        return true;
    }

    if (cl.coverage != AVCloudLayer::COVERAGE_VERTICAL_VISIBILITY) {
        if (const Token* a = scanToken(&m, cloud_types))
            cl.type = a->id;

        // @see WMO-49 Section 4.5.4.5
        // Denotes temporary failure of sensor and covers cases like FEW045///
        if (!std::strncmp(m, "///", 3))
            m += 3;
    }

    if (*m) {
        reportMalformed("cloud", "unexpected characters after layer height");
        return true;
    }

    c.clouds.push_back(cl);
    _cursor.skip();
    _afterWind = false;
    return true;
}


bool FieldScanner::scanWindShear(AVConditions& c)
{
    if (_cursor.atEnd())
        return false;

    const ReportToken& tok = _cursor.peek();
    if (!tok.startsWith("WS") || tok.text().find('/') == std::string::npos)
        return false;

    const char* m = tok.text().c_str() + 2;
    int height;
    if (!scanNumber(&m, &height, 3) || *m != '/') {
        reportMalformed("wind shear", "height needs three digits");
        return true;
    }

    AVWindShear ws;
    ws.height = height * 100;
    std::string problem;
    if (!parseWind(m + 1, ws.wind, problem)) {
        reportMalformed("wind shear", problem);
        return true;
    }

    c.windShear = ws;
    _cursor.skip();
    _afterWind = false;
    return true;
}


bool FieldScanner::scanAny(AVConditions& c)
{
    return scanVariability(c)
        || (!c.wind && scanWind(c))
        || scanWindShear(c)
        || scanVisibility(c)
        || scanWeather(c)
        || scanSkyCondition(c);
}


const char* coverageName(AVCloudLayer::Coverage c)
{
    switch (c) {
    case AVCloudLayer::COVERAGE_FEW:                 return "Few";
    case AVCloudLayer::COVERAGE_SCATTERED:           return "Scattered";
    case AVCloudLayer::COVERAGE_BROKEN:              return "Broken";
    case AVCloudLayer::COVERAGE_OVERCAST:            return "Overcast";
    case AVCloudLayer::COVERAGE_VERTICAL_VISIBILITY: return "Vertical Visibility";
    }
    return "Unknown";
}

const char* cloudTypeName(const std::string& type)
{
    const char* name = lookup(cloud_types, type);
    return name ? name : "";
}

const char* weatherCodeName(const std::string& code)
{
    const char* name = lookup(description, code);
    if (!name)
        name = lookup(phenomenon, code);
    return name ? name : "";
}

const char* skyClearName(const std::string& code)
{
    const char* name = lookup(sky_clear, code);
    return name ? name : "";
}

} // namespace avgear
