// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Plain text rendering of decoded METAR and TAF reports.
 */

#include "report_description.hxx"

#include <iomanip>
#include <sstream>

#include <avgear/debug/logstream.hxx>
#include <avgear/structure/exception.hxx>
#include <avgear/timing/report_time.hxx>

#include "metar.hxx"
#include "taf.hxx"

namespace avgear {

namespace {

const char* const DEG = "\xc2\xb0";

std::string degrees(int d)
{
    return std::to_string(d) + DEG;
}

std::string celsius(int t)
{
    return std::to_string(t) + DEG + "C";
}

std::string knots(int kt)
{
    return std::to_string(kt) + " KT";
}

// the distance as encoded, without P/M prefix, '+' or unit
std::string milesText(const std::string& text)
{
    std::string s = text;
    if (!s.empty() && (s[0] == 'P' || s[0] == 'M'))
        s.erase(0, 1);
    if (s.size() >= 2 && s.compare(s.size() - 2, 2, "SM") == 0)
        s.erase(s.size() - 2);
    const std::string::size_type plus = s.find('+');
    if (plus != std::string::npos)
        s.erase(plus);
    return s;
}

void appendConditions(std::vector<std::string>& lines, const AVConditions& c,
                      const std::string& indent)
{
    if (c.windShear) {
        std::ostringstream out;
        out << indent << "Wind Shear: Wind shear at " << c.windShear->height << " feet: "
            << describeWind(c.windShear->wind);
        lines.push_back(out.str());
    }

    if (c.wind)
        lines.push_back(indent + "Wind: " + describeWind(*c.wind));

    if (c.visibility)
        lines.push_back(indent + "Visibility: " + describeVisibility(*c.visibility));

    if (!c.weather.empty()) {
        std::string w;
        for (const auto& wx : c.weather) {
            if (!w.empty())
                w += ", ";
            w += describeWeather(wx);
        }
        lines.push_back(indent + "Weather: " + w);
    }

    if (!c.clouds.empty() || !c.skyClear.empty()) {
        lines.push_back(indent + "Clouds:");
        for (const auto& cl : c.clouds)
            lines.push_back(indent + "  - " + describeCloudLayer(cl));
        if (!c.skyClear.empty())
            lines.push_back(indent + "  - " + skyClearName(c.skyClear));
    }

    if (!c.unparsed.empty()) {
        std::string u;
        for (const auto& t : c.unparsed) {
            if (!u.empty())
                u += ' ';
            u += t;
        }
        lines.push_back(indent + "Unparsed: " + u);
    }
}

void trimTrailingBlanks(std::vector<std::string>& lines)
{
    while (!lines.empty() && lines.back().empty())
        lines.pop_back();
}

} // anonymous namespace


std::string describeWind(const AVWind& wind)
{
    if (wind.isCalm() && !wind.gust)
        return "Calm";

    std::string s;
    if (wind.isVariable())
        s = "Variable at " + knots(wind.speed);
    else
        s = degrees(*wind.direction) + " at " + knots(wind.speed);

    if (wind.gust)
        s += " gusting to " + knots(*wind.gust);

    if (wind.variableBetween)
        s += " (varying between " + degrees(wind.variableBetween->first) + " and "
             + degrees(wind.variableBetween->second) + ")";
    return s;
}


std::string describeVisibility(const AVVisibility& vis)
{
    if (vis.cavok)
        return "CAVOK";

    std::ostringstream out;
    if (vis.unit == AVVisibility::METERS) {
        const int m = static_cast<int>(vis.distance);
        if (m >= 9999)
            return "10 km or more";
        if (vis.modifier == AVVisibility::LESS_THAN)
            return "less than 50 meters";
        out << m << " meters";
        return out.str();
    }

    std::string miles = milesText(vis.text);
    if (miles.empty()) {
        out << vis.distance;
        miles = out.str();
        out.str("");
    }
    if (vis.modifier == AVVisibility::LESS_THAN)
        out << "less than ";
    out << miles << " statute mile" << (vis.distance > 1.0 ? "s" : "");
    if (vis.modifier == AVVisibility::GREATER_THAN)
        out << " or more";
    return out.str();
}


std::string describeWeather(const AVWeather& weather)
{
    if (weather.noSignificantWeather)
        return "No Significant Weather";

    std::string s;
    auto add = [&s](const std::string& word) {
        if (word.empty())
            return;
        if (!s.empty())
            s += ' ';
        s += word;
    };

    if (weather.intensity == AVWeather::LIGHT)
        add("Light");
    else if (weather.intensity == AVWeather::HEAVY)
        add("Heavy");
    if (weather.vicinity)
        add("In the vicinity");

    for (const auto& d : weather.descriptors)
        add(weatherCodeName(d));
    for (const auto& p : weather.phenomena)
        add(weatherCodeName(p));

    return s.empty() ? weather.text : s;
}


std::string describeCloudLayer(const AVCloudLayer& layer)
{
    std::string s = coverageName(layer.coverage);
    if (layer.height)
        s += " at " + std::to_string(*layer.height) + " feet";
    else
        s += " at unknown height";

    const std::string type = cloudTypeName(layer.type);
    if (!type.empty())
        s += " (" + type + ")";
    return s;
}


std::vector<std::string> describeMetar(const AVMetar& metar)
{
    std::vector<std::string> lines;

    std::string type = metar.getReportType() == AVMetar::SPECIAL ? "SPECI (special)"
                                                                 : "METAR (routine)";
    if (metar.isAutomatic())
        type += ", AUTOMATED";
    if (metar.isCorrected())
        type += ", CORRECTED";
    if (metar.isNil())
        type += ", NIL (Missing Report)";
    lines.push_back("Report Type: " + type);

    lines.push_back("Station: " + metar.getId().str());
    lines.push_back("Observation Day: " + ordinalLabel(metar.getObservationTime().day));
    lines.push_back("Observation Time: " + formatClock(metar.getObservationTime()));

    const AVConditions& c = metar.getConditions();
    if (c.wind)
        lines.push_back("Wind: " + describeWind(*c.wind));
    else
        lines.push_back("Wind: not reported");

    AVConditions rest = c;
    rest.wind.reset();
    rest.windShear.reset();
    rest.unparsed.clear();
    appendConditions(lines, rest, "");

    if (const auto& t = metar.getTemperature()) {
        lines.push_back("Temperature/Dewpoint: " + celsius(t->temperature) + "/"
                        + (t->dewpoint ? celsius(*t->dewpoint) : std::string("not reported")));
    } else {
        lines.push_back("Temperature/Dewpoint: not reported");
    }

    if (const auto& a = metar.getAltimeter()) {
        std::ostringstream out;
        out << "Altimeter: ";
        if (a->unit == AVAltimeter::HECTOPASCAL)
            out << a->value << " hPa";
        else
            out << std::fixed << std::setprecision(2) << a->inHg() << " inHg";
        lines.push_back(out.str());
    }

    if (c.windShear) {
        AVConditions ws;
        ws.windShear = c.windShear;
        appendConditions(lines, ws, "");
    }

    if (!metar.getTrend().empty())
        lines.push_back("Trend: " + metar.getTrend());
    if (!metar.getRemarks().empty())
        lines.push_back("Remarks: " + metar.getRemarks());

    if (!c.unparsed.empty()) {
        AVConditions u;
        u.unparsed = c.unparsed;
        appendConditions(lines, u, "");
    }

    if (!metar.getFieldErrors().empty())
        lines.push_back("Raw Report: " + metar.getRawText());

    AV_LOG(AV_FORMAT, AV_BULK, "described METAR " << metar.getId().str() << " in "
           << lines.size() << " lines");
    return lines;
}


std::vector<std::string> describeTaf(const AVTaf& taf)
{
    std::vector<std::string> lines;

    lines.push_back("Station: " + taf.getId().str());
    lines.push_back("Issue Date: " + ordinalLabel(taf.getIssueTime().day));
    lines.push_back("Issue Time: " + formatClock(taf.getIssueTime()));

    if (const auto& v = taf.getValidity()) {
        lines.push_back("Valid From: " + formatInstant(v->from));
        lines.push_back("Valid To: " + formatInstant(v->to));
    }

    std::vector<std::string> flags;
    if (taf.isAmended())
        flags.push_back("AMENDED");
    if (taf.isCorrected())
        flags.push_back("CORRECTED");
    if (taf.isNil())
        flags.push_back("NIL (Forecast Suspended)");
    if (taf.isAutomatic())
        flags.push_back("AUTOMATED");
    if (taf.isAmendmentNotScheduled())
        flags.push_back("AMD NOT SKED (Updates not scheduled)");
    if (!flags.empty()) {
        std::string s;
        for (const auto& f : flags)
            s += (s.empty() ? "" : ", ") + f;
        lines.push_back("Type: " + s);
    }
    lines.push_back("");

    if (!taf.getBaseForecast().empty()) {
        lines.push_back("BASE FORECAST:");
        appendConditions(lines, taf.getBaseForecast(), "  ");
        lines.push_back("");
    }

    if (!taf.getChanges().empty()) {
        lines.push_back("FORECAST CHANGES:");
        int i = 1;
        for (const auto& g : taf.getChanges()) {
            std::string period;
            if (!g.hasPeriod())
                period = "period not specified";
            else if (g.kind == AVForecastChange::FROM || !g.end)
                period = formatInstant(*g.start);
            else
                period = formatPeriod(*g.start, *g.end);

            lines.push_back("  " + std::to_string(i++) + ". " + g.label() + " " + period + ":");
            appendConditions(lines, g.conditions, "     ");
            lines.push_back("");
        }
    }

    if (!taf.getTemperatureForecasts().empty()) {
        lines.push_back("TEMPERATURE FORECAST:");
        for (const auto& t : taf.getTemperatureForecasts()) {
            lines.push_back(std::string("  ")
                            + (t.kind == AVTemperatureForecast::MAXIMUM ? "Maximum: " : "Minimum: ")
                            + celsius(t.temperature) + " at " + formatInstant(t.time));
        }
        lines.push_back("");
    }

    if (!taf.getPressureForecasts().empty()) {
        lines.push_back("PRESSURE FORECAST:");
        int i = 1;
        for (int p : taf.getPressureForecasts()) {
            std::ostringstream out;
            out << "  " << i++ << ". QNH: " << std::fixed << std::setprecision(2)
                << p / 100.0 << " inHg";
            lines.push_back(out.str());
        }
        lines.push_back("");
    }

    if (!taf.getRemarks().empty())
        lines.push_back("Remarks: " + taf.getRemarks());

    trimTrailingBlanks(lines);

    if (!taf.getFieldErrors().empty())
        lines.push_back("Raw Report: " + taf.getRawText());

    AV_LOG(AV_FORMAT, AV_BULK, "described TAF " << taf.getId().str() << " in "
           << lines.size() << " lines");
    return lines;
}


std::vector<std::string> describeFailure(const std::string& raw, const av_exception& error)
{
    std::vector<std::string> lines;
    lines.push_back("Report unavailable: " + error.getMessage());
    if (!raw.empty())
        lines.push_back("Raw Report: " + raw);
    return lines;
}


std::string joinLines(const std::vector<std::string>& lines, const std::string& eol)
{
    std::string s;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i)
            s += eol;
        s += lines[i];
    }
    return s;
}

} // namespace avgear
