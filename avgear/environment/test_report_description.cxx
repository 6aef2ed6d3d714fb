// SPDX-License-Identifier: LGPL-2.1-or-later

#include <avgear/misc/test_macros.hxx>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include <avgear/structure/exception.hxx>

#include "metar.hxx"
#include "report_description.hxx"
#include "taf.hxx"

using namespace avgear;

namespace {

bool contains(const std::vector<std::string>& lines, const std::string& line)
{
    return std::find(lines.begin(), lines.end(), line) != lines.end();
}

bool startsWith(const std::string& s, const std::string& prefix)
{
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // anonymous namespace

void test_metar_lines()
{
    AVMetar m("METAR EGMC 201650Z 31009KT 280V360 9999 BKN019 03/M00 Q1014");
    const std::vector<std::string> lines = m.getDescriptionLines();

    const std::vector<std::string> expected = {
        "Report Type: METAR (routine)",
        "Station: EGMC",
        "Observation Day: 20th",
        "Observation Time: 16:50Z",
        "Wind: 310\xc2\xb0 at 9 KT (varying between 280\xc2\xb0 and 360\xc2\xb0)",
        "Visibility: 10 km or more",
        "Clouds:",
        "  - Broken at 1900 feet",
        "Temperature/Dewpoint: 3\xc2\xb0" "C/0\xc2\xb0" "C",
        "Altimeter: 1014 hPa"
    };
    AV_CHECK_EQUAL(lines.size(), expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i)
        AV_CHECK_EQUAL(lines[i], expected[i]);

    // exactly one observation time line
    int timeLines = 0;
    for (const auto& l : lines) {
        if (startsWith(l, "Observation Time"))
            ++timeLines;
    }
    AV_CHECK_EQUAL(timeLines, 1);
}

void test_metar_unset_fields()
{
    AVMetar m("SPECI EGMC 201650Z XXXKT 4000 -SHRA FEW010CB");
    const std::vector<std::string> lines = m.getDescriptionLines();

    AV_CHECK_EQUAL(lines[0], "Report Type: SPECI (special)");
    AV_VERIFY(contains(lines, "Wind: not reported"));
    AV_VERIFY(contains(lines, "Visibility: 4000 meters"));
    AV_VERIFY(contains(lines, "Weather: Light Showers Rain"));
    AV_VERIFY(contains(lines, "  - Few at 1000 feet (Cumulonimbus)"));
    AV_VERIFY(contains(lines, "Temperature/Dewpoint: not reported"));
    AV_CHECK_EQUAL(lines.back(), "Raw Report: SPECI EGMC 201650Z XXXKT 4000 -SHRA FEW010CB");

    for (const auto& l : lines)
        AV_VERIFY(!startsWith(l, "Altimeter"));
}

void test_metar_extras()
{
    AVMetar m("KSFO 061656Z VRB03G15KT M1/4SM +TSRA VV/// 08/03 A2992 NOSIG RMK AO2");
    const std::vector<std::string> lines = m.getDescriptionLines();

    AV_VERIFY(contains(lines, "Wind: Variable at 3 KT gusting to 15 KT"));
    AV_VERIFY(contains(lines, "Visibility: less than 1/4 statute mile"));
    AV_VERIFY(contains(lines, "Weather: Heavy Thunderstorm Rain"));
    AV_VERIFY(contains(lines, "  - Vertical Visibility at unknown height"));
    AV_VERIFY(contains(lines, "Altimeter: 29.92 inHg"));
    AV_VERIFY(contains(lines, "Trend: NOSIG"));
    AV_VERIFY(contains(lines, "Remarks: AO2"));

    AVMetar c("EGMC 201650Z 00000KT CAVOK 10/05 Q1025");
    const std::vector<std::string> clines = c.getDescriptionLines();
    AV_VERIFY(contains(clines, "Wind: Calm"));
    AV_VERIFY(contains(clines, "Visibility: CAVOK"));

    AVMetar p("KJFK 061656Z 18010KT P6SM SKC 20/10 A3001");
    AV_VERIFY(contains(p.getDescriptionLines(), "Visibility: 6 statute miles or more"));
    AV_VERIFY(contains(p.getDescriptionLines(), "  - Sky Clear"));
}

void test_taf_lines()
{
    AVTaf t("TAF EGMC 201701Z 2018/2102 32012KT 9999 BKN018 PROB30 TEMPO 2018/2020 BKN014 "
            "TEMPO 2020/2102 BKN012");
    const std::vector<std::string> lines = t.getDescriptionLines();

    const std::vector<std::string> expected = {
        "Station: EGMC",
        "Issue Date: 20th",
        "Issue Time: 17:01Z",
        "Valid From: 18:00Z on 20th",
        "Valid To: 02:00Z on 21st",
        "",
        "BASE FORECAST:",
        "  Wind: 320\xc2\xb0 at 12 KT",
        "  Visibility: 10 km or more",
        "  Clouds:",
        "    - Broken at 1800 feet",
        "",
        "FORECAST CHANGES:",
        "  1. PROB30 TEMPORARY 18:00Z to 20:00Z:",
        "     Clouds:",
        "       - Broken at 1400 feet",
        "",
        "  2. TEMPORARY 20:00Z on 20th to 02:00Z on 21st:",
        "     Clouds:",
        "       - Broken at 1200 feet"
    };
    AV_CHECK_EQUAL(lines.size(), expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i)
        AV_CHECK_EQUAL(lines[i], expected[i]);

    for (const auto& l : lines) {
        AV_VERIFY(l.find("N/A") == std::string::npos);
        AV_VERIFY(l.find("2018 to 2102") == std::string::npos);
    }
}

void test_taf_blocks()
{
    AVTaf t("TAF AMD ZZZZ 201100Z 2012/2118 24015KT 9999 WS020/24045KT "
            "TX15/2014Z TNM02/2106Z QNH2992INS FM201800 27010KT "
            "BECMG BKN010 AMD NOT SKED RMK NXT FCST BY 18Z");
    const std::vector<std::string> lines = t.getDescriptionLines();

    AV_VERIFY(contains(lines, "Type: AMENDED, AMD NOT SKED (Updates not scheduled)"));
    AV_VERIFY(contains(lines, "  Wind Shear: Wind shear at 2000 feet: 240\xc2\xb0 at 45 KT"));
    AV_VERIFY(contains(lines, "  1. FROM 18:00Z on 20th:"));
    AV_VERIFY(contains(lines, "  2. BECOMING period not specified:"));
    AV_VERIFY(contains(lines, "TEMPERATURE FORECAST:"));
    AV_VERIFY(contains(lines, "  Maximum: 15\xc2\xb0" "C at 14:00Z on 20th"));
    AV_VERIFY(contains(lines, "  Minimum: -2\xc2\xb0" "C at 06:00Z on 21st"));
    AV_VERIFY(contains(lines, "PRESSURE FORECAST:"));
    AV_VERIFY(contains(lines, "  1. QNH: 29.92 inHg"));
    AV_VERIFY(contains(lines, "Remarks: NXT FCST BY 18Z"));
    AV_CHECK_EQUAL(lines.back(), "Raw Report: " + t.getRawText());
}

void test_taf_nil()
{
    AVTaf t("TAF EGMC 201701Z NIL");
    const std::vector<std::string> lines = t.getDescriptionLines();
    AV_CHECK_EQUAL(lines[0], "Station: EGMC");
    AV_VERIFY(contains(lines, "Type: NIL (Forecast Suspended)"));
    AV_VERIFY(!lines.back().empty());
}

void test_metar_nil()
{
    AVMetar m("METAR EGMC 201650Z NIL");
    const std::vector<std::string> lines = m.getDescriptionLines();
    AV_CHECK_EQUAL(lines[0], "Report Type: METAR (routine), NIL (Missing Report)");
    AV_VERIFY(contains(lines, "Station: EGMC"));
    AV_VERIFY(contains(lines, "Wind: not reported"));
    AV_VERIFY(contains(lines, "Temperature/Dewpoint: not reported"));
    AV_CHECK_EQUAL(lines.back(), "Temperature/Dewpoint: not reported");
}

void test_idempotence()
{
    AVMetar m("METAR EGMC 201650Z 31009KT 280V360 9999 BKN019 03/M00 Q1014");
    AV_CHECK_EQUAL(m.getDescription(), m.getDescription());

    AVTaf t("TAF EGMC 201701Z 2018/2102 32012KT 9999 BKN018 PROB30 TEMPO 2018/2020 BKN014");
    const std::string first = t.getDescription();
    AV_CHECK_EQUAL(first, t.getDescription());

    AVTaf copy = t;
    AV_CHECK_EQUAL(first, copy.getDescription());
}

void test_line_terminator()
{
    AVMetar m("EGMC 201650Z 31009KT 9999 03/M00 Q1014");
    const std::string crlf = m.getDescription("\r\n");
    AV_VERIFY(crlf.find("Station: EGMC\r\nObservation Day: 20th") != std::string::npos);
    AV_CHECK_EQUAL(joinLines({ "a", "b", "c" }, "<br>"), "a<br>b<br>c");
    AV_CHECK_EQUAL(joinLines({}), "");
}

void test_failure()
{
    const std::string raw = "METAR 201650Z 31009KT";
    try {
        AVMetar m(raw);
        AV_TEST_FAIL("no exception");
    } catch (const av_exception& e) {
        const std::vector<std::string> lines = describeFailure(raw, e);
        AV_CHECK_EQUAL(lines.size(), 2u);
        AV_VERIFY(startsWith(lines[0], "Report unavailable: station identifier missing"));
        AV_CHECK_EQUAL(lines[1], "Raw Report: " + raw);
    }

    try {
        AVTaf t("");
        AV_TEST_FAIL("no exception");
    } catch (const av_exception& e) {
        const std::vector<std::string> lines = describeFailure("", e);
        AV_CHECK_EQUAL(lines.size(), 1u);
        AV_CHECK_EQUAL(lines[0], "Report unavailable: empty report");
    }
}

int main(int argc, char* argv[])
{
    try {
        test_metar_lines();
        test_metar_unset_fields();
        test_metar_extras();
        test_taf_lines();
        test_taf_blocks();
        test_taf_nil();
        test_metar_nil();
        test_idempotence();
        test_line_terminator();
        test_failure();
    } catch (av_exception& e) {
        std::cerr << "Exception: " << e.getFormattedMessage() << std::endl;
        return -1;
    }

    std::cout << "all tests passed" << std::endl;
    return 0;
}
