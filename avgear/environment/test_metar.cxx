// SPDX-License-Identifier: LGPL-2.1-or-later

#include <avgear/misc/test_macros.hxx>

#include <iostream>
#include <string>

#include <avgear/structure/exception.hxx>

#include "metar.hxx"

using namespace avgear;

const double TEST_EPSILON = 1e-9;

void test_station()
{
    const char* ids[] = { "EGMC", "KJFK", "ZZZZ", "AAAA" };
    for (const char* id : ids)
        AV_CHECK_EQUAL(parseStation(id).str(), id);

    AV_VERIFY(parseStation("EGMC") == *AVStationId::parse("EGMC"));
    AV_VERIFY(!AVStationId::parse("EGM"));
    AV_VERIFY(!AVStationId::parse("EGMCX"));
    AV_VERIFY(!AVStationId::parse("egmc"));
    AV_VERIFY(!AVStationId::parse("EG1C"));
    AV_CHECK_THROW(parseStation("TAF1"), av_missing_station_exception);
}

void test_basic()
{
    AVMetar m1("METAR EGMC 201650Z 31009KT 280V360 9999 BKN019 03/M00 Q1014");
    AV_CHECK_EQUAL(m1.getReportType(), AVMetar::ROUTINE);
    AV_CHECK_EQUAL(m1.getId().str(), "EGMC");
    AV_VERIFY(m1.getObservationTime() == ReportTime(20, 16, 50));

    AV_VERIFY(m1.getWind());
    AV_CHECK_EQUAL(*m1.getWind()->direction, 310);
    AV_CHECK_EQUAL(m1.getWind()->speed, 9);
    AV_VERIFY(!m1.getWind()->gust);
    AV_VERIFY(m1.getWind()->variableBetween);
    AV_CHECK_EQUAL(m1.getWind()->variableBetween->first, 280);
    AV_CHECK_EQUAL(m1.getWind()->variableBetween->second, 360);

    AV_VERIFY(m1.getVisibility());
    AV_CHECK_EQUAL_EP2(m1.getVisibility()->distance, 9999, TEST_EPSILON);
    AV_CHECK_EQUAL(m1.getVisibility()->unit, AVVisibility::METERS);
    AV_VERIFY(m1.getVisibility()->isOpenEnded());

    AV_CHECK_EQUAL(m1.getClouds().size(), 1u);
    AV_CHECK_EQUAL(m1.getClouds()[0].coverage, AVCloudLayer::COVERAGE_BROKEN);
    AV_CHECK_EQUAL(*m1.getClouds()[0].height, 1900);

    AV_VERIFY(m1.getTemperature());
    AV_CHECK_EQUAL(m1.getTemperature()->temperature, 3);
    AV_CHECK_EQUAL(*m1.getTemperature()->dewpoint, 0);

    AV_VERIFY(m1.getAltimeter());
    AV_CHECK_EQUAL(m1.getAltimeter()->unit, AVAltimeter::HECTOPASCAL);
    AV_CHECK_EQUAL(m1.getAltimeter()->value, 1014);

    AV_VERIFY(m1.getFieldErrors().empty());
    AV_VERIFY(m1.getUnparsedTokens().empty());
    AV_CHECK_EQUAL(m1.getRawText(), "METAR EGMC 201650Z 31009KT 280V360 9999 BKN019 03/M00 Q1014");

    // negative temperature and negative dew point, no METAR keyword
    AVMetar m2("EHAM 012345Z 15005KT 9999 -SN OVC060CB SCT050TCU M20/M30 Q1005");
    AV_CHECK_EQUAL(m2.getTemperature()->temperature, -20);
    AV_CHECK_EQUAL(*m2.getTemperature()->dewpoint, -30);
    AV_CHECK_EQUAL(m2.getClouds().size(), 2u);
    AV_CHECK_EQUAL(m2.getClouds()[0].type, "CB");
    AV_CHECK_EQUAL(m2.getClouds()[1].type, "TCU");
    AV_CHECK_EQUAL(m2.getWeather().size(), 1u);
    AV_CHECK_EQUAL(m2.getWeather()[0].intensity, AVWeather::LIGHT);
    AV_CHECK_EQUAL(m2.getWeather()[0].phenomena[0], "SN");
}

void test_speci_and_modifiers()
{
    AVMetar m("SPECI KSFO 061656Z AUTO COR VRB03G15KT 1 1/2SM BR FEW008 SCT100 08/03 A3013 RMK AO2 SLP208");
    AV_CHECK_EQUAL(m.getReportType(), AVMetar::SPECIAL);
    AV_VERIFY(m.isAutomatic());
    AV_VERIFY(m.isCorrected());
    AV_VERIFY(!m.isNil());

    AV_VERIFY(m.getWind()->isVariable());
    AV_CHECK_EQUAL(m.getWind()->speed, 3);
    AV_CHECK_EQUAL(*m.getWind()->gust, 15);

    AV_CHECK_EQUAL(m.getVisibility()->unit, AVVisibility::STATUTE_MILES);
    AV_CHECK_EQUAL_EP2(m.getVisibility()->distance, 1.5, TEST_EPSILON);
    AV_CHECK_EQUAL(m.getVisibility()->text, "1 1/2SM");

    AV_CHECK_EQUAL(m.getWeather()[0].phenomena[0], "BR");
    AV_CHECK_EQUAL(m.getClouds().size(), 2u);

    AV_CHECK_EQUAL(m.getAltimeter()->unit, AVAltimeter::INCHES_HG);
    AV_CHECK_EQUAL_EP2(m.getAltimeter()->inHg(), 30.13, 1e-6);
    AV_CHECK_EQUAL(m.getRemarks(), "AO2 SLP208");
}

void test_nil()
{
    AVMetar m("METAR EGMC 201650Z NIL");
    AV_VERIFY(m.isNil());
    AV_VERIFY(!m.getWind());
    AV_VERIFY(!m.getTemperature());
}

void test_wind_units()
{
    // 5 MPS is 9.7 knots, 20 KMH is 10.8 knots
    AVMetar m1("UUEE 201650Z 27005MPS 9999 SKC 10/05 Q1025");
    AV_CHECK_EQUAL(m1.getWind()->speed, 10);
    AV_CHECK_EQUAL(m1.getSkyClear(), "SKC");

    AVMetar m2("UUEE 201650Z 27020G30KMH 9999 NSC 10/05 Q1025");
    AV_CHECK_EQUAL(m2.getWind()->speed, 11);
    AV_CHECK_EQUAL(*m2.getWind()->gust, 16);

    AVMetar m3("EGMC 201650Z 00000KT CAVOK 10/05 Q1025");
    AV_VERIFY(m3.getWind()->isCalm());
    AV_VERIFY(m3.getVisibility()->cavok);
}

void test_malformed_wind()
{
    AVMetar m("METAR EGMC 201650Z XXXKT 9999 BKN019 03/M00 Q1014");
    AV_CHECK_EQUAL(m.getId().str(), "EGMC");
    AV_VERIFY(m.getObservationTime() == ReportTime(20, 16, 50));
    AV_VERIFY(!m.getWind());
    AV_VERIFY(m.getVisibility());
    AV_CHECK_EQUAL_EP2(m.getVisibility()->distance, 9999, TEST_EPSILON);
    AV_CHECK_EQUAL(m.getClouds().size(), 1u);
    AV_VERIFY(m.getTemperature());
    AV_VERIFY(m.getAltimeter());

    AV_CHECK_EQUAL(m.getFieldErrors().size(), 1u);
    AV_CHECK_EQUAL(m.getFieldErrors()[0].getField(), "wind");
    AV_CHECK_EQUAL(m.getFieldErrors()[0].getText(), "XXXKT");
    AV_CHECK_EQUAL(m.getFieldErrors()[0].getLocation().getToken(), 3);
}

void test_gust_not_above_speed()
{
    AVMetar m("EGMC 201650Z 31020G15KT 9999 03/M00 Q1014");
    AV_CHECK_EQUAL(m.getWind()->speed, 20);
    AV_CHECK_EQUAL(*m.getWind()->gust, 15);
    AV_CHECK_EQUAL(m.getFieldErrors().size(), 1u);
}

void test_sensor_failure()
{
    AVMetar m1("EHAM 201125Z 27012KT 240V300 9999 // FEW025CB SCT048 10/05 Q1025");
    AV_CHECK_EQUAL(*m1.getWind()->direction, 270);
    AV_CHECK_EQUAL(m1.getWeather().size(), 0u);
    AV_CHECK_EQUAL(m1.getClouds().size(), 2u);

    AVMetar m2("LIMH 111955Z AUTO /////KT //// ///// Q////");
    AV_VERIFY(!m2.getWind());
    AV_VERIFY(!m2.getVisibility());
    AV_VERIFY(!m2.getTemperature());
    AV_VERIFY(!m2.getAltimeter());
    AV_VERIFY(m2.getFieldErrors().empty());

    AVMetar m3("EGMC 201650Z 31009KT 9999 BKN/// FEW045/// 03/// Q1014");
    AV_CHECK_EQUAL(m3.getClouds().size(), 2u);
    AV_VERIFY(!m3.getClouds()[0].height);
    AV_CHECK_EQUAL(*m3.getClouds()[1].height, 4500);
    AV_CHECK_EQUAL(m3.getTemperature()->temperature, 3);
    AV_VERIFY(!m3.getTemperature()->dewpoint);
}

void test_trend_and_unparsed()
{
    AVMetar m("EHAM 201125Z 27012KT 9999 R18/P1500 VCSH FEW025 10/05 Q1025 TEMPO 4000 SHRA RMK NOTE");
    AV_CHECK_EQUAL(m.getTrend(), "TEMPO 4000 SHRA");
    AV_CHECK_EQUAL(m.getRemarks(), "NOTE");
    AV_CHECK_EQUAL(m.getUnparsedTokens().size(), 1u);
    AV_CHECK_EQUAL(m.getUnparsedTokens()[0], "R18/P1500");
    AV_VERIFY(m.getWeather()[0].vicinity);

    // trend groups do not overwrite the observation
    AV_CHECK_EQUAL_EP2(m.getVisibility()->distance, 9999, TEST_EPSILON);
}

void test_receipt_time()
{
    AVMetar m("EGMC 201650Z 31009KT 9999 03/M00 Q1014");
    AV_VERIFY(!m.getReceiptTime());
    m.setReceiptTime("2024-03-20T16:52:00Z");
    AV_CHECK_EQUAL(*m.getReceiptTime(), "2024-03-20T16:52:00Z");
}

void test_failures()
{
    AV_CHECK_THROW(AVMetar(""), av_empty_input_exception);
    AV_CHECK_THROW(AVMetar("   "), av_empty_input_exception);
    AV_CHECK_THROW(AVMetar("METAR"), av_missing_station_exception);
    AV_CHECK_THROW(AVMetar("METAR EG1C 201650Z"), av_missing_station_exception);
    AV_CHECK_THROW(AVMetar("METAR EGMC"), av_missing_time_exception);
    AV_CHECK_THROW(AVMetar("METAR EGMC 31009KT 9999"), av_missing_time_exception);
    AV_CHECK_THROW(AVMetar("METAR EGMC 2016Z 31009KT"), av_malformed_time_exception);
    AV_CHECK_THROW(AVMetar("METAR EGMC 206650Z 31009KT"), av_malformed_time_exception);

    // all of them are av_exceptions
    AV_CHECK_THROW(AVMetar("METAR"), av_exception);
}

void test_time_error_location()
{
    try {
        AVMetar m("METAR EGMC 206650Z 31009KT");
        AV_TEST_FAIL("hour 66 accepted");
    } catch (av_malformed_time_exception& e) {
        AV_CHECK_EQUAL(e.getLocation().getToken(), 2);
        AV_CHECK_EQUAL(e.getLocation().getColumn(), 11);
        AV_CHECK_EQUAL(e.getOrigin(), "AVMetar");
        AV_CHECK_EQUAL(e.getText(), "206650Z");
        AV_VERIFY(e.getMessage().find("at token 2") != std::string::npos);
    }

    // a group with punctuation is never a time group
    AV_CHECK_THROW(AVMetar("METAR EGMC 20/650Z 31009KT"), av_missing_time_exception);

    // "1 1/2SM" needs whole miles made only of digits
    AVMetar m("METAR KSFO 061656Z 31009KT 1A 1/2SM 08/03 A3013");
    AV_VERIFY(!m.getVisibility() || m.getVisibility()->text != "1A 1/2SM");
}

int main(int argc, char* argv[])
{
    try {
        test_station();
        test_basic();
        test_speci_and_modifiers();
        test_nil();
        test_wind_units();
        test_malformed_wind();
        test_gust_not_above_speed();
        test_sensor_failure();
        test_trend_and_unparsed();
        test_receipt_time();
        test_failures();
        test_time_error_location();
    } catch (av_exception& e) {
        std::cerr << "Exception: " << e.getFormattedMessage() << std::endl;
        return -1;
    }

    std::cout << "all tests passed" << std::endl;
    return 0;
}
