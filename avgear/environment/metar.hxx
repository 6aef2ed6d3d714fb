// SPDX-License-Identifier: LGPL-2.1-or-later

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

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <avgear/environment/report_fields.hxx>
#include <avgear/timing/report_time.hxx>

namespace avgear {

class TokenCursor;

struct AVTemperature
{
    int temperature = 0;            ///< degrees Celsius
    std::optional<int> dewpoint;    ///< unset for "//" or "XX"
};


struct AVAltimeter
{
    enum Unit { HECTOPASCAL, INCHES_HG };

    Unit unit = HECTOPASCAL;
    int value = 0;                  ///< hPa, or inHg * 100

    double inHg() const { return value / 100.0; }
};


/**
 * A decoded METAR or SPECI observation.
 *
 * Only the station and the observation time are mandatory; the
 * constructor throws if either is missing or malformed. Every other
 * group that cannot be decoded is left unset and listed in
 * getFieldErrors().
 */
class AVMetar
{
public:
    enum ReportType { ROUTINE, SPECIAL };

    /**
     * @param m     metar string, optionally prefixed with METAR or SPECI
     *
     * @par Examples:
     * @code
     * AVMetar m("METAR EGMC 201650Z 31009KT 280V360 9999 BKN019 03/M00 Q1014");
     * int t = m.getTemperature()->temperature;
     * @endcode
     */
    explicit AVMetar(const std::string& m);

    ReportType getReportType() const { return _report_type; }
    const AVStationId& getId() const { return _id; }
    const ReportTime& getObservationTime() const { return _time; }

    bool isAutomatic() const { return _auto; }
    bool isCorrected() const { return _corrected; }
    bool isNil() const { return _nil; }

    const std::optional<AVWind>& getWind() const { return _conditions.wind; }
    const std::optional<AVVisibility>& getVisibility() const { return _conditions.visibility; }
    const std::vector<AVWeather>& getWeather() const { return _conditions.weather; }
    const std::vector<AVCloudLayer>& getClouds() const { return _conditions.clouds; }
    const std::string& getSkyClear() const { return _conditions.skyClear; }
    const std::optional<AVWindShear>& getWindShear() const { return _conditions.windShear; }
    const AVConditions& getConditions() const { return _conditions; }

    const std::optional<AVTemperature>& getTemperature() const { return _temperature; }
    const std::optional<AVAltimeter>& getAltimeter() const { return _altimeter; }

    /// trend forecast following NOSIG, BECMG or TEMPO, as encoded
    const std::string& getTrend() const { return _trend; }

    /// everything after RMK, as encoded
    const std::string& getRemarks() const { return _remarks; }

    const std::vector<std::string>& getUnparsedTokens() const { return _conditions.unparsed; }
    const FieldScanner::ErrorList& getFieldErrors() const { return _errors; }

    const std::string& getRawText() const { return _raw; }

    /**
     * Time the report was received, as supplied by whoever fetched it.
     * Never derived from the report itself.
     */
    const std::optional<std::string>& getReceiptTime() const { return _receipt_time; }
    void setReceiptTime(const std::string& t) { _receipt_time = t; }

    std::vector<std::string> getDescriptionLines() const;
    std::string getDescription(const std::string& eol = "\n") const;

private:
    bool scanType(TokenCursor& c);
    void scanId(TokenCursor& c);
    void scanDate(TokenCursor& c);
    bool scanModifier(TokenCursor& c);
    bool scanTemperature(TokenCursor& c, FieldScanner& fields);
    bool scanPressure(TokenCursor& c, FieldScanner& fields);
    bool scanTrendForecast(TokenCursor& c);
    bool scanRemark(TokenCursor& c);

    std::string _raw;
    ReportType _report_type = ROUTINE;
    AVStationId _id;
    ReportTime _time;
    bool _auto = false;
    bool _corrected = false;
    bool _nil = false;

    AVConditions _conditions;
    std::optional<AVTemperature> _temperature;
    std::optional<AVAltimeter> _altimeter;
    std::string _trend;
    std::string _remarks;

    FieldScanner::ErrorList _errors;
    std::optional<std::string> _receipt_time;
};

} // namespace avgear
