// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Interface for encoded Terminal Aerodrome Forecasts (TAF).
 *
 * @see WMO-49 Volume II, Table A5-1 (Template for TAF)
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <avgear/environment/report_fields.hxx>
#include <avgear/timing/report_time.hxx>

namespace avgear {

class ReportToken;
class TokenCursor;

/**
 * One FM, BECMG, TEMPO or PROBnn TEMPO group. Conditions left unset
 * are unchanged from the base forecast.
 */
struct AVForecastChange
{
    enum Kind { FROM, BECOMING, TEMPORARY, PROBABLE_TEMPORARY };

    Kind kind = FROM;
    std::optional<int> probability;     ///< 30 or 40, PROBABLE_TEMPORARY only
    std::optional<ReportTime> start;
    std::optional<ReportTime> end;      ///< never set for FROM
    AVConditions conditions;

    /// "FROM", "BECOMING", "TEMPORARY", "PROB30 TEMPORARY"
    std::string label() const;

    /// true if the group's own period could be decoded
    bool hasPeriod() const { return start.has_value(); }
};


/**
 * TX or TN group: forecast maximum or minimum temperature.
 */
struct AVTemperatureForecast
{
    enum Kind { MAXIMUM, MINIMUM };

    Kind kind = MAXIMUM;
    int temperature = 0;        ///< degrees Celsius
    ReportTime time;
};


/**
 * A decoded TAF.
 *
 * The station and the issue time are mandatory, and so is the validity
 * period unless the forecast is NIL. The constructor throws if any of
 * these is missing or malformed; every other group that cannot be
 * decoded is listed in getFieldErrors().
 */
class AVTaf
{
public:
    /**
     * @param t     forecast string, optionally prefixed with TAF
     *
     * @par Examples:
     * @code
     * AVTaf t("TAF EGMC 201701Z 2018/2102 32012KT 9999 BKN018 TEMPO 2020/2102 BKN012");
     * for (const auto& g : t.getChanges())
     *     std::cout << g.label() << std::endl;
     * @endcode
     */
    explicit AVTaf(const std::string& t);

    const AVStationId& getId() const { return _id; }
    const ReportTime& getIssueTime() const { return _issue_time; }

    /// unset only for NIL forecasts
    const std::optional<ValidityPeriod>& getValidity() const { return _validity; }

    bool isAmended() const { return _amended; }
    bool isCorrected() const { return _corrected; }
    bool isAutomatic() const { return _auto; }
    bool isNil() const { return _nil; }

    /// AMD NOT SKED: amendments are not scheduled
    bool isAmendmentNotScheduled() const { return _amd_not_sked; }

    const AVConditions& getBaseForecast() const { return _base; }
    const std::vector<AVForecastChange>& getChanges() const { return _changes; }
    const std::vector<AVTemperatureForecast>& getTemperatureForecasts() const { return _temperatures; }

    /// QNHnnnnINS groups, in inHg * 100
    const std::vector<int>& getPressureForecasts() const { return _pressures; }

    const std::string& getRemarks() const { return _remarks; }
    const FieldScanner::ErrorList& getFieldErrors() const { return _errors; }
    const std::string& getRawText() const { return _raw; }

    std::vector<std::string> getDescriptionLines() const;
    std::string getDescription(const std::string& eol = "\n") const;

private:
    void scanHeader(TokenCursor& c);
    void scanId(TokenCursor& c);
    void scanIssueTime(TokenCursor& c);
    void scanValidity(TokenCursor& c);
    bool scanChangeIntroducer(TokenCursor& c, FieldScanner& fields);
    void scanGroupPeriod(TokenCursor& c, FieldScanner& fields, AVForecastChange& change);
    bool scanTemperatureForecast(TokenCursor& c, FieldScanner& fields);
    bool scanPressureForecast(TokenCursor& c, FieldScanner& fields);
    bool scanAmendmentNotice(TokenCursor& c);
    bool scanRemark(TokenCursor& c);

    AVConditions& current() { return _changes.empty() ? _base : _changes.back().conditions; }

    std::string _raw;
    AVStationId _id;
    ReportTime _issue_time;
    std::optional<ValidityPeriod> _validity;
    bool _amended = false;
    bool _corrected = false;
    bool _auto = false;
    bool _nil = false;
    bool _amd_not_sked = false;

    AVConditions _base;
    std::vector<AVForecastChange> _changes;
    std::vector<AVTemperatureForecast> _temperatures;
    std::vector<int> _pressures;
    std::string _remarks;

    FieldScanner::ErrorList _errors;
};

} // namespace avgear
