// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Field groups shared by METAR and TAF reports.
 *
 * Wind, visibility, present weather, cloud layers and wind shear are
 * encoded the same way in an observation, in a TAF base forecast and in
 * every TAF change group. FieldScanner decodes them from a TokenCursor.
 *
 * @see WMO-49 Volume II, Table A3-2 (METAR/SPECI) and Table A5-1 (TAF)
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <avgear/debug/debug_types.h>
#include <avgear/structure/exception.hxx>

namespace avgear {

class ReportToken;
class TokenCursor;

/**
 * Four letter ICAO location indicator.
 */
class AVStationId
{
public:
    AVStationId() = default;

    /// empty optional unless token is exactly four upper-case letters
    static std::optional<AVStationId> parse(const std::string& token);

    const std::string& str() const { return _id; }
    bool empty() const { return _id.empty(); }

    bool operator==(const AVStationId& o) const { return _id == o._id; }

private:
    explicit AVStationId(const std::string& id) : _id(id) {}

    std::string _id;
};

/**
 * Parse a station group, throwing av_missing_station_exception if it
 * is not four upper-case letters.
 */
AVStationId parseStation(const std::string& token);


/**
 * Surface wind, speeds normalised to knots.
 */
struct AVWind
{
    std::optional<int> direction;                  ///< degrees true, unset for VRB
    int speed = 0;                                 ///< knots
    std::optional<int> gust;                       ///< knots
    std::optional<std::pair<int, int> > variableBetween;

    bool isVariable() const { return !direction; }
    bool isCalm() const { return direction && *direction == 0 && speed == 0; }
};


struct AVVisibility
{
    enum Unit { METERS, STATUTE_MILES };
    enum Modifier { EQUALS, GREATER_THAN, LESS_THAN };

    double distance = 0.0;      ///< in unit
    Unit unit = METERS;
    Modifier modifier = EQUALS;
    bool cavok = false;
    std::string text;           ///< as encoded, "9999", "1 1/2SM", "CAVOK"

    /// "10 km or more", "6 SM or more"
    bool isOpenEnded() const { return modifier == GREATER_THAN; }
};


/**
 * One present weather group, e.g. "-SHRA" or "VCTS".
 */
struct AVWeather
{
    enum Intensity { LIGHT, MODERATE, HEAVY };

    Intensity intensity = MODERATE;
    bool vicinity = false;
    bool noSignificantWeather = false;
    std::vector<std::string> descriptors;   ///< "SH", "TS", ...
    std::vector<std::string> phenomena;     ///< "RA", "BR", ...
    std::string text;
};


struct AVCloudLayer
{
    enum Coverage {
        COVERAGE_FEW,
        COVERAGE_SCATTERED,
        COVERAGE_BROKEN,
        COVERAGE_OVERCAST,
        COVERAGE_VERTICAL_VISIBILITY
    };

    Coverage coverage = COVERAGE_FEW;
    std::optional<int> height;  ///< feet above aerodrome level, unset for "///"
    std::string type;           ///< "CB", "TCU" or empty
};


struct AVWindShear
{
    int height = 0;             ///< feet
    AVWind wind;
};


/**
 * The wind/visibility/weather/cloud part of a report. In a TAF change
 * group an unset member means "unchanged from the base forecast".
 */
struct AVConditions
{
    std::optional<AVWind> wind;
    std::optional<AVVisibility> visibility;
    std::vector<AVWeather> weather;
    std::vector<AVCloudLayer> clouds;
    std::string skyClear;       ///< "NSC", "SKC", "CLR" or "NCD" if reported
    std::optional<AVWindShear> windShear;
    std::vector<std::string> unparsed;  ///< groups that fit no field, in order

    bool empty() const;
};


/**
 * Decodes field groups at the current cursor position.
 *
 * Every scan method returns true if it consumed the current group. A
 * group whose shape belongs to the field but which cannot be decoded is
 * consumed as well: the field stays unset and an
 * av_malformed_field_exception is appended to the error list.
 */
class FieldScanner
{
public:
    typedef std::vector<av_malformed_field_exception> ErrorList;

    FieldScanner(TokenCursor& cursor, ErrorList& errors, avDebugClass logClass);

    /// (\d{3}|VRB)\d{2,3}(G\d{2,3})?(KT|MPS|KMH)
    bool scanWind(AVConditions& c);

    /// \d{3}V\d{3}, only directly after a wind group
    bool scanVariability(AVConditions& c);

    /// \d{4}(NDV|N|NE|...)?, CAVOK, [PM]?(\d+ )?\d+(/\d+)?SM
    bool scanVisibility(AVConditions& c);

    /// (-|+|VC)?(descriptor){0,2}(phenomenon){0,3}, NSW
    bool scanWeather(AVConditions& c);

    /// (FEW|SCT|BKN|OVC)(\d{3}|///)(CB|TCU)?, VV(\d{3}|///), NSC/SKC/CLR/NCD
    bool scanSkyCondition(AVConditions& c);

    /// WS\d{3}/wind
    bool scanWindShear(AVConditions& c);

    /**
     * Try every field in turn, for the free-order groups of a TAF.
     * Returns false if the current group fits none of them.
     */
    bool scanAny(AVConditions& c);

    /// record a malformed field and consume the current group
    void reportMalformed(const char* field, const std::string& message);

private:
    bool parseWind(const std::string& text, AVWind& wind, std::string& problem) const;

    TokenCursor& _cursor;
    ErrorList& _errors;
    avDebugClass _logClass;
    bool _afterWind = false;
};


/**
 * Decimal digits from *src, at least min and at most max of them.
 * Advances *src past the digits and returns the count, or 0 if fewer
 * than min digits were found.
 */
int scanNumber(const char** src, int* num, int min, int max = 0);

/// description words, "Broken", "Light", "Showers", ...
const char* coverageName(AVCloudLayer::Coverage c);
const char* cloudTypeName(const std::string& type);
const char* weatherCodeName(const std::string& code);
const char* skyClearName(const std::string& code);

} // namespace avgear
