// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Plain text rendering of decoded METAR and TAF reports.
 *
 * Output depends on nothing but the record: no locale, no clock. Unset
 * fields are left out, except wind and temperature of an observation,
 * which are shown as "not reported".
 */

#pragma once

#include <string>
#include <vector>

#include <avgear/environment/report_fields.hxx>

class av_exception;

namespace avgear {

class AVMetar;
class AVTaf;

std::vector<std::string> describeMetar(const AVMetar& metar);
std::vector<std::string> describeTaf(const AVTaf& taf);

/**
 * The unavailable state shown when a report could not be parsed at all:
 * "Report unavailable: <message>" followed by the raw text, if any.
 */
std::vector<std::string> describeFailure(const std::string& raw, const av_exception& error);

/// "310° at 9 KT gusting to 20 KT (varying between 280° and 360°)"
std::string describeWind(const AVWind& wind);

/// "10 km or more", "4000 meters", "1 1/2 statute miles", "CAVOK"
std::string describeVisibility(const AVVisibility& vis);

/// "Light Showers Rain", "In the vicinity Thunderstorm"
std::string describeWeather(const AVWeather& weather);

/// "Broken at 1900 feet (Cumulonimbus)"
std::string describeCloudLayer(const AVCloudLayer& layer);

std::string joinLines(const std::vector<std::string>& lines, const std::string& eol = "\n");

} // namespace avgear
