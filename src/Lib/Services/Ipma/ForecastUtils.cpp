#include <algorithm> // std::ranges::find_if
#include <cmath>     // std::isfinite
#include <limits>    // std::numeric_limits
#include <variant>   // std::{get_if, holds_alternative}

#include "Nimbus++/Services/Ipma.hpp"
#include "Nimbus++/Utils/Logging.hpp"
#include "Nimbus++/Utils/Strings.hpp"
#include "Nimbus++/Utils/Types.hpp"

using namespace nimbus::utils::types;
using nimbus::utils::strings::ParseNumber;

namespace {
  // IPMA's own code for "no information".
  constexpr i32 UNKNOWN_WEATHER_TYPE = -99;

  fn AsInteger(const Option<nimbus::services::ipma::FieldValue>& value) -> Option<i32> {
    const Option<f64> number = nimbus::services::ipma::AsNumber(value);

    if (!number || !std::isfinite(*number))
      return None;

    if (*number < std::numeric_limits<i32>::min() || *number > std::numeric_limits<i32>::max())
      return None;

    return static_cast<i32>(*number);
  }
} // namespace

namespace nimbus::services::ipma {
  fn CoerceToNumber(Option<FieldValue>& value) -> Unit {
    if (!value)
      return;

    const String* text = std::get_if<String>(&*value);

    if (text == nullptr)
      return;

    if (const Option<f64> number = ParseNumber<f64>(*text))
      *value = *number;
    else
      debug_log("Leaving non-numeric value '{}' as is", *text);
  }

  fn AsNumber(const Option<FieldValue>& value) -> Option<f64> {
    if (!value)
      return None;

    if (const f64* number = std::get_if<f64>(&*value))
      return *number;

    return ParseNumber<f64>(std::get<String>(*value));
  }

  fn NormalizeForecast(DailyForecast& forecast) -> Unit {
    for (DayForecast& day : forecast.data) {
      CoerceToNumber(day.tMin);
      CoerceToNumber(day.tMax);
      CoerceToNumber(day.precipitaProb);
      CoerceToNumber(day.latitude);
      CoerceToNumber(day.longitude);
    }
  }

  fn FindDay(const DailyForecast& forecast, const StringView date) -> Option<DayForecast> {
    const auto iter = std::ranges::find_if(forecast.data, [date](const DayForecast& day) { return day.forecastDate == date; });

    if (iter == forecast.data.end())
      return None;

    return *iter;
  }

  fn BuildDayReport(const i64 globalIdLocal, const DayForecast& day, const WeatherTypeMap& labels) -> DayReport {
    DayReport report {
      .globalIdLocal = globalIdLocal,
      .forecastDate  = day.forecastDate,
      .tMin          = AsNumber(day.tMin),
      .tMax          = AsNumber(day.tMax),
      .precipitaProb = AsNumber(day.precipitaProb),
      .predWindDir   = day.predWindDir,
      .weather       = { .id = AsInteger(day.idWeatherType).value_or(UNKNOWN_WEATHER_TYPE) },
      .wind          = { .windClass = AsInteger(day.classWindSpeed), .dir = day.predWindDir },
    };

    if (const auto iter = labels.find(report.weather.id); iter != labels.end()) {
      report.weather.pt = iter->second.pt;
      report.weather.en = iter->second.en;
    }

    return report;
  }
} // namespace nimbus::services::ipma
