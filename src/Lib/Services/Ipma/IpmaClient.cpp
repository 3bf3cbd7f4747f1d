#include <format>    // std::format
#include <limits>    // std::numeric_limits
#include <utility>   // std::{move, pair}

#include "Nimbus++/Services/Ipma.hpp"
#include "Nimbus++/Utils/Error.hpp"
#include "Nimbus++/Utils/Logging.hpp"
#include "Nimbus++/Utils/Strings.hpp"
#include "Nimbus++/Utils/Types.hpp"

#include "DataTransferObjects.hpp"

using namespace nimbus::utils::types;
using enum nimbus::utils::error::NimbusErrorCode;
using nimbus::utils::strings::ToLowerCase;
using nimbus::utils::strings::Trim;

namespace {
  using nimbus::services::ipma::Locality;

  constexpr PCStr LOCALITIES_KEY    = "localities";
  constexpr PCStr WEATHER_TYPES_KEY = "weather_types";

  // Missing ids sort after every real one (IPMA globalIdLocal values already exceed 10^6).
  constexpr i64 MISSING_ID_SENTINEL = std::numeric_limits<i64>::max();

  template <typename Dto>
  fn DecodeJson(const String& body, const String& url) -> Result<Dto> {
    using glz::error_ctx, glz::read, glz::error_code;

    Dto dto {};

    if (const error_ctx errc = read<glz::opts { .error_on_unknown_keys = false }>(dto, body); errc.ec != error_code::none)
      ERR_FMT(ParseError, "Failed to parse JSON from {}: {}", url, glz::format_error(errc, body));

    return dto;
  }

  fn TieBreakKey(const Locality& loc) -> std::pair<i64, i64> {
    return {
      loc.idConcelho ? static_cast<i64>(*loc.idConcelho) : MISSING_ID_SENTINEL,
      loc.globalIdLocal.value_or(MISSING_ID_SENTINEL),
    };
  }

  template <typename Predicate>
  fn PickCandidate(const Vec<Locality>& localities, const Option<i32> districtId, Predicate&& matches) -> Option<Locality> {
    const Locality* best = nullptr;

    for (const Locality& loc : localities) {
      if (!matches(ToLowerCase(loc.local)))
        continue;

      if (districtId && loc.idDistrito != districtId)
        continue;

      // Strict comparison keeps the first of equal keys, as a stable sort would.
      if (best == nullptr || TieBreakKey(loc) < TieBreakKey(*best))
        best = &loc;
    }

    if (best == nullptr)
      return None;

    return *best;
  }
} // namespace

namespace nimbus::services::ipma {
  IpmaClient::IpmaClient(ClientConfig config, UniquePointer<IJsonFetcher> fetcher, const cache::Clock& now)
    : m_config(std::move(config)),
      m_fetcher(std::move(fetcher)),
      m_localities(m_config.localitiesTtl, now),
      m_weatherTypes(m_config.classesTtl, now),
      m_forecasts(m_config.forecastTtl, now) {
    while (m_config.baseUrl.ends_with('/'))
      m_config.baseUrl.pop_back();
  }

  fn IpmaClient::getLocalities() -> Result<Vec<Locality>> {
    return m_localities.getOrSet(LOCALITIES_KEY, [&]() -> Result<Vec<Locality>> {
      const String url  = std::format("{}/distrits-islands.json", m_config.baseUrl);
      const String body = TRY(m_fetcher->fetchJson(url));

      dto::LocalitiesResponse response = TRY(DecodeJson<dto::LocalitiesResponse>(body, url));

      debug_log("Loaded {} localities", response.data.size());

      return std::move(response.data);
    });
  }

  fn IpmaClient::getWeatherTypes() -> Result<WeatherTypeMap> {
    return m_weatherTypes.getOrSet(WEATHER_TYPES_KEY, [&]() -> Result<WeatherTypeMap> {
      const String url  = std::format("{}/weather-type-classe.json", m_config.baseUrl);
      const String body = TRY(m_fetcher->fetchJson(url));

      const dto::WeatherTypesResponse response = TRY(DecodeJson<dto::WeatherTypesResponse>(body, url));

      WeatherTypeMap mapping;

      for (const dto::WeatherType& item : response.data)
        mapping.insert_or_assign(item.idWeatherType, WeatherTypeLabel { .pt = item.descWeatherTypePT, .en = item.descWeatherTypeEN });

      return mapping;
    });
  }

  fn IpmaClient::getDailyForecast(const i64 globalIdLocal) -> Result<DailyForecast> {
    return m_forecasts.getOrSet(std::format("forecast:{}", globalIdLocal), [&]() -> Result<DailyForecast> {
      const String url  = std::format("{}/forecast/meteorology/cities/daily/{}.json", m_config.baseUrl, globalIdLocal);
      const String body = TRY(m_fetcher->fetchJson(url));

      return DecodeJson<DailyForecast>(body, url);
    });
  }

  fn IpmaClient::findLocality(const StringView name, const Option<i32> districtId) -> Result<Option<Locality>> {
    const Vec<Locality> localities = TRY(getLocalities());

    Option<Locality> found = ResolveLocality(localities, name, districtId);

    if (!found)
      debug_log("No locality matches '{}'", name);

    return found;
  }

  fn IpmaClient::getDayForecast(const i64 globalIdLocal, const StringView date) -> Result<Option<DayReport>> {
    const DailyForecast forecast = TRY(getDailyForecast(globalIdLocal));

    const Option<DayForecast> day = FindDay(forecast, date);

    if (!day)
      return None;

    const WeatherTypeMap labels = TRY(getWeatherTypes());

    const i64 reportedId = forecast.globalIdLocal.value_or(0);

    return BuildDayReport(reportedId != 0 ? reportedId : globalIdLocal, *day, labels);
  }

  fn IpmaClient::clearCaches() -> Unit {
    m_localities.clear();
    m_weatherTypes.clear();
    m_forecasts.clear();
  }

  fn ResolveLocality(const Vec<Locality>& localities, const StringView name, const Option<i32> districtId) -> Option<Locality> {
    const String needle = ToLowerCase(Trim(name));

    if (Option<Locality> exact = PickCandidate(localities, districtId, [&](const String& local) { return local == needle; }))
      return exact;

    return PickCandidate(localities, districtId, [&](const String& local) { return local.find(needle) != String::npos; });
  }
} // namespace nimbus::services::ipma
