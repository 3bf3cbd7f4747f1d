#pragma once

#include <format>  // std::format
#include <utility> // std::move

#include <Nimbus++/Services/Ipma.hpp>
#include <Nimbus++/Utils/Error.hpp>
#include <Nimbus++/Utils/Types.hpp>

// Canned IPMA payloads and an in-memory fetcher shared by the client and route tests.
namespace nimbus::fixtures {
  namespace types = ::nimbus::utils::types;

  inline constexpr types::PCStr BASE_URL = "https://ipma.test/open-data";

  inline constexpr types::PCStr LOCALITIES_JSON = R"json({
    "owner": "IPMA",
    "country": "PT",
    "data": [
      { "idRegiao": 3, "idAreaAviso": "MPS", "idConcelho": 1, "globalIdLocal": 3420300, "latitude": "33.0700", "idDistrito": 42, "local": "Porto Santo", "longitude": "-16.3400" },
      { "idRegiao": 1, "idAreaAviso": "PTO", "idConcelho": 12, "globalIdLocal": 1131200, "latitude": "41.1580", "idDistrito": 13, "local": "Porto", "longitude": "-8.6294" },
      { "idRegiao": 1, "idAreaAviso": "LSB", "idConcelho": 6, "globalIdLocal": 1110600, "latitude": "38.7660", "idDistrito": 11, "local": "Lisboa", "longitude": "-9.1286" }
    ]
  })json";

  // District capitals whose names carry Latin-1 accents.
  inline constexpr types::PCStr ACCENTED_LOCALITIES_JSON = R"json({
    "owner": "IPMA",
    "country": "PT",
    "data": [
      { "idRegiao": 1, "idAreaAviso": "EVR", "idConcelho": 5, "globalIdLocal": 1070500, "latitude": "38.5701", "idDistrito": 7, "local": "Évora", "longitude": "-7.9104" },
      { "idRegiao": 1, "idAreaAviso": "STB", "idConcelho": 12, "globalIdLocal": 1151200, "latitude": "38.5246", "idDistrito": 15, "local": "Setúbal", "longitude": "-8.8856" },
      { "idRegiao": 1, "idAreaAviso": "BGC", "idConcelho": 2, "globalIdLocal": 1040200, "latitude": "41.8076", "idDistrito": 4, "local": "Bragança", "longitude": "-6.7606" }
    ]
  })json";

  inline constexpr types::PCStr WEATHER_TYPES_JSON = R"json({
    "owner": "IPMA",
    "country": "PT",
    "data": [
      { "descWeatherTypeEN": "No information", "descWeatherTypePT": "---", "idWeatherType": -99 },
      { "descWeatherTypeEN": "Clear sky", "descWeatherTypePT": "Céu limpo", "idWeatherType": 1 },
      { "descWeatherTypeEN": "Light rain", "descWeatherTypePT": "Chuva fraca", "idWeatherType": 9 }
    ]
  })json";

  inline constexpr types::PCStr LISBON_FORECAST_JSON = R"json({
    "owner": "IPMA",
    "country": "PT",
    "data": [
      { "precipitaProb": "0.0", "tMin": "12.3", "tMax": "22.0", "predWindDir": "NW", "idWeatherType": 1, "classWindSpeed": 2, "longitude": "-9.1286", "forecastDate": "2026-10-19", "latitude": "38.7660" },
      { "precipitaProb": "84.0", "tMin": 14, "tMax": 19.5, "predWindDir": "SW", "idWeatherType": 9, "classWindSpeed": 3, "classPrecInt": 1, "longitude": "-9.1286", "forecastDate": "2026-10-20", "latitude": "38.7660" }
    ],
    "globalIdLocal": 1110600,
    "dataUpdate": "2026-10-19T10:31:04"
  })json";

  inline fn Url(const types::StringView path) -> types::String {
    return std::format("{}/{}", BASE_URL, path);
  }

  inline fn LocalitiesUrl() -> types::String {
    return Url("distrits-islands.json");
  }

  inline fn WeatherTypesUrl() -> types::String {
    return Url("weather-type-classe.json");
  }

  inline fn ForecastUrl(const types::i64 globalIdLocal) -> types::String {
    return Url(std::format("forecast/meteorology/cities/daily/{}.json", globalIdLocal));
  }

  /**
   * @brief Serves canned bodies by URL and counts how often each URL is requested.
   * @details Unknown URLs answer like IPMA does for an unknown locality: HTTP 404.
   */
  class FakeFetcher final : public services::ipma::IJsonFetcher {
    types::Map<types::String, types::Result<types::String>> m_responses;
    mutable types::Map<types::String, types::i32>           m_calls;

   public:
    FakeFetcher() = default;

    fn respond(const types::String& url, types::Result<types::String> response) -> types::Unit {
      m_responses.insert_or_assign(url, std::move(response));
    }

    [[nodiscard]] fn callsTo(const types::String& url) const -> types::i32 {
      const auto iter = m_calls.find(url);
      return iter == m_calls.end() ? 0 : iter->second;
    }

    [[nodiscard]] fn fetchJson(const types::String& url) const -> types::Result<types::String> override {
      using enum utils::error::NimbusErrorCode;

      m_calls[url]++;

      if (const auto iter = m_responses.find(url); iter != m_responses.end())
        return iter->second;

      ERR_FMT(UpstreamStatus, "Upstream answered HTTP 404 for {}", url);
    }
  };
} // namespace nimbus::fixtures
