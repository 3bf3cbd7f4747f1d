#pragma once

#include <chrono>                // std::chrono::{seconds, minutes, hours}
#include <glaze/core/common.hpp> // object
#include <glaze/core/meta.hpp>   // Object
#include <variant>               // std::variant

#include "../Utils/Error.hpp"
#include "../Utils/TtlCache.hpp"
#include "../Utils/Types.hpp"

namespace nimbus::services::ipma {
  namespace types = ::nimbus::utils::types;
  namespace cache = ::nimbus::utils::cache;

  inline constexpr types::PCStr DEFAULT_BASE_URL = "https://api.ipma.pt/open-data";

  /// Ceiling applied to every upstream request.
  inline constexpr std::chrono::seconds DEFAULT_FETCH_TIMEOUT = std::chrono::seconds(20);

  /**
   * @brief A scalar that IPMA sends either as a JSON number or as a JSON string.
   */
  using FieldValue = std::variant<types::f64, types::String>;

  /**
   * @struct Locality
   * @brief Reference record for a place known to IPMA (district capitals, islands, ...).
   *
   * `globalIdLocal` is the key every forecast lookup uses. Everything but `local` is
   * optional, and coordinates keep whichever JSON type IPMA sent, so a null or a
   * number-for-string swap in one record does not fail the whole document.
   */
  struct Locality {
    types::Option<types::i64>    globalIdLocal;
    types::String                local;
    types::Option<types::i32>    idRegiao;
    types::Option<types::i32>    idDistrito;
    types::Option<types::i32>    idConcelho;
    types::Option<types::String> idAreaAviso;
    types::Option<FieldValue>    latitude;  ///< Decimal degrees, as delivered.
    types::Option<FieldValue>    longitude; ///< Decimal degrees, as delivered.
  };

  struct WeatherTypeLabel {
    types::String pt;
    types::String en;
  };

  /// `idWeatherType` -> localized labels.
  using WeatherTypeMap = types::Map<types::i32, WeatherTypeLabel>;

  /**
   * @struct DayForecast
   * @brief One day of the IPMA daily forecast, fields kept in their upstream shape.
   */
  struct DayForecast {
    types::String                    forecastDate; ///< YYYY-MM-DD
    types::Option<FieldValue>        tMin;
    types::Option<FieldValue>        tMax;
    types::Option<FieldValue>        precipitaProb;
    types::Option<types::String>     predWindDir;
    types::Option<FieldValue>        idWeatherType;
    types::Option<FieldValue>        classWindSpeed;
    types::Option<FieldValue>        classPrecInt;
    types::Option<FieldValue>        latitude;
    types::Option<FieldValue>        longitude;
  };

  struct DailyForecast {
    types::Option<types::String> owner;
    types::Option<types::String> country;
    types::Option<types::i64>    globalIdLocal;
    types::Option<types::String> dataUpdate;
    types::Vec<DayForecast>      data;
  };

  struct WeatherInfo {
    types::i32    id = 0;
    types::String pt;
    types::String en;
  };

  struct WindInfo {
    types::Option<types::i32>    windClass; ///< Serialized as "class".
    types::Option<types::String> dir;
  };

  /**
   * @struct DayReport
   * @brief Single-day forecast with the weather type expanded and wind grouped.
   */
  struct DayReport {
    types::i64                   globalIdLocal = 0;
    types::String                forecastDate;
    types::Option<types::f64>    tMin;
    types::Option<types::f64>    tMax;
    types::Option<types::f64>    precipitaProb;
    types::Option<types::String> predWindDir;
    WeatherInfo                  weather;
    WindInfo                     wind;
  };

  /**
   * @brief Settings the client is built from. Immutable once the client exists.
   */
  struct ClientConfig {
    types::String        baseUrl       = DEFAULT_BASE_URL;
    std::chrono::seconds localitiesTtl = std::chrono::hours(12);
    std::chrono::seconds classesTtl    = std::chrono::hours(12);
    std::chrono::seconds forecastTtl   = std::chrono::minutes(30);
  };

  /**
   * @brief Retrieves a JSON document over the network.
   *
   * Implementations return the response body on a 2xx answer, a TransportFailure
   * error when the host cannot be reached in time, and an UpstreamStatus error
   * for any other status.
   */
  class IJsonFetcher {
   public:
    IJsonFetcher(const IJsonFetcher&) = delete;
    IJsonFetcher(IJsonFetcher&&)      = delete;

    fn operator=(const IJsonFetcher&)->IJsonFetcher& = delete;
    fn operator=(IJsonFetcher&&)->IJsonFetcher&      = delete;

    virtual ~IJsonFetcher() = default;

    [[nodiscard]] virtual fn fetchJson(const types::String& url) const -> types::Result<types::String> = 0;

   protected:
    IJsonFetcher() = default;
  };

  /**
   * @brief Creates the libcurl-backed fetcher.
   * @param timeout Total time allowed for one request.
   */
  fn CreateCurlFetcher(std::chrono::seconds timeout = DEFAULT_FETCH_TIMEOUT) -> types::UniquePointer<IJsonFetcher>;

  /**
   * @class IpmaClient
   * @brief Read-through client for the IPMA open-data API.
   *
   * Owns one TTL cache per resource class. Safe to share between threads; concurrent
   * misses on the same key may each reach upstream.
   */
  class IpmaClient {
    ClientConfig                        m_config;
    types::UniquePointer<IJsonFetcher>  m_fetcher;
    cache::TtlCache<types::Vec<Locality>> m_localities;
    cache::TtlCache<WeatherTypeMap>     m_weatherTypes;
    cache::TtlCache<DailyForecast>      m_forecasts;

   public:
    IpmaClient(ClientConfig config, types::UniquePointer<IJsonFetcher> fetcher, const cache::Clock& now = cache::SteadyClock());

    /**
     * @brief All reference localities (`{base}/distrits-islands.json`).
     */
    fn getLocalities() -> types::Result<types::Vec<Locality>>;

    /**
     * @brief Weather-type labels keyed by `idWeatherType` (`{base}/weather-type-classe.json`).
     */
    fn getWeatherTypes() -> types::Result<WeatherTypeMap>;

    /**
     * @brief Multi-day forecast for a locality, as delivered by IPMA.
     * @param globalIdLocal Locality key.
     */
    fn getDailyForecast(types::i64 globalIdLocal) -> types::Result<DailyForecast>;

    /**
     * @brief Resolves a locality name typed by a person.
     * @param name Locality name, matched case-insensitively.
     * @param districtId Optional `idDistrito` restricting the candidates.
     * @return The chosen record, None if nothing matches, or the upstream error.
     * @see ResolveLocality
     */
    fn findLocality(types::StringView name, types::Option<types::i32> districtId = types::None) -> types::Result<types::Option<Locality>>;

    /**
     * @brief Forecast for one date, enriched with weather-type labels.
     * @param globalIdLocal Locality key.
     * @param date Target date, YYYY-MM-DD.
     * @return The report, None when the date is outside the forecast window, or the upstream error.
     */
    fn getDayForecast(types::i64 globalIdLocal, types::StringView date) -> types::Result<types::Option<DayReport>>;

    /**
     * @brief Drops every cached entry so the next calls go upstream.
     */
    fn clearCaches() -> types::Unit;

    [[nodiscard]] fn config() const -> const ClientConfig& {
      return m_config;
    }
  };

  /**
   * @brief Two-tier locality match.
   *
   * Exact case-insensitive matches on `local` are preferred; substring matches are
   * only considered when there is no exact one. Both tiers honour the district filter.
   * Ties go to the smallest (idConcelho, globalIdLocal), missing ids sorting last.
   */
  fn ResolveLocality(const types::Vec<Locality>& localities, types::StringView name, types::Option<types::i32> districtId) -> types::Option<Locality>;

  /**
   * @brief Turns a numeric string into a number in place.
   * @details Strings that do not parse are left as they are. Never fails.
   */
  fn CoerceToNumber(types::Option<FieldValue>& value) -> types::Unit;

  /**
   * @brief Numeric view of a field, coercing strings. None if not numeric.
   */
  fn AsNumber(const types::Option<FieldValue>& value) -> types::Option<types::f64>;

  /**
   * @brief Coerces tMin, tMax, precipitaProb, latitude and longitude of every day.
   */
  fn NormalizeForecast(DailyForecast& forecast) -> types::Unit;

  /**
   * @brief Day whose forecastDate equals `date` exactly.
   */
  fn FindDay(const DailyForecast& forecast, types::StringView date) -> types::Option<DayForecast>;

  fn BuildDayReport(types::i64 globalIdLocal, const DayForecast& day, const WeatherTypeMap& labels) -> DayReport;
} // namespace nimbus::services::ipma

namespace glz {
  template <>
  struct meta<nimbus::services::ipma::Locality> {
    using T = nimbus::services::ipma::Locality;

    // clang-format off
    static constexpr detail::Object value = object(
      "globalIdLocal", &T::globalIdLocal,
      "local",         &T::local,
      "idRegiao",      &T::idRegiao,
      "idDistrito",    &T::idDistrito,
      "idConcelho",    &T::idConcelho,
      "idAreaAviso",   &T::idAreaAviso,
      "latitude",      &T::latitude,
      "longitude",     &T::longitude
    );
    // clang-format on
  };

  template <>
  struct meta<nimbus::services::ipma::DayForecast> {
    using T = nimbus::services::ipma::DayForecast;

    // clang-format off
    static constexpr detail::Object value = object(
      "forecastDate",   &T::forecastDate,
      "tMin",           &T::tMin,
      "tMax",           &T::tMax,
      "precipitaProb",  &T::precipitaProb,
      "predWindDir",    &T::predWindDir,
      "idWeatherType",  &T::idWeatherType,
      "classWindSpeed", &T::classWindSpeed,
      "classPrecInt",   &T::classPrecInt,
      "latitude",       &T::latitude,
      "longitude",      &T::longitude
    );
    // clang-format on
  };

  template <>
  struct meta<nimbus::services::ipma::DailyForecast> {
    using T = nimbus::services::ipma::DailyForecast;

    // clang-format off
    static constexpr detail::Object value = object(
      "owner",         &T::owner,
      "country",       &T::country,
      "globalIdLocal", &T::globalIdLocal,
      "dataUpdate",    &T::dataUpdate,
      "data",          &T::data
    );
    // clang-format on
  };

  template <>
  struct meta<nimbus::services::ipma::WeatherInfo> {
    using T = nimbus::services::ipma::WeatherInfo;

    static constexpr detail::Object value = object("id", &T::id, "pt", &T::pt, "en", &T::en);
  };

  template <>
  struct meta<nimbus::services::ipma::WindInfo> {
    using T = nimbus::services::ipma::WindInfo;

    static constexpr detail::Object value = object("class", &T::windClass, "dir", &T::dir);
  };

  template <>
  struct meta<nimbus::services::ipma::DayReport> {
    using T = nimbus::services::ipma::DayReport;

    // clang-format off
    static constexpr detail::Object value = object(
      "globalIdLocal", &T::globalIdLocal,
      "forecastDate",  &T::forecastDate,
      "tMin",          &T::tMin,
      "tMax",          &T::tMax,
      "precipitaProb", &T::precipitaProb,
      "predWindDir",   &T::predWindDir,
      "weather",       &T::weather,
      "wind",          &T::wind
    );
    // clang-format on
  };
} // namespace glz
