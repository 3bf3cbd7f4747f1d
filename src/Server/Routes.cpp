#include "Routes.hpp"

#include <algorithm>       // std::ranges::replace
#include <chrono>          // std::chrono::{year, month, day, year_month_day}
#include <format>          // std::format
#include <glaze/glaze.hpp> // glz::{meta, object, write, error_ctx, format_error}
#include <matchit.h>       // matchit::{match, is, or_, _}
#include <utility>         // std::move

#include <Nimbus++/Utils/Logging.hpp>
#include <Nimbus++/Utils/Strings.hpp>

#include "Wrappers/Curl.hpp"

using namespace nimbus::utils::types;
using namespace nimbus::services::ipma;
using nimbus::utils::error::NimbusError;
using nimbus::utils::strings::ParseNumber;
using nimbus::utils::strings::ToLowerCase;
using nimbus::utils::strings::Trim;

namespace {
  struct HealthBody {
    String status = "ok";
  };

  struct LocalitiesBody {
    usize         count = 0;
    Vec<Locality> data;
  };

  struct ErrorBody {
    String detail;
  };
} // namespace

namespace glz {
  template <>
  struct meta<HealthBody> {
    static constexpr detail::Object value = object("status", &HealthBody::status);
  };

  template <>
  struct meta<LocalitiesBody> {
    static constexpr detail::Object value = object("count", &LocalitiesBody::count, "data", &LocalitiesBody::data);
  };

  template <>
  struct meta<ErrorBody> {
    static constexpr detail::Object value = object("detail", &ErrorBody::detail);
  };
} // namespace glz

namespace {
  using nimbus::server::QueryParams;
  using nimbus::server::Response;

  template <typename Body>
  fn Json(const u16 status, const Body& body) -> Response {
    String json;

    // Absent upstream fields are written as null rather than dropped.
    if (const glz::error_ctx errc = glz::write<glz::opts { .skip_null_members = false }>(body, json)) {
      error_log("Failed to write JSON response: {}", glz::format_error(errc, json));
      return { .status = 500, .body = R"({"detail":"Internal Server Error"})" };
    }

    return { .status = status, .body = std::move(json) };
  }

  fn Detail(const u16 status, String message) -> Response {
    return Json(status, ErrorBody { .detail = std::move(message) });
  }

  fn UpstreamFailure(const NimbusError& err) -> Response {
    warn_at(err);

    return Detail(nimbus::server::StatusFor(err.code), std::format("Upstream request failed: {}", err.message));
  }

  fn Param(const QueryParams& params, const String& key) -> Option<StringView> {
    const auto iter = params.find(key);

    if (iter == params.end() || Trim(iter->second).empty())
      return None;

    return StringView(iter->second);
  }

  template <typename Number>
  fn IntegerParam(const QueryParams& params, const String& key) -> Result<Option<Number>, Response> {
    const Option<StringView> raw = Param(params, key);

    if (!raw)
      return None;

    const Option<Number> value = ParseNumber<Number>(*raw);

    if (!value)
      return std::unexpected(Detail(422, std::format("Query parameter '{}' must be an integer", key)));

    return value;
  }
} // namespace

namespace nimbus::server {
  fn ParseQuery(StringView query) -> Result<QueryParams> {
    QueryParams params;

    while (!query.empty()) {
      const usize     amp  = query.find('&');
      const StringView pair = query.substr(0, amp);

      query = amp == StringView::npos ? StringView {} : query.substr(amp + 1);

      if (pair.empty())
        continue;

      const usize eq = pair.find('=');

      String key(pair.substr(0, eq));
      String value(eq == StringView::npos ? StringView {} : pair.substr(eq + 1));

      std::ranges::replace(key, '+', ' ');
      std::ranges::replace(value, '+', ' ');

      params.insert_or_assign(TRY(Curl::Easy::unescape(key)), TRY(Curl::Easy::unescape(value)));
    }

    return params;
  }

  fn StatusFor(const utils::error::NimbusErrorCode code) -> u16 {
    using matchit::match, matchit::is, matchit::or_, matchit::_;
    using enum utils::error::NimbusErrorCode;

    return match(code)(
      is | TransportFailure                 = static_cast<u16>(503),
      is | or_(UpstreamStatus, ParseError)  = static_cast<u16>(502),
      is | _                                = static_cast<u16>(500)
    );
  }

  fn IsValidIsoDate(const StringView date) -> bool {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-')
      return false;

    for (const usize idx : { 0, 1, 2, 3, 5, 6, 8, 9 })
      if (date[idx] < '0' || date[idx] > '9')
        return false;

    const Option<i32> year  = ParseNumber<i32>(date.substr(0, 4));
    const Option<u32> month = ParseNumber<u32>(date.substr(5, 2));
    const Option<u32> day   = ParseNumber<u32>(date.substr(8, 2));

    if (!year || !month || !day)
      return false;

    return std::chrono::year_month_day { std::chrono::year(*year), std::chrono::month(*month), std::chrono::day(*day) }.ok();
  }

  fn Routes::health() const -> Response {
    return Json(200, HealthBody {});
  }

  fn Routes::localities(const QueryParams& params) -> Response {
    const Result<Option<i32>, Response> districtId = IntegerParam<i32>(params, "district_id");

    if (!districtId)
      return districtId.error();

    Result<Vec<Locality>> all = m_client.getLocalities();

    if (!all)
      return UpstreamFailure(all.error());

    const Option<StringView> query  = Param(params, "q");
    const String             needle = query ? ToLowerCase(Trim(*query)) : String {};

    LocalitiesBody body;

    for (Locality& loc : *all) {
      if (query && ToLowerCase(loc.local).find(needle) == String::npos)
        continue;

      if (*districtId && loc.idDistrito != **districtId)
        continue;

      body.data.push_back(std::move(loc));
    }

    body.count = body.data.size();

    return Json(200, body);
  }

  fn Routes::dailyForecast(const QueryParams& params) -> Response {
    const Result<i64, Response> globalIdLocal = resolveTarget(params);

    if (!globalIdLocal)
      return globalIdLocal.error();

    Result<DailyForecast> forecast = m_client.getDailyForecast(*globalIdLocal);

    if (!forecast)
      return UpstreamFailure(forecast.error());

    NormalizeForecast(*forecast);

    return Json(200, *forecast);
  }

  fn Routes::dayForecast(const QueryParams& params) -> Response {
    const Option<StringView> date = Param(params, "forecast_date");

    if (!date)
      return Detail(422, "Query parameter 'forecast_date' is required");

    if (!IsValidIsoDate(*date))
      return Detail(422, std::format("Invalid forecast_date '{}', expected YYYY-MM-DD", *date));

    const Result<i64, Response> globalIdLocal = resolveTarget(params);

    if (!globalIdLocal)
      return globalIdLocal.error();

    const Result<Option<DayReport>> report = m_client.getDayForecast(*globalIdLocal, *date);

    if (!report)
      return UpstreamFailure(report.error());

    if (!*report)
      return Detail(404, "Date not in available forecast window");

    return Json(200, **report);
  }

  fn Routes::resolveTarget(const QueryParams& params) -> Result<i64, Response> {
    const Result<Option<i64>, Response> globalIdLocal = IntegerParam<i64>(params, "global_id_local");

    if (!globalIdLocal)
      return std::unexpected(globalIdLocal.error());

    // Zero is not a valid id and falls back to the locality name.
    if (*globalIdLocal && **globalIdLocal != 0)
      return **globalIdLocal;

    const Option<StringView> locality = Param(params, "locality");

    if (!locality)
      return std::unexpected(Detail(400, "Provide either global_id_local or locality"));

    const Result<Option<i32>, Response> districtId = IntegerParam<i32>(params, "district_id");

    if (!districtId)
      return std::unexpected(districtId.error());

    const Result<Option<Locality>> found = m_client.findLocality(*locality, *districtId);

    if (!found)
      return std::unexpected(UpstreamFailure(found.error()));

    if (!*found || !(*found)->globalIdLocal)
      return std::unexpected(Detail(404, "Locality not found"));

    return *(*found)->globalIdLocal;
  }
} // namespace nimbus::server
