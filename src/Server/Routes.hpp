#pragma once

#include <Nimbus++/Services/Ipma.hpp>
#include <Nimbus++/Utils/Error.hpp>
#include <Nimbus++/Utils/Types.hpp>

namespace nimbus::server {
  namespace types = ::nimbus::utils::types;

  /// Decoded query string, last occurrence of a key wins.
  using QueryParams = types::Map<types::String, types::String>;

  /**
   * @brief What a handler answers with. The body is always JSON.
   */
  struct Response {
    types::u16    status = 200;
    types::String body;
  };

  /**
   * @brief Splits and percent-decodes a query string.
   * @param query Everything after '?', without the '?'.
   * @details '+' decodes to a space. Pairs without '=' get an empty value.
   */
  fn ParseQuery(types::StringView query) -> types::Result<QueryParams>;

  /**
   * @brief HTTP status an upstream failure is reported with.
   */
  fn StatusFor(utils::error::NimbusErrorCode code) -> types::u16;

  /**
   * @brief Checks a YYYY-MM-DD string names a real calendar day.
   */
  fn IsValidIsoDate(types::StringView date) -> bool;

  /**
   * @class Routes
   * @brief Handlers of the public JSON API, independent of the HTTP server.
   */
  class Routes {
    services::ipma::IpmaClient& m_client;

   public:
    explicit Routes(services::ipma::IpmaClient& client)
      : m_client(client) {}

    /// GET /health
    [[nodiscard]] fn health() const -> Response;

    /// GET /v1/localities?q=&district_id=
    fn localities(const QueryParams& params) -> Response;

    /// GET /v1/forecast/daily?global_id_local=&locality=&district_id=
    fn dailyForecast(const QueryParams& params) -> Response;

    /// GET /v1/forecast/day?forecast_date=&global_id_local=&locality=&district_id=
    fn dayForecast(const QueryParams& params) -> Response;

   private:
    /**
     * @brief Turns the locality parameters into a globalIdLocal.
     * @return The id, or the error response to send back.
     */
    fn resolveTarget(const QueryParams& params) -> types::Result<types::i64, Response>;
  };
} // namespace nimbus::server
