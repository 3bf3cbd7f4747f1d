#include <chrono>

#include <Nimbus++/Services/Ipma.hpp>
#include <Nimbus++/Utils/Error.hpp>
#include <Nimbus++/Utils/Types.hpp>

#include "IpmaFixtures.hpp"
#include "Routes.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace testing;
using namespace nimbus::services::ipma;
using namespace nimbus::fixtures;
using namespace nimbus::utils;

using nimbus::server::IsValidIsoDate;
using nimbus::server::ParseQuery;
using nimbus::server::QueryParams;
using nimbus::server::Response;
using nimbus::server::Routes;
using nimbus::server::StatusFor;

using types::Err;
using types::i32;
using types::Result;
using types::String;
using types::Unit;

using enum error::NimbusErrorCode;

class RoutesTest : public Test {
 protected:
  // NOLINTBEGIN(*-non-private-member-variables-in-classes)
  FakeFetcher*                     m_fetcher = nullptr;
  types::UniquePointer<IpmaClient> m_client;
  types::UniquePointer<Routes>     m_routes;
  // NOLINTEND(*-non-private-member-variables-in-classes)

  fn SetUp() -> Unit override {
    auto fetcher = std::make_unique<FakeFetcher>();
    m_fetcher    = fetcher.get();

    m_fetcher->respond(LocalitiesUrl(), String(LOCALITIES_JSON));
    m_fetcher->respond(WeatherTypesUrl(), String(WEATHER_TYPES_JSON));
    m_fetcher->respond(ForecastUrl(1110600), String(LISBON_FORECAST_JSON));

    m_client = std::make_unique<IpmaClient>(ClientConfig { .baseUrl = BASE_URL }, std::move(fetcher));
    m_routes = std::make_unique<Routes>(*m_client);
  }
};

TEST_F(RoutesTest, Health) {
  const Response response = m_routes->health();

  EXPECT_EQ(response.status, 200);
  EXPECT_EQ(response.body, R"({"status":"ok"})");
}

TEST_F(RoutesTest, ParseQuery_DecodesPlusAndPercentEscapes) {
  Result<QueryParams> params = ParseQuery("locality=Vila+Real&q=%C3%89vora&district_id=17&flag&&q2=a%26b");

  ASSERT_TRUE(params.has_value());
  EXPECT_EQ(params->at("locality"), "Vila Real");
  EXPECT_EQ(params->at("q"), "Évora");
  EXPECT_EQ(params->at("district_id"), "17");
  EXPECT_EQ(params->at("flag"), "");
  EXPECT_EQ(params->at("q2"), "a&b");
}

TEST_F(RoutesTest, ParseQuery_EmptyQuery) {
  Result<QueryParams> params = ParseQuery("");

  ASSERT_TRUE(params.has_value());
  EXPECT_TRUE(params->empty());
}

TEST_F(RoutesTest, Localities_ListsEverything) {
  const Response response = m_routes->localities({});

  EXPECT_EQ(response.status, 200);
  EXPECT_THAT(response.body, StartsWith(R"({"count":3,"data":[)"));
}

TEST_F(RoutesTest, Localities_FiltersBySubstringAndDistrict) {
  const Response byName = m_routes->localities({ { "q", "PORTO" } });

  EXPECT_EQ(byName.status, 200);
  EXPECT_THAT(byName.body, HasSubstr(R"("count":2)"));

  const Response byDistrict = m_routes->localities({ { "q", "porto" }, { "district_id", "13" } });

  EXPECT_EQ(byDistrict.status, 200);
  EXPECT_THAT(byDistrict.body, HasSubstr(R"("count":1)"));
  EXPECT_THAT(byDistrict.body, HasSubstr(R"("globalIdLocal":1131200)"));
  EXPECT_THAT(byDistrict.body, Not(HasSubstr("Porto Santo")));
}

TEST_F(RoutesTest, Localities_FindLocalityFoldsAccentedCapitals) {
  m_fetcher->respond(LocalitiesUrl(), String(ACCENTED_LOCALITIES_JSON));

  const Response evora = m_routes->localities({ { "q", "évora" } });

  EXPECT_EQ(evora.status, 200);
  EXPECT_THAT(evora.body, HasSubstr(R"("count":1)"));
  EXPECT_THAT(evora.body, HasSubstr(R"("globalIdLocal":1070500)"));

  const Response braganca = m_routes->localities({ { "q", "BRAGANÇA" } });

  EXPECT_THAT(braganca.body, HasSubstr(R"("globalIdLocal":1040200)"));

  const Response setubal = m_routes->dailyForecast({ { "locality", "SETÚBAL" } });

  EXPECT_EQ(m_fetcher->callsTo(ForecastUrl(1151200)), 1);
  EXPECT_EQ(setubal.status, 502);
}

TEST_F(RoutesTest, Localities_NonIntegerDistrictIs422) {
  const Response response = m_routes->localities({ { "district_id", "north" } });

  EXPECT_EQ(response.status, 422);
  EXPECT_THAT(response.body, HasSubstr("district_id"));
}

TEST_F(RoutesTest, DailyForecast_RequiresIdOrLocality) {
  const Response response = m_routes->dailyForecast({});

  EXPECT_EQ(response.status, 400);
  EXPECT_EQ(response.body, R"({"detail":"Provide either global_id_local or locality"})");
}

TEST_F(RoutesTest, DailyForecast_ZeroIdCountsAsMissing) {
  EXPECT_EQ(m_routes->dailyForecast({ { "global_id_local", "0" } }).status, 400);
}

TEST_F(RoutesTest, DailyForecast_BlankLocalityCountsAsMissing) {
  const Response response = m_routes->dailyForecast({ { "locality", "  \t" } });

  EXPECT_EQ(response.status, 400);
  EXPECT_EQ(m_fetcher->callsTo(LocalitiesUrl()), 0);
}

TEST_F(RoutesTest, DailyForecast_UnknownLocalityIs404) {
  const Response response = m_routes->dailyForecast({ { "locality", "Atlantis" } });

  EXPECT_EQ(response.status, 404);
  EXPECT_EQ(response.body, R"({"detail":"Locality not found"})");
}

TEST_F(RoutesTest, DailyForecast_ResolvesLocalityAndNormalizes) {
  const Response response = m_routes->dailyForecast({ { "locality", "lisboa" } });

  EXPECT_EQ(response.status, 200);
  EXPECT_THAT(response.body, HasSubstr(R"("globalIdLocal":1110600)"));
  EXPECT_THAT(response.body, HasSubstr(R"("tMin":12.3)"));
  EXPECT_THAT(response.body, HasSubstr(R"("latitude":38.766)"));
  EXPECT_THAT(response.body, Not(HasSubstr(R"("tMin":"12.3")")));
}

TEST_F(RoutesTest, DailyForecast_ExplicitIdSkipsResolution) {
  const Response response = m_routes->dailyForecast({ { "global_id_local", "1110600" }, { "locality", "Atlantis" } });

  EXPECT_EQ(response.status, 200);
  EXPECT_EQ(m_fetcher->callsTo(LocalitiesUrl()), 0);
}

TEST_F(RoutesTest, DailyForecast_UpstreamFailuresMapToGatewayErrors) {
  EXPECT_EQ(m_routes->dailyForecast({ { "global_id_local", "1234567" } }).status, 502);

  m_fetcher->respond(ForecastUrl(1131200), Err({ TransportFailure, "Connection timed out" }));
  EXPECT_EQ(m_routes->dailyForecast({ { "global_id_local", "1131200" } }).status, 503);
}

TEST_F(RoutesTest, DayForecast_RequiresValidDate) {
  EXPECT_EQ(m_routes->dayForecast({ { "global_id_local", "1110600" } }).status, 422);
  EXPECT_EQ(m_routes->dayForecast({ { "global_id_local", "1110600" }, { "forecast_date", "2026-02-30" } }).status, 422);
  EXPECT_EQ(m_routes->dayForecast({ { "global_id_local", "1110600" }, { "forecast_date", "19-10-2026" } }).status, 422);
}

TEST_F(RoutesTest, DayForecast_DateOutsideWindowIs404) {
  const Response response = m_routes->dayForecast({ { "global_id_local", "1110600" }, { "forecast_date", "2026-12-25" } });

  EXPECT_EQ(response.status, 404);
  EXPECT_EQ(response.body, R"({"detail":"Date not in available forecast window"})");
}

TEST_F(RoutesTest, DayForecast_ReturnsEnrichedDay) {
  const Response response = m_routes->dayForecast({ { "locality", "Lisboa" }, { "forecast_date", "2026-10-19" } });

  EXPECT_EQ(response.status, 200);
  EXPECT_THAT(response.body, StartsWith(R"({"globalIdLocal":1110600,"forecastDate":"2026-10-19","tMin":12.3,)"));
  EXPECT_THAT(response.body, HasSubstr(R"("weather":{"id":1,)"));
  EXPECT_THAT(response.body, HasSubstr(R"("en":"Clear sky")"));
  EXPECT_THAT(response.body, HasSubstr(R"("wind":{"class":2,"dir":"NW"})"));
}

TEST_F(RoutesTest, StatusForUpstreamErrors) {
  EXPECT_EQ(StatusFor(TransportFailure), 503);
  EXPECT_EQ(StatusFor(UpstreamStatus), 502);
  EXPECT_EQ(StatusFor(ParseError), 502);
  EXPECT_EQ(StatusFor(InternalError), 500);
}

TEST_F(RoutesTest, IsoDateValidation) {
  EXPECT_TRUE(IsValidIsoDate("2026-10-19"));
  EXPECT_TRUE(IsValidIsoDate("2028-02-29"));
  EXPECT_FALSE(IsValidIsoDate("2026-02-29"));
  EXPECT_FALSE(IsValidIsoDate("2026-13-01"));
  EXPECT_FALSE(IsValidIsoDate("2026-1-19"));
  EXPECT_FALSE(IsValidIsoDate("2026-10-19T00:00"));
  EXPECT_FALSE(IsValidIsoDate("+026-10-19"));
}

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
