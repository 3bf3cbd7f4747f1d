#pragma once

// clang-format off
// we need glaze.hpp include before any other includes that might use it
// because core/meta.hpp complains about not having uint8_t defined otherwise
#include <glaze/glaze.hpp>
#include <glaze/core/meta.hpp>

#include "Nimbus++/Services/Ipma.hpp"
#include "Nimbus++/Utils/Types.hpp"
// clang-format on

namespace nimbus::services::ipma::dto {
  namespace types = nimbus::utils::types;

  // distrits-islands.json
  struct LocalitiesResponse {
    types::String        owner;
    types::String        country;
    types::Vec<Locality> data;
  };

  // weather-type-classe.json
  struct WeatherType {
    types::i32    idWeatherType = 0;
    types::String descWeatherTypePT;
    types::String descWeatherTypeEN;
  };

  struct WeatherTypesResponse {
    types::String           owner;
    types::String           country;
    types::Vec<WeatherType> data;
  };
} // namespace nimbus::services::ipma::dto

namespace glz {
  namespace {
    using namespace nimbus::services::ipma::dto;
  } // namespace

  template <>
  struct meta<LocalitiesResponse> {
    static constexpr detail::Object value = object("owner", &LocalitiesResponse::owner, "country", &LocalitiesResponse::country, "data", &LocalitiesResponse::data);
  };

  template <>
  struct meta<WeatherType> {
    // clang-format off
    static constexpr detail::Object value = object(
      "idWeatherType",     &WeatherType::idWeatherType,
      "descWeatherTypePT", &WeatherType::descWeatherTypePT,
      "descWeatherTypeEN", &WeatherType::descWeatherTypeEN
    );
    // clang-format on
  };

  template <>
  struct meta<WeatherTypesResponse> {
    static constexpr detail::Object value = object("owner", &WeatherTypesResponse::owner, "country", &WeatherTypesResponse::country, "data", &WeatherTypesResponse::data);
  };
} // namespace glz
