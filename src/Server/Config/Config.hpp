#pragma once

#include <filesystem>                // std::filesystem::path
#include <toml++/impl/node.hpp>      // toml::node
#include <toml++/impl/node_view.hpp> // toml::node_view
#include <toml++/impl/table.hpp>     // toml::table

#include <Nimbus++/Services/Ipma.hpp>
#include <Nimbus++/Utils/Logging.hpp>
#include <Nimbus++/Utils/Types.hpp>

namespace nimbus::config {
  namespace types = ::nimbus::utils::types;

  /**
   * @struct Ipma
   * @brief Where the upstream API lives.
   */
  struct Ipma {
    types::String baseUrl = services::ipma::DEFAULT_BASE_URL;

    /**
     * @brief Parses the [ipma] table.
     */
    static fn fromToml(const toml::table& tbl) -> Ipma;
  };

  /**
   * @struct Cache
   * @brief Time-to-live of each cached resource class, in seconds.
   */
  struct Cache {
    types::i64 localitiesTtl = 12L * 60 * 60; ///< Localities change rarely.
    types::i64 classesTtl    = 12L * 60 * 60; ///< Weather-type labels.
    types::i64 forecastTtl   = 30L * 60;      ///< Forecasts are refreshed upstream several times a day.

    /**
     * @brief Parses the [cache] table. Non-positive values keep the default.
     */
    static fn fromToml(const toml::table& tbl) -> Cache;
  };

  struct Server {
    types::String address = "0.0.0.0";
    types::u16    port    = 8000;

    static fn fromToml(const toml::table& tbl) -> Server;
  };

  struct Logging {
    utils::logging::LogLevel level = utils::logging::LogLevel::Info;

    static fn fromToml(const toml::table& tbl) -> Logging;
  };

  /**
   * @struct Config
   * @brief Holds the application configuration settings.
   */
  struct Config {
    Ipma    ipma;
    Cache   cache;
    Server  server;
    Logging logging;

    Config() = default;

    /**
     * @brief Constructs a Config instance from a TOML table.
     * @param tbl The TOML table to parse, containing [ipma], [cache], [server] and [logging].
     */
    explicit Config(const toml::table& tbl);

    /**
     * @brief Settings handed to the IPMA client.
     */
    [[nodiscard]] fn clientConfig() const -> services::ipma::ClientConfig;

    /**
     * @brief Loads the configuration.
     * @param explicitPath File given on the command line; searched for when absent.
     * @return The parsed configuration, or defaults if the file cannot be read.
     *
     * A default file is written to the preferred location when no file exists.
     */
    static fn getInstance(const types::Option<std::filesystem::path>& explicitPath = types::None) -> Config;

    /**
     * @brief Gets the path to the configuration file without loading it.
     */
    static fn getConfigPath() -> std::filesystem::path;
  };
} // namespace nimbus::config
