#include "Config.hpp"

#include <filesystem>                // std::filesystem::{path, operator/, exists, create_directories}
#include <format>                    // std::format
#include <fstream>                   // std::ofstream
#include <limits>                    // std::numeric_limits
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_cast, enum_name, case_insensitive}
#include <system_error>              // std::error_code
#include <toml++/impl/parser.hpp>    // toml::{parse_file, parse_result}

#include <Nimbus++/Utils/Env.hpp>
#include <Nimbus++/Utils/Logging.hpp>
#include <Nimbus++/Utils/Types.hpp>

namespace fs = std::filesystem;

using namespace nimbus::utils::types;
using nimbus::utils::env::GetEnv;
using nimbus::utils::logging::LogLevel;

namespace {
  fn ReadTtl(const toml::table& tbl, const StringView key, const i64 fallback) -> i64 {
    const Option<i64> value = tbl[key].value<i64>();

    if (!value)
      return fallback;

    if (*value <= 0) {
      warn_log("cache.{} must be a positive number of seconds (got {}), using {}", key, *value, fallback);
      return fallback;
    }

    return *value;
  }

  fn CreateDefaultConfig(const fs::path& configPath) -> bool {
    try {
      std::error_code errc;
      create_directories(configPath.parent_path(), errc);

      if (errc) {
        error_log("Failed to create config directory: {}", errc.message());
        return false;
      }

      const nimbus::config::Config defaults;

      const String configContent = std::format(R"toml(# Nimbus++ Configuration File

# Upstream API
[ipma]
base_url = "{}"

# Freshness window of each cached resource, in seconds
[cache]
localities_ttl = {}
classes_ttl = {}
forecast_ttl = {}

[server]
address = "{}"
port = {}

[logging]
level = "info" # debug, info, warn or error
)toml",
                                               defaults.ipma.baseUrl,
                                               defaults.cache.localitiesTtl,
                                               defaults.cache.classesTtl,
                                               defaults.cache.forecastTtl,
                                               defaults.server.address,
                                               defaults.server.port);

      std::ofstream file(configPath);

      if (!file) {
        error_log("Failed to open {} for writing", configPath.string());
        return false;
      }

      file << configContent;

      info_log("Created default config file at {}", configPath.string());
      return true;
    } catch (const fs::filesystem_error& fsErr) {
      error_log("Filesystem error during default config creation: {}", fsErr.what());
      return false;
    }
  }
} // namespace

namespace nimbus::config {
  fn Ipma::fromToml(const toml::table& tbl) -> Ipma {
    Ipma ipma;

    if (const toml::node_view<const toml::node> urlNode = tbl["base_url"])
      if (auto urlVal = urlNode.value<String>(); urlVal && !urlVal->empty())
        ipma.baseUrl = *urlVal;

    return ipma;
  }

  fn Cache::fromToml(const toml::table& tbl) -> Cache {
    const Cache defaults;

    return {
      .localitiesTtl = ReadTtl(tbl, "localities_ttl", defaults.localitiesTtl),
      .classesTtl    = ReadTtl(tbl, "classes_ttl", defaults.classesTtl),
      .forecastTtl   = ReadTtl(tbl, "forecast_ttl", defaults.forecastTtl),
    };
  }

  fn Server::fromToml(const toml::table& tbl) -> Server {
    Server server;

    if (auto address = tbl["address"].value<String>())
      server.address = *address;

    if (const Option<i64> port = tbl["port"].value<i64>()) {
      if (*port > 0 && *port <= std::numeric_limits<u16>::max())
        server.port = static_cast<u16>(*port);
      else
        warn_log("server.port {} is out of range, using {}", *port, server.port);
    }

    return server;
  }

  fn Logging::fromToml(const toml::table& tbl) -> Logging {
    Logging logging;

    if (auto levelName = tbl["level"].value<String>()) {
      if (const Option<LogLevel> level = magic_enum::enum_cast<LogLevel>(*levelName, magic_enum::case_insensitive))
        logging.level = *level;
      else
        warn_log("Unknown log level '{}', using {}", *levelName, magic_enum::enum_name(logging.level));
    }

    return logging;
  }

  Config::Config(const toml::table& tbl) {
    if (const toml::node_view ipmaTbl = tbl["ipma"]; ipmaTbl.is_table())
      this->ipma = Ipma::fromToml(*ipmaTbl.as_table());

    if (const toml::node_view cacheTbl = tbl["cache"]; cacheTbl.is_table())
      this->cache = Cache::fromToml(*cacheTbl.as_table());

    if (const toml::node_view serverTbl = tbl["server"]; serverTbl.is_table())
      this->server = Server::fromToml(*serverTbl.as_table());

    if (const toml::node_view loggingTbl = tbl["logging"]; loggingTbl.is_table())
      this->logging = Logging::fromToml(*loggingTbl.as_table());
  }

  fn Config::clientConfig() const -> services::ipma::ClientConfig {
    return {
      .baseUrl       = ipma.baseUrl,
      .localitiesTtl = std::chrono::seconds(cache.localitiesTtl),
      .classesTtl    = std::chrono::seconds(cache.classesTtl),
      .forecastTtl   = std::chrono::seconds(cache.forecastTtl),
    };
  }

  fn Config::getConfigPath() -> fs::path {
    Vec<fs::path> possiblePaths;

    if (Result<String> result = GetEnv("XDG_CONFIG_HOME"))
      possiblePaths.emplace_back(fs::path(*result) / "nimbus++" / "config.toml");

    if (Result<String> result = GetEnv("HOME"))
      possiblePaths.emplace_back(fs::path(*result) / ".config" / "nimbus++" / "config.toml");

    possiblePaths.emplace_back(fs::path(".") / "config.toml");

    for (const fs::path& path : possiblePaths)
      if (std::error_code errc; fs::exists(path, errc) && !errc)
        return path;

    return possiblePaths.front();
  }

  fn Config::getInstance(const Option<fs::path>& explicitPath) -> Config {
    try {
      const fs::path configPath = explicitPath.value_or(Config::getConfigPath());

      std::error_code errc;

      if (!fs::exists(configPath, errc)) {
        if (explicitPath) {
          warn_log("Config file {} does not exist, using defaults", configPath.string());
          return {};
        }

        info_log("Config file not found at {}, creating defaults.", configPath.string());

        if (!CreateDefaultConfig(configPath))
          return {};
      }

      const toml::table parsedConfig = toml::parse_file(configPath.string());

      debug_log("Config loaded from {}", configPath.string());

      return Config(parsedConfig);
    } catch (const Exception& e) {
      warn_log("Config loading failed: {}, using defaults", e.what());
      return {};
    }
  }
} // namespace nimbus::config
