#define ASIO_HAS_CO_AWAIT      1
#define ASIO_HAS_STD_COROUTINE 1

#include <asio/error.hpp>            // asio::error::operation_aborted
#include <asio/io_context.hpp>       // asio::io_context
#include <asio/signal_set.hpp>       // asio::signal_set
#include <csignal>                   // SIGINT, SIGTERM
#include <cstdlib>                   // EXIT_FAILURE, EXIT_SUCCESS
#include <filesystem>                // std::filesystem::path
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_cast, enum_name, case_insensitive}

#ifdef fn
  #undef fn
#endif

#include <glaze/net/http_server.hpp> // glz::{http_server, request, response}

#ifndef fn
  #define fn auto
#endif

#include <Nimbus++/Services/Ipma.hpp>
#include <Nimbus++/Utils/Error.hpp>
#include <Nimbus++/Utils/Logging.hpp>
#include <Nimbus++/Utils/Types.hpp>

#include "Config/Config.hpp"
#include "Routes.hpp"
#include "Wrappers/Curl.hpp"

using namespace nimbus::utils::types;
using namespace nimbus::utils::logging;
using nimbus::config::Config;
using nimbus::server::QueryParams;
using nimbus::server::Response;
using nimbus::server::Routes;

namespace {
  constexpr PCStr USAGE = R"(Usage: nimbus-server [options]

Options:
  -c, --config <path>     Read configuration from <path>
  -l, --log-level <level> Minimum log level (debug, info, warn, error)
  -V, --verbose           Enable verbose logging. Overrides --log-level.
      --config-path       Print the configuration file location and exit
  -v, --version           Print the version and exit
  -h, --help              Show this help and exit
)";

  struct Arguments {
    Option<std::filesystem::path> configPath;
    Option<LogLevel>              logLevel;
    bool                          verbose        = false;
    bool                          showConfigPath = false;
    bool                          showVersion    = false;
    bool                          showHelp       = false;
  };

  fn ParseArguments(const Vec<StringView>& args) -> Result<Arguments> {
    using enum nimbus::utils::error::NimbusErrorCode;

    Arguments parsed;

    for (usize idx = 1; idx < args.size(); ++idx) {
      const StringView arg = args[idx];

      fn nextValue = [&]() -> Result<StringView> {
        if (idx + 1 >= args.size())
          ERR_FMT(InvalidArgument, "Option '{}' expects a value", arg);

        return args[++idx];
      };

      if (arg == "-c" || arg == "--config")
        parsed.configPath = std::filesystem::path(TRY(nextValue()));
      else if (arg == "-l" || arg == "--log-level") {
        const StringView name = TRY(nextValue());

        parsed.logLevel = magic_enum::enum_cast<LogLevel>(name, magic_enum::case_insensitive);

        if (!parsed.logLevel)
          ERR_FMT(InvalidArgument, "Unknown log level '{}'", name);
      } else if (arg == "-V" || arg == "--verbose")
        parsed.verbose = true;
      else if (arg == "--config-path")
        parsed.showConfigPath = true;
      else if (arg == "-v" || arg == "--version")
        parsed.showVersion = true;
      else if (arg == "-h" || arg == "--help")
        parsed.showHelp = true;
      else
        ERR_FMT(InvalidArgument, "Unknown option '{}'", arg);
    }

    return parsed;
  }

  fn Reply(glz::response& res, const Response& response) -> Unit {
    res.status(response.status).header("Content-Type", "application/json").body(response.body);
  }

  template <typename Handler>
  fn Handle(const glz::request& req, glz::response& res, Handler&& handler) -> Unit {
    info_log("GET {} from {}", req.target, req.remote_ip);

    const usize      queryStart = req.target.find('?');
    const StringView query      = queryStart == String::npos ? StringView {} : StringView(req.target).substr(queryStart + 1);

    Result<QueryParams> params = nimbus::server::ParseQuery(query);

    if (!params) {
      warn_at(params.error());
      Reply(res, { .status = 400, .body = R"({"detail":"Malformed query string"})" });
      return;
    }

    const Response response = handler(*params);

    debug_log("{} -> {}", req.target, response.status);

    Reply(res, response);
  }
} // namespace

fn main(const i32 argc, CStr* argv[]) -> i32 try {
  Arguments args;

  {
    Result<Arguments> parsed = ParseArguments(Vec<StringView>(argv, argv + argc));

    if (!parsed) {
      error_at(parsed.error());
      Print("{}", USAGE);
      return EXIT_FAILURE;
    }

    args = *parsed;
  }

  if (args.showHelp) {
    Print("{}", USAGE);
    return EXIT_SUCCESS;
  }

  if (args.showVersion) {
    Println("nimbus++ {}", NIMBUS_VERSION);
    return EXIT_SUCCESS;
  }

  if (args.showConfigPath) {
    Println("{}", args.configPath.value_or(Config::getConfigPath()).string());
    return EXIT_SUCCESS;
  }

  const Config config = Config::getInstance(args.configPath);

  SetRuntimeLogLevel(args.verbose ? LogLevel::Debug : args.logLevel.value_or(config.logging.level));

  if (Result<> curlInit = Curl::GlobalInit(); !curlInit) {
    error_at(curlInit.error());
    return EXIT_FAILURE;
  }

  nimbus::services::ipma::IpmaClient client(config.clientConfig(), nimbus::services::ipma::CreateCurlFetcher());

  Routes routes(client);

  glz::http_server server;

  server.on_error([](const std::error_code errc, const std::source_location& loc) {
    if (errc != asio::error::operation_aborted)
      error_log("Server error at {}:{} -> {}", loc.file_name(), loc.line(), errc.message());
  });

  server.get("/health", [&](const glz::request& req, glz::response& res) {
    Handle(req, res, [&](const QueryParams&) { return routes.health(); });
  });

  server.get("/v1/localities", [&](const glz::request& req, glz::response& res) {
    Handle(req, res, [&](const QueryParams& params) { return routes.localities(params); });
  });

  server.get("/v1/forecast/daily", [&](const glz::request& req, glz::response& res) {
    Handle(req, res, [&](const QueryParams& params) { return routes.dailyForecast(params); });
  });

  server.get("/v1/forecast/day", [&](const glz::request& req, glz::response& res) {
    Handle(req, res, [&](const QueryParams& params) { return routes.dayForecast(params); });
  });

  server.bind(config.server.address, config.server.port);
  server.start();

  info_log("Serving IPMA data from {} at http://{}:{}. Press Ctrl+C to exit.", config.ipma.baseUrl, config.server.address, config.server.port);

  {
    using namespace asio;

    io_context signalContext;

    signal_set signals(signalContext, SIGINT, SIGTERM);

    signals.async_wait([&](const error_code& error, i32 signalNumber) {
      if (!error) {
        info_log("Shutdown signal ({}) received. Stopping server...", signalNumber);
        server.stop();
        signalContext.stop();
      }
    });

    signalContext.run();
  }

  Curl::GlobalCleanup();

  info_log("Server stopped. Exiting.");
  return EXIT_SUCCESS;
} catch (const Exception& e) {
  error_log("Fatal error: {}", e.what());
  return EXIT_FAILURE;
}
