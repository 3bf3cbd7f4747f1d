#include <algorithm> // std::min
#include <chrono>    // std::chrono::seconds
#include <memory>    // std::make_unique

#include "Nimbus++/Services/Ipma.hpp"
#include "Nimbus++/Utils/Error.hpp"
#include "Nimbus++/Utils/Logging.hpp"
#include "Nimbus++/Utils/Types.hpp"

#include "Wrappers/Curl.hpp"

using namespace nimbus::utils::types;
using nimbus::utils::error::NimbusError;
using enum nimbus::utils::error::NimbusErrorCode;
using nimbus::services::ipma::IJsonFetcher;

namespace {
  constexpr i64 CONNECT_TIMEOUT_SECS = 5;

  class CurlFetcher final : public IJsonFetcher {
    i64 m_timeoutSecs;

   public:
    explicit CurlFetcher(const i64 timeoutSecs)
      : m_timeoutSecs(timeoutSecs) {}

    [[nodiscard]] fn fetchJson(const String& url) const -> Result<String> override {
      String responseBuffer;

      Curl::Easy curl({
        .url                = url,
        .writeBuffer        = &responseBuffer,
        .timeoutSecs        = m_timeoutSecs,
        .connectTimeoutSecs = std::min(CONNECT_TIMEOUT_SECS, m_timeoutSecs),
        .userAgent          = String("nimbus++/" NIMBUS_VERSION),
        .followRedirects    = true,
      });

      if (!curl) {
        if (const Option<NimbusError>& initError = curl.getInitializationError())
          ERR_FROM(*initError);

        ERR(InternalError, "Failed to initialize cURL (Easy handle is invalid after construction)");
      }

      debug_log("GET {}", url);

      TRY_VOID(curl.perform());

      const i64 status = TRY(curl.responseCode());

      if (status < 200 || status >= 300)
        ERR_FMT(UpstreamStatus, "Upstream answered HTTP {} for {}", status, url);

      return responseBuffer;
    }
  };
} // namespace

namespace nimbus::services::ipma {
  fn CreateCurlFetcher(const std::chrono::seconds timeout) -> UniquePointer<IJsonFetcher> {
    return std::make_unique<CurlFetcher>(static_cast<i64>(timeout.count()));
  }
} // namespace nimbus::services::ipma
