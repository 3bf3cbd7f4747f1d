#pragma once

#include <curl/curl.h>
#include <utility> // std::{exchange, move}

#include <Nimbus++/Utils/Error.hpp>
#include <Nimbus++/Utils/Types.hpp>

namespace Curl {
  namespace types = nimbus::utils::types;
  namespace error = nimbus::utils::error;

  /**
   * @brief Options for initializing a Curl::Easy handle.
   */
  struct EasyOptions {
    types::Option<types::String> url                = types::None; ///< URL to set for the transfer
    types::String*               writeBuffer        = nullptr;     ///< Pointer to a string buffer to store the response
    types::Option<types::i64>    timeoutSecs        = types::None; ///< Timeout for the entire request in seconds
    types::Option<types::i64>    connectTimeoutSecs = types::None; ///< Timeout for the connection phase in seconds
    types::Option<types::String> userAgent          = types::None; ///< User-agent string
    bool                         followRedirects    = false;       ///< Follow 3xx responses
  };

  /**
   * @brief RAII wrapper for CURL easy handle.
   */
  class Easy {
    CURL*                             m_curl      = nullptr;
    types::Option<error::NimbusError> m_initError = types::None; ///< Error raised while applying EasyOptions

    static fn writeCallback(types::RawPointer contents, const types::usize size, const types::usize nmemb, types::String* str) -> types::usize {
      const types::usize totalSize = size * nmemb;
      str->append(static_cast<char*>(contents), totalSize);
      return totalSize;
    }

    fn recordInitError(types::Result<> res) -> bool {
      if (res)
        return false;

      m_initError = std::move(res).error();
      return true;
    }

   public:
    /**
     * @brief Initializes a CURL easy handle and applies the given options.
     * @param options The options to configure the CURL handle.
     */
    explicit Easy(const EasyOptions& options)
      : m_curl(curl_easy_init()) {
      if (!m_curl) {
        m_initError = error::NimbusError(error::NimbusErrorCode::InternalError, "curl_easy_init() failed");
        return;
      }

      if (options.url && recordInitError(setUrl(*options.url)))
        return;

      if (options.writeBuffer && recordInitError(setWriteFunction(options.writeBuffer)))
        return;

      if (options.timeoutSecs && recordInitError(setTimeout(*options.timeoutSecs)))
        return;

      if (options.connectTimeoutSecs && recordInitError(setConnectTimeout(*options.connectTimeoutSecs)))
        return;

      if (options.userAgent && recordInitError(setUserAgent(*options.userAgent)))
        return;

      if (options.followRedirects)
        recordInitError(setOpt(CURLOPT_FOLLOWLOCATION, 1L));
    }

    ~Easy() {
      if (m_curl)
        curl_easy_cleanup(m_curl);
    }

    Easy(const Easy&)                = delete;
    fn operator=(const Easy&)->Easy& = delete;

    Easy(Easy&& other) noexcept
      : m_curl(std::exchange(other.m_curl, nullptr)), m_initError(std::move(other.m_initError)) {}

    fn operator=(Easy&& other) noexcept -> Easy& {
      if (this != &other) {
        if (m_curl)
          curl_easy_cleanup(m_curl);

        m_curl      = std::exchange(other.m_curl, nullptr);
        m_initError = std::move(other.m_initError);
      }

      return *this;
    }

    /**
     * @brief True if the handle exists and every option was applied.
     */
    [[nodiscard]] explicit operator bool() const {
      return m_curl != nullptr && !m_initError;
    }

    [[nodiscard]] fn getInitializationError() const -> const types::Option<error::NimbusError>& {
      return m_initError;
    }

    template <typename T>
    fn setOpt(const CURLoption option, T value) -> types::Result<> {
      using enum error::NimbusErrorCode;

      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      if (m_initError)
        ERR(InternalError, "CURL handle initialization previously failed");

      if (const CURLcode res = curl_easy_setopt(m_curl, option, value); res != CURLE_OK)
        ERR_FMT(PlatformSpecific, "curl_easy_setopt failed: {}", curl_easy_strerror(res));

      return {};
    }

    /**
     * @brief Performs a blocking transfer.
     * @return TransportFailure when libcurl could not complete the exchange.
     */
    fn perform() -> types::Result<> {
      using enum error::NimbusErrorCode;

      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      if (m_initError)
        ERR_FMT(InternalError, "Cannot perform request, CURL handle initialization failed: {}", m_initError->message);

      if (const CURLcode res = curl_easy_perform(m_curl); res != CURLE_OK)
        ERR_FMT(TransportFailure, "curl_easy_perform failed: {}", curl_easy_strerror(res));

      return {};
    }

    template <typename T>
    fn getInfo(const CURLINFO info, T* value) -> types::Result<> {
      using enum error::NimbusErrorCode;

      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      if (const CURLcode res = curl_easy_getinfo(m_curl, info, value); res != CURLE_OK)
        ERR_FMT(PlatformSpecific, "curl_easy_getinfo failed: {}", curl_easy_strerror(res));

      return {};
    }

    /**
     * @brief HTTP status of the last transfer.
     */
    fn responseCode() -> types::Result<types::i64> {
      long code = 0; // NOLINT(google-runtime-int)

      TRY_VOID(getInfo(CURLINFO_RESPONSE_CODE, &code));

      return static_cast<types::i64>(code);
    }

    /**
     * @brief Decodes %XX sequences.
     * @param text Percent-encoded input.
     */
    static fn unescape(const types::StringView text) -> types::Result<types::String> {
      using enum error::NimbusErrorCode;

      // A zero length makes libcurl fall back to strlen().
      if (text.empty())
        return types::String {};

      types::i32 outLength = 0;

      char* decoded = curl_easy_unescape(nullptr, text.data(), static_cast<types::i32>(text.length()), &outLength);

      if (!decoded)
        ERR(OutOfMemory, "curl_easy_unescape failed");

      types::String result(decoded, static_cast<types::usize>(outLength));

      curl_free(decoded);

      return result;
    }

    fn setUrl(const types::String& url) -> types::Result<> {
      return setOpt(CURLOPT_URL, url.c_str());
    }

    fn setWriteFunction(types::String* buffer) -> types::Result<> {
      using enum error::NimbusErrorCode;

      if (!buffer)
        ERR(InvalidArgument, "Write buffer cannot be null");

      TRY_VOID(setOpt(CURLOPT_WRITEFUNCTION, writeCallback));

      return setOpt(CURLOPT_WRITEDATA, buffer);
    }

    fn setTimeout(const types::i64 timeout) -> types::Result<> {
      return setOpt(CURLOPT_TIMEOUT, static_cast<long>(timeout)); // NOLINT(google-runtime-int)
    }

    fn setConnectTimeout(const types::i64 timeout) -> types::Result<> {
      return setOpt(CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout)); // NOLINT(google-runtime-int)
    }

    fn setUserAgent(const types::String& userAgent) -> types::Result<> {
      return setOpt(CURLOPT_USERAGENT, userAgent.c_str());
    }
  };

  /**
   * @brief Initializes CURL globally. Call once before any thread creates a handle.
   */
  inline fn GlobalInit(const types::i64 flags = CURL_GLOBAL_ALL) -> types::Result<> {
    using enum error::NimbusErrorCode;

    if (const CURLcode res = curl_global_init(flags); res != CURLE_OK)
      ERR_FMT(PlatformSpecific, "curl_global_init failed: {}", curl_easy_strerror(res));

    return {};
  }

  inline fn GlobalCleanup() -> types::Unit {
    curl_global_cleanup();
  }
} // namespace Curl
