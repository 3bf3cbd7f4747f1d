#pragma once

#include <format>          // std::format
#include <source_location> // std::source_location
#include <system_error>    // std::error_code
#include <utility>         // std::move

#include "Types.hpp"

namespace nimbus::utils::error {
  namespace types = ::nimbus::utils::types;

  /**
   * @enum NimbusErrorCode
   * @brief Error categories reported by the library.
   */
  enum class NimbusErrorCode : types::u8 {
    InternalError,      ///< Invariant broken inside the library.
    InvalidArgument,    ///< Caller supplied an unusable argument.
    NotFound,           ///< Lookup produced no result.
    OutOfMemory,        ///< Allocation failed.
    ParseError,         ///< Upstream payload could not be decoded.
    PlatformSpecific,   ///< Failure reported by an underlying C API.
    TransportFailure,   ///< Upstream unreachable (DNS, connect, timeout).
    UpstreamStatus,     ///< Upstream answered with a non-2xx status.
  };

  /**
   * @struct NimbusError
   * @brief Error value carried by types::Result.
   */
  struct NimbusError {
    types::String        message;  ///< Human-readable description.
    std::source_location location; ///< Where the error was raised.
    NimbusErrorCode      code;     ///< Error category.

    NimbusError(const NimbusErrorCode errc, types::String msg, const std::source_location& loc = std::source_location::current())
      : message(std::move(msg)), location(loc), code(errc) {}

    explicit NimbusError(const types::Exception& exc, const std::source_location& loc = std::source_location::current())
      : message(exc.what()), location(loc), code(NimbusErrorCode::InternalError) {}

    explicit NimbusError(const std::error_code& errc, const std::source_location& loc = std::source_location::current())
      : message(errc.message()), location(loc), code(NimbusErrorCode::PlatformSpecific) {}
  };
} // namespace nimbus::utils::error

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define ERR(errc, msg) return ::std::unexpected(::nimbus::utils::error::NimbusError((errc), (msg)))

#define ERR_FMT(errc, fmt, ...) \
  return ::std::unexpected(::nimbus::utils::error::NimbusError((errc), ::std::format((fmt) __VA_OPT__(, ) __VA_ARGS__)))

#define ERR_FROM(err) return ::std::unexpected(err)

// GNU statement expression: yields the value or returns the error from the enclosing function.
#define TRY(expr)                                          \
  ({                                                       \
    auto&& nimbusTryResult_ = (expr);                      \
    if (!nimbusTryResult_)                                 \
      return ::std::unexpected(nimbusTryResult_.error());  \
    ::std::move(nimbusTryResult_).value();                 \
  })

#define TRY_VOID(expr)                                    \
  do {                                                    \
    if (auto&& nimbusTryResult_ = (expr); !nimbusTryResult_) \
      return ::std::unexpected(nimbusTryResult_.error()); \
  } while (false)
// NOLINTEND(cppcoreguidelines-macro-usage)
