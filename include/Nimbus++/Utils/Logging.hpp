#pragma once

#include <algorithm>  // std::copy_n
#include <chrono>     // std::chrono::system_clock
#include <cstdio>     // stderr, stdout, std::fwrite, std::fflush
#include <ctime>      // localtime_r, strftime, time_t, tm
#include <filesystem> // std::filesystem::path
#include <format>     // std::format
#include <utility>    // std::forward

#ifndef NDEBUG
  #include <source_location> // std::source_location
#endif

#include "Error.hpp"
#include "Types.hpp"

namespace nimbus::utils::logging {
  namespace types = ::nimbus::utils::types;

  inline fn GetLogMutex() -> types::Mutex& {
    static types::Mutex LogMutexInstance;
    return LogMutexInstance;
  }

  /**
   * @brief Writes raw text to stdout or stderr.
   * @param text The text to write
   * @param useStderr Whether to write to stderr instead of stdout
   */
  inline fn WriteToConsole(const types::StringView text, const bool useStderr = false) -> types::Unit {
    std::FILE* stream = useStderr ? stderr : stdout;

    std::fwrite(text.data(), 1, text.size(), stream);
    std::fflush(stream);
  }

  enum class LogColor : types::u8 {
    Black   = 0,
    Red     = 1,
    Green   = 2,
    Yellow  = 3,
    Blue    = 4,
    Magenta = 5,
    Cyan    = 6,
    White   = 7,
    Gray    = 8,
  };

  struct LogLevelConst {
    // clang-format off
    static constexpr types::Array<types::StringView, 9> COLOR_CODE_LITERALS = {
      "\033[38;5;0m", "\033[38;5;1m", "\033[38;5;2m",
      "\033[38;5;3m", "\033[38;5;4m", "\033[38;5;5m",
      "\033[38;5;6m", "\033[38;5;7m", "\033[38;5;8m",
    };
    // clang-format on

    static constexpr types::PCStr RESET_CODE   = "\033[0m";
    static constexpr types::PCStr BOLD_START   = "\033[1m";
    static constexpr types::PCStr ITALIC_START = "\033[3m";

    // Bold + color + padded level name + reset.
    static constexpr types::StringView DEBUG_STYLED = "\033[1m\033[38;5;6mDEBUG\033[0m";
    static constexpr types::StringView INFO_STYLED  = "\033[1m\033[38;5;2mINFO \033[0m";
    static constexpr types::StringView WARN_STYLED  = "\033[1m\033[38;5;3mWARN \033[0m";
    static constexpr types::StringView ERROR_STYLED = "\033[1m\033[38;5;1mERROR\033[0m";

    static constexpr types::PCStr TIMESTAMP_FORMAT = "%X";
    static constexpr types::PCStr LOG_FORMAT       = "{} {} {}";

#ifndef NDEBUG
    static constexpr types::PCStr FILE_LINE_FORMAT  = "{}:{}";
    static constexpr types::PCStr DEBUG_LINE_PREFIX = "           ╰──── ";
#endif
  };

  /**
   * @enum LogLevel
   * @brief Represents different log levels.
   */
  enum class LogLevel : types::u8 {
    Debug,
    Info,
    Warn,
    Error,
  };

  /**
   * @brief Gets the current runtime log level.
   * @return Reference to the process-wide log level.
   */
  inline fn GetRuntimeLogLevel() -> LogLevel& {
    static LogLevel Level = LogLevel::Info;
    return Level;
  }

  /**
   * @brief Sets the runtime log level.
   * @param level The new log level to set.
   */
  inline fn SetRuntimeLogLevel(const LogLevel level) -> types::Unit {
    GetRuntimeLogLevel() = level;
  }

  /**
   * @struct Style
   * @brief Options for text styling with ANSI codes.
   */
  struct Style {
    LogColor color  = LogColor::White; ///< Optional color to apply
    bool     bold   = false;           ///< Whether to make text bold
    bool     italic = false;           ///< Whether to make text italic
  };

  /**
   * @brief Applies ANSI styling to text.
   * @param text The text to style
   * @param style The style options (color, bold, italic)
   * @return Styled string, or the text unchanged when the style is the default one
   */
  inline fn Stylize(const types::StringView text, const Style& style) -> types::String {
    if (!style.bold && !style.italic && style.color == LogColor::White)
      return types::String(text);

    types::String result;
    result.reserve(text.size() + 24);

    if (style.bold)
      result += LogLevelConst::BOLD_START;
    if (style.italic)
      result += LogLevelConst::ITALIC_START;
    if (style.color != LogColor::White)
      result += LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<types::usize>(style.color));

    result += text;
    result += LogLevelConst::RESET_CODE;

    return result;
  }

  constexpr fn GetLevelInfo() -> const types::Array<types::StringView, 4>& {
    static constexpr types::Array<types::StringView, 4> LEVEL_INFO_INSTANCE = {
      LogLevelConst::DEBUG_STYLED,
      LogLevelConst::INFO_STYLED,
      LogLevelConst::WARN_STYLED,
      LogLevelConst::ERROR_STYLED,
    };

    return LEVEL_INFO_INSTANCE;
  }

  constexpr fn ShouldUseStderr(const LogLevel level) -> bool {
    return level == LogLevel::Warn || level == LogLevel::Error;
  }

  template <typename... Args>
  inline fn Print(std::format_string<Args...> fmt, Args&&... args) -> types::Unit {
    WriteToConsole(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  inline fn Println(std::format_string<Args...> fmt, Args&&... args) -> types::Unit {
    WriteToConsole(std::format(fmt, std::forward<Args>(args)...) + '\n');
  }

  /**
   * @brief Returns a HH:MM:SS timestamp for the given epoch time.
   *        Cached per thread and recomputed only when the second changes.
   */
  inline fn GetCachedTimestamp(const std::time_t timeT) -> types::StringView {
    thread_local auto                  LastTt   = static_cast<std::time_t>(-1);
    thread_local types::Array<char, 9> TsBuffer = { '\0' };

    if (timeT != LastTt) {
      std::tm localTm {};

      if (localtime_r(&timeT, &localTm) == nullptr ||
          std::strftime(TsBuffer.data(), TsBuffer.size(), LogLevelConst::TIMESTAMP_FORMAT, &localTm) == 0)
        std::copy_n("??:??:??", 9, TsBuffer.data());

      LastTt = timeT;
    }

    return { TsBuffer.data(), 8 };
  }

  /**
   * @brief Logs a message with the specified log level, source location, and format string.
   * @param level The log level.
   * @param loc The source location of the log message (only in Debug builds).
   * @param fmt The format string.
   * @param args The arguments for the format string.
   */
  template <typename... Args>
  fn LogImpl(
    const LogLevel level,
#ifndef NDEBUG
    const std::source_location& loc,
#endif
    std::format_string<Args...> fmt,
    Args&&... args
  ) -> types::Unit {
    using std::chrono::system_clock;

    if (level < GetRuntimeLogLevel())
      return;

    const std::time_t       nowTt     = system_clock::to_time_t(system_clock::now());
    const types::StringView timestamp = GetCachedTimestamp(nowTt);

    types::String line = std::format(
      LogLevelConst::LOG_FORMAT,
      Stylize(std::format("[{}]", timestamp), { .color = LogColor::Gray }),
      GetLevelInfo().at(static_cast<types::usize>(level)),
      std::format(fmt, std::forward<Args>(args)...)
    );

    line += '\n';

#ifndef NDEBUG
    const types::String fileLine = std::format(
      LogLevelConst::FILE_LINE_FORMAT,
      std::filesystem::path(loc.file_name()).lexically_normal().filename().string(),
      loc.line()
    );

    line += Stylize(std::format("{}{}", LogLevelConst::DEBUG_LINE_PREFIX, fileLine), { .color = LogColor::Gray, .italic = true });
    line += '\n';
#endif

    const types::LockGuard lock(GetLogMutex());
    WriteToConsole(line, ShouldUseStderr(level));
  }

  template <typename ErrorType>
  fn LogError(const LogLevel level, const ErrorType& errorObj) -> types::Unit {
    using DecayedErrorType = std::decay_t<ErrorType>;

#ifndef NDEBUG
    std::source_location logLocation;
#endif

    types::String errorMessagePart;

    if constexpr (std::is_same_v<DecayedErrorType, error::NimbusError>) {
#ifndef NDEBUG
      logLocation = errorObj.location;
#endif
      errorMessagePart = errorObj.message;
    } else {
#ifndef NDEBUG
      logLocation = std::source_location::current();
#endif
      if constexpr (std::is_base_of_v<std::exception, DecayedErrorType>)
        errorMessagePart = errorObj.what();
      else
        errorMessagePart = "Unknown error type logged";
    }

#ifndef NDEBUG
    LogImpl(level, logLocation, "{}", errorMessagePart);
#else
    LogImpl(level, "{}", errorMessagePart);
#endif
  }

#define debug_at(error_obj) ::nimbus::utils::logging::LogError(::nimbus::utils::logging::LogLevel::Debug, error_obj)
#define info_at(error_obj)  ::nimbus::utils::logging::LogError(::nimbus::utils::logging::LogLevel::Info, error_obj)
#define warn_at(error_obj)  ::nimbus::utils::logging::LogError(::nimbus::utils::logging::LogLevel::Warn, error_obj)
#define error_at(error_obj) ::nimbus::utils::logging::LogError(::nimbus::utils::logging::LogLevel::Error, error_obj)

#ifdef NDEBUG
  #define debug_log(fmt, ...) ::nimbus::utils::logging::LogImpl(::nimbus::utils::logging::LogLevel::Debug, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define info_log(fmt, ...)  ::nimbus::utils::logging::LogImpl(::nimbus::utils::logging::LogLevel::Info, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define warn_log(fmt, ...)  ::nimbus::utils::logging::LogImpl(::nimbus::utils::logging::LogLevel::Warn, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define error_log(fmt, ...) ::nimbus::utils::logging::LogImpl(::nimbus::utils::logging::LogLevel::Error, fmt __VA_OPT__(, ) __VA_ARGS__)
#else
  #define debug_log(fmt, ...) \
    ::nimbus::utils::logging::LogImpl(::nimbus::utils::logging::LogLevel::Debug, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define info_log(fmt, ...) \
    ::nimbus::utils::logging::LogImpl(::nimbus::utils::logging::LogLevel::Info, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define warn_log(fmt, ...) \
    ::nimbus::utils::logging::LogImpl(::nimbus::utils::logging::LogLevel::Warn, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define error_log(fmt, ...) \
    ::nimbus::utils::logging::LogImpl(::nimbus::utils::logging::LogLevel::Error, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
#endif
} // namespace nimbus::utils::logging
