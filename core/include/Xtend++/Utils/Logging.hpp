#pragma once

#include <algorithm>  // std::copy_n
#include <chrono>     // std::chrono::system_clock
#include <ctime>      // localtime_r/s, strftime, time_t, tm
#include <filesystem> // std::filesystem::path
#include <format>     // std::format
#include <utility>    // std::forward

#ifdef _WIN32
  #ifndef NOMINMAX
    #define NOMINMAX
  #endif
  #include <windows.h>
#endif

#ifdef __cpp_lib_print
  #include <print> // std::print
#else
  #include <iostream> // std::cout, std::cerr
#endif

#include <source_location> // std::source_location

#include "Error.hpp"
#include "Types.hpp"

namespace xtend::utils::logging {
  namespace types = ::xtend::utils::types;

  inline auto GetLogMutex() -> types::Mutex& {
    static types::Mutex LogMutexInstance;
    return LogMutexInstance;
  }

  /**
   * @brief Writes text to the console, going through the Win32 console API where available.
   * @param text The text to write
   * @param useStderr Whether to write to stderr instead of stdout
   */
  inline auto WriteToConsole(const types::StringView text, bool useStderr = false) -> void {
#ifdef _WIN32
    HANDLE hOutput = GetStdHandle(useStderr ? STD_ERROR_HANDLE : STD_OUTPUT_HANDLE);
    if (hOutput != INVALID_HANDLE_VALUE) {
      DWORD consoleMode = 0;
      if (GetConsoleMode(hOutput, &consoleMode))
        WriteConsoleA(hOutput, text.data(), static_cast<DWORD>(text.size()), nullptr, nullptr);
      else
        WriteFile(hOutput, text.data(), static_cast<DWORD>(text.size()), nullptr, nullptr);
      return;
    }
#endif

#ifdef __cpp_lib_print
    if (useStderr)
      std::print(stderr, "{}", text);
    else
      std::print("{}", text);
#else
    if (useStderr)
      std::cerr << text;
    else
      std::cout << text;
#endif
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
    static constexpr types::PCStr DIM_START    = "\033[2m";

    // bold + color + text + reset
    static constexpr types::StringView TRACE_STYLED = "\033[1m\033[38;5;5mTRACE\033[0m";
    static constexpr types::StringView DEBUG_STYLED = "\033[1m\033[38;5;4mDEBUG\033[0m";
    static constexpr types::StringView INFO_STYLED  = "\033[1m\033[38;5;2mINFO \033[0m";
    static constexpr types::StringView WARN_STYLED  = "\033[1m\033[38;5;3mWARN \033[0m";
    static constexpr types::StringView ERROR_STYLED = "\033[1m\033[38;5;1mERROR\033[0m";

    static constexpr types::PCStr TIMESTAMP_FORMAT = "%Y-%m-%dT%H:%M:%S";
  };

  /**
   * @enum LogLevel
   * @brief Represents different log levels (tracing-style).
   */
  enum class LogLevel : types::u8 {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
  };

  /**
   * @brief Storage for a log level owned by another module.
   *
   * Dynamically loaded plugin modules carry their own copy of this header's
   * statics. The host hands them a pointer to its level so both stay in sync.
   */
  inline auto GetLogLevelPtrStorage() -> LogLevel*& {
    static LogLevel* Ptr = nullptr;
    return Ptr;
  }

  inline auto GetLocalLogLevel() -> LogLevel& {
    static LogLevel Level = LogLevel::Info;
    return Level;
  }

  inline auto SetLogLevelPtr(LogLevel* ptr) -> void {
    GetLogLevelPtrStorage() = ptr;
  }

  inline auto GetLogLevelPtr() -> LogLevel* {
    return &GetLocalLogLevel();
  }

  inline auto GetRuntimeLogLevel() -> LogLevel& {
    if (LogLevel* ptr = GetLogLevelPtrStorage())
      return *ptr;
    return GetLocalLogLevel();
  }

  inline auto SetRuntimeLogLevel(const LogLevel level) {
    if (LogLevel* ptr = GetLogLevelPtrStorage())
      *ptr = level;
    else
      GetLocalLogLevel() = level;
  }

  /**
   * @brief Receives every record that passes the level check, after it was written.
   *
   * Runs on the logging thread without the log lock held.
   */
  using LogSink = types::Fn<void(LogLevel, types::StringView)>;

  inline auto GetLogSink() -> LogSink& {
    static LogSink Sink;
    return Sink;
  }

  /**
   * @brief Installs (or, with an empty function, removes) the process-wide log sink.
   */
  inline auto SetLogSink(LogSink sink) -> void {
    const types::LockGuard lock(GetLogMutex());
    GetLogSink() = std::move(sink);
  }

  /**
   * @struct Style
   * @brief Options for text styling with ANSI codes.
   */
  struct Style {
    LogColor color  = LogColor::White;
    bool     bold   = false;
    bool     italic = false;
    bool     dim    = false;
  };

  inline auto Stylize(const types::StringView text, const Style& style) -> types::String {
    const bool hasStyle = style.bold || style.italic || style.dim || style.color != LogColor::White;

    if (!hasStyle)
      return types::String(text);

    types::String result;
    result.reserve(text.size() + 32);

    if (style.bold)
      result += LogLevelConst::BOLD_START;
    if (style.italic)
      result += LogLevelConst::ITALIC_START;
    if (style.dim)
      result += LogLevelConst::DIM_START;
    if (style.color != LogColor::White)
      result += LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<types::usize>(style.color));

    result += text;
    result += LogLevelConst::RESET_CODE;

    return result;
  }

  constexpr auto GetLevelInfo() -> const types::Array<types::StringView, 5>& {
    static constexpr types::Array<types::StringView, 5> LEVEL_INFO_INSTANCE = {
      LogLevelConst::TRACE_STYLED,
      LogLevelConst::DEBUG_STYLED,
      LogLevelConst::INFO_STYLED,
      LogLevelConst::WARN_STYLED,
      LogLevelConst::ERROR_STYLED,
    };
    return LEVEL_INFO_INSTANCE;
  }

  constexpr auto ShouldUseStderr(const LogLevel level) -> bool {
    return level == LogLevel::Warn || level == LogLevel::Error;
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // Print Helpers
  // ─────────────────────────────────────────────────────────────────────────────

  inline auto Print(const LogLevel level, const types::StringView text) {
    WriteToConsole(text, ShouldUseStderr(level));
  }

  inline auto Println(const LogLevel level) {
    WriteToConsole("\n", ShouldUseStderr(level));
  }

  // User-facing print (stdout only)
  template <typename... Args>
  inline auto Print(std::format_string<Args...> fmt, Args&&... args) {
    WriteToConsole(std::format(fmt, std::forward<Args>(args)...));
  }

  inline auto Print(const types::StringView text) {
    WriteToConsole(text);
  }

  template <typename... Args>
  inline auto Println(std::format_string<Args...> fmt, Args&&... args) {
    WriteToConsole(std::format(fmt, std::forward<Args>(args)...) + '\n');
  }

  inline auto Println(const types::StringView text) {
    types::String textWithNewline(text);
    textWithNewline += '\n';
    WriteToConsole(textWithNewline);
  }

  inline auto Println() {
    WriteToConsole("\n");
  }

  /**
   * @brief Returns a ISO8601-like timestamp string (YYYY-MM-DDTHH:MM:SS).
   */
  inline auto GetCachedTimestamp(const std::time_t timeT) -> types::StringView {
    thread_local auto                   LastTt   = static_cast<std::time_t>(-1);
    thread_local types::Array<char, 20> TsBuffer = { '\0' };

    if (timeT != LastTt) {
      std::tm localTm {};

      if (
#ifdef _WIN32
        localtime_s(&localTm, &timeT) == 0
#else
        localtime_r(&timeT, &localTm) != nullptr
#endif
      ) {
        if (std::strftime(TsBuffer.data(), TsBuffer.size(), LogLevelConst::TIMESTAMP_FORMAT, &localTm) == 0)
          std::copy_n("????-??-??T??:??:??", 20, TsBuffer.data());
      } else
        std::copy_n("????-??-??T??:??:??", 20, TsBuffer.data());

      LastTt = timeT;
    }

    return { TsBuffer.data(), 19 };
  }

  /**
   * @brief Turns a compiler function signature into a module-like target.
   * @details "auto xtend::core::plugin::PluginManager::load(...)" becomes "xtend::core::plugin::PluginManager".
   */
  inline auto ExtractTarget(const types::StringView func) -> types::String {
    types::usize parenPos = func.find('(');
    if (parenPos == types::StringView::npos)
      parenPos = func.size();

    const types::usize lastColonPos = func.rfind("::", parenPos);
    if (lastColonPos == types::StringView::npos)
      return types::String(func.substr(0, parenPos));

    const types::usize spacePos = func.rfind(' ', lastColonPos);
    const types::usize startPos = (spacePos != types::StringView::npos) ? spacePos + 1 : 0;

    return types::String(func.substr(startPos, lastColonPos - startPos));
  }

  template <typename... Args>
  auto LogImpl(
    const LogLevel              level,
    const std::source_location& loc,
    std::format_string<Args...> fmt,
    Args&&... args
  ) {
    using namespace std::chrono;
    using std::filesystem::path;

    if (level < GetRuntimeLogLevel())
      return;

    const std::time_t       nowTt     = system_clock::to_time_t(system_clock::now());
    const types::StringView timestamp = GetCachedTimestamp(nowTt);
    const types::String     message   = std::format(fmt, std::forward<Args>(args)...);
    const types::String     target    = ExtractTarget(loc.function_name());

    LogSink sink;

    {
      const types::LockGuard lock(GetLogMutex());

      // timestamp LEVEL file:line target: message
      Print(level, Stylize(timestamp, { .color = LogColor::Gray, .dim = true }));
      Print(level, " ");
      Print(level, GetLevelInfo().at(static_cast<types::usize>(level)));
      Print(level, " ");
#ifndef NDEBUG
      Print(level, Stylize(std::format("{}:{}", path(loc.file_name()).filename().string(), loc.line()), { .color = LogColor::Gray, .italic = true }));
      Print(level, " ");
#endif
      Print(level, Stylize(target, { .bold = true }));
      Print(level, ": ");
      Print(level, message);
      Println(level);

      sink = GetLogSink();
    }

    // sinks run without the log lock and may log
    if (sink)
      sink(level, message);
  }

  /**
   * @brief Logs an error object at the location it was created.
   */
  template <typename ErrorType>
  auto LogError(const LogLevel level, const ErrorType& errorObj, const std::source_location& here = std::source_location::current()) {
    using DecayedErrorType = std::decay_t<ErrorType>;

    if constexpr (std::is_same_v<DecayedErrorType, error::XtendError>)
      LogImpl(level, errorObj.location, "{}", errorObj.message);
    else if constexpr (std::is_base_of_v<std::exception, DecayedErrorType>)
      LogImpl(level, here, "{}", errorObj.what());
    else if constexpr (requires { errorObj.message; })
      LogImpl(level, here, "{}", errorObj.message);
    else
      LogImpl(level, here, "{}", "Unknown error type logged");
  }
} // namespace xtend::utils::logging

#define trace_log(fmt, ...) \
  ::xtend::utils::logging::LogImpl(::xtend::utils::logging::LogLevel::Trace, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define debug_log(fmt, ...) \
  ::xtend::utils::logging::LogImpl(::xtend::utils::logging::LogLevel::Debug, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define info_log(fmt, ...) \
  ::xtend::utils::logging::LogImpl(::xtend::utils::logging::LogLevel::Info, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define warn_log(fmt, ...) \
  ::xtend::utils::logging::LogImpl(::xtend::utils::logging::LogLevel::Warn, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define error_log(fmt, ...) \
  ::xtend::utils::logging::LogImpl(::xtend::utils::logging::LogLevel::Error, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define debug_at(error_obj) ::xtend::utils::logging::LogError(::xtend::utils::logging::LogLevel::Debug, error_obj)
#define warn_at(error_obj)  ::xtend::utils::logging::LogError(::xtend::utils::logging::LogLevel::Warn, error_obj)
#define error_at(error_obj) ::xtend::utils::logging::LogError(::xtend::utils::logging::LogLevel::Error, error_obj)
