#pragma once

#include <format>          // std::format
#include <matchit.hpp>     // matchit::{match, is, or_, _}
#include <source_location> // std::source_location

#include "Types.hpp"

namespace xtend::utils::error {
  /**
   * @enum XtendErrorCode
   * @brief Error categories reported by the plugin framework and its tooling.
   */
  enum class XtendErrorCode : types::u8 {
    ConfigurationError,  ///< Configuration or environment issue.
    DuplicateEntryPoint, ///< The same entry point name was declared twice within one group.
    InternalError,       ///< An error occurred within the framework's own logic.
    InvalidArgument,     ///< An invalid argument was passed to a function or method.
    IoError,             ///< General I/O error (filesystem, pipes, etc.).
    NotFound,            ///< A required resource (file, module, symbol, plugin) was not found.
    NotSupported,        ///< The requested operation is not supported on this platform or for this input.
    Other,               ///< A generic error, typically converted from an exception thrown by plugin code.
    ParseError,          ///< Failed to parse text (entry point declarations, locators, config).
    PermissionDenied,    ///< Insufficient permissions to perform the operation.
    PluginDisabled,      ///< The plugin was disabled by a filter, its load condition or a listener.
    PluginInitFailed,    ///< The plugin's factory failed.
    PluginLoadFailed,    ///< The plugin's load routine failed.
    PluginNotLoaded,     ///< The plugin went through the lifecycle without ending up loaded.
    ResolutionFailed,    ///< A code object could not be turned into a plugin specification.
  };

  /**
   * @struct XtendError
   * @brief Holds structured information about a failed operation.
   *
   * Used as the error type in Result across the library.
   */
  struct XtendError {
    types::String        message;  ///< A descriptive error message.
    std::source_location location; ///< The source location where the error occurred (file, line, function).
    XtendErrorCode       code;     ///< The general category of the error.

    XtendError(const XtendErrorCode errc, types::String msg, const std::source_location& loc = std::source_location::current())
      : message(std::move(msg)), location(loc), code(errc) {}

    /**
     * @brief Wraps an exception thrown by plugin or listener code.
     */
    static auto fromException(const types::Exception& exc, const std::source_location& loc = std::source_location::current()) -> XtendError {
      return { XtendErrorCode::Other, exc.what(), loc };
    }
  };

  /**
   * @brief Whether an error code belongs to the plugin lifecycle family.
   *
   * Listener hooks that fail with one of these codes are not swallowed by the
   * manager; a PluginDisabled error raised from a hook disables the plugin.
   */
  constexpr auto IsPluginError(const XtendErrorCode code) -> bool {
    using matchit::match, matchit::is, matchit::or_, matchit::_;
    using enum XtendErrorCode;

    return match(code)(
      is | or_(PluginDisabled, PluginInitFailed, PluginLoadFailed, PluginNotLoaded) = true,
      is | _                                                                     = false
    );
  }

  /**
   * @brief Builds the disabled signal for a plugin.
   */
  inline auto PluginDisabledError(
    const types::StringView     ns,
    const types::StringView     name,
    const types::StringView     reason,
    const std::source_location& loc = std::source_location::current()
  ) -> XtendError {
    return { XtendErrorCode::PluginDisabled, std::format("plugin {}:{} is disabled, reason: {}", ns, name, reason), loc };
  }

  /**
   * @brief The reason carried by a disabled signal (the whole message when it has no reason part).
   */
  inline auto DisabledReason(const XtendError& error) -> types::String {
    constexpr types::StringView marker = ", reason: ";

    const types::usize pos = error.message.find(marker);
    if (pos == types::String::npos)
      return error.message;

    return error.message.substr(pos + marker.size());
  }
} // namespace xtend::utils::error

#define ERR(errc, msg)          return ::xtend::utils::types::Err(::xtend::utils::error::XtendError(errc, msg))
#define ERR_FROM(err)           return ::xtend::utils::types::Err(::xtend::utils::error::XtendError(err))
#define ERR_FMT(errc, fmt, ...) return ::xtend::utils::types::Err(::xtend::utils::error::XtendError(errc, std::format(fmt, __VA_ARGS__)))

/**
 * @brief Macro for Rust-style error propagation.
 *
 * Evaluates the given expression (which must return a Result<T, E>). If the
 * result holds an error, the enclosing function returns it wrapped in Err().
 * Otherwise the success value is yielded.
 *
 * @note On GCC/Clang this uses GNU statement expressions. On MSVC the value is
 *       unwrapped by throwing the error, so callers there need a try block.
 *
 * @example
 * @code
 * auto readIndex(const fs::path& file) -> Result<EntryPointIndex> {
 *   String text = TRY(ReadTextFile(file));
 *   auto entryPoints = TRY(ParseEntryPointsText(text));
 *   return BuildEntryPointIndex(entryPoints);
 * }
 * @endcode
 */
#ifdef _MSC_VER
  #define XTEND_CONCAT_IMPL(a, b) a##b
  #define XTEND_CONCAT(a, b)      XTEND_CONCAT_IMPL(a, b)

  #define TRY(expr)            \
    [&]() {                    \
      auto _tmp = (expr);      \
      if (!_tmp)               \
        throw _tmp.error();    \
      return *std::move(_tmp); \
    }()
#else
  #define XTEND_CONCAT_IMPL(a, b) a##b
  #define XTEND_CONCAT(a, b)      XTEND_CONCAT_IMPL(a, b)

  #define TRY(expr)                                                                             \
    _Pragma("clang diagnostic push")                                                            \
      _Pragma("clang diagnostic ignored \"-Wgnu-statement-expression-from-macro-expansion\"")({ \
        auto&& _xtend_try_result = (expr);                                                      \
        if (!_xtend_try_result)                                                                 \
          return ::xtend::utils::types::Err(_xtend_try_result.error());                         \
        std::move(*_xtend_try_result);                                                          \
      })                                                                                        \
        _Pragma("clang diagnostic pop")
#endif

/**
 * @brief Macro for error propagation with Result<void> types.
 *
 * @example
 * @code
 * auto writeCacheFile(const fs::path& file, StringView text) -> Result<> {
 *   TRY_VOID(EnsureParentDirectory(file));
 *   TRY_VOID(WriteTextFile(file, text));
 *   return {};
 * }
 * @endcode
 */
#ifdef _MSC_VER
  #define TRY_VOID(expr)                                               \
    do {                                                               \
      auto&& _xtend_try_result = (expr);                               \
      if (!_xtend_try_result)                                          \
        return ::xtend::utils::types::Err(_xtend_try_result.error());  \
    } while (0)
#else
  #define TRY_VOID(expr)                                                                        \
    _Pragma("clang diagnostic push")                                                            \
      _Pragma("clang diagnostic ignored \"-Wgnu-statement-expression-from-macro-expansion\"")({ \
        auto&& _xtend_try_result = (expr);                                                      \
        if (!_xtend_try_result)                                                                 \
          return ::xtend::utils::types::Err(_xtend_try_result.error());                         \
      })                                                                                        \
        _Pragma("clang diagnostic pop")
#endif
