#pragma once

#include <cstdlib> // std::getenv, setenv, unsetenv, _dupenv_s, _putenv_s

#include "Error.hpp"
#include "Types.hpp"

namespace xtend::utils::env {
  namespace types = ::xtend::utils::types;
  namespace error = ::xtend::utils::error;

  using enum error::XtendErrorCode;

  /**
   * @brief Retrieves an environment variable.
   * @param name The name of the environment variable.
   * @return The value, or NotFound when it is unset.
   */
  [[nodiscard]] inline auto GetEnv(const types::PCStr name) -> types::Result<types::String> {
#ifdef _WIN32
    types::CStr* rawPtr     = nullptr;
    types::usize bufferSize = 0;

    const types::i32 err = _dupenv_s(&rawPtr, &bufferSize, name);

    const types::UniquePointer<types::CStr, decltype(&free)> ptrManager(rawPtr, free);

    if (err != 0)
      ERR_FMT(PermissionDenied, "Failed to retrieve environment variable '{}'", name);

    if (!ptrManager)
      ERR_FMT(NotFound, "Environment variable '{}' not found", name);

    return types::String(ptrManager.get());
#else
    const types::PCStr value = std::getenv(name);

    if (!value)
      ERR_FMT(NotFound, "Environment variable '{}' not found", name);

    return types::String(value);
#endif
  }

  /**
   * @brief Sets an environment variable, replacing any previous value.
   */
  inline auto SetEnv(const types::PCStr name, const types::PCStr value) -> types::Result<> {
#ifdef _WIN32
    if (_putenv_s(name, value) != 0)
#else
    if (setenv(name, value, 1) != 0)
#endif
      ERR_FMT(InvalidArgument, "Failed to set environment variable '{}'", name);

    return {};
  }

  /**
   * @brief Removes an environment variable.
   */
  inline auto UnsetEnv(const types::PCStr name) -> types::Result<> {
#ifdef _WIN32
    if (_putenv_s(name, "") != 0)
#else
    if (unsetenv(name) != 0)
#endif
      ERR_FMT(InvalidArgument, "Failed to unset environment variable '{}'", name);

    return {};
  }

  /**
   * @brief Splits a PATH-style list (':' on POSIX, ';' on Windows), dropping empty items.
   */
  inline auto SplitPathList(const types::StringView list) -> types::Vec<types::String> {
#ifdef _WIN32
    constexpr types::CStr SEPARATOR = ';';
#else
    constexpr types::CStr SEPARATOR = ':';
#endif

    types::Vec<types::String> items;
    types::usize              start = 0;

    while (start <= list.size()) {
      types::usize end = list.find(SEPARATOR, start);
      if (end == types::StringView::npos)
        end = list.size();

      if (end > start)
        items.emplace_back(list.substr(start, end - start));

      start = end + 1;
    }

    return items;
  }
} // namespace xtend::utils::env
