/**
 * @file SearchPath.hpp
 * @brief Where Xtend++ looks for installed plugin modules, and where it keeps its cache.
 */

#pragma once

#include <filesystem> // std::filesystem::path

#include "../Utils/Types.hpp"
#include "Plugin.hpp"

namespace xtend::core::plugin {
  namespace fs    = std::filesystem;
  namespace types = ::xtend::utils::types;

  /**
   * @brief Directories listed in XTEND_PATH followed by the configured search paths.
   *
   * Each directory may hold loadable module libraries and "<dist>.xtend-info"
   * metadata directories.
   */
  XTEND_API auto DefaultSearchPath() -> types::Vec<fs::path>;

  /**
   * @brief Replaces the search paths appended after XTEND_PATH (usually from the config file).
   */
  XTEND_API auto SetConfiguredSearchPath(types::Vec<fs::path> paths) -> types::Unit;

  /**
   * @brief The user's cache directory.
   *
   * Windows: %LOCALAPPDATA%\cache. macOS: ~/Library/Caches. Linux: $XDG_CACHE_HOME
   * when it is an absolute path, otherwise ~/.cache.
   */
  XTEND_API auto GetUserCacheDir() -> fs::path;

  /**
   * @brief Absolute path of the running executable, or an empty path when it cannot be determined.
   */
  XTEND_API auto GetExecutablePath() -> fs::path;

  /**
   * @brief The install prefix the library was configured with.
   */
  XTEND_API auto GetInstallPrefix() -> types::String;
} // namespace xtend::core::plugin
