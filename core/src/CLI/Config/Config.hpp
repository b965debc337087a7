#pragma once

#include <filesystem> // std::filesystem::path

#include <Xtend++/Core/Filter.hpp>

#include <Xtend++/Utils/Logging.hpp>
#include <Xtend++/Utils/Types.hpp>

namespace xtend::config {
  /**
   * @struct General
   * @brief Holds general configuration settings.
   */
  struct General {
    xtend::utils::types::Option<xtend::utils::logging::LogLevel> logLevel; ///< Overridden by --log-level and --verbose.
  };

  /**
   * @struct Cache
   * @brief Settings of the on-disk entry point cache.
   */
  struct Cache {
    bool                                                   enabled = true;
    xtend::utils::types::Option<std::filesystem::path>     directory; ///< Defaults to "<user cache dir>/xtend".
  };

  /**
   * @struct Plugins
   * @brief Where plugins are installed and which ones are never loaded.
   */
  struct Plugins {
    xtend::utils::types::Vec<std::filesystem::path>                     searchPaths;
    xtend::utils::types::Vec<xtend::core::plugin::PluginSpecMatcher>    exclusions;
  };

  /**
   * @struct Config
   * @brief Holds the application configuration settings.
   */
  struct Config {
    General general;
    Cache   cache;
    Plugins plugins;

    Config() = default;

    /**
     * @brief Loads the configuration file, creating a default one when none exists.
     * @param explicitPath A file given on the command line; used instead of the search
     * @return The parsed settings, or defaults when the file cannot be read
     */
    static auto getInstance(const xtend::utils::types::Option<std::filesystem::path>& explicitPath = xtend::utils::types::None) -> Config;

    /**
     * @brief Parses one configuration file.
     */
    static auto load(const std::filesystem::path& path) -> xtend::utils::types::Result<Config>;

    /**
     * @brief Gets the path to the configuration file without loading it.
     */
    static auto getConfigPath() -> std::filesystem::path;
  };
} // namespace xtend::config
