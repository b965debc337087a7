#include "Config.hpp"

#include <filesystem> // std::filesystem::{path, operator/, exists, create_directories}
#include <glaze/toml.hpp>
#include <magic_enum/magic_enum.hpp>
#include <system_error> // std::error_code

#include <Xtend++/Utils/Env.hpp>
#include <Xtend++/Utils/Error.hpp>
#include <Xtend++/Utils/Logging.hpp>
#include <Xtend++/Utils/Types.hpp>

namespace fs = std::filesystem;

using namespace xtend::utils::types;
using xtend::utils::env::GetEnv;
using xtend::utils::logging::LogLevel;

// Intermediate structs for TOML parsing with glaze.
// Empty strings stand for "not provided".
namespace {
  struct TomlGeneral {
    String logLevel;
  };

  struct TomlCache {
    bool   enabled = true;
    String directory;
  };

  struct TomlExclusion {
    String ns;
    String name;
    String value;
  };

  struct TomlPlugins {
    Vec<String>        searchPaths;
    Vec<TomlExclusion> exclusions;
  };

  struct TomlConfig {
    TomlGeneral general;
    TomlCache   cache;
    TomlPlugins plugins;
  };
} // namespace

#ifdef __clang__
  #pragma clang diagnostic push
  #pragma clang diagnostic ignored "-Wunused-const-variable"
#endif

template <>
struct glz::meta<TomlGeneral> {
  using T                     = TomlGeneral;
  static constexpr auto value = object("log_level", &T::logLevel);
};

template <>
struct glz::meta<TomlCache> {
  using T                     = TomlCache;
  static constexpr auto value = object("enabled", &T::enabled, "directory", &T::directory);
};

template <>
struct glz::meta<TomlExclusion> {
  using T                     = TomlExclusion;
  static constexpr auto value = object("namespace", &T::ns, "name", &T::name, "value", &T::value);
};

template <>
struct glz::meta<TomlPlugins> {
  using T                     = TomlPlugins;
  static constexpr auto value = object("search_paths", &T::searchPaths, "exclusions", &T::exclusions);
};

template <>
struct glz::meta<TomlConfig> {
  using T                     = TomlConfig;
  static constexpr auto value = object("general", &T::general, "cache", &T::cache, "plugins", &T::plugins);
};

#ifdef __clang__
  #pragma clang diagnostic pop
#endif

namespace {
  auto NonEmpty(const String& value) -> Option<String> {
    return value.empty() ? None : Option<String>(value);
  }

  auto CreateDefaultConfig(const fs::path& configPath) -> bool {
    std::error_code errc;
    create_directories(configPath.parent_path(), errc);

    if (errc) {
      error_log("Failed to create config directory: {}", errc.message());
      return false;
    }

    TomlConfig defaultCfg;
    defaultCfg.general.logLevel = "info";

    String     buffer;
    const auto writeError = glz::write_file_toml(defaultCfg, configPath.string(), buffer);

    if (writeError) {
      error_log("Failed to write default config: {}", glz::format_error(writeError, buffer));
      return false;
    }

    info_log("Created default config file at {}", configPath.string());
    return true;
  }
} // namespace

namespace xtend::config {
  auto Config::getConfigPath() -> fs::path {
    Vec<fs::path> possiblePaths;

#ifdef _WIN32
    if (Result<String> result = GetEnv("LOCALAPPDATA"))
      possiblePaths.emplace_back(fs::path(*result) / "xtend++" / "config.toml");

    if (Result<String> result = GetEnv("APPDATA"))
      possiblePaths.emplace_back(fs::path(*result) / "xtend++" / "config.toml");
#else
    if (Result<String> result = GetEnv("XDG_CONFIG_HOME"))
      possiblePaths.emplace_back(fs::path(*result) / "xtend++" / "config.toml");

    if (Result<String> result = GetEnv("HOME"))
      possiblePaths.emplace_back(fs::path(*result) / ".config" / "xtend++" / "config.toml");
#endif

    possiblePaths.emplace_back(fs::path(".") / "config.toml");

    for (const fs::path& path : possiblePaths)
      if (std::error_code errc; fs::exists(path, errc) && !errc)
        return path;

    return possiblePaths.front();
  }

  auto Config::load(const fs::path& path) -> Result<Config> {
    using enum utils::error::XtendErrorCode;

    TomlConfig tomlCfg;
    String     buffer;

    glz::context ctx {};
    ctx.current_file = path.string();
    if (const auto fileError = glz::file_to_buffer(buffer, ctx.current_file); bool(fileError))
      ERR_FMT(IoError, "Failed to read config file: {}", path.string());

    // unknown keys are tolerated so other tools can share the file
    if (const auto readError = glz::read<glz::opts { .format = glz::TOML, .error_on_unknown_keys = false }>(tomlCfg, buffer, ctx))
      ERR_FMT(ParseError, "Failed to parse config file: {}", glz::format_error(readError, buffer));

    Config cfg;

    if (!tomlCfg.general.logLevel.empty()) {
      cfg.general.logLevel = magic_enum::enum_cast<LogLevel>(tomlCfg.general.logLevel, magic_enum::case_insensitive);

      if (!cfg.general.logLevel)
        ERR_FMT(ConfigurationError, "Unknown log level in config: {}", tomlCfg.general.logLevel);
    }

    cfg.cache.enabled = tomlCfg.cache.enabled;
    if (!tomlCfg.cache.directory.empty())
      cfg.cache.directory = fs::path(tomlCfg.cache.directory);

    for (const String& searchPath : tomlCfg.plugins.searchPaths)
      if (!searchPath.empty())
        cfg.plugins.searchPaths.emplace_back(searchPath);

    for (const TomlExclusion& exclusion : tomlCfg.plugins.exclusions) {
      core::plugin::PluginSpecMatcher matcher {
        .ns    = NonEmpty(exclusion.ns),
        .name  = NonEmpty(exclusion.name),
        .value = NonEmpty(exclusion.value),
      };

      // an exclusion without patterns would disable every plugin
      if (!matcher.ns && !matcher.name && !matcher.value) {
        warn_log("Ignoring plugin exclusion without any pattern in {}", path.string());
        continue;
      }

      cfg.plugins.exclusions.push_back(std::move(matcher));
    }

    debug_log("Config loaded from {}", path.string());
    return cfg;
  }

  auto Config::getInstance(const Option<fs::path>& explicitPath) -> Config {
    const fs::path configPath = explicitPath.value_or(getConfigPath());

    std::error_code errc;

    if (!fs::exists(configPath, errc)) {
      if (explicitPath) {
        warn_log("Config file {} does not exist, using defaults.", configPath.string());
        return {};
      }

      info_log("Config file not found at {}, creating defaults.", configPath.string());

      if (!CreateDefaultConfig(configPath))
        return {};
    }

    Result<Config> cfg = load(configPath);

    if (!cfg) {
      error_at(cfg.error());
      return {};
    }

    return *std::move(cfg);
  }
} // namespace xtend::config
