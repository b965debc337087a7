/**
 * @file CLI.hpp
 * @brief Command handlers of the xtend tool.
 */

#pragma once

#include <filesystem> // std::filesystem::path

#include <Xtend++/Core/CodeLoader.hpp>
#include <Xtend++/Core/EntryPoint.hpp>
#include <Xtend++/Core/EntryPointsCache.hpp>

#include <Xtend++/Utils/Types.hpp>

namespace xtend::cli {
  namespace fs = std::filesystem;

  enum class OutputFormat : utils::types::u8 {
    Ini,
    Json,
  };

  /**
   * @struct DiscoverOptions
   * @brief Which modules to scan for plugins.
   *
   * Named modules are imported from the library directories. Without names,
   * every module library in the library directories is opened and all of
   * their modules are scanned. Module names are then narrowed by the include
   * and exclude globs.
   */
  struct DiscoverOptions {
    utils::types::Vec<utils::types::String> modules;
    utils::types::Vec<utils::types::String> libraryDirs;
    utils::types::Vec<utils::types::String> include;
    utils::types::Vec<utils::types::String> exclude;
  };

  /**
   * @brief Scans the selected modules and returns their entry points.
   * @param loader Loader the modules are imported with
   */
  auto DiscoverModuleEntryPoints(core::plugin::DynamicCodeLoader& loader, const DiscoverOptions& options) -> utils::types::Result<core::plugin::EntryPointMap>;

  /**
   * @brief Renders an entry point map as INI text or as a JSON object of arrays.
   */
  auto FormatEntryPoints(const core::plugin::EntryPointMap& map, OutputFormat format) -> utils::types::Result<utils::types::String>;

  /**
   * @brief "discover": prints the entry points, or writes them to @p output.
   */
  auto HandleDiscoverCommand(const DiscoverOptions& options, OutputFormat format, const utils::types::Option<fs::path>& output) -> utils::types::Result<>;

  /**
   * @brief "entrypoints": regenerates "<outputDir>/<project>.xtend-info/entry_points.txt".
   * @return The written file
   */
  auto HandleEntrypointsCommand(const DiscoverOptions& options, const fs::path& outputDir, const utils::types::String& project) -> utils::types::Result<fs::path>;

  /**
   * @brief "resolve": lists the plugins of a namespace without loading them.
   */
  auto HandleResolveCommand(const utils::types::String& ns) -> utils::types::Result<>;

  /**
   * @brief "show": prints the declarations generated in @p workdir.
   */
  auto HandleShowCommand(const fs::path& workdir) -> utils::types::Result<>;

  /**
   * @brief "clear-cache": deletes the cache files.
   */
  auto HandleClearCacheCommand(core::plugin::EntryPointsCache& cache) -> utils::types::Result<>;
} // namespace xtend::cli
