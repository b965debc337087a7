/**
 * @file CLI.cpp
 * @brief Command handlers of the xtend tool.
 */

#include "CLI.hpp"

#include <algorithm> // std::ranges::{any_of, sort}
#include <fstream>   // std::ofstream
#include <glaze/glaze.hpp>

#include <Xtend++/Core/Filter.hpp>
#include <Xtend++/Core/Finder.hpp>
#include <Xtend++/Core/Listener.hpp>
#include <Xtend++/Core/PluginManager.hpp>

#include <Xtend++/Utils/Error.hpp>
#include <Xtend++/Utils/Logging.hpp>

namespace xtend::cli {
  using namespace utils::types;
  using namespace utils::logging;
  using namespace core::plugin;
  using enum utils::error::XtendErrorCode;

  namespace {
    auto WriteTextFile(const fs::path& file, const StringView contents) -> Result<> {
      std::error_code errc;

      if (file.has_parent_path())
        fs::create_directories(file.parent_path(), errc);

      if (errc)
        ERR_FMT(IoError, "cannot create directory '{}': {}", file.parent_path().string(), errc.message());

      std::ofstream stream(file, std::ios::binary | std::ios::trunc);

      if (!stream)
        ERR_FMT(IoError, "cannot open '{}' for writing", file.string());

      stream << contents;

      if (!stream)
        ERR_FMT(IoError, "error while writing '{}'", file.string());

      return {};
    }

    auto SelectModules(Vec<String> candidates, const DiscoverOptions& options) -> Vec<String> {
      std::erase_if(candidates, [&](const String& module) -> bool {
        if (!options.include.empty() && !std::ranges::any_of(options.include, [&](const String& glob) { return GlobMatch(glob, module); }))
          return true;

        return std::ranges::any_of(options.exclude, [&](const String& glob) { return GlobMatch(glob, module); });
      });

      return candidates;
    }

    /**
     * Reports entry points that failed to resolve during "resolve".
     */
    class ResolveReporter final : public IPluginLifecycleListener {
     public:
      auto onResolveException(const StringView ns, const EntryPoint& entryPoint, const utils::error::XtendError& error) -> Result<> override {
        Print(LogLevel::Error, std::format("{}:{} = {} could not be resolved: {}", ns, entryPoint.name, entryPoint.value, error.message));
        Println(LogLevel::Error);
        return {};
      }
    };
  } // namespace

  auto DiscoverModuleEntryPoints(DynamicCodeLoader& loader, const DiscoverOptions& options) -> Result<EntryPointMap> {
    for (const String& dir : options.libraryDirs)
      loader.addLibraryDir(dir);

    Vec<String> candidates;

    if (options.modules.empty())
      candidates = TRY(loader.importAll());
    else
      for (const String& module : options.modules) {
        TRY_VOID(loader.importModule(module));
        candidates.push_back(module);
      }

    Vec<String> modules = SelectModules(std::move(candidates), options);

    if (modules.empty())
      warn_log("No modules selected for discovery");
    else
      debug_log("Scanning {} module(s) for plugins", modules.size());

    ModuleScanningFinder finder(std::move(modules));
    return DiscoverEntryPoints(finder);
  }

  auto FormatEntryPoints(const EntryPointMap& map, const OutputFormat format) -> Result<String> {
    if (format == OutputFormat::Ini)
      return SerializeEntryPointsText(map);

    // sorted for stable output
    std::map<String, Vec<String>> sorted;
    for (const auto& [group, lines] : map) {
      Vec<String> entries = lines;
      std::ranges::sort(entries);
      sorted.emplace(group, std::move(entries));
    }

    String jsonStr;

    if (const glz::error_ctx errorContext = glz::write<glz::opts { .prettify = true }>(sorted, jsonStr))
      ERR_FMT(InternalError, "Failed to write JSON output: {}", glz::format_error(errorContext, jsonStr));

    jsonStr.push_back('\n');
    return jsonStr;
  }

  auto HandleDiscoverCommand(const DiscoverOptions& options, const OutputFormat format, const Option<fs::path>& output) -> Result<> {
    DynamicCodeLoader loader(DefaultSearchPath());

    const EntryPointMap map  = TRY(DiscoverModuleEntryPoints(loader, options));
    const String        text = TRY(FormatEntryPoints(map, format));

    if (!output) {
      Print(text);
      return {};
    }

    TRY_VOID(WriteTextFile(*output, text));
    info_log("Wrote entry points to {}", output->string());
    return {};
  }

  auto HandleEntrypointsCommand(const DiscoverOptions& options, const fs::path& outputDir, const String& project) -> Result<fs::path> {
    if (project.empty())
      ERR(InvalidArgument, "a project name is required to generate entry points");

    DynamicCodeLoader loader(DefaultSearchPath());

    const EntryPointMap map = TRY(DiscoverModuleEntryPoints(loader, options));

    const fs::path file = outputDir / (project + String(DIST_INFO_SUFFIX)) / ENTRY_POINTS_FILE;
    TRY_VOID(WriteTextFile(file, TRY(SerializeEntryPointsText(map))));

    usize count = 0;
    for (const auto& [group, lines] : map)
      count += lines.size();

    info_log("Wrote {} entry point(s) in {} group(s) to {}", count, map.size(), file.string());
    return file;
  }

  auto HandleResolveCommand(const String& ns) -> Result<> {
    PluginManager manager(ns, { .listeners = { std::make_shared<ResolveReporter>() } });

    const Vec<PluginSpec> specs = TRY(manager.listPluginSpecs());

    for (const PluginSpec& spec : specs) {
      const Option<CodeLocation>& location = spec.factory.location();
      Println("{} = {}", Describe(spec), location ? location->locator() : String("<unexported factory>"));
    }

    debug_log("{} plugin(s) resolved in namespace {}", specs.size(), ns);
    return {};
  }

  auto HandleShowCommand(const fs::path& workdir) -> Result<> {
    const Array<fs::path, 1> searchPath { workdir };

    const Vec<Distribution> distributions = FindDistributions(searchPath);

    if (distributions.empty())
      ERR_FMT(NotFound, "no {} directory in {}, run 'xtend entrypoints' first", DIST_INFO_SUFFIX, workdir.string());

    for (const Distribution& dist : distributions) {
      const Vec<EntryPoint> entryPoints = TRY(ReadEntryPointsFile(dist.entryPointsFile));
      const EntryPointMap   map         = TRY(ToEntryPointMap(entryPoints));

      Println("# {}", dist.entryPointsFile.string());
      Print(TRY(SerializeEntryPointsText(map)));
    }

    return {};
  }

  auto HandleClearCacheCommand(EntryPointsCache& cache) -> Result<> {
    const usize removedCount = TRY(cache.clearDisk());

    if (removedCount > 0)
      Println("Removed {} files.", removedCount);
    else
      Println("No cache files were found to clear.");

    return {};
  }
} // namespace xtend::cli
