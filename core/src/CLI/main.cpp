#include <cstdlib>    // EXIT_SUCCESS, EXIT_FAILURE
#include <filesystem> // std::filesystem::{current_path, path}
#include <format>     // std::format

#include <Xtend++/Core/EntryPointsCache.hpp>
#include <Xtend++/Core/Filter.hpp>
#include <Xtend++/Core/SearchPath.hpp>

#include <Xtend++/Utils/ArgumentParser.hpp>
#include <Xtend++/Utils/Error.hpp>
#include <Xtend++/Utils/Logging.hpp>
#include <Xtend++/Utils/Types.hpp>

#include "CLI.hpp"
#include "Config/Config.hpp"

#ifndef XTEND_VERSION
  #define XTEND_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;

using namespace xtend::utils::types;
using namespace xtend::utils::logging;
using namespace xtend::core::plugin;
using namespace xtend::config;
using namespace xtend::cli;

struct CliOptions {
  // Global
  bool   ignoreCache = false;
  String workdir;
  String configPath;

  // discover / entrypoints
  Vec<String>  modules;
  Vec<String>  libraryDirs;
  Vec<String>  include;
  Vec<String>  exclude;
  OutputFormat format = OutputFormat::Ini;
  String       output;
  String       project;

  // resolve
  String ns;
};

auto main(const i32 argc, CStr* argv[]) -> i32 try {
  CliOptions opts;

  using xtend::utils::argparse::ArgumentParser;

  ArgumentParser parser(std::format("xtend {}", XTEND_VERSION));

  parser
    .addArguments("-v", "--verbose")
    .help("Enable verbose logging. Overrides --log-level.")
    .flag();

  parser
    .addArguments("-l", "--log-level")
    .help("Set the minimum log level.")
    .defaultValue(LogLevel::Info);

  parser
    .addArguments("--workdir")
    .help("Project directory (defaults to the current directory).")
    .defaultValue(String(""))
    .bindTo(opts.workdir);

  parser
    .addArguments("--ignore-cache")
    .help("Neither read nor write the on-disk entry point cache for this run.")
    .flag()
    .bindTo(opts.ignoreCache);

  parser
    .addArguments("--config")
    .help("Configuration file to use instead of the default locations.")
    .defaultValue(String(""))
    .bindTo(opts.configPath);

  const auto addDiscoveryArguments = [&opts](ArgumentParser& command) {
    command
      .addArguments("-m", "--module")
      .help("Module to scan for plugins. May be repeated. Defaults to every module in the library directories.")
      .repeatable()
      .bindTo(opts.modules);

    command
      .addArguments("-p", "--path")
      .help("Additional directory to load module libraries from. May be repeated.")
      .repeatable()
      .bindTo(opts.libraryDirs);

    command
      .addArguments("-e", "--exclude")
      .help("Glob of module names to leave out. May be repeated.")
      .repeatable()
      .bindTo(opts.exclude);

    command
      .addArguments("-i", "--include")
      .help("Glob of module names to scan; others are left out. May be repeated.")
      .repeatable()
      .bindTo(opts.include);
  };

  ArgumentParser& discover = parser.addSubcommand("discover", "Discover plugins in modules and print their entry points.");
  addDiscoveryArguments(discover);

  discover
    .addArguments("-f", "--format")
    .help("Output format.")
    .defaultValue(OutputFormat::Ini)
    .bindToEnum(opts.format);

  discover
    .addArguments("-o", "--output")
    .help("Write to this file instead of standard output.")
    .defaultValue(String(""))
    .bindTo(opts.output);

  ArgumentParser& entrypoints = parser.addSubcommand("entrypoints", "Regenerate <project>.xtend-info/entry_points.txt.");
  addDiscoveryArguments(entrypoints);

  entrypoints
    .addArguments("-o", "--output")
    .help("Directory the .xtend-info directory is written to (defaults to --workdir).")
    .defaultValue(String(""))
    .bindTo(opts.output);

  entrypoints
    .addArguments("--project")
    .help("Project name (defaults to the name of the output directory).")
    .defaultValue(String(""))
    .bindTo(opts.project);

  ArgumentParser& resolve = parser.addSubcommand("resolve", "List the plugins of a namespace without loading them.");

  resolve
    .addArguments("-n", "--namespace")
    .help("Namespace to resolve.")
    .defaultValue(String(""))
    .bindTo(opts.ns);

  parser.addSubcommand("show", "Print the entry points generated in the project directory.");
  parser.addSubcommand("cache-dir", "Print the entry point cache directory.");
  parser.addSubcommand("clear-cache", "Delete the on-disk entry point cache.");

  if (Result<> result = parser.parseInto({ argv, static_cast<usize>(argc) }); !result) {
    error_at(result.error());
    return EXIT_FAILURE;
  }

  const Config config = Config::getInstance(opts.configPath.empty() ? None : Option<fs::path>(opts.configPath));

  if (parser.get<bool>("--verbose"))
    SetRuntimeLogLevel(LogLevel::Debug);
  else if (parser.isUsed("--log-level") || !config.general.logLevel)
    SetRuntimeLogLevel(parser.getEnum<LogLevel>("--log-level"));
  else
    SetRuntimeLogLevel(*config.general.logLevel);

  SetConfiguredSearchPath(config.plugins.searchPaths);

  for (const PluginSpecMatcher& exclusion : config.plugins.exclusions)
    GlobalPluginFilter().addExclusion(exclusion);

  EntryPointsCache& cache = EntryPointsCache::instance();

  if (config.cache.directory)
    cache.setCacheDir(*config.cache.directory);

  cache.setIgnoreDisk(opts.ignoreCache || !config.cache.enabled);

  const fs::path workdir = opts.workdir.empty() ? fs::current_path() : fs::path(opts.workdir);

  const DiscoverOptions discoverOptions {
    .modules     = opts.modules,
    .libraryDirs = opts.libraryDirs,
    .include     = opts.include,
    .exclude     = opts.exclude,
  };

  const Option<String> command = parser.getSubcommand();

  if (!command) {
    parser.printHelp();
    return EXIT_FAILURE;
  }

  Result<> outcome;

  if (*command == "discover")
    outcome = HandleDiscoverCommand(discoverOptions, opts.format, opts.output.empty() ? None : Option<fs::path>(opts.output));
  else if (*command == "entrypoints") {
    const fs::path outputDir = opts.output.empty() ? workdir : fs::path(opts.output);
    const String   project   = opts.project.empty() ? fs::absolute(outputDir).lexically_normal().filename().string() : opts.project;

    if (Result<fs::path> written = HandleEntrypointsCommand(discoverOptions, outputDir, project))
      Println("{}", written->string());
    else
      outcome = Err(written.error());
  } else if (*command == "resolve") {
    if (opts.ns.empty()) {
      error_log("resolve requires --namespace");
      return EXIT_FAILURE;
    }

    outcome = HandleResolveCommand(opts.ns);
  } else if (*command == "show")
    outcome = HandleShowCommand(workdir);
  else if (*command == "cache-dir")
    Println("{}", cache.cacheDir().string());
  else if (*command == "clear-cache")
    outcome = HandleClearCacheCommand(cache);

  if (!outcome) {
    error_at(outcome.error());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
