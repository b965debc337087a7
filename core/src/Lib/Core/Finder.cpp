#include <Xtend++/Core/Finder.hpp>
#include <Xtend++/Core/SearchPath.hpp>

#include <Xtend++/Utils/Logging.hpp>

namespace xtend::core::plugin {
  using namespace utils::types;
  using utils::error::XtendError;

  ModuleScanningFinder::ModuleScanningFinder(Vec<String> modules, const ModuleRegistry& registry)
    : m_modules(std::move(modules)), m_registry(registry) {}

  auto ModuleScanningFinder::findPlugins() -> Result<Vec<PluginSpec>> {
    Vec<PluginSpec> specs;

    for (const String& module : m_modules) {
      const Vec<ModuleRegistry::Member> members = TRY(m_registry.members(module));

      for (const auto& [symbol, object] : members) {
        Result<PluginSpec> spec = ResolveSpec(object);

        if (!spec) {
          trace_log("{}:{} is not a plugin: {}", module, symbol, spec.error().message);
          continue;
        }

        debug_log("Found plugin {} at {}:{}", Describe(*spec), module, symbol);
        specs.push_back(*std::move(spec));
      }
    }

    return specs;
  }

  MetadataPluginFinder::MetadataPluginFinder(String ns, Options options)
    : m_namespace(std::move(ns)),
      m_onResolveFailure(std::move(options.onResolveFailure)),
      m_loader(options.loader ? std::move(options.loader) : DynamicCodeLoader::defaultInstance()),
      m_resolver(options.resolver ? std::move(options.resolver) : EntryPointsCache::shared()),
      m_searchPath(std::move(options.searchPath)) {}

  auto MetadataPluginFinder::findPlugins() -> Result<Vec<PluginSpec>> {
    const Vec<fs::path> searchPath = m_searchPath.value_or(DefaultSearchPath());

    const EntryPointIndex index = TRY(m_resolver->getEntryPoints(searchPath));

    const auto group = index.find(m_namespace);
    if (group == index.end()) {
      debug_log("No entry points declared for namespace {}", m_namespace);
      return Vec<PluginSpec> {};
    }

    Vec<PluginSpec> specs;
    specs.reserve(group->second.size());

    for (const EntryPoint& entryPoint : group->second) {
      Result<PluginSpec> spec = m_loader->load(entryPoint.value).and_then(ResolveSpec);

      if (!spec) {
        debug_log("Skipping entry point {} = {}: {}", entryPoint.name, entryPoint.value, spec.error().message);

        if (m_onResolveFailure)
          m_onResolveFailure(m_namespace, entryPoint, spec.error());

        continue;
      }

      specs.push_back(*std::move(spec));
    }

    return specs;
  }
} // namespace xtend::core::plugin
