/**
 * @file Finder.hpp
 * @brief Sources of plugin specifications.
 */

#pragma once

#include <filesystem> // std::filesystem::path

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "CodeLoader.hpp"
#include "EntryPoint.hpp"
#include "EntryPointsCache.hpp"
#include "ModuleRegistry.hpp"
#include "PluginSpec.hpp"

namespace xtend::core::plugin {
  namespace fs    = std::filesystem;
  namespace types = ::xtend::utils::types;

  /**
   * @class IPluginFinder
   * @brief Produces plugin specifications from some source.
   *
   * A finder may return specs of several namespaces; managers keep their own.
   */
  class XTEND_API IPluginFinder {
   public:
    IPluginFinder()                                        = default;
    IPluginFinder(const IPluginFinder&)                    = delete;
    IPluginFinder(IPluginFinder&&)                         = delete;
    auto operator=(const IPluginFinder&) -> IPluginFinder& = delete;
    auto operator=(IPluginFinder&&) -> IPluginFinder&      = delete;
    virtual ~IPluginFinder()                               = default;

    virtual auto findPlugins() -> types::Result<types::Vec<PluginSpec>> = 0;
  };

  /**
   * @class ModuleScanningFinder
   * @brief Resolves every export of a fixed list of registered modules.
   *
   * Exports that are not plugins are skipped. Used when generating entry point
   * declarations, where all candidate modules are known.
   */
  class XTEND_API ModuleScanningFinder final : public IPluginFinder {
   public:
    explicit ModuleScanningFinder(types::Vec<types::String> modules, const ModuleRegistry& registry = ModuleRegistry::instance());

    auto findPlugins() -> types::Result<types::Vec<PluginSpec>> override;

   private:
    types::Vec<types::String> m_modules;
    const ModuleRegistry&     m_registry;
  };

  /**
   * @brief Called for an entry point whose code could not be loaded or resolved.
   */
  using ResolveFailureCallback = types::Fn<void(types::StringView ns, const EntryPoint& entryPoint, const utils::error::XtendError& error)>;

  /**
   * @class MetadataPluginFinder
   * @brief Resolves the installed entry points of one namespace.
   *
   * Each entry point of the namespace's group is loaded through the code loader
   * and resolved into a spec. A failure never reaches the caller: it is handed
   * to the failure callback and that entry point is left out.
   */
  class XTEND_API MetadataPluginFinder final : public IPluginFinder {
   public:
    struct Options {
      ResolveFailureCallback                      onResolveFailure;
      types::SharedPointer<ICodeLoader>           loader;     ///< DynamicCodeLoader::defaultInstance() when unset
      types::SharedPointer<IEntryPointsResolver>  resolver;   ///< EntryPointsCache::shared() when unset
      types::Option<types::Vec<fs::path>>         searchPath; ///< DefaultSearchPath() at find time when unset
    };

    explicit MetadataPluginFinder(types::String ns, Options options = {});

    auto findPlugins() -> types::Result<types::Vec<PluginSpec>> override;

   private:
    types::String                              m_namespace;
    ResolveFailureCallback                     m_onResolveFailure;
    types::SharedPointer<ICodeLoader>          m_loader;
    types::SharedPointer<IEntryPointsResolver> m_resolver;
    types::Option<types::Vec<fs::path>>        m_searchPath;
  };
} // namespace xtend::core::plugin
