#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name

#include <Xtend++/Core/PluginManager.hpp>

#include <Xtend++/Utils/Logging.hpp>

namespace xtend::core::plugin {
  using namespace utils::types;
  using enum utils::error::XtendErrorCode;
  using utils::error::PluginDisabledError;
  using utils::error::XtendError;

  namespace {
    constexpr StringView FILTER_DISABLED_REASON    = "A plugin filter disabled this plugin before it was initialized";
    constexpr StringView CONDITION_DISABLED_REASON = "Load condition for plugin was false";
  } // namespace

  auto PluginContainer::plugin() const -> IPlugin* {
    const RecursiveLockGuard lock(m_mutex);
    return m_plugin.get();
  }

  auto PluginContainer::loadValue() const -> LoadValue {
    const RecursiveLockGuard lock(m_mutex);
    return m_loadValue;
  }

  auto PluginContainer::initError() const -> Option<XtendError> {
    const RecursiveLockGuard lock(m_mutex);
    return m_initError;
  }

  auto PluginContainer::loadError() const -> Option<XtendError> {
    const RecursiveLockGuard lock(m_mutex);
    return m_loadError;
  }

  auto PluginContainer::disabledReason() const -> Option<String> {
    const RecursiveLockGuard lock(m_mutex);
    return m_disabledReason;
  }

  auto PluginContainer::distribution(const Span<const fs::path> searchPath) const -> Option<Distribution> {
    return ResolveDistribution(m_spec, searchPath);
  }

  PluginManager::PluginManager(String ns, PluginManagerOptions options)
    : m_namespace(std::move(ns)),
      m_loadArgs(std::move(options.loadArgs)),
      m_dispatcher(std::move(options.listeners)),
      m_filters(options.filters ? *std::move(options.filters) : Vec<PluginFilter> { GlobalPluginFilter().asFilter() }),
      m_finder(std::move(options.finder)) {
    if (!m_finder)
      m_finder = std::make_shared<MetadataPluginFinder>(
        m_namespace,
        MetadataPluginFinder::Options {
          .onResolveFailure = [this](const StringView ns, const EntryPoint& entryPoint, const XtendError& error) -> void {
            if (Result<> hook = m_dispatcher.fireResolveException(ns, entryPoint, error); !hook)
              debug_log("Ignoring {} raised by onResolveException: {}", magic_enum::enum_name(hook.error().code), hook.error().message);
          },
          .loader     = nullptr,
          .resolver   = nullptr,
          .searchPath = None,
        }
      );
  }

  auto PluginManager::addListener(ListenerPtr listener) -> Unit {
    m_dispatcher.add(std::move(listener));
  }

  auto PluginManager::addFilter(PluginFilter filter) -> Unit {
    const LockGuard lock(m_filtersMutex);
    m_filters.push_back(std::move(filter));
  }

  auto PluginManager::filtersSnapshot() const -> Vec<PluginFilter> {
    const LockGuard lock(m_filtersMutex);
    return m_filters;
  }

  auto PluginManager::load(const StringView name) -> Result<IPlugin*> {
    PluginContainer* container = TRY(requirePlugin(name));

    // the instance never changes once loaded
    if (container->isLoaded())
      return container->m_plugin.get();

    if (container->isDisabled())
      return Err(PluginDisabledError(m_namespace, name, container->disabledReason().value_or("")));

    const RecursiveLockGuard lock(container->m_mutex);

    // another thread may have finished while we waited for the lock
    if (container->m_isDisabled)
      return Err(PluginDisabledError(m_namespace, name, container->m_disabledReason.value_or("")));

    if (!container->m_isLoaded && !container->m_initError && !container->m_loadError)
      if (Result<> attempt = loadPlugin(*container); !attempt) {
        if (attempt.error().code == PluginDisabled) {
          container->m_disabledReason = utils::error::DisabledReason(attempt.error());
          container->m_isDisabled.store(true, std::memory_order_release);
        }

        return Err(attempt.error());
      }

    if (container->m_initError)
      return Err(*container->m_initError);

    if (container->m_loadError)
      return Err(*container->m_loadError);

    if (!container->m_isLoaded)
      ERR_FMT(PluginNotLoaded, "plugin {}:{} did not load correctly", m_namespace, name);

    return container->m_plugin.get();
  }

  auto PluginManager::loadAll(const bool propagateErrors) -> Result<Vec<IPlugin*>> {
    const PluginIndex* index = TRY(plugins());

    Vec<IPlugin*> loaded;

    for (const UniquePointer<PluginContainer>& container : index->containers) {
      if (container->isLoaded()) {
        loaded.push_back(container->plugin());
        continue;
      }

      Result<IPlugin*> plugin = load(container->name());

      if (plugin) {
        loaded.push_back(*plugin);
        continue;
      }

      if (plugin.error().code == PluginDisabled)
        debug_log("{}", plugin.error().message);
      else if (propagateErrors)
        return Err(plugin.error());
      else
        error_log("exception while loading plugin {}:{}: {}", m_namespace, container->name(), plugin.error().message);
    }

    return loaded;
  }

  auto PluginManager::listPluginSpecs() -> Result<Vec<PluginSpec>> {
    const PluginIndex* index = TRY(plugins());

    Vec<PluginSpec> specs;
    specs.reserve(index->containers.size());

    for (const UniquePointer<PluginContainer>& container : index->containers)
      specs.push_back(container->spec());

    return specs;
  }

  auto PluginManager::listNames() -> Result<Vec<String>> {
    const PluginIndex* index = TRY(plugins());

    Vec<String> names;
    names.reserve(index->containers.size());

    for (const UniquePointer<PluginContainer>& container : index->containers)
      names.push_back(container->name());

    return names;
  }

  auto PluginManager::listContainers() -> Result<Vec<PluginContainer*>> {
    const PluginIndex* index = TRY(plugins());

    Vec<PluginContainer*> containers;
    containers.reserve(index->containers.size());

    for (const UniquePointer<PluginContainer>& container : index->containers)
      containers.push_back(container.get());

    return containers;
  }

  auto PluginManager::getContainer(const StringView name) -> Result<PluginContainer*> {
    return requirePlugin(name);
  }

  auto PluginManager::exists(const StringView name) -> bool {
    Result<const PluginIndex*> index = plugins();

    if (!index) {
      error_at(index.error());
      return false;
    }

    return (*index)->positions.contains(String(name));
  }

  auto PluginManager::isLoaded(const StringView name) -> Result<bool> {
    const PluginContainer* container = TRY(requirePlugin(name));
    return container->isLoaded();
  }

  auto PluginManager::plugins() -> Result<const PluginIndex*> {
    if (m_indexBuilt.load(std::memory_order_acquire))
      return &m_index;

    const LockGuard lock(m_indexMutex);

    if (!m_indexBuilt.load(std::memory_order_relaxed)) {
      // a failed discovery is retried on the next call
      m_index = TRY(initPluginIndex());
      m_indexBuilt.store(true, std::memory_order_release);
    }

    return &m_index;
  }

  auto PluginManager::initPluginIndex() -> Result<PluginIndex> {
    const Vec<PluginSpec> specs = TRY(m_finder->findPlugins());

    PluginIndex index;

    for (const PluginSpec& spec : specs) {
      TRY_VOID(m_dispatcher.fireResolveAfter(spec));

      if (spec.ns != m_namespace)
        continue;

      auto container = std::make_unique<PluginContainer>(spec);

      if (const auto existing = index.positions.find(spec.name); existing != index.positions.end()) {
        debug_log("Plugin {} found again, replacing the earlier spec", Describe(spec));
        index.containers.at(existing->second) = std::move(container);
      } else {
        index.positions.emplace(spec.name, index.containers.size());
        index.containers.push_back(std::move(container));
      }
    }

    debug_log("Resolved {} plugin(s) in namespace {}", index.containers.size(), m_namespace);
    return index;
  }

  auto PluginManager::requirePlugin(const StringView name) -> Result<PluginContainer*> {
    const PluginIndex* index = TRY(plugins());

    const auto position = index->positions.find(String(name));

    if (position == index->positions.end())
      ERR_FMT(NotFound, "no plugin named {} in namespace {}", name, m_namespace);

    return index->containers.at(position->second).get();
  }

  auto PluginManager::recordInitFailure(PluginContainer& container, const XtendError& error) -> Result<> {
    if (error.code == PluginDisabled)
      return Err(error);

    debug_log("error instantiating plugin {}", Describe(container.m_spec));
    debug_at(error);

    container.m_initError = XtendError(PluginInitFailed, std::format("error instantiating plugin {}: {}", Describe(container.m_spec), error.message), error.location);

    return recordHookFailure(container.m_initError, m_dispatcher.fireInitException(container.m_spec, error));
  }

  auto PluginManager::recordLoadFailure(PluginContainer& container, IPlugin& plugin, const XtendError& error) -> Result<> {
    if (error.code == PluginDisabled)
      return Err(error);

    debug_log("error loading plugin {}", Describe(container.m_spec));
    debug_at(error);

    container.m_loadError = XtendError(PluginLoadFailed, std::format("error loading plugin {}: {}", Describe(container.m_spec), error.message), error.location);

    return recordHookFailure(container.m_loadError, m_dispatcher.fireLoadException(container.m_spec, plugin, error));
  }

  auto PluginManager::recordHookFailure(Option<XtendError>& recorded, Result<> hook) -> Result<> {
    if (hook)
      return {};

    // a disabled signal still disables the plugin; any other error replaces the recorded one
    if (hook.error().code == PluginDisabled)
      return hook;

    recorded = hook.error();
    return {};
  }

  auto PluginManager::loadPlugin(PluginContainer& container) -> Result<> {
    const RecursiveLockGuard lock(container.m_mutex);

    const PluginSpec& spec = container.m_spec;

    for (const PluginFilter& filter : filtersSnapshot()) {
      bool excluded = false;

      try {
        excluded = filter(spec);
      } catch (const Exception& e) {
        ERR_FMT(Other, "plugin filter failed for {}: {}", Describe(spec), e.what());
      }

      if (excluded)
        return Err(PluginDisabledError(m_namespace, spec.name, FILTER_DISABLED_REASON));
    }

    if (!container.m_isInit) {
      debug_log("instantiating plugin {}", Describe(spec));

      Result<UniquePointer<IPlugin>> instance = spec.factory();

      if (!instance)
        return recordInitFailure(container, instance.error());

      container.m_plugin = *std::move(instance);
      container.m_isInit.store(true, std::memory_order_release);

      if (Result<> hook = m_dispatcher.fireInitAfter(spec, *container.m_plugin); !hook)
        return recordInitFailure(container, hook.error());
    }

    IPlugin& plugin = *container.m_plugin;

    bool shouldLoad = false;
    try {
      shouldLoad = plugin.shouldLoad();
    } catch (const Exception& e) {
      return recordLoadFailure(container, plugin, XtendError::fromException(e));
    }

    if (!shouldLoad)
      return Err(PluginDisabledError(m_namespace, spec.name, CONDITION_DISABLED_REASON));

    if (Result<> hook = m_dispatcher.fireLoadBefore(spec, plugin, m_loadArgs); !hook)
      return recordLoadFailure(container, plugin, hook.error());

    debug_log("loading plugin {}:{}", m_namespace, spec.name);

    Result<LoadValue> value = [&] -> Result<LoadValue> {
      try {
        return plugin.load(m_loadArgs);
      } catch (const Exception& e) {
        return Err(XtendError::fromException(e));
      }
    }();

    if (!value)
      return recordLoadFailure(container, plugin, value.error());

    if (Result<> hook = m_dispatcher.fireLoadAfter(spec, plugin, *value); !hook)
      return recordLoadFailure(container, plugin, hook.error());

    container.m_loadValue = *std::move(value);
    container.m_isLoaded.store(true, std::memory_order_release);

    return {};
  }
} // namespace xtend::core::plugin
