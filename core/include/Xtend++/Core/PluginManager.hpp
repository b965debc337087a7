/**
 * @file PluginManager.hpp
 * @brief Discovery, initialization and loading of the plugins of one namespace.
 *
 * @details A plugin managed by a PluginManager moves through three states:
 * - resolved: its spec was found and a container was created for it
 * - initialized: the spec's factory produced an instance
 * - loaded: the instance's load routine succeeded
 *
 * A plugin can also become disabled (by a filter, by its own shouldLoad(), or
 * by a listener), which is sticky, or fail during init or load, in which case
 * the error is kept on its container and returned by every later load().
 */

#pragma once

#include <filesystem> // std::filesystem::path

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "EntryPointsCache.hpp"
#include "Filter.hpp"
#include "Finder.hpp"
#include "Listener.hpp"
#include "Plugin.hpp"
#include "PluginSpec.hpp"
#include "SearchPath.hpp"

namespace xtend::core::plugin {
  namespace fs    = std::filesystem;
  namespace types = ::xtend::utils::types;

  /**
   * @class PluginContainer
   * @brief Lifecycle state of one plugin inside a manager.
   *
   * Fields only change under the container's own lock, and only forward
   * (never un-initialized, never un-loaded).
   */
  class XTEND_API PluginContainer {
   public:
    explicit PluginContainer(PluginSpec spec) : m_spec(std::move(spec)) {}

    [[nodiscard]] auto name() const -> const types::String& {
      return m_spec.name;
    }

    [[nodiscard]] auto spec() const -> const PluginSpec& {
      return m_spec;
    }

    /**
     * @brief The instance, or nullptr before a successful init.
     */
    [[nodiscard]] auto plugin() const -> IPlugin*;

    [[nodiscard]] auto loadValue() const -> LoadValue;

    [[nodiscard]] auto isInit() const -> bool {
      return m_isInit.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto isLoaded() const -> bool {
      return m_isLoaded.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto isDisabled() const -> bool {
      return m_isDisabled.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto initError() const -> types::Option<utils::error::XtendError>;
    [[nodiscard]] auto loadError() const -> types::Option<utils::error::XtendError>;
    [[nodiscard]] auto disabledReason() const -> types::Option<types::String>;

    /**
     * @brief The installed distribution that provides this plugin's code, if any.
     */
    [[nodiscard]] auto distribution(types::Span<const fs::path> searchPath) const -> types::Option<Distribution>;

    [[nodiscard]] auto distribution() const -> types::Option<Distribution> {
      return distribution(DefaultSearchPath());
    }

   private:
    friend class PluginManager;

    mutable types::RecursiveMutex              m_mutex;
    PluginSpec                                 m_spec;
    types::UniquePointer<IPlugin>              m_plugin;
    LoadValue                                  m_loadValue;
    types::Atomic<bool>                        m_isInit     = false;
    types::Atomic<bool>                        m_isLoaded   = false;
    types::Atomic<bool>                        m_isDisabled = false;
    types::Option<utils::error::XtendError>    m_initError;
    types::Option<utils::error::XtendError>    m_loadError;
    types::Option<types::String>               m_disabledReason;
  };

  /**
   * @struct PluginManagerOptions
   * @brief Optional collaborators of a PluginManager.
   */
  struct PluginManagerOptions {
    LoadArgs                                   loadArgs;  ///< Passed to every plugin's load routine
    types::Vec<ListenerPtr>                    listeners;
    types::SharedPointer<IPluginFinder>        finder;    ///< A MetadataPluginFinder for the namespace when unset
    types::Option<types::Vec<PluginFilter>>    filters;   ///< { GlobalPluginFilter() } when unset
  };

  /**
   * @class PluginManager
   * @brief Manages the plugins of one namespace found by a finder.
   *
   * The plugin index is built on first use. Loading is idempotent and
   * thread-safe: concurrent load() calls for the same plugin run its factory
   * and load routine once, calls for different plugins do not block each other.
   */
  class XTEND_API PluginManager {
   public:
    explicit PluginManager(types::String ns, PluginManagerOptions options = {});

    PluginManager(const PluginManager&)                    = delete;
    PluginManager(PluginManager&&)                         = delete;
    auto operator=(const PluginManager&) -> PluginManager& = delete;
    auto operator=(PluginManager&&) -> PluginManager&      = delete;
    ~PluginManager()                                       = default;

    [[nodiscard]] auto getNamespace() const -> const types::String& {
      return m_namespace;
    }

    /**
     * @brief Loads a plugin, or returns it when it is already loaded.
     *
     * @return The instance (owned by the manager), or one of: NotFound for an
     * unknown name, PluginDisabled, PluginInitFailed, PluginLoadFailed,
     * PluginNotLoaded
     */
    auto load(types::StringView name) -> types::Result<IPlugin*>;

    /**
     * @brief load() followed by a checked downcast.
     */
    template <typename P>
    auto loadAs(const types::StringView name) -> types::Result<P*> {
      using enum utils::error::XtendErrorCode;

      IPlugin* plugin = TRY(load(name));

      if (auto* typed = dynamic_cast<P*>(plugin))
        return typed;

      ERR_FMT(InvalidArgument, "plugin {}:{} is not of the requested type", m_namespace, name);
    }

    /**
     * @brief Loads every plugin of the namespace and returns those that loaded.
     *
     * Disabled plugins are skipped quietly. Other failures are logged and
     * skipped, or returned immediately when @p propagateErrors is set.
     */
    auto loadAll(bool propagateErrors = false) -> types::Result<types::Vec<IPlugin*>>;

    auto listPluginSpecs() -> types::Result<types::Vec<PluginSpec>>;

    auto listNames() -> types::Result<types::Vec<types::String>>;

    auto listContainers() -> types::Result<types::Vec<PluginContainer*>>;

    auto getContainer(types::StringView name) -> types::Result<PluginContainer*>;

    /**
     * @brief Whether the namespace has a plugin named @p name. False when discovery fails.
     */
    auto exists(types::StringView name) -> bool;

    auto isLoaded(types::StringView name) -> types::Result<bool>;

    auto addListener(ListenerPtr listener) -> types::Unit;

    auto addFilter(PluginFilter filter) -> types::Unit;

   private:
    struct PluginIndex {
      types::Vec<types::UniquePointer<PluginContainer>> containers; ///< Discovery order
      types::UnorderedMap<types::String, types::usize>   positions;
    };

    auto plugins() -> types::Result<const PluginIndex*>;
    auto initPluginIndex() -> types::Result<PluginIndex>;
    auto requirePlugin(types::StringView name) -> types::Result<PluginContainer*>;

    auto loadPlugin(PluginContainer& container) -> types::Result<>;
    auto recordLoadFailure(PluginContainer& container, IPlugin& plugin, const utils::error::XtendError& error) -> types::Result<>;
    auto recordInitFailure(PluginContainer& container, const utils::error::XtendError& error) -> types::Result<>;
    static auto recordHookFailure(types::Option<utils::error::XtendError>& recorded, types::Result<> hook) -> types::Result<>;
    auto filtersSnapshot() const -> types::Vec<PluginFilter>;

    types::String                       m_namespace;
    LoadArgs                            m_loadArgs;
    ListenerDispatcher                  m_dispatcher;
    mutable types::Mutex                m_filtersMutex;
    types::Vec<PluginFilter>            m_filters;
    types::SharedPointer<IPluginFinder> m_finder;

    types::Mutex                        m_indexMutex;
    types::Atomic<bool>                 m_indexBuilt = false;
    PluginIndex                         m_index;
  };
} // namespace xtend::core::plugin
