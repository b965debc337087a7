/**
 * @file Listener.hpp
 * @brief Observers of the plugin lifecycle.
 */

#pragma once

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "EntryPoint.hpp"
#include "Plugin.hpp"
#include "PluginSpec.hpp"

namespace xtend::core::plugin {
  namespace types = ::xtend::utils::types;

  /**
   * @class IPluginLifecycleListener
   * @brief One hook per lifecycle transition. Every hook does nothing by default.
   *
   * A hook reports failure through its Result or by throwing. Failures are
   * logged and ignored by the manager, except errors of the plugin family (see
   * IsPluginError): returning PluginDisabledError(...) from onInitAfter or
   * onLoadBefore disables the plugin.
   */
  class XTEND_API IPluginLifecycleListener {
   public:
    IPluginLifecycleListener()                                                   = default;
    IPluginLifecycleListener(const IPluginLifecycleListener&)                    = delete;
    IPluginLifecycleListener(IPluginLifecycleListener&&)                         = delete;
    auto operator=(const IPluginLifecycleListener&) -> IPluginLifecycleListener& = delete;
    auto operator=(IPluginLifecycleListener&&) -> IPluginLifecycleListener&      = delete;
    virtual ~IPluginLifecycleListener()                                          = default;

    virtual auto onResolveAfter(const PluginSpec& spec) -> types::Result<>;

    virtual auto onResolveException(types::StringView ns, const EntryPoint& entryPoint, const utils::error::XtendError& error) -> types::Result<>;

    virtual auto onInitAfter(const PluginSpec& spec, IPlugin& plugin) -> types::Result<>;

    virtual auto onInitException(const PluginSpec& spec, const utils::error::XtendError& error) -> types::Result<>;

    virtual auto onLoadBefore(const PluginSpec& spec, IPlugin& plugin, const LoadArgs& args) -> types::Result<>;

    virtual auto onLoadAfter(const PluginSpec& spec, IPlugin& plugin, const LoadValue& value) -> types::Result<>;

    virtual auto onLoadException(const PluginSpec& spec, IPlugin& plugin, const utils::error::XtendError& error) -> types::Result<>;
  };

  using ListenerPtr = types::SharedPointer<IPluginLifecycleListener>;

  /**
   * @brief Runs one listener hook. Plugin-family errors are returned, anything else is logged and dropped.
   */
  XTEND_API auto InvokeHookSafely(types::StringView hookName, const types::Fn<types::Result<>()>& hook) -> types::Result<>;

  /**
   * @class ListenerDispatcher
   * @brief Fires each hook on an ordered list of listeners through InvokeHookSafely.
   *
   * The first plugin-family error stops the dispatch and is returned.
   */
  class XTEND_API ListenerDispatcher {
   public:
    explicit ListenerDispatcher(types::Vec<ListenerPtr> listeners = {});

    auto add(ListenerPtr listener) -> types::Unit;

    [[nodiscard]] auto listeners() const -> types::Vec<ListenerPtr>;

    auto fireResolveAfter(const PluginSpec& spec) const -> types::Result<>;
    auto fireResolveException(types::StringView ns, const EntryPoint& entryPoint, const utils::error::XtendError& error) const -> types::Result<>;
    auto fireInitAfter(const PluginSpec& spec, IPlugin& plugin) const -> types::Result<>;
    auto fireInitException(const PluginSpec& spec, const utils::error::XtendError& error) const -> types::Result<>;
    auto fireLoadBefore(const PluginSpec& spec, IPlugin& plugin, const LoadArgs& args) const -> types::Result<>;
    auto fireLoadAfter(const PluginSpec& spec, IPlugin& plugin, const LoadValue& value) const -> types::Result<>;
    auto fireLoadException(const PluginSpec& spec, IPlugin& plugin, const utils::error::XtendError& error) const -> types::Result<>;

   private:
    auto fire(types::StringView hookName, const types::Fn<types::Result<>(IPluginLifecycleListener&)>& hook) const -> types::Result<>;

    mutable types::Mutex    m_mutex;
    types::Vec<ListenerPtr> m_listeners;
  };

  /**
   * @class CompositePluginLifecycleListener
   * @brief A listener that forwards every hook to its delegates, in order, each one isolated.
   */
  class XTEND_API CompositePluginLifecycleListener final : public IPluginLifecycleListener {
   public:
    explicit CompositePluginLifecycleListener(types::Vec<ListenerPtr> listeners = {});

    auto addListener(ListenerPtr listener) -> types::Unit;

    auto onResolveAfter(const PluginSpec& spec) -> types::Result<> override;
    auto onResolveException(types::StringView ns, const EntryPoint& entryPoint, const utils::error::XtendError& error) -> types::Result<> override;
    auto onInitAfter(const PluginSpec& spec, IPlugin& plugin) -> types::Result<> override;
    auto onInitException(const PluginSpec& spec, const utils::error::XtendError& error) -> types::Result<> override;
    auto onLoadBefore(const PluginSpec& spec, IPlugin& plugin, const LoadArgs& args) -> types::Result<> override;
    auto onLoadAfter(const PluginSpec& spec, IPlugin& plugin, const LoadValue& value) -> types::Result<> override;
    auto onLoadException(const PluginSpec& spec, IPlugin& plugin, const utils::error::XtendError& error) -> types::Result<> override;

   private:
    ListenerDispatcher m_dispatcher;
  };
} // namespace xtend::core::plugin
