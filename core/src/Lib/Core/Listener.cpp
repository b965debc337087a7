#include <Xtend++/Core/Listener.hpp>

#include <Xtend++/Utils/Logging.hpp>

namespace xtend::core::plugin {
  using namespace utils::types;
  using utils::error::IsPluginError;
  using utils::error::XtendError;

  auto IPluginLifecycleListener::onResolveAfter(const PluginSpec& /*spec*/) -> Result<> {
    return {};
  }

  auto IPluginLifecycleListener::onResolveException(StringView /*ns*/, const EntryPoint& /*entryPoint*/, const XtendError& /*error*/) -> Result<> {
    return {};
  }

  auto IPluginLifecycleListener::onInitAfter(const PluginSpec& /*spec*/, IPlugin& /*plugin*/) -> Result<> {
    return {};
  }

  auto IPluginLifecycleListener::onInitException(const PluginSpec& /*spec*/, const XtendError& /*error*/) -> Result<> {
    return {};
  }

  auto IPluginLifecycleListener::onLoadBefore(const PluginSpec& /*spec*/, IPlugin& /*plugin*/, const LoadArgs& /*args*/) -> Result<> {
    return {};
  }

  auto IPluginLifecycleListener::onLoadAfter(const PluginSpec& /*spec*/, IPlugin& /*plugin*/, const LoadValue& /*value*/) -> Result<> {
    return {};
  }

  auto IPluginLifecycleListener::onLoadException(const PluginSpec& /*spec*/, IPlugin& /*plugin*/, const XtendError& /*error*/) -> Result<> {
    return {};
  }

  auto InvokeHookSafely(const StringView hookName, const Fn<Result<>()>& hook) -> Result<> {
    try {
      Result<> result = hook();

      if (result || IsPluginError(result.error().code))
        return result;

      error_log("error while calling {}: {}", hookName, result.error().message);
      debug_at(result.error());
    } catch (const Exception& e) {
      error_log("error while calling {}: {}", hookName, e.what());
    }

    return {};
  }

  ListenerDispatcher::ListenerDispatcher(Vec<ListenerPtr> listeners) : m_listeners(std::move(listeners)) {
    std::erase(m_listeners, nullptr);
  }

  auto ListenerDispatcher::add(ListenerPtr listener) -> Unit {
    if (!listener)
      return;

    const LockGuard lock(m_mutex);
    m_listeners.push_back(std::move(listener));
  }

  auto ListenerDispatcher::listeners() const -> Vec<ListenerPtr> {
    const LockGuard lock(m_mutex);
    return m_listeners;
  }

  auto ListenerDispatcher::fire(const StringView hookName, const Fn<Result<>(IPluginLifecycleListener&)>& hook) const -> Result<> {
    // hooks run without the lock held so they may add listeners
    for (const ListenerPtr& listener : listeners())
      TRY_VOID(InvokeHookSafely(hookName, [&] -> Result<> { return hook(*listener); }));

    return {};
  }

  auto ListenerDispatcher::fireResolveAfter(const PluginSpec& spec) const -> Result<> {
    return fire("onResolveAfter", [&](IPluginLifecycleListener& listener) { return listener.onResolveAfter(spec); });
  }

  auto ListenerDispatcher::fireResolveException(const StringView ns, const EntryPoint& entryPoint, const XtendError& error) const -> Result<> {
    return fire("onResolveException", [&](IPluginLifecycleListener& listener) { return listener.onResolveException(ns, entryPoint, error); });
  }

  auto ListenerDispatcher::fireInitAfter(const PluginSpec& spec, IPlugin& plugin) const -> Result<> {
    return fire("onInitAfter", [&](IPluginLifecycleListener& listener) { return listener.onInitAfter(spec, plugin); });
  }

  auto ListenerDispatcher::fireInitException(const PluginSpec& spec, const XtendError& error) const -> Result<> {
    return fire("onInitException", [&](IPluginLifecycleListener& listener) { return listener.onInitException(spec, error); });
  }

  auto ListenerDispatcher::fireLoadBefore(const PluginSpec& spec, IPlugin& plugin, const LoadArgs& args) const -> Result<> {
    return fire("onLoadBefore", [&](IPluginLifecycleListener& listener) { return listener.onLoadBefore(spec, plugin, args); });
  }

  auto ListenerDispatcher::fireLoadAfter(const PluginSpec& spec, IPlugin& plugin, const LoadValue& value) const -> Result<> {
    return fire("onLoadAfter", [&](IPluginLifecycleListener& listener) { return listener.onLoadAfter(spec, plugin, value); });
  }

  auto ListenerDispatcher::fireLoadException(const PluginSpec& spec, IPlugin& plugin, const XtendError& error) const -> Result<> {
    return fire("onLoadException", [&](IPluginLifecycleListener& listener) { return listener.onLoadException(spec, plugin, error); });
  }

  CompositePluginLifecycleListener::CompositePluginLifecycleListener(Vec<ListenerPtr> listeners) : m_dispatcher(std::move(listeners)) {}

  auto CompositePluginLifecycleListener::addListener(ListenerPtr listener) -> Unit {
    m_dispatcher.add(std::move(listener));
  }

  auto CompositePluginLifecycleListener::onResolveAfter(const PluginSpec& spec) -> Result<> {
    return m_dispatcher.fireResolveAfter(spec);
  }

  auto CompositePluginLifecycleListener::onResolveException(const StringView ns, const EntryPoint& entryPoint, const XtendError& error) -> Result<> {
    return m_dispatcher.fireResolveException(ns, entryPoint, error);
  }

  auto CompositePluginLifecycleListener::onInitAfter(const PluginSpec& spec, IPlugin& plugin) -> Result<> {
    return m_dispatcher.fireInitAfter(spec, plugin);
  }

  auto CompositePluginLifecycleListener::onInitException(const PluginSpec& spec, const XtendError& error) -> Result<> {
    return m_dispatcher.fireInitException(spec, error);
  }

  auto CompositePluginLifecycleListener::onLoadBefore(const PluginSpec& spec, IPlugin& plugin, const LoadArgs& args) -> Result<> {
    return m_dispatcher.fireLoadBefore(spec, plugin, args);
  }

  auto CompositePluginLifecycleListener::onLoadAfter(const PluginSpec& spec, IPlugin& plugin, const LoadValue& value) -> Result<> {
    return m_dispatcher.fireLoadAfter(spec, plugin, value);
  }

  auto CompositePluginLifecycleListener::onLoadException(const PluginSpec& spec, IPlugin& plugin, const XtendError& error) -> Result<> {
    return m_dispatcher.fireLoadException(spec, plugin, error);
  }
} // namespace xtend::core::plugin
