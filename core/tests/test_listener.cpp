#include <boost/ut.hpp>

#include <stdexcept> // std::runtime_error

#include <Xtend++/Core/Listener.hpp>
#include <Xtend++/Core/PluginManager.hpp>

#include "Support.hpp"

namespace {
  using namespace xtend::core::plugin;
  using namespace xtend::utils::types;
  using xtend::utils::error::PluginDisabledError;
  using xtend::utils::error::XtendError;
  using xtend::utils::error::XtendErrorCode;

  constexpr StringView NS = "xtend.tests.listeners";

  /**
   * Records every hook as "hook:plugin".
   */
  class RecordingListener : public IPluginLifecycleListener {
   public:
    Vec<String>        events;
    Option<XtendError> lastError;

    auto onResolveAfter(const PluginSpec& spec) -> Result<> override {
      events.push_back("resolve:" + spec.name);
      return {};
    }

    auto onInitAfter(const PluginSpec& spec, IPlugin& /*plugin*/) -> Result<> override {
      events.push_back("init:" + spec.name);
      return {};
    }

    auto onInitException(const PluginSpec& spec, const XtendError& error) -> Result<> override {
      events.push_back("init-error:" + spec.name);
      lastError = error;
      return {};
    }

    auto onLoadBefore(const PluginSpec& spec, IPlugin& /*plugin*/, const LoadArgs& /*args*/) -> Result<> override {
      events.push_back("before:" + spec.name);
      return {};
    }

    auto onLoadAfter(const PluginSpec& spec, IPlugin& /*plugin*/, const LoadValue& /*value*/) -> Result<> override {
      events.push_back("after:" + spec.name);
      return {};
    }

    auto onLoadException(const PluginSpec& spec, IPlugin& /*plugin*/, const XtendError& error) -> Result<> override {
      events.push_back("load-error:" + spec.name);
      lastError = error;
      return {};
    }
  };

  class VetoingListener final : public IPluginLifecycleListener {
   public:
    explicit VetoingListener(String target) : m_target(std::move(target)) {}

    auto onLoadBefore(const PluginSpec& spec, IPlugin& /*plugin*/, const LoadArgs& /*args*/) -> Result<> override {
      if (spec.name == m_target)
        return Err(PluginDisabledError(spec.ns, spec.name, "vetoed by policy"));
      return {};
    }

   private:
    String m_target;
  };

  class ThrowingListener final : public IPluginLifecycleListener {
   public:
    auto onInitAfter(const PluginSpec& /*spec*/, IPlugin& /*plugin*/) -> Result<> override {
      throw std::runtime_error("listener bug");
    }

    auto onLoadAfter(const PluginSpec& /*spec*/, IPlugin& /*plugin*/, const LoadValue& /*value*/) -> Result<> override {
      ERR(XtendErrorCode::IoError, "cannot write audit log");
    }
  };

  class InitVetoListener final : public IPluginLifecycleListener {
   public:
    auto onInitAfter(const PluginSpec& spec, IPlugin& /*plugin*/) -> Result<> override {
      return Err(PluginDisabledError(spec.ns, spec.name, "not licensed"));
    }
  };

  /**
   * Turns every failure into its own plugin-family error.
   */
  class EscalatingListener final : public IPluginLifecycleListener {
   public:
    auto onInitException(const PluginSpec& spec, const XtendError& /*error*/) -> Result<> override {
      ERR_FMT(XtendErrorCode::PluginInitFailed, "{} quarantined during init", spec.name);
    }

    auto onLoadException(const PluginSpec& spec, IPlugin& /*plugin*/, const XtendError& /*error*/) -> Result<> override {
      ERR_FMT(XtendErrorCode::PluginNotLoaded, "{} quarantined during load", spec.name);
    }
  };

  auto ManagerWith(Vec<PluginSpec> specs, Vec<ListenerPtr> listeners) -> UniquePointer<PluginManager> {
    return std::make_unique<PluginManager>(
      String(NS),
      PluginManagerOptions {
        .loadArgs  = {},
        .listeners = std::move(listeners),
        .finder    = std::make_shared<xtend::test::StaticFinder>(std::move(specs)),
        .filters   = Vec<PluginFilter> {},
      }
    );
  }
} // namespace

auto main() -> int {
  using namespace boost::ut;
  using xtend::test::Counters;
  using xtend::test::ScriptedSpec;

  "Hooks fire in lifecycle order"_test = [] -> void {
    Counters counters;
    auto     recorder = std::make_shared<RecordingListener>();
    auto     manager  = ManagerWith({ ScriptedSpec(String(NS), "a", counters), ScriptedSpec(String(NS), "b", counters) }, { recorder });

    expect(manager->load("b").has_value());

    expect(recorder->events == Vec<String> { "resolve:a", "resolve:b", "init:b", "before:b", "after:b" });
  };

  "A listener can veto loading"_test = [] -> void {
    Counters counters;
    auto     recorder = std::make_shared<RecordingListener>();
    auto     manager  = ManagerWith({ ScriptedSpec(String(NS), "blocked", counters) }, { std::make_shared<VetoingListener>("blocked"), recorder });

    Result<IPlugin*> plugin = manager->load("blocked");

    expect(!plugin.has_value());
    expect(plugin.error().code == XtendErrorCode::PluginDisabled);
    expect(counters.created.load() == 1);
    expect(counters.loaded.load() == 0);

    PluginContainer* container = *manager->getContainer("blocked");
    expect(container->isDisabled());
    expect(*container->disabledReason() == String("vetoed by policy"));
    expect(!container->loadError().has_value());

    // the veto stops the remaining listeners for that hook
    expect(recorder->events == Vec<String> { "resolve:blocked", "init:blocked" });
  };

  "A listener can disable a plugin right after creation"_test = [] -> void {
    Counters counters;
    auto     manager = ManagerWith({ ScriptedSpec(String(NS), "unlicensed", counters) }, { std::make_shared<InitVetoListener>() });

    Result<IPlugin*> plugin = manager->load("unlicensed");

    expect(plugin.error().code == XtendErrorCode::PluginDisabled);
    expect(*(*manager->getContainer("unlicensed"))->disabledReason() == String("not licensed"));
    expect(counters.loaded.load() == 0);
  };

  "Broken listeners do not break loading"_test = [] -> void {
    Counters counters;
    auto     recorder = std::make_shared<RecordingListener>();
    auto     manager  = ManagerWith({ ScriptedSpec(String(NS), "sturdy", counters) }, { std::make_shared<ThrowingListener>(), recorder });

    Result<IPlugin*> plugin = manager->load("sturdy");

    expect(plugin.has_value());
    expect(counters.loaded.load() == 1);
    expect(recorder->events == Vec<String> { "resolve:sturdy", "init:sturdy", "before:sturdy", "after:sturdy" });
  };

  "Failure hooks receive the original error"_test = [] -> void {
    Counters counters;
    auto     recorder = std::make_shared<RecordingListener>();
    auto     failing  = ScriptedSpec(String(NS), "fails", counters, true, [](const LoadArgs&) -> Result<LoadValue> {
      ERR(XtendErrorCode::IoError, "resource missing");
    });
    auto     manager  = ManagerWith({ failing }, { recorder });

    Result<IPlugin*> plugin = manager->load("fails");

    expect(plugin.error().code == XtendErrorCode::PluginLoadFailed);
    expect(recorder->events.back() == String("load-error:fails"));
    expect(recorder->lastError.has_value());
    expect(recorder->lastError->code == XtendErrorCode::IoError);
    expect(recorder->lastError->message == String("resource missing"));
  };

  "Errors raised by failure hooks are reported on every load"_test = [] -> void {
    Counters counters;
    auto     loadFails = ScriptedSpec(String(NS), "unstable", counters, true, [](const LoadArgs&) -> Result<LoadValue> {
      ERR(XtendErrorCode::IoError, "resource missing");
    });
    const PluginSpec initFails {
      .ns      = String(NS),
      .name    = "unbuildable",
      .factory = PluginFactory(CodeLocation { .module = "xtend_tests.scripted", .symbol = "unbuildable" }, []() -> Result<UniquePointer<IPlugin>> {
        ERR(XtendErrorCode::InternalError, "no memory");
      }),
    };
    auto manager = ManagerWith({ loadFails, initFails }, { std::make_shared<EscalatingListener>() });

    for (const StringView name : { "unstable", "unbuildable" }) {
      Result<IPlugin*> first  = manager->load(name);
      Result<IPlugin*> second = manager->load(name);

      expect(!first.has_value() && !second.has_value());
      expect(first.error().code == second.error().code);
      expect(first.error().message == second.error().message);
    }

    Result<IPlugin*> unstable = manager->load("unstable");
    expect(unstable.error().code == XtendErrorCode::PluginNotLoaded);
    expect(unstable.error().message == String("unstable quarantined during load"));

    Result<IPlugin*> unbuildable = manager->load("unbuildable");
    expect(unbuildable.error().code == XtendErrorCode::PluginInitFailed);
    expect(unbuildable.error().message == String("unbuildable quarantined during init"));
    expect(counters.loaded.load() == 1);
  };

  "Listeners added later see later events"_test = [] -> void {
    Counters counters;
    auto     manager  = ManagerWith({ ScriptedSpec(String(NS), "a", counters), ScriptedSpec(String(NS), "b", counters) }, {});
    auto     recorder = std::make_shared<RecordingListener>();

    expect(manager->load("a").has_value());
    manager->addListener(recorder);
    expect(manager->load("b").has_value());

    expect(recorder->events == Vec<String> { "init:b", "before:b", "after:b" });
  };

  "Hook errors outside the plugin family are swallowed"_test = [] -> void {
    Result<> swallowed = InvokeHookSafely("onLoadAfter", []() -> Result<> { ERR(XtendErrorCode::IoError, "disk full"); });
    Result<> thrown    = InvokeHookSafely("onLoadAfter", []() -> Result<> { throw std::runtime_error("bug"); });
    Result<> disabled  = InvokeHookSafely("onLoadBefore", []() -> Result<> { return Err(PluginDisabledError("ns", "p", "no")); });

    expect(swallowed.has_value());
    expect(thrown.has_value());
    expect(!disabled.has_value());
    expect(disabled.error().code == XtendErrorCode::PluginDisabled);
  };

  "Composite listener isolates its members"_test = [] -> void {
    auto first  = std::make_shared<ThrowingListener>();
    auto second = std::make_shared<RecordingListener>();

    CompositePluginLifecycleListener composite({ first, nullptr });
    composite.addListener(second);

    Counters                 counters;
    const PluginSpec         spec   = ScriptedSpec(String(NS), "x", counters);
    UniquePointer<IPlugin>   plugin = *spec.factory();

    expect(composite.onInitAfter(spec, *plugin).has_value());
    expect(composite.onLoadAfter(spec, *plugin, LoadValue {}).has_value());
    expect(second->events == Vec<String> { "init:x", "after:x" });
  };

  "Composite listener forwards vetoes"_test = [] -> void {
    CompositePluginLifecycleListener composite({ std::make_shared<VetoingListener>("x") });

    Counters               counters;
    const PluginSpec       spec   = ScriptedSpec(String(NS), "x", counters);
    UniquePointer<IPlugin> plugin = *spec.factory();

    Result<> result = composite.onLoadBefore(spec, *plugin, LoadArgs {});

    expect(!result.has_value());
    expect(result.error().code == XtendErrorCode::PluginDisabled);
  };

  return 0;
}
