/**
 * @file FunctionPlugin.hpp
 * @brief Adapts plain functions into plugins.
 *
 * @details A FunctionPluginBuilder turns a function into two things: a
 * callable FunctionPlugin wrapper (a regular IPlugin whose operator() forwards
 * to the function) and a PluginSpec whose factory creates such a wrapper. The
 * wrapper can be called directly in tests without going through a manager.
 */

#pragma once

#include <utility> // std::forward

#include "../Utils/Types.hpp"
#include "Plugin.hpp"
#include "PluginSpec.hpp"

namespace xtend::core::plugin {
  namespace types = ::xtend::utils::types;

  /**
   * @brief Literal enablement value or a predicate evaluated at load time.
   */
  using Enablement = types::Variant<bool, types::Fn<bool()>>;

  /**
   * @brief Custom load routine for a function plugin.
   */
  using LoadRoutine = types::Fn<types::Result<LoadValue>(const LoadArgs&)>;

  template <typename Signature>
  class FunctionPlugin;

  /**
   * @class FunctionPlugin
   * @brief Plugin wrapper around a function with signature R(Args...).
   */
  template <typename R, typename... Args>
  class FunctionPlugin<R(Args...)> final : public IPlugin {
   public:
    using Function = types::Fn<R(Args...)>;

    FunctionPlugin(types::String ns, types::String name, Function function, Enablement enablement = true, LoadRoutine loadRoutine = {})
      : m_namespace(std::move(ns)),
        m_name(std::move(name)),
        m_function(std::move(function)),
        m_enablement(std::move(enablement)),
        m_loadRoutine(std::move(loadRoutine)) {}

    [[nodiscard]] auto getNamespace() const -> types::StringView override {
      return m_namespace;
    }

    [[nodiscard]] auto getName() const -> types::StringView override {
      return m_name;
    }

    [[nodiscard]] auto shouldLoad() const -> bool override {
      if (const auto* predicate = std::get_if<types::Fn<bool()>>(&m_enablement))
        return *predicate ? (*predicate)() : true;

      return std::get<bool>(m_enablement);
    }

    auto load(const LoadArgs& args) -> types::Result<LoadValue> override {
      if (m_loadRoutine)
        return m_loadRoutine(args);

      return LoadValue {};
    }

    auto operator()(Args... args) const -> R {
      return m_function(std::forward<Args>(args)...);
    }

    [[nodiscard]] auto function() const -> const Function& {
      return m_function;
    }

   private:
    types::String m_namespace;
    types::String m_name;
    Function      m_function;
    Enablement    m_enablement;
    LoadRoutine   m_loadRoutine;
  };

  /**
   * @struct FunctionPluginDefinition
   * @brief What a FunctionPluginBuilder produces for one function.
   */
  template <typename Signature>
  struct FunctionPluginDefinition {
    CodeLocation                      location;
    PluginSpec                        spec;
    typename FunctionPlugin<Signature>::Function function;
    Enablement                        enablement;
    LoadRoutine                       loadRoutine;

    /**
     * @brief A fresh wrapper, independent of any manager.
     */
    [[nodiscard]] auto instantiate() const -> types::UniquePointer<FunctionPlugin<Signature>> {
      return std::make_unique<FunctionPlugin<Signature>>(spec.ns, spec.name, function, enablement, loadRoutine);
    }

    /**
     * @brief The exportable code object: the function with its spec attached.
     */
    [[nodiscard]] auto ref() const -> PluginFunctionRef {
      return PluginFunctionRef { .symbol = location.symbol, .spec = spec };
    }
  };

  /**
   * @class FunctionPluginBuilder
   * @brief Collects the options of a function plugin, then builds its definition.
   *
   * @code
   * auto def = FunctionPluginBuilder("acme.transforms")
   *              .shouldLoad([] { return HasGpu(); })
   *              .build({ "acme.tools", "upper" }, &upper);
   * @endcode
   */
  class FunctionPluginBuilder {
   public:
    explicit FunctionPluginBuilder(types::String ns) : m_namespace(std::move(ns)) {}

    /**
     * @brief Overrides the plugin name, which defaults to the function's symbol.
     */
    auto name(types::String name) -> FunctionPluginBuilder& {
      m_name = std::move(name);
      return *this;
    }

    auto shouldLoad(bool enabled) -> FunctionPluginBuilder& {
      m_enablement = enabled;
      return *this;
    }

    auto shouldLoad(types::Fn<bool()> predicate) -> FunctionPluginBuilder& {
      m_enablement = std::move(predicate);
      return *this;
    }

    auto onLoad(LoadRoutine routine) -> FunctionPluginBuilder& {
      m_loadRoutine = std::move(routine);
      return *this;
    }

    template <typename R, typename... Args>
    [[nodiscard]] auto build(CodeLocation location, R (*function)(Args...)) const -> FunctionPluginDefinition<R(Args...)> {
      return build<R(Args...)>(std::move(location), types::Fn<R(Args...)>(function));
    }

    template <typename Signature>
    [[nodiscard]] auto build(CodeLocation location, types::Fn<Signature> function) const -> FunctionPluginDefinition<Signature> {
      types::String pluginName = m_name.value_or(location.symbol);

      PluginFactory factory(
        location,
        [ns = m_namespace, pluginName, function, enablement = m_enablement, loadRoutine = m_loadRoutine]() -> types::Result<types::UniquePointer<IPlugin>> {
          return std::make_unique<FunctionPlugin<Signature>>(ns, pluginName, function, enablement, loadRoutine);
        }
      );

      return FunctionPluginDefinition<Signature> {
        .location    = location,
        .spec        = PluginSpec { .ns = m_namespace, .name = std::move(pluginName), .factory = std::move(factory) },
        .function    = std::move(function),
        .enablement  = m_enablement,
        .loadRoutine = m_loadRoutine,
      };
    }

   private:
    types::String               m_namespace;
    types::Option<types::String> m_name;
    Enablement                  m_enablement = true;
    LoadRoutine                 m_loadRoutine;
  };
} // namespace xtend::core::plugin
