/**
 * @file PluginSpec.hpp
 * @brief Plugin specifications and the code objects they are resolved from.
 */

#pragma once

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "Plugin.hpp"

namespace xtend::core::plugin {
  namespace types = ::xtend::utils::types;

  /**
   * @struct CodeLocation
   * @brief Where a symbol lives: the module that exports it and its exported name.
   *
   * Its text form, the locator, is "module:symbol".
   */
  struct XTEND_API CodeLocation {
    types::String module;
    types::String symbol;

    /**
     * @brief Parses "module:symbol". Both parts must be non-empty.
     */
    static auto parse(types::StringView locator) -> types::Result<CodeLocation>;

    [[nodiscard]] auto locator() const -> types::String;

    [[nodiscard]] auto empty() const -> bool {
      return module.empty() || symbol.empty();
    }

    auto operator==(const CodeLocation&) const -> bool = default;
  };

  /**
   * @brief Zero-argument callable producing a plugin instance.
   *
   * Failure may be reported through the Result or by throwing.
   */
  using FactoryFn = types::Fn<types::Result<types::UniquePointer<IPlugin>>()>;

  /**
   * @class PluginFactory
   * @brief A factory callable together with the code location it was exported from.
   *
   * Factories built from exported symbols carry a location and can be written
   * out as entry points. Ad-hoc factories (lambdas in tests, closures) have no
   * location; they work in a manager but cannot be serialized.
   */
  class XTEND_API PluginFactory {
   public:
    PluginFactory() = default;
    PluginFactory(CodeLocation location, FactoryFn create);
    explicit PluginFactory(FactoryFn create);

    /**
     * @brief Invokes the factory. A null instance is reported as an error.
     */
    auto operator()() const -> types::Result<types::UniquePointer<IPlugin>>;

    [[nodiscard]] auto location() const -> const types::Option<CodeLocation>& {
      return m_location;
    }

    [[nodiscard]] auto valid() const -> bool {
      return m_create != nullptr;
    }

    /**
     * @brief Same code location when both have one, otherwise same callable.
     */
    auto operator==(const PluginFactory& other) const -> bool;

   private:
    types::Option<CodeLocation>            m_location;
    types::SharedPointer<const FactoryFn> m_create;
  };

  /**
   * @struct PluginSpec
   * @brief Identifies a plugin by (namespace, name) and carries the factory that creates it.
   */
  struct XTEND_API PluginSpec {
    types::String ns;
    types::String name;
    PluginFactory factory;

    auto operator==(const PluginSpec&) const -> bool = default;
  };

  /**
   * @brief Formats a spec as "ns:name" for messages.
   */
  inline auto Describe(const PluginSpec& spec) -> types::String {
    return spec.ns + ":" + spec.name;
  }

  /**
   * @struct PluginClassRef
   * @brief An exported plugin class: its static identity plus a factory constructing it.
   */
  struct PluginClassRef {
    types::String ns;
    types::String name;
    PluginFactory factory;
  };

  /**
   * @struct PluginFunctionRef
   * @brief An exported function, with the spec attached when it was registered as a plugin.
   */
  struct PluginFunctionRef {
    types::String             symbol;
    types::Option<PluginSpec> spec;
  };

  /**
   * @struct OpaqueSymbol
   * @brief Any other exported symbol. Never resolves to a spec.
   */
  struct OpaqueSymbol {
    types::String symbol;
    types::String kind;
  };

  /**
   * @brief Everything a module can export and a code loader can hand back.
   */
  using CodeObject = types::Variant<PluginSpec, PluginClassRef, PluginFunctionRef, OpaqueSymbol>;

  /**
   * @brief Builds the class reference for a plugin class exported as @p location.
   */
  template <PluginType P>
  auto MakeClassRef(CodeLocation location) -> PluginClassRef {
    return PluginClassRef {
      .ns      = types::String(P::Namespace),
      .name    = types::String(P::Name),
      .factory = PluginFactory(
        std::move(location),
        []() -> types::Result<types::UniquePointer<IPlugin>> { return std::make_unique<P>(); }
      ),
    };
  }

  /**
   * @brief Turns a code object into a plugin specification.
   *
   * Specs are returned as-is, plugin classes yield a spec from their static
   * identity, functions yield their attached spec. Everything else fails with
   * ResolutionFailed.
   */
  XTEND_API auto ResolveSpec(const CodeObject& source) -> types::Result<PluginSpec>;
} // namespace xtend::core::plugin
