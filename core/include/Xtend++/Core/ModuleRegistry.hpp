/**
 * @file ModuleRegistry.hpp
 * @brief Process-wide table of the code objects each module exports.
 *
 * @details Modules (the host executable, the library, or shared libraries
 * opened by a code loader) publish their plugin classes, plugin functions and
 * specs here at static-initialization time through the XTEND_EXPORT_* macros.
 * A locator "module:symbol" is resolved by looking the pair up in this table.
 */

#pragma once

#include "../Utils/Types.hpp"
#include "PluginSpec.hpp"

namespace xtend::core::plugin {
  namespace types = ::xtend::utils::types;

  class XTEND_API ModuleRegistry {
   public:
    using Member = types::Pair<types::String, CodeObject>;

    ModuleRegistry() = default;

    /**
     * @brief The registry every XTEND_EXPORT_* macro writes to.
     */
    static auto instance() -> ModuleRegistry&;

    /**
     * @brief Publishes @p object as @p module:@p symbol, replacing an earlier export of the same name.
     * @return Always true, so the call can initialize a namespace-scope constant.
     */
    auto add(types::StringView module, types::StringView symbol, CodeObject object) -> bool;

    [[nodiscard]] auto find(const CodeLocation& location) const -> types::Option<CodeObject>;

    /**
     * @brief All exports of a module in registration order.
     * @return NotFound when nothing was ever exported under @p module
     */
    [[nodiscard]] auto members(types::StringView module) const -> types::Result<types::Vec<Member>>;

    [[nodiscard]] auto hasModule(types::StringView module) const -> bool;

    [[nodiscard]] auto modules() const -> types::Vec<types::String>;

    /**
     * @brief Withdraws every export of a module (used before its library is closed).
     */
    auto removeModule(types::StringView module) -> types::Unit;

   private:
    mutable types::Mutex                                 m_mutex;
    types::Map<types::String, types::Vec<Member>>        m_modules;
  };
} // namespace xtend::core::plugin

#define XTEND_EXPORT_IMPL(module, symbol, object)                                                  \
  namespace {                                                                                      \
    [[maybe_unused]] const bool XTEND_CONCAT(xtendExport_, __LINE__) =                             \
      ::xtend::core::plugin::ModuleRegistry::instance().add(module, symbol, object);               \
  }

/**
 * @def XTEND_EXPORT_PLUGIN
 * @brief Exports a plugin class (see PluginType) as module:ClassName.
 *
 * @code
 * XTEND_EXPORT_PLUGIN("acme.greeters", HelloGreeter)
 * @endcode
 */
#define XTEND_EXPORT_PLUGIN(module, PluginClass) \
  XTEND_EXPORT_IMPL(module, #PluginClass, ::xtend::core::plugin::MakeClassRef<PluginClass>({ module, #PluginClass }))

/**
 * @def XTEND_EXPORT_FUNCTION_PLUGIN
 * @brief Exports a free function as a plugin, configured by a FunctionPluginBuilder expression.
 *
 * @code
 * XTEND_EXPORT_FUNCTION_PLUGIN("acme.tools", upper, FunctionPluginBuilder("acme.transforms").name("upper"))
 * @endcode
 */
#define XTEND_EXPORT_FUNCTION_PLUGIN(module, function, builder) \
  XTEND_EXPORT_IMPL(module, #function, (builder).build({ module, #function }, &function).ref())

/**
 * @def XTEND_EXPORT_FUNCTION
 * @brief Exports a plain function. It is visible to module scanning but is not a plugin.
 */
#define XTEND_EXPORT_FUNCTION(module, function) \
  XTEND_EXPORT_IMPL(module, #function, (::xtend::core::plugin::PluginFunctionRef { .symbol = #function, .spec = ::xtend::utils::types::None }))

/**
 * @def XTEND_EXPORT_SPEC
 * @brief Exports a ready-made PluginSpec under @p symbol.
 */
#define XTEND_EXPORT_SPEC(module, symbol, spec) \
  XTEND_EXPORT_IMPL(module, #symbol, (::xtend::core::plugin::CodeObject { spec }))

/**
 * @def XTEND_EXPORT_SYMBOL
 * @brief Exports any other named symbol. It never resolves to a plugin.
 */
#define XTEND_EXPORT_SYMBOL(module, symbol) \
  XTEND_EXPORT_IMPL(module, #symbol, (::xtend::core::plugin::OpaqueSymbol { .symbol = #symbol, .kind = "symbol" }))

/**
 * @def XTEND_MODULE_LOG_SYNC
 * @brief Lets a code loader point this shared library's log level at the host's.
 *
 * Place once in every dynamically loaded module.
 */
#define XTEND_MODULE_LOG_SYNC()                                                                                  \
  extern "C" XTEND_MODULE_API auto XtendSetModuleLogLevel(::xtend::utils::logging::LogLevel* levelPtr) -> void { \
    ::xtend::utils::logging::SetLogLevelPtr(levelPtr);                                                           \
  }
