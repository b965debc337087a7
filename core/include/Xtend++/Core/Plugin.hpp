/**
 * @file Plugin.hpp
 * @brief The contract every Xtend++ plugin implements.
 *
 * @details A plugin is identified by a namespace (the extension point it
 * serves) and a name that is unique within that namespace. Both are fixed when
 * the instance is created. The manager asks a plugin whether it wants to be
 * loaded (shouldLoad) and then runs its load routine with the manager's load
 * arguments.
 */

#pragma once

#include <concepts> // std::derived_from, std::default_initializable

#include "../Utils/Error.hpp"
#include "../Utils/Logging.hpp" // IWYU pragma: keep
#include "../Utils/Types.hpp"

#if defined(_WIN32)
  #if defined(XTEND_BUILD)
    #define XTEND_API __declspec(dllexport)
  #else
    #define XTEND_API __declspec(dllimport)
  #endif
  #define XTEND_MODULE_API __declspec(dllexport)
#else
  #define XTEND_API        __attribute__((visibility("default")))
  #define XTEND_MODULE_API __attribute__((visibility("default")))
#endif

namespace xtend::core::plugin {
  namespace types = ::xtend::utils::types;

  /**
   * @brief Value produced by a plugin's load routine.
   */
  using LoadValue = types::Any;

  /**
   * @struct LoadArgs
   * @brief Positional and keyword arguments a manager forwards to every load routine.
   */
  struct LoadArgs {
    types::Vec<types::Any>                 args;
    types::Map<types::String, types::Any> kwargs;
  };

  /**
   * @class IPlugin
   * @brief Base interface for all plugins.
   */
  class XTEND_API IPlugin {
   public:
    IPlugin()                                  = default;
    IPlugin(const IPlugin&)                    = delete;
    IPlugin(IPlugin&&)                         = delete;
    auto operator=(const IPlugin&) -> IPlugin& = delete;
    auto operator=(IPlugin&&) -> IPlugin&      = delete;
    virtual ~IPlugin()                         = default;

    /**
     * @brief The namespace (extension point) this plugin belongs to.
     */
    [[nodiscard]] virtual auto getNamespace() const -> types::StringView = 0;

    /**
     * @brief The plugin's name, unique within its namespace.
     */
    [[nodiscard]] virtual auto getName() const -> types::StringView = 0;

    /**
     * @brief Enablement check run once before load. Returning false disables the plugin.
     */
    [[nodiscard]] virtual auto shouldLoad() const -> bool {
      return true;
    }

    /**
     * @brief Load routine. Runs at most once per instance.
     * @param args The manager's load arguments
     * @return A value the manager keeps on the plugin's container, or an error
     */
    virtual auto load(const LoadArgs& args) -> types::Result<LoadValue> {
      (void)args;
      return LoadValue {};
    }
  };

  /**
   * @brief Compile-time description of a plugin class.
   *
   * A plugin class names its identity with two static members:
   * @code
   * class Greeter : public Plugin<Greeter> {
   *  public:
   *   static constexpr StringView Namespace = "xtend.examples.greeters";
   *   static constexpr StringView Name      = "hello";
   * };
   * @endcode
   */
  template <typename T>
  concept PluginType = std::derived_from<T, IPlugin> && std::default_initializable<T> && requires {
    { T::Namespace } -> std::convertible_to<types::StringView>;
    { T::Name } -> std::convertible_to<types::StringView>;
  };

  /**
   * @class Plugin
   * @brief CRTP base that answers getNamespace/getName from the derived class' static identity.
   */
  template <typename Derived>
  class Plugin : public IPlugin {
   public:
    [[nodiscard]] auto getNamespace() const -> types::StringView override {
      return Derived::Namespace;
    }

    [[nodiscard]] auto getName() const -> types::StringView override {
      return Derived::Name;
    }
  };
} // namespace xtend::core::plugin
