/**
 * @file Filter.hpp
 * @brief Predicates that disable plugins before they are initialized.
 */

#pragma once

#include "../Utils/Types.hpp"
#include "PluginSpec.hpp"

namespace xtend::core::plugin {
  namespace types = ::xtend::utils::types;

  /**
   * @brief Returns true when the plugin must be disabled.
   */
  using PluginFilter = types::Fn<bool(const PluginSpec&)>;

  /**
   * @struct PluginSpecMatcher
   * @brief Glob patterns over a spec. Every configured pattern must match; an empty matcher matches everything.
   */
  struct XTEND_API PluginSpecMatcher {
    types::Option<types::String> ns;
    types::Option<types::String> name;
    types::Option<types::String> value; ///< Matched against the spec's locator

    [[nodiscard]] auto matches(const PluginSpec& spec) const -> bool;
  };

  /**
   * @brief Shell-style glob match ('*', '?', '[...]').
   */
  XTEND_API auto GlobMatch(types::StringView pattern, types::StringView text) -> bool;

  /**
   * @class MatchingPluginFilter
   * @brief Disables a plugin when any of its exclusions matches it.
   */
  class XTEND_API MatchingPluginFilter {
   public:
    MatchingPluginFilter() = default;
    explicit MatchingPluginFilter(types::Vec<PluginSpecMatcher> exclusions);

    auto addExclusion(PluginSpecMatcher matcher) -> types::Unit;

    auto operator()(const PluginSpec& spec) const -> bool;

    [[nodiscard]] auto exclusions() const -> types::Vec<PluginSpecMatcher>;

    /**
     * @brief A PluginFilter that consults this filter, including exclusions added later.
     *
     * The filter must outlive the returned function.
     */
    [[nodiscard]] auto asFilter() const -> PluginFilter;

   private:
    mutable types::Mutex          m_mutex;
    types::Vec<PluginSpecMatcher> m_exclusions;
  };

  /**
   * @brief Process-wide filter installed in managers that were not given filters. Starts empty.
   */
  XTEND_API auto GlobalPluginFilter() -> MatchingPluginFilter&;
} // namespace xtend::core::plugin
