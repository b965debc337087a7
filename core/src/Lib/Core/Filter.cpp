#include <algorithm> // std::ranges::any_of

#include <Xtend++/Core/Filter.hpp>

#ifdef _WIN32
  #include <shlwapi.h> // PathMatchSpecA
#else
  #include <fnmatch.h> // fnmatch
#endif

namespace xtend::core::plugin {
  using namespace utils::types;

  auto GlobMatch(const StringView pattern, const StringView text) -> bool {
    const String patternStr(pattern);
    const String textStr(text);

#ifdef _WIN32
    return PathMatchSpecA(textStr.c_str(), patternStr.c_str()) == TRUE;
#else
    return fnmatch(patternStr.c_str(), textStr.c_str(), 0) == 0;
#endif
  }

  auto PluginSpecMatcher::matches(const PluginSpec& spec) const -> bool {
    if (ns && !GlobMatch(*ns, spec.ns))
      return false;

    if (name && !GlobMatch(*name, spec.name))
      return false;

    if (value) {
      // a factory without a code location has no value to match
      const Option<CodeLocation>& location = spec.factory.location();

      if (!location || !GlobMatch(*value, location->locator()))
        return false;
    }

    return true;
  }

  MatchingPluginFilter::MatchingPluginFilter(Vec<PluginSpecMatcher> exclusions) : m_exclusions(std::move(exclusions)) {}

  auto MatchingPluginFilter::addExclusion(PluginSpecMatcher matcher) -> Unit {
    const LockGuard lock(m_mutex);
    m_exclusions.push_back(std::move(matcher));
  }

  auto MatchingPluginFilter::operator()(const PluginSpec& spec) const -> bool {
    const LockGuard lock(m_mutex);
    return std::ranges::any_of(m_exclusions, [&](const PluginSpecMatcher& matcher) { return matcher.matches(spec); });
  }

  auto MatchingPluginFilter::exclusions() const -> Vec<PluginSpecMatcher> {
    const LockGuard lock(m_mutex);
    return m_exclusions;
  }

  auto MatchingPluginFilter::asFilter() const -> PluginFilter {
    return [this](const PluginSpec& spec) -> bool { return (*this)(spec); };
  }

  auto GlobalPluginFilter() -> MatchingPluginFilter& {
    static MatchingPluginFilter Instance;
    return Instance;
  }
} // namespace xtend::core::plugin
