#include <Xtend++/Core/ModuleRegistry.hpp>

#include <Xtend++/Utils/Error.hpp>

namespace xtend::core::plugin {
  using namespace utils::types;
  using enum utils::error::XtendErrorCode;

  auto ModuleRegistry::instance() -> ModuleRegistry& {
    static ModuleRegistry Registry;
    return Registry;
  }

  auto ModuleRegistry::add(const StringView module, const StringView symbol, CodeObject object) -> bool {
    const LockGuard lock(m_mutex);

    auto iter = m_modules.find(module);
    if (iter == m_modules.end())
      iter = m_modules.emplace(String(module), Vec<Member> {}).first;

    Vec<Member>& members = iter->second;

    for (Member& member : members)
      if (member.first == symbol) {
        member.second = std::move(object);
        return true;
      }

    members.emplace_back(String(symbol), std::move(object));
    return true;
  }

  auto ModuleRegistry::find(const CodeLocation& location) const -> Option<CodeObject> {
    const LockGuard lock(m_mutex);

    const auto iter = m_modules.find(location.module);
    if (iter == m_modules.end())
      return None;

    for (const auto& [symbol, object] : iter->second)
      if (symbol == location.symbol)
        return object;

    return None;
  }

  auto ModuleRegistry::members(const StringView module) const -> Result<Vec<Member>> {
    const LockGuard lock(m_mutex);

    const auto iter = m_modules.find(module);
    if (iter == m_modules.end())
      ERR_FMT(NotFound, "no module named '{}'", module);

    return iter->second;
  }

  auto ModuleRegistry::hasModule(const StringView module) const -> bool {
    const LockGuard lock(m_mutex);
    return m_modules.contains(module);
  }

  auto ModuleRegistry::modules() const -> Vec<String> {
    const LockGuard lock(m_mutex);

    Vec<String> names;
    names.reserve(m_modules.size());

    for (const auto& [name, members] : m_modules)
      names.push_back(name);

    return names;
  }

  auto ModuleRegistry::removeModule(const StringView module) -> Unit {
    const LockGuard lock(m_mutex);

    if (const auto iter = m_modules.find(module); iter != m_modules.end())
      m_modules.erase(iter);
  }
} // namespace xtend::core::plugin
