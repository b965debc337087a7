#include <format>      // std::format
#include <matchit.hpp> // matchit::{match, is, as, Id, _}

#include <Xtend++/Core/PluginSpec.hpp>

#include <Xtend++/Utils/Error.hpp>

namespace xtend::core::plugin {
  using utils::error::XtendError;
  using utils::types::Err;
  using utils::types::Result;
  using utils::types::String;
  using utils::types::StringView;
  using utils::types::UniquePointer;
  using utils::types::usize;
  using enum utils::error::XtendErrorCode;

  auto CodeLocation::parse(const StringView locator) -> Result<CodeLocation> {
    const usize colon = locator.find(':');

    if (colon == StringView::npos)
      ERR_FMT(ParseError, "invalid locator '{}': expected 'module:symbol'", locator);

    CodeLocation location {
      .module = String(locator.substr(0, colon)),
      .symbol = String(locator.substr(colon + 1)),
    };

    // surrounding whitespace is tolerated, as in hand-written declaration files
    constexpr StringView WHITESPACE = " \t";
    for (String* part : { &location.module, &location.symbol }) {
      part->erase(0, part->find_first_not_of(WHITESPACE));
      part->erase(part->find_last_not_of(WHITESPACE) + 1);
    }

    if (location.empty())
      ERR_FMT(ParseError, "invalid locator '{}': module and symbol must not be empty", locator);

    return location;
  }

  auto CodeLocation::locator() const -> String {
    return std::format("{}:{}", module, symbol);
  }

  PluginFactory::PluginFactory(CodeLocation location, FactoryFn create)
    : m_location(std::move(location)), m_create(std::make_shared<const FactoryFn>(std::move(create))) {}

  PluginFactory::PluginFactory(FactoryFn create)
    : m_create(std::make_shared<const FactoryFn>(std::move(create))) {}

  auto PluginFactory::operator()() const -> Result<UniquePointer<IPlugin>> {
    if (!m_create || !*m_create)
      ERR(InvalidArgument, "plugin factory is empty");

    Result<UniquePointer<IPlugin>> instance = [&]() -> Result<UniquePointer<IPlugin>> {
      try {
        return (*m_create)();
      } catch (const utils::types::Exception& exc) {
        return Err(XtendError::fromException(exc));
      }
    }();

    if (instance && !*instance)
      ERR(InternalError, "plugin factory returned no instance");

    return instance;
  }

  auto PluginFactory::operator==(const PluginFactory& other) const -> bool {
    if (m_location && other.m_location)
      return *m_location == *other.m_location;

    return m_create == other.m_create;
  }

  auto ResolveSpec(const CodeObject& source) -> Result<PluginSpec> {
    using matchit::match, matchit::is, matchit::as, matchit::Id, matchit::_;

    Id<PluginSpec>        spec;
    Id<PluginClassRef>    classRef;
    Id<PluginFunctionRef> functionRef;

    return match(source)(
      is | as<PluginSpec>(spec) = [&] -> Result<PluginSpec> { return *spec; },
      is | as<PluginClassRef>(classRef) = [&] -> Result<PluginSpec> {
        const PluginClassRef& ref = *classRef;
        return PluginSpec { .ns = ref.ns, .name = ref.name, .factory = ref.factory };
      },
      is | as<PluginFunctionRef>(functionRef) = [&] -> Result<PluginSpec> {
        const PluginFunctionRef& ref = *functionRef;

        if (!ref.spec)
          ERR_FMT(ResolutionFailed, "function '{}' was not registered as a plugin", ref.symbol);

        return *ref.spec;
      },
      is | _ = [&] -> Result<PluginSpec> {
        const auto& opaque = std::get<OpaqueSymbol>(source);
        ERR_FMT(ResolutionFailed, "cannot resolve a plugin spec from {} '{}'", opaque.kind.empty() ? "symbol" : opaque.kind, opaque.symbol);
      }
    );
  }
} // namespace xtend::core::plugin
