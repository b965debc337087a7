#include <boost/ut.hpp>

#include <Xtend++/Core/CodeLoader.hpp>
#include <Xtend++/Core/Finder.hpp>
#include <Xtend++/Core/PluginManager.hpp>

#include "Support.hpp"

#ifndef XTEND_TEST_MODULE_DIR
  #error "XTEND_TEST_MODULE_DIR must name the directory holding the sample module library"
#endif

namespace {
  using namespace xtend::core::plugin;
  using namespace xtend::utils::types;
  using xtend::utils::error::XtendError;
  using xtend::utils::error::XtendErrorCode;

  class ResolveFailureRecorder final : public IPluginLifecycleListener {
   public:
    Vec<String> failed;

    auto onResolveException(const StringView /*ns*/, const EntryPoint& entryPoint, const XtendError& /*error*/) -> Result<> override {
      failed.push_back(entryPoint.name);
      return {};
    }
  };
} // namespace

auto main() -> int {
  using namespace boost::ut;
  using xtend::test::TempDir;
  using xtend::test::WriteFile;

  // one loader for the whole run: a library that cannot be unloaded would not register again
  const auto loader = std::make_shared<DynamicCodeLoader>(Vec<fs::path> { fs::path(XTEND_TEST_MODULE_DIR) });

  "Opening every library reports the new modules"_test = [&] -> void {
    Result<Vec<String>> modules = loader->importAll();

    expect(modules.has_value());
    expect(*modules == Vec<String> { "xtend_sample.greeters", "xtend_sample.tools" });

    Result<Vec<String>> again = loader->importAll();
    expect(again.has_value());
    expect(again->empty());
  };

  "Locators resolve to exported plugin classes"_test = [&] -> void {
    Result<CodeObject> object = loader->load("xtend_sample.greeters:HelloGreeter");
    expect(object.has_value());

    Result<PluginSpec> spec = ResolveSpec(*object);
    expect(spec.has_value());
    expect(spec->ns == String("xtend.sample.greeters"));
    expect(spec->name == String("hello"));
  };

  "Function plugins are exported with their spec"_test = [&] -> void {
    Result<PluginSpec> spec = loader->load("xtend_sample.tools:Shout").and_then(ResolveSpec);

    expect(spec.has_value());
    expect(spec->ns == String("xtend.sample.transforms"));
    expect(spec->name == String("shout"));

    Result<UniquePointer<IPlugin>> instance = spec->factory();
    auto* shout = dynamic_cast<FunctionPlugin<String(const String&)>*>(instance->get());

    expect(shout != nullptr);
    expect((*shout)("hi") == String("HI!"));
  };

  "Missing symbols and modules are not found"_test = [&] -> void {
    Result<CodeObject> symbol = loader->load("xtend_sample.greeters:Nope");
    expect(symbol.error().code == XtendErrorCode::NotFound);
    expect(symbol.error().message == String("module 'xtend_sample.greeters' has no export named 'Nope'"));

    Result<CodeObject> module = loader->load("xtend_sample.unknown:Thing");
    expect(module.error().code == XtendErrorCode::NotFound);

    expect(loader->load("not a locator").error().code == XtendErrorCode::ParseError);
  };

  "Libraries are looked up only in the library directories"_test = [] -> void {
    const TempDir     empty;
    DynamicCodeLoader isolated({ empty.path() });

    Result<> first  = isolated.importModule("xtend_absent.module");
    Result<> second = isolated.importModule("xtend_absent.module");

    expect(first.error().code == XtendErrorCode::NotFound);
    expect(second.error().code == XtendErrorCode::NotFound);

    isolated.addLibraryDir(empty.path());
    expect(isolated.libraryDirs().size() == 1_ul);
  };

  "Plugins declared in metadata are loaded from module libraries"_test = [&] -> void {
    const TempDir site;

    WriteFile(
      site.path() / "sample.xtend-info" / "entry_points.txt",
      "[xtend.sample.greeters]\n"
      "hello = xtend_sample.greeters:HelloGreeter\n"
      "silent = xtend_sample.greeters:SilentGreeter\n"
      "version = xtend_sample.greeters:Version\n"
      "missing = xtend_sample.greeters:Missing\n"
    );

    auto recorder = std::make_shared<ResolveFailureRecorder>();

    auto finder = std::make_shared<MetadataPluginFinder>(
      "xtend.sample.greeters",
      MetadataPluginFinder::Options {
        .onResolveFailure = [recorder](const StringView ns, const EntryPoint& entryPoint, const XtendError& error) {
          (void)recorder->onResolveException(ns, entryPoint, error);
        },
        .loader     = loader,
        .resolver   = std::make_shared<MetadataEntryPointsResolver>(),
        .searchPath = Vec<fs::path> { site.path() },
      }
    );

    PluginManager manager(
      "xtend.sample.greeters",
      PluginManagerOptions { .loadArgs = {}, .listeners = {}, .finder = finder, .filters = Vec<PluginFilter> {} }
    );

    expect(*manager.listNames() == Vec<String> { "hello", "silent" });
    expect(recorder->failed == Vec<String> { "version", "missing" });

    Result<Vec<IPlugin*>> loaded = manager.loadAll();

    expect(loaded.has_value());
    expect(loaded->size() == 1_ul);
    expect(std::any_cast<String>((*manager.getContainer("hello"))->loadValue()) == String("hello from the sample module"));
    expect((*manager.getContainer("silent"))->isDisabled());

    Option<Distribution> dist = (*manager.getContainer("hello"))->distribution(Vec<fs::path> { site.path() });
    expect(dist.has_value());
    expect(dist->name == String("sample"));
  };

  return 0;
}
