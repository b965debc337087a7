#include <boost/ut.hpp>

#include <Xtend++/Core/EntryPoint.hpp>
#include <Xtend++/Core/Finder.hpp>
#include <Xtend++/Core/PluginSpec.hpp>

#include "Support.hpp"

auto main() -> int {
  using namespace boost::ut;
  using namespace xtend::core::plugin;
  using namespace xtend::utils::error;
  using namespace xtend::utils::types;
  using xtend::test::Counters;
  using xtend::test::ScriptedSpec;
  using xtend::test::StaticFinder;
  using xtend::test::TempDir;
  using xtend::test::WriteFile;

  "Locator parsing"_test = [] -> void {
    Result<CodeLocation> location = CodeLocation::parse("acme.greeters : HelloGreeter");

    expect(location.has_value());
    expect(location->module == String("acme.greeters"));
    expect(location->symbol == String("HelloGreeter"));
    expect(location->locator() == String("acme.greeters:HelloGreeter"));

    expect(!CodeLocation::parse("acme.greeters").has_value());
    expect(!CodeLocation::parse(":HelloGreeter").has_value());
    expect(CodeLocation::parse("acme:").error().code == XtendErrorCode::ParseError);
  };

  "Spec becomes an entry point in its namespace group"_test = [] -> void {
    Counters   counters;
    PluginSpec spec = ScriptedSpec("acme.greeters", "hello", counters);

    Result<EntryPoint> entryPoint = SpecToEntryPoint(spec);

    expect(entryPoint.has_value());
    expect(entryPoint->name == String("hello"));
    expect(entryPoint->group == String("acme.greeters"));
    expect(entryPoint->value == String("xtend_tests.scripted:hello"));
    expect(counters.created.load() == 0);
  };

  "Spec without exported factory has no entry point"_test = [] -> void {
    const PluginSpec spec { .ns = "acme.greeters", .name = "adhoc", .factory = PluginFactory(FactoryFn {}) };

    Result<EntryPoint> entryPoint = SpecToEntryPoint(spec);

    expect(!entryPoint.has_value());
    expect(entryPoint.error().code == XtendErrorCode::NotSupported);
  };

  "Duplicate names in one group are rejected"_test = [] -> void {
    const Vec<EntryPoint> entryPoints {
      { .name = "hello", .value = "acme.a:Hello", .group = "acme.greeters" },
      { .name = "hello", .value = "acme.b:Hello", .group = "acme.greeters" },
    };

    Result<EntryPointMap> map = ToEntryPointMap(entryPoints);

    expect(!map.has_value());
    expect(map.error().code == XtendErrorCode::DuplicateEntryPoint);
    expect(map.error().message == String("duplicate entry point 'hello' in group 'acme.greeters'"));
  };

  "Same name in different groups is allowed"_test = [] -> void {
    const Vec<EntryPoint> entryPoints {
      { .name = "hello", .value = "acme.a:Hello", .group = "acme.greeters" },
      { .name = "hello", .value = "acme.b:Hello", .group = "acme.other" },
    };

    Result<EntryPointMap> map = ToEntryPointMap(entryPoints);

    expect(map.has_value());
    expect(map->size() == 2_ul);
    expect(map->at("acme.greeters") == Vec<String> { "hello = acme.a:Hello" });
  };

  "Discovered specs are grouped by namespace"_test = [] -> void {
    Counters     counters;
    StaticFinder finder({
      ScriptedSpec("acme.greeters", "hello", counters),
      ScriptedSpec("acme.greeters", "goodbye", counters),
      ScriptedSpec("acme.transforms", "upper", counters),
    });

    Result<EntryPointMap> map = DiscoverEntryPoints(finder);

    expect(map.has_value());
    expect(map->at("acme.greeters") == Vec<String> { "hello = xtend_tests.scripted:hello", "goodbye = xtend_tests.scripted:goodbye" });
    expect(map->at("acme.transforms").size() == 1_ul);
    expect(counters.created.load() == 0);
  };

  "Declaration text parsing"_test = [] -> void {
    constexpr StringView text = "# generated\n"
                                "[acme.greeters]\n"
                                "hello = acme.greeters:Hello\n"
                                "; comment\n"
                                "  goodbye=acme.greeters:Goodbye  \n"
                                "\n"
                                "[acme.empty]\n";

    Result<EntryPointMap> map = ParseEntryPointsText(text);

    expect(map.has_value());
    expect(map->at("acme.greeters") == Vec<String> { "hello = acme.greeters:Hello", "goodbye = acme.greeters:Goodbye" });
    expect(map->contains("acme.empty"));
    expect(map->at("acme.empty").empty());
  };

  "Declaration text errors name the line"_test = [] -> void {
    Result<EntryPointMap> orphan = ParseEntryPointsText("hello = acme:Hello\n");
    expect(!orphan.has_value());
    expect(orphan.error().code == XtendErrorCode::ParseError);
    expect(orphan.error().message.starts_with("line 1:"));

    Result<EntryPointMap> unterminated = ParseEntryPointsText("[acme.greeters]\n[broken\n");
    expect(!unterminated.has_value());
    expect(unterminated.error().message.starts_with("line 2:"));

    Result<EntryPointMap> noValue = ParseEntryPointsText("[acme.greeters]\nhello =\n");
    expect(!noValue.has_value());
  };

  "Serialized declarations are sorted within a group"_test = [] -> void {
    const EntryPointMap map {
      { "acme.transforms", { "upper = acme.tools:upper" } },
      { "acme.greeters", { "hello = acme.greeters:Hello", "goodbye = acme.greeters:Goodbye" } },
    };

    Result<String> serialized = SerializeEntryPointsText(map);
    expect(serialized.has_value());

    const String text = serialized.value_or("");

    expect(text == String("[acme.greeters]\n"
                          "goodbye = acme.greeters:Goodbye\n"
                          "hello = acme.greeters:Hello\n"
                          "\n"
                          "[acme.transforms]\n"
                          "upper = acme.tools:upper\n"
                          "\n"));

    Result<EntryPointMap> reparsed = ParseEntryPointsText(text);
    expect(reparsed.has_value());
    expect(reparsed->at("acme.greeters").size() == 2_ul);
  };

  "Malformed lines cannot be serialized"_test = [] -> void {
    const EntryPointMap map { { "acme.greeters", { "hello = acme.greeters:Hello", "no assignment here" } } };

    Result<String> text = SerializeEntryPointsText(map);

    expect(!text.has_value());
    expect(text.error().code == XtendErrorCode::ParseError);
    expect(text.error().message.contains("no assignment here"));
  };

  "Serialized indexes keep their entry order"_test = [] -> void {
    const Vec<EntryPoint> entryPoints {
      { .name = "zeta", .value = "acme.greeters:Zeta", .group = "acme.greeters" },
      { .name = "alpha", .value = "acme.greeters:Alpha", .group = "acme.greeters" },
    };
    const EntryPointIndex index = BuildEntryPointIndex(entryPoints);

    const String text = SerializeEntryPointIndex(index);

    expect(text == String("[acme.greeters]\n"
                          "zeta = acme.greeters:Zeta\n"
                          "alpha = acme.greeters:Alpha\n"
                          "\n"));

    Result<EntryPointMap> reparsed = ParseEntryPointsText(text);
    expect(reparsed.has_value());
    expect(BuildEntryPointIndex(*EntryPointsFromMap(*reparsed)) == index);
  };

  "Map lines become entry points"_test = [] -> void {
    const EntryPointMap map { { "acme.greeters", { "hello = acme.greeters:Hello" } } };

    Result<Vec<EntryPoint>> entryPoints = EntryPointsFromMap(map);

    expect(entryPoints.has_value());
    expect(entryPoints->size() == 1_ul);
    expect(entryPoints->front() == EntryPoint { .name = "hello", .value = "acme.greeters:Hello", .group = "acme.greeters" });

    const EntryPointMap broken { { "acme.greeters", { "no assignment here" } } };
    expect(!EntryPointsFromMap(broken).has_value());
  };

  "First declaration of a name wins in the index"_test = [] -> void {
    const Vec<EntryPoint> entryPoints {
      { .name = "hello", .value = "first.greeters:Hello", .group = "acme.greeters" },
      { .name = "hello", .value = "second.greeters:Hello", .group = "acme.greeters" },
      { .name = "hello", .value = "first.greeters:Hello", .group = "acme.greeters" },
      { .name = "upper", .value = "acme.tools:upper", .group = "acme.transforms" },
    };

    expect(UniqueEntryPoints(entryPoints).size() == 3_ul);

    const EntryPointIndex index = BuildEntryPointIndex(entryPoints);

    expect(index.size() == 2_ul);
    expect(index.at("acme.greeters").size() == 1_ul);
    expect(index.at("acme.greeters").front().value == String("first.greeters:Hello"));
  };

  "Declaration files are read from disk"_test = [] -> void {
    const TempDir dir;
    const auto    file = dir.path() / "entry_points.txt";

    WriteFile(file, "[acme.greeters]\nhello = acme.greeters:Hello\n");

    Result<Vec<EntryPoint>> entryPoints = ReadEntryPointsFile(file);

    expect(entryPoints.has_value());
    expect(entryPoints->size() == 1_ul);
    expect(entryPoints->front().group == String("acme.greeters"));

    Result<Vec<EntryPoint>> missing = ReadEntryPointsFile(dir.path() / "absent.txt");
    expect(!missing.has_value());
    expect(missing.error().code == XtendErrorCode::IoError);
  };

  return 0;
}
