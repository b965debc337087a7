#include <boost/ut.hpp>

#include <type_traits> // std::is_default_constructible_v

#include <Xtend++/Utils/ArgumentParser.hpp>
#include <Xtend++/Utils/Types.hpp>

namespace {
  enum class Format : xtend::utils::types::u8 {
    Ini,
    Json,
  };
} // namespace

auto main() -> int {
  using namespace boost::ut;
  using namespace xtend::utils::argparse;
  using namespace xtend::utils::types;

  "ArgumentParser flag"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    bool           verbose = false;
    parser.addArguments("-v", "--verbose").flag().bindTo(verbose);

    Vec<String> args   = { "testprog", "--verbose" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(verbose);
    expect(parser.isUsed("-v"));
  };

  "ArgumentParser value"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    String         output;
    parser.addArguments("-o", "--output").bindTo(output);

    Vec<String> args   = { "testprog", "-o", "out.txt" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(output == String("out.txt"));
  };

  "ArgumentParser default value"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    i32            count = 0;
    parser.addArguments("-c", "--count").defaultValue(i32(10)).bindTo(count);

    Vec<String> args   = { "testprog" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(count == 10);
  };

  "ArgumentParser repeatable option"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    Vec<String>    modules;
    parser.addArguments("-m", "--module").repeatable().bindTo(modules);

    Vec<String> args   = { "testprog", "-m", "acme.greeters", "--module", "acme.tools" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(modules == Vec<String> { "acme.greeters", "acme.tools" });
  };

  "ArgumentParser enum value is case-insensitive"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    Format         format = Format::Ini;
    parser.addArguments("-f", "--format").defaultValue(Format::Ini).bindToEnum(format);

    Vec<String> args   = { "testprog", "--format", "json" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(format == Format::Json);
  };

  "ArgumentParser subcommand options"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    String         ns;
    bool           ignoreCache = false;

    parser.addArguments("--ignore-cache").flag().bindTo(ignoreCache);
    ArgumentParser& resolve = parser.addSubcommand("resolve", "List plugins");
    resolve.addArguments("-n", "--namespace").defaultValue(String("")).bindTo(ns);
    parser.addSubcommand("show", "Show entry points");

    Vec<String> args   = { "testprog", "--ignore-cache", "resolve", "-n", "acme.greeters" };
    Result<>    result = parser.parseInto(args);

    expect(result.has_value());
    expect(parser.getSubcommand() == Option<String>("resolve"));
    expect(ignoreCache);
    expect(ns == String("acme.greeters"));
  };

  "ArgumentParser subcommands carry their own help flag"_test = [] -> void {
    static_assert(!std::is_default_constructible_v<ArgumentParser>);

    ArgumentParser  parser("0.1.0");
    ArgumentParser& show = parser.addSubcommand("show", "Show entry points");

    Vec<String> args   = { "testprog", "show" };
    Result<>    result = parser.parseArgs(args);

    expect(result.has_value());
    expect(parser.getSubcommand() == Option<String>("show"));
    expect(!show.get<bool>("--help"));
    expect(!show.get<bool>("-h"));
  };

  "ArgumentParser unknown command"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    parser.addSubcommand("show", "Show entry points");

    Vec<String> args   = { "testprog", "frobnicate" };
    Result<>    result = parser.parseArgs(args);

    expect(!result.has_value());
  };

  "ArgumentParser missing value"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    parser.addArguments("-o");

    Vec<String> args   = { "testprog", "-o" };
    Result<>    result = parser.parseArgs(args);

    expect(!result.has_value());
  };

  "ArgumentParser unknown argument"_test = [] -> void {
    ArgumentParser parser("0.1.0");
    Vec<String>    args   = { "testprog", "--unknown" };
    Result<>       result = parser.parseArgs(args);

    expect(!result.has_value());
  };

  return 0;
}
