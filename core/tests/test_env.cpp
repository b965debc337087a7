#include <boost/ut.hpp>

#include <Xtend++/Utils/Env.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace xtend::utils::env;
  using namespace xtend::utils::error;
  using namespace xtend::utils::types;

  "GetEnv returns NotFound for missing variable"_test = [] -> void {
    Result<String> result = GetEnv("XTEND_TEST_NONEXISTENT_VAR_12345");

    expect(!result.has_value());
    expect(result.error().code == XtendErrorCode::NotFound);
  };

  "SetEnv and GetEnv round-trip"_test = [] -> void {
    expect(SetEnv("XTEND_TEST_VAR", "test_value").has_value());
    Result<String> result = GetEnv("XTEND_TEST_VAR");

    expect(result.has_value());
    expect(*result == String("test_value"));

    expect(UnsetEnv("XTEND_TEST_VAR").has_value());
  };

  "UnsetEnv removes variable"_test = [] -> void {
    expect(SetEnv("XTEND_TEST_VAR2", "value").has_value());
    expect(UnsetEnv("XTEND_TEST_VAR2").has_value());

    Result<String> result = GetEnv("XTEND_TEST_VAR2");

    expect(!result.has_value());
  };

  "SplitPathList drops empty items"_test = [] -> void {
#ifdef _WIN32
    const Vec<String> items = SplitPathList(";C:\\plugins;;D:\\more;");
    expect(items == Vec<String> { "C:\\plugins", "D:\\more" });
#else
    const Vec<String> items = SplitPathList(":/opt/plugins::/usr/lib/xtend:");
    expect(items == Vec<String> { "/opt/plugins", "/usr/lib/xtend" });
#endif

    expect(SplitPathList("").empty());
  };

  return 0;
}
