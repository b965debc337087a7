#include <boost/ut.hpp>

#include <Xtend++/Core/SearchPath.hpp>

#include <Xtend++/Utils/Env.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace xtend::core::plugin;
  using namespace xtend::utils::env;
  using namespace xtend::utils::types;

  "XTEND_PATH entries come before configured paths"_test = [] -> void {
#ifdef _WIN32
    expect(SetEnv("XTEND_PATH", "C:\\first;C:\\shared").has_value());
    const fs::path first = "C:\\first", shared = "C:\\shared", configured = "C:\\configured";
#else
    expect(SetEnv("XTEND_PATH", "/first:/shared").has_value());
    const fs::path first = "/first", shared = "/shared", configured = "/configured";
#endif
    SetConfiguredSearchPath({ shared, configured });

    expect(DefaultSearchPath() == Vec<fs::path> { first, shared, configured });

    expect(UnsetEnv("XTEND_PATH").has_value());
    SetConfiguredSearchPath({});
  };

  "empty without XTEND_PATH or configured paths"_test = [] -> void {
    expect(UnsetEnv("XTEND_PATH").has_value());
    SetConfiguredSearchPath({});

    expect(DefaultSearchPath().empty());
  };

#if !defined(_WIN32) && !defined(__APPLE__)
  "cache dir follows an absolute XDG_CACHE_HOME"_test = [] -> void {
    expect(SetEnv("HOME", "/home/xtend-test").has_value());

    expect(SetEnv("XDG_CACHE_HOME", "/var/cache/xtend-test").has_value());
    expect(GetUserCacheDir() == fs::path("/var/cache/xtend-test"));

    expect(SetEnv("XDG_CACHE_HOME", "relative/cache").has_value());
    expect(GetUserCacheDir() == fs::path("/home/xtend-test/.cache"));

    expect(UnsetEnv("XDG_CACHE_HOME").has_value());
    expect(GetUserCacheDir() == fs::path("/home/xtend-test/.cache"));
  };
#endif

  "executable path points at this test"_test = [] -> void {
    const fs::path exe = GetExecutablePath();

    expect(!exe.empty());
    expect(exe.stem().string().starts_with("test_search_path"));
  };

  return 0;
}
