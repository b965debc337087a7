#include <algorithm> // std::ranges::find

#include <Xtend++/Core/SearchPath.hpp>

#include <Xtend++/Utils/Env.hpp>
#include <Xtend++/Utils/Logging.hpp>

#ifdef _WIN32
  #include <windows.h> // GetModuleFileNameA
#elifdef __APPLE__
  #include <mach-o/dyld.h> // _NSGetExecutablePath
#endif

#ifndef XTEND_INSTALL_PREFIX
  #define XTEND_INSTALL_PREFIX ""
#endif

namespace xtend::core::plugin {
  using namespace utils::types;
  using utils::env::GetEnv;
  using utils::env::SplitPathList;

  namespace {
    auto ConfiguredSearchPathStorage() -> Vec<fs::path>& {
      static Vec<fs::path> Paths;
      return Paths;
    }

    auto ConfiguredSearchPathMutex() -> Mutex& {
      static Mutex PathMutex;
      return PathMutex;
    }
  } // namespace

  auto DefaultSearchPath() -> Vec<fs::path> {
    Vec<fs::path> paths;

    if (Result<String> envPath = GetEnv("XTEND_PATH"))
      for (const String& entry : SplitPathList(*envPath))
        paths.emplace_back(entry);

    const LockGuard lock(ConfiguredSearchPathMutex());

    for (const fs::path& entry : ConfiguredSearchPathStorage())
      if (std::ranges::find(paths, entry) == paths.end())
        paths.push_back(entry);

    return paths;
  }

  auto SetConfiguredSearchPath(Vec<fs::path> paths) -> Unit {
    const LockGuard lock(ConfiguredSearchPathMutex());
    ConfiguredSearchPathStorage() = std::move(paths);
  }

  auto GetUserCacheDir() -> fs::path {
#ifdef _WIN32
    if (Result<String> localAppData = GetEnv("LOCALAPPDATA"))
      return fs::path(*localAppData) / "cache";
    return fs::path(GetEnv("USERPROFILE").value_or(".")) / "AppData" / "Local" / "cache";
#elifdef __APPLE__
    return fs::path(GetEnv("HOME").value_or(".")) / "Library" / "Caches";
#else
    if (Result<String> xdgCache = GetEnv("XDG_CACHE_HOME"); xdgCache && fs::path(*xdgCache).is_absolute())
      return fs::path(*xdgCache);
    return fs::path(GetEnv("HOME").value_or(".")) / ".cache";
#endif
  }

  auto GetExecutablePath() -> fs::path {
#ifdef _WIN32
    Array<char, MAX_PATH> buffer {};
    const DWORD           length = GetModuleFileNameA(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
    if (length == 0 || length == buffer.size()) {
      debug_log("GetModuleFileNameA failed: {}", GetLastError());
      return {};
    }
    return fs::path(String(buffer.data(), length));
#elifdef __APPLE__
    Array<char, 4096> buffer {};
    u32               size = static_cast<u32>(buffer.size());
    if (_NSGetExecutablePath(buffer.data(), &size) != 0) {
      debug_log("_NSGetExecutablePath needs a buffer of {} bytes", size);
      return {};
    }
    std::error_code errc;
    fs::path        resolved = fs::weakly_canonical(buffer.data(), errc);
    return errc ? fs::path(buffer.data()) : resolved;
#else
    std::error_code errc;
    fs::path        exe = fs::read_symlink("/proc/self/exe", errc);
    if (errc) {
      debug_log("Could not resolve /proc/self/exe: {}", errc.message());
      return {};
    }
    return exe;
#endif
  }

  auto GetInstallPrefix() -> String {
    return XTEND_INSTALL_PREFIX;
  }
} // namespace xtend::core::plugin
