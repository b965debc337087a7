#include <algorithm> // std::ranges::{any_of, find, set_difference, sort}
#include <format>    // std::format
#include <iterator>  // std::back_inserter

#include <Xtend++/Core/CodeLoader.hpp>
#include <Xtend++/Core/SearchPath.hpp>

#include <Xtend++/Utils/Error.hpp>
#include <Xtend++/Utils/Logging.hpp>

#ifdef _WIN32
  #include <windows.h>
#else
  #include <dlfcn.h> // dlopen, dlsym, dlclose, dlerror
#endif

namespace xtend::core::plugin {
  using namespace utils::types;
  using enum utils::error::XtendErrorCode;

  namespace {
#ifdef _WIN32
    constexpr StringView LIBRARY_EXTENSION = ".dll";
#elifdef __APPLE__
    constexpr StringView LIBRARY_EXTENSION = ".dylib";
#else
    constexpr StringView LIBRARY_EXTENSION = ".so";
#endif

    // "pkg.sub.mod" is provided by the library named after "pkg"
    auto LibraryNameFor(const StringView module) -> StringView {
      return module.substr(0, module.find('.'));
    }
  } // namespace

  DynamicCodeLoader::DynamicCodeLoader(Vec<fs::path> libraryDirs, ModuleRegistry& registry)
    : m_libraryDirs(std::move(libraryDirs)), m_registry(registry) {}

  DynamicCodeLoader::~DynamicCodeLoader() {
    const LockGuard lock(m_mutex);

    for (auto iter = m_libraries.rbegin(); iter != m_libraries.rend(); ++iter) {
      for (const String& module : iter->modules)
        m_registry.removeModule(module);

      debug_log("Closing module library '{}'", iter->path.string());
      unloadDynamicLibrary(iter->handle);
    }
  }

  auto DynamicCodeLoader::defaultInstance() -> SharedPointer<ICodeLoader> {
    static const SharedPointer<ICodeLoader> Instance = std::make_shared<DynamicCodeLoader>(DefaultSearchPath());
    return Instance;
  }

  auto DynamicCodeLoader::load(const StringView locator) -> Result<CodeObject> {
    const CodeLocation location = TRY(CodeLocation::parse(locator));

    if (Option<CodeObject> object = m_registry.find(location))
      return *std::move(object);

    TRY_VOID(importModule(location.module));

    if (Option<CodeObject> object = m_registry.find(location))
      return *std::move(object);

    ERR_FMT(NotFound, "module '{}' has no export named '{}'", location.module, location.symbol);
  }

  auto DynamicCodeLoader::importModule(const StringView module) -> Result<> {
    if (m_registry.hasModule(module))
      return {};

    const LockGuard lock(m_mutex);

    // another thread may have opened the library while we waited
    if (m_registry.hasModule(module))
      return {};

    TRY_VOID(openLibraryFor(module));

    if (!m_registry.hasModule(module))
      ERR_FMT(NotFound, "no module named '{}'", module);

    return {};
  }

  auto DynamicCodeLoader::addLibraryDir(fs::path dir) -> Unit {
    const LockGuard lock(m_mutex);

    if (std::ranges::find(m_libraryDirs, dir) == m_libraryDirs.end()) {
      debug_log("Added module library directory: {}", dir.string());
      m_libraryDirs.push_back(std::move(dir));
      m_failedLibraries.clear();
    }
  }

  auto DynamicCodeLoader::libraryDirs() const -> Vec<fs::path> {
    const LockGuard lock(m_mutex);
    return m_libraryDirs;
  }

  auto DynamicCodeLoader::openLibraryFor(const StringView module) -> Result<> {
    const String libraryName(LibraryNameFor(module));

    if (std::ranges::find(m_failedLibraries, libraryName) != m_failedLibraries.end())
      ERR_FMT(NotFound, "no module named '{}' (library '{}' is not available)", module, libraryName);

    for (const fs::path& dir : m_libraryDirs)
      for (const String& fileName : { std::format("lib{}{}", libraryName, LIBRARY_EXTENSION), std::format("{}{}", libraryName, LIBRARY_EXTENSION) }) {
        const fs::path candidate = dir / fileName;

        if (std::error_code errc; !fs::is_regular_file(candidate, errc))
          continue;

        if (isOpen(candidate))
          ERR_FMT(NotFound, "library '{}' is loaded but does not export module '{}'", candidate.string(), module);

        debug_log("Loading module library '{}' for module '{}'", candidate.string(), module);

        TRY_VOID(openLibrary(candidate));
        return {};
      }

    m_failedLibraries.push_back(libraryName);
    ERR_FMT(NotFound, "no module named '{}': library '{}' not found in {} search director{}", module, libraryName, m_libraryDirs.size(), m_libraryDirs.size() == 1 ? "y" : "ies");
  }

  auto DynamicCodeLoader::importAll() -> Result<Vec<String>> {
    const LockGuard lock(m_mutex);

    Vec<String> imported;

    for (const fs::path& dir : m_libraryDirs) {
      std::error_code errc;

      if (!fs::is_directory(dir, errc))
        continue;

      Vec<fs::path> candidates;
      for (fs::directory_iterator iter(dir, errc), end; !errc && iter != end; iter.increment(errc))
        if (iter->path().extension().string() == LIBRARY_EXTENSION && iter->is_regular_file(errc))
          candidates.push_back(iter->path());

      if (errc)
        ERR_FMT(IoError, "cannot list library directory '{}': {}", dir.string(), errc.message());

      std::ranges::sort(candidates);

      for (const fs::path& candidate : candidates) {
        if (isOpen(candidate))
          continue;

        debug_log("Loading module library '{}'", candidate.string());

        Vec<String> modules = TRY(openLibrary(candidate));
        imported.insert(imported.end(), modules.begin(), modules.end());
      }
    }

    return imported;
  }

  auto DynamicCodeLoader::isOpen(const fs::path& path) const -> bool {
    return std::ranges::any_of(m_libraries, [&](const LoadedLibrary& library) { return library.path == path; });
  }

  auto DynamicCodeLoader::openLibrary(const fs::path& path) -> Result<Vec<String>> {
    const Vec<String> before = m_registry.modules();

    const DynamicLibraryHandle handle = TRY(loadDynamicLibrary(path));

    syncModuleLogLevel(handle);

    const Vec<String> after = m_registry.modules();
    Vec<String>       added;
    std::ranges::set_difference(after, before, std::back_inserter(added));

    m_libraries.push_back(LoadedLibrary { .handle = handle, .path = path, .modules = added });
    return added;
  }

  auto DynamicCodeLoader::loadDynamicLibrary(const fs::path& path) -> Result<DynamicLibraryHandle> {
#ifdef _WIN32
    HMODULE handle = LoadLibraryA(path.string().c_str());
    if (!handle)
      ERR_FMT(IoError, "Failed to load DLL '{}': Error Code {}", path.string(), GetLastError());
    return static_cast<DynamicLibraryHandle>(handle);
#else
    void* handle = dlopen(path.string().c_str(), RTLD_LAZY);
    if (!handle)
      ERR_FMT(IoError, "Failed to load shared library '{}': {}", path.string(), dlerror());
    return handle;
#endif
  }

  auto DynamicCodeLoader::unloadDynamicLibrary(DynamicLibraryHandle handle) -> Unit {
    if (!handle)
      return;

#ifdef _WIN32
    if (!FreeLibrary(static_cast<HMODULE>(handle)))
      warn_log("FreeLibrary failed: Error Code {}", GetLastError());
#else
    if (dlclose(handle) != 0)
      warn_log("dlclose failed: {}", dlerror());
#endif
  }

  auto DynamicCodeLoader::syncModuleLogLevel(DynamicLibraryHandle handle) -> Unit {
    using utils::logging::GetLogLevelPtr;
    using utils::logging::LogLevel;

    using SetLogLevelFunc = void (*)(LogLevel*);

#ifdef _WIN32
    FARPROC func = GetProcAddress(static_cast<HMODULE>(handle), "XtendSetModuleLogLevel");
#else
    void* func = dlsym(handle, "XtendSetModuleLogLevel");
#endif
    if (func) {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      auto setLogLevel = reinterpret_cast<SetLogLevelFunc>(func);
      setLogLevel(GetLogLevelPtr());
      debug_log("Synchronized log level with module library");
    } else
      debug_log("Module library does not export XtendSetModuleLogLevel");
  }
} // namespace xtend::core::plugin
