/**
 * @file CodeLoader.hpp
 * @brief Turns locator strings into code objects.
 */

#pragma once

#include <filesystem> // std::filesystem::path

#include "../Utils/Types.hpp"
#include "ModuleRegistry.hpp"
#include "PluginSpec.hpp"

namespace xtend::core::plugin {
  namespace fs    = std::filesystem;
  namespace types = ::xtend::utils::types;

  /**
   * @class ICodeLoader
   * @brief Resolves a locator ("module:symbol") to the code object it names.
   *
   * Loading is synchronous and may fail; the caller decides what a failure means.
   */
  class XTEND_API ICodeLoader {
   public:
    ICodeLoader()                                      = default;
    ICodeLoader(const ICodeLoader&)                    = delete;
    ICodeLoader(ICodeLoader&&)                         = delete;
    auto operator=(const ICodeLoader&) -> ICodeLoader& = delete;
    auto operator=(ICodeLoader&&) -> ICodeLoader&      = delete;
    virtual ~ICodeLoader()                             = default;

    virtual auto load(types::StringView locator) -> types::Result<CodeObject> = 0;
  };

  // Platform-specific dynamic library handle
#ifdef _WIN32
  using DynamicLibraryHandle = void*; // HMODULE
#else
  using DynamicLibraryHandle = void*;
#endif

  /**
   * @class DynamicCodeLoader
   * @brief Resolves locators against the module registry, opening shared libraries on demand.
   *
   * @details A locator's module "pkg.sub" is first looked up in the registry.
   * When no library exported it yet, the loader opens "libpkg" or "pkg" (with
   * the platform's library extension) from its library directories, which runs
   * the library's XTEND_EXPORT_* registrations, and looks again. Libraries stay
   * open for the loader's lifetime; their exports are withdrawn from the
   * registry before they are closed, so the loader must outlive every plugin
   * created from them.
   */
  class XTEND_API DynamicCodeLoader final : public ICodeLoader {
   public:
    explicit DynamicCodeLoader(types::Vec<fs::path> libraryDirs, ModuleRegistry& registry = ModuleRegistry::instance());
    ~DynamicCodeLoader() override;

    DynamicCodeLoader(const DynamicCodeLoader&)                    = delete;
    DynamicCodeLoader(DynamicCodeLoader&&)                         = delete;
    auto operator=(const DynamicCodeLoader&) -> DynamicCodeLoader& = delete;
    auto operator=(DynamicCodeLoader&&) -> DynamicCodeLoader&      = delete;

    auto load(types::StringView locator) -> types::Result<CodeObject> override;

    /**
     * @brief Makes sure @p module is registered, opening its library if needed.
     */
    auto importModule(types::StringView module) -> types::Result<>;

    /**
     * @brief Opens every module library in the library directories.
     * @return The modules registered by the libraries opened in this call
     */
    auto importAll() -> types::Result<types::Vec<types::String>>;

    auto addLibraryDir(fs::path dir) -> types::Unit;

    [[nodiscard]] auto libraryDirs() const -> types::Vec<fs::path>;

    /**
     * @brief The loader used when none is injected. Searches DefaultSearchPath().
     */
    static auto defaultInstance() -> types::SharedPointer<ICodeLoader>;

   private:
    struct LoadedLibrary {
      DynamicLibraryHandle      handle;
      fs::path                  path;
      types::Vec<types::String> modules; ///< modules that appeared in the registry when it was opened
    };

    auto openLibraryFor(types::StringView module) -> types::Result<>;
    auto openLibrary(const fs::path& path) -> types::Result<types::Vec<types::String>>;
    auto isOpen(const fs::path& path) const -> bool;

    static auto loadDynamicLibrary(const fs::path& path) -> types::Result<DynamicLibraryHandle>;
    static auto unloadDynamicLibrary(DynamicLibraryHandle handle) -> types::Unit;
    static auto syncModuleLogLevel(DynamicLibraryHandle handle) -> types::Unit;

    mutable types::Mutex           m_mutex;
    types::Vec<fs::path>           m_libraryDirs;
    ModuleRegistry&                m_registry;
    types::Vec<LoadedLibrary>      m_libraries;
    types::Vec<types::String>      m_failedLibraries;
  };
} // namespace xtend::core::plugin
