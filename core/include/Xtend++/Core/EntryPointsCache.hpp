/**
 * @file EntryPointsCache.hpp
 * @brief Resolution of installed entry points, with an in-process memo and an on-disk cache.
 *
 * @details Installed distributions are "<dist>.xtend-info" directories placed
 * directly inside a search-path entry. Each one declares its entry points in
 * "entry_points.txt", or redirects to another declaration file through
 * "entry_points_editable.txt" (the file's content is the target path).
 */

#pragma once

#include <filesystem> // std::filesystem::path

#include "../Utils/Types.hpp"
#include "EntryPoint.hpp"

namespace xtend::core::plugin {
  namespace fs    = std::filesystem;
  namespace types = ::xtend::utils::types;

  inline constexpr types::StringView DIST_INFO_SUFFIX      = ".xtend-info";
  inline constexpr types::StringView ENTRY_POINTS_FILE     = "entry_points.txt";
  inline constexpr types::StringView EDITABLE_REDIRECT_FILE = "entry_points_editable.txt";

  /**
   * @struct Distribution
   * @brief One installed distribution found on the search path.
   */
  struct Distribution {
    types::String name;            ///< Directory name without the ".xtend-info" suffix
    fs::path      infoDir;         ///< The "<name>.xtend-info" directory
    fs::path      entryPointsFile; ///< The declaration file in effect (own or redirect target)
    bool          editable = false;
  };

  /**
   * @brief Lists the distributions on @p searchPath. The first directory providing a name wins.
   */
  XTEND_API auto FindDistributions(types::Span<const fs::path> searchPath) -> types::Vec<Distribution>;

  /**
   * @brief The redirect target of an info directory, when the redirect file exists and its target does too.
   */
  XTEND_API auto ReadEditableRedirect(const fs::path& infoDir) -> types::Option<fs::path>;

  /**
   * @brief The distribution that provides the module a spec's factory was exported from.
   *
   * A distribution provides a root module ("pkg" for "pkg.sub") when one of its
   * declared entry points points into it. The first such distribution on the
   * search path is returned; None when the factory has no location or nothing provides it.
   */
  XTEND_API auto ResolveDistribution(const PluginSpec& spec, types::Span<const fs::path> searchPath) -> types::Option<Distribution>;

  /**
   * @class IEntryPointsResolver
   * @brief Produces the group -> entry points index for a search path.
   */
  class XTEND_API IEntryPointsResolver {
   public:
    IEntryPointsResolver()                                               = default;
    IEntryPointsResolver(const IEntryPointsResolver&)                    = delete;
    IEntryPointsResolver(IEntryPointsResolver&&)                         = delete;
    auto operator=(const IEntryPointsResolver&) -> IEntryPointsResolver& = delete;
    auto operator=(IEntryPointsResolver&&) -> IEntryPointsResolver&      = delete;
    virtual ~IEntryPointsResolver()                                      = default;

    virtual auto getEntryPoints(types::Span<const fs::path> searchPath) -> types::Result<EntryPointIndex> = 0;
  };

  /**
   * @class MetadataEntryPointsResolver
   * @brief Scans every distribution's declarations. No caching.
   */
  class XTEND_API MetadataEntryPointsResolver final : public IEntryPointsResolver {
   public:
    auto getEntryPoints(types::Span<const fs::path> searchPath) -> types::Result<EntryPointIndex> override;

    /**
     * @brief All declared entry points, deduplicated, in search-path order.
     */
    static auto resolveEntryPoints(types::Span<const fs::path> searchPath) -> types::Result<types::Vec<EntryPoint>>;
  };

  /**
   * @struct InterpreterIdentity
   * @brief The running program, as far as cache keys are concerned.
   */
  struct InterpreterIdentity {
    types::String executable;
    types::String prefix;

    static auto current() -> InterpreterIdentity;
  };

  /**
   * @brief SHA-256 (hex) of the identity and the modification state of everything reachable from @p searchPath.
   *
   * Covers each entry and its mtime, each distribution's declaration file and
   * its mtime, and redirect targets. A missing file contributes -1.
   */
  XTEND_API auto ComputePathStateHash(const InterpreterIdentity& identity, types::Span<const fs::path> searchPath) -> types::Result<types::String>;

  /**
   * @class EntryPointsCache
   * @brief Memoizing resolver backed by "<hash>.entry_points.txt" files.
   *
   * Callers asking for the same search path serialize on that path's slot;
   * different search paths proceed independently.
   */
  class XTEND_API EntryPointsCache final : public IEntryPointsResolver {
   public:
    explicit EntryPointsCache(
      fs::path                                  cacheDir,
      InterpreterIdentity                       identity = InterpreterIdentity::current(),
      types::SharedPointer<IEntryPointsResolver> source   = std::make_shared<MetadataEntryPointsResolver>()
    );

    /**
     * @brief The process-wide cache in "<user cache dir>/xtend".
     */
    static auto instance() -> EntryPointsCache&;

    /**
     * @brief Non-owning handle to instance(), for injection.
     */
    static auto shared() -> types::SharedPointer<IEntryPointsResolver>;

    auto getEntryPoints(types::Span<const fs::path> searchPath) -> types::Result<EntryPointIndex> override;

    /**
     * @brief The file the current state of @p searchPath is cached in.
     */
    auto cacheFileFor(types::Span<const fs::path> searchPath) const -> types::Result<fs::path>;

    /**
     * @brief When set, cache files are neither read nor written. The in-process memo still applies.
     */
    auto setIgnoreDisk(bool ignore) -> types::Unit;

    /**
     * @brief Moves the cache to @p dir and forgets the in-process memo.
     * @note Not synchronized with lookups; call it before the cache is in use.
     */
    auto setCacheDir(fs::path dir) -> types::Unit;

    /**
     * @brief Forgets the in-process memo.
     */
    auto invalidate() -> types::Unit;

    /**
     * @brief Deletes every cache file in the cache directory.
     * @return Number of files removed
     */
    auto clearDisk() -> types::Result<types::usize>;

    [[nodiscard]] auto cacheDir() const -> const fs::path& {
      return m_cacheDir;
    }

   private:
    struct Slot {
      types::Mutex                          mutex;
      types::Option<EntryPointIndex>        index;
    };

    auto slotFor(const types::String& key) -> types::SharedPointer<Slot>;
    auto build(types::Span<const fs::path> searchPath) -> types::Result<EntryPointIndex>;

    fs::path                                                     m_cacheDir;
    InterpreterIdentity                                          m_identity;
    types::SharedPointer<IEntryPointsResolver>                   m_source;
    types::Atomic<bool>                                          m_ignoreDisk = false;
    types::Mutex                                                 m_slotsMutex;
    types::UnorderedMap<types::String, types::SharedPointer<Slot>> m_slots;
  };
} // namespace xtend::core::plugin
