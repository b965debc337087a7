#include <algorithm>           // std::ranges::{find_if, sort}
#include <chrono>              // std::chrono::{duration_cast, nanoseconds}
#include <format>              // std::format
#include <fstream>             // std::{ifstream, ofstream}
#include <openssl/evp.h>       // EVP_{MD_CTX_new, MD_CTX_free, DigestInit_ex, DigestUpdate, DigestFinal_ex, sha256}
#include <sstream>             // std::ostringstream

#include <Xtend++/Core/EntryPointsCache.hpp>
#include <Xtend++/Core/SearchPath.hpp>

#include <Xtend++/Utils/Error.hpp>
#include <Xtend++/Utils/Logging.hpp>

namespace xtend::core::plugin {
  using namespace utils::types;
  using enum utils::error::XtendErrorCode;

  namespace {
    constexpr StringView CACHE_FILE_SUFFIX = ".entry_points.txt";
    constexpr i64        MISSING_MTIME     = -1;

    auto MTimeOf(const fs::path& path) -> i64 {
      std::error_code errc;
      const fs::file_time_type time = fs::last_write_time(path, errc);

      if (errc)
        return MISSING_MTIME;

      return std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count();
    }

    // Key of the in-process memo: the exact search path.
    auto MemoKey(const Span<const fs::path> searchPath) -> String {
      String key;

      for (const fs::path& entry : searchPath) {
        key += entry.string();
        key.push_back('\0');
      }

      return key;
    }

    auto ReadWholeFile(const fs::path& file) -> Result<String> {
      std::ifstream stream(file, std::ios::binary);

      if (!stream)
        ERR_FMT(IoError, "cannot open '{}'", file.string());

      std::ostringstream contents;
      contents << stream.rdbuf();
      return contents.str();
    }

    auto WriteWholeFile(const fs::path& file, const StringView contents) -> Result<> {
      std::error_code errc;
      fs::create_directories(file.parent_path(), errc);

      if (errc)
        ERR_FMT(IoError, "cannot create cache directory '{}': {}", file.parent_path().string(), errc.message());

      std::ofstream stream(file, std::ios::binary | std::ios::trunc);

      if (!stream)
        ERR_FMT(IoError, "cannot open '{}' for writing", file.string());

      stream << contents;

      if (!stream)
        ERR_FMT(IoError, "error while writing '{}'", file.string());

      return {};
    }

    /**
     * Incremental SHA-256 over OpenSSL's EVP interface.
     */
    class Sha256 {
     public:
      Sha256() : m_ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {}

      auto init() -> Result<> {
        if (!m_ctx || EVP_DigestInit_ex(m_ctx.get(), EVP_sha256(), nullptr) != 1)
          ERR(InternalError, "failed to initialize SHA-256 digest");

        return {};
      }

      auto update(const StringView data) -> Result<> {
        if (EVP_DigestUpdate(m_ctx.get(), data.data(), data.size()) != 1)
          ERR(InternalError, "failed to update SHA-256 digest");

        return {};
      }

      // Fields are length-prefixed so that ("ab", "c") and ("a", "bc") differ.
      auto field(const StringView data) -> Result<> {
        TRY_VOID(update(std::format("{}:", data.size())));
        return update(data);
      }

      auto field(const i64 value) -> Result<> {
        return field(std::format("{}", value));
      }

      auto hexDigest() -> Result<String> {
        Array<unsigned char, EVP_MAX_MD_SIZE> digest {};
        unsigned int                          length = 0;

        if (EVP_DigestFinal_ex(m_ctx.get(), digest.data(), &length) != 1)
          ERR(InternalError, "failed to finalize SHA-256 digest");

        String hex;
        hex.reserve(static_cast<usize>(length) * 2);

        for (unsigned int i = 0; i < length; ++i)
          hex += std::format("{:02x}", digest.at(i));

        return hex;
      }

     private:
      UniquePointer<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> m_ctx;
    };

    auto ListInfoDirs(const fs::path& entry) -> Vec<fs::path> {
      Vec<fs::path>   infoDirs;
      std::error_code errc;

      if (!fs::is_directory(entry, errc))
        return infoDirs;

      for (fs::directory_iterator iter(entry, errc), end; !errc && iter != end; iter.increment(errc)) {
        const fs::path& path = iter->path();

        if (path.extension().string() == DIST_INFO_SUFFIX && iter->is_directory(errc))
          infoDirs.push_back(path);
      }

      if (errc)
        warn_log("Error while listing '{}': {}", entry.string(), errc.message());

      std::ranges::sort(infoDirs);
      return infoDirs;
    }
  } // namespace

  auto ReadEditableRedirect(const fs::path& infoDir) -> Option<fs::path> {
    const fs::path redirect = infoDir / EDITABLE_REDIRECT_FILE;

    if (std::error_code errc; !fs::is_regular_file(redirect, errc))
      return None;

    Result<String> contents = ReadWholeFile(redirect);
    if (!contents) {
      warn_at(contents.error());
      return None;
    }

    const usize first = contents->find_first_not_of(" \t\r\n");
    const usize last  = contents->find_last_not_of(" \t\r\n");

    if (first == String::npos)
      return None;

    fs::path target(contents->substr(first, last - first + 1));
    if (target.is_relative())
      target = infoDir / target;

    if (std::error_code errc; !fs::exists(target, errc)) {
      debug_log("Editable redirect in '{}' points to missing '{}'", infoDir.string(), target.string());
      return None;
    }

    return target;
  }

  auto FindDistributions(const Span<const fs::path> searchPath) -> Vec<Distribution> {
    Vec<Distribution> distributions;

    for (const fs::path& entry : searchPath)
      for (const fs::path& infoDir : ListInfoDirs(entry)) {
        String name = infoDir.stem().string();

        const auto existing = std::ranges::find_if(distributions, [&](const Distribution& dist) { return dist.name == name; });

        if (existing != distributions.end()) {
          debug_log("Distribution '{}' in '{}' is shadowed by '{}'", name, infoDir.string(), existing->infoDir.string());
          continue;
        }

        Distribution dist { .name = std::move(name), .infoDir = infoDir, .entryPointsFile = infoDir / ENTRY_POINTS_FILE };

        if (Option<fs::path> target = ReadEditableRedirect(infoDir)) {
          dist.entryPointsFile = *std::move(target);
          dist.editable        = true;
        }

        distributions.push_back(std::move(dist));
      }

    return distributions;
  }

  auto ResolveDistribution(const PluginSpec& spec, const Span<const fs::path> searchPath) -> Option<Distribution> {
    const Option<CodeLocation>& location = spec.factory.location();

    if (!location)
      return None;

    const auto rootOf = [](const StringView module) { return module.substr(0, module.find('.')); };

    const StringView root = rootOf(location->module);

    for (const Distribution& dist : FindDistributions(searchPath)) {
      Result<Vec<EntryPoint>> declared = ReadEntryPointsFile(dist.entryPointsFile);

      if (!declared)
        continue;

      for (const EntryPoint& entryPoint : *declared)
        if (Result<CodeLocation> declaredLocation = CodeLocation::parse(entryPoint.value); declaredLocation && rootOf(declaredLocation->module) == root)
          return dist;
    }

    return None;
  }

  auto MetadataEntryPointsResolver::resolveEntryPoints(const Span<const fs::path> searchPath) -> Result<Vec<EntryPoint>> {
    Vec<EntryPoint> entryPoints;

    for (const Distribution& dist : FindDistributions(searchPath)) {
      if (std::error_code errc; !fs::is_regular_file(dist.entryPointsFile, errc))
        continue;

      Result<Vec<EntryPoint>> declared = ReadEntryPointsFile(dist.entryPointsFile);

      // one broken distribution does not hide the others
      if (!declared) {
        warn_log("Ignoring entry points of distribution '{}': {}", dist.name, declared.error().message);
        continue;
      }

      trace_log("Distribution '{}' declares {} entry point(s)", dist.name, declared->size());
      entryPoints.insert(entryPoints.end(), declared->begin(), declared->end());
    }

    return UniqueEntryPoints(entryPoints);
  }

  auto MetadataEntryPointsResolver::getEntryPoints(const Span<const fs::path> searchPath) -> Result<EntryPointIndex> {
    const Vec<EntryPoint> entryPoints = TRY(resolveEntryPoints(searchPath));
    return BuildEntryPointIndex(entryPoints);
  }

  auto InterpreterIdentity::current() -> InterpreterIdentity {
    return { .executable = GetExecutablePath().string(), .prefix = GetInstallPrefix() };
  }

  auto ComputePathStateHash(const InterpreterIdentity& identity, const Span<const fs::path> searchPath) -> Result<String> {
    Sha256 sha;
    TRY_VOID(sha.init());

    TRY_VOID(sha.field(identity.executable));
    TRY_VOID(sha.field(identity.prefix));

    for (const fs::path& entry : searchPath) {
      TRY_VOID(sha.field(entry.string()));
      TRY_VOID(sha.field(MTimeOf(entry)));

      for (const fs::path& infoDir : ListInfoDirs(entry)) {
        const fs::path declarations = infoDir / ENTRY_POINTS_FILE;
        TRY_VOID(sha.field(declarations.string()));
        TRY_VOID(sha.field(MTimeOf(declarations)));

        const fs::path redirect = infoDir / EDITABLE_REDIRECT_FILE;
        TRY_VOID(sha.field(redirect.string()));
        TRY_VOID(sha.field(MTimeOf(redirect)));

        if (const Option<fs::path> target = ReadEditableRedirect(infoDir)) {
          TRY_VOID(sha.field(target->string()));
          TRY_VOID(sha.field(MTimeOf(*target)));
        }
      }
    }

    return sha.hexDigest();
  }

  EntryPointsCache::EntryPointsCache(fs::path cacheDir, InterpreterIdentity identity, SharedPointer<IEntryPointsResolver> source)
    : m_cacheDir(std::move(cacheDir)), m_identity(std::move(identity)), m_source(std::move(source)) {}

  auto EntryPointsCache::instance() -> EntryPointsCache& {
    static Atomic<EntryPointsCache*>      Instance = nullptr;
    static Mutex                          InstanceMutex;
    static UniquePointer<EntryPointsCache> Storage;

    if (EntryPointsCache* cache = Instance.load(std::memory_order_acquire))
      return *cache;

    const LockGuard lock(InstanceMutex);

    if (EntryPointsCache* cache = Instance.load(std::memory_order_relaxed))
      return *cache;

    Storage = std::make_unique<EntryPointsCache>(GetUserCacheDir() / "xtend");
    Instance.store(Storage.get(), std::memory_order_release);

    debug_log("Entry point cache directory: {}", Storage->cacheDir().string());
    return *Storage;
  }

  auto EntryPointsCache::shared() -> SharedPointer<IEntryPointsResolver> {
    return SharedPointer<IEntryPointsResolver>(SharedPointer<IEntryPointsResolver> {}, &instance());
  }

  auto EntryPointsCache::cacheFileFor(const Span<const fs::path> searchPath) const -> Result<fs::path> {
    const String hash = TRY(ComputePathStateHash(m_identity, searchPath));
    return m_cacheDir / (hash + String(CACHE_FILE_SUFFIX));
  }

  auto EntryPointsCache::setIgnoreDisk(const bool ignore) -> Unit {
    m_ignoreDisk.store(ignore);
  }

  auto EntryPointsCache::setCacheDir(fs::path dir) -> Unit {
    m_cacheDir = std::move(dir);
    invalidate();
  }

  auto EntryPointsCache::invalidate() -> Unit {
    const LockGuard lock(m_slotsMutex);
    m_slots.clear();
  }

  auto EntryPointsCache::clearDisk() -> Result<usize> {
    std::error_code errc;
    usize           removed = 0;

    if (!fs::is_directory(m_cacheDir, errc))
      return removed;

    for (fs::directory_iterator iter(m_cacheDir, errc), end; !errc && iter != end; iter.increment(errc)) {
      const String fileName = iter->path().filename().string();

      if (!fileName.ends_with(CACHE_FILE_SUFFIX))
        continue;

      if (std::error_code removeErrc; fs::remove(iter->path(), removeErrc))
        ++removed;
      else if (removeErrc)
        ERR_FMT(IoError, "cannot remove '{}': {}", iter->path().string(), removeErrc.message());
    }

    if (errc)
      ERR_FMT(IoError, "cannot list '{}': {}", m_cacheDir.string(), errc.message());

    invalidate();
    return removed;
  }

  auto EntryPointsCache::slotFor(const String& key) -> SharedPointer<Slot> {
    const LockGuard lock(m_slotsMutex);

    SharedPointer<Slot>& slot = m_slots[key];
    if (!slot)
      slot = std::make_shared<Slot>();

    return slot;
  }

  auto EntryPointsCache::getEntryPoints(const Span<const fs::path> searchPath) -> Result<EntryPointIndex> {
    const SharedPointer<Slot> slot = slotFor(MemoKey(searchPath));

    const LockGuard lock(slot->mutex);

    if (!slot->index)
      slot->index = TRY(build(searchPath));

    return *slot->index;
  }

  auto EntryPointsCache::build(const Span<const fs::path> searchPath) -> Result<EntryPointIndex> {
    if (m_ignoreDisk.load())
      return m_source->getEntryPoints(searchPath);

    const fs::path cacheFile = TRY(cacheFileFor(searchPath));

    if (std::error_code errc; fs::is_regular_file(cacheFile, errc)) {
      Result<Vec<EntryPoint>> cached = ReadEntryPointsFile(cacheFile);

      if (cached) {
        debug_log("Using cached entry points from {}", cacheFile.string());
        return BuildEntryPointIndex(*cached);
      }

      // a damaged cache file is rebuilt
      warn_log("Discarding unreadable cache file {}: {}", cacheFile.string(), cached.error().message);
    }

    EntryPointIndex index = TRY(m_source->getEntryPoints(searchPath));

    // written in index order; reading it back yields the same index
    if (Result<> written = WriteWholeFile(cacheFile, SerializeEntryPointIndex(index)); !written)
      warn_at(written.error());
    else
      debug_log("Wrote entry point cache {}", cacheFile.string());

    return index;
  }
} // namespace xtend::core::plugin
