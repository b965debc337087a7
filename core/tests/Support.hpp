/**
 * @file Support.hpp
 * @brief Helpers shared by the plugin framework tests.
 */

#pragma once

#include <atomic>     // std::atomic
#include <chrono>     // std::chrono::steady_clock
#include <filesystem> // std::filesystem
#include <format>     // std::format
#include <fstream>    // std::ofstream

#include <Xtend++/Core/Finder.hpp>
#include <Xtend++/Core/Plugin.hpp>
#include <Xtend++/Core/PluginSpec.hpp>

#include <Xtend++/Utils/Types.hpp>

namespace xtend::test {
  namespace fs = std::filesystem;

  using namespace utils::types;
  using namespace core::plugin;

  /**
   * @brief Finder returning a fixed list of specs, counting how often it is asked.
   */
  class StaticFinder final : public IPluginFinder {
   public:
    explicit StaticFinder(Vec<PluginSpec> specs) : m_specs(std::move(specs)) {}

    auto findPlugins() -> Result<Vec<PluginSpec>> override {
      ++calls;
      return m_specs;
    }

    std::atomic<i32> calls = 0;

   private:
    Vec<PluginSpec> m_specs;
  };

  /**
   * @brief Per-plugin counters, shared between a test and the instances it creates.
   */
  struct Counters {
    std::atomic<i32> created = 0;
    std::atomic<i32> loaded  = 0;
  };

  /**
   * @brief Plugin whose identity and behavior are set at construction.
   */
  class ScriptedPlugin final : public IPlugin {
   public:
    ScriptedPlugin(String ns, String name, Counters& counters, bool enabled, Fn<Result<LoadValue>(const LoadArgs&)> onLoad)
      : m_namespace(std::move(ns)), m_name(std::move(name)), m_counters(counters), m_enabled(enabled), m_onLoad(std::move(onLoad)) {
      ++m_counters.created;
    }

    [[nodiscard]] auto getNamespace() const -> StringView override {
      return m_namespace;
    }

    [[nodiscard]] auto getName() const -> StringView override {
      return m_name;
    }

    [[nodiscard]] auto shouldLoad() const -> bool override {
      return m_enabled;
    }

    auto load(const LoadArgs& args) -> Result<LoadValue> override {
      ++m_counters.loaded;

      if (m_onLoad)
        return m_onLoad(args);

      return LoadValue { m_name };
    }

   private:
    String                                 m_namespace;
    String                                 m_name;
    Counters&                              m_counters;
    bool                                   m_enabled;
    Fn<Result<LoadValue>(const LoadArgs&)> m_onLoad;
  };

  /**
   * @brief Spec whose factory creates a ScriptedPlugin.
   */
  inline auto ScriptedSpec(
    const String&                          ns,
    const String&                          name,
    Counters&                              counters,
    const bool                             enabled = true,
    Fn<Result<LoadValue>(const LoadArgs&)> onLoad  = {}
  ) -> PluginSpec {
    return PluginSpec {
      .ns      = ns,
      .name    = name,
      .factory = PluginFactory(
        CodeLocation { .module = "xtend_tests.scripted", .symbol = name },
        [ns, name, &counters, enabled, onLoad]() -> Result<UniquePointer<IPlugin>> {
          return std::make_unique<ScriptedPlugin>(ns, name, counters, enabled, onLoad);
        }
      ),
    };
  }

  /**
   * @brief Fresh directory under the system temp directory, removed on destruction.
   */
  class TempDir {
   public:
    TempDir() {
      static std::atomic<u64> Counter = 0;

      const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
      m_path           = fs::temp_directory_path() / std::format("xtend-test-{}-{}", stamp, Counter++);
      fs::create_directories(m_path);
    }

    TempDir(const TempDir&)                    = delete;
    TempDir(TempDir&&)                         = delete;
    auto operator=(const TempDir&) -> TempDir& = delete;
    auto operator=(TempDir&&) -> TempDir&      = delete;

    ~TempDir() {
      std::error_code errc;
      fs::remove_all(m_path, errc);
    }

    [[nodiscard]] auto path() const -> const fs::path& {
      return m_path;
    }

   private:
    fs::path m_path;
  };

  inline auto WriteFile(const fs::path& file, const StringView contents) -> void {
    fs::create_directories(file.parent_path());
    std::ofstream stream(file, std::ios::binary | std::ios::trunc);
    stream << contents;
  }
} // namespace xtend::test
