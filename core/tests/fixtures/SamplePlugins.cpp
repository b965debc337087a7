/**
 * @file SamplePlugins.cpp
 * @brief Module library opened by the dynamic loader tests.
 *
 * Provides the modules "xtend_sample.greeters" and "xtend_sample.tools" from
 * a library named after their common root.
 */

#include <Xtend++/Core/FunctionPlugin.hpp>
#include <Xtend++/Core/ModuleRegistry.hpp>
#include <Xtend++/Core/Plugin.hpp>

#include <Xtend++/Utils/Logging.hpp>
#include <Xtend++/Utils/Types.hpp>

namespace {
  using namespace xtend::utils::types;
  using xtend::core::plugin::FunctionPluginBuilder;
  using xtend::core::plugin::LoadArgs;
  using xtend::core::plugin::LoadValue;
  using xtend::core::plugin::Plugin;

  class HelloGreeter final : public Plugin<HelloGreeter> {
   public:
    static constexpr StringView Namespace = "xtend.sample.greeters";
    static constexpr StringView Name      = "hello";

    auto load(const LoadArgs& args) -> Result<LoadValue> override {
      debug_log("HelloGreeter loaded with {} argument(s)", args.args.size());
      return LoadValue { String("hello from the sample module") };
    }
  };

  class SilentGreeter final : public Plugin<SilentGreeter> {
   public:
    static constexpr StringView Namespace = "xtend.sample.greeters";
    static constexpr StringView Name      = "silent";

    [[nodiscard]] auto shouldLoad() const -> bool override {
      return false;
    }
  };

  auto Shout(const String& text) -> String {
    String loud = text;
    for (char& chr : loud)
      if (chr >= 'a' && chr <= 'z')
        chr = static_cast<char>(chr - 'a' + 'A');
    return loud + "!";
  }

  [[maybe_unused]] auto Version() -> i32 {
    return 1;
  }
} // namespace

XTEND_EXPORT_PLUGIN("xtend_sample.greeters", HelloGreeter)
XTEND_EXPORT_PLUGIN("xtend_sample.greeters", SilentGreeter)
XTEND_EXPORT_FUNCTION("xtend_sample.greeters", Version)
XTEND_EXPORT_FUNCTION_PLUGIN("xtend_sample.tools", Shout, FunctionPluginBuilder("xtend.sample.transforms").name("shout"))

XTEND_MODULE_LOG_SYNC()
