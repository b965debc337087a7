#include <boost/ut.hpp>

#include <Xtend++/Utils/Logging.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace xtend::utils::logging;
  using namespace xtend::utils::types;

  "Sink receives records at or above the runtime level"_test = [] -> void {
    Vec<Pair<LogLevel, String>> records;

    SetRuntimeLogLevel(LogLevel::Info);
    SetLogSink([&records](const LogLevel level, const StringView message) { records.emplace_back(level, String(message)); });

    debug_log("hidden {}", 1);
    info_log("shown {}", 2);
    error_log("failed {}", 3);

    SetLogSink({});

    expect(records.size() == 2_ul);
    expect(records.at(0) == Pair<LogLevel, String> { LogLevel::Info, "shown 2" });
    expect(records.at(1) == Pair<LogLevel, String> { LogLevel::Error, "failed 3" });
  };

  "A sink may log"_test = [] -> void {
    Vec<String> messages;

    SetRuntimeLogLevel(LogLevel::Info);
    SetLogSink([&messages](const LogLevel level, const StringView message) {
      messages.emplace_back(message);

      if (level == LogLevel::Warn)
        info_log("forwarded: {}", message);
    });

    warn_log("disk almost full");

    SetLogSink({});

    expect(messages == Vec<String> { "disk almost full", "forwarded: disk almost full" });
  };

  return 0;
}
