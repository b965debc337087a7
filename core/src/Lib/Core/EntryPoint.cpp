#include <algorithm> // std::ranges::{find_if, sort}
#include <format>    // std::format
#include <fstream>   // std::ifstream
#include <sstream>   // std::ostringstream

#include <Xtend++/Core/EntryPoint.hpp>
#include <Xtend++/Core/Finder.hpp>

#include <Xtend++/Utils/Error.hpp>
#include <Xtend++/Utils/Logging.hpp>

namespace xtend::core::plugin {
  using namespace utils::types;
  using enum utils::error::XtendErrorCode;

  namespace {
    constexpr StringView WHITESPACE = " \t\r\n";

    auto Trim(StringView text) -> StringView {
      const usize first = text.find_first_not_of(WHITESPACE);

      if (first == StringView::npos)
        return {};

      const usize last = text.find_last_not_of(WHITESPACE);
      return text.substr(first, last - first + 1);
    }

    // "name = value" -> (name, value). The first '=' separates the two.
    auto SplitAssignment(const StringView line) -> Option<Pair<String, String>> {
      const usize equals = line.find('=');

      if (equals == StringView::npos)
        return None;

      const StringView name  = Trim(line.substr(0, equals));
      const StringView value = Trim(line.substr(equals + 1));

      if (name.empty() || value.empty())
        return None;

      return Pair<String, String> { String(name), String(value) };
    }
  } // namespace

  auto SpecToEntryPoint(const PluginSpec& spec) -> Result<EntryPoint> {
    const Option<CodeLocation>& location = spec.factory.location();

    if (!location || location->empty())
      ERR_FMT(NotSupported, "plugin {} has no exported factory and cannot be written as an entry point", Describe(spec));

    return EntryPoint { .name = spec.name, .value = location->locator(), .group = spec.ns };
  }

  auto ToEntryPointMap(const Span<const EntryPoint> entryPoints) -> Result<EntryPointMap> {
    EntryPointMap                    map;
    Map<String, Vec<String>>         seenNames;

    for (const EntryPoint& entryPoint : entryPoints) {
      Vec<String>& names = seenNames[entryPoint.group];

      if (std::ranges::find(names, entryPoint.name) != names.end())
        ERR_FMT(DuplicateEntryPoint, "duplicate entry point '{}' in group '{}'", entryPoint.name, entryPoint.group);

      names.push_back(entryPoint.name);
      map[entryPoint.group].push_back(std::format("{} = {}", entryPoint.name, entryPoint.value));
    }

    return map;
  }

  auto EntryPointsFromMap(const EntryPointMap& map) -> Result<Vec<EntryPoint>> {
    Vec<EntryPoint> entryPoints;

    for (const auto& [group, lines] : map)
      for (const String& line : lines) {
        Option<Pair<String, String>> assignment = SplitAssignment(line);

        if (!assignment)
          ERR_FMT(ParseError, "invalid entry point '{}' in group '{}'", line, group);

        entryPoints.push_back(EntryPoint { .name = std::move(assignment->first), .value = std::move(assignment->second), .group = group });
      }

    return entryPoints;
  }

  auto DiscoverEntryPoints(IPluginFinder& finder) -> Result<EntryPointMap> {
    const Vec<PluginSpec> specs = TRY(finder.findPlugins());

    Vec<EntryPoint> entryPoints;
    entryPoints.reserve(specs.size());

    for (const PluginSpec& spec : specs)
      entryPoints.push_back(TRY(SpecToEntryPoint(spec)));

    return ToEntryPointMap(entryPoints);
  }

  auto ParseEntryPointsText(const StringView text) -> Result<EntryPointMap> {
    EntryPointMap map;
    Option<String> section;
    usize          lineNumber = 0;

    usize position = 0;
    while (position <= text.size()) {
      usize end = text.find('\n', position);
      if (end == StringView::npos)
        end = text.size();

      const StringView line = Trim(text.substr(position, end - position));
      position              = end + 1;
      ++lineNumber;

      if (line.empty() || line.front() == '#' || line.front() == ';')
        continue;

      if (line.front() == '[') {
        if (line.back() != ']')
          ERR_FMT(ParseError, "line {}: unterminated section header '{}'", lineNumber, line);

        const StringView name = Trim(line.substr(1, line.size() - 2));
        if (name.empty())
          ERR_FMT(ParseError, "line {}: empty section name", lineNumber);

        section = String(name);
        // keep empty sections
        map[*section];
        continue;
      }

      if (!section)
        ERR_FMT(ParseError, "line {}: entry '{}' appears before any section", lineNumber, line);

      const Option<Pair<String, String>> assignment = SplitAssignment(line);
      if (!assignment)
        ERR_FMT(ParseError, "line {}: expected 'name = value', got '{}'", lineNumber, line);

      map[*section].push_back(std::format("{} = {}", assignment->first, assignment->second));
    }

    return map;
  }

  auto SerializeEntryPointsText(const EntryPointMap& map) -> Result<String> {
    std::ostringstream out;

    for (const auto& [group, lines] : map) {
      Vec<Pair<String, String>> entries;
      entries.reserve(lines.size());

      for (const String& line : lines) {
        Option<Pair<String, String>> assignment = SplitAssignment(line);

        if (!assignment)
          ERR_FMT(ParseError, "invalid entry point '{}' in group '{}'", line, group);

        entries.push_back(*std::move(assignment));
      }

      std::ranges::sort(entries);

      out << '[' << group << "]\n";
      for (const auto& [name, value] : entries)
        out << name << " = " << value << '\n';
      out << '\n';
    }

    return out.str();
  }

  auto SerializeEntryPointIndex(const EntryPointIndex& index) -> String {
    std::ostringstream out;

    for (const auto& [group, entryPoints] : index) {
      out << '[' << group << "]\n";
      for (const EntryPoint& entryPoint : entryPoints)
        out << entryPoint.name << " = " << entryPoint.value << '\n';
      out << '\n';
    }

    return out.str();
  }

  auto UniqueEntryPoints(const Span<const EntryPoint> entryPoints) -> Vec<EntryPoint> {
    Vec<EntryPoint> unique;

    for (const EntryPoint& entryPoint : entryPoints)
      if (std::ranges::find(unique, entryPoint) == unique.end())
        unique.push_back(entryPoint);

    return unique;
  }

  auto BuildEntryPointIndex(const Span<const EntryPoint> entryPoints) -> EntryPointIndex {
    EntryPointIndex index;

    for (const EntryPoint& entryPoint : entryPoints) {
      Vec<EntryPoint>& group = index[entryPoint.group];

      const bool seen = std::ranges::find_if(group, [&](const EntryPoint& existing) { return existing.name == entryPoint.name; }) != group.end();

      if (seen)
        debug_log("Ignoring entry point {} = {} in group {}: name already taken", entryPoint.name, entryPoint.value, entryPoint.group);
      else
        group.push_back(entryPoint);
    }

    return index;
  }

  auto ReadEntryPointsFile(const std::filesystem::path& file) -> Result<Vec<EntryPoint>> {
    std::ifstream stream(file, std::ios::binary);

    if (!stream)
      ERR_FMT(IoError, "cannot open entry point file '{}'", file.string());

    std::ostringstream contents;
    contents << stream.rdbuf();

    if (stream.bad())
      ERR_FMT(IoError, "error while reading entry point file '{}'", file.string());

    Result<EntryPointMap> map = ParseEntryPointsText(contents.str());
    if (!map)
      ERR_FMT(ParseError, "{}: {}", file.string(), map.error().message);

    return EntryPointsFromMap(*map);
  }
} // namespace xtend::core::plugin
