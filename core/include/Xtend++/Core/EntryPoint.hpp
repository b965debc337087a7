/**
 * @file EntryPoint.hpp
 * @brief Entry points: the serializable (group, name, locator) form of a plugin specification.
 *
 * @details The on-disk declaration format is INI-like:
 * @code
 * [xtend.examples.greeters]
 * hello = acme.greeters:HelloGreeter
 * shout = acme.greeters:ShoutGreeter
 *
 * @endcode
 */

#pragma once

#include <filesystem> // std::filesystem::path

#include "../Utils/Types.hpp"
#include "PluginSpec.hpp"

namespace xtend::core::plugin {
  namespace types = ::xtend::utils::types;

  class IPluginFinder;

  /**
   * @struct EntryPoint
   * @brief Where to find one plugin: its group (namespace), name and locator.
   */
  struct EntryPoint {
    types::String name;
    types::String value; ///< Locator, "module:symbol"
    types::String group;

    auto operator==(const EntryPoint&) const -> bool = default;
  };

  /**
   * @brief Group -> "name = value" lines, the shape written into declaration files.
   */
  using EntryPointMap = types::Map<types::String, types::Vec<types::String>>;

  /**
   * @brief Group -> entry points, the shape finders consume.
   */
  using EntryPointIndex = types::Map<types::String, types::Vec<EntryPoint>>;

  /**
   * @brief Derives an entry point from a spec's factory location.
   * @return NotSupported when the factory was not exported from a module (no location)
   */
  XTEND_API auto SpecToEntryPoint(const PluginSpec& spec) -> types::Result<EntryPoint>;

  /**
   * @brief Groups entry points into the declaration shape, keeping input order within a group.
   * @return DuplicateEntryPoint when a name repeats within one group
   */
  XTEND_API auto ToEntryPointMap(types::Span<const EntryPoint> entryPoints) -> types::Result<EntryPointMap>;

  /**
   * @brief Flattens a declaration map back into entry points (groups in key order).
   * @return ParseError for a line that is not "name = value"
   */
  XTEND_API auto EntryPointsFromMap(const EntryPointMap& map) -> types::Result<types::Vec<EntryPoint>>;

  /**
   * @brief Runs @p finder and converts everything it found into a declaration map.
   */
  XTEND_API auto DiscoverEntryPoints(IPluginFinder& finder) -> types::Result<EntryPointMap>;

  XTEND_API auto ParseEntryPointsText(types::StringView text) -> types::Result<EntryPointMap>;

  /**
   * @brief Sections sorted by group, entries sorted by name, a blank line after each section.
   * @return ParseError for a line that is not "name = value"
   */
  XTEND_API auto SerializeEntryPointsText(const EntryPointMap& map) -> types::Result<types::String>;

  /**
   * @brief Writes an index in the declaration format, keeping the order of entries within each group.
   *
   * Parsing the text and indexing it again yields @p index.
   */
  XTEND_API auto SerializeEntryPointIndex(const EntryPointIndex& index) -> types::String;

  /**
   * @brief Drops repeated (name, value, group) triples, keeping the first.
   */
  XTEND_API auto UniqueEntryPoints(types::Span<const EntryPoint> entryPoints) -> types::Vec<EntryPoint>;

  /**
   * @brief Indexes entry points by group. The first entry point with a given name in a group wins.
   */
  XTEND_API auto BuildEntryPointIndex(types::Span<const EntryPoint> entryPoints) -> EntryPointIndex;

  /**
   * @brief Reads a declaration file into entry points.
   */
  XTEND_API auto ReadEntryPointsFile(const std::filesystem::path& file) -> types::Result<types::Vec<EntryPoint>>;
} // namespace xtend::core::plugin
