/**
 * @file ArgumentParser.hpp
 * @brief Small command-line parser with subcommands for the xtend tool.
 *
 * Supports flags, valued options, repeatable options, enum-valued options
 * (via magic_enum), positional values and one level of subcommands, each with
 * its own options. Values can be bound straight into option structs.
 */

#pragma once

#include <algorithm>                 // std::ranges::{equal, transform}
#include <cctype>                    // std::tolower
#include <concepts>                  // std::convertible_to
#include <cstdlib>                   // std::exit
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_name, enum_cast, enum_values}
#include <utility>                   // std::forward

#include "Error.hpp"
#include "Logging.hpp"
#include "Types.hpp"

namespace xtend::utils::argparse {
  namespace error   = ::xtend::utils::error;
  namespace logging = ::xtend::utils::logging;
  namespace types   = ::xtend::utils::types;

  class Argument;

  using ArgValue   = types::Variant<bool, types::i32, types::String, types::Vec<types::String>>;
  using ArgBinding = types::Fn<void(const Argument&)>;
  using ArgChoices = types::Vec<types::String>;

  inline auto ToLower(types::String text) -> types::String {
    std::ranges::transform(text, text.begin(), [](types::u8 chr) -> types::CStr { return static_cast<types::CStr>(std::tolower(chr)); });
    return text;
  }

  /**
   * @brief Enum <-> string conversion for enum-valued options.
   */
  template <typename EnumType>
  struct EnumTraits {
    static constexpr bool has_string_conversion = magic_enum::is_scoped_enum_v<EnumType>;

    static auto getChoices() -> const ArgChoices& {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");

      static const ArgChoices CACHED_CHOICES = [] {
        ArgChoices vec;
        for (const auto value : magic_enum::enum_values<EnumType>())
          vec.emplace_back(magic_enum::enum_name(value));
        return vec;
      }();

      return CACHED_CHOICES;
    }

    static auto stringToEnum(const types::String& str) -> EnumType {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");

      if (auto result = magic_enum::enum_cast<EnumType>(str))
        return *result;

      const auto enumValues = magic_enum::enum_values<EnumType>();
      for (const auto value : enumValues)
        if (ToLower(str) == ToLower(types::String(magic_enum::enum_name(value))))
          return value;

      return enumValues[0];
    }

    static auto enumToString(EnumType value) -> types::String {
      return types::String(magic_enum::enum_name(value));
    }
  };

  /**
   * @brief One option (flag, valued or repeatable) with its names, value and binding.
   */
  class Argument {
   public:
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, types::String> && ...))
    explicit Argument(NameTs&&... names)
      : m_names { types::String(std::forward<NameTs>(names))... } {}

    auto help(types::String helpText) -> Argument& {
      m_helpText = std::move(helpText);
      return *this;
    }

    template <typename T>
    auto defaultValue(T value) -> Argument& {
      m_defaultValue = std::move(value);
      return *this;
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    auto defaultValue(EnumType value) -> Argument& {
      m_defaultValue = EnumTraits<EnumType>::enumToString(value);
      return choices(EnumTraits<EnumType>::getChoices());
    }

    auto flag() -> Argument& {
      m_isFlag       = true;
      m_defaultValue = false;
      return *this;
    }

    /**
     * @brief Accept the option several times, collecting every value in order.
     */
    auto repeatable() -> Argument& {
      m_isRepeatable = true;
      m_defaultValue = types::Vec<types::String> {};
      return *this;
    }

    auto choices(const ArgChoices& allowed) -> Argument& {
      m_choices = allowed;
      return *this;
    }

    template <typename T>
    auto get() const -> T {
      if (m_value)
        return std::get<T>(*m_value);

      if (m_defaultValue)
        return std::get<T>(*m_defaultValue);

      return T {};
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    auto getEnum() const -> EnumType {
      return EnumTraits<EnumType>::stringToEnum(get<types::String>());
    }

    [[nodiscard]] auto isUsed() const -> bool {
      return m_isUsed;
    }

    [[nodiscard]] auto getPrimaryName() const -> const types::String& {
      return m_names.front();
    }

    [[nodiscard]] auto getNames() const -> const types::Vec<types::String>& {
      return m_names;
    }

    [[nodiscard]] auto getHelpText() const -> const types::String& {
      return m_helpText;
    }

    [[nodiscard]] auto isFlag() const -> bool {
      return m_isFlag;
    }

    [[nodiscard]] auto isRepeatable() const -> bool {
      return m_isRepeatable;
    }

    [[nodiscard]] auto getChoices() const -> ArgChoices {
      return m_choices.value_or(ArgChoices {});
    }

    /**
     * @brief Stores a value given on the command line, validating choices and integer options.
     */
    auto setValue(const types::String& raw) -> types::Result<> {
      if (m_choices) {
        const bool valid = std::ranges::any_of(*m_choices, [&](const types::String& choice) -> bool {
          return ToLower(choice) == ToLower(raw);
        });

        if (!valid) {
          types::String allowed;
          for (const types::String& choice : *m_choices)
            allowed += (allowed.empty() ? "" : ", ") + ToLower(choice);

          ERR_FMT(error::XtendErrorCode::InvalidArgument, "Invalid value '{}' for argument '{}'. Allowed values: {}", raw, getPrimaryName(), allowed);
        }
      }

      if (m_isRepeatable) {
        auto values = get<types::Vec<types::String>>();
        values.push_back(raw);
        m_value = std::move(values);
      } else if (m_defaultValue && std::holds_alternative<types::i32>(*m_defaultValue)) {
        try {
          m_value = static_cast<types::i32>(std::stoi(raw));
        } catch (const std::logic_error&) {
          ERR_FMT(error::XtendErrorCode::InvalidArgument, "Failed to parse '{}' as integer for argument '{}'", raw, getPrimaryName());
        }
      } else
        m_value = raw;

      m_isUsed = true;
      return {};
    }

    auto markUsed() -> types::Unit {
      m_isUsed = true;

      if (m_isFlag)
        m_value = true;
    }

    /**
     * @brief Bind this argument to a struct member.
     *
     * @example
     *   struct Options { bool verbose; String output; Vec<String> modules; };
     *   parser.addArguments("-v", "--verbose").flag().bindTo(opts.verbose);
     *   parser.addArguments("-m", "--module").repeatable().bindTo(opts.modules);
     */
    template <typename T>
      requires std::same_as<T, bool> || std::same_as<T, types::i32> || std::same_as<T, types::String> || std::same_as<T, types::Vec<types::String>>
    auto bindTo(T& member) -> Argument& {
      m_binding = [&member](const Argument& arg) { member = arg.get<T>(); };
      return *this;
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    auto bindToEnum(EnumType& member) -> Argument& {
      m_binding = [&member](const Argument& arg) { member = arg.getEnum<EnumType>(); };
      return *this;
    }

    auto applyBinding() const -> types::Unit {
      if (m_binding)
        m_binding(*this);
    }

   private:
    types::Vec<types::String> m_names;
    types::String             m_helpText;
    types::Option<ArgValue>   m_value;
    types::Option<ArgValue>   m_defaultValue;
    types::Option<ArgChoices> m_choices;
    ArgBinding                m_binding;
    bool                      m_isFlag {};
    bool                      m_isRepeatable {};
    bool                      m_isUsed {};
  };

  /**
   * @brief Parser for one command level. The root parser owns the subcommand parsers.
   */
  class ArgumentParser {
    struct SubcommandTag {
      explicit SubcommandTag() = default;
    };

   public:
    /**
     * @brief Construct the root parser.
     * @param version Version string printed by -V/--version
     */
    explicit ArgumentParser(types::String version)
      : m_version(std::move(version)) {
      addArguments("-h", "--help").help("Show this help message and exit").flag();
      addArguments("-V", "--version").help("Show version information and exit").flag();
    }

    /**
     * @brief Construct a subcommand parser. Only addSubcommand() can name the tag.
     */
    explicit ArgumentParser(SubcommandTag /*tag*/) {}

    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, types::String> && ...))
    auto addArguments(NameTs&&... names) -> Argument& {
      m_arguments.emplace_back(std::make_unique<Argument>(std::forward<NameTs>(names)...));
      Argument& arg = *m_arguments.back();

      for (const types::String& name : arg.getNames())
        m_argumentMap[name] = &arg;

      return arg;
    }

    /**
     * @brief Adds a subcommand with its own options. Options given after the
     *        subcommand name are parsed by the returned parser.
     */
    auto addSubcommand(const types::String& name, types::String helpText) -> ArgumentParser& {
      auto child = std::make_unique<ArgumentParser>(SubcommandTag {});
      child->m_programName = name;
      child->m_helpText    = std::move(helpText);
      child->addArguments("-h", "--help").help("Show this help message and exit").flag();

      ArgumentParser& ref = *child;
      m_subcommands.emplace_back(name, std::move(child));
      return ref;
    }

    auto parseArgs(types::Span<const char* const> args) -> types::Result<> {
      types::Vec<types::String> owned(args.begin(), args.end());
      return parseArgs(owned);
    }

    auto parseArgs(const types::Vec<types::String>& args) -> types::Result<> {
      if (args.empty())
        return {};

      if (m_programName.empty())
        m_programName = args[0];

      for (types::usize i = 1; i < args.size(); ++i) {
        const types::String& arg = args[i];

        if (arg == "-h" || arg == "--help") {
          printHelp();
          std::exit(0);
        }

        if (!m_version.empty() && (arg == "-V" || arg == "--version")) {
          logging::Println(m_version);
          std::exit(0);
        }

        if (!arg.starts_with('-')) {
          if (ArgumentParser* sub = findSubcommand(arg)) {
            m_activeSubcommand = arg;
            types::Vec<types::String> rest(args.begin() + static_cast<types::isize>(i), args.end());
            return sub->parseArgs(rest);
          }

          if (!m_subcommands.empty() && m_positionals.empty() && m_activeSubcommand.empty())
            ERR_FMT(error::XtendErrorCode::InvalidArgument, "Unknown command: {}", arg);

          m_positionals.push_back(arg);
          continue;
        }

        auto iter = m_argumentMap.find(arg);
        if (iter == m_argumentMap.end())
          ERR_FMT(error::XtendErrorCode::InvalidArgument, "Unknown argument: {}", arg);

        Argument* argument = iter->second;

        if (argument->isFlag()) {
          argument->markUsed();
          continue;
        }

        if (i + 1 >= args.size())
          ERR_FMT(error::XtendErrorCode::InvalidArgument, "Argument {} requires a value", arg);

        TRY_VOID(argument->setValue(args[++i]));
      }

      return {};
    }

    template <typename T = types::String>
    auto get(types::StringView name) const -> T {
      if (auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->get<T>();

      return T {};
    }

    template <typename EnumType>
    auto getEnum(types::StringView name) const -> EnumType {
      static_assert(EnumTraits<EnumType>::has_string_conversion, "Enum type not supported. Add a specialization to EnumTraits.");

      if (auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->getEnum<EnumType>();

      return EnumTraits<EnumType>::stringToEnum("");
    }

    [[nodiscard]] auto isUsed(types::StringView name) const -> bool {
      if (auto iter = m_argumentMap.find(name); iter != m_argumentMap.end())
        return iter->second->isUsed();

      return false;
    }

    /**
     * @brief Name of the subcommand found on the command line, if any.
     */
    [[nodiscard]] auto getSubcommand() const -> types::Option<types::String> {
      if (m_activeSubcommand.empty())
        return types::None;
      return m_activeSubcommand;
    }

    [[nodiscard]] auto getPositionals() const -> const types::Vec<types::String>& {
      return m_positionals;
    }

    auto printHelp() const -> types::Unit {
      types::String usage = std::format("Usage: {}", m_programName);

      if (!m_subcommands.empty())
        usage += " [OPTIONS] COMMAND [COMMAND OPTIONS]";
      else
        for (const auto& arg : m_arguments)
          usage += std::format(" [{}{}]", arg->getPrimaryName(), arg->isFlag() ? "" : " VALUE");

      logging::Println(usage);

      if (!m_helpText.empty()) {
        logging::Println();
        logging::Println(m_helpText);
      }

      logging::Println();

      if (!m_subcommands.empty()) {
        logging::Println("Commands:");
        for (const auto& [name, sub] : m_subcommands)
          logging::Println("  {:<14}{}", name, sub->m_helpText);
        logging::Println();
      }

      logging::Println("Arguments:");
      for (const auto& arg : m_arguments) {
        types::String names;
        for (const types::String& name : arg->getNames())
          names += (names.empty() ? "" : ", ") + name;

        logging::Println("  {}{}", names, arg->isFlag() ? "" : (arg->isRepeatable() ? " VALUE..." : " VALUE"));

        if (!arg->getHelpText().empty())
          logging::Println("    " + arg->getHelpText());

        if (const ArgChoices choices = arg->getChoices(); !choices.empty()) {
          types::String allowed;
          for (const types::String& choice : choices)
            allowed += (allowed.empty() ? "" : ", ") + ToLower(choice);
          logging::Println("    Available values: " + allowed);
        }
      }
    }

    /**
     * @brief Transfers parsed values (or defaults) into bound members, including subcommand options.
     */
    auto applyBindings() const -> types::Unit {
      for (const auto& arg : m_arguments)
        arg->applyBinding();

      for (const auto& [name, sub] : m_subcommands)
        if (name == m_activeSubcommand)
          sub->applyBindings();
    }

    auto parseInto(types::Span<const char* const> args) -> types::Result<> {
      TRY_VOID(parseArgs(args));
      applyBindings();
      return {};
    }

    auto parseInto(const types::Vec<types::String>& args) -> types::Result<> {
      TRY_VOID(parseArgs(args));
      applyBindings();
      return {};
    }

   private:
    auto findSubcommand(types::StringView name) const -> ArgumentParser* {
      for (const auto& [subName, sub] : m_subcommands)
        if (subName == name)
          return sub.get();
      return nullptr;
    }

    types::String                                                         m_programName;
    types::String                                                         m_version;
    types::String                                                         m_helpText;
    types::String                                                         m_activeSubcommand;
    types::Vec<types::String>                                             m_positionals;
    types::Vec<types::UniquePointer<Argument>>                            m_arguments;
    types::Map<types::String, Argument*>                                  m_argumentMap;
    types::Vec<types::Pair<types::String, types::UniquePointer<ArgumentParser>>> m_subcommands;
  };
} // namespace xtend::utils::argparse
