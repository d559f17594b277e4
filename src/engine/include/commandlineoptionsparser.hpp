#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <ostream>
#include <span>
#include <string_view>
#include <variant>

#include "commandlineoption.hpp"
#include "durationstring.hpp"
#include "levenshteindistancecalculator.hpp"
#include "mdist_cctype.hpp"
#include "mdist_invalid_argument_exception.hpp"
#include "mdist_string.hpp"
#include "mdist_vector.hpp"
#include "stringconv.hpp"
#include "timedef.hpp"

namespace mdist {

/// Parses command line arguments into an options structure Opts, from a static list of option definitions.
template <class Opts>
class CommandLineOptionsParser {
 public:
  using value_type = Opts;

  template <std::size_t N>
  explicit CommandLineOptionsParser(const OptionDef<Opts> (&defs)[N]) : _defs(std::begin(defs), std::end(defs)) {
    std::ranges::stable_sort(_defs, {}, [](const OptionDef<Opts> &def) { return def.option.group; });
  }

  /// Parses given arguments (program name excluded) into a new Opts object.
  /// Throws invalid_argument for unknown options, with a suggestion of a close option name if any, and for invalid
  /// or missing option values.
  Opts parse(std::span<const char *const> arguments) const {
    Opts opts;
    for (auto argIt = arguments.begin(); argIt != arguments.end(); ++argIt) {
      const std::string_view arg(*argIt);
      const auto defIt = std::ranges::find_if(_defs, [arg](const auto &def) { return def.option.matches(arg); });
      if (defIt == _defs.end()) {
        throwUnknownOption(arg);
      }

      std::optional<std::string_view> nextArg;
      if (std::next(argIt) != arguments.end()) {
        nextArg = *std::next(argIt);
      }

      const bool isNextArgConsumed = std::visit(
          [this, &opts, &option = defIt->option, nextArg](auto Opts::*pField) {
            return assignValue(option, opts.*pField, nextArg);
          },
          defIt->field);
      if (isNextArgConsumed) {
        ++argIt;
      }
    }
    return opts;
  }

  /// Prints the usage line followed by the description of all options, by group.
  void displayHelp(std::string_view programName, std::ostream &os) const {
    os << "usage: " << programName << " <general options> [command(s)]\n";

    std::size_t descriptionColumn = 0;
    for (const auto &def : _defs) {
      descriptionColumn = std::max(descriptionColumn, OptionSynopsis(def.option).size() + 1U);
    }

    std::optional<OptionGroup> currentGroup;
    for (const auto &def : _defs) {
      if (currentGroup != def.option.group) {
        currentGroup = def.option.group;
        os << '\n' << OptionGroupName(def.option.group) << ":\n";
      }
      const string synopsis = OptionSynopsis(def.option);
      os << synopsis << string(descriptionColumn - synopsis.size(), ' ');
      PrintDescription(def.option.description, descriptionColumn, os);
    }
  }

 private:
  static constexpr std::size_t kHelpLineWidth = 100;

  // Each assignValue returns true if the value of the option was 'nextArg', which is then consumed.

  static bool assignValue(const CommandLineOption &, bool &flag, std::optional<std::string_view>) {
    flag = true;
    return false;
  }

  static bool assignValue(const CommandLineOption &option, int &value, std::optional<std::string_view> nextArg) {
    if (!nextArg || !IsInteger(*nextArg)) {
      throw invalid_argument("Expecting an integer value for option {}", option.longName);
    }
    value = StringToIntegral<int>(*nextArg);
    return true;
  }

  static bool assignValue(const CommandLineOption &option, std::string_view &value,
                          std::optional<std::string_view> nextArg) {
    value = RequiredValue(option, nextArg);
    return true;
  }

  static bool assignValue(const CommandLineOption &option, Duration &value, std::optional<std::string_view> nextArg) {
    value = ParseDuration(RequiredValue(option, nextArg));
    return true;
  }

  bool assignValue(const CommandLineOption &, std::optional<std::string_view> &value,
                   std::optional<std::string_view> nextArg) const {
    if (nextArg && !isOption(*nextArg)) {
      value = *nextArg;
      return true;
    }
    value = std::string_view();
    return false;
  }

  static std::string_view RequiredValue(const CommandLineOption &option, std::optional<std::string_view> nextArg) {
    if (!nextArg) {
      throw invalid_argument("Expecting a value for option {}", option.longName);
    }
    return *nextArg;
  }

  static bool IsInteger(std::string_view str) {
    if (str.starts_with('-')) {
      str.remove_prefix(1);
    }
    return !str.empty() && std::ranges::all_of(str, [](char ch) { return isdigit(ch); });
  }

  bool isOption(std::string_view arg) const {
    return std::ranges::any_of(_defs, [arg](const auto &def) { return def.option.matches(arg); });
  }

  [[noreturn]] void throwUnknownOption(std::string_view arg) const {
    LevenshteinDistanceCalculator calc;
    std::string_view closestName;
    int minDistance = 0;
    for (const auto &def : _defs) {
      const int distance = calc(arg, def.option.longName);
      if (closestName.empty() || distance < minDistance) {
        closestName = def.option.longName;
        minDistance = distance;
      }
    }

    const auto minSize = static_cast<int>(std::min(arg.size(), closestName.size()));
    if (!closestName.empty() && (minDistance <= 2 || minDistance < minSize / 2)) {
      throw invalid_argument("Unrecognized command-line option '{}' - did you mean '{}'?", arg, closestName);
    }
    throw invalid_argument("Unrecognized command-line option '{}'", arg);
  }

  // "  --threads, -t <n>"
  static string OptionSynopsis(const CommandLineOption &option) {
    string synopsis("  ");
    synopsis.append(option.longName);
    if (option.shortName != '\0') {
      synopsis.append(", -");
      synopsis.push_back(option.shortName);
    }
    if (!option.valueName.empty()) {
      synopsis.push_back(' ');
      synopsis.append(option.valueName);
    }
    return synopsis;
  }

  // Prints 'description' word by word from column 'indent', wrapping lines at kHelpLineWidth chars and at each
  // new line char of the description.
  static void PrintDescription(std::string_view description, std::size_t indent, std::ostream &os) {
    const string indentation(indent, ' ');
    std::size_t column = indent;
    bool isLineStart = true;
    while (!description.empty()) {
      const std::size_t wordLen = std::min(description.find_first_of(" \n"), description.size());
      const std::string_view word = description.substr(0, wordLen);

      if (!isLineStart && column + 1U + word.size() > kHelpLineWidth) {
        os << '\n' << indentation;
        column = indent;
        isLineStart = true;
      }
      if (!isLineStart) {
        os << ' ';
        ++column;
      }
      os << word;
      column += word.size();
      isLineStart = false;

      if (wordLen < description.size() && description[wordLen] == '\n') {
        os << '\n' << indentation;
        column = indent;
        isLineStart = true;
      }
      description.remove_prefix(std::min(wordLen + 1U, description.size()));
    }
    os << '\n';
  }

  vector<OptionDef<Opts>> _defs;
};

}  // namespace mdist
