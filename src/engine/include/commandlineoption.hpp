#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

#include "timedef.hpp"

namespace mdist {

/// Options are displayed in the help grouped by OptionGroup, in the order of this enum.
enum class OptionGroup : int8_t { kGeneral, kCommands };

constexpr std::string_view OptionGroupName(OptionGroup group) {
  switch (group) {
    case OptionGroup::kGeneral:
      return "General options";
    case OptionGroup::kCommands:
      return "Commands";
  }
  return "";
}

/// Name and help text of a command line option.
struct CommandLineOption {
  /// Tells whether given argument is this option, either by its long name ("--threads") or by its short name ("-t").
  constexpr bool matches(std::string_view arg) const {
    if (shortName != '\0' && arg.size() == 2 && arg[0] == '-' && arg[1] == shortName) {
      return true;
    }
    return arg == longName;
  }

  OptionGroup group;
  std::string_view longName;
  // '\0' if the option has no short name
  char shortName;
  // placeholder of the value in the help, empty for flags
  std::string_view valueName;
  std::string_view description;
};

/// Field of the options structure Opts filled by an option. Its type tells how the option value is parsed:
///  - bool: flag without value
///  - int: mandatory integral value
///  - std::string_view: mandatory value
///  - std::optional<std::string_view>: value is optional, set to an empty string if absent
///  - Duration: mandatory value parsed by ParseDuration
template <class Opts>
using OptionField = std::variant<bool Opts::*, int Opts::*, std::string_view Opts::*,
                                 std::optional<std::string_view> Opts::*, Duration Opts::*>;

template <class Opts>
struct OptionDef {
  CommandLineOption option;
  OptionField<Opts> field;
};

}  // namespace mdist
