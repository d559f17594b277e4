#pragma once

#include <ostream>
#include <string_view>

#include "factoryregistry.hpp"

namespace mdist {

class Memodist;
struct MemodistCmdLineOptions;

/// Command of the memodist program, applied on a Memodist object with its command line argument.
class MemodistCommand {
 public:
  explicit MemodistCommand(Memodist &memodist) : _pMemodist(&memodist) {}

  MemodistCommand(const MemodistCommand &) = delete;
  MemodistCommand(MemodistCommand &&) = delete;
  MemodistCommand &operator=(const MemodistCommand &) = delete;
  MemodistCommand &operator=(MemodistCommand &&) = delete;

  virtual ~MemodistCommand() = default;

  /// Executes the command with given argument, printing its result on 'os'.
  /// Throws invalid_argument if the argument is invalid.
  virtual void execute(std::string_view arg, std::ostream &os) = 0;

 protected:
  Memodist &memodist() const { return *_pMemodist; }

 private:
  Memodist *_pMemodist;
};

/// Prints the edit distance between two words given as 'word1,word2'.
class DistanceCommand : public MemodistCommand {
 public:
  using MemodistCommand::MemodistCommand;

  void execute(std::string_view arg, std::ostream &os) override;
};

/// Prints the memoized Fibonacci numbers of indexes given as 'n1,n2,...'.
class FibonacciCommand : public MemodistCommand {
 public:
  using MemodistCommand::MemodistCommand;

  void execute(std::string_view arg, std::ostream &os) override;
};

/// Prints the result of the asynchronous pipeline applied on given payload.
class PipelineCommand : public MemodistCommand {
 public:
  using MemodistCommand::MemodistCommand;

  void execute(std::string_view arg, std::ostream &os) override;
};

using MemodistCommandRegistry = FactoryRegistry<MemodistCommand, Memodist &>;

/// Registry of all memodist commands, by name ("distance", "fibonacci", "pipeline").
const MemodistCommandRegistry &GetMemodistCommandRegistry();

/// Executes the commands present in given options, in a fixed order (distance, fibonacci, pipeline).
/// Returns the number of processed commands.
int ProcessMemodistCommands(Memodist &memodist, const MemodistCmdLineOptions &options, std::ostream &os);

}  // namespace mdist
