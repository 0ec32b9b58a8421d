#pragma once

#include <string>
#include <string_view>

namespace cudaswitch::core::process {

// Result of one child command. `output` holds stdout and stderr interleaved in
// the order the child wrote them.
struct CommandResult {
  std::string command;
  int exit_code = -1;
  std::string output;
};

// Seam between the switch sequence and `/bin/sh`. Everything that leaves the
// process (sudo, bash, nvcc) goes through one of these so tests can script the
// outside world.
class ICommandRunner {
public:
  virtual ~ICommandRunner() = default;

  // Runs `command` through the shell and waits for it. Returns false only when
  // the command could not be started at all; a non-zero exit is reported via
  // `result.exit_code` and is not an error here.
  virtual bool Run(const std::string& command, CommandResult& result, std::string& error) = 0;
};

// popen-backed runner used by the CLI.
class ShellCommandRunner final : public ICommandRunner {
public:
  bool Run(const std::string& command, CommandResult& result, std::string& error) override;
};

// Single-quotes `raw` for POSIX sh so paths and versions are passed through
// verbatim, including spaces and quotes.
std::string ShellQuote(std::string_view raw);

} // namespace cudaswitch::core::process
