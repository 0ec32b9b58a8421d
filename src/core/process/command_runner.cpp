#include "core/process/command_runner.hpp"

#include <cstdio>
#include <sys/wait.h>

namespace cudaswitch::core::process {

bool ShellCommandRunner::Run(const std::string& command, CommandResult& result,
                             std::string& error) {
  result.command = command;
  result.output.clear();
  result.exit_code = -1;
  error.clear();

  const std::string wrapped = command + " 2>&1";
  FILE* pipe = popen(wrapped.c_str(), "r");
  if (pipe == nullptr) {
    error = "failed to execute command: " + command;
    return false;
  }

  char buffer[4096];
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), pipe) != nullptr) {
    result.output.append(buffer);
  }

  const int raw_status = pclose(pipe);
  if (raw_status == -1) {
    error = "failed to collect exit status for command: " + command;
    return false;
  }
  if (WIFEXITED(raw_status)) {
    result.exit_code = WEXITSTATUS(raw_status);
  } else if (WIFSIGNALED(raw_status)) {
    // Same convention as the shell: 128 + signal number.
    result.exit_code = 128 + WTERMSIG(raw_status);
  } else {
    result.exit_code = raw_status;
  }

  return true;
}

std::string ShellQuote(std::string_view raw) {
  std::string quoted;
  quoted.reserve(raw.size() + 2U);
  quoted.push_back('\'');
  for (const char c : raw) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

} // namespace cudaswitch::core::process
