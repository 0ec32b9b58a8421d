#include "switcher/version_report.hpp"

#include "core/process/command_runner.hpp"

namespace cudaswitch::switcher {

using core::process::ShellQuote;

std::string BuildVersionReportCommand(const toolkit::SearchPathConfig& search_paths,
                                      const std::filesystem::path& shell_rc) {
  // `env` rather than sh-level assignments so the new PATH is also the one used
  // to look up the program being started.
  std::string command = "env " + std::string(toolkit::kExecutablePathVar) + "=" +
                        ShellQuote(search_paths.executable_path.ToString()) + " " +
                        std::string(toolkit::kLibraryPathVar) + "=" +
                        ShellQuote(search_paths.library_path.ToString()) + " ";

  const std::string report = std::string(kCompilerName) + " --version";
  if (shell_rc.empty()) {
    return command + report;
  }

  // The rc path travels as $1 so it never needs quoting inside the script.
  const std::string script = ". \"$1\"; exec " + report;
  return command + "bash -c " + ShellQuote(script) + " cudaswitch-reload " +
         ShellQuote(shell_rc.string());
}

} // namespace cudaswitch::switcher
