#include "cudaswitch/cli/router.hpp"

#include "admin/filesystem_admin_factory.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "core/process/command_runner.hpp"
#include "switcher/toolkit_switcher.hpp"
#include "toolkit/layout.hpp"
#include "toolkit/search_paths.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace cudaswitch::cli {

namespace {

using core::errors::ExitCode;
using core::errors::ToInt;

constexpr int kExitSuccess = ToInt(ExitCode::kSuccess);
constexpr int kExitFailure = ToInt(ExitCode::kFailure);
constexpr int kExitUsage = ToInt(ExitCode::kUsage);
constexpr int kExitConfigInvalid = ToInt(ExitCode::kConfigInvalid);
constexpr int kExitConflictingPath = ToInt(ExitCode::kConflictingPath);
constexpr int kExitMissingTarget = ToInt(ExitCode::kMissingTarget);
constexpr int kExitPreflightFailed = ToInt(ExitCode::kPreflightFailed);

// The program name is echoed verbatim so the text matches however the user
// invoked the tool (bare name, relative or absolute path).
void PrintUsage(std::ostream& out, std::string_view program) {
  out << "Usage: " << program << " <cuda_version_number>\n"
      << "Example: " << program << " 12.1\n";
}

} // namespace

int ExitCodeFor(const switcher::SwitchResult& result) {
  switch (result.status) {
  case switcher::SwitchStatus::kConflictingPath:
    return kExitConflictingPath;
  case switcher::SwitchStatus::kMissingTarget:
    return kExitMissingTarget;
  case switcher::SwitchStatus::kPreflightFailed:
    return kExitPreflightFailed;
  case switcher::SwitchStatus::kCompleted:
    break;
  }

  if (!result.report_started) {
    return kExitFailure;
  }
  return result.report_exit_code;
}

int Dispatch(int argc, char** argv) {
  return Dispatch(argc, argv, core::config::ProcessEnvironment());
}

int Dispatch(int argc, char** argv, const core::config::EnvironmentLookup& env) {
  const std::string_view program =
      argc > 0 ? std::string_view(argv[0]) : std::string_view("cudaswitch");

  // Argument gate runs before anything reads the environment or the disk.
  if (argc != 2) {
    PrintUsage(std::cout, program);
    return kExitUsage;
  }

  const std::string version(argv[1]);
  if (version == "-h" || version == "--help") {
    PrintUsage(std::cout, program);
    return kExitSuccess;
  }

  std::string error;
  if (!toolkit::IsUsableVersionString(version, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cout, program);
    return kExitUsage;
  }

  core::config::SwitcherSettings settings;
  if (!core::config::LoadSettings(env, settings, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  core::logging::Logger logger(settings.log_level);
  logger.SetVersion(version);

  core::process::ShellCommandRunner runner;
  std::unique_ptr<admin::IFilesystemAdmin> filesystem_admin =
      admin::CreateFilesystemAdmin(settings.elevation, runner);
  logger.Debug("settings resolved",
               {{"install_root", settings.install_root.string()},
                {"elevation", core::config::ToString(settings.elevation)},
                {"admin", filesystem_admin->Name()},
                {"shell_rc", settings.shell_rc.string()}});

  switcher::SwitchRequest request;
  request.version = version;
  request.layout = toolkit::ToolkitLayout(settings.install_root);
  request.ambient_search_paths = toolkit::SearchPathConfigFromEnvironment(env);
  request.shell_rc = settings.shell_rc;

  switcher::ToolkitSwitcher toolkit_switcher(*filesystem_admin, runner, logger, std::cout);
  const switcher::SwitchResult result = toolkit_switcher.Switch(request);
  if (result.status != switcher::SwitchStatus::kCompleted) {
    std::cerr << "error: " << result.error << '\n';
  }
  return ExitCodeFor(result);
}

} // namespace cudaswitch::cli
