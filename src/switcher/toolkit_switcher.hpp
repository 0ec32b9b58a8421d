#pragma once

#include "admin/filesystem_admin.hpp"
#include "core/logging/logger.hpp"
#include "core/process/command_runner.hpp"
#include "toolkit/layout.hpp"
#include "toolkit/search_paths.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace cudaswitch::switcher {

struct SwitchRequest {
  std::string version;
  toolkit::ToolkitLayout layout{std::filesystem::path("/usr/local")};
  // Search paths of the invoking process, before the toolkit is prepended.
  toolkit::SearchPathConfig ambient_search_paths;
  // Startup file re-sourced for the version report; empty disables it.
  std::filesystem::path shell_rc;
};

enum class SwitchStatus {
  // All steps were attempted. Individual mutation failures are recorded in the
  // result flags, not here.
  kCompleted,
  kConflictingPath,
  kMissingTarget,
  kPreflightFailed,
};

const char* ToString(SwitchStatus status);

struct SwitchResult {
  SwitchStatus status = SwitchStatus::kCompleted;
  // Set for every status other than kCompleted.
  std::string error;

  std::optional<std::filesystem::path> previous_target;
  bool backup_attempted = false;
  bool backup_created = false;
  bool link_created = false;
  std::filesystem::path link_target;

  toolkit::SearchPathConfig search_paths;
  bool shell_reloaded = false;

  bool report_started = false;
  int report_exit_code = -1;
  std::string report_output;
};

// Runs the switch sequence:
//   preflight -> backup existing link -> create link -> extend search paths
//   -> reload shell startup file + report compiler version.
//
// Preflight failures (conflicting entry at the link path, missing toolkit
// directory) stop before any mutation. After that nothing stops the sequence:
// a failed rename or link creation is logged and the next step still runs,
// so the compiler report always reflects whatever state was reached.
class ToolkitSwitcher {
public:
  ToolkitSwitcher(admin::IFilesystemAdmin& admin, core::process::ICommandRunner& runner,
                  core::logging::Logger& logger, std::ostream& out)
      : admin_(admin), runner_(runner), logger_(logger), out_(out) {}

  ToolkitSwitcher(const ToolkitSwitcher&) = delete;
  ToolkitSwitcher& operator=(const ToolkitSwitcher&) = delete;

  SwitchResult Switch(const SwitchRequest& request);

private:
  bool RunPreflight(const SwitchRequest& request, SwitchResult& result);
  void BackupExistingLink(const SwitchRequest& request, SwitchResult& result);
  void CreateLink(const SwitchRequest& request, SwitchResult& result);
  std::filesystem::path ResolveShellReload(const SwitchRequest& request, SwitchResult& result);
  void ReportCompilerVersion(const std::filesystem::path& shell_rc, SwitchResult& result);

  admin::IFilesystemAdmin& admin_;
  core::process::ICommandRunner& runner_;
  core::logging::Logger& logger_;
  std::ostream& out_;
};

} // namespace cudaswitch::switcher
