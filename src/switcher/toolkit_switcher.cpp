#include "switcher/toolkit_switcher.hpp"

#include "switcher/version_report.hpp"
#include "toolkit/link_inspector.hpp"

#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace cudaswitch::switcher {

const char* ToString(SwitchStatus status) {
  switch (status) {
  case SwitchStatus::kCompleted:
    return "completed";
  case SwitchStatus::kConflictingPath:
    return "conflicting_path";
  case SwitchStatus::kMissingTarget:
    return "missing_target";
  case SwitchStatus::kPreflightFailed:
    return "preflight_failed";
  }
  return "completed";
}

SwitchResult ToolkitSwitcher::Switch(const SwitchRequest& request) {
  SwitchResult result;
  logger_.SetVersion(request.version);
  logger_.Debug("switch requested",
                {{"install_root", request.layout.InstallRoot().string()},
                 {"admin", admin_.Name()}});

  if (!RunPreflight(request, result)) {
    logger_.Error("switch aborted before any change",
                  {{"status", ToString(result.status)}, {"error", result.error}});
    return result;
  }

  BackupExistingLink(request, result);
  CreateLink(request, result);

  result.search_paths =
      toolkit::WithToolkitPrepended(request.ambient_search_paths,
                                    request.layout.BinDir().string(),
                                    request.layout.LibDir().string());
  logger_.Debug("search paths extended",
                {{"PATH", result.search_paths.executable_path.ToString()},
                 {"LD_LIBRARY_PATH", result.search_paths.library_path.ToString()}});

  if (result.link_created) {
    out_ << "Symbolic link created for CUDA version " << request.version << '\n';
    out_.flush();
  }

  const fs::path shell_rc = ResolveShellReload(request, result);
  ReportCompilerVersion(shell_rc, result);

  if (!result.link_created) {
    logger_.Warn("switch incomplete; toolkit link was not created, shell exports withheld",
                 {{"link", request.layout.LinkPath().string()}});
    return result;
  }

  // A child process cannot change its parent's environment; hand the user the
  // lines that would.
  const std::vector<std::string> exports = toolkit::ToExportLines(result.search_paths);
  logger_.Info("search path changes apply to child processes only; to update this shell run",
               {{"export_path", exports[0]}, {"export_ld_library_path", exports[1]}});
  return result;
}

bool ToolkitSwitcher::RunPreflight(const SwitchRequest& request, SwitchResult& result) {
  std::string error;
  if (!toolkit::IsUsableVersionString(request.version, error)) {
    result.status = SwitchStatus::kPreflightFailed;
    result.error = error;
    return false;
  }

  const fs::path link_path = request.layout.LinkPath();
  toolkit::LinkInspection inspection;
  if (!toolkit::InspectLinkPath(link_path, inspection, error)) {
    result.status = SwitchStatus::kPreflightFailed;
    result.error = error;
    return false;
  }
  logger_.Debug("link path inspected",
                {{"path", link_path.string()},
                 {"state", toolkit::ToString(inspection.state)},
                 {"target", inspection.current_target.string()}});

  if (inspection.state == toolkit::LinkState::kConflicting) {
    result.status = SwitchStatus::kConflictingPath;
    result.error = link_path.string() + " exists and is a " + inspection.entry_type +
                   ", not a symbolic link; move it aside before switching";
    return false;
  }
  if (inspection.state == toolkit::LinkState::kSymlink) {
    result.previous_target = inspection.current_target;
  }

  result.link_target = request.layout.TargetPathFor(request.version);
  toolkit::TargetState target_state = toolkit::TargetState::kMissing;
  if (!toolkit::InspectToolkitTarget(result.link_target, target_state, error)) {
    result.status = SwitchStatus::kPreflightFailed;
    result.error = error;
    return false;
  }
  if (target_state == toolkit::TargetState::kMissing) {
    result.status = SwitchStatus::kMissingTarget;
    result.error = "CUDA " + request.version + " is not installed: " +
                   result.link_target.string() + " does not exist";
    return false;
  }
  if (target_state == toolkit::TargetState::kNotDirectory) {
    result.status = SwitchStatus::kMissingTarget;
    result.error = result.link_target.string() + " is not a directory";
    return false;
  }

  return true;
}

void ToolkitSwitcher::BackupExistingLink(const SwitchRequest& request, SwitchResult& result) {
  if (!result.previous_target.has_value()) {
    logger_.Debug("no existing link; backup skipped");
    return;
  }

  const fs::path link_path = request.layout.LinkPath();
  const fs::path backup_path = request.layout.BackupPath();
  result.backup_attempted = true;

  std::string error;
  if (!admin_.Rename(link_path, backup_path, error)) {
    logger_.Error("failed to move existing link to backup",
                  {{"from", link_path.string()}, {"to", backup_path.string()}, {"error", error}});
    return;
  }

  result.backup_created = true;
  logger_.Info("existing link moved to backup",
               {{"backup", backup_path.string()},
                {"previous_target", result.previous_target->string()}});
}

void ToolkitSwitcher::CreateLink(const SwitchRequest& request, SwitchResult& result) {
  const fs::path link_path = request.layout.LinkPath();
  std::string error;
  if (!admin_.CreateSymlink(result.link_target, link_path, error)) {
    logger_.Error("failed to create toolkit link",
                  {{"link", link_path.string()},
                   {"target", result.link_target.string()},
                   {"error", error}});
    return;
  }

  result.link_created = true;
  logger_.Info("toolkit link created",
               {{"link", link_path.string()}, {"target", result.link_target.string()}});
}

fs::path ToolkitSwitcher::ResolveShellReload(const SwitchRequest& request, SwitchResult& result) {
  if (request.shell_rc.empty()) {
    logger_.Debug("shell startup file reload disabled");
    return {};
  }

  std::error_code ec;
  if (!fs::is_regular_file(request.shell_rc, ec)) {
    logger_.Warn("shell startup file not found; reload skipped",
                 {{"path", request.shell_rc.string()}});
    return {};
  }

  result.shell_reloaded = true;
  return request.shell_rc;
}

void ToolkitSwitcher::ReportCompilerVersion(const fs::path& shell_rc, SwitchResult& result) {
  const std::string command = BuildVersionReportCommand(result.search_paths, shell_rc);
  logger_.Debug("running version report", {{"command", command}});

  core::process::CommandResult report;
  std::string error;
  if (!runner_.Run(command, report, error)) {
    logger_.Error("failed to start version report", {{"error", error}});
    return;
  }

  result.report_started = true;
  result.report_exit_code = report.exit_code;
  result.report_output = report.output;

  out_ << report.output;
  if (!report.output.empty() && report.output.back() != '\n') {
    out_ << '\n';
  }
  out_.flush();

  if (report.exit_code != 0) {
    logger_.Warn("version report exited non-zero",
                 {{"exit_code", std::to_string(report.exit_code)}});
  }
}

} // namespace cudaswitch::switcher
