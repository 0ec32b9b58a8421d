#include "admin/sudo_filesystem_admin.hpp"

namespace cudaswitch::admin {

using core::process::ShellQuote;

namespace {

std::string TrimTrailingNewlines(std::string text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.pop_back();
  }
  return text;
}

} // namespace

// -T keeps mv/ln from descending into `to` when the backup is a link to a
// directory; the backup itself must be replaced.
std::string SudoFilesystemAdmin::BuildRenameCommand(const std::filesystem::path& from,
                                                    const std::filesystem::path& to) {
  return "sudo mv -f -T -- " + ShellQuote(from.string()) + " " + ShellQuote(to.string());
}

std::string SudoFilesystemAdmin::BuildSymlinkCommand(const std::filesystem::path& target,
                                                     const std::filesystem::path& link_path) {
  return "sudo ln -s -T -- " + ShellQuote(target.string()) + " " + ShellQuote(link_path.string());
}

bool SudoFilesystemAdmin::Rename(const std::filesystem::path& from,
                                 const std::filesystem::path& to, std::string& error) {
  return RunPrivileged(BuildRenameCommand(from, to), error);
}

bool SudoFilesystemAdmin::CreateSymlink(const std::filesystem::path& target,
                                        const std::filesystem::path& link_path,
                                        std::string& error) {
  return RunPrivileged(BuildSymlinkCommand(target, link_path), error);
}

bool SudoFilesystemAdmin::RunPrivileged(const std::string& command, std::string& error) {
  error.clear();
  core::process::CommandResult result;
  if (!runner_.Run(command, result, error)) {
    return false;
  }
  if (result.exit_code != 0) {
    error = "'" + command + "' exited with code " + std::to_string(result.exit_code);
    const std::string output = TrimTrailingNewlines(result.output);
    if (!output.empty()) {
      error += ": " + output;
    }
    return false;
  }
  return true;
}

} // namespace cudaswitch::admin
