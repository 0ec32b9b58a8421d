#pragma once

#include "admin/filesystem_admin.hpp"
#include "core/process/command_runner.hpp"

namespace cudaswitch::admin {

// Delegates each mutation to `sudo mv` / `sudo ln`. sudo talks to the terminal
// directly for its password prompt, so captured output only holds errors.
class SudoFilesystemAdmin final : public IFilesystemAdmin {
public:
  explicit SudoFilesystemAdmin(core::process::ICommandRunner& runner) : runner_(runner) {}

  std::string Name() const override {
    return "sudo";
  }

  bool Rename(const std::filesystem::path& from, const std::filesystem::path& to,
              std::string& error) override;

  bool CreateSymlink(const std::filesystem::path& target, const std::filesystem::path& link_path,
                     std::string& error) override;

  static std::string BuildRenameCommand(const std::filesystem::path& from,
                                        const std::filesystem::path& to);
  static std::string BuildSymlinkCommand(const std::filesystem::path& target,
                                         const std::filesystem::path& link_path);

private:
  bool RunPrivileged(const std::string& command, std::string& error);

  core::process::ICommandRunner& runner_;
};

} // namespace cudaswitch::admin
