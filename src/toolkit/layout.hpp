#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace cudaswitch::toolkit {

inline constexpr std::string_view kLinkName = "cuda";
inline constexpr std::string_view kBackupName = "cuda_backup";
inline constexpr std::string_view kVersionedDirPrefix = "cuda-";

// Fixed path scheme under one install root:
//   <root>/cuda          active toolkit link
//   <root>/cuda_backup   previous link, overwritten on every switch
//   <root>/cuda-<v>      installed toolkit for version <v>
class ToolkitLayout {
public:
  explicit ToolkitLayout(std::filesystem::path install_root)
      : install_root_(std::move(install_root)) {}

  const std::filesystem::path& InstallRoot() const {
    return install_root_;
  }

  std::filesystem::path LinkPath() const;
  std::filesystem::path BackupPath() const;
  std::filesystem::path TargetPathFor(std::string_view version) const;

  // Subdirectories reached through the link, so they stay valid across switches.
  std::filesystem::path BinDir() const;
  std::filesystem::path LibDir() const;

private:
  std::filesystem::path install_root_;
};

// A version is used verbatim as a directory-name suffix. It must be non-empty,
// must not contain '/' or NUL, and must not be "." or "..".
bool IsUsableVersionString(std::string_view version, std::string& error);

} // namespace cudaswitch::toolkit
