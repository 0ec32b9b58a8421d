#include "toolkit/layout.hpp"

namespace cudaswitch::toolkit {

std::filesystem::path ToolkitLayout::LinkPath() const {
  return install_root_ / std::string(kLinkName);
}

std::filesystem::path ToolkitLayout::BackupPath() const {
  return install_root_ / std::string(kBackupName);
}

std::filesystem::path ToolkitLayout::TargetPathFor(std::string_view version) const {
  return install_root_ / (std::string(kVersionedDirPrefix) + std::string(version));
}

std::filesystem::path ToolkitLayout::BinDir() const {
  return LinkPath() / "bin";
}

std::filesystem::path ToolkitLayout::LibDir() const {
  return LinkPath() / "lib64";
}

bool IsUsableVersionString(std::string_view version, std::string& error) {
  error.clear();
  if (version.empty()) {
    error = "cuda version cannot be empty";
    return false;
  }
  if (version == "." || version == "..") {
    error = "cuda version cannot be '" + std::string(version) + "'";
    return false;
  }
  for (const char c : version) {
    if (c == '/' || c == '\0') {
      error = "cuda version must not contain path separators: " + std::string(version);
      return false;
    }
  }
  return true;
}

} // namespace cudaswitch::toolkit
