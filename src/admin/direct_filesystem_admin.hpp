#pragma once

#include "admin/filesystem_admin.hpp"

namespace cudaswitch::admin {

// In-process std::filesystem implementation. Works when the caller already has
// write access to the install root (running as root, or a user-owned prefix).
class DirectFilesystemAdmin final : public IFilesystemAdmin {
public:
  std::string Name() const override {
    return "direct";
  }

  bool Rename(const std::filesystem::path& from, const std::filesystem::path& to,
              std::string& error) override;

  bool CreateSymlink(const std::filesystem::path& target, const std::filesystem::path& link_path,
                     std::string& error) override;
};

} // namespace cudaswitch::admin
