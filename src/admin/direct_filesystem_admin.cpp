#include "admin/direct_filesystem_admin.hpp"

#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

namespace cudaswitch::admin {

namespace {

std::string DescribeFailure(std::string_view operation, const std::error_code& ec) {
  std::string text = std::string(operation) + ": " + ec.message();
  if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
    text += " (elevated privileges required; set CUDASWITCH_ELEVATION=sudo or run as root)";
  }
  return text;
}

} // namespace

bool DirectFilesystemAdmin::Rename(const fs::path& from, const fs::path& to, std::string& error) {
  error.clear();
  std::error_code ec;
  fs::rename(from, to, ec);
  if (ec) {
    error = DescribeFailure("rename '" + from.string() + "' -> '" + to.string() + "'", ec);
    return false;
  }
  return true;
}

bool DirectFilesystemAdmin::CreateSymlink(const fs::path& target, const fs::path& link_path,
                                          std::string& error) {
  error.clear();
  std::error_code ec;
  fs::create_symlink(target, link_path, ec);
  if (ec) {
    error = DescribeFailure(
        "create symlink '" + link_path.string() + "' -> '" + target.string() + "'", ec);
    return false;
  }
  return true;
}

} // namespace cudaswitch::admin
