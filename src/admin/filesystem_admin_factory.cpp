#include "admin/filesystem_admin_factory.hpp"

#include "admin/direct_filesystem_admin.hpp"
#include "admin/sudo_filesystem_admin.hpp"

#include <unistd.h>

namespace cudaswitch::admin {

using core::config::ElevationMode;

ElevationMode ResolveElevationMode(ElevationMode requested, bool running_as_root) {
  if (requested != ElevationMode::kAuto) {
    return requested;
  }
  return running_as_root ? ElevationMode::kNone : ElevationMode::kSudo;
}

bool IsRunningAsRoot() {
  return geteuid() == 0;
}

std::unique_ptr<IFilesystemAdmin> CreateFilesystemAdmin(ElevationMode mode,
                                                        core::process::ICommandRunner& runner) {
  switch (ResolveElevationMode(mode, IsRunningAsRoot())) {
  case ElevationMode::kSudo:
    return std::make_unique<SudoFilesystemAdmin>(runner);
  case ElevationMode::kNone:
  case ElevationMode::kAuto:
    break;
  }
  return std::make_unique<DirectFilesystemAdmin>();
}

} // namespace cudaswitch::admin
