#pragma once

#include "admin/filesystem_admin.hpp"
#include "core/config/settings.hpp"
#include "core/process/command_runner.hpp"

#include <memory>

namespace cudaswitch::admin {

// Collapses kAuto to a concrete mode: direct for root, sudo for everyone else.
core::config::ElevationMode ResolveElevationMode(core::config::ElevationMode requested,
                                                 bool running_as_root);

bool IsRunningAsRoot();

// `runner` must outlive the returned admin when the sudo mode is selected.
std::unique_ptr<IFilesystemAdmin> CreateFilesystemAdmin(core::config::ElevationMode mode,
                                                        core::process::ICommandRunner& runner);

} // namespace cudaswitch::admin
