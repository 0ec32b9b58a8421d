#pragma once

#include "core/config/settings.hpp"
#include "switcher/toolkit_switcher.hpp"

namespace cudaswitch::cli {

// Entry point behind `cudaswitch <cuda_version_number>`.
//
// Exit contract (see core/errors/exit_codes.hpp):
//   0      switch done and `nvcc --version` succeeded, or help requested
//   1      usage error; nothing was touched
//   2      invalid CUDASWITCH_* environment setting; nothing was touched
//   10/11  link path occupied by a non-link / toolkit dir missing; nothing touched
//   12     link or toolkit path could not be examined; nothing touched
//   other  exit code of the version report
int Dispatch(int argc, char** argv);

// Same as Dispatch with an explicit environment, so tests can configure the
// install root without touching the process environment.
int Dispatch(int argc, char** argv, const core::config::EnvironmentLookup& env);

// Maps a finished switch onto the exit contract above. A report that never
// started counts as a plain failure; a started one passes its code through.
int ExitCodeFor(const switcher::SwitchResult& result);

} // namespace cudaswitch::cli
