#pragma once

#include "toolkit/search_paths.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace cudaswitch::switcher {

inline constexpr std::string_view kCompilerName = "nvcc";

// Builds the shell command that reports the active compiler version with
// `search_paths` applied to the child's environment.
//
// When `shell_rc` is non-empty the startup file is sourced by bash first, in
// the same child, so anything it sets is visible to the compiler. The effect
// ends with that child; the invoking shell never sees it.
std::string BuildVersionReportCommand(const toolkit::SearchPathConfig& search_paths,
                                      const std::filesystem::path& shell_rc);

} // namespace cudaswitch::switcher
