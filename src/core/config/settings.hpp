#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace cudaswitch::core::config {

inline constexpr std::string_view kEnvInstallRoot = "CUDASWITCH_ROOT";
inline constexpr std::string_view kEnvElevation = "CUDASWITCH_ELEVATION";
inline constexpr std::string_view kEnvShellRc = "CUDASWITCH_SHELL_RC";
inline constexpr std::string_view kEnvLogLevel = "CUDASWITCH_LOG_LEVEL";

inline constexpr std::string_view kDefaultInstallRoot = "/usr/local";

// How link mutations obtain the rights to write under the install root.
enum class ElevationMode {
  kAuto, // direct when already root, sudo otherwise
  kSudo,
  kNone, // direct std::filesystem calls with the caller's own rights
};

const char* ToString(ElevationMode mode);
bool ParseElevationMode(std::string_view raw, ElevationMode& mode, std::string& error);

// Resolved runtime settings. The command line carries exactly one positional
// argument, so every knob here comes from the environment.
struct SwitcherSettings {
  std::filesystem::path install_root{std::string(kDefaultInstallRoot)};
  ElevationMode elevation = ElevationMode::kAuto;
  // Empty means the startup-file reload is disabled.
  std::filesystem::path shell_rc;
  logging::LogLevel log_level = logging::LogLevel::kInfo;
};

// Returns the value of one environment variable, or nullopt when unset.
using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view name)>;

// Lookup backed by the real process environment.
EnvironmentLookup ProcessEnvironment();

// Fills `settings` from `env`. Unset variables keep their defaults; a set but
// unusable value is an error and leaves `settings` partially filled.
bool LoadSettings(const EnvironmentLookup& env, SwitcherSettings& settings, std::string& error);

} // namespace cudaswitch::core::config
