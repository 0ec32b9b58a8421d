#include "core/config/settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace cudaswitch::core::config {

namespace {

std::string ToLower(std::string_view raw) {
  std::string lowered(raw);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

bool ParseInstallRoot(std::string_view raw, std::filesystem::path& root, std::string& error) {
  std::string value(raw);
  while (value.size() > 1U && value.back() == '/') {
    value.pop_back();
  }

  if (value.empty()) {
    error = "empty value for " + std::string(kEnvInstallRoot);
    return false;
  }
  if (value.front() != '/') {
    error = std::string(kEnvInstallRoot) + " must be an absolute path: " + std::string(raw);
    return false;
  }

  root = std::filesystem::path(value).lexically_normal();
  return true;
}

std::filesystem::path DefaultShellRc(const EnvironmentLookup& env) {
  const std::optional<std::string> home = env("HOME");
  if (!home.has_value() || home->empty()) {
    return {};
  }
  return std::filesystem::path(*home) / ".bashrc";
}

} // namespace

const char* ToString(ElevationMode mode) {
  switch (mode) {
  case ElevationMode::kAuto:
    return "auto";
  case ElevationMode::kSudo:
    return "sudo";
  case ElevationMode::kNone:
    return "none";
  }
  return "auto";
}

bool ParseElevationMode(std::string_view raw, ElevationMode& mode, std::string& error) {
  error.clear();
  const std::string normalized = ToLower(raw);
  if (normalized == "auto") {
    mode = ElevationMode::kAuto;
    return true;
  }
  if (normalized == "sudo") {
    mode = ElevationMode::kSudo;
    return true;
  }
  if (normalized == "none" || normalized == "direct") {
    mode = ElevationMode::kNone;
    return true;
  }

  error = "invalid " + std::string(kEnvElevation) + " '" + std::string(raw) +
          "' (expected auto|sudo|none)";
  return false;
}

EnvironmentLookup ProcessEnvironment() {
  return [](std::string_view name) -> std::optional<std::string> {
    const char* value = std::getenv(std::string(name).c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

bool LoadSettings(const EnvironmentLookup& env, SwitcherSettings& settings, std::string& error) {
  error.clear();

  if (const auto root = env(kEnvInstallRoot); root.has_value()) {
    if (!ParseInstallRoot(*root, settings.install_root, error)) {
      return false;
    }
  }

  if (const auto elevation = env(kEnvElevation); elevation.has_value()) {
    if (!ParseElevationMode(*elevation, settings.elevation, error)) {
      return false;
    }
  }

  if (const auto level = env(kEnvLogLevel); level.has_value()) {
    if (!logging::ParseLogLevel(*level, kEnvLogLevel, settings.log_level, error)) {
      return false;
    }
  }

  settings.shell_rc = DefaultShellRc(env);
  if (const auto rc = env(kEnvShellRc); rc.has_value()) {
    if (rc->empty()) {
      error = "empty value for " + std::string(kEnvShellRc) + " (use 'none' to disable)";
      return false;
    }
    settings.shell_rc = ToLower(*rc) == "none" ? std::filesystem::path{}
                                               : std::filesystem::path(*rc);
  }

  return true;
}

} // namespace cudaswitch::core::config
