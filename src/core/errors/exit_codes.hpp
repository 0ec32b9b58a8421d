#pragma once

namespace cudaswitch::core::errors {

// Stable process-exit contract for the switch command.
//
// Usage keeps the historical value 1 so wrapper scripts written against the
// shell version of this tool keep working. Precondition failures get their own
// values so callers can tell "nothing was touched" apart from a failed report.
// kFailure covers a version report that could not be started at all.
// Any other non-zero exit is the version report's own exit code.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 1,
  kConfigInvalid = 2,
  kConflictingPath = 10,
  kMissingTarget = 11,
  kPreflightFailed = 12,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace cudaswitch::core::errors
