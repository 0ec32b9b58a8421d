#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/install_root_fixtures.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

using cudaswitch::tests::common::AssertContains;
using cudaswitch::tests::common::AssertEqual;
using cudaswitch::tests::common::AssertNotContains;
using cudaswitch::tests::common::CapturedDispatch;
using cudaswitch::tests::common::DispatchCaptured;

int main() {
  const fs::path root = cudaswitch::tests::common::CreateUniqueTempDir("cudaswitch-logging");
  cudaswitch::tests::common::CreateToolkitInstall(root, "12.1");

  const CapturedDispatch debug = DispatchCaptured(
      {"cudaswitch", "12.1"},
      cudaswitch::tests::common::MakeEnvironment({{"CUDASWITCH_ROOT", root.string()},
                                                  {"CUDASWITCH_ELEVATION", "none"},
                                                  {"CUDASWITCH_SHELL_RC", "none"},
                                                  {"CUDASWITCH_LOG_LEVEL", "debug"},
                                                  {"PATH", "/usr/bin:/bin"}}));
  AssertEqual(debug.exit_code, 0, "debug run exit code");

  // Log lines stay on stderr; stdout carries only the user-facing text.
  AssertContains(debug.stderr_text, "level=DEBUG");
  AssertContains(debug.stderr_text, "level=INFO");
  AssertContains(debug.stderr_text, "version=\"12.1\"");
  AssertContains(debug.stderr_text, "msg=\"toolkit link created\"");
  AssertContains(debug.stderr_text, "admin=\"direct\"");
  AssertContains(debug.stderr_text, "export_path=\"export PATH=");
  AssertNotContains(debug.stdout_text, "level=");
  AssertContains(debug.stdout_text, "Symbolic link created for CUDA version 12.1");

  const CapturedDispatch quiet = DispatchCaptured(
      {"cudaswitch", "12.1"},
      cudaswitch::tests::common::MakeEnvironment({{"CUDASWITCH_ROOT", root.string()},
                                                  {"CUDASWITCH_ELEVATION", "none"},
                                                  {"CUDASWITCH_SHELL_RC", "none"},
                                                  {"CUDASWITCH_LOG_LEVEL", "error"},
                                                  {"PATH", "/usr/bin:/bin"}}));
  AssertEqual(quiet.exit_code, 0, "quiet run exit code");
  AssertNotContains(quiet.stderr_text, "level=INFO");
  AssertNotContains(quiet.stderr_text, "level=DEBUG");

  cudaswitch::tests::common::RemovePathBestEffort(root);
  std::cout << "logging_contract_smoke: ok\n";
  return 0;
}
