#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/install_root_fixtures.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using cudaswitch::tests::common::AssertAbsent;
using cudaswitch::tests::common::AssertContains;
using cudaswitch::tests::common::AssertEqual;
using cudaswitch::tests::common::AssertSymlinkTo;
using cudaswitch::tests::common::CapturedDispatch;
using cudaswitch::tests::common::DispatchCaptured;

namespace {

void AssertUsage(const CapturedDispatch& captured, const std::string& program) {
  AssertEqual(captured.exit_code, 1, "usage exit code");
  AssertContains(captured.stdout_text, "Usage: " + program + " <cuda_version_number>\n");
  AssertContains(captured.stdout_text, "Example: " + program + " 12.1\n");
}

void AssertUntouched(const fs::path& root) {
  AssertSymlinkTo(root / "cuda", root / "cuda-11.8");
  AssertAbsent(root / "cuda_backup");
}

} // namespace

int main() {
  const fs::path root = cudaswitch::tests::common::CreateUniqueTempDir("cudaswitch-usage");
  cudaswitch::tests::common::CreateToolkitInstall(root, "11.8");
  cudaswitch::tests::common::CreateToolkitInstall(root, "12.1");
  fs::create_symlink(root / "cuda-11.8", root / "cuda");

  const auto env = cudaswitch::tests::common::MakeEnvironment({
      {"CUDASWITCH_ROOT", root.string()},
      {"CUDASWITCH_ELEVATION", "none"},
      {"CUDASWITCH_SHELL_RC", "none"},
  });

  AssertUsage(DispatchCaptured({"cuda.sh"}, env), "cuda.sh");
  AssertUntouched(root);

  AssertUsage(DispatchCaptured({"cudaswitch", "12.1", "11.8"}, env), "cudaswitch");
  AssertUntouched(root);

  AssertUsage(DispatchCaptured({"./bin/cudaswitch", "12.1", "--force", "extra"}, env),
              "./bin/cudaswitch");
  AssertUntouched(root);

  const CapturedDispatch empty_version = DispatchCaptured({"cudaswitch", ""}, env);
  AssertUsage(empty_version, "cudaswitch");
  AssertContains(empty_version.stderr_text, "error: cuda version cannot be empty");
  AssertUntouched(root);

  const CapturedDispatch traversal = DispatchCaptured({"cudaswitch", "../etc"}, env);
  AssertEqual(traversal.exit_code, 1, "path-like version exit code");
  AssertUntouched(root);

  const CapturedDispatch help = DispatchCaptured({"cudaswitch", "--help"}, env);
  AssertEqual(help.exit_code, 0, "help exit code");
  AssertContains(help.stdout_text, "Example: cudaswitch 12.1");
  AssertUntouched(root);

  const CapturedDispatch bad_config = DispatchCaptured(
      {"cudaswitch", "12.1"},
      cudaswitch::tests::common::MakeEnvironment({{"CUDASWITCH_ROOT", root.string()},
                                                  {"CUDASWITCH_ELEVATION", "root-please"}}));
  AssertEqual(bad_config.exit_code, 2, "invalid config exit code");
  AssertContains(bad_config.stderr_text, "CUDASWITCH_ELEVATION");
  AssertUntouched(root);

  cudaswitch::tests::common::RemovePathBestEffort(root);
  std::cout << "usage_gate_smoke: ok\n";
  return 0;
}
