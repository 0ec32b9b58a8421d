#include "admin/direct_filesystem_admin.hpp"

#include "common/assertions.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

using cudaswitch::tests::common::AssertAbsent;
using cudaswitch::tests::common::AssertContains;
using cudaswitch::tests::common::AssertSymlinkTo;
using cudaswitch::tests::common::Fail;

int main() {
  const fs::path root = cudaswitch::tests::common::CreateUniqueTempDir("cudaswitch-direct-admin");
  fs::create_directories(root / "cuda-11.8");
  fs::create_directories(root / "cuda-12.1");

  cudaswitch::admin::DirectFilesystemAdmin admin;
  std::string error;

  if (!admin.CreateSymlink(root / "cuda-11.8", root / "cuda", error)) {
    Fail("initial symlink failed: " + error);
  }
  AssertSymlinkTo(root / "cuda", root / "cuda-11.8");

  if (!admin.Rename(root / "cuda", root / "cuda_backup", error)) {
    Fail("first rename failed: " + error);
  }
  AssertAbsent(root / "cuda");
  AssertSymlinkTo(root / "cuda_backup", root / "cuda-11.8");

  // The backup is now a link to a directory; a second rename must replace the
  // link itself rather than land inside cuda-11.8.
  if (!admin.CreateSymlink(root / "cuda-12.1", root / "cuda", error)) {
    Fail("second symlink failed: " + error);
  }
  if (!admin.Rename(root / "cuda", root / "cuda_backup", error)) {
    Fail("second rename failed: " + error);
  }
  AssertSymlinkTo(root / "cuda_backup", root / "cuda-12.1");
  AssertAbsent(root / "cuda-11.8" / "cuda");

  // Dangling targets are allowed.
  if (!admin.CreateSymlink(root / "cuda-99.9", root / "cuda", error)) {
    Fail("dangling symlink failed: " + error);
  }
  AssertSymlinkTo(root / "cuda", root / "cuda-99.9");

  if (admin.CreateSymlink(root / "cuda-12.1", root / "cuda", error)) {
    Fail("symlink over an existing link unexpectedly succeeded");
  }
  AssertContains(error, "create symlink");

  cudaswitch::tests::common::RemovePathBestEffort(root);
  std::cout << "direct_filesystem_admin_smoke: ok\n";
  return 0;
}
