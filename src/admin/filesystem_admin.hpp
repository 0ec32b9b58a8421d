#pragma once

#include <filesystem>
#include <string>

namespace cudaswitch::admin {

// Privileged filesystem mutations needed to swap the toolkit link.
//
// The install root normally belongs to root, so these are the only two calls
// that need elevated rights. Keeping them behind one small interface lets the
// switch sequence run unchanged against sudo, direct syscalls, or a test fake.
class IFilesystemAdmin {
public:
  virtual ~IFilesystemAdmin() = default;

  // Short label for logs ("direct", "sudo").
  virtual std::string Name() const = 0;

  // Moves `from` to `to`, replacing `to` when it is a file or symlink. `to` is
  // never treated as a directory to move into.
  virtual bool Rename(const std::filesystem::path& from, const std::filesystem::path& to,
                      std::string& error) = 0;

  // Creates `link_path` as a symbolic link whose contents are `target`. The
  // target is not required to exist.
  virtual bool CreateSymlink(const std::filesystem::path& target,
                             const std::filesystem::path& link_path, std::string& error) = 0;
};

} // namespace cudaswitch::admin
