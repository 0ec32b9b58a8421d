#pragma once

#include <filesystem>
#include <string>

namespace cudaswitch::toolkit {

enum class LinkState {
  kAbsent,
  kSymlink,
  // Something that is not a symbolic link (directory, regular file, socket...)
  // occupies the link path.
  kConflicting,
};

const char* ToString(LinkState state);

struct LinkInspection {
  LinkState state = LinkState::kAbsent;
  // Raw link contents for kSymlink; may be relative or dangling.
  std::filesystem::path current_target;
  // Entry type name for kConflicting, used in error text.
  std::string entry_type;
};

// Classifies `link_path` without following it. A dangling symlink counts as
// kSymlink. Returns false only when the path cannot be examined at all.
bool InspectLinkPath(const std::filesystem::path& link_path, LinkInspection& inspection,
                     std::string& error);

enum class TargetState {
  kDirectory,
  kMissing,
  kNotDirectory,
};

// Classifies a versioned toolkit directory, following symlinks so a versioned
// dir that is itself a link to elsewhere is accepted. Returns false only when
// the path cannot be examined at all.
bool InspectToolkitTarget(const std::filesystem::path& target, TargetState& state,
                          std::string& error);

} // namespace cudaswitch::toolkit
