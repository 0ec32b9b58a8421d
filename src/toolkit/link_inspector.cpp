#include "toolkit/link_inspector.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace cudaswitch::toolkit {

namespace {

const char* DescribeFileType(fs::file_type type) {
  switch (type) {
  case fs::file_type::regular:
    return "regular file";
  case fs::file_type::directory:
    return "directory";
  case fs::file_type::block:
    return "block device";
  case fs::file_type::character:
    return "character device";
  case fs::file_type::fifo:
    return "fifo";
  case fs::file_type::socket:
    return "socket";
  default:
    return "unknown entry";
  }
}

} // namespace

const char* ToString(LinkState state) {
  switch (state) {
  case LinkState::kAbsent:
    return "absent";
  case LinkState::kSymlink:
    return "symlink";
  case LinkState::kConflicting:
    return "conflicting";
  }
  return "absent";
}

bool InspectLinkPath(const fs::path& link_path, LinkInspection& inspection, std::string& error) {
  error.clear();
  inspection = LinkInspection{};

  std::error_code ec;
  const fs::file_status status = fs::symlink_status(link_path, ec);
  if (status.type() == fs::file_type::not_found) {
    inspection.state = LinkState::kAbsent;
    return true;
  }
  if (ec) {
    error = "failed to examine '" + link_path.string() + "': " + ec.message();
    return false;
  }

  if (status.type() == fs::file_type::symlink) {
    inspection.state = LinkState::kSymlink;
    inspection.current_target = fs::read_symlink(link_path, ec);
    if (ec) {
      error = "failed to read link '" + link_path.string() + "': " + ec.message();
      return false;
    }
    return true;
  }

  inspection.state = LinkState::kConflicting;
  inspection.entry_type = DescribeFileType(status.type());
  return true;
}

bool InspectToolkitTarget(const fs::path& target, TargetState& state, std::string& error) {
  error.clear();
  std::error_code ec;
  const fs::file_status status = fs::status(target, ec);
  if (status.type() == fs::file_type::not_found) {
    state = TargetState::kMissing;
    return true;
  }
  if (ec) {
    error = "failed to examine '" + target.string() + "': " + ec.message();
    return false;
  }
  state = status.type() == fs::file_type::directory ? TargetState::kDirectory
                                                    : TargetState::kNotDirectory;
  return true;
}

} // namespace cudaswitch::toolkit
