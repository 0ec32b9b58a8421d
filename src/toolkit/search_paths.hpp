#pragma once

#include "core/config/settings.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cudaswitch::toolkit {

inline constexpr std::string_view kExecutablePathVar = "PATH";
inline constexpr std::string_view kLibraryPathVar = "LD_LIBRARY_PATH";

// Colon-separated search path held as ordered entries. Empty entries found in
// the environment are kept as-is (they mean "current directory" to the loader
// and the shell), so a round trip never changes what the variable means.
class SearchPath {
public:
  SearchPath() = default;

  static SearchPath Parse(std::string_view raw);

  // Adds `entry` in front of all existing entries. Existing copies of the same
  // entry are left in place.
  void Prepend(std::string entry);

  const std::vector<std::string>& Entries() const {
    return entries_;
  }

  bool Empty() const {
    return entries_.empty();
  }

  std::string ToString() const;

private:
  std::vector<std::string> entries_;
};

// Search paths handed to child processes. Built from, but never written back
// to, the ambient process environment.
struct SearchPathConfig {
  SearchPath executable_path;
  SearchPath library_path;
};

SearchPathConfig SearchPathConfigFromEnvironment(const core::config::EnvironmentLookup& env);

// Returns `base` with `bin_dir` and `lib_dir` placed first.
SearchPathConfig WithToolkitPrepended(SearchPathConfig base, std::string_view bin_dir,
                                      std::string_view lib_dir);

// `export VAR='value'` lines that apply the config to an interactive shell.
std::vector<std::string> ToExportLines(const SearchPathConfig& config);

} // namespace cudaswitch::toolkit
