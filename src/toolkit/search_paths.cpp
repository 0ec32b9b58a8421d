#include "toolkit/search_paths.hpp"

#include "core/process/command_runner.hpp"

namespace cudaswitch::toolkit {

SearchPath SearchPath::Parse(std::string_view raw) {
  SearchPath path;
  if (raw.empty()) {
    return path;
  }

  std::size_t start = 0;
  while (true) {
    const std::size_t colon = raw.find(':', start);
    if (colon == std::string_view::npos) {
      path.entries_.emplace_back(raw.substr(start));
      break;
    }
    path.entries_.emplace_back(raw.substr(start, colon - start));
    start = colon + 1U;
  }
  return path;
}

void SearchPath::Prepend(std::string entry) {
  entries_.insert(entries_.begin(), std::move(entry));
}

std::string SearchPath::ToString() const {
  std::string joined;
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    if (i != 0U) {
      joined.push_back(':');
    }
    joined += entries_[i];
  }
  return joined;
}

SearchPathConfig SearchPathConfigFromEnvironment(const core::config::EnvironmentLookup& env) {
  SearchPathConfig config;
  config.executable_path = SearchPath::Parse(env(kExecutablePathVar).value_or(""));
  config.library_path = SearchPath::Parse(env(kLibraryPathVar).value_or(""));
  return config;
}

SearchPathConfig WithToolkitPrepended(SearchPathConfig base, std::string_view bin_dir,
                                      std::string_view lib_dir) {
  base.executable_path.Prepend(std::string(bin_dir));
  base.library_path.Prepend(std::string(lib_dir));
  return base;
}

std::vector<std::string> ToExportLines(const SearchPathConfig& config) {
  return {
      "export " + std::string(kExecutablePathVar) + "=" +
          core::process::ShellQuote(config.executable_path.ToString()),
      "export " + std::string(kLibraryPathVar) + "=" +
          core::process::ShellQuote(config.library_path.ToString()),
  };
}

} // namespace cudaswitch::toolkit
