#include "switcher/version_report.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using cudaswitch::toolkit::SearchPath;
using cudaswitch::toolkit::SearchPathConfig;

namespace {

SearchPathConfig SampleSearchPaths() {
  SearchPathConfig config;
  config.executable_path = SearchPath::Parse("/usr/local/cuda/bin:/usr/bin");
  config.library_path = SearchPath::Parse("/usr/local/cuda/lib64");
  return config;
}

} // namespace

TEST_CASE("Version report runs nvcc with the extended search paths", "[switcher][report]") {
  const std::string command =
      cudaswitch::switcher::BuildVersionReportCommand(SampleSearchPaths(), {});
  REQUIRE(command ==
          "env PATH='/usr/local/cuda/bin:/usr/bin' "
          "LD_LIBRARY_PATH='/usr/local/cuda/lib64' nvcc --version");
}

TEST_CASE("Version report sources the startup file in the same child", "[switcher][report]") {
  const std::string command = cudaswitch::switcher::BuildVersionReportCommand(
      SampleSearchPaths(), "/home/dev/my rc/.bashrc");
  REQUIRE(command ==
          "env PATH='/usr/local/cuda/bin:/usr/bin' "
          "LD_LIBRARY_PATH='/usr/local/cuda/lib64' "
          "bash -c '. \"$1\"; exec nvcc --version' cudaswitch-reload "
          "'/home/dev/my rc/.bashrc'");
}
