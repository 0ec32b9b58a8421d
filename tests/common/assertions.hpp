#ifndef CUDASWITCH_TESTS_COMMON_ASSERTIONS_HPP_
#define CUDASWITCH_TESTS_COMMON_ASSERTIONS_HPP_

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

namespace cudaswitch::tests::common {

[[noreturn]] inline void Fail(std::string_view message) {
  std::cerr << message << '\n';
  std::abort();
}

inline void AssertTrue(bool condition, std::string_view message) {
  if (!condition) {
    Fail(message);
  }
}

inline void AssertEqual(long long actual, long long expected, std::string_view what) {
  if (actual == expected) {
    return;
  }
  std::cerr << what << ": expected " << expected << ", got " << actual << '\n';
  std::abort();
}

inline void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) != std::string_view::npos) {
    return;
  }
  std::cerr << "expected to find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertNotContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) == std::string_view::npos) {
    return;
  }
  std::cerr << "expected to not find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

// Checks that `link_path` is a symbolic link whose raw contents equal
// `expected_target`.
inline void AssertSymlinkTo(const std::filesystem::path& link_path,
                            const std::filesystem::path& expected_target) {
  std::error_code ec;
  if (!std::filesystem::is_symlink(std::filesystem::symlink_status(link_path, ec))) {
    Fail("expected a symlink at: " + link_path.string());
  }
  const std::filesystem::path actual = std::filesystem::read_symlink(link_path, ec);
  if (ec) {
    Fail("failed to read symlink: " + link_path.string());
  }
  if (actual != expected_target) {
    Fail("symlink " + link_path.string() + " points to " + actual.string() + ", expected " +
         expected_target.string());
  }
}

inline void AssertAbsent(const std::filesystem::path& path) {
  std::error_code ec;
  if (std::filesystem::symlink_status(path, ec).type() != std::filesystem::file_type::not_found) {
    Fail("expected no entry at: " + path.string());
  }
}

} // namespace cudaswitch::tests::common

#endif // CUDASWITCH_TESTS_COMMON_ASSERTIONS_HPP_
