#ifndef MEDIAPREP_TESTS_COMMON_TEMP_DIR_HPP_
#define MEDIAPREP_TESTS_COMMON_TEMP_DIR_HPP_

#include "assertions.hpp"

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace mediaprep::tests::common {

// Fresh directory under the system temp dir. The pid keeps parallel CTest
// runs apart; the counter keeps several roots in one test apart.
inline std::filesystem::path CreateUniqueTempDir(std::string_view prefix) {
  static std::atomic<unsigned> counter{0};
  const std::filesystem::path root =
      std::filesystem::temp_directory_path() /
      (std::string(prefix) + "-" + std::to_string(::getpid()) + "-" +
       std::to_string(counter.fetch_add(1)));

  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  if (ec) {
    Fail("failed to create temp root " + root.string() + ": " + ec.message());
  }
  return root;
}

inline void WriteFixtureFile(const std::filesystem::path& path, std::string_view content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!out) {
    Fail("failed to write fixture " + path.string());
  }
}

// Shell script fixture standing in for an external tool.
inline std::filesystem::path WriteExecutableScript(const std::filesystem::path& dir,
                                                   std::string_view name,
                                                   std::string_view body) {
  const std::filesystem::path path = dir / name;
  WriteFixtureFile(path, "#!/bin/sh\n" + std::string(body));
  std::error_code ec;
  std::filesystem::permissions(path, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    Fail("failed to make fixture executable: " + path.string());
  }
  return path;
}

inline void RemovePathBestEffort(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
}

} // namespace mediaprep::tests::common

#endif // MEDIAPREP_TESTS_COMMON_TEMP_DIR_HPP_
