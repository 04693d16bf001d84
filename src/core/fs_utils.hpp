#ifndef MEDIAPREP_CORE_FS_UTILS_HPP_
#define MEDIAPREP_CORE_FS_UTILS_HPP_

#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace mediaprep::core {

// Creates the directory that will hold `output_path`. A bare file name needs
// nothing.
inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }
  const std::filesystem::path parent = output_path.parent_path();
  if (parent.empty()) {
    return true;
  }
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    error = "cannot create directory '" + parent.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// Writes `bytes` to a sibling `.partial` file and renames it over
// `output_path`, so readers see either the old file or the complete new one.
// Two workers writing the same destination each get their own partial file;
// the last rename wins.
inline bool WriteBytesFileAtomic(const std::filesystem::path& output_path,
                                 std::span<const unsigned char> bytes, std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  static std::atomic<std::uint64_t> sequence{0};
  std::filesystem::path partial = output_path;
  partial += ".partial-" + std::to_string(::getpid()) + "-" +
             std::to_string(sequence.fetch_add(1U, std::memory_order_relaxed));

  std::ofstream out(partial, std::ios::binary | std::ios::trunc);
  if (out) {
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    out.close();
  }
  std::error_code ec;
  if (!out) {
    std::filesystem::remove(partial, ec);
    error = "cannot write '" + partial.string() + "'";
    return false;
  }

  std::filesystem::rename(partial, output_path, ec);
  if (ec) {
    error = "cannot move output into place at '" + output_path.string() + "': " + ec.message();
    std::error_code cleanup_ec;
    std::filesystem::remove(partial, cleanup_ec);
    return false;
  }
  return true;
}

inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  const auto* data = reinterpret_cast<const unsigned char*>(text.data());
  return WriteBytesFileAtomic(output_path, std::span<const unsigned char>(data, text.size()),
                              error);
}

// Reads a request document or other small input file in full.
inline bool ReadFileBytes(const std::filesystem::path& input_path, std::string& bytes,
                          std::string& error) {
  std::ifstream in(input_path, std::ios::binary);
  if (!in) {
    error = "cannot open '" + input_path.string() + "'";
    return false;
  }
  bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    error = "read error on '" + input_path.string() + "'";
    return false;
  }
  return true;
}

} // namespace mediaprep::core

#endif // MEDIAPREP_CORE_FS_UTILS_HPP_
