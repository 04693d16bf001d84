#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace mediaprep::media {

struct ProcessResult {
  // Exit status when the child exited normally, 128 + signal when it was
  // killed, -1 when it never started.
  int exit_code = -1;
  // Combined stdout and stderr, truncated to the last `max_output_bytes`.
  std::string output;
};

// Runs `argv[0]` (looked up on PATH) with the remaining arguments, no shell
// involved, and waits for it to finish.
//
// Returns false only when the process could not be started at all (empty
// argv, pipe/fork failure, binary not found); a nonzero exit status is a
// successful run with `result.exit_code != 0`.
bool RunProcess(const std::vector<std::string>& argv, ProcessResult& result, std::string& error,
                std::size_t max_output_bytes = 64U * 1024U);

// Last `max_lines` non-empty lines of `text`, for error diagnostics.
std::string TailLines(const std::string& text, std::size_t max_lines);

} // namespace mediaprep::media
