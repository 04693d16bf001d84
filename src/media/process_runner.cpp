#include "media/process_runner.hpp"

#include <cerrno>
#include <cstring>
#include <utility>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mediaprep::media {

namespace {

void CloseQuietly(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

std::string ErrnoText(int code) {
  return std::strerror(code);
}

} // namespace

bool RunProcess(const std::vector<std::string>& argv, ProcessResult& result, std::string& error,
                std::size_t max_output_bytes) {
  result = ProcessResult{};
  error.clear();

  if (argv.empty() || argv.front().empty()) {
    error = "cannot run an empty command line";
    return false;
  }

  // Both pipes are close-on-exec so a concurrent fork in another worker never
  // inherits them; dup2 onto stdout/stderr clears the flag for our own child.
  int output_pipe[2] = {-1, -1};
  if (::pipe2(output_pipe, O_CLOEXEC) != 0) {
    error = "failed to create output pipe: " + ErrnoText(errno);
    return false;
  }

  // The child reports an execvp failure through this pipe; a successful exec
  // closes it (O_CLOEXEC) and the parent reads EOF.
  int status_pipe[2] = {-1, -1};
  if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
    error = "failed to create status pipe: " + ErrnoText(errno);
    CloseQuietly(output_pipe[0]);
    CloseQuietly(output_pipe[1]);
    return false;
  }

  std::vector<char*> child_argv;
  child_argv.reserve(argv.size() + 1U);
  for (const auto& arg : argv) {
    child_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  child_argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    error = "fork failed: " + ErrnoText(errno);
    CloseQuietly(output_pipe[0]);
    CloseQuietly(output_pipe[1]);
    CloseQuietly(status_pipe[0]);
    CloseQuietly(status_pipe[1]);
    return false;
  }

  if (pid == 0) {
    ::close(output_pipe[0]);
    ::close(status_pipe[0]);
    ::dup2(output_pipe[1], STDOUT_FILENO);
    ::dup2(output_pipe[1], STDERR_FILENO);
    ::close(output_pipe[1]);
    const int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      ::dup2(null_fd, STDIN_FILENO);
      ::close(null_fd);
    }
    ::execvp(child_argv[0], child_argv.data());
    const int exec_errno = errno;
    const ssize_t ignored = ::write(status_pipe[1], &exec_errno, sizeof(exec_errno));
    (void)ignored;
    ::_exit(127);
  }

  CloseQuietly(output_pipe[1]);
  CloseQuietly(status_pipe[1]);

  char buffer[4096];
  while (true) {
    const ssize_t count = ::read(output_pipe[0], buffer, sizeof(buffer));
    if (count > 0) {
      result.output.append(buffer, static_cast<std::size_t>(count));
      if (result.output.size() > max_output_bytes) {
        result.output.erase(0, result.output.size() - max_output_bytes);
      }
      continue;
    }
    if (count < 0 && errno == EINTR) {
      continue;
    }
    break;
  }
  CloseQuietly(output_pipe[0]);

  int exec_errno = 0;
  ssize_t status_read = 0;
  do {
    status_read = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (status_read < 0 && errno == EINTR);
  CloseQuietly(status_pipe[0]);

  int raw_status = 0;
  pid_t waited = 0;
  do {
    waited = ::waitpid(pid, &raw_status, 0);
  } while (waited < 0 && errno == EINTR);

  if (status_read == static_cast<ssize_t>(sizeof(exec_errno))) {
    error = "failed to execute '" + argv.front() + "': " + ErrnoText(exec_errno);
    return false;
  }
  if (waited < 0) {
    error = "waitpid failed for '" + argv.front() + "': " + ErrnoText(errno);
    return false;
  }

  if (WIFEXITED(raw_status)) {
    result.exit_code = WEXITSTATUS(raw_status);
  } else if (WIFSIGNALED(raw_status)) {
    result.exit_code = 128 + WTERMSIG(raw_status);
  } else {
    result.exit_code = raw_status;
  }
  return true;
}

std::string TailLines(const std::string& text, std::size_t max_lines) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    std::string line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!line.empty()) {
      lines.push_back(std::move(line));
    }
    start = end + 1U;
  }

  const std::size_t first = lines.size() > max_lines ? lines.size() - max_lines : 0U;
  std::string tail;
  for (std::size_t i = first; i < lines.size(); ++i) {
    if (!tail.empty()) {
      tail.push_back('\n');
    }
    tail += lines[i];
  }
  return tail;
}

} // namespace mediaprep::media
