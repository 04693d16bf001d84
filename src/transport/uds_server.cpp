#include "transport/uds_server.hpp"

#include "service/wire_codec.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdint>
#include <chrono>
#include <cstring>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace mediaprep::transport {

namespace {

constexpr int kPollIntervalMs = 200;
constexpr auto kQueueWait = std::chrono::milliseconds(kPollIntervalMs);

using Clock = std::chrono::steady_clock;

enum class IoResult {
  kOk,
  kClosed,
  kTimedOut,
  kStopped,
  kError,
};

std::string ErrnoText(int code) {
  return std::system_category().message(code);
}

// Waits until `fd` is readable. Gives up with kStopped once `stop` is set and
// with kTimedOut at `deadline`.
IoResult WaitReadable(int fd, const std::atomic<bool>& stop, Clock::time_point deadline) {
  while (!stop.load()) {
    const auto now = Clock::now();
    if (now >= deadline) {
      return IoResult::kTimedOut;
    }
    const std::int64_t left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count() + 1;
    pollfd entry{};
    entry.fd = fd;
    entry.events = POLLIN;
    const int ready =
        ::poll(&entry, 1, static_cast<int>(std::min<std::int64_t>(left, kPollIntervalMs)));
    if (ready > 0) {
      return IoResult::kOk;
    }
    if (ready < 0 && errno != EINTR) {
      return IoResult::kError;
    }
  }
  return IoResult::kStopped;
}

IoResult ReadExact(int fd, unsigned char* buffer, std::size_t size,
                   const std::atomic<bool>& stop, Clock::time_point deadline) {
  std::size_t done = 0;
  while (done < size) {
    const IoResult wait = WaitReadable(fd, stop, deadline);
    if (wait != IoResult::kOk) {
      return wait;
    }
    const ssize_t got = ::recv(fd, buffer + done, size - done, 0);
    if (got == 0) {
      return IoResult::kClosed;
    }
    if (got < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      return IoResult::kError;
    }
    done += static_cast<std::size_t>(got);
  }
  return IoResult::kOk;
}

bool WriteAll(int fd, const unsigned char* data, std::size_t size) {
  std::size_t done = 0;
  while (done < size) {
    const ssize_t sent = ::send(fd, data + done, size - done, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    done += static_cast<std::size_t>(sent);
  }
  return true;
}

bool WriteFrame(int fd, std::string_view body) {
  const auto header = service::EncodeFrameHeader(static_cast<std::uint32_t>(body.size()));
  return WriteAll(fd, header.data(), header.size()) &&
         WriteAll(fd, reinterpret_cast<const unsigned char*>(body.data()), body.size());
}

// A leftover socket file from a previous run is removed; any other kind of
// file at that path is left alone and reported.
bool RemoveStaleSocket(const std::filesystem::path& path, std::string& error) {
  struct stat info {};
  if (::lstat(path.c_str(), &info) != 0) {
    if (errno == ENOENT) {
      return true;
    }
    error = "cannot stat socket path '" + path.string() + "': " + ErrnoText(errno);
    return false;
  }
  if (!S_ISSOCK(info.st_mode)) {
    error = "socket path '" + path.string() + "' exists and is not a socket";
    return false;
  }
  if (::unlink(path.c_str()) != 0) {
    error = "cannot remove stale socket '" + path.string() + "': " + ErrnoText(errno);
    return false;
  }
  return true;
}

} // namespace

std::string HandleFrameBody(std::string_view body, const DispatchFn& dispatch) {
  const auto started = std::chrono::steady_clock::now();
  service::Request request;
  service::OperationError error;
  if (!service::ParseRequest(body, request, error)) {
    service::Outcome outcome;
    outcome.ok = false;
    outcome.payload = service::BuildErrorPayload(error);
    outcome.latency = std::max(std::chrono::nanoseconds(1),
                               std::chrono::duration_cast<std::chrono::nanoseconds>(
                                   std::chrono::steady_clock::now() - started));
    return service::SerializeOutcome(outcome);
  }
  return service::SerializeOutcome(dispatch(request));
}

UdsServer::UdsServer(UdsServerOptions options, DispatchFn dispatch,
                     core::logging::Logger* logger)
    : options_(std::move(options)), dispatch_(std::move(dispatch)), logger_(logger) {
  if (options_.worker_count == 0) {
    options_.worker_count = 1;
  }
}

UdsServer::~UdsServer() {
  RequestStop();
  Shutdown();
}

bool UdsServer::Start(std::string& error) {
  if (listen_fd_ >= 0) {
    error = "server is already started";
    return false;
  }

  const std::string path = options_.socket_path.string();
  sockaddr_un address{};
  if (path.empty() || path.size() >= sizeof(address.sun_path)) {
    error = "socket path must be 1.." + std::to_string(sizeof(address.sun_path) - 1) +
            " bytes: '" + path + "'";
    return false;
  }
  if (!RemoveStaleSocket(options_.socket_path, error)) {
    return false;
  }

  int wake[2] = {-1, -1};
  if (::pipe2(wake, O_CLOEXEC | O_NONBLOCK) != 0) {
    error = "failed to create wake pipe: " + ErrnoText(errno);
    return false;
  }

  const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    error = "socket() failed: " + ErrnoText(errno);
    ::close(wake[0]);
    ::close(wake[1]);
    return false;
  }
  address.sun_family = AF_UNIX;
  std::memcpy(address.sun_path, path.c_str(), path.size() + 1);
  if (::bind(fd, reinterpret_cast<const sockaddr*>(&address), sizeof(address)) != 0) {
    error = "bind('" + path + "') failed: " + ErrnoText(errno);
    ::close(fd);
    ::close(wake[0]);
    ::close(wake[1]);
    return false;
  }
  if (::listen(fd, SOMAXCONN) != 0) {
    error = "listen('" + path + "') failed: " + ErrnoText(errno);
    ::close(fd);
    ::close(wake[0]);
    ::close(wake[1]);
    ::unlink(path.c_str());
    return false;
  }

  listen_fd_ = fd;
  wake_read_fd_ = wake[0];
  wake_write_fd_ = wake[1];
  stop_.store(false);
  workers_.reserve(options_.worker_count);
  for (std::size_t i = 0; i < options_.worker_count; ++i) {
    workers_.emplace_back(&UdsServer::WorkerLoop, this);
  }
  io_thread_ = std::thread(&UdsServer::IoLoop, this);

  if (logger_ != nullptr) {
    logger_->Info("server_listening", {{"socket_path", path},
                                       {"workers", std::to_string(options_.worker_count)}});
  }
  return true;
}

void UdsServer::Wait() {
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
  Shutdown();
}

void UdsServer::RequestStop() noexcept {
  stop_.store(true);
}

void UdsServer::IoLoop() {
  std::vector<pollfd> entries;
  std::vector<int> still_idle;
  std::vector<int> became_ready;
  while (!stop_.load()) {
    {
      std::lock_guard<std::mutex> lock(queue_mu_);
      idle_.insert(idle_.end(), returned_.begin(), returned_.end());
      returned_.clear();
    }

    // [0] wake pipe, [1] listener, [2..] idle connections.
    entries.clear();
    entries.push_back(pollfd{wake_read_fd_, POLLIN, 0});
    entries.push_back(pollfd{listen_fd_, POLLIN, 0});
    for (const int client : idle_) {
      entries.push_back(pollfd{client, POLLIN, 0});
    }

    const int ready = ::poll(entries.data(), entries.size(), kPollIntervalMs);
    if (ready < 0) {
      if (errno != EINTR && logger_ != nullptr) {
        logger_->Warn("poll_failed", {{"error", ErrnoText(errno)}});
      }
      continue;
    }
    if (ready == 0) {
      continue;
    }

    if (entries[0].revents != 0) {
      unsigned char drain[64];
      ssize_t drained = 0;
      do {
        drained = ::read(wake_read_fd_, drain, sizeof(drain));
      } while (drained > 0);
    }

    // Readable, hung up or failed: a worker reads the frame or sees the close.
    still_idle.clear();
    became_ready.clear();
    for (std::size_t i = 2; i < entries.size(); ++i) {
      if (entries[i].revents != 0) {
        became_ready.push_back(entries[i].fd);
      } else {
        still_idle.push_back(entries[i].fd);
      }
    }
    idle_.swap(still_idle);
    if (!became_ready.empty()) {
      {
        std::lock_guard<std::mutex> lock(queue_mu_);
        ready_.insert(ready_.end(), became_ready.begin(), became_ready.end());
      }
      queue_cv_.notify_all();
    }

    if ((entries[1].revents & POLLIN) != 0) {
      AcceptConnection();
    }
  }
  queue_cv_.notify_all();
}

void UdsServer::AcceptConnection() {
  const int client = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
  if (client < 0) {
    if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED && logger_ != nullptr) {
      logger_->Warn("accept_failed", {{"error", ErrnoText(errno)}});
    }
    return;
  }
  // A client that stops reading its responses must not pin a worker in send().
  const auto send_timeout = options_.frame_read_timeout.count();
  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(send_timeout / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((send_timeout % 1000) * 1000);
  if (::setsockopt(client, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout)) != 0 &&
      logger_ != nullptr) {
    logger_->Warn("send_timeout_not_set", {{"error", ErrnoText(errno)}});
  }
  idle_.push_back(client);
}

void UdsServer::WorkerLoop() {
  while (true) {
    int client = -1;
    {
      std::unique_lock<std::mutex> lock(queue_mu_);
      queue_cv_.wait_for(lock, kQueueWait, [this] { return !ready_.empty() || stop_.load(); });
      if (stop_.load()) {
        return;
      }
      if (ready_.empty()) {
        continue;
      }
      client = ready_.front();
      ready_.pop_front();
    }
    if (ServeOneRequest(client)) {
      ReturnConnection(client);
    } else {
      ::close(client);
    }
  }
}

bool UdsServer::ServeOneRequest(int fd) {
  const Clock::time_point deadline = Clock::now() + options_.frame_read_timeout;
  std::array<unsigned char, service::kFrameHeaderBytes> header{};
  IoResult read = ReadExact(fd, header.data(), header.size(), stop_, deadline);
  if (read == IoResult::kOk) {
    const std::uint32_t length = service::DecodeFrameHeader(header);
    if (length > options_.max_frame_bytes) {
      if (logger_ != nullptr) {
        logger_->Warn("frame_too_large",
                      {{"bytes", std::to_string(length)},
                       {"limit", std::to_string(options_.max_frame_bytes)}});
      }
      return false;
    }
    std::string body(length, '\0');
    read = ReadExact(fd, reinterpret_cast<unsigned char*>(body.data()), body.size(), stop_,
                     deadline);
    if (read == IoResult::kOk) {
      if (!WriteFrame(fd, HandleFrameBody(body, dispatch_))) {
        if (logger_ != nullptr) {
          logger_->Warn("response_write_failed", {{"error", ErrnoText(errno)}});
        }
        return false;
      }
      return true;
    }
  }
  if (read == IoResult::kTimedOut && logger_ != nullptr) {
    logger_->Warn("frame_read_timeout",
                  {{"timeout_ms", std::to_string(options_.frame_read_timeout.count())}});
  }
  return false;
}

void UdsServer::ReturnConnection(int fd) {
  {
    std::lock_guard<std::mutex> lock(queue_mu_);
    returned_.push_back(fd);
  }
  const unsigned char byte = 1;
  // A full pipe already holds a pending wake-up.
  if (::write(wake_write_fd_, &byte, 1) < 0 && errno != EAGAIN && logger_ != nullptr) {
    logger_->Warn("wake_failed", {{"error", ErrnoText(errno)}});
  }
}

void UdsServer::Shutdown() {
  stop_.store(true);
  queue_cv_.notify_all();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
  for (std::thread& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();

  {
    std::lock_guard<std::mutex> lock(queue_mu_);
    for (const int client : ready_) {
      ::close(client);
    }
    ready_.clear();
    for (const int client : returned_) {
      ::close(client);
    }
    returned_.clear();
  }
  for (const int client : idle_) {
    ::close(client);
  }
  idle_.clear();

  for (int* wake_fd : {&wake_read_fd_, &wake_write_fd_}) {
    if (*wake_fd >= 0) {
      ::close(*wake_fd);
      *wake_fd = -1;
    }
  }

  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
    ::unlink(options_.socket_path.c_str());
    if (logger_ != nullptr) {
      logger_->Info("server_stopped", {{"socket_path", options_.socket_path.string()}});
    }
  }
}

} // namespace mediaprep::transport
