#pragma once

#include "core/logging/logger.hpp"
#include "service/request.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace mediaprep::transport {

using DispatchFn = std::function<service::Outcome(const service::Request&)>;

struct UdsServerOptions {
  std::filesystem::path socket_path;
  std::size_t worker_count = 1;
  std::uint32_t max_frame_bytes = 64U * 1024U * 1024U;
  // Once the first byte of a frame arrives, the rest must follow within this
  // long or the connection is closed.
  std::chrono::milliseconds frame_read_timeout{30000};
};

// Turns one request frame body into one response frame body. Bodies that do
// not parse still get a ValidationError outcome so the connection stays
// usable.
std::string HandleFrameBody(std::string_view body, const DispatchFn& dispatch);

// Unix-domain stream server speaking length-prefixed JSON frames.
//
// One I/O thread accepts connections and polls the idle ones. A connection
// with a request waiting is queued for a fixed pool of workers; a worker
// reads and answers exactly one frame, then hands the connection back. Idle
// connections therefore never hold a worker, and a connection is only ever
// served by one worker at a time, so its responses keep request order.
// RequestStop() only stores a flag, so it may be called from a signal
// handler; loops notice it within one poll interval, and a request already
// being handled runs to completion.
class UdsServer {
public:
  UdsServer(UdsServerOptions options, DispatchFn dispatch,
            core::logging::Logger* logger = nullptr);
  ~UdsServer();

  UdsServer(const UdsServer&) = delete;
  UdsServer& operator=(const UdsServer&) = delete;

  // Removes a stale socket file, binds, listens and starts the threads.
  bool Start(std::string& error);

  // Blocks until RequestStop() and all threads have exited.
  void Wait();

  void RequestStop() noexcept;

  bool stop_requested() const noexcept {
    return stop_.load();
  }

  const std::filesystem::path& socket_path() const {
    return options_.socket_path;
  }

private:
  void IoLoop();
  void AcceptConnection();
  void WorkerLoop();
  // Reads and answers one frame; false when the connection should be closed.
  bool ServeOneRequest(int fd);
  void ReturnConnection(int fd);
  void Shutdown();

  UdsServerOptions options_;
  DispatchFn dispatch_;
  core::logging::Logger* logger_ = nullptr;

  int listen_fd_ = -1;
  // Workers write one byte here to wake the I/O thread out of poll().
  int wake_read_fd_ = -1;
  int wake_write_fd_ = -1;
  std::atomic<bool> stop_{false};
  std::thread io_thread_;
  std::vector<std::thread> workers_;

  // Owned by the I/O thread until Shutdown().
  std::vector<int> idle_;

  std::mutex queue_mu_;
  std::condition_variable queue_cv_;
  std::deque<int> ready_;
  std::vector<int> returned_;
};

} // namespace mediaprep::transport
