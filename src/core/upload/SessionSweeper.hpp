#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace uds {

class UploadService;

// Background thread that expires abandoned upload sessions.
class SessionSweeper {
public:
  SessionSweeper(UploadService& uploads,
                 std::chrono::milliseconds ttl,
                 std::chrono::milliseconds interval);
  ~SessionSweeper();

  SessionSweeper(const SessionSweeper&) = delete;
  SessionSweeper& operator=(const SessionSweeper&) = delete;

  void start();
  void stop();

  // One sweep, on the calling thread.
  size_t sweepOnce();

private:
  void run();

  UploadService& uploads_;
  std::chrono::milliseconds ttl_;
  std::chrono::milliseconds interval_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stopping_ = false;
  std::thread worker_;
};

} // namespace uds
