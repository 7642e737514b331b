#include "core/upload/SessionSweeper.hpp"

#include <spdlog/spdlog.h>

#include "core/Time.hpp"
#include "core/upload/UploadService.hpp"

namespace uds {

SessionSweeper::SessionSweeper(UploadService& uploads,
                               std::chrono::milliseconds ttl,
                               std::chrono::milliseconds interval)
  : uploads_(uploads), ttl_(ttl), interval_(interval) {}

SessionSweeper::~SessionSweeper() { stop(); }

void SessionSweeper::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (worker_.joinable()) return;
  stopping_ = false;
  worker_ = std::thread([this] { run(); });
}

void SessionSweeper::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

size_t SessionSweeper::sweepOnce() {
  return uploads_.sweepExpired(ttl_, now_millis());
}

void SessionSweeper::run() {
  spdlog::info("session sweeper running every {}s, ttl {}s",
               interval_.count() / 1000, ttl_.count() / 1000);
  std::unique_lock<std::mutex> lock(mu_);
  while (!cv_.wait_for(lock, interval_, [this] { return stopping_; })) {
    lock.unlock();
    try {
      size_t n = sweepOnce();
      if (n > 0) spdlog::info("session sweep removed {} session(s)", n);
    } catch (const std::exception& e) {
      spdlog::error("session sweep failed: {}", e.what());
    }
    lock.lock();
  }
}

} // namespace uds
