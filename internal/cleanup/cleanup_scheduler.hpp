#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/util/time.hpp"

namespace staging::core {
class LifecycleManager;
}

namespace staging::cleanup {

struct CleanupRunSummary {
  std::size_t expired   = 0;
  std::size_t retired   = 0;
  std::size_t failed    = 0;
  bool        completed = true;
};

/*
  Periodically retires staging tables whose TTL has elapsed.

  Each run asks the lifecycle manager for expired definitions and retires
  them one by one. A failing resource is counted and skipped; a failing run
  is logged and the loop waits for the next period.
*/
class CleanupScheduler {
 public:
  CleanupScheduler(std::shared_ptr<core::LifecycleManager> manager, std::chrono::seconds interval);
  ~CleanupScheduler();

  CleanupScheduler(const CleanupScheduler&)            = delete;
  CleanupScheduler& operator=(const CleanupScheduler&) = delete;

  void Start();
  void Stop();

  // One pass, on the calling thread. Never throws.
  CleanupRunSummary RunOnce(util::TimePoint now = util::Now());

  std::size_t Runs() const {
    return runs_.load();
  }

 private:
  void Loop();

  std::shared_ptr<core::LifecycleManager> manager_;
  std::chrono::seconds                    interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::atomic<std::size_t> runs_{0};
};

} // namespace staging::cleanup
