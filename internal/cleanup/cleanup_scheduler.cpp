#include "internal/cleanup/cleanup_scheduler.hpp"

#include <stdexcept>

#include "internal/core/lifecycle_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace staging::cleanup {

using observability::IntField;
using observability::StringField;

CleanupScheduler::CleanupScheduler(std::shared_ptr<core::LifecycleManager> manager, std::chrono::seconds interval)
    : manager_(std::move(manager)), interval_(interval) {
  if (!manager_) {
    throw std::invalid_argument("cleanup scheduler requires a lifecycle manager");
  }
  if (interval_.count() <= 0) {
    throw std::invalid_argument("cleanup scheduler requires a positive interval");
  }
}

CleanupScheduler::~CleanupScheduler() {
  Stop();
}

void CleanupScheduler::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&CleanupScheduler::Loop, this);
  STAGING_LOG_INFO("cleanup scheduler started", {IntField("interval_seconds", interval_.count())});
}

void CleanupScheduler::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  STAGING_LOG_INFO("cleanup scheduler stopped", {IntField("runs", static_cast<int64_t>(runs_.load()))});
}

void CleanupScheduler::Loop() {
  while (running_) {
    RunOnce();

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, interval_, [&] { return !running_; });
  }
}

CleanupRunSummary CleanupScheduler::RunOnce(util::TimePoint now) {
  observability::SpanScope span("staging.cleanup");
  CleanupRunSummary        summary;
  ++runs_;

  try {
    const auto expired = manager_->FindExpired(now);
    summary.expired    = expired.size();

    for (const auto& definition : expired) {
      if (manager_->Retire(definition.physical_name, "ttl expired")) {
        ++summary.retired;
      } else {
        ++summary.failed;
        STAGING_LOG_WARN("expired staging table not retired", {StringField("table", definition.physical_name)});
      }
    }
  } catch (const std::exception& e) {
    summary.completed = false;
    span.RecordException(e.what());
    STAGING_LOG_ERROR("cleanup run failed", {StringField("error", e.what())});
  } catch (...) {
    summary.completed = false;
    span.RecordException("unknown error");
    STAGING_LOG_ERROR("cleanup run failed", {StringField("error", "unknown error")});
  }

  span.SetAttribute("staging.cleanup.retired", static_cast<int64_t>(summary.retired));
  span.SetAttribute("staging.cleanup.failed", static_cast<int64_t>(summary.failed));
  if (summary.expired > 0 || !summary.completed) {
    STAGING_LOG_INFO("cleanup run finished", {IntField("expired", static_cast<int64_t>(summary.expired)),
                                              IntField("retired", static_cast<int64_t>(summary.retired)),
                                              IntField("failed", static_cast<int64_t>(summary.failed))});
  }
  return summary;
}

} // namespace staging::cleanup
