#include "visit_watchdog.hpp"

#include "internal/core/visit_manager.hpp"
#include "internal/observability/logging.hpp"

namespace glucolumin::pipeline {

VisitWatchdog::VisitWatchdog(std::shared_ptr<glucolumin::core::VisitManager> manager, std::chrono::milliseconds interval)
    : manager_(std::move(manager)), interval_(interval) {
}

VisitWatchdog::~VisitWatchdog() {
  Stop();
}

void VisitWatchdog::Start() {
  std::lock_guard lock(mutex_);
  if (thread_.joinable()) return;
  stopping_ = false;
  thread_   = std::thread(&VisitWatchdog::Run, this);
}

void VisitWatchdog::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void VisitWatchdog::SweepOnce(util::TimePoint now) {
  const auto expired = manager_->ExpireCollections(now);
  const auto overdue = manager_->FailOverdueProcessing(now);
  if (expired > 0 || overdue > 0) {
    GLUCOLUMIN_LOG_INFO("watchdog sweep", {observability::IntField("collection_timeouts", static_cast<int64_t>(expired)),
                                           observability::IntField("processing_timeouts", static_cast<int64_t>(overdue))});
  }
}

void VisitWatchdog::Run() {
  std::unique_lock lock(mutex_);
  while (!cv_.wait_for(lock, interval_, [&] { return stopping_; })) {
    lock.unlock();
    try {
      SweepOnce(util::Now());
    } catch (const std::exception& e) {
      GLUCOLUMIN_LOG_ERROR("watchdog sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace glucolumin::pipeline
