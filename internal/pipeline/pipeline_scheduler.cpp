#include "pipeline_scheduler.hpp"

namespace glucolumin::pipeline {

bool PipelineScheduler::Enqueue(const PipelineTask& task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(task);
  }
  cv_.notify_one();
  return true;
}

std::optional<PipelineTask> PipelineScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  PipelineTask task = queue_.front();
  queue_.pop();
  return task;
}

void PipelineScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t PipelineScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace glucolumin::pipeline
