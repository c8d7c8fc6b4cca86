#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "pipeline_task.hpp"

namespace glucolumin::pipeline {

/*
  Thread-safe blocking queue for pipeline workers.
*/
class PipelineScheduler {
 public:
  // Returns false once the scheduler is shut down.
  bool Enqueue(const PipelineTask& task);

  // blocking wait
  std::optional<PipelineTask> Dequeue();

  void Shutdown();

  std::size_t Pending() const;

 private:
  mutable std::mutex       mutex_;
  std::condition_variable  cv_;
  std::queue<PipelineTask> queue_;
  bool                     shutdown_ = false;
};

} // namespace glucolumin::pipeline
