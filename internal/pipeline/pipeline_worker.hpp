#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "pipeline_scheduler.hpp"

namespace glucolumin::core {
class VisitManager;
}

namespace glucolumin::pipeline {

/*
  Pool of background threads draining the pipeline queue.

  Executes:
      PROCESSING visit -> features, result, DONE | FAILED
*/
class PipelineWorker {
 public:
  PipelineWorker(std::shared_ptr<PipelineScheduler> scheduler, std::shared_ptr<glucolumin::core::VisitManager> manager, std::size_t threads);
  ~PipelineWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<PipelineScheduler>              scheduler_;
  std::shared_ptr<glucolumin::core::VisitManager> manager_;
  std::size_t                                     thread_count_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace glucolumin::pipeline
