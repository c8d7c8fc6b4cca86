#include "pipeline_worker.hpp"

#include "internal/core/visit_manager.hpp"
#include "internal/observability/logging.hpp"

namespace glucolumin::pipeline {

PipelineWorker::PipelineWorker(std::shared_ptr<PipelineScheduler> scheduler, std::shared_ptr<glucolumin::core::VisitManager> manager,
                               std::size_t threads)
    : scheduler_(std::move(scheduler)), manager_(std::move(manager)), thread_count_(threads == 0 ? 1 : threads) {
}

PipelineWorker::~PipelineWorker() {
  Stop();
}

void PipelineWorker::Start() {
  if (running_.exchange(true)) return;
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&PipelineWorker::Run, this);
  }
  GLUCOLUMIN_LOG_INFO("pipeline workers started", {observability::IntField("threads", static_cast<int64_t>(thread_count_))});
}

void PipelineWorker::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void PipelineWorker::Run() {
  while (running_) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    try {
      manager_->ExecutePipeline(*task);
    } catch (const std::exception& e) {
      GLUCOLUMIN_LOG_ERROR("pipeline task failed", {observability::StringField("visit_id", task->visit_id), observability::StringField("error", e.what())});
    }
  }
}

} // namespace glucolumin::pipeline
