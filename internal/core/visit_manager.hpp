#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/core/signal_quality.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/features.hpp"
#include "internal/model/visit.hpp"
#include "internal/pipeline/pipeline_task.hpp"
#include "internal/util/visit_id.hpp"

namespace glucolumin::pipeline {
class GlucosePipeline;
class PipelineScheduler;
}

namespace glucolumin::core {

struct VisitManagerOptions {
  std::size_t max_samples_per_visit = 65536;

  std::chrono::milliseconds collection_window{30000};
  std::chrono::milliseconds max_processing{60000};

  SignalQualityOptions signal_quality;

  // Replaceable for tests; defaults to util::GenerateVisitId.
  std::function<util::VisitId(util::TimePoint)> id_generator;
};

struct AppendOutcome {
  uint64_t           accepted = 0;
  uint64_t           total    = 0;
  model::VisitStatus status   = glucolumin::v1::VISIT_STATUS_UNSPECIFIED;
};

/*
  Visit session state machine.

  REGISTERED -> COLLECTING -> PROCESSING -> {DONE, FAILED}

  Every mutation runs under the visit's exclusive lock and commits through
  the repository before the session cache is updated. Pipeline computation
  runs without any visit lock held; its outcome is applied only if the
  visit is still in the processing run that produced it.
*/
class VisitManager {
 public:
  VisitManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<pipeline::GlucosePipeline> pipeline,
               std::shared_ptr<pipeline::PipelineScheduler> scheduler, VisitManagerOptions options);

  model::Visit Register(const model::PatientProfile& profile);

  AppendOutcome AppendSamples(const std::string& visit_id, const std::vector<model::RawSample>& samples);

  // True only for the call that moved the visit to PROCESSING.
  bool EndScan(const std::string& visit_id, model::ProcessingTrigger trigger = glucolumin::v1::PROCESSING_TRIGGER_END_OF_SCAN);

  // Worker entry point. Never throws for pipeline errors; they become FAILED.
  void ExecutePipeline(const pipeline::PipelineTask& task);

  // Watchdog hooks; each returns the number of visits it moved.
  std::size_t ExpireCollections(util::TimePoint now);
  std::size_t FailOverdueProcessing(util::TimePoint now);

  // Loads every visit into the session cache and re-enqueues visits left in
  // PROCESSING. Returns the number re-enqueued.
  std::size_t HydrateCaches();

  model::Visit GetVisit(const std::string& visit_id) const;

  model::FeatureVector GetFeatures(const std::string& visit_id) const;

  std::map<model::VisitStatus, uint64_t> CountByStatus() const;

  std::vector<db::model::InvalidScanRecord> ListInvalidScans(const std::optional<std::string>& visit_id, std::size_t limit) const;

  // Records a scan the device rejected before upload. An empty reason is
  // stored as "Unknown error". The visit's status is left alone.
  db::model::InvalidScanRecord ReportInvalidScan(const std::string& visit_id, const std::string& reason, double value);

  // Number of per-visit lock entries; one per known visit at most.
  std::size_t TrackedVisitLocks() const;

  const VisitManagerOptions& Options() const {
    return options_;
  }

 private:
  // NotFoundError for ids with no visit.
  std::shared_ptr<std::shared_mutex> VisitMutex(const std::string& visit_id) const;
  std::shared_ptr<std::shared_mutex> CreateVisitMutex(const std::string& visit_id) const;

  std::optional<model::Visit> LoadVisit(const std::string& visit_id) const;
  model::Visit                RequireVisit(const std::string& visit_id) const;
  void                        CacheVisit(const model::Visit& visit) const;

  // Caller holds the visit's exclusive lock.
  void BeginProcessingLocked(model::Visit visit, model::ProcessingTrigger trigger, util::TimePoint now);
  void FailLocked(model::Visit visit, const std::string& reason, util::TimePoint now);
  db::model::InvalidScanRecord RecordInvalidScan(const std::string& visit_id, const std::string& reason, double value, util::TimePoint now);

  std::shared_ptr<db::Repository>              repository_;
  std::shared_ptr<pipeline::GlucosePipeline>   pipeline_;
  std::shared_ptr<pipeline::PipelineScheduler> scheduler_;
  VisitManagerOptions                          options_;

  // Session cache consistency model:
  // - every mutation commits to the repository first, then refreshes the entry
  //   while still holding the visit's exclusive lock
  // - misses fall through to the repository
  mutable std::shared_mutex                             cache_mutex_;
  mutable std::unordered_map<std::string, model::Visit> cache_;

  mutable std::mutex                                                          visit_mutexes_guard_;
  mutable std::unordered_map<std::string, std::shared_ptr<std::shared_mutex>> visit_mutexes_;

  // Visits whose pipeline is currently executing.
  std::mutex                      running_guard_;
  std::unordered_set<std::string> running_;
};

} // namespace glucolumin::core
