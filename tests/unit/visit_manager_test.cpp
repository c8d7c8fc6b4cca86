#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/calibration/model_registry.hpp"
#include "internal/core/visit_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/pipeline/glucose_pipeline.hpp"
#include "internal/pipeline/pipeline_scheduler.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace glucolumin;
using namespace glucolumin::v1;

// Every state-machine test runs once per repository backend.
struct Backend {
  std::string                                       name;
  std::function<std::shared_ptr<db::Repository>()> make_repository;
};

Backend MemoryBackend() {
  return {"memory", [] { return std::make_shared<db::memory::MemoryRepository>(); }};
}

// Each repository gets its own database file, removed at exit.
Backend SqliteBackend(std::vector<std::string>& files) {
  return {"sqlite", [&files] {
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            const auto path  = (std::filesystem::temp_directory_path() /
                               ("glucolumin_unit_visit_manager_" + std::to_string(stamp) + "_" + std::to_string(files.size()) + ".db"))
                                  .string();
            files.push_back(path);
            auto repo = std::make_shared<db::sqlite::SqliteRepository>(std::make_shared<db::sqlite::SqliteDB>(path, true));
            repo->Bootstrap();
            return repo;
          }};
}

struct Harness {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<calibration::ModelRegistry>  models;
  std::shared_ptr<pipeline::GlucosePipeline>   glucose_pipeline;
  std::shared_ptr<pipeline::PipelineScheduler> scheduler;
  std::shared_ptr<core::VisitManager>          manager;

  explicit Harness(const Backend& backend, core::VisitManagerOptions options = {}, bool load_model = true)
      : Harness(backend.make_repository(), std::move(options), load_model) {
  }

  Harness(std::shared_ptr<db::Repository> repo, core::VisitManagerOptions options = {}, bool load_model = true)
      : repository(std::move(repo)) {
    models           = std::make_shared<calibration::ModelRegistry>();
    glucose_pipeline = std::make_shared<pipeline::GlucosePipeline>(signal::SignalConditioningOptions{}, models);
    models->ExpectFeatures(glucose_pipeline->Extractor().FeatureNames());
    if (load_model) {
      models->Load("config/model.yaml");
    }
    scheduler = std::make_shared<pipeline::PipelineScheduler>();
    manager   = std::make_shared<core::VisitManager>(repository, glucose_pipeline, scheduler, std::move(options));
  }

  // Runs every queued task on the calling thread.
  std::size_t Drain() {
    std::size_t ran = 0;
    while (scheduler->Pending() > 0) {
      auto task = scheduler->Dequeue();
      assert(task.has_value());
      manager->ExecutePipeline(*task);
      ++ran;
    }
    return ran;
  }
};

model::PatientProfile Profile() {
  model::PatientProfile p;
  p.name           = "Test Patient";
  p.age            = 35;
  p.sex            = "male";
  p.height_cm      = 175.0;
  p.weight_kg      = 70.0;
  p.skin_tone      = "medium";
  p.blood_pressure = "120/80";
  p.had_food       = false;
  return p;
}

std::vector<model::RawSample> Samples(uint64_t first, std::size_t count, double base = 150.0) {
  std::vector<model::RawSample> out;
  for (std::size_t i = 0; i < count; ++i) {
    const auto index = first + i;
    out.push_back({index, base + std::sin(0.1 * static_cast<double>(index))});
  }
  return out;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestRegisterCreatesRegisteredVisit(const Backend& backend) {
  Harness h(backend);
  const auto visit = h.manager->Register(Profile());

  assert(util::IsValidVisitId(visit.visit_id));
  assert(visit.patient_id == "P-" + util::VisitSuffix(visit.visit_id).value());
  assert(visit.status == VISIT_STATUS_REGISTERED);
  assert(visit.patient.sex == "Male");
  assert(visit.patient.skin_tone == "Medium");
  assert(visit.bmi == 22.86);

  const auto stored = h.manager->GetVisit(visit.visit_id);
  assert(stored.status == VISIT_STATUS_REGISTERED);
  assert(stored.sample_count == 0);
}

void TestRegisterRejectsInvalidProfile(const Backend& backend) {
  Harness h(backend);
  auto    bad        = Profile();
  bad.blood_pressure = "80/120";
  assert(Throws<util::ValidationError>([&] { h.manager->Register(bad); }));
  assert(h.manager->CountByStatus().empty());
}

void TestDuplicateIdExhaustsRetries(const Backend& backend) {
  core::VisitManagerOptions options;
  std::atomic<int>          calls{0};
  options.id_generator = [&calls](util::TimePoint) {
    ++calls;
    return util::VisitId{"V20261019_ABCDEF", "P-ABCDEF"};
  };
  Harness h(backend, options);

  h.manager->Register(Profile());
  assert(Throws<util::DuplicateVisitError>([&] { h.manager->Register(Profile()); }));
  assert(calls.load() == 6);
}

void TestDuplicateIdRetriesWithFreshId(const Backend& backend) {
  core::VisitManagerOptions options;
  std::atomic<int>          calls{0};
  options.id_generator = [&calls](util::TimePoint) {
    const int call = ++calls;
    return call <= 2 ? util::VisitId{"V20261019_ABCDEF", "P-ABCDEF"} : util::VisitId{"V20261019_ABCDE1", "P-ABCDE1"};
  };
  Harness h(backend, options);

  assert(h.manager->Register(Profile()).visit_id == "V20261019_ABCDEF");
  const auto second = h.manager->Register(Profile());
  assert(second.visit_id == "V20261019_ABCDE1");
  assert(second.patient_id == "P-ABCDE1");
  assert(calls.load() == 3);
  assert(h.manager->GetVisit("V20261019_ABCDE1").status == VISIT_STATUS_REGISTERED);
  assert(h.manager->CountByStatus().at(VISIT_STATUS_REGISTERED) == 2);
}

void TestUploadValidation(const Backend& backend) {
  Harness    h(backend);
  const auto id = h.manager->Register(Profile()).visit_id;

  assert(Throws<util::NotFoundError>([&] { h.manager->AppendSamples("V20261019_000000", Samples(0, 4)); }));
  assert(Throws<util::ValidationError>([&] { h.manager->AppendSamples(id, {}); }));

  auto outcome = h.manager->AppendSamples(id, Samples(0, 10));
  assert(outcome.accepted == 10);
  assert(outcome.total == 10);
  assert(outcome.status == VISIT_STATUS_COLLECTING);

  // Index 9 was already received.
  assert(Throws<util::ValidationError>([&] { h.manager->AppendSamples(id, Samples(9, 3)); }));
  // Out of order inside one batch.
  assert(Throws<util::ValidationError>([&] { h.manager->AppendSamples(id, {{20, 1.0}, {15, 1.0}}); }));
  assert(Throws<util::ValidationError>([&] { h.manager->AppendSamples(id, {{20, std::nan("")}}); }));
  assert(h.manager->GetVisit(id).sample_count == 10);

  // Gaps are allowed as long as indices increase.
  outcome = h.manager->AppendSamples(id, Samples(100, 5));
  assert(outcome.total == 15);
  assert(h.manager->GetVisit(id).last_sample_index.value() == 104);
}

void TestSampleIndexRange(const Backend& backend) {
  Harness    h(backend);
  const auto id = h.manager->Register(Profile()).visit_id;

  assert(Throws<util::ValidationError>([&] { h.manager->AppendSamples(id, {{model::kMaxSampleIndex + 1, 150.0}}); }));
  assert(Throws<util::ValidationError>([&] { h.manager->AppendSamples(id, {{0, 150.0}, {UINT64_MAX, 150.0}}); }));
  assert(h.manager->GetVisit(id).sample_count == 0);

  const auto outcome = h.manager->AppendSamples(id, {{0, 150.0}, {model::kMaxSampleIndex, 151.0}});
  assert(outcome.total == 2);
  assert(h.manager->GetVisit(id).last_sample_index.value() == model::kMaxSampleIndex);
}

void TestSampleCap(const Backend& backend) {
  core::VisitManagerOptions options;
  options.max_samples_per_visit = 20;
  Harness    h(backend, options);
  const auto id = h.manager->Register(Profile()).visit_id;

  h.manager->AppendSamples(id, Samples(0, 15));
  assert(Throws<util::ResourceExhaustedError>([&] { h.manager->AppendSamples(id, Samples(15, 6)); }));
  assert(h.manager->GetVisit(id).sample_count == 15);
  h.manager->AppendSamples(id, Samples(15, 5));
  assert(h.manager->GetVisit(id).sample_count == 20);
}

void TestEndScanRunsPipelineToDone(const Backend& backend) {
  Harness    h(backend);
  const auto id = h.manager->Register(Profile()).visit_id;
  h.manager->AppendSamples(id, Samples(0, 300));

  assert(h.manager->EndScan(id));
  assert(!h.manager->EndScan(id));
  assert(h.scheduler->Pending() == 1);

  const auto processing = h.manager->GetVisit(id);
  assert(processing.status == VISIT_STATUS_PROCESSING);
  assert(processing.trigger == PROCESSING_TRIGGER_END_OF_SCAN);
  assert(!processing.result.has_value());
  assert(Throws<util::InvalidStateError>([&] { h.manager->AppendSamples(id, Samples(300, 1)); }));

  assert(h.Drain() == 1);

  const auto done = h.manager->GetVisit(id);
  assert(done.status == VISIT_STATUS_DONE);
  assert(done.result.has_value());
  assert(done.result->model_version == "placeholder-1");
  assert(done.result->glucose_mg_dl == std::round(done.result->glucose_mg_dl * 100.0) / 100.0);
  assert(done.result->classification != CLASSIFICATION_UNSPECIFIED);

  const auto features = h.manager->GetFeatures(id);
  assert(model::FeatureNames(features) == h.glucose_pipeline->Extractor().FeatureNames());

  assert(!h.manager->EndScan(id));
  assert(Throws<util::InvalidStateError>([&] { h.manager->AppendSamples(id, Samples(300, 1)); }));
  assert(h.manager->CountByStatus().at(VISIT_STATUS_DONE) == 1);
}

void TestConcurrentTriggersRunPipelineOnce(const Backend& backend) {
  Harness    h(backend);
  const auto id = h.manager->Register(Profile()).visit_id;
  h.manager->AppendSamples(id, Samples(0, 200));

  std::atomic<int>         triggered{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      if (h.manager->EndScan(id)) ++triggered;
    });
  }
  for (auto& t : threads) t.join();
  assert(triggered.load() == 1);
  assert(h.scheduler->Pending() == 1);

  // The same task delivered to several workers completes once.
  auto task = h.scheduler->Dequeue();
  assert(task.has_value());
  threads.clear();
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&] { h.manager->ExecutePipeline(*task); });
  }
  for (auto& t : threads) t.join();

  const auto visit = h.manager->GetVisit(id);
  assert(visit.status == VISIT_STATUS_DONE);
  assert(visit.failure_reason.empty());
}

void TestShortSeriesFails(const Backend& backend) {
  Harness    h(backend);
  const auto id = h.manager->Register(Profile()).visit_id;
  h.manager->AppendSamples(id, Samples(0, 5));
  assert(h.manager->EndScan(id));
  h.Drain();

  const auto visit = h.manager->GetVisit(id);
  assert(visit.status == VISIT_STATUS_FAILED);
  assert(visit.failure_reason.rfind("InsufficientSamplesError:", 0) == 0);
  assert(!visit.result.has_value());

  // FAILED is terminal for uploads too.
  assert(Throws<util::InvalidStateError>([&] { h.manager->AppendSamples(id, Samples(5, 10)); }));
  assert(!h.manager->EndScan(id));
  const auto after = h.manager->GetVisit(id);
  assert(after.status == VISIT_STATUS_FAILED);
  assert(after.sample_count == 5);
}

void TestEndScanWithoutSamplesFails(const Backend& backend) {
  Harness    h(backend);
  const auto id = h.manager->Register(Profile()).visit_id;
  assert(h.manager->EndScan(id));
  h.Drain();
  assert(h.manager->GetVisit(id).status == VISIT_STATUS_FAILED);
}

void TestMissingModelFails(const Backend& backend) {
  Harness    h(backend, {}, false);
  const auto id = h.manager->Register(Profile()).visit_id;
  h.manager->AppendSamples(id, Samples(0, 64));
  h.manager->EndScan(id);
  h.Drain();

  const auto visit = h.manager->GetVisit(id);
  assert(visit.status == VISIT_STATUS_FAILED);
  assert(visit.failure_reason.rfind("ModelUnavailableError:", 0) == 0);
}

void TestCollectionTimeoutTriggersProcessing(const Backend& backend) {
  core::VisitManagerOptions options;
  options.collection_window = std::chrono::milliseconds(2000);
  Harness    h(backend, options);
  const auto id   = h.manager->Register(Profile()).visit_id;
  const auto idle = h.manager->Register(Profile()).visit_id;
  h.manager->AppendSamples(id, Samples(0, 64));

  assert(h.manager->ExpireCollections(util::Now()) == 0);
  assert(h.manager->ExpireCollections(util::Now() + std::chrono::seconds(5)) == 1);

  const auto visit = h.manager->GetVisit(id);
  assert(visit.status == VISIT_STATUS_PROCESSING);
  assert(visit.trigger == PROCESSING_TRIGGER_COLLECTION_TIMEOUT);
  // A visit with no samples is not collecting.
  assert(h.manager->GetVisit(idle).status == VISIT_STATUS_REGISTERED);

  h.Drain();
  assert(h.manager->GetVisit(id).status == VISIT_STATUS_DONE);
}

void TestProcessingTimeoutFailsVisit(const Backend& backend) {
  core::VisitManagerOptions options;
  options.max_processing = std::chrono::milliseconds(2000);
  Harness    h(backend, options);
  const auto id = h.manager->Register(Profile()).visit_id;
  h.manager->AppendSamples(id, Samples(0, 64));
  h.manager->EndScan(id);

  assert(h.manager->FailOverdueProcessing(util::Now()) == 0);
  assert(h.manager->FailOverdueProcessing(util::Now() + std::chrono::seconds(5)) == 1);

  auto visit = h.manager->GetVisit(id);
  assert(visit.status == VISIT_STATUS_FAILED);
  assert(visit.failure_reason == "ProcessingTimeoutError: processing exceeded 2000 ms");

  // The queued task arrives late and must not resurrect the visit.
  h.Drain();
  visit = h.manager->GetVisit(id);
  assert(visit.status == VISIT_STATUS_FAILED);
  assert(!visit.result.has_value());
}

void TestSignalQualityGate(const Backend& backend) {
  core::VisitManagerOptions options;
  options.signal_quality.enabled = true;
  Harness    h(backend, options);
  const auto id = h.manager->Register(Profile()).visit_id;

  std::vector<model::RawSample> saturated;
  for (uint64_t i = 0; i < 16; ++i) saturated.push_back({i, 1000.0 + static_cast<double>(i % 3)});
  assert(Throws<util::ValidationError>([&] { h.manager->AppendSamples(id, saturated); }));

  std::vector<model::RawSample> dark;
  for (uint64_t i = 0; i < 16; ++i) dark.push_back({i, 1.0 + 0.5 * static_cast<double>(i % 2)});
  assert(Throws<util::ValidationError>([&] { h.manager->AppendSamples(id, dark); }));

  const auto visit = h.manager->GetVisit(id);
  assert(visit.status == VISIT_STATUS_REGISTERED);
  assert(visit.sample_count == 0);

  const auto scans = h.manager->ListInvalidScans(id, 0);
  assert(scans.size() == 2);
  // Newest first.
  assert(scans[0].reason == "SENSOR_ERROR");
  assert(scans[1].reason == "NO_FINGER_DETECTED");
  assert(scans[1].value > 1000.0);
  assert(h.manager->ListInvalidScans(std::nullopt, 1).size() == 1);

  // A plausible batch passes.
  h.manager->AppendSamples(id, Samples(0, 16));
  assert(h.manager->GetVisit(id).status == VISIT_STATUS_COLLECTING);
}

void TestRecoveryRequeuesProcessingVisits(const Backend& backend) {
  auto repository = backend.make_repository();

  std::string id;
  std::string done_id;
  {
    Harness first(repository);
    done_id = first.manager->Register(Profile()).visit_id;
    first.manager->AppendSamples(done_id, Samples(0, 64));
    first.manager->EndScan(done_id);
    first.Drain();

    id = first.manager->Register(Profile()).visit_id;
    first.manager->AppendSamples(id, Samples(0, 64));
    first.manager->EndScan(id);
    // Process stops before the task runs.
  }

  Harness second(repository);
  assert(second.manager->HydrateCaches() == 1);
  assert(second.scheduler->Pending() == 1);

  auto visit = second.manager->GetVisit(id);
  assert(visit.status == VISIT_STATUS_PROCESSING);
  assert(visit.trigger == PROCESSING_TRIGGER_RECOVERY);

  second.Drain();
  assert(second.manager->GetVisit(id).status == VISIT_STATUS_DONE);

  const auto done = second.manager->GetVisit(done_id);
  assert(done.status == VISIT_STATUS_DONE);
  assert(done.result.has_value());
  assert(second.manager->CountByStatus().at(VISIT_STATUS_DONE) == 2);
}

void TestUnknownVisit(const Backend& backend) {
  Harness h(backend);
  assert(Throws<util::NotFoundError>([&] { h.manager->GetVisit("V20261019_FFFFFF"); }));
  assert(Throws<util::NotFoundError>([&] { h.manager->EndScan("V20261019_FFFFFF"); }));
  assert(Throws<util::NotFoundError>([&] { h.manager->GetFeatures("V20261019_FFFFFF"); }));
}

void TestUnknownIdsLeaveNoLockEntries(const Backend& backend) {
  Harness    h(backend);
  const auto id = h.manager->Register(Profile()).visit_id;
  h.manager->AppendSamples(id, Samples(0, 4));
  const auto tracked = h.manager->TrackedVisitLocks();
  assert(tracked == 1);

  for (int i = 0; i < 500; ++i) {
    const auto unknown = "V20261019_" + std::to_string(100000 + i);
    if (unknown == id) continue;
    assert(Throws<util::NotFoundError>([&] { h.manager->GetVisit(unknown); }));
    assert(Throws<util::NotFoundError>([&] { h.manager->EndScan(unknown); }));
    assert(Throws<util::NotFoundError>([&] { h.manager->AppendSamples(unknown, Samples(0, 1)); }));
    assert(Throws<util::NotFoundError>([&] { h.manager->GetFeatures(unknown); }));
    assert(Throws<util::NotFoundError>([&] { h.manager->ReportInvalidScan(unknown, "SENSOR_ERROR", 0.0); }));
    h.manager->ExecutePipeline({unknown, PROCESSING_TRIGGER_END_OF_SCAN, util::Now()});
  }
  assert(h.manager->TrackedVisitLocks() == tracked);
  assert(h.manager->ListInvalidScans(std::nullopt, 0).empty());
}

void TestReportInvalidScanKeepsStatus(const Backend& backend) {
  Harness    h(backend);
  const auto id = h.manager->Register(Profile()).visit_id;
  h.manager->AppendSamples(id, Samples(0, 8));

  const auto record = h.manager->ReportInvalidScan(id, "SENSOR_ERROR", 2.5);
  assert(record.visit_id == id);
  assert(record.reason == "SENSOR_ERROR");
  assert(record.value == 2.5);
  assert(record.recorded_at_ms > 0);
  assert(h.manager->ReportInvalidScan(id, "  ", 0.0).reason == "Unknown error");
  assert(Throws<util::ValidationError>([&] { h.manager->ReportInvalidScan(id, "x", std::nan("")); }));

  const auto scans = h.manager->ListInvalidScans(id, 0);
  assert(scans.size() == 2);
  assert(scans[0].reason == "Unknown error");
  assert(scans[1].id == record.id);

  const auto visit = h.manager->GetVisit(id);
  assert(visit.status == VISIT_STATUS_COLLECTING);
  assert(visit.sample_count == 8);
}

void RunBackendSuite(const Backend& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  TestRegisterCreatesRegisteredVisit(backend);
  TestRegisterRejectsInvalidProfile(backend);
  TestDuplicateIdExhaustsRetries(backend);
  TestDuplicateIdRetriesWithFreshId(backend);
  TestUploadValidation(backend);
  TestSampleIndexRange(backend);
  TestSampleCap(backend);
  TestEndScanRunsPipelineToDone(backend);
  TestConcurrentTriggersRunPipelineOnce(backend);
  TestShortSeriesFails(backend);
  TestEndScanWithoutSamplesFails(backend);
  TestMissingModelFails(backend);
  TestCollectionTimeoutTriggersProcessing(backend);
  TestProcessingTimeoutFailsVisit(backend);
  TestSignalQualityGate(backend);
  TestRecoveryRequeuesProcessingVisits(backend);
  TestUnknownVisit(backend);
  TestUnknownIdsLeaveNoLockEntries(backend);
  TestReportInvalidScanKeepsStatus(backend);
}

} // namespace

int main() {
  std::vector<std::string> sqlite_files;

  RunBackendSuite(MemoryBackend());
  RunBackendSuite(SqliteBackend(sqlite_files));

  for (const auto& path : sqlite_files) {
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
  }

  std::cout << "glucolumin_unit_visit_manager: pass\n";
  return 0;
}
