#include "visit_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/pipeline/glucose_pipeline.hpp"
#include "internal/pipeline/pipeline_scheduler.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace glucolumin::core {

using namespace glucolumin::v1;
using observability::IntField;
using observability::StringField;

namespace {

constexpr int kMaxIdAttempts = 5;

// Persisted timestamps have millisecond resolution; keep the cache identical.
util::TimePoint NowMillis() {
  return util::FromUnixMillis(util::ToUnixMillis(util::Now()));
}

uint64_t OptionalMillis(const std::optional<util::TimePoint>& tp) {
  return tp ? util::ToUnixMillis(*tp) : 0;
}

std::optional<util::TimePoint> MillisOrNull(uint64_t ms) {
  if (ms == 0) return std::nullopt;
  return util::FromUnixMillis(ms);
}

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFoundError(message);
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::Conflict:
      throw util::InvalidStateError(message);
    case db::ErrorCode::ConstraintViolation:
      throw util::ValidationError(message);
    default:
      throw std::runtime_error(message + " (" + db::ErrorCodeName(result.code) + ")");
  }
}

db::model::VisitRecord ToRecord(const model::Visit& visit) {
  db::model::VisitRecord r;
  r.visit_id                 = visit.visit_id;
  r.patient_id               = visit.patient_id;
  r.patient_name             = visit.patient.name;
  r.age                      = visit.patient.age;
  r.sex                      = visit.patient.sex;
  r.height_cm                = visit.patient.height_cm;
  r.weight_kg                = visit.patient.weight_kg;
  r.bmi                      = visit.bmi;
  r.skin_tone                = visit.patient.skin_tone;
  r.blood_pressure           = visit.patient.blood_pressure;
  r.had_food                 = visit.patient.had_food;
  r.family_history           = visit.patient.family_diabetic_history;
  r.status                   = visit.status;
  r.trigger                  = visit.trigger;
  r.created_at_ms            = util::ToUnixMillis(visit.created_at);
  r.updated_at_ms            = util::ToUnixMillis(visit.updated_at);
  r.last_sample_at_ms        = OptionalMillis(visit.last_sample_at);
  r.processing_started_at_ms = OptionalMillis(visit.processing_started_at);
  r.sample_count             = visit.sample_count;
  r.last_sample_index        = visit.last_sample_index ? static_cast<int64_t>(*visit.last_sample_index) : -1;
  r.failure_reason           = visit.failure_reason;
  return r;
}

model::Visit ToVisit(const db::model::VisitRecord& r, const std::optional<db::model::ResultRecord>& result) {
  model::Visit visit;
  visit.visit_id                        = r.visit_id;
  visit.patient_id                      = r.patient_id;
  visit.patient.name                    = r.patient_name;
  visit.patient.age                     = r.age;
  visit.patient.sex                     = r.sex;
  visit.patient.height_cm               = r.height_cm;
  visit.patient.weight_kg               = r.weight_kg;
  visit.patient.skin_tone               = r.skin_tone;
  visit.patient.blood_pressure          = r.blood_pressure;
  visit.patient.had_food                = r.had_food;
  visit.patient.family_diabetic_history = r.family_history;
  visit.bmi                             = r.bmi;
  visit.status                          = r.status;
  visit.trigger                         = r.trigger;
  visit.created_at                      = util::FromUnixMillis(r.created_at_ms);
  visit.updated_at                      = util::FromUnixMillis(r.updated_at_ms);
  visit.last_sample_at                  = MillisOrNull(r.last_sample_at_ms);
  visit.processing_started_at           = MillisOrNull(r.processing_started_at_ms);
  visit.sample_count                    = r.sample_count;
  if (r.last_sample_index >= 0) {
    visit.last_sample_index = static_cast<uint64_t>(r.last_sample_index);
  }
  visit.failure_reason = r.failure_reason;

  if (result) {
    model::PredictionResult prediction;
    prediction.glucose_mg_dl  = result->glucose_mg_dl;
    prediction.classification = result->classification;
    prediction.label          = result->label;
    prediction.advice         = result->advice;
    prediction.computed_at    = util::FromUnixMillis(result->computed_at_ms);
    prediction.model_version  = result->model_version;
    visit.result              = prediction;
  }
  return visit;
}

// UpdateVisit with the version bumped from the stored row.
void WriteVisit(db::Repository& repository, db::Transaction& tx, const model::Visit& visit, const std::string& context) {
  auto record = ToRecord(visit);
  auto stored = repository.GetVisit(tx, visit.visit_id);
  if (!stored) throw util::NotFoundError(context + ": visit " + visit.visit_id + " not found");
  record.version = stored->version + 1;
  ThrowIfDbError(repository.UpdateVisit(tx, record), context);
}

} // namespace

VisitManager::VisitManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<pipeline::GlucosePipeline> pipeline,
                           std::shared_ptr<pipeline::PipelineScheduler> scheduler, VisitManagerOptions options)
    : repository_(std::move(repository)), pipeline_(std::move(pipeline)), scheduler_(std::move(scheduler)), options_(std::move(options)) {
  if (!options_.id_generator) {
    options_.id_generator = util::GenerateVisitId;
  }
}

std::shared_ptr<std::shared_mutex> VisitManager::VisitMutex(const std::string& visit_id) const {
  {
    std::lock_guard<std::mutex> lock(visit_mutexes_guard_);
    auto                        it = visit_mutexes_.find(visit_id);
    if (it != visit_mutexes_.end()) {
      return it->second;
    }
  }

  // Only visits that exist get a lock entry.
  if (!LoadVisit(visit_id)) {
    throw util::NotFoundError("visit " + visit_id + " not found");
  }
  return CreateVisitMutex(visit_id);
}

std::shared_ptr<std::shared_mutex> VisitManager::CreateVisitMutex(const std::string& visit_id) const {
  std::lock_guard<std::mutex> lock(visit_mutexes_guard_);
  auto&                       visit_mutex = visit_mutexes_[visit_id];
  if (!visit_mutex) {
    visit_mutex = std::make_shared<std::shared_mutex>();
  }
  return visit_mutex;
}

std::size_t VisitManager::TrackedVisitLocks() const {
  std::lock_guard<std::mutex> lock(visit_mutexes_guard_);
  return visit_mutexes_.size();
}

void VisitManager::CacheVisit(const model::Visit& visit) const {
  std::unique_lock lock(cache_mutex_);
  cache_[visit.visit_id] = visit;
}

std::optional<model::Visit> VisitManager::LoadVisit(const std::string& visit_id) const {
  {
    std::shared_lock lock(cache_mutex_);
    auto             it = cache_.find(visit_id);
    if (it != cache_.end()) {
      return it->second;
    }
  }

  auto tx     = repository_->BeginReadOnly();
  auto record = repository_->GetVisit(*tx, visit_id);
  if (!record) {
    return std::nullopt;
  }
  auto result = repository_->GetResult(*tx, visit_id);
  tx->Commit();

  auto visit = ToVisit(*record, result);
  CacheVisit(visit);
  return visit;
}

model::Visit VisitManager::RequireVisit(const std::string& visit_id) const {
  auto visit = LoadVisit(visit_id);
  if (!visit) {
    throw util::NotFoundError("visit " + visit_id + " not found");
  }
  return *visit;
}

// ---------------------------------------------------------------------
// Registration / collection
// ---------------------------------------------------------------------

model::Visit VisitManager::Register(const model::PatientProfile& profile) {
  model::ValidateProfile(profile);

  model::Visit visit;
  visit.patient           = profile;
  visit.patient.sex       = model::CanonicalSex(profile.sex);
  visit.patient.skin_tone = model::CanonicalSkinTone(profile.skin_tone);
  visit.bmi               = model::BodyMassIndex(profile.height_cm, profile.weight_kg);
  visit.status            = VISIT_STATUS_REGISTERED;
  visit.created_at        = NowMillis();
  visit.updated_at        = visit.created_at;

  for (int attempt = 1; attempt <= kMaxIdAttempts; ++attempt) {
    const auto id    = options_.id_generator(visit.created_at);
    visit.visit_id   = id.visit_id;
    visit.patient_id = id.patient_id;

    std::unique_lock<std::shared_mutex> visit_lock(*CreateVisitMutex(visit.visit_id));
    auto                                tx  = repository_->Begin();
    auto                                res = repository_->InsertVisit(*tx, ToRecord(visit));
    if (res.code == db::ErrorCode::AlreadyExists) {
      GLUCOLUMIN_LOG_WARN("visit id collision", {StringField("visit_id", visit.visit_id), IntField("attempt", attempt)});
      continue;
    }
    ThrowIfDbError(res, "register visit");
    tx->Commit();

    CacheVisit(visit);
    GLUCOLUMIN_LOG_INFO("visit registered", {StringField("visit_id", visit.visit_id), StringField("patient_id", visit.patient_id),
                                             observability::DoubleField("bmi", visit.bmi)});
    return visit;
  }

  throw util::DuplicateVisitError("could not allocate a unique visit id after " + std::to_string(kMaxIdAttempts) + " attempts");
}

AppendOutcome VisitManager::AppendSamples(const std::string& visit_id, const std::vector<model::RawSample>& samples) {
  if (samples.empty()) {
    throw util::ValidationError("upload for " + visit_id + " contains no samples");
  }

  std::unique_lock<std::shared_mutex> visit_lock(*VisitMutex(visit_id));
  auto                                visit = RequireVisit(visit_id);

  if (!model::AcceptsSamples(visit.status)) {
    throw util::InvalidStateError("visit " + visit_id + " is " + std::string(model::StatusLabel(visit.status)) + " and no longer accepts samples");
  }

  std::optional<uint64_t> previous = visit.last_sample_index;
  std::vector<double>     values;
  values.reserve(samples.size());
  for (const auto& sample : samples) {
    if (sample.sample_index > model::kMaxSampleIndex) {
      throw util::ValidationError("sample index " + std::to_string(sample.sample_index) + " is out of range");
    }
    if (previous && sample.sample_index <= *previous) {
      throw util::ValidationError("sample index " + std::to_string(sample.sample_index) + " does not follow " + std::to_string(*previous));
    }
    if (!std::isfinite(sample.value)) {
      throw util::ValidationError("sample " + std::to_string(sample.sample_index) + " is not a finite number");
    }
    previous = sample.sample_index;
    values.push_back(sample.value);
  }

  if (visit.sample_count + samples.size() > options_.max_samples_per_visit) {
    throw util::ResourceExhaustedError("visit " + visit_id + " would exceed " + std::to_string(options_.max_samples_per_visit) + " samples");
  }

  const auto now = NowMillis();

  if (auto issue = EvaluateSignalQuality(values, options_.signal_quality)) {
    RecordInvalidScan(visit_id, issue->reason, issue->value, now);
    throw util::ValidationError("signal quality check failed: " + issue->reason);
  }

  std::vector<db::model::RawSampleRecord> records;
  records.reserve(samples.size());
  for (const auto& sample : samples) {
    records.push_back({sample.sample_index, sample.value});
  }

  const auto previous_status = visit.status;
  visit.status               = VISIT_STATUS_COLLECTING;
  visit.sample_count += samples.size();
  visit.last_sample_index = samples.back().sample_index;
  visit.last_sample_at    = now;
  visit.updated_at        = now;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->AppendSamples(*tx, visit_id, records), "append samples");
  WriteVisit(*repository_, *tx, visit, "append samples");
  tx->Commit();

  CacheVisit(visit);

  if (previous_status != VISIT_STATUS_COLLECTING) {
    GLUCOLUMIN_LOG_INFO("visit collecting", {StringField("visit_id", visit_id)});
  }
  GLUCOLUMIN_LOG_DEBUG("samples appended", {StringField("visit_id", visit_id), IntField("accepted", static_cast<int64_t>(samples.size())),
                                            IntField("total", static_cast<int64_t>(visit.sample_count))});

  return {samples.size(), visit.sample_count, visit.status};
}

db::model::InvalidScanRecord VisitManager::RecordInvalidScan(const std::string& visit_id, const std::string& reason, double value,
                                                            util::TimePoint now) {
  db::model::InvalidScanRecord record;
  record.visit_id       = visit_id;
  record.reason         = reason;
  record.value          = value;
  record.recorded_at_ms = util::ToUnixMillis(now);

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertInvalidScan(*tx, record), "record invalid scan");
  tx->Commit();

  GLUCOLUMIN_LOG_WARN("invalid scan rejected", {StringField("visit_id", visit_id), StringField("reason", reason),
                                                observability::DoubleField("value", value)});
  return record;
}

db::model::InvalidScanRecord VisitManager::ReportInvalidScan(const std::string& visit_id, const std::string& reason, double value) {
  if (!std::isfinite(value)) {
    throw util::ValidationError("invalid scan value must be finite");
  }
  const bool blank = std::all_of(reason.begin(), reason.end(), [](unsigned char c) { return std::isspace(c) != 0; });

  std::shared_lock<std::shared_mutex> visit_lock(*VisitMutex(visit_id));
  (void)RequireVisit(visit_id);
  return RecordInvalidScan(visit_id, blank ? std::string("Unknown error") : reason, value, NowMillis());
}

// ---------------------------------------------------------------------
// Processing trigger
// ---------------------------------------------------------------------

bool VisitManager::EndScan(const std::string& visit_id, model::ProcessingTrigger trigger) {
  std::unique_lock<std::shared_mutex> visit_lock(*VisitMutex(visit_id));
  auto                                visit = RequireVisit(visit_id);

  if (!model::CanTransition(visit.status, VISIT_STATUS_PROCESSING)) {
    GLUCOLUMIN_LOG_DEBUG("end of scan ignored", {StringField("visit_id", visit_id), StringField("status", model::StatusLabel(visit.status))});
    return false;
  }

  BeginProcessingLocked(std::move(visit), trigger, NowMillis());
  return true;
}

void VisitManager::BeginProcessingLocked(model::Visit visit, model::ProcessingTrigger trigger, util::TimePoint now) {
  visit.status                = VISIT_STATUS_PROCESSING;
  visit.trigger               = trigger;
  visit.processing_started_at = now;
  visit.updated_at            = now;

  auto tx = repository_->Begin();
  WriteVisit(*repository_, *tx, visit, "begin processing");
  tx->Commit();

  CacheVisit(visit);
  GLUCOLUMIN_LOG_INFO("visit processing", {StringField("visit_id", visit.visit_id), StringField("trigger", model::TriggerLabel(trigger)),
                                           IntField("samples", static_cast<int64_t>(visit.sample_count))});

  if (!scheduler_->Enqueue({visit.visit_id, trigger, now})) {
    GLUCOLUMIN_LOG_WARN("pipeline scheduler stopped; visit left for recovery", {StringField("visit_id", visit.visit_id)});
  }
}

void VisitManager::FailLocked(model::Visit visit, const std::string& reason, util::TimePoint now) {
  visit.status         = VISIT_STATUS_FAILED;
  visit.failure_reason = reason;
  visit.updated_at     = now;

  auto tx = repository_->Begin();
  WriteVisit(*repository_, *tx, visit, "fail visit");
  tx->Commit();

  CacheVisit(visit);
  GLUCOLUMIN_LOG_ERROR("visit failed", {StringField("visit_id", visit.visit_id), StringField("reason", reason)});
}

// ---------------------------------------------------------------------
// Pipeline execution
// ---------------------------------------------------------------------

void VisitManager::ExecutePipeline(const pipeline::PipelineTask& task) {
  const auto& visit_id = task.visit_id;

  {
    std::lock_guard lock(running_guard_);
    if (!running_.insert(visit_id).second) {
      GLUCOLUMIN_LOG_DEBUG("pipeline already running", {StringField("visit_id", visit_id)});
      return;
    }
  }
  struct RunningGuard {
    VisitManager*      self;
    const std::string& id;
    ~RunningGuard() {
      std::lock_guard lock(self->running_guard_);
      self->running_.erase(id);
    }
  } running_guard{this, visit_id};

  if (!LoadVisit(visit_id)) {
    GLUCOLUMIN_LOG_WARN("pipeline task for unknown visit", {StringField("visit_id", visit_id)});
    return;
  }

  // Snapshot inputs under a shared lock; compute without any lock.
  model::Visit        snapshot;
  std::vector<double> values;
  std::string         failure;
  {
    std::shared_lock<std::shared_mutex> visit_lock(*VisitMutex(visit_id));
    auto                                visit = LoadVisit(visit_id);
    if (!visit) {
      return;
    }
    if (visit->status != VISIT_STATUS_PROCESSING) {
      GLUCOLUMIN_LOG_DEBUG("pipeline task skipped", {StringField("visit_id", visit_id), StringField("status", model::StatusLabel(visit->status))});
      return;
    }
    snapshot = *visit;

    try {
      auto tx      = repository_->BeginReadOnly();
      auto samples = repository_->ReadSamples(*tx, visit_id);
      tx->Commit();
      values.reserve(samples.size());
      for (const auto& sample : samples) {
        values.push_back(sample.value);
      }
    } catch (const std::exception& e) {
      failure = util::DescribeFailure(e);
    }
  }

  const auto started = snapshot.processing_started_at.value_or(NowMillis());
  const auto elapsed = util::Now() - started;
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::duration_cast<std::chrono::steady_clock::duration>(options_.max_processing - elapsed);

  std::optional<pipeline::PipelineOutput> output;
  if (failure.empty()) {
    try {
      output = pipeline_->Run(values, snapshot.patient, deadline);
    } catch (const std::exception& e) {
      failure = util::DescribeFailure(e);
    }
  }

  std::unique_lock<std::shared_mutex> visit_lock(*VisitMutex(visit_id));
  auto                                current = LoadVisit(visit_id);
  if (!current || current->status != VISIT_STATUS_PROCESSING || current->processing_started_at != snapshot.processing_started_at) {
    GLUCOLUMIN_LOG_WARN("late pipeline completion discarded",
                        {StringField("visit_id", visit_id), StringField("status", current ? model::StatusLabel(current->status) : "UNKNOWN")});
    return;
  }

  const auto now = NowMillis();

  if (output) {
    auto visit = *current;

    model::PredictionResult result;
    result.glucose_mg_dl  = output->glucose_mg_dl;
    result.classification = output->advisory.classification;
    result.label          = output->advisory.label;
    result.advice         = output->advisory.advice;
    result.computed_at    = now;
    result.model_version  = output->model_version;

    visit.status     = VISIT_STATUS_DONE;
    visit.updated_at = now;
    visit.result     = result;

    std::vector<db::model::FeatureRecord> features;
    features.reserve(output->features.size());
    for (std::size_t i = 0; i < output->features.size(); ++i) {
      features.push_back({static_cast<uint32_t>(i), output->features[i].name, output->features[i].value});
    }

    db::model::ResultRecord record;
    record.visit_id       = visit_id;
    record.glucose_mg_dl  = result.glucose_mg_dl;
    record.classification = result.classification;
    record.label          = result.label;
    record.advice         = result.advice;
    record.model_version  = result.model_version;
    record.computed_at_ms = util::ToUnixMillis(now);

    try {
      auto tx = repository_->Begin();
      ThrowIfDbError(repository_->UpsertFeatures(*tx, visit_id, features), "store features");
      ThrowIfDbError(repository_->InsertResult(*tx, record), "store result");
      WriteVisit(*repository_, *tx, visit, "complete visit");
      tx->Commit();
    } catch (const std::exception& e) {
      failure = util::DescribeFailure(e);
    }

    if (failure.empty()) {
      CacheVisit(visit);
      GLUCOLUMIN_LOG_INFO("visit done", {StringField("visit_id", visit_id), observability::DoubleField("glucose_mg_dl", result.glucose_mg_dl),
                                         StringField("classification", result.label), StringField("model_version", result.model_version)});
      return;
    }
  }

  FailLocked(*current, failure, now);
}

// ---------------------------------------------------------------------
// Watchdog
// ---------------------------------------------------------------------

std::size_t VisitManager::ExpireCollections(util::TimePoint now) {
  std::vector<std::string> candidates;
  {
    std::shared_lock lock(cache_mutex_);
    for (const auto& [id, visit] : cache_) {
      if (visit.status == VISIT_STATUS_COLLECTING && visit.last_sample_at && now - *visit.last_sample_at > options_.collection_window) {
        candidates.push_back(id);
      }
    }
  }

  std::size_t moved = 0;
  for (const auto& id : candidates) {
    std::unique_lock<std::shared_mutex> visit_lock(*VisitMutex(id));
    auto                                visit = LoadVisit(id);
    if (!visit || visit->status != VISIT_STATUS_COLLECTING || !visit->last_sample_at ||
        now - *visit->last_sample_at <= options_.collection_window) {
      continue;
    }
    BeginProcessingLocked(std::move(*visit), PROCESSING_TRIGGER_COLLECTION_TIMEOUT, NowMillis());
    ++moved;
  }
  return moved;
}

std::size_t VisitManager::FailOverdueProcessing(util::TimePoint now) {
  std::vector<std::string> candidates;
  {
    std::shared_lock lock(cache_mutex_);
    for (const auto& [id, visit] : cache_) {
      if (visit.status == VISIT_STATUS_PROCESSING && visit.processing_started_at &&
          now - *visit.processing_started_at > options_.max_processing) {
        candidates.push_back(id);
      }
    }
  }

  std::size_t moved = 0;
  for (const auto& id : candidates) {
    std::unique_lock<std::shared_mutex> visit_lock(*VisitMutex(id));
    auto                                visit = LoadVisit(id);
    if (!visit || visit->status != VISIT_STATUS_PROCESSING || !visit->processing_started_at ||
        now - *visit->processing_started_at <= options_.max_processing) {
      continue;
    }
    const util::ProcessingTimeoutError timeout("processing exceeded " + std::to_string(options_.max_processing.count()) + " ms");
    FailLocked(std::move(*visit), util::DescribeFailure(timeout), NowMillis());
    ++moved;
  }
  return moved;
}

// ---------------------------------------------------------------------
// Recovery / queries
// ---------------------------------------------------------------------

std::size_t VisitManager::HydrateCaches() {
  std::vector<model::Visit> visits;
  {
    auto       tx      = repository_->BeginReadOnly();
    const auto records = repository_->ListVisits(*tx);
    visits.reserve(records.size());
    for (const auto& record : records) {
      std::optional<db::model::ResultRecord> result;
      if (record.status == VISIT_STATUS_DONE) {
        result = repository_->GetResult(*tx, record.visit_id);
      }
      visits.push_back(ToVisit(record, result));
    }
    tx->Commit();
  }

  {
    std::unique_lock lock(cache_mutex_);
    cache_.clear();
    for (const auto& visit : visits) {
      cache_[visit.visit_id] = visit;
    }
  }

  std::size_t recovered = 0;
  for (const auto& visit : visits) {
    if (visit.status != VISIT_STATUS_PROCESSING) {
      continue;
    }
    std::unique_lock<std::shared_mutex> visit_lock(*VisitMutex(visit.visit_id));
    auto                                current = LoadVisit(visit.visit_id);
    if (!current || current->status != VISIT_STATUS_PROCESSING) {
      continue;
    }

    const auto now                 = NowMillis();
    current->trigger               = PROCESSING_TRIGGER_RECOVERY;
    current->processing_started_at = now;
    current->updated_at            = now;

    auto tx = repository_->Begin();
    WriteVisit(*repository_, *tx, *current, "recover visit");
    tx->Commit();
    CacheVisit(*current);

    GLUCOLUMIN_LOG_INFO("visit recovered", {StringField("visit_id", current->visit_id)});
    if (scheduler_->Enqueue({current->visit_id, PROCESSING_TRIGGER_RECOVERY, now})) {
      ++recovered;
    }
  }

  GLUCOLUMIN_LOG_INFO("session cache hydrated", {IntField("visits", static_cast<int64_t>(visits.size())),
                                                 IntField("recovered", static_cast<int64_t>(recovered))});
  return recovered;
}

model::Visit VisitManager::GetVisit(const std::string& visit_id) const {
  std::shared_lock<std::shared_mutex> visit_lock(*VisitMutex(visit_id));
  return RequireVisit(visit_id);
}

model::FeatureVector VisitManager::GetFeatures(const std::string& visit_id) const {
  std::shared_lock<std::shared_mutex> visit_lock(*VisitMutex(visit_id));
  (void)RequireVisit(visit_id);

  auto tx      = repository_->BeginReadOnly();
  auto records = repository_->GetFeatures(*tx, visit_id);
  tx->Commit();

  model::FeatureVector features;
  features.reserve(records.size());
  for (const auto& record : records) {
    features.push_back({record.name, record.value});
  }
  return features;
}

std::map<model::VisitStatus, uint64_t> VisitManager::CountByStatus() const {
  std::map<model::VisitStatus, uint64_t> counts;
  std::shared_lock                       lock(cache_mutex_);
  for (const auto& [_, visit] : cache_) {
    ++counts[visit.status];
  }
  return counts;
}

std::vector<db::model::InvalidScanRecord> VisitManager::ListInvalidScans(const std::optional<std::string>& visit_id, std::size_t limit) const {
  auto tx    = repository_->BeginReadOnly();
  auto scans = repository_->ListInvalidScans(*tx, visit_id, limit);
  tx->Commit();
  return scans;
}

} // namespace glucolumin::core
