#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace glucolumin::db::memory {

namespace {

Result ReadOnlyViolation() {
  return Result::Err(ErrorCode::ReadOnly, "write attempted in a read-only transaction");
}

} // namespace

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, false);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginReadOnly() {
  return std::make_unique<MemoryTransaction>(*this, true);
}

MemoryRepository::EntryPtr MemoryRepository::CommittedEntry(const std::string& visit_id) const {
  std::shared_lock lock(state_mutex_);
  auto             it = visits_.find(visit_id);
  return it == visits_.end() ? nullptr : it->second;
}

std::shared_ptr<std::mutex> MemoryRepository::AcquireWriteLock(const std::string& visit_id) {
  std::scoped_lock lock(write_locks_guard_);
  auto&            mutex = write_locks_[visit_id];
  if (!mutex) mutex = std::make_shared<std::mutex>();
  return mutex;
}

void MemoryRepository::ReleaseWriteLock(const std::string& visit_id, std::shared_ptr<std::mutex> lock) {
  std::scoped_lock guard(write_locks_guard_);
  lock.reset();
  // copies are only made under the guard, so use_count is exact here
  auto it = write_locks_.find(visit_id);
  if (it != write_locks_.end() && it->second.use_count() == 1) {
    write_locks_.erase(it);
  }
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertVisit(Transaction& t, const model::VisitRecord& r) {
  auto& tx = TX(t);
  if (tx.IsReadOnly()) return ReadOnlyViolation();
  auto* entry = tx.Create(r.visit_id);
  if (!entry) return Result::Err(ErrorCode::AlreadyExists, "visit " + r.visit_id + " exists");
  entry->visit = r;
  return Result::Ok();
}

std::optional<model::VisitRecord> MemoryRepository::GetVisit(Transaction& t, const std::string& visit_id) {
  const auto* entry = TX(t).Read(visit_id);
  if (!entry) return std::nullopt;
  return entry->visit;
}

std::vector<model::VisitRecord> MemoryRepository::ListVisits(Transaction& t) {
  auto& tx = TX(t);

  std::map<std::string, EntryPtr> entries;
  {
    std::shared_lock lock(state_mutex_);
    entries = visits_;
  }

  std::vector<model::VisitRecord> records;
  records.reserve(entries.size());
  for (const auto& [visit_id, entry] : entries) {
    // own writes and pinned entries win over the committed map
    const auto* current = tx.IsReadOnly() || tx.Staged().contains(visit_id) ? tx.Read(visit_id) : entry.get();
    if (current) records.push_back(current->visit);
  }
  if (!tx.IsReadOnly()) {
    for (const auto& [visit_id, entry] : tx.Staged()) {
      if (entry && !entries.contains(visit_id)) records.push_back(entry->visit);
    }
    std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.visit_id < b.visit_id; });
  }
  return records;
}

Result MemoryRepository::UpdateVisit(Transaction& t, const model::VisitRecord& r) {
  auto& tx = TX(t);
  if (tx.IsReadOnly()) return ReadOnlyViolation();
  auto* entry = tx.Write(r.visit_id);
  if (!entry) return Result::Err(ErrorCode::NotFound, "visit " + r.visit_id);
  entry->visit = r;
  return Result::Ok();
}

Result MemoryRepository::AppendSamples(Transaction& t, const std::string& visit_id, const std::vector<model::RawSampleRecord>& samples) {
  auto& tx = TX(t);
  if (tx.IsReadOnly()) return ReadOnlyViolation();
  auto* entry = tx.Write(visit_id);
  if (!entry) return Result::Err(ErrorCode::NotFound, "visit " + visit_id);

  auto next = std::make_shared<std::vector<model::RawSampleRecord>>();
  if (entry->samples) {
    next->reserve(entry->samples->size() + samples.size());
    *next = *entry->samples;
  }

  for (const auto& sample : samples) {
    if (!next->empty() && sample.sample_index <= next->back().sample_index) {
      return Result::Err(ErrorCode::ConstraintViolation, "sample index " + std::to_string(sample.sample_index) + " does not increase");
    }
    next->push_back(sample);
  }

  entry->samples = std::move(next);
  return Result::Ok();
}

std::vector<model::RawSampleRecord> MemoryRepository::ReadSamples(Transaction& t, const std::string& visit_id) {
  const auto* entry = TX(t).Read(visit_id);
  if (!entry || !entry->samples) return {};
  return *entry->samples;
}

Result MemoryRepository::UpsertFeatures(Transaction& t, const std::string& visit_id, const std::vector<model::FeatureRecord>& features) {
  auto& tx = TX(t);
  if (tx.IsReadOnly()) return ReadOnlyViolation();
  auto* entry = tx.Write(visit_id);
  if (!entry) return Result::Err(ErrorCode::NotFound, "visit " + visit_id);
  entry->features = features;
  return Result::Ok();
}

std::vector<model::FeatureRecord> MemoryRepository::GetFeatures(Transaction& t, const std::string& visit_id) {
  const auto* entry = TX(t).Read(visit_id);
  if (!entry) return {};
  auto out = entry->features;
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.position < b.position; });
  return out;
}

Result MemoryRepository::InsertResult(Transaction& t, const model::ResultRecord& r) {
  auto& tx = TX(t);
  if (tx.IsReadOnly()) return ReadOnlyViolation();
  auto* entry = tx.Write(r.visit_id);
  if (!entry) return Result::Err(ErrorCode::NotFound, "visit " + r.visit_id);
  if (entry->result) return Result::Err(ErrorCode::AlreadyExists, "result for " + r.visit_id + " exists");
  entry->result = r;
  return Result::Ok();
}

std::optional<model::ResultRecord> MemoryRepository::GetResult(Transaction& t, const std::string& visit_id) {
  const auto* entry = TX(t).Read(visit_id);
  if (!entry) return std::nullopt;
  return entry->result;
}

Result MemoryRepository::InsertInvalidScan(Transaction& t, model::InvalidScanRecord& r) {
  auto& tx = TX(t);
  if (tx.IsReadOnly()) return ReadOnlyViolation();
  r.id = next_invalid_scan_id_++;
  tx.StageInvalidScan(r);
  return Result::Ok();
}

std::vector<model::InvalidScanRecord> MemoryRepository::ListInvalidScans(Transaction& t, const std::optional<std::string>& visit_id,
                                                                         std::size_t limit) {
  auto&      tx      = TX(t);
  const auto matches = [&](const model::InvalidScanRecord& r) { return !visit_id || r.visit_id == *visit_id; };

  // newest first by id, own staged records included
  std::map<uint64_t, model::InvalidScanRecord> candidates;
  for (const auto& r : tx.StagedInvalidScans()) {
    if (matches(r)) candidates.emplace(r.id, r);
  }
  {
    std::shared_lock lock(state_mutex_);
    std::size_t      taken = 0;
    for (auto it = invalid_scans_.rbegin(); it != invalid_scans_.rend(); ++it) {
      if (!matches(it->second)) continue;
      candidates.emplace(it->first, it->second);
      if (limit != 0 && ++taken >= limit) break;
    }
  }

  std::vector<model::InvalidScanRecord> out;
  for (auto it = candidates.rbegin(); it != candidates.rend(); ++it) {
    out.push_back(it->second);
    if (limit != 0 && out.size() >= limit) break;
  }
  return out;
}

} // namespace glucolumin::db::memory
