#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace glucolumin::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository() = default;

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginReadOnly() override;
  std::string BackendName() const override { return "memory"; }

  Result InsertVisit(Transaction&, const model::VisitRecord&) override;
  std::optional<model::VisitRecord> GetVisit(Transaction&, const std::string&) override;
  std::vector<model::VisitRecord> ListVisits(Transaction&) override;
  Result UpdateVisit(Transaction&, const model::VisitRecord&) override;

  Result AppendSamples(Transaction&, const std::string& visit_id,
                       const std::vector<model::RawSampleRecord>& samples) override;
  std::vector<model::RawSampleRecord> ReadSamples(Transaction&, const std::string& visit_id) override;

  Result UpsertFeatures(Transaction&, const std::string& visit_id,
                        const std::vector<model::FeatureRecord>& features) override;
  std::vector<model::FeatureRecord> GetFeatures(Transaction&, const std::string& visit_id) override;

  Result InsertResult(Transaction&, const model::ResultRecord&) override;
  std::optional<model::ResultRecord> GetResult(Transaction&, const std::string& visit_id) override;

  Result InsertInvalidScan(Transaction&, model::InvalidScanRecord&) override;
  std::vector<model::InvalidScanRecord> ListInvalidScans(
      Transaction&, const std::optional<std::string>& visit_id, std::size_t limit) override;

private:
  friend class MemoryTransaction;

  using SampleSeries = std::shared_ptr<const std::vector<model::RawSampleRecord>>;

  // Everything stored for one visit. Committed entries are immutable; a
  // write copies the entry it touches and swaps the pointer on commit, so
  // the cost of a write never depends on other visits.
  struct VisitEntry {
    model::VisitRecord                  visit;
    SampleSeries                        samples;
    std::vector<model::FeatureRecord>   features;
    std::optional<model::ResultRecord>  result;
  };
  using EntryPtr = std::shared_ptr<const VisitEntry>;

  EntryPtr CommittedEntry(const std::string& visit_id) const;

  // Per-visit writer lock; entries are dropped once no transaction holds them.
  std::shared_ptr<std::mutex> AcquireWriteLock(const std::string& visit_id);
  void ReleaseWriteLock(const std::string& visit_id, std::shared_ptr<std::mutex> lock);

  // guards visits_ and invalid_scans_
  mutable std::shared_mutex state_mutex_;
  std::map<std::string, EntryPtr> visits_;
  std::map<uint64_t, model::InvalidScanRecord> invalid_scans_;

  std::atomic<uint64_t> next_invalid_scan_id_{1};

  std::mutex write_locks_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> write_locks_;
};

}
