#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/feature_record.hpp"
#include "internal/db/model/invalid_scan_record.hpp"
#include "internal/db/model/result_record.hpp"
#include "internal/db/model/sample_record.hpp"
#include "internal/db/model/visit_record.hpp"

namespace glucolumin::db {

/*
  Result store.

  CRITICAL GUARANTEES:

  - All writes require a write Transaction
  - Reads throw std::runtime_error on a storage failure; nullopt or an
    empty list always means "no rows"
  - Reads inside a transaction see its writes
  - Raw samples are append-only; indices strictly increase per visit
  - A visit has at most one result and it is never overwritten
  - Result + DONE status committed together are visible together

  The DB is the source of truth for:
    visit state
    raw sample series
    features and results
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::unique_ptr<Transaction> BeginReadOnly() = 0;

  virtual std::string BackendName() const = 0;

  // ---------------------------------------------------------------------
  // Visits
  // ---------------------------------------------------------------------

  virtual Result InsertVisit(Transaction&, const model::VisitRecord&) = 0;

  virtual std::optional<model::VisitRecord> GetVisit(Transaction&, const std::string& visit_id) = 0;

  virtual std::vector<model::VisitRecord> ListVisits(Transaction&) = 0;

  // Replaces the row; NotFound if absent.
  virtual Result UpdateVisit(Transaction&, const model::VisitRecord&) = 0;

  // ---------------------------------------------------------------------
  // Raw samples
  // ---------------------------------------------------------------------

  // ConstraintViolation if an index does not exceed the previous one.
  virtual Result AppendSamples(Transaction&, const std::string& visit_id, const std::vector<model::RawSampleRecord>& samples) = 0;

  // Chronological order.
  virtual std::vector<model::RawSampleRecord> ReadSamples(Transaction&, const std::string& visit_id) = 0;

  // ---------------------------------------------------------------------
  // Features / results
  // ---------------------------------------------------------------------

  virtual Result UpsertFeatures(Transaction&, const std::string& visit_id, const std::vector<model::FeatureRecord>& features) = 0;

  virtual std::vector<model::FeatureRecord> GetFeatures(Transaction&, const std::string& visit_id) = 0;

  // AlreadyExists if the visit has a result.
  virtual Result InsertResult(Transaction&, const model::ResultRecord&) = 0;

  virtual std::optional<model::ResultRecord> GetResult(Transaction&, const std::string& visit_id) = 0;

  // ---------------------------------------------------------------------
  // Invalid scans
  // ---------------------------------------------------------------------

  virtual Result InsertInvalidScan(Transaction&, model::InvalidScanRecord&) = 0;

  // Newest first. limit 0 = unbounded.
  virtual std::vector<model::InvalidScanRecord> ListInvalidScans(Transaction&, const std::optional<std::string>& visit_id, std::size_t limit) = 0;
};

} // namespace glucolumin::db
