#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace glucolumin::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates the schema if missing.
  void Bootstrap();

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginReadOnly() override;
  std::string BackendName() const override { return "sqlite"; }

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
